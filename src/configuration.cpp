#include <collate/configuration.hpp>

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

namespace collate {

namespace {

fs::path const & config_dir_user()
{
    static struct ConfigDirUser
    {
        ConfigDirUser()
        {
            char const* xdg_config_home = getenv("XDG_CONFIG_HOME");
            if (xdg_config_home != nullptr) {
                path = fs::path(xdg_config_home);
            }
            if (path.empty()) {
                char const* home = getenv("HOME");
                if (home != nullptr) {
                    path = fs::path(home) / ".config";
                }
            }
            if (!path.empty()) {
                path /= "collate";
            } else {
                throw std::runtime_error("Neither XDG_CONFIG_HOME nor HOME is set.");
            }
        }

        fs::path path;
    } config_dir_user;

    return config_dir_user.path;
};

std::string_view path_helper(fs::path& path, std::span<std::string_view const> subpaths, bool is_dir) {
    for (const auto& subpath : subpaths) {
        path /= subpath;
    }
    if (is_dir) {
        fs::create_directories(path);
        path /= "";
    } else {
        fs::create_directories(path.parent_path());
    }
    return path.native();
}

// child lookup by exact key; ptree paths would split on '.'
pt::ptree * child(pt::ptree & tree, std::string_view key, bool create)
{
    auto it = tree.find(std::string(key));
    if (it != tree.not_found()) {
        return &it->second;
    }
    if (!create) {
        return nullptr;
    }
    return &tree.push_back(std::make_pair(std::string(key), pt::ptree()))->second;
}

class ConfigurationImpl {
public:
    ConfigurationImpl(std::span<std::string_view const> subpath, bool user_wide)
    : path_(user_wide ? Configuration::path_user(subpath) : Configuration::path_local(subpath))
    {
        if (!user_wide) {
            std::string path_user(Configuration::path_user(subpath));
            if (fs::exists(path_user)) {
                dflt_lock_ = boost::interprocess::file_lock(path_user.c_str());
                if (!dflt_lock_.try_lock_sharable()) {
                    std::cerr << "Waiting for another process to finish with " << path_user << " ..." << std::endl;
                    dflt_lock_.lock_sharable();
                }
                pt::ini_parser::read_ini(path_user, dflt_);
                has_dflt_ = true;
            }
        }
        if (fs::exists(path_)) {
            lock_ = boost::interprocess::file_lock(path_.c_str());
            if (!lock_.try_lock()) {
                std::cerr << "Waiting for another process to finish with " << path_ << " ..." << std::endl;
                lock_.lock();
            }
            pt::ini_parser::read_ini(path_, tree_);
        }
    }

    ~ConfigurationImpl() {
        bool changed = false;
        for (auto & [value, hash] : accessed_) {
            if (std::hash<std::string>()(value->data()) != hash) {
                changed = true;
                break;
            }
        }
        if (!changed) {
            return;
        }
        // drop entries that were only created by lookups
        for (auto it = created_.rbegin(); it != created_.rend(); ++ it) {
            auto & [parent, key] = *it;
            auto found = parent->find(key);
            if (found != parent->not_found() && found->second.data().empty() && found->second.empty()) {
                parent->erase(parent->to_iterator(found));
            }
        }
        try {
            pt::ini_parser::write_ini(path_, tree_);
        } catch (pt::ini_parser_error const& e) {
            std::cerr << "Could not write " << path_ << ": " << e.what() << std::endl;
        }
    }

    std::string& operator[](std::span<std::string_view const> locator) {
        if (locator.size() != 2) {
            throw std::invalid_argument("configuration locator must be {section, key}");
        }
        std::lock_guard<std::mutex> lk(mtx_);
        auto [section_name, key] = std::make_pair(locator[0], locator[1]);

        bool section_found = child(tree_, section_name, false) != nullptr;
        pt::ptree * section = child(tree_, section_name, true);
        if (!section_found) {
            created_.emplace_back(&tree_, std::string(section_name));
        }
        pt::ptree * value = child(*section, key, false);
        if (!value) {
            value = child(*section, key, true);
            created_.emplace_back(section, std::string(key));
            if (has_dflt_) {
                pt::ptree * dflt_section = child(dflt_, section_name, false);
                pt::ptree * dflt = dflt_section ? child(*dflt_section, key, false) : nullptr;
                if (dflt) {
                    value->data() = dflt->data();
                }
            }
        }

        if (accessed_.find(value) == accessed_.end()) {
            accessed_[value] = std::hash<std::string>()(value->data());
        }
        return value->data();
    }

    std::vector<StringViewPair> values(std::string_view section_name) {
        std::vector<StringViewPair> result;
        std::unordered_set<std::string_view> found_keys;
        for (pt::ptree * tree : {&tree_, &dflt_}) {
            pt::ptree * section = child(*tree, section_name, false);
            if (!section) {
                continue;
            }
            for (auto & [key, value] : *section) {
                if (value.data().empty()) {
                    continue;
                }
                auto [_, inserted] = found_keys.insert(key);
                if (inserted) {
                    result.emplace_back(key, value.data());
                }
            }
        }
        return result;
    }

private:
    std::string path_;
    pt::ptree tree_;
    boost::interprocess::file_lock lock_;
    pt::ptree dflt_;
    bool has_dflt_ = false;
    boost::interprocess::file_lock dflt_lock_;
    std::mutex mtx_;
    std::unordered_map<pt::ptree*, size_t> accessed_;
    std::vector<std::pair<pt::ptree*, std::string>> created_;
};

} // namespace

bool Configuration::init() {
    try {
        path_local();
    } catch (std::invalid_argument const&) {
        fs::create_directory(".collate");
        return true;
    }
    return false;
}

Configuration::Configuration(std::span<std::string_view const> subpath, bool user_wide)
    : impl_(reinterpret_cast<void*>(new ConfigurationImpl(subpath, user_wide))) {}

Configuration::~Configuration() {
    delete reinterpret_cast<ConfigurationImpl*>(impl_);
}

std::string& Configuration::operator[](std::span<std::string_view const> locator) {
    return (*reinterpret_cast<ConfigurationImpl*>(impl_))[locator];
}

std::vector<StringViewPair> Configuration::values(std::string_view section) {
    return reinterpret_cast<ConfigurationImpl*>(impl_)->values(section);
}

std::string_view Configuration::path_local(std::span<std::string_view const> subpaths, bool is_dir) {
    fs::path config_dir_local;
    for (
        fs::path path = fs::current_path(), parent_path = path.parent_path();
        !path.empty();
        path = parent_path, parent_path = path.parent_path()
    ) {
        fs::path collate_dir = path / ".collate";
        if (collate_dir == config_dir_user()) {
            break;
        }
        if (fs::is_directory(collate_dir)) {
            config_dir_local = collate_dir;
            break;
        }
        if (path == parent_path) {
            break;
        }
    }
    if (config_dir_local.empty()) {
        throw std::invalid_argument("Could not find .collate directory for project. Create one.");
    }

    static thread_local fs::path path;
    path = config_dir_local;
    return path_helper(path, subpaths, is_dir);
}

std::string_view Configuration::path_user(std::span<std::string_view const> subpaths, bool is_dir) {
    static thread_local fs::path path;
    path = config_dir_user();
    return path_helper(path, subpaths, is_dir);
}

} // namespace collate
