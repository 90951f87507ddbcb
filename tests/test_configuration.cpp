#define BOOST_TEST_MAIN
#include <boost/test/unit_test.hpp>

#include <collate/configuration.hpp>
#include <collate/settings.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

// RAII class for managing temporary directories
class TemporaryDirectory {
public:
    TemporaryDirectory(std::string_view prefix = "collate-test") {
        auto pid = getpid();
        auto tid = std::this_thread::get_id();
        auto now = std::chrono::system_clock::now();
        auto timestamp = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();

        std::ostringstream oss;
        oss << prefix << "-" << pid << "-" << tid << "-" << timestamp;
        path_ = fs::temp_directory_path() / oss.str();

        fs::create_directory(path_);
    }

    ~TemporaryDirectory() {
        fs::current_path(fs::temp_directory_path());
        fs::remove_all(path_);
    }

    const fs::path& path() const {
        return path_;
    }

private:
    fs::path path_;
};

// keep user configuration written by the tests out of the real home
struct UserConfigurationHome {
    UserConfigurationHome() : home("collate-home") {
        setenv("XDG_CONFIG_HOME", home.path().c_str(), 1);
    }
    TemporaryDirectory home;
};

BOOST_GLOBAL_FIXTURE(UserConfigurationHome);

static void write_file(std::string_view path, std::string_view content)
{
    std::ofstream file{std::string(path)};
    file << content;
}

static std::string read_file(std::string_view path)
{
    std::ifstream file{std::string(path)};
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

BOOST_AUTO_TEST_SUITE(ConfigurationTest)

BOOST_AUTO_TEST_CASE(init)
{
    TemporaryDirectory temp_dir;
    fs::current_path(temp_dir.path());

    BOOST_CHECK(collate::Configuration::init());
    BOOST_CHECK(fs::is_directory(".collate"));
    BOOST_CHECK(!collate::Configuration::init());
}

BOOST_AUTO_TEST_CASE(path_local)
{
    TemporaryDirectory temp_dir;
    fs::create_directory(temp_dir.path() / ".collate");
    fs::current_path(temp_dir.path());

    std::string_view path = collate::Configuration::path_local();
    BOOST_CHECK_EQUAL(path, (temp_dir.path() / ".collate").native());
}

BOOST_AUTO_TEST_CASE(path_local_from_subdirectory)
{
    TemporaryDirectory temp_dir;
    fs::create_directory(temp_dir.path() / ".collate");
    fs::create_directories(temp_dir.path() / "docs" / "2024");
    fs::current_path(temp_dir.path() / "docs" / "2024");

    std::string_view path = collate::Configuration::path_local(collate::span<std::string_view>({"collate.ini"}));
    BOOST_CHECK_EQUAL(path, (temp_dir.path() / ".collate" / "collate.ini").native());
}

BOOST_AUTO_TEST_CASE(path_local_missing)
{
    TemporaryDirectory temp_dir;
    fs::current_path(temp_dir.path());

    BOOST_CHECK_THROW(collate::Configuration::path_local(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(path_user)
{
    fs::path expected_path = fs::path(getenv("XDG_CONFIG_HOME")) / "collate";

    std::string_view path = collate::Configuration::path_user();
    BOOST_CHECK_EQUAL(path, expected_path.native());
}

BOOST_AUTO_TEST_CASE(path_local_subpaths)
{
    TemporaryDirectory temp_dir;
    fs::create_directory(temp_dir.path() / ".collate");
    fs::current_path(temp_dir.path());

    std::string_view path = collate::Configuration::path_local(collate::span<std::string_view>({"subdir", "subsubdir"}), true);
    BOOST_CHECK_EQUAL(path, (temp_dir.path() / ".collate" / "subdir" / "subsubdir" / "").native());
    BOOST_CHECK(fs::is_directory(temp_dir.path() / ".collate" / "subdir" / "subsubdir"));
}

BOOST_AUTO_TEST_CASE(default_to_user_parameters)
{
    TemporaryDirectory temp_dir;
    fs::create_directory(temp_dir.path() / ".collate");
    fs::current_path(temp_dir.path());

    write_file(collate::Configuration::path_user(collate::span<std::string_view>({"defaults.ini"})),
        "[section]\nkey = value_from_user\n");
    write_file(collate::Configuration::path_local(collate::span<std::string_view>({"defaults.ini"})),
        "[section]\nother_key = value_from_local\n");

    collate::Configuration config(collate::span<std::string_view>({"defaults.ini"}));

    BOOST_CHECK_EQUAL(config[collate::span<std::string_view>({"section", "key"})], "value_from_user");
    BOOST_CHECK_EQUAL(config[collate::span<std::string_view>({"section", "other_key"})], "value_from_local");
    BOOST_CHECK_EQUAL(config[collate::span<std::string_view>({"section", "absent"})], "");

    auto values = config.values("section");
    BOOST_REQUIRE_EQUAL(values.size(), 2u);
    BOOST_CHECK_EQUAL(values[0].first, "other_key");
    BOOST_CHECK_EQUAL(values[1].first, "key");
}

BOOST_AUTO_TEST_CASE(dotted_keys)
{
    TemporaryDirectory temp_dir;
    fs::create_directory(temp_dir.path() / ".collate");
    fs::current_path(temp_dir.path());

    write_file(collate::Configuration::path_local(collate::span<std::string_view>({"dotted.ini"})),
        "[files]\nreport.html = yes\n");

    collate::Configuration config(collate::span<std::string_view>({"dotted.ini"}));
    BOOST_CHECK_EQUAL(config[collate::span<std::string_view>({"files", "report.html"})], "yes");
}

BOOST_AUTO_TEST_CASE(bad_locator)
{
    TemporaryDirectory temp_dir;
    fs::create_directory(temp_dir.path() / ".collate");
    fs::current_path(temp_dir.path());

    collate::Configuration config(collate::span<std::string_view>({"locator.ini"}));
    BOOST_CHECK_THROW(config[collate::span<std::string_view>({"section"})], std::invalid_argument);
    BOOST_CHECK_THROW(config[collate::span<std::string_view>({"a", "b", "c"})], std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(write_changed_parameters)
{
    TemporaryDirectory temp_dir;
    fs::create_directory(temp_dir.path() / ".collate");
    fs::current_path(temp_dir.path());

    std::string local_path(collate::Configuration::path_local(collate::span<std::string_view>({"changed.ini"})));
    write_file(local_path, "[section]\nother_key = value_from_local\n");

    {
        collate::Configuration config(collate::span<std::string_view>({"changed.ini"}));
        config[collate::span<std::string_view>({"section", "key"})] = "new_value";
        // looked up but left empty
        config[collate::span<std::string_view>({"unused", "key"})];
    }

    std::string content = read_file(local_path);
    BOOST_CHECK(content.find("key=new_value") != std::string::npos);
    BOOST_CHECK(content.find("other_key=value_from_local") != std::string::npos);
    BOOST_CHECK(content.find("unused") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(do_not_write_unmodified_parameters)
{
    TemporaryDirectory temp_dir;
    fs::create_directory(temp_dir.path() / ".collate");
    fs::current_path(temp_dir.path());

    write_file(collate::Configuration::path_user(collate::span<std::string_view>({"unmodified.ini"})),
        "[section]\nkey = value_from_user\n");
    std::string local_path(collate::Configuration::path_local(collate::span<std::string_view>({"unmodified.ini"})));
    write_file(local_path, "[section]\nother_key = value_from_local\n");

    {
        collate::Configuration config(collate::span<std::string_view>({"unmodified.ini"}));
        std::string value = config[collate::span<std::string_view>({"section", "key"})];
        BOOST_CHECK_EQUAL(value, "value_from_user");
    }

    BOOST_CHECK_EQUAL(read_file(local_path), "[section]\nother_key = value_from_local\n");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SettingsTest)

BOOST_AUTO_TEST_CASE(defaults)
{
    TemporaryDirectory temp_dir;
    fs::create_directory(temp_dir.path() / ".collate");
    fs::current_path(temp_dir.path());

    collate::Settings settings = collate::Settings::load();
    BOOST_CHECK_EQUAL(settings.threshold, collate::DEFAULT_THRESHOLD);
    BOOST_CHECK_EQUAL(settings.report_directory, fs::path("comparisons"));
    BOOST_CHECK(settings.format == collate::ReportFormat::Html);
    BOOST_CHECK_EQUAL(settings.jobs, 0u);
    BOOST_CHECK_GE(settings.thread_count(), 1u);
    BOOST_CHECK(!fs::exists(temp_dir.path() / ".collate" / "collate.ini"));
}

BOOST_AUTO_TEST_CASE(from_file)
{
    TemporaryDirectory temp_dir;
    fs::create_directory(temp_dir.path() / ".collate");
    fs::current_path(temp_dir.path());

    write_file(collate::Configuration::path_local(collate::span<std::string_view>({"collate.ini"})),
        "[match]\nthreshold = 0.6\n"
        "[report]\ndirectory = out/reports\nformat = both\n"
        "[batch]\njobs = 3\n");

    collate::Settings settings = collate::Settings::load();
    BOOST_CHECK_EQUAL(settings.threshold, 0.6);
    BOOST_CHECK_EQUAL(settings.report_directory, fs::path("out/reports"));
    BOOST_CHECK(settings.format == collate::ReportFormat::Both);
    BOOST_CHECK_EQUAL(settings.jobs, 3u);
    BOOST_CHECK_EQUAL(settings.thread_count(), 3u);
}

BOOST_AUTO_TEST_CASE(invalid_values)
{
    TemporaryDirectory temp_dir;
    fs::create_directory(temp_dir.path() / ".collate");
    fs::current_path(temp_dir.path());

    std::string path(collate::Configuration::path_local(collate::span<std::string_view>({"collate.ini"})));

    write_file(path, "[match]\nthreshold = 1.5\n");
    BOOST_CHECK_THROW(collate::Settings::load(), collate::InvalidConfiguration);

    write_file(path, "[match]\nthreshold = high\n");
    BOOST_CHECK_THROW(collate::Settings::load(), collate::InvalidConfiguration);

    write_file(path, "[report]\nformat = pdf\n");
    BOOST_CHECK_THROW(collate::Settings::load(), collate::InvalidConfiguration);

    write_file(path, "[batch]\njobs = -2\n");
    BOOST_CHECK_THROW(collate::Settings::load(), collate::InvalidConfiguration);
}

BOOST_AUTO_TEST_CASE(parse_helpers)
{
    BOOST_CHECK_EQUAL(collate::parse_threshold(" 0.25 "), 0.25);
    BOOST_CHECK_EQUAL(collate::parse_threshold("0"), 0.0);
    BOOST_CHECK_EQUAL(collate::parse_threshold("1"), 1.0);
    BOOST_CHECK_THROW(collate::parse_threshold(""), collate::InvalidConfiguration);
    BOOST_CHECK_THROW(collate::parse_threshold("0.5x"), collate::InvalidConfiguration);
    BOOST_CHECK_THROW(collate::parse_threshold("nan"), collate::InvalidConfiguration);

    BOOST_CHECK_EQUAL(collate::parse_jobs("8"), 8u);
    BOOST_CHECK_THROW(collate::parse_jobs("two"), collate::InvalidConfiguration);

    BOOST_CHECK(collate::parse_report_format("json") == collate::ReportFormat::Json);
    BOOST_CHECK_EQUAL(collate::report_format_name(collate::ReportFormat::Both), "both");
    BOOST_CHECK_THROW(collate::parse_report_format("HTML"), collate::InvalidConfiguration);
}

BOOST_AUTO_TEST_SUITE_END()
