#pragma once

#include <collate/common.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace collate {

class Configuration {
public:
    /*
     * Create the project configuration directory if there is none.
     *
     * Returns true if a new directory was created.
     */
    static bool init();

    /*
     * Open an INI file below the project directory, or below the user
     * directory if user_wide. Project files fall back to the user file
     * of the same name for values they do not set.
     */
    Configuration(std::span<std::string_view const> subpath, bool user_wide = false);

    Configuration(Configuration const&) = delete;
    Configuration & operator=(Configuration const&) = delete;

    /*
     * Accessor for a value, located by {section, key}.
     * Assigning to it marks the file for writing.
     */
    std::string & operator[](std::span<std::string_view const> locator);

    /*
     * Key-value pairs of a section, project values first.
     */
    std::vector<StringViewPair> values(std::string_view section);

    /*
     * Writes the file back if any value was changed.
     */
    ~Configuration();

    /*
     * Get a per-project configuration path.
     */
    static std::string_view path_local(std::span<std::string_view const> subpath = {}, bool is_dir = false);

    /*
     * Get a per-user configuration path.
     */
    static std::string_view path_user(std::span<std::string_view const> subpath = {}, bool is_dir = false);

private:
    void* impl_;
};

} // namespace collate
