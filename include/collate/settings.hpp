#pragma once

#include <collate/align.hpp>

#include <cstddef>
#include <filesystem>
#include <string_view>

namespace collate {

enum class ReportFormat {
    Html,
    Json,
    Both,
};

ReportFormat parse_report_format(std::string_view text);
std::string_view report_format_name(ReportFormat format);

/*
 * Settings for comparing document pairs, from collate.ini:
 *
 *   [match]
 *   threshold = 0.3
 *   [report]
 *   directory = comparisons
 *   format = html
 *   [batch]
 *   jobs = 4
 */
struct Settings
{
    double threshold = DEFAULT_THRESHOLD;
    std::filesystem::path report_directory = "comparisons";
    ReportFormat format = ReportFormat::Html;
    size_t jobs = 0; // 0 picks the hardware concurrency

    /*
     * Read collate.ini from the project and user configuration.
     * Malformed values throw InvalidConfiguration.
     */
    static Settings load();

    size_t thread_count() const;
};

double parse_threshold(std::string_view text);
size_t parse_jobs(std::string_view text);

} // namespace collate
