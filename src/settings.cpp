#include <collate/settings.hpp>
#include <collate/configuration.hpp>

#include <charconv>
#include <thread>

namespace collate {

ReportFormat parse_report_format(std::string_view text)
{
    text = trim(text);
    if (text == "html") {
        return ReportFormat::Html;
    }
    if (text == "json") {
        return ReportFormat::Json;
    }
    if (text == "both") {
        return ReportFormat::Both;
    }
    throw InvalidConfiguration("report format must be html, json or both, got \"" + std::string(text) + "\"");
}

std::string_view report_format_name(ReportFormat format)
{
    switch (format) {
    case ReportFormat::Html: return "html";
    case ReportFormat::Json: return "json";
    case ReportFormat::Both: return "both";
    }
    return "html";
}

double parse_threshold(std::string_view text)
{
    text = trim(text);
    double value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw InvalidConfiguration("match threshold is not a number: \"" + std::string(text) + "\"");
    }
    check_threshold(value);
    return value;
}

size_t parse_jobs(std::string_view text)
{
    text = trim(text);
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw InvalidConfiguration("job count is not a non-negative integer: \"" + std::string(text) + "\"");
    }
    return value;
}

Settings Settings::load()
{
    Settings settings;
    Configuration config(collate::span<std::string_view>({"collate.ini"}));

    std::string const& threshold = config[collate::span<std::string_view>({"match", "threshold"})];
    if (!threshold.empty()) {
        settings.threshold = parse_threshold(threshold);
    }
    std::string const& directory = config[collate::span<std::string_view>({"report", "directory"})];
    if (!directory.empty()) {
        settings.report_directory = directory;
    }
    std::string const& format = config[collate::span<std::string_view>({"report", "format"})];
    if (!format.empty()) {
        settings.format = parse_report_format(format);
    }
    std::string const& jobs = config[collate::span<std::string_view>({"batch", "jobs"})];
    if (!jobs.empty()) {
        settings.jobs = parse_jobs(jobs);
    }

    return settings;
}

size_t Settings::thread_count() const
{
    if (jobs) {
        return jobs;
    }
    size_t hardware = std::thread::hardware_concurrency();
    return hardware ? hardware : 1;
}

} // namespace collate
