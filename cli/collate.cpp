#include <collate/batch.hpp>
#include <collate/configuration.hpp>
#include <collate/log.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace collate;

static void usage(std::ostream & out)
{
    out << "usage: collate [-t THRESHOLD] [-o DIR] [-j JOBS] [-f html|json|both]\n"
        << "               -s SOURCE... -r RENDERED...\n"
        << "\n"
        << "Compares each source document (.docx) with the rendering (.html)\n"
        << "of the same name and writes a comparison report for every pair.\n"
        << "Directories are expanded to the files they contain.\n";
}

static void add_paths(fs::path const& path, std::vector<fs::path> & paths)
{
    if (fs::is_directory(path)) {
        std::vector<fs::path> entries;
        for (auto & entry : fs::directory_iterator(path)) {
            if (entry.is_regular_file()) {
                entries.push_back(entry.path());
            }
        }
        std::sort(entries.begin(), entries.end());
        paths.insert(paths.end(), entries.begin(), entries.end());
    } else {
        paths.push_back(path);
    }
}

int main(int argc, char **argv) {
    std::vector<fs::path> sources, renderings;
    std::optional<std::string> threshold, directory, jobs, format;

    std::vector<fs::path> * target = nullptr;
    for (int i = 1; i < argc; ++ i) {
        std::string_view arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "collate: " << arg << " needs a value" << std::endl;
                usage(std::cerr);
                std::exit(2);
            }
            return argv[++ i];
        };
        if (arg == "-h" || arg == "--help") {
            usage(std::cout);
            return 0;
        } else if (arg == "-s" || arg == "--source") {
            target = &sources;
        } else if (arg == "-r" || arg == "--rendered") {
            target = &renderings;
        } else if (arg == "-t" || arg == "--threshold") {
            threshold = value();
        } else if (arg == "-o" || arg == "--output") {
            directory = value();
        } else if (arg == "-j" || arg == "--jobs") {
            jobs = value();
        } else if (arg == "-f" || arg == "--format") {
            format = value();
        } else if (target && !arg.starts_with("-")) {
            add_paths(arg, *target);
        } else {
            std::cerr << "collate: unexpected argument " << arg << std::endl;
            usage(std::cerr);
            return 2;
        }
    }
    if (sources.empty() || renderings.empty()) {
        usage(std::cerr);
        return 2;
    }

    Settings settings;
    try {
        if (Configuration::init()) {
            std::cerr << "Created " << fs::absolute(".collate").native() << std::endl;
        }
        settings = Settings::load();
        if (threshold) {
            settings.threshold = parse_threshold(*threshold);
        }
        if (directory) {
            settings.report_directory = *directory;
        }
        if (jobs) {
            settings.jobs = parse_jobs(*jobs);
        }
        if (format) {
            settings.format = parse_report_format(*format);
        }
    } catch (std::exception const& e) {
        std::cerr << "collate: " << e.what() << std::endl;
        return 2;
    }

    std::string threshold_str = std::to_string(settings.threshold);
    std::string jobs_str = std::to_string(settings.thread_count());
    Log::log(collate::span<StringViewPair>({
        {"event", "start"},
        {"threshold", threshold_str},
        {"jobs", jobs_str},
        {"directory", settings.report_directory.native()},
    }));

    int status = 0;
    try {
        std::vector<DocumentPair> pairs = pair_documents(sources, renderings);
        if (pairs.empty()) {
            std::cerr << "collate: no source and rendering share a file name" << std::endl;
            return 1;
        }

        std::vector<PairResult> results = compare_all(pairs, settings);
        for (auto & result : results) {
            if (result.error) {
                status = 1;
                std::cout << result.key << ": error: " << *result.error << std::endl;
                continue;
            }
            std::cout << result.key << ": "
                      << result.summary.matched << " matched, "
                      << result.summary.missing << " missing, "
                      << result.summary.extra << " extra";
            if (result.summary.identical()) {
                std::cout << ", identical";
            }
            std::cout << " -> " << result.reports.front().native() << std::endl;
        }
        std::cout << "index: " << write_index(results, settings).native() << std::endl;
    } catch (std::exception const& e) {
        std::cerr << "collate: " << e.what() << std::endl;
        return 1;
    }

    return status;
}
