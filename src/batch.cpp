#include <collate/batch.hpp>
#include <collate/extract.hpp>
#include <collate/log.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace collate {

std::string secure_filename(std::string_view filename)
{
    // split on whitespace (path separators count) and rejoin with '_'
    std::string joined;
    bool pending_separator = false;
    for (char c : filename) {
        if ((unsigned char)c >= 0x80) {
            continue;
        }
        if (std::isspace((unsigned char)c) || c == '/') {
            pending_separator = !joined.empty();
            continue;
        }
        if (pending_separator) {
            joined += '_';
            pending_separator = false;
        }
        joined += c;
    }

    std::string safe;
    for (char c : joined) {
        if (std::isalnum((unsigned char)c) || c == '_' || c == '.' || c == '-') {
            safe += c;
        }
    }

    size_t start = safe.find_first_not_of("._");
    if (start == std::string::npos) {
        return {};
    }
    size_t end = safe.find_last_not_of("._");
    return safe.substr(start, end - start + 1);
}

std::string stem(std::string_view filename)
{
    size_t slash = filename.rfind('/');
    size_t base = slash == std::string_view::npos ? 0 : slash + 1;
    size_t dot = filename.rfind('.');
    if (dot == std::string_view::npos || dot < base) {
        return std::string(filename);
    }
    // dots leading the base name do not start an extension
    for (size_t i = base; i < dot; ++ i) {
        if (filename[i] != '.') {
            return std::string(filename.substr(0, dot));
        }
    }
    return std::string(filename);
}

std::vector<DocumentPair> pair_documents(
    std::span<fs::path const> sources,
    std::span<fs::path const> renderings
)
{
    auto keyed = [](std::span<fs::path const> paths) {
        std::map<std::string, fs::path> by_key;
        for (auto & path : paths) {
            std::string key = stem(secure_filename(path.filename().string()));
            if (key.empty()) {
                Log::log(collate::span<StringViewPair>({
                    {"event", "unpaired"},
                    {"path", path.native()},
                    {"reason", "no usable file name"},
                }));
                continue;
            }
            by_key[key] = path;
        }
        return by_key;
    };
    std::map<std::string, fs::path> source_map = keyed(sources);
    std::map<std::string, fs::path> rendered_map = keyed(renderings);

    std::vector<DocumentPair> pairs;
    for (auto & [key, source] : source_map) {
        auto found = rendered_map.find(key);
        if (found == rendered_map.end()) {
            Log::log(collate::span<StringViewPair>({
                {"event", "unpaired"},
                {"path", source.native()},
                {"reason", "no rendering"},
            }));
            continue;
        }
        pairs.push_back({key, source, found->second});
    }
    for (auto & [key, rendered] : rendered_map) {
        if (!source_map.count(key)) {
            Log::log(collate::span<StringViewPair>({
                {"event", "unpaired"},
                {"path", rendered.native()},
                {"reason", "no source"},
            }));
        }
    }
    return pairs;
}

static void write_text(fs::path const& path, std::string_view content)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(content.data(), (std::streamsize)content.size());
    file.close();
    if (!file) {
        throw std::runtime_error("cannot write " + path.string());
    }
}

PairResult compare_pair(DocumentPair const& pair, Settings const& settings)
{
    PairResult result;
    result.key = pair.key;

    Log::log(collate::span<StringViewPair>({
        {"event", "compare"},
        {"key", pair.key},
        {"source", pair.source.native()},
        {"rendered", pair.rendered.native()},
    }));

    try {
        std::vector<std::string> left = read_sentences(pair.source);
        std::vector<std::string> right = read_sentences(pair.rendered);
        Alignment alignment = align(left, right, settings.threshold);
        result.summary = summarize(alignment);

        fs::create_directories(settings.report_directory);
        if (settings.format != ReportFormat::Json) {
            fs::path path = settings.report_directory / (pair.key + "_compare.html");
            write_text(path, render_page(pair.key, alignment));
            result.reports.push_back(path);
        }
        if (settings.format != ReportFormat::Html) {
            fs::path path = settings.report_directory / (pair.key + "_compare.json");
            write_text(path, render_json(pair.key, settings.threshold, alignment));
            result.reports.push_back(path);
        }
    } catch (std::runtime_error const& e) {
        result.error = e.what();
        Log::log(collate::span<StringViewPair>({
            {"event", "failed"},
            {"key", pair.key},
            {"error", *result.error},
        }));
        return result;
    }

    std::string matched = std::to_string(result.summary.matched);
    std::string missing = std::to_string(result.summary.missing);
    std::string extra = std::to_string(result.summary.extra);
    Log::log(collate::span<StringViewPair>({
        {"event", "compared"},
        {"key", pair.key},
        {"matched", matched},
        {"missing", missing},
        {"extra", extra},
    }));
    return result;
}

std::vector<PairResult> compare_all(std::span<DocumentPair const> pairs, Settings const& settings)
{
    check_threshold(settings.threshold);

    std::vector<PairResult> results(pairs.size());
    std::vector<std::exception_ptr> errors(pairs.size());
    {
        boost::asio::thread_pool pool(std::min(settings.thread_count(), std::max(pairs.size(), (size_t)1)));
        for (size_t i = 0; i < pairs.size(); ++ i) {
            boost::asio::post(pool, [&, i]() {
                try {
                    results[i] = compare_pair(pairs[i], settings);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            });
        }
        pool.join();
    }
    for (auto & error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return results;
}

std::string render_index(std::span<PairResult const> results, fs::path const& directory)
{
    std::stringstream page;
    page << "<!DOCTYPE html>\n"
         << "<html>\n<head>\n<meta charset=\"utf-8\">\n<title>Comparisons</title>\n</head>\n<body>\n"
         << "<h1>Comparisons</h1>\n<ul>\n";
    for (auto & result : results) {
        page << "<li>";
        if (result.error) {
            page << escape_html(result.key) << ": <em>" << escape_html(*result.error) << "</em>";
        } else {
            bool first = true;
            page << escape_html(result.key) << ": ";
            for (auto & report : result.reports) {
                if (!first) {
                    page << ", ";
                }
                first = false;
                fs::path relative = report.lexically_relative(directory);
                std::string href = relative.empty() ? report.string() : relative.string();
                page << "<a href=\"" << escape_html(href) << "\">" << escape_html(report.extension().string().substr(1)) << "</a>";
            }
            page << " (" << result.summary.matched << " matched, "
                 << result.summary.missing << " missing, "
                 << result.summary.extra << " extra)";
        }
        page << "</li>\n";
    }
    page << "</ul>\n</body>\n</html>\n";
    return page.str();
}

fs::path write_index(std::span<PairResult const> results, Settings const& settings)
{
    fs::create_directories(settings.report_directory);
    fs::path path = settings.report_directory / "index.html";
    write_text(path, render_index(results, settings.report_directory));
    return path;
}

} // namespace collate
