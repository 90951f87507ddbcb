#pragma once

#include <collate/report.hpp>
#include <collate/settings.hpp>

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace collate {

struct DocumentPair
{
    std::string key;
    std::filesystem::path source;
    std::filesystem::path rendered;
};

struct PairResult
{
    std::string key;
    std::vector<std::filesystem::path> reports;
    Summary summary;
    std::optional<std::string> error;
};

/*
 * Reduce an uploaded file name to a safe ASCII name:
 * whitespace and path separators become '_', other characters
 * outside [A-Za-z0-9_.-] are dropped, and '.' and '_' are
 * stripped from both ends.
 */
std::string secure_filename(std::string_view filename);

/*
 * File name without its last extension. A leading dot is not an
 * extension separator.
 */
std::string stem(std::string_view filename);

/*
 * Pair source documents with renderings sharing a key,
 * stem(secure_filename(name)). Later files replace earlier ones with
 * the same key. Pairs are sorted by key.
 */
std::vector<DocumentPair> pair_documents(
    std::span<std::filesystem::path const> sources,
    std::span<std::filesystem::path const> renderings
);

/*
 * Extract, align and write the reports of one pair.
 * Extraction and write failures are returned in PairResult::error.
 */
PairResult compare_pair(DocumentPair const& pair, Settings const& settings);

/*
 * compare_pair() for every pair on a pool of settings.thread_count()
 * threads. Results are in pair order.
 */
std::vector<PairResult> compare_all(std::span<DocumentPair const> pairs, Settings const& settings);

std::string render_index(std::span<PairResult const> results, std::filesystem::path const& directory);

/*
 * Write index.html into the report directory and return its path.
 */
std::filesystem::path write_index(std::span<PairResult const> results, Settings const& settings);

} // namespace collate
