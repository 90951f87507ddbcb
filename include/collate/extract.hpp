#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace collate {

/*
 * Failure to read or interpret an input document.
 */
class ExtractionError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/*
 * Split text at whitespace that follows '.', '!' or '?' and precedes
 * an upper-case ASCII letter. Pieces are trimmed; empty ones dropped.
 */
std::vector<std::string> split_sentences(std::string_view text);

/*
 * Visible text of an HTML document, one space between text lines.
 * Scripts, styles and page chrome (header, footer, nav, noscript)
 * are dropped with everything they contain. Parsing recovers from
 * malformed markup; ExtractionError only if nothing could be parsed.
 */
std::string html_text(std::string_view markup);

/*
 * Body paragraph text of a .docx archive, one paragraph per line.
 */
std::string docx_text(std::string_view archive);

/*
 * Read a whole file. Throws ExtractionError.
 */
std::string read_file(std::filesystem::path const& path);

/*
 * Sentences of a document, extracted according to its extension:
 * .docx, .html/.htm, anything else as plain text.
 */
std::vector<std::string> read_sentences(std::filesystem::path const& path);

} // namespace collate
