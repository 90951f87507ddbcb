#include <collate/extract.hpp>
#include <collate/common.hpp>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;

namespace collate {

std::vector<std::string> split_sentences(std::string_view text)
{
    std::u32string cps = decode_utf8(text);
    std::vector<std::string> sentences;

    auto emit = [&](size_t start, size_t end) {
        std::string piece;
        for (size_t i = start; i < end; ++ i) {
            encode_utf8(cps[i], piece);
        }
        std::string_view trimmed = trim(piece);
        if (!trimmed.empty()) {
            sentences.emplace_back(trimmed);
        }
    };

    size_t start = 0;
    size_t i = 0;
    while (i < cps.size()) {
        char32_t cp = cps[i];
        if ((cp == '.' || cp == '!' || cp == '?') && i + 1 < cps.size() && is_space(cps[i + 1])) {
            size_t j = i + 1;
            while (j < cps.size() && is_space(cps[j])) {
                ++ j;
            }
            if (j < cps.size() && cps[j] >= 'A' && cps[j] <= 'Z') {
                emit(start, i + 1);
                start = j;
                i = j;
                continue;
            }
        }
        ++ i;
    }
    emit(start, cps.size());

    return sentences;
}

namespace {

//=============================================================================
// HTML
//=============================================================================

struct XmlDocDeleter
{
    void operator()(xmlDoc * doc) const { xmlFreeDoc(doc); }
};

bool is_excluded(xmlNode const* node)
{
    static constexpr std::string_view excluded[] = {
        "script", "style", "noscript", "header", "footer", "nav",
    };
    std::string_view name = (char const*)node->name;
    return std::find(std::begin(excluded), std::end(excluded), name) != std::end(excluded);
}

void collect_text(xmlNode const* node, std::vector<std::string_view> & nodes)
{
    for (; node; node = node->next) {
        switch (node->type) {
        case XML_ELEMENT_NODE:
            if (!is_excluded(node)) {
                collect_text(node->children, nodes);
            }
            break;
        case XML_TEXT_NODE:
        case XML_CDATA_SECTION_NODE:
            if (node->content) {
                nodes.emplace_back((char const*)node->content);
            }
            break;
        default:
            break;
        }
    }
}

//=============================================================================
// DOCX
//=============================================================================

constexpr uint32_t ZIP_LOCAL_HEADER = 0x04034b50;
constexpr uint32_t ZIP_CENTRAL_HEADER = 0x02014b50;
constexpr uint32_t ZIP_END_OF_DIRECTORY = 0x06054b50;

uint32_t read_le(std::string_view data, size_t off, size_t bytes)
{
    if (off + bytes > data.size()) {
        throw ExtractionError("truncated zip archive");
    }
    uint32_t value = 0;
    for (size_t i = 0; i < bytes; ++ i) {
        value |= (uint32_t)(unsigned char)data[off + i] << (8 * i);
    }
    return value;
}

std::string zip_member(std::string_view archive, std::string_view member)
{
    if (archive.size() < 22) {
        throw ExtractionError("not a zip archive");
    }
    // the end record is followed by a comment of up to 64k
    size_t eocd = std::string_view::npos;
    size_t lowest = archive.size() > 22 + 0xFFFF ? archive.size() - 22 - 0xFFFF : 0;
    for (size_t off = archive.size() - 22 + 1; off-- > lowest;) {
        if (read_le(archive, off, 4) == ZIP_END_OF_DIRECTORY) {
            eocd = off;
            break;
        }
    }
    if (eocd == std::string_view::npos) {
        throw ExtractionError("not a zip archive");
    }

    size_t entries = read_le(archive, eocd + 10, 2);
    size_t off = read_le(archive, eocd + 16, 4);
    for (size_t n = 0; n < entries; ++ n) {
        if (read_le(archive, off, 4) != ZIP_CENTRAL_HEADER) {
            throw ExtractionError("corrupt zip central directory");
        }
        uint32_t method = read_le(archive, off + 10, 2);
        size_t compressed = read_le(archive, off + 20, 4);
        size_t uncompressed = read_le(archive, off + 24, 4);
        size_t name_len = read_le(archive, off + 28, 2);
        size_t extra_len = read_le(archive, off + 30, 2);
        size_t comment_len = read_le(archive, off + 32, 2);
        size_t local = read_le(archive, off + 42, 4);
        if (off + 46 + name_len > archive.size()) {
            throw ExtractionError("truncated zip archive");
        }
        std::string_view name = archive.substr(off + 46, name_len);
        off += 46 + name_len + extra_len + comment_len;
        if (name != member) {
            continue;
        }

        if (read_le(archive, local, 4) != ZIP_LOCAL_HEADER) {
            throw ExtractionError("corrupt zip local header");
        }
        size_t data = local + 30 + read_le(archive, local + 26, 2) + read_le(archive, local + 28, 2);
        if (data + compressed > archive.size()) {
            throw ExtractionError("truncated zip archive");
        }
        std::string_view payload = archive.substr(data, compressed);

        if (method == 0) {
            return std::string(payload);
        }
        if (method != 8) {
            std::stringstream ss;
            ss << "unsupported zip compression method " << method << " for " << member;
            throw ExtractionError(ss.str());
        }

        namespace io = boost::iostreams;
        io::zlib_params params;
        params.noheader = true;
        io::filtering_istream in;
        in.push(io::zlib_decompressor(params));
        in.push(io::array_source(payload.data(), payload.size()));
        std::string inflated;
        inflated.reserve(uncompressed);
        try {
            io::copy(in, io::back_inserter(inflated));
        } catch (io::zlib_error const& e) {
            throw ExtractionError(std::string("corrupt deflate stream in ") + std::string(member) + ": " + e.what());
        }
        if (inflated.size() != uncompressed) {
            throw ExtractionError(std::string("size mismatch inflating ") + std::string(member));
        }
        return inflated;
    }

    throw ExtractionError(std::string("zip archive has no ") + std::string(member));
}

namespace pt = boost::property_tree;

void run_text(pt::ptree const& run, std::string & out)
{
    for (auto & [key, child] : run) {
        if (key == "w:t") {
            out += child.data();
        } else if (key == "w:tab" || key == "w:ptab") {
            out += '\t';
        } else if (key == "w:br" || key == "w:cr") {
            std::string type = child.get("<xmlattr>.w:type", "");
            if (type != "page" && type != "column") {
                out += '\n';
            }
        } else if (key == "w:noBreakHyphen") {
            out += '-';
        }
    }
}

std::string paragraph_text(pt::ptree const& paragraph)
{
    std::string text;
    for (auto & [key, child] : paragraph) {
        if (key == "w:r") {
            run_text(child, text);
        } else if (key == "w:hyperlink") {
            for (auto & [link_key, link_child] : child) {
                if (link_key == "w:r") {
                    run_text(link_child, text);
                }
            }
        }
    }
    return text;
}

} // namespace

std::string html_text(std::string_view markup)
{
    if (markup.empty()) {
        return {};
    }
    // once per process, before any thread parses
    static bool const parser_ready = (xmlInitParser(), true);
    (void)parser_ready;

    std::unique_ptr<xmlDoc, XmlDocDeleter> doc(htmlReadMemory(
        markup.data(), (int)markup.size(), nullptr, "UTF-8",
        HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET
    ));
    if (!doc) {
        throw ExtractionError("cannot parse html document");
    }

    std::vector<std::string_view> nodes;
    collect_text(doc->children, nodes);

    // text nodes one per line, then one space between the non-blank lines
    std::string joined;
    for (auto & node : nodes) {
        if (!joined.empty()) {
            joined += '\n';
        }
        joined += node;
    }
    std::string result;
    size_t start = 0;
    while (start <= joined.size()) {
        size_t end = joined.find_first_of("\n\r\v\f", start);
        if (end == std::string::npos) {
            end = joined.size();
        }
        std::string_view line = trim(std::string_view(joined).substr(start, end - start));
        if (!line.empty()) {
            if (!result.empty()) {
                result += ' ';
            }
            result += line;
        }
        start = end + 1;
    }
    return result;
}

std::string docx_text(std::string_view archive)
{
    std::istringstream xml(zip_member(archive, "word/document.xml"));
    pt::ptree tree;
    try {
        pt::read_xml(xml, tree);
    } catch (pt::xml_parser_error const& e) {
        throw ExtractionError(std::string("malformed word/document.xml: ") + e.what());
    }

    auto body = tree.get_child_optional("w:document.w:body");
    if (!body) {
        throw ExtractionError("word/document.xml has no document body");
    }

    std::string text;
    for (auto & [key, child] : *body) {
        if (key != "w:p") {
            continue;
        }
        std::string paragraph = paragraph_text(child);
        if (trim(paragraph).empty()) {
            continue;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += paragraph;
    }
    return text;
}

std::string read_file(fs::path const& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ExtractionError("cannot open " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw ExtractionError("cannot read " + path.string());
    }
    return content;
}

std::vector<std::string> read_sentences(fs::path const& path)
{
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });

    std::string content = read_file(path);
    if (ext == ".docx") {
        return split_sentences(docx_text(content));
    }
    if (ext == ".html" || ext == ".htm") {
        return split_sentences(html_text(content));
    }
    return split_sentences(content);
}

} // namespace collate
