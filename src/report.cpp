#include <collate/report.hpp>
#include <collate/common.hpp>

#include <boost/json.hpp>

#include <sstream>

namespace collate {

std::string escape_html(std::string_view text)
{
    static StringViewPair const replacements[] = {
        {"&", "&amp;"},
        {"<", "&lt;"},
        {">", "&gt;"},
        {"\"", "&quot;"},
    };
    return std::string(replaced(text, replacements));
}

std::string render_markup(Spans const& spans)
{
    std::string result;
    for (auto & span : spans) {
        if (!result.empty()) {
            result += ' ';
        }
        if (span.cls == TokenClass::Equal) {
            result += escape_html(span.text);
        } else {
            result += "<span class=\"";
            result += class_name(span.cls);
            result += "\">";
            result += escape_html(span.text);
            result += "</span>";
        }
    }
    return result;
}

std::vector<MarkupRow> render_markup(Alignment const& alignment)
{
    std::vector<MarkupRow> rows;
    rows.reserve(alignment.size());
    for (auto & row : alignment) {
        rows.push_back({render_markup(row.left), render_markup(row.right), row.unmatched_left});
    }
    return rows;
}

Summary summarize(Alignment const& alignment)
{
    Summary summary;
    for (auto & row : alignment) {
        if (row.unmatched_left) {
            ++ summary.missing;
            continue;
        }
        if (row.left.empty() && !row.right.empty() && row.right.front().cls == TokenClass::Extra) {
            ++ summary.extra;
            continue;
        }
        ++ summary.matched;
        auto count = [&](Spans const& spans) {
            for (auto & span : spans) {
                switch (span.cls) {
                case TokenClass::Equal: break;
                case TokenClass::CaseDiff: ++ summary.case_diff; break;
                case TokenClass::DecimalDiff: ++ summary.decimal_diff; break;
                case TokenClass::Diff: ++ summary.diff; break;
                case TokenClass::Missing: ++ summary.missing_tokens; break;
                case TokenClass::Extra: ++ summary.extra_tokens; break;
                }
            }
        };
        // paired classes are counted once, from the left side
        count(row.left);
        for (auto & span : row.right) {
            if (span.cls == TokenClass::Extra) {
                ++ summary.extra_tokens;
            }
        }
    }
    return summary;
}

std::string render_page(std::string_view name, Alignment const& alignment)
{
    Summary summary = summarize(alignment);
    std::string title = escape_html(name);
    std::stringstream page;

    page << "<!DOCTYPE html>\n"
         << "<html>\n<head>\n<meta charset=\"utf-8\">\n"
         << "<title>Comparison: " << title << "</title>\n"
         << "<style>\n"
         << "body { font-family: sans-serif; margin: 2em; }\n"
         << "table { border-collapse: collapse; width: 100%; }\n"
         << "th, td { border: 1px solid #ccc; padding: 0.4em; vertical-align: top; width: 50%; }\n"
         << "tr.unmatched td { background: #fff4f4; }\n"
         << ".missing { background: #f8b4b4; }\n"
         << ".extra { background: #b4f0b4; }\n"
         << ".case-diff { background: #f8e7a0; }\n"
         << ".decimal-diff { background: #b4d4f8; }\n"
         << ".diff { background: #f8c890; }\n"
         << "</style>\n</head>\n<body>\n"
         << "<h1>" << title << "</h1>\n"
         << "<p class=\"legend\">"
         << "<span class=\"missing\">missing</span> "
         << "<span class=\"extra\">extra</span> "
         << "<span class=\"case-diff\">case</span> "
         << "<span class=\"decimal-diff\">number format</span> "
         << "<span class=\"diff\">changed</span></p>\n"
         << "<p class=\"summary\">"
         << summary.matched << " matched, "
         << summary.missing << " missing, "
         << summary.extra << " extra sentences</p>\n"
         << "<table>\n<tr><th>Source</th><th>Rendered</th></tr>\n";

    for (auto & row : alignment) {
        page << (row.unmatched_left ? "<tr class=\"unmatched\">" : "<tr>")
             << "<td>" << render_markup(row.left) << "</td>"
             << "<td>" << render_markup(row.right) << "</td>"
             << "</tr>\n";
    }

    page << "</table>\n</body>\n</html>\n";
    return page.str();
}

static boost::json::array spans_json(Spans const& spans)
{
    boost::json::array array;
    for (auto & span : spans) {
        boost::json::object obj;
        obj["text"] = span.text;
        obj["class"] = span.cls == TokenClass::Equal ? std::string_view("equal") : class_name(span.cls);
        array.emplace_back(std::move(obj));
    }
    return array;
}

std::string render_json(std::string_view name, double threshold, Alignment const& alignment)
{
    Summary summary = summarize(alignment);
    boost::json::object doc;
    doc["name"] = name;
    doc["threshold"] = threshold;
    doc["summary"] = {
        {"matched", summary.matched},
        {"missing", summary.missing},
        {"extra", summary.extra},
        {"case_diff", summary.case_diff},
        {"decimal_diff", summary.decimal_diff},
        {"diff", summary.diff},
        {"missing_tokens", summary.missing_tokens},
        {"extra_tokens", summary.extra_tokens},
    };

    boost::json::array rows;
    for (auto & row : alignment) {
        rows.emplace_back(boost::json::object{
            {"left", spans_json(row.left)},
            {"right", spans_json(row.right)},
            {"unmatched_left", row.unmatched_left},
        });
    }
    doc["rows"] = std::move(rows);

    return boost::json::serialize(doc);
}

} // namespace collate
