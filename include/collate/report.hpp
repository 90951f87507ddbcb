#pragma once

#include <collate/align.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace collate {

/*
 * A row serialized to inline markup.
 */
struct MarkupRow
{
    std::string left;
    std::string right;
    bool unmatched_left;

    bool operator==(MarkupRow const&) const = default;
};

struct Summary
{
    size_t matched = 0;
    size_t missing = 0;
    size_t extra = 0;

    // token counts, differences only
    size_t case_diff = 0;
    size_t decimal_diff = 0;
    size_t diff = 0;
    size_t missing_tokens = 0;
    size_t extra_tokens = 0;

    bool identical() const
    {
        return !missing && !extra && !case_diff && !decimal_diff && !diff && !missing_tokens && !extra_tokens;
    }
};

std::string escape_html(std::string_view text);

/*
 * Spans joined by single spaces. Equal spans are plain text, the rest
 * are wrapped as <span class="...">text</span>.
 */
std::string render_markup(Spans const& spans);
std::vector<MarkupRow> render_markup(Alignment const& alignment);

Summary summarize(Alignment const& alignment);

/*
 * Standalone HTML comparison page, source on the left and rendering
 * on the right.
 */
std::string render_page(std::string_view name, Alignment const& alignment);

/*
 * JSON document with the summary and the rows as span lists.
 */
std::string render_json(std::string_view name, double threshold, Alignment const& alignment);

} // namespace collate
