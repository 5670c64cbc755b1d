#include <weft/layout/fill.h>

#include <algorithm>

namespace weft::layout {

std::vector<std::string> fill_glyphs(const std::string& pattern) {
    std::vector<std::string> glyphs;
    for (std::size_t i = 0; i < pattern.size();) {
        unsigned char lead = static_cast<unsigned char>(pattern[i]);
        std::size_t len = 1;
        if ((lead & 0xE0) == 0xC0) len = 2;
        else if ((lead & 0xF0) == 0xE0) len = 3;
        else if ((lead & 0xF8) == 0xF0) len = 4;
        // Truncated sequence at the end: keep what is there as one glyph.
        len = std::min(len, pattern.size() - i);
        glyphs.push_back(pattern.substr(i, len));
        i += len;
    }
    return glyphs;
}

std::int64_t fill_cell_count(const FillDirective& directive) {
    const Rect& box = directive.assigned_rect;
    if (box.is_empty()) return 0;
    std::int64_t covered = 0;
    if (directive.child_rect && !directive.child_rect->is_empty()) {
        covered = std::int64_t{directive.child_rect->width} * directive.child_rect->height;
    }
    return std::int64_t{box.width} * box.height - covered;
}

std::optional<std::string> fill_glyph_at(const FillDirective& directive, int x, int y) {
    const Rect& box = directive.assigned_rect;
    if (!box.contains(x, y)) return std::nullopt;
    if (directive.child_rect && directive.child_rect->contains(x, y)) return std::nullopt;

    auto glyphs = fill_glyphs(directive.pattern);
    if (glyphs.empty()) return std::nullopt;
    return glyphs[static_cast<std::size_t>(x - box.x) % glyphs.size()];
}

std::vector<std::string> tile_fill(const FillDirective& directive) {
    const Rect& box = directive.assigned_rect;
    auto glyphs = fill_glyphs(directive.pattern);

    std::vector<std::string> rows;
    rows.reserve(static_cast<std::size_t>(std::max(0, box.height)));
    for (int y = box.y; y < box.bottom(); ++y) {
        std::string row;
        for (int x = box.x; x < box.right(); ++x) {
            bool under_child = directive.child_rect && directive.child_rect->contains(x, y);
            if (under_child || glyphs.empty()) {
                row += ' ';
            } else {
                row += glyphs[static_cast<std::size_t>(x - box.x) % glyphs.size()];
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace weft::layout
