#pragma once
#include <weft/layout/geometry.h>
#include <weft/widget/widget_node.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace weft::layout {

// Cells of an expand's box that its child does not cover, to be tiled with
// `pattern` by the renderer.
struct FillDirective {
    widget::NodeId node = widget::kInvalidNode;
    widget::NodePath path;
    Rect assigned_rect;
    std::optional<Rect> child_rect;
    std::string pattern;
};

// The pattern split into code points; each one fills a single cell.
std::vector<std::string> fill_glyphs(const std::string& pattern);

// Number of box cells left for the pattern.
std::int64_t fill_cell_count(const FillDirective& directive);

// Glyph painted at absolute cell (x, y), or nullopt outside the box, under the
// child, or for an empty pattern. Every row restarts the pattern at the box's
// left edge and is cut off at its right edge.
std::optional<std::string> fill_glyph_at(const FillDirective& directive, int x, int y);

// The whole box as text rows; cells under the child are spaces.
std::vector<std::string> tile_fill(const FillDirective& directive);

} // namespace weft::layout
