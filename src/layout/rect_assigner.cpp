#include <weft/layout/rect_assigner.h>

#include <algorithm>
#include <type_traits>

namespace weft::layout {

using widget::NodeId;

void RectAssigner::assign_root(Extent extent) {
    NodeId root = pass_.tree.root();
    if (root == widget::kInvalidNode) return;
    // The caller's extent is the root's box; only an unbounded dimension
    // falls back to the computed size.
    Size s = pass_.sizes[root];
    assign(root, Rect{0, 0, extent.width_bounded() ? extent.width : s.width,
                      extent.height_bounded() ? extent.height : s.height});
}

void RectAssigner::assign(NodeId id, Rect rect) {
    pass_.rects[id] = rect;
    const auto& node = pass_.tree.node(id);
    const auto& kids = node.children;

    std::visit([&](const auto& kind) {
        using T = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<T, widget::Stack>) {
            place_stack(id, kind.axis, rect);
        } else if constexpr (std::is_same_v<T, widget::ZStack>) {
            // Overlay: later children draw on top, order is kept as-is.
            for (NodeId child : kids) {
                Size s = pass_.sizes[child];
                assign(child, Rect{rect.x, rect.y, s.width, s.height});
            }
        } else if constexpr (std::is_same_v<T, widget::Border>) {
            constexpr int inset = core::config::kBorderInset;
            for (NodeId child : kids) assign(child, rect.shrink(inset, inset, inset, inset));
        } else if constexpr (std::is_same_v<T, widget::Padding>) {
            for (NodeId child : kids) {
                assign(child, rect.shrink(kind.left, kind.right, kind.top, kind.bottom));
            }
        } else if constexpr (std::is_same_v<T, widget::Expand>) {
            // The child keeps its own size at the box origin; the rest is fill.
            for (NodeId child : kids) {
                Size s = pass_.sizes[child];
                assign(child, Rect{rect.x, rect.y, std::min(s.width, rect.width),
                                   std::min(s.height, rect.height)});
            }
        } else {
            // Container, Canvas, ComponentSlot pass their box through;
            // spans share their text's box.
            for (NodeId child : kids) assign(child, rect);
        }
    }, node.kind);
}

void RectAssigner::place_stack(NodeId id, Axis axis, Rect rect) {
    int offset = 0;
    for (NodeId child : pass_.tree.children(id)) {
        Size s = pass_.sizes[child];
        Rect r{rect.x, rect.y, s.width, s.height};
        if (axis == Axis::Horizontal) {
            r.x = saturating_add(r.x, offset);
        } else {
            r.y = saturating_add(r.y, offset);
        }
        assign(child, r);
        offset = saturating_add(offset, main_of(s, axis));
    }
}

} // namespace weft::layout
