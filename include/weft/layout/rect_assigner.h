#pragma once
#include <weft/layout/layout_pass.h>

namespace weft::layout {

// Top-down pass turning computed sizes into absolute rectangles.
class RectAssigner {
public:
    explicit RectAssigner(LayoutPass& pass) : pass_(pass) {}

    // Places the root at (0,0) with the caller's extent as its box, then
    // every descendant.
    void assign_root(Extent extent);

    void assign(widget::NodeId id, Rect rect);

private:
    void place_stack(widget::NodeId id, Axis axis, Rect rect);

    LayoutPass& pass_;
};

} // namespace weft::layout
