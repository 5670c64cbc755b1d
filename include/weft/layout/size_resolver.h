#pragma once
#include <weft/layout/layout_pass.h>
#include <optional>
#include <stdexcept>
#include <string>

namespace weft::layout {

// Raised when the measurement collaborator cannot size a leaf. Aborts the
// current pass; LayoutEngine turns it into a failed LayoutResult.
class MeasurementError : public std::runtime_error {
public:
    MeasurementError(widget::NodeId node, const std::string& message)
        : std::runtime_error(message), node_(node) {}

    widget::NodeId node() const { return node_; }

private:
    widget::NodeId node_;
};

// Bottom-up sizing. Fixed children of a stack are measured in order against
// the room their earlier siblings left; expand and spacer children are then
// sized from the leftover by the space distributor, and their own children
// are sized inside the box they were given.
class SizeResolver {
public:
    explicit SizeResolver(LayoutPass& pass) : pass_(pass) {}

    // Sizes `id` and its subtree. Throws MeasurementError.
    Size resolve(widget::NodeId id, Extent extent);

private:
    Size resolve_stack(widget::NodeId id, Axis axis, Extent extent);
    Size resolve_zstack(widget::NodeId id, Extent extent);
    Size resolve_inset(widget::NodeId id, Extent extent, int left, int right, int top, int bottom);
    Size resolve_pinned(widget::NodeId id, Extent extent, std::optional<int> width,
                        std::optional<int> height, bool measure_when_empty);
    Size resolve_text(widget::NodeId id, Extent extent);
    Size resolve_lone_flexible(widget::NodeId id, Extent extent);

    // Expand/spacer that already knows its box. Unbounded box dimensions fall
    // back to the child's size.
    Size size_in_box(widget::NodeId id, Extent box);

    // Expand/spacer that gets no extra room: sized like its child.
    Size pass_through(widget::NodeId id, Extent extent);

    Size measure(widget::NodeId id, int available_width);
    Size record(widget::NodeId id, Size wanted, Extent extent);
    std::optional<widget::NodeId> only_child(widget::NodeId id) const;

    LayoutPass& pass_;
};

} // namespace weft::layout
