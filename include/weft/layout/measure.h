#pragma once
#include <weft/layout/geometry.h>
#include <weft/widget/widget_node.h>
#include <functional>
#include <string>

namespace weft::layout {

struct MeasureResult {
    bool ok = false;
    Size size;
    std::string error;

    static MeasureResult success(Size s) { return {true, s, {}}; }
    static MeasureResult failure(std::string message) { return {false, {}, std::move(message)}; }
};

// Collaborator that sizes leaf content (text, spans, canvases without explicit
// dimensions). `available_width` is kUnbounded when the width is unconstrained.
using MeasureFn = std::function<MeasureResult(const widget::WidgetTree& tree,
                                              widget::NodeId node,
                                              int available_width)>;

// One cell per code point, lines split on '\n' and hard-wrapped at the
// available width. Text content includes the content of its span children.
MeasureFn monospace_measurer();

// Number of UTF-8 code points in `text`.
int count_code_points(const std::string& text);

} // namespace weft::layout
