#pragma once
#include <weft/core/diagnostics.h>
#include <weft/layout/geometry.h>
#include <weft/layout/measure.h>
#include <weft/widget/widget_node.h>
#include <cstdint>
#include <string>
#include <vector>

namespace weft::layout {

// Scratch state for one layout invocation. Nothing here outlives the pass;
// the tree itself is only read.
struct LayoutPass {
    explicit LayoutPass(const widget::WidgetTree& t)
        : tree(t), sizes(t.size()), demanded(t.size()), rects(t.size()) {}

    const widget::WidgetTree& tree;
    std::vector<Size> sizes;     // computed size, clamped to the node's extent
    std::vector<Size> demanded;  // size the node asked for before clamping
    std::vector<Rect> rects;     // assigned absolute rectangle

    const MeasureFn* measurer = nullptr;
    core::DiagnosticEmitter* diagnostics = nullptr;
    std::uint64_t number = 0;

    // Events about a node carry its path as the subject.
    void log(core::Severity severity, const std::string& stage, const std::string& message,
             widget::NodeId subject = widget::kInvalidNode) const;
    void warn(const std::string& stage, widget::NodeId subject, const std::string& message) const {
        log(core::Severity::Warning, stage, message, subject);
    }

    // "expand at /0/2"
    std::string describe(widget::NodeId id) const;
};

} // namespace weft::layout
