#pragma once
#include <weft/core/diagnostics.h>
#include <weft/layout/fill.h>
#include <weft/layout/geometry.h>
#include <weft/layout/measure.h>
#include <weft/widget/widget_node.h>
#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace weft::layout {

enum class LayoutError {
    None,
    MeasurementError,
};

const char* layout_error_name(LayoutError error);

// Output of one pass. All-or-nothing: a failed pass carries no rectangles.
struct LayoutResult {
    bool ok = false;
    LayoutError error = LayoutError::None;
    std::string message;

    std::map<widget::NodePath, Rect> rects;
    std::vector<Rect> node_rects;  // indexed by NodeId
    std::vector<Size> sizes;       // computed sizes, indexed by NodeId
    std::vector<FillDirective> fills;

    std::optional<Rect> rect_of(widget::NodeId id) const;
    std::optional<Rect> rect_at(const widget::NodePath& path) const;
};

class LayoutEngine {
public:
    LayoutEngine() = default;
    explicit LayoutEngine(MeasureFn measurer) : measurer_(std::move(measurer)) {}

    // Full layout of `tree` inside `extent`. Pure with respect to the tree and
    // safe to call concurrently; each call is numbered and its diagnostics
    // carry that number.
    LayoutResult compute(const widget::WidgetTree& tree, Extent extent) const;

    // Leaf measurement for text, spans and content-sized canvases.
    void set_measurer(MeasureFn fn) { measurer_ = std::move(fn); }

    // Optional sink for pass diagnostics, may be shared; not owned.
    void set_diagnostics(core::DiagnosticEmitter* emitter) { diagnostics_ = emitter; }

    std::uint64_t pass_count() const { return pass_count_.load(); }

private:
    static std::vector<FillDirective> collect_fills(const widget::WidgetTree& tree,
                                                    const std::vector<Rect>& rects);

    MeasureFn measurer_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    mutable std::atomic<std::uint64_t> pass_count_{0};
};

// Stable text form of a layout, one node per line in pre-order:
//   vstack /0 [1,1 8x4]
std::string serialize_layout(const widget::WidgetTree& tree, const LayoutResult& result);

} // namespace weft::layout
