#include <weft/layout/layout_engine.h>
#include <weft/layout/layout_pass.h>
#include <weft/layout/rect_assigner.h>
#include <weft/layout/size_resolver.h>

#include <sstream>

namespace weft::layout {

using widget::NodeId;

namespace {

std::string format_extent(Extent extent) {
    auto dim = [](int v) { return is_bounded(v) ? std::to_string(v) : std::string("inf"); };
    return dim(extent.width) + "x" + dim(extent.height);
}

} // namespace

const char* layout_error_name(LayoutError error) {
    switch (error) {
        case LayoutError::None:             return "none";
        case LayoutError::MeasurementError: return "measurement-error";
    }
    return "unknown";
}

std::optional<Rect> LayoutResult::rect_of(NodeId id) const {
    if (id >= node_rects.size()) return std::nullopt;
    return node_rects[id];
}

std::optional<Rect> LayoutResult::rect_at(const widget::NodePath& path) const {
    auto it = rects.find(path);
    if (it == rects.end()) return std::nullopt;
    return it->second;
}

LayoutResult LayoutEngine::compute(const widget::WidgetTree& tree, Extent extent) const {
    const std::uint64_t pass_id = ++pass_count_;
    LayoutResult result;

    LayoutPass pass(tree);
    pass.measurer = &measurer_;
    pass.diagnostics = diagnostics_;
    pass.number = pass_id;

    if (tree.empty()) {
        result.ok = true;
        return result;
    }

    pass.log(core::Severity::Info, "begin",
             std::to_string(tree.size()) + " nodes in " + format_extent(extent));

    try {
        SizeResolver(pass).resolve(tree.root(), extent);
    } catch (const MeasurementError& e) {
        pass.log(core::Severity::Error, "measure", e.what(), e.node());
        result.error = LayoutError::MeasurementError;
        result.message = e.what();
        return result;
    }

    RectAssigner(pass).assign_root(extent);

    tree.visit_pre_order([&](NodeId id) {
        result.rects.emplace(tree.path_of(id), pass.rects[id]);
    });
    result.fills = collect_fills(tree, pass.rects);
    result.node_rects = std::move(pass.rects);
    result.sizes = std::move(pass.sizes);
    result.ok = true;

    const Rect& root = result.node_rects[tree.root()];
    pass.log(core::Severity::Info, "end",
             "root " + std::to_string(root.width) + "x" + std::to_string(root.height) + ", " +
                 std::to_string(result.fills.size()) + " fill directives");
    return result;
}

std::vector<FillDirective> LayoutEngine::collect_fills(const widget::WidgetTree& tree,
                                                       const std::vector<Rect>& rects) {
    std::vector<FillDirective> fills;
    tree.visit_pre_order([&](NodeId id) {
        const auto* expand = tree.node(id).as<widget::Expand>();
        if (!expand || expand->fill.empty()) return;

        FillDirective d;
        d.node = id;
        d.path = tree.path_of(id);
        d.assigned_rect = rects[id];
        d.pattern = expand->fill;
        const auto& kids = tree.children(id);
        if (!kids.empty()) d.child_rect = rects[kids.front()];

        if (fill_cell_count(d) > 0) fills.push_back(std::move(d));
    });
    return fills;
}

std::string serialize_layout(const widget::WidgetTree& tree, const LayoutResult& result) {
    std::ostringstream oss;
    if (!result.ok) {
        oss << "error " << layout_error_name(result.error) << ": " << result.message << "\n";
        return oss.str();
    }
    tree.visit_pre_order([&](NodeId id) {
        const Rect& r = result.node_rects[id];
        oss << std::string(tree.depth(id) * 2, ' ') << widget::kind_name(tree.node(id).kind)
            << " " << widget::format_path(tree.path_of(id)) << " [" << r.x << "," << r.y << " "
            << r.width << "x" << r.height << "]\n";
    });
    for (const auto& f : result.fills) {
        oss << "fill " << widget::format_path(f.path) << " \"" << f.pattern << "\" ["
            << f.assigned_rect.x << "," << f.assigned_rect.y << " " << f.assigned_rect.width
            << "x" << f.assigned_rect.height << "]";
        if (f.child_rect) {
            oss << " minus [" << f.child_rect->x << "," << f.child_rect->y << " "
                << f.child_rect->width << "x" << f.child_rect->height << "]";
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace weft::layout
