#include <weft/layout/size_resolver.h>
#include <weft/layout/space_distributor.h>

#include <algorithm>
#include <type_traits>

namespace weft::layout {

using widget::NodeId;

namespace {

std::uint32_t factor_of(const widget::WidgetNode& node) {
    if (const auto* e = node.as<widget::Expand>()) return e->factor;
    if (const auto* s = node.as<widget::Spacer>()) return s->factor;
    return 0;
}

std::string cells(int value) {
    return is_bounded(value) ? std::to_string(value) : std::string("unbounded");
}

} // namespace

Size SizeResolver::resolve(NodeId id, Extent extent) {
    const auto& node = pass_.tree.node(id);
    return std::visit([&](const auto& kind) -> Size {
        using T = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<T, widget::Stack>) {
            return resolve_stack(id, kind.axis, extent);
        } else if constexpr (std::is_same_v<T, widget::ZStack>) {
            return resolve_zstack(id, extent);
        } else if constexpr (std::is_same_v<T, widget::Border>) {
            return resolve_inset(id, extent, core::config::kBorderInset, core::config::kBorderInset,
                                 core::config::kBorderInset, core::config::kBorderInset);
        } else if constexpr (std::is_same_v<T, widget::Padding>) {
            return resolve_inset(id, extent, kind.left, kind.right, kind.top, kind.bottom);
        } else if constexpr (std::is_same_v<T, widget::Container>) {
            return resolve_pinned(id, extent, kind.width, kind.height, false);
        } else if constexpr (std::is_same_v<T, widget::Canvas>) {
            return resolve_pinned(id, extent, kind.width, kind.height, true);
        } else if constexpr (std::is_same_v<T, widget::ComponentSlot>) {
            return resolve_pinned(id, extent, std::nullopt, std::nullopt, false);
        } else if constexpr (std::is_same_v<T, widget::Text>) {
            return resolve_text(id, extent);
        } else if constexpr (std::is_same_v<T, widget::Span>) {
            return record(id, measure(id, extent.width), extent);
        } else {
            // Expand or Spacer outside a stack's distribution.
            return resolve_lone_flexible(id, extent);
        }
    }, node.kind);
}

Size SizeResolver::resolve_stack(NodeId id, Axis axis, Extent extent) {
    const auto& tree = pass_.tree;
    const int along = extent.along(axis);
    const int across = extent.across(axis);

    std::vector<NodeId> expands;
    std::vector<NodeId> spacers;
    int consumed = 0;
    int demand = 0;

    for (NodeId child : tree.children(id)) {
        const auto& node = tree.node(child);
        const bool flexible = node.is_flexible();
        if (flexible) {
            auto child_axis = tree.effective_axis(child);
            if (child_axis == axis) {
                (node.is<widget::Expand>() ? expands : spacers).push_back(child);
                continue;
            }
            pass_.warn("distribute/axis", child,
                       pass_.describe(child) + " expands " + (child_axis ? axis_name(*child_axis) : "unset") +
                           " inside a " + axis_name(axis) + " stack; sized to its content");
        }

        int room = is_bounded(along) ? std::max(0, along - consumed) : kUnbounded;
        Extent child_extent = Extent::from_axis(axis, room, across);
        Size s = flexible ? pass_through(child, child_extent) : resolve(child, child_extent);
        consumed = saturating_add(consumed, main_of(s, axis));
        demand = saturating_add(demand, main_of(pass_.demanded[child], axis));
    }

    if (!expands.empty() || !spacers.empty()) {
        if (is_bounded(along)) {
            if (demand > along) {
                pass_.warn("distribute/overflow", id,
                           pass_.describe(id) + " fixed children need " + std::to_string(demand) +
                               " cells of " + std::to_string(along) + "; nothing left to distribute");
            }
            const int remaining = std::max(0, along - consumed);

            std::vector<std::uint32_t> expand_factors;
            std::vector<std::uint32_t> spacer_factors;
            for (NodeId e : expands) expand_factors.push_back(factor_of(tree.node(e)));
            for (NodeId s : spacers) spacer_factors.push_back(factor_of(tree.node(s)));

            Distribution d = distribute_stack(remaining, expand_factors, spacer_factors);
            for (std::size_t i = 0; i < expands.size(); ++i) {
                size_in_box(expands[i], Extent::from_axis(axis, d.expands[i], across));
            }
            for (std::size_t i = 0; i < spacers.size(); ++i) {
                size_in_box(spacers[i], Extent::from_axis(axis, d.spacers[i], across));
            }
        } else {
            pass_.warn("distribute/unbounded", id,
                       pass_.describe(id) + " has no bound along its axis; expands and spacers "
                                            "are sized to their content");
            for (NodeId e : expands) size_in_box(e, Extent::from_axis(axis, kUnbounded, across));
            for (NodeId s : spacers) size_in_box(s, Extent::from_axis(axis, kUnbounded, across));
        }
    }

    int total = 0;
    int thickest = 0;
    for (NodeId child : tree.children(id)) {
        total = saturating_add(total, main_of(pass_.sizes[child], axis));
        thickest = std::max(thickest, cross_of(pass_.sizes[child], axis));
    }
    return record(id, make_size(axis, total, thickest), extent);
}

Size SizeResolver::resolve_zstack(NodeId id, Extent extent) {
    Size largest;
    for (NodeId child : pass_.tree.children(id)) {
        Size s = resolve(child, extent);
        largest.width = std::max(largest.width, s.width);
        largest.height = std::max(largest.height, s.height);
    }
    Size wanted{extent.width_bounded() ? extent.width : largest.width,
                extent.height_bounded() ? extent.height : largest.height};
    return record(id, wanted, extent);
}

Size SizeResolver::resolve_inset(NodeId id, Extent extent, int left, int right, int top,
                                 int bottom) {
    const int horizontal = saturating_add(left, right);
    const int vertical = saturating_add(top, bottom);
    Size content;
    if (auto child = only_child(id)) {
        content = resolve(*child, extent.reduce(horizontal, vertical));
    }
    return record(id, {saturating_add(content.width, horizontal),
                       saturating_add(content.height, vertical)}, extent);
}

Size SizeResolver::resolve_pinned(NodeId id, Extent extent, std::optional<int> width,
                                  std::optional<int> height, bool measure_when_empty) {
    Extent inner = extent.pin(width, height);
    Size content;
    if (auto child = only_child(id)) {
        content = resolve(*child, inner);
    } else if (measure_when_empty && (!width || !height)) {
        content = measure(id, inner.width);
    }
    return record(id, {width.value_or(content.width), height.value_or(content.height)}, extent);
}

Size SizeResolver::resolve_text(NodeId id, Extent extent) {
    Size s = record(id, measure(id, extent.width), extent);
    // Spans are inline runs of the text; they share its box.
    for (NodeId span : pass_.tree.children(id)) {
        pass_.sizes[span] = s;
        pass_.demanded[span] = pass_.demanded[id];
    }
    return s;
}

Size SizeResolver::resolve_lone_flexible(NodeId id, Extent extent) {
    auto axis = pass_.tree.effective_axis(id);
    if (!axis) {
        pass_.warn("distribute/axis", id,
                   pass_.describe(id) + " has no axis to expand along; sized to its content");
        return pass_through(id, extent);
    }
    if (!is_bounded(extent.along(*axis))) {
        pass_.warn("distribute/unbounded", id,
                   pass_.describe(id) + " is unbounded along " + axis_name(*axis) +
                       "; sized to its content");
    }
    // Sole claimant: the whole extent is its leftover.
    return size_in_box(id, extent);
}

Size SizeResolver::size_in_box(NodeId id, Extent box) {
    Size content;
    if (auto child = only_child(id)) {
        content = resolve(*child, box);
    }
    Size wanted{box.width_bounded() ? box.width : content.width,
                box.height_bounded() ? box.height : content.height};
    return record(id, wanted, box);
}

Size SizeResolver::pass_through(NodeId id, Extent extent) {
    Size content;
    if (auto child = only_child(id)) {
        content = resolve(*child, extent);
    }
    return record(id, content, extent);
}

Size SizeResolver::measure(NodeId id, int available_width) {
    if (!pass_.measurer || !*pass_.measurer) {
        throw MeasurementError(id, pass_.describe(id) + ": no measurer installed");
    }
    MeasureResult r = (*pass_.measurer)(pass_.tree, id, available_width);
    if (!r.ok) {
        std::string reason = r.error.empty() ? std::string("measurement failed") : r.error;
        throw MeasurementError(id, pass_.describe(id) + ": " + reason +
                                       " (available width " + cells(available_width) + ")");
    }
    return r.size;
}

Size SizeResolver::record(NodeId id, Size wanted, Extent extent) {
    pass_.demanded[id] = wanted;
    pass_.sizes[id] = extent.clamp(wanted);
    return pass_.sizes[id];
}

std::optional<NodeId> SizeResolver::only_child(NodeId id) const {
    const auto& kids = pass_.tree.children(id);
    if (kids.empty()) return std::nullopt;
    return kids.front();
}

} // namespace weft::layout
