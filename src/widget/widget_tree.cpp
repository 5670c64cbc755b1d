#include <weft/widget/widget_node.h>

#include <algorithm>
#include <sstream>

namespace weft::widget {

namespace {

struct KindNamer {
    std::string operator()(const Stack& s) const {
        return s.axis == Axis::Horizontal ? "hstack" : "vstack";
    }
    std::string operator()(const ZStack&) const { return "zstack"; }
    std::string operator()(const Border&) const { return "border"; }
    std::string operator()(const Padding&) const { return "padding"; }
    std::string operator()(const Container&) const { return "container"; }
    std::string operator()(const Canvas&) const { return "canvas"; }
    std::string operator()(const Text&) const { return "text"; }
    std::string operator()(const Span&) const { return "span"; }
    std::string operator()(const Expand&) const { return "expand"; }
    std::string operator()(const Spacer&) const { return "spacer"; }
    std::string operator()(const ComponentSlot&) const { return "component"; }
};

} // namespace

std::string format_path(const NodePath& path) {
    std::ostringstream oss;
    oss << "/";
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) oss << "/";
        oss << path[i];
    }
    return oss.str();
}

std::string kind_name(const WidgetKind& kind) {
    return std::visit(KindNamer{}, kind);
}

NodePath WidgetTree::path_of(NodeId id) const {
    NodePath path;
    NodeId current = id;
    while (nodes_.at(current).parent != kInvalidNode) {
        NodeId parent = nodes_[current].parent;
        const auto& siblings = nodes_[parent].children;
        auto it = std::find(siblings.begin(), siblings.end(), current);
        path.push_back(static_cast<std::size_t>(it - siblings.begin()));
        current = parent;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

std::optional<NodeId> WidgetTree::find(const NodePath& path) const {
    if (nodes_.empty()) return std::nullopt;
    NodeId current = root();
    for (std::size_t index : path) {
        const auto& kids = nodes_[current].children;
        if (index >= kids.size()) return std::nullopt;
        current = kids[index];
    }
    return current;
}

std::size_t WidgetTree::depth(NodeId id) const {
    std::size_t d = 0;
    for (NodeId p = nodes_.at(id).parent; p != kInvalidNode; p = nodes_[p].parent) {
        ++d;
    }
    return d;
}

std::optional<Axis> WidgetTree::nearest_stack_axis(NodeId id) const {
    for (NodeId p = nodes_.at(id).parent; p != kInvalidNode; p = nodes_[p].parent) {
        if (const auto* stack = nodes_[p].as<Stack>()) {
            return stack->axis;
        }
    }
    return std::nullopt;
}

std::optional<Axis> WidgetTree::effective_axis(NodeId id) const {
    const auto& n = nodes_.at(id);
    if (const auto* expand = n.as<Expand>(); expand && expand->axis) {
        return expand->axis;
    }
    return nearest_stack_axis(id);
}

std::vector<NodeId> WidgetTree::pre_order() const {
    std::vector<NodeId> order;
    visit_pre_order([&](NodeId id) { order.push_back(id); });
    return order;
}

std::vector<NodeId> WidgetTree::post_order() const {
    std::vector<NodeId> order;
    visit_post_order([&](NodeId id) { order.push_back(id); });
    return order;
}

void WidgetTree::visit_pre_order(const std::function<void(NodeId)>& fn) const {
    if (nodes_.empty()) return;
    std::vector<NodeId> stack{root()};
    while (!stack.empty()) {
        NodeId id = stack.back();
        stack.pop_back();
        fn(id);
        const auto& kids = nodes_[id].children;
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
            stack.push_back(*it);
        }
    }
}

void WidgetTree::visit_post_order(const std::function<void(NodeId)>& fn) const {
    if (nodes_.empty()) return;
    // (node, next child index to visit)
    std::vector<std::pair<NodeId, std::size_t>> stack{{root(), 0}};
    while (!stack.empty()) {
        auto& [id, next] = stack.back();
        const auto& kids = nodes_[id].children;
        if (next < kids.size()) {
            NodeId child = kids[next++];
            stack.push_back({child, 0});
        } else {
            fn(id);
            stack.pop_back();
        }
    }
}

} // namespace weft::widget
