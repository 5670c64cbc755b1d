#pragma once
#include <weft/core/config.h>
#include <weft/layout/geometry.h>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace weft::widget {

using layout::Axis;

using NodeId = std::size_t;
inline constexpr NodeId kInvalidNode = static_cast<NodeId>(-1);

// Child indices from the root; the root's path is empty.
using NodePath = std::vector<std::size_t>;

std::string format_path(const NodePath& path);

// Widget kinds. Each carries its attributes already converted to typed fields.
struct Stack {
    Axis axis = Axis::Vertical;
};
struct ZStack {};
struct Border {};
struct Padding {
    int left = 0, right = 0, top = 0, bottom = 0;
};
struct Container {
    std::optional<int> width;
    std::optional<int> height;
};
struct Canvas {
    std::optional<int> width;
    std::optional<int> height;
};
struct Text {
    std::string content;
};
struct Span {
    std::string content;
};
struct Expand {
    std::uint32_t factor = core::config::kDefaultFactor;
    std::optional<Axis> axis;  // defaults to the nearest stack's axis
    std::string fill;
};
struct Spacer {
    std::uint32_t factor = core::config::kDefaultFactor;
};
struct ComponentSlot {
    std::string name;
};

using WidgetKind = std::variant<Stack, ZStack, Border, Padding, Container, Canvas,
                                Text, Span, Expand, Spacer, ComponentSlot>;

// Tag name as written in templates ("vstack", "hstack", "expand", ...).
std::string kind_name(const WidgetKind& kind);

// Resolved attribute values; no expressions remain by the time a tree is built.
using AttributeValue = std::variant<bool, std::int64_t, std::string>;
using AttributeMap = std::map<std::string, AttributeValue>;

struct WidgetNode {
    WidgetKind kind;
    AttributeMap attributes;
    NodeId parent = kInvalidNode;
    std::vector<NodeId> children;  // document order

    template<typename T> bool is() const { return std::holds_alternative<T>(kind); }
    template<typename T> const T* as() const { return std::get_if<T>(&kind); }

    // Expand and Spacer take their size from the space distributor.
    bool is_flexible() const { return is<Expand>() || is<Spacer>(); }
};

// Arena-backed widget tree. Node ids are indices into the arena and stay
// valid for the lifetime of the tree; the tree is never mutated once built.
class WidgetTree {
public:
    bool empty() const { return nodes_.empty(); }
    std::size_t size() const { return nodes_.size(); }
    NodeId root() const { return nodes_.empty() ? kInvalidNode : 0; }

    const WidgetNode& node(NodeId id) const { return nodes_.at(id); }
    NodeId parent(NodeId id) const { return nodes_.at(id).parent; }
    const std::vector<NodeId>& children(NodeId id) const { return nodes_.at(id).children; }

    NodePath path_of(NodeId id) const;
    std::optional<NodeId> find(const NodePath& path) const;
    std::size_t depth(NodeId id) const;

    // Axis of the closest Stack strictly above the node, if any.
    std::optional<Axis> nearest_stack_axis(NodeId id) const;

    // Own axis for Expand when set, otherwise the nearest stack's axis.
    std::optional<Axis> effective_axis(NodeId id) const;

    std::vector<NodeId> pre_order() const;
    std::vector<NodeId> post_order() const;

    void visit_pre_order(const std::function<void(NodeId)>& fn) const;
    void visit_post_order(const std::function<void(NodeId)>& fn) const;

private:
    friend class WidgetTreeBuilder;
    std::vector<WidgetNode> nodes_;
};

} // namespace weft::widget
