#include <weft/widget/tree_builder.h>

#include <limits>
#include <type_traits>

namespace weft::widget {

namespace {

struct AttributeError {
    TreeError error = TreeError::None;
    std::string message;

    bool failed() const { return error != TreeError::None; }
    void set(TreeError e, std::string m) {
        if (failed()) return;
        error = e;
        message = std::move(m);
    }
};

const char* value_type_name(const AttributeValue& value) {
    if (std::holds_alternative<bool>(value)) return "bool";
    if (std::holds_alternative<std::int64_t>(value)) return "integer";
    return "string";
}

std::optional<std::int64_t> read_integer(const AttributeMap& attrs, const std::string& key,
                                         AttributeError& err) {
    auto it = attrs.find(key);
    if (it == attrs.end()) return std::nullopt;
    if (const auto* v = std::get_if<std::int64_t>(&it->second)) return *v;
    err.set(TreeError::InvalidAttribute,
            "attribute '" + key + "' expects an integer, got " + value_type_name(it->second));
    return std::nullopt;
}

std::optional<std::string> read_string(const AttributeMap& attrs, const std::string& key,
                                       AttributeError& err) {
    auto it = attrs.find(key);
    if (it == attrs.end()) return std::nullopt;
    if (const auto* v = std::get_if<std::string>(&it->second)) return *v;
    err.set(TreeError::InvalidAttribute,
            "attribute '" + key + "' expects a string, got " + value_type_name(it->second));
    return std::nullopt;
}

// Non-negative cell count that fits an int.
std::optional<int> read_cells(const AttributeMap& attrs, const std::string& key,
                              AttributeError& err) {
    auto v = read_integer(attrs, key, err);
    if (!v) return std::nullopt;
    if (*v < 0 || *v > std::numeric_limits<int>::max()) {
        err.set(TreeError::InvalidAttribute,
                "attribute '" + key + "' must be a non-negative cell count, got " +
                    std::to_string(*v));
        return std::nullopt;
    }
    return static_cast<int>(*v);
}

std::uint32_t read_factor(const AttributeMap& attrs, AttributeError& err) {
    auto v = read_integer(attrs, "factor", err);
    if (!v) return core::config::kDefaultFactor;
    if (*v < 0) {
        err.set(TreeError::InvalidFactor, "factor must be >= 0, got " + std::to_string(*v));
        return 0;
    }
    if (*v > std::numeric_limits<std::uint32_t>::max()) {
        err.set(TreeError::InvalidAttribute, "factor is out of range: " + std::to_string(*v));
        return 0;
    }
    return static_cast<std::uint32_t>(*v);
}

std::optional<Axis> read_axis(const AttributeMap& attrs, AttributeError& err) {
    auto text = read_string(attrs, "axis", err);
    if (!text) return std::nullopt;
    auto axis = layout::parse_axis(*text);
    if (!axis) {
        err.set(TreeError::InvalidAttribute, "unknown axis '" + *text + "'");
    }
    return axis;
}

// Typed kinds can still carry out-of-range values when built directly.
AttributeError check_kind(const WidgetKind& kind) {
    AttributeError err;
    std::visit([&](const auto& k) {
        using T = std::decay_t<decltype(k)>;
        if constexpr (std::is_same_v<T, Padding>) {
            if (k.left < 0 || k.right < 0 || k.top < 0 || k.bottom < 0) {
                err.set(TreeError::InvalidAttribute, "padding must be non-negative");
            }
        } else if constexpr (std::is_same_v<T, Container> || std::is_same_v<T, Canvas>) {
            if ((k.width && *k.width < 0) || (k.height && *k.height < 0)) {
                err.set(TreeError::InvalidAttribute, "width/height must be non-negative");
            }
        }
    }, kind);
    return err;
}

} // namespace

const char* tree_error_name(TreeError error) {
    switch (error) {
        case TreeError::None:              return "none";
        case TreeError::EmptyTree:         return "empty-tree";
        case TreeError::MultipleRoots:     return "multiple-roots";
        case TreeError::UnknownParent:     return "unknown-parent";
        case TreeError::UnknownWidget:     return "unknown-widget";
        case TreeError::InvalidAttribute:  return "invalid-attribute";
        case TreeError::InvalidFactor:     return "invalid-factor";
        case TreeError::InvalidChildCount: return "invalid-child-count";
    }
    return "unknown";
}

ParsedWidget parse_widget(std::string_view tag, const AttributeMap& attributes,
                          const std::string& value) {
    ParsedWidget result;
    AttributeError err;

    if (tag == "vstack") {
        result.kind = Stack{Axis::Vertical};
    } else if (tag == "hstack") {
        result.kind = Stack{Axis::Horizontal};
    } else if (tag == "zstack") {
        result.kind = ZStack{};
    } else if (tag == "border") {
        result.kind = Border{};
    } else if (tag == "padding") {
        Padding p;
        int all = read_cells(attributes, "padding", err).value_or(0);
        p.left = read_cells(attributes, "left", err).value_or(all);
        p.right = read_cells(attributes, "right", err).value_or(all);
        p.top = read_cells(attributes, "top", err).value_or(all);
        p.bottom = read_cells(attributes, "bottom", err).value_or(all);
        result.kind = p;
    } else if (tag == "container") {
        Container c;
        c.width = read_cells(attributes, "width", err);
        c.height = read_cells(attributes, "height", err);
        result.kind = c;
    } else if (tag == "canvas") {
        Canvas c;
        c.width = read_cells(attributes, "width", err);
        c.height = read_cells(attributes, "height", err);
        result.kind = c;
    } else if (tag == "text") {
        result.kind = Text{value};
    } else if (tag == "span") {
        result.kind = Span{value};
    } else if (tag == "expand") {
        Expand e;
        e.factor = read_factor(attributes, err);
        e.axis = read_axis(attributes, err);
        e.fill = read_string(attributes, "fill", err).value_or("");
        result.kind = e;
    } else if (tag == "spacer") {
        Spacer s;
        s.factor = read_factor(attributes, err);
        result.kind = s;
    } else if (tag == "component") {
        result.kind = ComponentSlot{value};
    } else {
        result.error = TreeError::UnknownWidget;
        result.message = "unknown widget '" + std::string(tag) + "'";
        return result;
    }

    if (err.failed()) {
        result.error = err.error;
        result.message = std::string(tag) + ": " + err.message;
        return result;
    }
    result.ok = true;
    return result;
}

NodeId WidgetTreeBuilder::add_root(WidgetKind kind, AttributeMap attributes) {
    if (has_error()) return kInvalidNode;
    if (!tree_.empty()) {
        fail(TreeError::MultipleRoots, "tree already has a root");
        return kInvalidNode;
    }
    return append(kInvalidNode, std::move(kind), std::move(attributes));
}

NodeId WidgetTreeBuilder::add_child(NodeId parent, WidgetKind kind, AttributeMap attributes) {
    if (has_error()) return kInvalidNode;
    if (parent >= tree_.size()) {
        fail(TreeError::UnknownParent, "parent node " + std::to_string(parent) + " does not exist");
        return kInvalidNode;
    }
    return append(parent, std::move(kind), std::move(attributes));
}

NodeId WidgetTreeBuilder::add_markup_root(std::string_view tag, AttributeMap attributes,
                                          const std::string& value) {
    if (has_error()) return kInvalidNode;
    auto parsed = parse_widget(tag, attributes, value);
    if (!parsed.ok) {
        fail(parsed.error, parsed.message);
        return kInvalidNode;
    }
    return add_root(std::move(parsed.kind), std::move(attributes));
}

NodeId WidgetTreeBuilder::add_markup_child(NodeId parent, std::string_view tag,
                                           AttributeMap attributes, const std::string& value) {
    if (has_error()) return kInvalidNode;
    auto parsed = parse_widget(tag, attributes, value);
    if (!parsed.ok) {
        fail(parsed.error, parsed.message);
        return kInvalidNode;
    }
    return add_child(parent, std::move(parsed.kind), std::move(attributes));
}

NodeId WidgetTreeBuilder::append(NodeId parent, WidgetKind kind, AttributeMap attributes) {
    auto check = check_kind(kind);
    if (check.failed()) {
        fail(check.error, kind_name(kind) + ": " + check.message);
        return kInvalidNode;
    }

    NodeId id = tree_.nodes_.size();
    WidgetNode node;
    node.kind = std::move(kind);
    node.attributes = std::move(attributes);
    node.parent = parent;
    tree_.nodes_.push_back(std::move(node));
    if (parent != kInvalidNode) {
        tree_.nodes_[parent].children.push_back(id);
    }
    return id;
}

void WidgetTreeBuilder::fail(TreeError error, std::string message) {
    if (has_error()) return;
    error_ = error;
    message_ = std::move(message);
}

bool WidgetTreeBuilder::validate_children(NodeId id) {
    const auto& n = tree_.node(id);
    const std::size_t count = n.children.size();
    const std::string where = kind_name(n.kind) + " at " + format_path(tree_.path_of(id));

    if (n.is<Spacer>() || n.is<Span>()) {
        if (count != 0) {
            fail(TreeError::InvalidChildCount, where + " cannot have children");
            return false;
        }
    } else if (n.is<Text>()) {
        for (NodeId child : n.children) {
            if (!tree_.node(child).is<Span>()) {
                fail(TreeError::InvalidChildCount, where + " only accepts span children");
                return false;
            }
        }
    } else if (n.is<Border>() || n.is<Padding>() || n.is<Container>() || n.is<Canvas>() ||
               n.is<Expand>() || n.is<ComponentSlot>()) {
        if (count > 1) {
            fail(TreeError::InvalidChildCount,
                 where + " accepts a single child, got " + std::to_string(count));
            return false;
        }
    }
    return true;
}

TreeBuildResult WidgetTreeBuilder::build() {
    TreeBuildResult result;
    if (!has_error() && tree_.empty()) {
        fail(TreeError::EmptyTree, "no root widget");
    }
    if (!has_error()) {
        for (NodeId id = 0; id < tree_.size(); ++id) {
            if (!validate_children(id)) break;
        }
    }

    if (has_error()) {
        result.error = error_;
        result.message = message_;
    } else {
        result.ok = true;
        result.tree = std::move(tree_);
    }

    tree_ = WidgetTree{};
    error_ = TreeError::None;
    message_.clear();
    return result;
}

} // namespace weft::widget
