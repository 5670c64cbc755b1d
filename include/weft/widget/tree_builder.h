#pragma once
#include <weft/widget/widget_node.h>
#include <string>
#include <string_view>

namespace weft::widget {

enum class TreeError {
    None,
    EmptyTree,
    MultipleRoots,
    UnknownParent,
    UnknownWidget,
    InvalidAttribute,
    InvalidFactor,
    InvalidChildCount,
};

const char* tree_error_name(TreeError error);

struct TreeBuildResult {
    bool ok = false;
    TreeError error = TreeError::None;
    std::string message;
    WidgetTree tree;
};

struct ParsedWidget {
    bool ok = false;
    TreeError error = TreeError::None;
    std::string message;
    WidgetKind kind;
};

// Convert a template tag plus its resolved attribute bag into a typed kind.
// `value` is the positional argument: text content for text/span, the
// component name for component.
ParsedWidget parse_widget(std::string_view tag, const AttributeMap& attributes,
                          const std::string& value = {});

// Builds a WidgetTree one node at a time. The first error is kept and
// reported by build(); later additions after an error are ignored.
class WidgetTreeBuilder {
public:
    NodeId add_root(WidgetKind kind, AttributeMap attributes = {});
    NodeId add_child(NodeId parent, WidgetKind kind, AttributeMap attributes = {});

    NodeId add_markup_root(std::string_view tag, AttributeMap attributes = {},
                           const std::string& value = {});
    NodeId add_markup_child(NodeId parent, std::string_view tag,
                            AttributeMap attributes = {}, const std::string& value = {});

    bool has_error() const { return error_ != TreeError::None; }

    // Validates child counts and hands over the tree. The builder is empty afterwards.
    TreeBuildResult build();

private:
    NodeId append(NodeId parent, WidgetKind kind, AttributeMap attributes);
    void fail(TreeError error, std::string message);
    bool validate_children(NodeId id);

    WidgetTree tree_;
    TreeError error_ = TreeError::None;
    std::string message_;
};

} // namespace weft::widget
