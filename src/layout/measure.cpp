#include <weft/layout/measure.h>

#include <algorithm>

namespace weft::layout {

namespace {

std::string collect_content(const widget::WidgetTree& tree, widget::NodeId id) {
    const auto& node = tree.node(id);
    std::string content;
    if (const auto* text = node.as<widget::Text>()) {
        content = text->content;
        for (widget::NodeId child : node.children) {
            if (const auto* span = tree.node(child).as<widget::Span>()) {
                content += span->content;
            }
        }
    } else if (const auto* span = node.as<widget::Span>()) {
        content = span->content;
    }
    return content;
}

} // namespace

int count_code_points(const std::string& text) {
    int count = 0;
    for (unsigned char c : text) {
        // Continuation bytes are 10xxxxxx.
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

MeasureFn monospace_measurer() {
    return [](const widget::WidgetTree& tree, widget::NodeId id, int available_width) {
        std::string content = collect_content(tree, id);
        if (content.empty()) {
            return MeasureResult::success({0, 0});
        }

        int width = 0;
        int height = 0;
        std::size_t start = 0;
        while (start <= content.size()) {
            std::size_t end = content.find('\n', start);
            if (end == std::string::npos) end = content.size();
            int len = count_code_points(content.substr(start, end - start));

            if (is_bounded(available_width) && available_width > 0 && len > available_width) {
                height += (len + available_width - 1) / available_width;
                width = std::max(width, available_width);
            } else {
                height += 1;
                width = std::max(width, len);
            }
            start = end + 1;
        }
        return MeasureResult::success({width, height});
    };
}

} // namespace weft::layout
