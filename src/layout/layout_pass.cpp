#include <weft/layout/layout_pass.h>

#include <utility>

namespace weft::layout {

void LayoutPass::log(core::Severity severity, const std::string& stage, const std::string& message,
                     widget::NodeId subject) const {
    if (!diagnostics) return;
    core::DiagnosticEvent event;
    event.severity = severity;
    event.module = core::config::kLayoutModule;
    event.stage = stage;
    event.message = message;
    event.pass = number;
    if (subject != widget::kInvalidNode) {
        event.subject = widget::format_path(tree.path_of(subject));
    }
    diagnostics->emit(std::move(event));
}

std::string LayoutPass::describe(widget::NodeId id) const {
    return widget::kind_name(tree.node(id).kind) + " at " + widget::format_path(tree.path_of(id));
}

} // namespace weft::layout
