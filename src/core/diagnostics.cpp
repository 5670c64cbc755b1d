#include <weft/core/diagnostics.h>

#include <algorithm>
#include <iterator>
#include <sstream>

namespace weft::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "] " << event.module;
    if (!event.stage.empty()) oss << "/" << event.stage;
    if (event.pass != 0) oss << " #" << event.pass;
    if (!event.subject.empty()) oss << " @" << event.subject;
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(DiagnosticEvent event) {
    if (event.timestamp == std::chrono::steady_clock::time_point{}) {
        event.timestamp = std::chrono::steady_clock::now();
    }

    std::vector<DiagnosticObserver> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (event.severity < min_severity_) return;
        events_.push_back(event);
        observers = observers_;
    }
    for (const auto& observer : observers) observer(event);
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

template <typename Pred>
std::vector<DiagnosticEvent> DiagnosticEmitter::select(Pred pred) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DiagnosticEvent> out;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(out), pred);
    return out;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(const std::string& stage) const {
    return select([&stage](const DiagnosticEvent& e) {
        if (e.stage.compare(0, stage.size(), stage) != 0) return false;
        return e.stage.size() == stage.size() || e.stage[stage.size()] == '/';
    });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_of_pass(std::uint64_t pass) const {
    return select([pass](const DiagnosticEvent& e) { return e.pass == pass; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_about(const std::string& subject) const {
    return select([&subject](const DiagnosticEvent& e) { return e.subject == subject; });
}

std::size_t DiagnosticEmitter::count(Severity severity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(),
                      [severity](const DiagnosticEvent& e) { return e.severity == severity; }));
}

void DiagnosticEmitter::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

}  // namespace weft::core
