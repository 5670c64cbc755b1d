#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace weft::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

// One record from a layout pass. `subject` is the node path the event is
// about ("/0/2"), empty for pass-level events. `pass` is the number the
// engine gave the pass that produced it, 0 outside a pass.
struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string subject;
    std::string message;
    std::uint64_t pass = 0;
};

// "[warning] layout/distribute/axis #3 @/0/2: ..."
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Thread-safe sink shared by any number of layout passes. Observers run on
// the emitting thread, outside the lock.
class DiagnosticEmitter {
public:
    // Stamps the event if it has no timestamp, drops it below the minimum
    // severity, otherwise stores it and notifies observers.
    void emit(DiagnosticEvent event);

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    // `stage` matches itself and anything nested under it: "distribute"
    // selects "distribute/axis" as well.
    std::vector<DiagnosticEvent> events_by_stage(const std::string& stage) const;
    std::vector<DiagnosticEvent> events_of_pass(std::uint64_t pass) const;
    std::vector<DiagnosticEvent> events_about(const std::string& subject) const;

    std::size_t count(Severity severity) const;
    bool has_errors() const { return count(Severity::Error) != 0; }

    void clear();
    std::size_t size() const;

private:
    template <typename Pred>
    std::vector<DiagnosticEvent> select(Pred pred) const;

    mutable std::mutex mutex_;
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_ = Severity::Info;
};

}  // namespace weft::core
