#pragma once

#include <tether/core/config.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace tether::core {

enum class Severity {
    Debug,
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    // Execution context the event concerns; 0 when it concerns none.
    std::int64_t context_id = 0;
};

// "[severity] module/stage (ctx:N): message"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Writes each event as one formatted line to std::cerr.
DiagnosticObserver stderr_observer();

// Fans accepted events out to observers and keeps the newest ones for
// inspection. Retention is bounded so a long-lived session does not grow
// without limit; the oldest events are evicted first.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::size_t max_events = config::kMaxRetainedDiagnostics);

    void emit(Severity severity, const std::string& module, const std::string& stage,
              const std::string& message, std::int64_t context_id = 0);

    void set_min_severity(Severity min);
    Severity min_severity() const;

    // 0 keeps nothing; observers still see every accepted event.
    void set_max_events(std::size_t max);
    std::size_t max_events() const { return max_events_; }
    // Events evicted since construction or the last clear().
    std::uint64_t evicted() const { return evicted_; }

    void add_observer(DiagnosticObserver observer);

    const std::deque<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;

    void clear();
    std::size_t size() const;

private:
    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::size_t max_events_;
    std::uint64_t evicted_ = 0;
    Severity min_severity_ = Severity::Info;

    void trim();
};

}  // namespace tether::core
