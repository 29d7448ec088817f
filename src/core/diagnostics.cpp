#include <tether/core/diagnostics.h>

#include <iostream>
#include <sstream>
#include <utility>

namespace tether::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Debug:   return "debug";
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.context_id != 0) {
        oss << " (ctx:" << event.context_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticObserver stderr_observer() {
    return [](const DiagnosticEvent& event) {
        std::cerr << format_diagnostic(event) << '\n';
    };
}

DiagnosticEmitter::DiagnosticEmitter(std::size_t max_events) : max_events_(max_events) {}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message,
                             std::int64_t context_id) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.context_id = context_id;

    for (const auto& observer : observers_) {
        observer(event);
    }

    if (max_events_ == 0) {
        ++evicted_;
        return;
    }
    events_.push_back(std::move(event));
    trim();
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    return min_severity_;
}

void DiagnosticEmitter::set_max_events(std::size_t max) {
    max_events_ = max;
    trim();
}

void DiagnosticEmitter::trim() {
    while (events_.size() > max_events_) {
        events_.pop_front();
        ++evicted_;
    }
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::deque<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

void DiagnosticEmitter::clear() {
    events_.clear();
    evicted_ = 0;
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

}  // namespace tether::core
