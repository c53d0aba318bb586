#pragma once

#include <trellis/core/config.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace trellis::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

// Error kinds reported by the style and layout pipeline.
enum class DiagnosticCode {
    None,
    ParseError,           // malformed stylesheet syntax
    UnresolvedReference,  // duplicate id, unknown property or value
    ReflowFailure,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    DiagnosticCode code = DiagnosticCode::None;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);
const char* diagnostic_code_name(DiagnosticCode code);

// "[warning][unresolved-reference] css.cascade/intake (cid:3): message"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Bounded event log. Once `capacity` events are held, each new event
// evicts the oldest one. Observers see every accepted event regardless.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::size_t capacity = config::kDiagnosticCapacity);

    void emit(Severity severity, DiagnosticCode code, const std::string& module,
              const std::string& stage, const std::string& message);
    void info(const std::string& module, const std::string& stage, const std::string& message);
    void warn_unresolved(const std::string& module, const std::string& stage,
                         const std::string& message);

    void set_correlation_id(std::uint64_t id) { correlation_id_ = id; }
    std::uint64_t correlation_id() const { return correlation_id_; }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    void add_observer(DiagnosticObserver observer);

    // Oldest first.
    const std::deque<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::vector<DiagnosticEvent> events_by_code(DiagnosticCode code) const;

    std::size_t size() const { return events_.size(); }
    std::size_t capacity() const { return capacity_; }
    // Events evicted to respect the capacity.
    std::uint64_t evicted() const { return evicted_; }

private:
    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::size_t capacity_;
    std::uint64_t evicted_ = 0;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

// Context captured when a reflow aborts: the failing stage, the recent
// diagnostics, and key/value facts about the pass.
struct FailureTrace {
    std::uint64_t correlation_id = 0;
    std::string module;
    std::string stage;
    std::string error_message;
    std::vector<DiagnosticEvent> context_events;
    std::vector<std::pair<std::string, std::string>> snapshots;

    void add_snapshot(std::string key, std::string value);
    const std::string* snapshot(const std::string& key) const;
};

class FailureTraceCollector {
public:
    // Records a trace and returns it so the caller can attach snapshots.
    FailureTrace& capture(const DiagnosticEmitter& emitter, const std::string& module,
                          const std::string& stage, const std::string& error_message);

    const std::vector<FailureTrace>& traces() const { return traces_; }
    std::size_t size() const { return traces_.size(); }

private:
    std::vector<FailureTrace> traces_;
};

}  // namespace trellis::core
