#include <trellis/core/diagnostics.h>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <utility>

namespace trellis::core {

namespace {

template <typename Pred>
std::vector<DiagnosticEvent> select(const std::deque<DiagnosticEvent>& events, Pred pred) {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events.begin(), events.end(), std::back_inserter(result), pred);
    return result;
}

}  // namespace

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

const char* diagnostic_code_name(DiagnosticCode code) {
    switch (code) {
        case DiagnosticCode::None:                return "none";
        case DiagnosticCode::ParseError:          return "parse-error";
        case DiagnosticCode::UnresolvedReference: return "unresolved-reference";
        case DiagnosticCode::ReflowFailure:       return "reflow-failure";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream out;
    out << '[' << severity_name(event.severity) << ']';
    if (event.code != DiagnosticCode::None) out << '[' << diagnostic_code_name(event.code) << ']';
    if (!event.module.empty()) out << ' ' << event.module;
    if (!event.stage.empty()) out << '/' << event.stage;
    if (event.correlation_id != 0) out << " (cid:" << event.correlation_id << ')';
    out << ": " << event.message;
    return out.str();
}

// ---------------------------------------------------------------------------
// DiagnosticEmitter
// ---------------------------------------------------------------------------

DiagnosticEmitter::DiagnosticEmitter(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void DiagnosticEmitter::emit(Severity severity, DiagnosticCode code, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (severity < min_severity_) return;

    DiagnosticEvent event{std::chrono::steady_clock::now(), severity, code,
                          module, stage, message, correlation_id_};
    for (const auto& observer : observers_) {
        observer(event);
    }

    if (events_.size() == capacity_) {
        events_.pop_front();
        ++evicted_;
    }
    events_.push_back(std::move(event));
}

void DiagnosticEmitter::info(const std::string& module, const std::string& stage,
                             const std::string& message) {
    emit(Severity::Info, DiagnosticCode::None, module, stage, message);
}

void DiagnosticEmitter::warn_unresolved(const std::string& module, const std::string& stage,
                                        const std::string& message) {
    emit(Severity::Warning, DiagnosticCode::UnresolvedReference, module, stage, message);
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    if (observer) observers_.push_back(std::move(observer));
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    return select(events_, [&](const DiagnosticEvent& e) { return e.module == module; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_code(DiagnosticCode code) const {
    return select(events_, [code](const DiagnosticEvent& e) { return e.code == code; });
}

// ---------------------------------------------------------------------------
// Failure traces
// ---------------------------------------------------------------------------

void FailureTrace::add_snapshot(std::string key, std::string value) {
    snapshots.emplace_back(std::move(key), std::move(value));
}

const std::string* FailureTrace::snapshot(const std::string& key) const {
    for (const auto& [name, value] : snapshots) {
        if (name == key) return &value;
    }
    return nullptr;
}

FailureTrace& FailureTraceCollector::capture(const DiagnosticEmitter& emitter,
                                             const std::string& module,
                                             const std::string& stage,
                                             const std::string& error_message) {
    FailureTrace trace;
    trace.correlation_id = emitter.correlation_id();
    trace.module = module;
    trace.stage = stage;
    trace.error_message = error_message;
    trace.context_events.assign(emitter.events().begin(), emitter.events().end());
    traces_.push_back(std::move(trace));
    return traces_.back();
}

}  // namespace trellis::core
