#include "temporal_update/core/events.hpp"
#include "temporal_update/core/utils.hpp"

namespace temporal_update::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success, DriverState state,
                           const json& extra, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["state"] = driver_state_to_string(state);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::sweep_end(const std::string& run_id, int iteration,
                             double relative_change, std::ostream& out) {
    json event = base_event("sweep_end", run_id);
    event["iteration"] = iteration;
    event["relative_change"] = relative_change;
    emit(event, out);
}

void EventEmitter::components_progress(const std::string& run_id, int visited, int total,
                                       std::ostream& out) {
    json event = base_event("components_progress", run_id);
    event["current"] = visited;
    event["total"] = total;
    event["substep"] = std::to_string(visited) + " out of total " + std::to_string(total) +
                       " temporal components updated";
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out) {
    json event = {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
    for (auto& [key, value] : data.items()) {
        event[key] = value;
    }
    out << event.dump() << "\n";
    out.flush();
}

} // namespace temporal_update::core
