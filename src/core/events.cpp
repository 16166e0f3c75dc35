#include "frame_diff/core/events.hpp"
#include "frame_diff/core/utils.hpp"

namespace frame_diff::core {

namespace {

// Frame ids are paths and may hold bytes that are not UTF-8.
std::string dump_line(const json& event) {
    return event.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << dump_line(event) << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, const json& extra,
                           std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::pairing_start(const std::string& run_id, int pairing_index,
                                 const std::string& reference_id,
                                 const std::string& comparison_id, std::ostream& out) {
    json event = base_event("pairing_start", run_id);
    event["pairing_index"] = pairing_index;
    event["reference"] = reference_id;
    event["comparison"] = comparison_id;
    emit(event, out);
}

void EventEmitter::pairing_end(const std::string& run_id, const ComparisonResult& result,
                               std::ostream& out) {
    json event = base_event("pairing_end", run_id);
    event["pairing_index"] = result.pairing_index;
    event["comparison"] = result.comparison_id;
    event["status"] = "ok";
    event["state"] = pairing_state_to_string(result.state);
    event["threshold"] = result.threshold;
    event["promising_cutoff"] = result.promising_cutoff;
    event["n_candidates"] = result.all_candidates.size();
    event["n_promising"] = result.promising_candidates.size();
    emit(event, out);
}

void EventEmitter::pairing_failed(const std::string& run_id, const ComparisonResult& result,
                                  std::ostream& out) {
    json event = base_event("pairing_failed", run_id);
    event["pairing_index"] = result.pairing_index;
    event["comparison"] = result.comparison_id;
    event["status"] = "error";
    if (result.error) {
        event["kind"] = pairing_error_kind_to_string(result.error->kind);
        event["message"] = result.error->message;
    }
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
    out << dump_line(event) << "\n";
    out.flush();
}

} // namespace frame_diff::core
