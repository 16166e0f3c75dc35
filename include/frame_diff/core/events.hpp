#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace frame_diff::core {

using json = nlohmann::json;

// Emits one JSON object per line for log files and front ends.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status,
                 const json& extra, std::ostream& out);

    void pairing_start(const std::string& run_id, int pairing_index,
                       const std::string& reference_id, const std::string& comparison_id,
                       std::ostream& out);
    void pairing_end(const std::string& run_id, const ComparisonResult& result,
                     std::ostream& out);
    void pairing_failed(const std::string& run_id, const ComparisonResult& result,
                        std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out);

} // namespace frame_diff::core
