#pragma once

#include "agent_record.hpp"
#include "liveness.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace report {

// Shell lines for `eval`.
std::string export_lines(const std::string& pid, const std::string& socket);
std::string unset_lines();

// Multi-line human description of one record.
std::string describe(const AgentRecord& record, const LivenessValidator& liveness, double now);

nlohmann::json to_json(const AgentRecord& record, const LivenessValidator& liveness);

// "1h 05m", "12m", "expired"
std::string remaining(double expires_at, double now);

} // namespace report
