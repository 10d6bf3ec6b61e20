#include "report.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>
#include <stdexcept>

namespace report {

namespace {

// system_clock counts nanoseconds in 64 bits, which ends in 2262.
constexpr double kMaxEpoch = 9e9;

std::string local_time(double epoch) {
    if (!std::isfinite(epoch) || std::fabs(epoch) > kMaxEpoch) return "-";
    auto tp = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(epoch)));
    auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    try {
        return std::format("{:%Y-%m-%d %H:%M:%S}",
                           std::chrono::zoned_time(std::chrono::current_zone(), secs));
    } catch (const std::runtime_error&) {
        return std::format("{:%Y-%m-%d %H:%M:%S} UTC", secs);
    }
}

std::string flag(bool managed, bool exported) {
    std::string s = managed ? "managed" : "foreign";
    if (exported) s += ", exported";
    return s;
}

} // namespace

std::string export_lines(const std::string& pid, const std::string& socket) {
    return std::format("SSH_AUTH_SOCK={}; export SSH_AUTH_SOCK;\n"
                       "SSH_AGENT_PID={}; export SSH_AGENT_PID;\n",
                       socket, pid);
}

std::string unset_lines() {
    return "unset SSH_AUTH_SOCK;\nunset SSH_AGENT_PID;\n";
}

std::string remaining(double expires_at, double now) {
    if (!(expires_at > now)) return "expired";
    auto total = static_cast<long>(std::min(expires_at - now, kMaxEpoch));
    long hours = total / 3600;
    long minutes = (total % 3600) / 60;
    if (hours > 0) return std::format("{}h {:02}m", hours, minutes);
    if (minutes > 0) return std::format("{}m", minutes);
    return std::format("{}s", total);
}

std::string describe(const AgentRecord& record, const LivenessValidator& liveness, double now) {
    std::string out = std::format("{} [{}]{}\n", record.specifier,
                                  record.valid ? "valid" : "invalid",
                                  record.is_exported() ? " *" : "");

    out += std::format("  pid:        {} ({})", record.pid.empty() ? "-" : record.pid,
                       flag(record.managed.pid, record.exported.pid));
    if (auto started = liveness.pid_time(record.pid)) {
        out += std::format(", started {}", local_time(*started));
    }
    out += "\n";

    out += std::format("  socket:     {} ({})\n", record.socket.empty() ? "-" : record.socket,
                       flag(record.managed.socket, record.exported.socket));

    if (auto expires = record.expires_at()) {
        out += std::format("  expires:    {} ({})\n", local_time(*expires), remaining(*expires, now));
    }

    if (record.identities.empty()) {
        out += "  identities: -\n";
    } else {
        for (size_t i = 0; i < record.identities.size(); ++i) {
            out += std::format("  {}{}\n", i == 0 ? "identities: " : "            ",
                               record.identities[i]);
        }
    }
    return out;
}

nlohmann::json to_json(const AgentRecord& record, const LivenessValidator& liveness) {
    nlohmann::json j = {
        {"specifier", record.specifier},
        {"pid", record.pid},
        {"socket", record.socket},
        {"managed", {{"pid", record.managed.pid}, {"socket", record.managed.socket}}},
        {"exported", {{"pid", record.exported.pid}, {"socket", record.exported.socket}}},
        {"valid", record.valid},
        {"identities", record.identities},
    };

    if (auto expires = record.expires_at()) j["expires_at"] = *expires;
    else j["expires_at"] = nullptr;

    if (auto started = liveness.pid_time(record.pid)) j["started_at"] = *started;
    else j["started_at"] = nullptr;

    return j;
}

} // namespace report
