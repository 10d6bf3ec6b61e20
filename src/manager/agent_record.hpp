#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Backed by a directory this program created under the temp root.
struct ManagedOrigin {
    std::string directory;
    double expires_at = 0.0; // epoch seconds; 0 when the marker is unreadable
};

// Known only through SSH_AGENT_PID / SSH_AUTH_SOCK of the calling shell.
struct ForeignOrigin {};

using AgentOrigin = std::variant<ManagedOrigin, ForeignOrigin>;

struct PidSocketFlags {
    bool pid = false;
    bool socket = false;

    bool operator==(const PidSocketFlags&) const = default;
};

struct AgentRecord {
    std::string specifier;
    std::string pid;
    std::string socket;
    PidSocketFlags managed;
    PidSocketFlags exported;
    AgentOrigin origin = ForeignOrigin{};
    bool valid = false;
    std::vector<std::string> identities;

    const ManagedOrigin* managed_origin() const { return std::get_if<ManagedOrigin>(&origin); }
    bool is_managed() const { return managed_origin() != nullptr; }

    // Absent for foreign agents: no expiration is tracked for them.
    std::optional<double> expires_at() const {
        if (auto* m = managed_origin()) return m->expires_at;
        return std::nullopt;
    }

    bool is_exported() const { return exported.pid && exported.socket; }
};

// One discovery snapshot, ordered by specifier.
using Registry = std::map<std::string, AgentRecord>;
