#pragma once

#include "platform/system.hpp"

#include <optional>
#include <string>
#include <sys/types.h>

// Point-in-time checks of a pid and a socket path. The two are independent:
// a live pid says nothing about the socket and vice versa.
class LivenessValidator {
public:
    LivenessValidator(const System& system, uid_t euid);

    // Some process with this id is alive. A recycled pid passes too.
    bool pid_valid(const std::string& pid) const;
    // A socket (not a symlink to one) owned by our effective uid.
    bool socket_valid(const std::string& path) const;

    // Pid valid, socket valid, and for managed records not yet expired.
    bool valid(const std::string& pid, const std::string& socket,
               std::optional<double> expires_at) const;

    std::optional<double> pid_time(const std::string& pid) const;
    std::optional<double> socket_time(const std::string& path) const;

    static std::optional<int> parse_pid(const std::string& pid);

private:
    const System& system_;
    uid_t euid_;
};
