#pragma once

#include "agent_record.hpp"
#include "config.hpp"
#include "identity_matcher.hpp"
#include "liveness.hpp"
#include "platform/system.hpp"

#include <functional>
#include <string>

// Agent directories under the temp root: ssh-agent-<specifier>/{agent.pid,
// agent.sock, agent.expiration}.
class ManagedAgentStore {
public:
    using LogFn = std::function<void(const std::string&)>;

    static constexpr const char* kPidFile = "agent.pid";
    static constexpr const char* kSocketFile = "agent.sock";
    static constexpr const char* kExpirationFile = "agent.expiration";

    ManagedAgentStore(System& system, const LivenessValidator& liveness,
                      IdentityMatcher& matcher, std::string tmp_dir, LogFn log = {});

    // Loads every owned agent directory, deleting the ones with nothing left
    // alive in them.
    Registry scan(const Ambient& ambient);

    std::string agent_dir(const std::string& spec) const;

private:
    std::optional<AgentRecord> load(const std::string& dir_name, const Ambient& ambient);

    System& system_;
    const LivenessValidator& liveness_;
    IdentityMatcher& matcher_;
    std::string tmp_dir_;
    LogFn log_;
};
