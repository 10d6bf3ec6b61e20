#pragma once

#include "agent_record.hpp"
#include "config.hpp"
#include "identity_matcher.hpp"
#include "liveness.hpp"

// Adds a record for the agent the calling shell exports, unless it is one of
// the managed agents already in the registry.
class NonManagedAgentResolver {
public:
    NonManagedAgentResolver(const LivenessValidator& liveness, IdentityMatcher& matcher);

    void resolve(Registry& registry, const Ambient& ambient);

    // Some single managed record owns both the exported pid and socket.
    static bool matches_managed(const Registry& registry, const Ambient& ambient);

private:
    const LivenessValidator& liveness_;
    IdentityMatcher& matcher_;
};
