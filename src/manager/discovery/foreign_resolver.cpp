#include "discovery/foreign_resolver.hpp"

#include "specifier.hpp"

#include <algorithm>

NonManagedAgentResolver::NonManagedAgentResolver(const LivenessValidator& liveness,
                                                 IdentityMatcher& matcher)
    : liveness_(liveness), matcher_(matcher) {}

bool NonManagedAgentResolver::matches_managed(const Registry& registry, const Ambient& ambient) {
    return std::ranges::any_of(registry, [&](const auto& entry) {
        const AgentRecord& r = entry.second;
        return r.managed.pid && r.pid == ambient.agent_pid &&
               r.managed.socket && r.socket == ambient.auth_sock;
    });
}

void NonManagedAgentResolver::resolve(Registry& registry, const Ambient& ambient) {
    if (ambient.agent_pid.empty() && ambient.auth_sock.empty()) return;
    if (matches_managed(registry, ambient)) return;

    AgentRecord record;
    record.pid = ambient.agent_pid;
    record.socket = ambient.auth_sock;
    record.exported = {.pid = true, .socket = true};
    record.origin = ForeignOrigin{};

    bool pid_ok = liveness_.pid_valid(record.pid);
    bool sock_ok = liveness_.socket_valid(record.socket);
    record.specifier = specifier::foreign(pid_ok ? liveness_.pid_time(record.pid) : std::nullopt,
                                          sock_ok ? liveness_.socket_time(record.socket) : std::nullopt);

    record.valid = liveness_.valid(record.pid, record.socket, record.expires_at());
    if (record.valid) {
        record.identities = matcher_.resolve(record.pid, record.socket);
    }

    auto spec = record.specifier;
    registry.insert_or_assign(spec, std::move(record));
}
