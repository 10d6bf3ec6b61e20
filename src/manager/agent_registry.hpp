#pragma once

#include "agent_error.hpp"
#include "agent_record.hpp"
#include "config.hpp"
#include "discovery/foreign_resolver.hpp"
#include "discovery/managed_store.hpp"
#include "identity_matcher.hpp"
#include "liveness.hpp"
#include "platform/key_tools.hpp"
#include "platform/system.hpp"

#include <expected>
#include <string>

struct Selector {
    enum class Mode { Default, Specifier, Identity };

    Mode mode = Mode::Default;
    std::string value;

    static Selector by_specifier(std::string spec) { return {Mode::Specifier, std::move(spec)}; }
    static Selector by_identity(std::string name) { return {Mode::Identity, std::move(name)}; }
};

struct StartResult {
    std::string specifier;
    std::string pid;
    std::string socket;
    bool already_running = false;
};

class AgentRegistry {
public:
    AgentRegistry(Config config, Ambient ambient, System& system, KeyTools& tools,
                  bool verbose = false);

    AgentRegistry(const AgentRegistry&) = delete;
    AgentRegistry& operator=(const AgentRegistry&) = delete;

    // A fresh snapshot on every call.
    Registry discover();

    // Reuses a valid managed agent already holding exactly the requested
    // identity (or none, when none is requested).
    std::expected<StartResult, AgentError> start(const std::string& identity);

    // Hangs up the agent and removes its pidfile; the agent removes its own socket.
    // False if the pidfile is still there afterwards.
    bool stop(const AgentRecord& record);

    static std::expected<AgentRecord, AgentError> select(const Registry& registry,
                                                         const Selector& selector);

    const LivenessValidator& liveness() const { return liveness_; }
    const Config& config() const { return config_; }
    const Ambient& ambient() const { return ambient_; }

private:
    static bool holds_exactly(const AgentRecord& record, const std::string& identity);

    std::expected<std::string, AgentError> create_agent_dir();

    void log(const std::string& msg);

    static constexpr int kMaxAllocationAttempts = 5;

    Config config_;
    Ambient ambient_;
    bool verbose_;

    System& system_;
    KeyTools& tools_;

    LivenessValidator liveness_;
    IdentityMatcher matcher_;
    ManagedAgentStore store_;
    NonManagedAgentResolver resolver_;
};
