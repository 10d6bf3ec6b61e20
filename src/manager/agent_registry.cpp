#include "agent_registry.hpp"

#include "specifier.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <print>
#include <signal.h>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

AgentRegistry::AgentRegistry(Config config, Ambient ambient, System& system, KeyTools& tools,
                             bool verbose)
    : config_(std::move(config)), ambient_(std::move(ambient)), verbose_(verbose),
      system_(system), tools_(tools),
      liveness_(system_, ambient_.euid),
      matcher_(system_, tools_, config_.key_dir),
      store_(system_, liveness_, matcher_, config_.tmp_dir,
             [this](const std::string& msg) { log(msg); }),
      resolver_(liveness_, matcher_) {}

Registry AgentRegistry::discover() {
    auto registry = store_.scan(ambient_);
    resolver_.resolve(registry, ambient_);
    return registry;
}

bool AgentRegistry::holds_exactly(const AgentRecord& record, const std::string& identity) {
    if (identity.empty()) return record.identities.empty();
    return record.identities.size() == 1 && record.identities.front() == identity;
}

std::expected<StartResult, AgentError> AgentRegistry::start(const std::string& identity) {
    auto registry = discover();
    for (auto& [spec, record] : registry) {
        if (!record.is_managed() || !record.valid) continue;
        if (!holds_exactly(record, identity)) continue;

        log(std::format("agent {} already running (pid {})", spec, record.pid));
        return StartResult{
            .specifier = spec,
            .pid = record.pid,
            .socket = record.socket,
            .already_running = true,
        };
    }

    std::string key_path;
    if (!identity.empty()) {
        key_path = (fs::path(config_.key_dir) / identity).string();
        if (!system_.lstat(key_path)) {
            return std::unexpected(AgentError{AgentError::Kind::NotFoundIdentity,
                                              "no key file " + key_path});
        }
    }

    auto dir = create_agent_dir();
    if (!dir) return std::unexpected(dir.error());

    auto spec = specifier::from_directory(fs::path(*dir).filename().string());
    auto socket = (fs::path(*dir) / ManagedAgentStore::kSocketFile).string();

    auto pid = tools_.spawn_agent(config_.lifetime, socket);
    if (!pid) {
        system_.remove_all(*dir);
        return std::unexpected(AgentError{AgentError::Kind::StartFailure, pid.error()});
    }

    auto pid_str = std::to_string(*pid);
    double expires_at = system_.now() + config_.lifetime;

    auto written = system_.write_file((fs::path(*dir) / ManagedAgentStore::kPidFile).string(),
                                      pid_str + "\n", 0600);
    if (written) {
        written = system_.write_file((fs::path(*dir) / ManagedAgentStore::kExpirationFile).string(),
                                     std::format("{:.6f}\n", expires_at), 0600);
    }
    if (!written) {
        // Without its pidfile the agent could never be found again.
        if (auto sent = system_.send_signal(*pid, SIGHUP); !sent) {
            std::println(stderr, "start: cannot signal pid {}: {}", *pid, sent.error().message());
        }
        system_.remove_all(*dir);
        return std::unexpected(AgentError{AgentError::Kind::StartFailure, written.error()});
    }

    log(std::format("started agent {} (pid {}, socket {})", spec, pid_str, socket));

    if (!identity.empty()) {
        auto added = tools_.add_identity(pid_str, socket, key_path);
        if (!added) {
            return std::unexpected(AgentError{
                AgentError::Kind::IdentityAddFailure,
                std::format("agent {} started but adding {} failed: {}", spec, identity, added.error()),
            });
        }
        log(std::format("added {} to agent {}", identity, spec));
    }

    return StartResult{
        .specifier = spec,
        .pid = pid_str,
        .socket = socket,
        .already_running = false,
    };
}

std::expected<std::string, AgentError> AgentRegistry::create_agent_dir() {
    std::string last_error;
    for (int attempt = 0; attempt < kMaxAllocationAttempts; ++attempt) {
        auto spec = specifier::allocate(system_.now());
        auto dir = store_.agent_dir(spec);

        auto made = system_.make_dir(dir, 0700);
        if (made) return dir;

        last_error = std::format("cannot create {}: {}", dir, made.error().message());
        if (made.error() != std::errc::file_exists) break;

        log(std::format("specifier {} taken, retrying", spec));
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return std::unexpected(AgentError{AgentError::Kind::StartFailure, last_error});
}

bool AgentRegistry::stop(const AgentRecord& record) {
    if (auto pid = LivenessValidator::parse_pid(record.pid)) {
        auto sent = system_.send_signal(*pid, SIGHUP);
        if (!sent && sent.error() != std::errc::no_such_process) {
            std::println(stderr, "stop: cannot signal pid {}: {}", *pid, sent.error().message());
        }
    }

    auto* origin = record.managed_origin();
    if (!origin) {
        log(std::format("stopped foreign agent {}", record.specifier));
        return true;
    }

    auto pidfile = (fs::path(origin->directory) / ManagedAgentStore::kPidFile).string();
    if (!system_.remove_file(pidfile) && system_.lstat(pidfile)) {
        std::println(stderr, "stop: cannot remove {}", pidfile);
        return false;
    }
    if (system_.is_empty_dir(origin->directory) && !system_.remove_all(origin->directory)) {
        std::println(stderr, "stop: cannot remove {}", origin->directory);
    }
    log(std::format("stopped agent {}", record.specifier));
    return true;
}

std::expected<AgentRecord, AgentError> AgentRegistry::select(const Registry& registry,
                                                             const Selector& selector) {
    switch (selector.mode) {
        case Selector::Mode::Specifier: {
            auto it = registry.find(selector.value);
            if (it == registry.end()) {
                return std::unexpected(AgentError{AgentError::Kind::NotFoundSpecifier,
                                                  "no agent with specifier " + selector.value});
            }
            return it->second;
        }
        case Selector::Mode::Identity: {
            std::vector<const AgentRecord*> matches;
            for (auto& [spec, record] : registry) {
                if (record.valid && std::ranges::contains(record.identities, selector.value)) {
                    matches.push_back(&record);
                }
            }
            if (matches.empty()) {
                return std::unexpected(AgentError{AgentError::Kind::NotFoundIdentity,
                                                  "no valid agent holds identity " + selector.value});
            }
            if (matches.size() > 1) {
                return std::unexpected(AgentError{
                    AgentError::Kind::ExclusivityViolated,
                    std::format("{} agents hold identity {}", matches.size(), selector.value),
                });
            }
            return *matches.front();
        }
        case Selector::Mode::Default:
            break;
    }

    if (registry.empty()) {
        return std::unexpected(AgentError{AgentError::Kind::NotFoundDefault, "no agents found"});
    }
    if (registry.size() > 1) {
        return std::unexpected(AgentError{
            AgentError::Kind::NotFoundDefault,
            std::format("{} agents found, select one by specifier or identity", registry.size()),
        });
    }
    return registry.begin()->second;
}

void AgentRegistry::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[ssh-agent-manager] {}", msg);
    }
}
