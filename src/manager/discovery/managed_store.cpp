#include "discovery/managed_store.hpp"

#include "specifier.hpp"

#include <charconv>
#include <cmath>
#include <filesystem>
#include <print>

namespace fs = std::filesystem;

namespace {

// Anything past this is not a time a running agent could have been given.
constexpr double kMaxExpiration = 1e10;

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

double parse_expiration(const std::string& text) {
    auto value = trim(text);
    double expires = 0.0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), expires);
    if (ec != std::errc{} || ptr != value.data() + value.size()) return 0.0;
    if (!std::isfinite(expires) || expires < 0.0 || expires > kMaxExpiration) return 0.0;
    return expires;
}

} // namespace

ManagedAgentStore::ManagedAgentStore(System& system, const LivenessValidator& liveness,
                                     IdentityMatcher& matcher, std::string tmp_dir, LogFn log)
    : system_(system), liveness_(liveness), matcher_(matcher),
      tmp_dir_(std::move(tmp_dir)), log_(std::move(log)) {}

std::string ManagedAgentStore::agent_dir(const std::string& spec) const {
    return (fs::path(tmp_dir_) / specifier::directory_name(spec)).string();
}

Registry ManagedAgentStore::scan(const Ambient& ambient) {
    Registry registry;
    for (auto& name : system_.list_dir(tmp_dir_)) {
        if (!specifier::is_managed_directory(name)) continue;

        auto record = load(name, ambient);
        if (!record) continue;
        auto spec = record->specifier;
        registry.emplace(spec, std::move(*record));
    }
    return registry;
}

std::optional<AgentRecord> ManagedAgentStore::load(const std::string& dir_name,
                                                   const Ambient& ambient) {
    auto dir = (fs::path(tmp_dir_) / dir_name).string();

    // The temp root may be shared; only trust directories we own.
    auto st = system_.lstat(dir);
    if (!st || st->type != FileType::Directory || st->owner != ambient.euid) return std::nullopt;

    auto pid_path = (fs::path(dir) / kPidFile).string();
    auto sock_path = (fs::path(dir) / kSocketFile).string();

    AgentRecord record;
    record.specifier = specifier::from_directory(dir_name);
    record.pid = trim(system_.read_file(pid_path));
    record.managed.pid = system_.lstat(pid_path).has_value();
    if (system_.lstat(sock_path)) {
        record.socket = sock_path;
        record.managed.socket = true;
    }

    ManagedOrigin origin{
        .directory = dir,
        .expires_at = parse_expiration(system_.read_file((fs::path(dir) / kExpirationFile).string())),
    };

    bool pid_ok = liveness_.pid_valid(record.pid);
    bool sock_ok = liveness_.socket_valid(record.socket);

    if (!pid_ok && record.socket.empty() && !sock_ok) {
        if (log_) log_("reaping " + dir);
        if (!system_.remove_all(dir)) {
            std::println(stderr, "store: failed to remove {}", dir);
        }
        return std::nullopt;
    }

    record.valid = pid_ok && sock_ok && system_.now() < origin.expires_at;
    record.origin = std::move(origin);
    record.exported.pid = !record.pid.empty() && record.pid == ambient.agent_pid;
    record.exported.socket = !record.socket.empty() && record.socket == ambient.auth_sock;

    if (record.valid) {
        record.identities = matcher_.resolve(record.pid, record.socket);
    }
    return record;
}
