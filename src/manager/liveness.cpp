#include "liveness.hpp"

#include <charconv>

LivenessValidator::LivenessValidator(const System& system, uid_t euid)
    : system_(system), euid_(euid) {}

std::optional<int> LivenessValidator::parse_pid(const std::string& pid) {
    if (pid.empty()) return std::nullopt;
    int value = 0;
    auto [ptr, ec] = std::from_chars(pid.data(), pid.data() + pid.size(), value);
    if (ec != std::errc{} || ptr != pid.data() + pid.size()) return std::nullopt;
    if (value <= 0) return std::nullopt;
    return value;
}

bool LivenessValidator::pid_valid(const std::string& pid) const {
    auto value = parse_pid(pid);
    return value && system_.process_alive(*value);
}

bool LivenessValidator::socket_valid(const std::string& path) const {
    if (path.empty()) return false;
    auto st = system_.lstat(path);
    return st && st->type == FileType::Socket && st->owner == euid_;
}

bool LivenessValidator::valid(const std::string& pid, const std::string& socket,
                              std::optional<double> expires_at) const {
    if (!pid_valid(pid) || !socket_valid(socket)) return false;
    if (expires_at && system_.now() >= *expires_at) return false;
    return true;
}

std::optional<double> LivenessValidator::pid_time(const std::string& pid) const {
    auto value = parse_pid(pid);
    if (!value) return std::nullopt;
    return system_.process_start_time(*value);
}

std::optional<double> LivenessValidator::socket_time(const std::string& path) const {
    if (path.empty()) return std::nullopt;
    auto st = system_.lstat(path);
    if (!st) return std::nullopt;
    return st->mtime;
}
