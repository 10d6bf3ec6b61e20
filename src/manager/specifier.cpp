#include "specifier.hpp"

#include <algorithm>
#include <format>
#include <regex>

namespace specifier {

namespace {

const std::regex& timestamp_pattern() {
    static const std::regex re(R"((\d{7})\.(\d{3}))");
    return re;
}

const std::regex& directory_pattern() {
    static const std::regex re(R"(^ssh-agent-(\d{3}\.\d{4}\.\d{3})$)");
    return re;
}

std::string regroup(const std::string& digits) {
    return digits.substr(0, 3) + "." + digits.substr(3, 4) + "." + digits.substr(7, 3);
}

} // namespace

std::optional<std::string> from_timestamp(const std::string& decimal) {
    std::smatch m;
    if (!std::regex_search(decimal, m, timestamp_pattern())) return std::nullopt;
    return regroup(m[1].str() + m[2].str());
}

std::string allocate(double now) {
    return from_timestamp(std::format("{:.6f}", now)).value_or(kSentinel);
}

std::string from_directory(const std::string& dir_name) {
    std::smatch m;
    if (!std::regex_match(dir_name, m, directory_pattern())) return kSentinel;
    return m[1].str();
}

bool is_managed_directory(const std::string& dir_name) {
    return std::regex_match(dir_name, directory_pattern());
}

std::string directory_name(const std::string& spec) {
    return kDirPrefix + spec;
}

std::string foreign(std::optional<double> pid_time, std::optional<double> socket_time) {
    std::string spec = kSentinel;

    std::optional<double> earliest;
    if (pid_time && socket_time) earliest = std::min(*pid_time, *socket_time);
    else if (pid_time) earliest = pid_time;
    else if (socket_time) earliest = socket_time;

    if (earliest) {
        spec = from_timestamp(std::format("{:.6f}", *earliest)).value_or(kSentinel);
    }

    return spec.substr(0, 9) + kForeignSuffix;
}

bool is_foreign(const std::string& spec) {
    return spec.size() == 12 && spec.ends_with(kForeignSuffix);
}

} // namespace specifier
