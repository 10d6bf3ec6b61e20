#pragma once

#include <optional>
#include <string>

// Specifiers have the shape ddd.dddd.ddd. Directory-backed ones are all
// digits; foreign ones end in a fixed non-numeric group so the two can never
// collide.
namespace specifier {

inline constexpr const char* kSentinel = "000.0000.000";
inline constexpr const char* kForeignSuffix = "env";
inline constexpr const char* kDirPrefix = "ssh-agent-";

// Reformats the first "ddddddd.ddd" run of a decimal timestamp.
std::optional<std::string> from_timestamp(const std::string& decimal);

// For a new managed agent, from the current time.
std::string allocate(double now);

// Parses the specifier back out of a "ssh-agent-ddd.dddd.ddd" name.
std::string from_directory(const std::string& dir_name);
bool is_managed_directory(const std::string& dir_name);
std::string directory_name(const std::string& spec);

// Earliest of the given times, sentinel when none.
std::string foreign(std::optional<double> pid_time, std::optional<double> socket_time);
bool is_foreign(const std::string& spec);

} // namespace specifier
