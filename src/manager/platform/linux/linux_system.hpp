#pragma once

#include "platform/system.hpp"

#include <cstdint>
#include <optional>
#include <string>

class LinuxSystem : public System {
public:
    std::vector<std::string> list_dir(const std::string& path) const override;
    std::optional<FileStatus> lstat(const std::string& path) const override;

    bool process_alive(int pid) const override;
    std::optional<double> process_start_time(int pid) const override;

    std::string read_file(const std::string& path) const override;
    std::expected<void, std::string>
        write_file(const std::string& path, const std::string& content, mode_t mode) override;
    std::expected<void, std::error_code> make_dir(const std::string& path, mode_t mode) override;
    bool remove_file(const std::string& path) override;
    bool remove_all(const std::string& path) override;
    bool is_empty_dir(const std::string& path) const override;

    std::expected<void, std::error_code> send_signal(int pid, int sig) override;

    double now() const override;

    // Field 22 of a /proc/<pid>/stat line. The command field may itself
    // contain spaces and parentheses, so fields are counted from the last ')'.
    static std::optional<uint64_t> parse_start_ticks(const std::string& stat_line);
    // The "btime" line of /proc/stat.
    static std::optional<int64_t> parse_boot_time(const std::string& proc_stat);
};
