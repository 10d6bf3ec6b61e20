#pragma once

#include <expected>
#include <optional>
#include <string>
#include <system_error>
#include <sys/types.h>
#include <vector>

enum class FileType { Regular, Directory, Socket, Symlink, Other };

struct FileStatus {
    FileType type = FileType::Other;
    uid_t owner = 0;
    double mtime = 0.0; // epoch seconds
};

// Everything discovery needs from the operating system. Tests substitute an
// in-memory implementation.
class System {
public:
    virtual ~System() = default;

    // Entry names (not paths) directly under `path`; empty if unreadable.
    virtual std::vector<std::string> list_dir(const std::string& path) const = 0;
    // Does not follow symlinks.
    virtual std::optional<FileStatus> lstat(const std::string& path) const = 0;

    virtual bool process_alive(int pid) const = 0;
    virtual std::optional<double> process_start_time(int pid) const = 0;

    // Empty string if missing or unreadable.
    virtual std::string read_file(const std::string& path) const = 0;
    virtual std::expected<void, std::string>
        write_file(const std::string& path, const std::string& content, mode_t mode) = 0;
    // Fails with std::errc::file_exists if the directory is already there.
    virtual std::expected<void, std::error_code> make_dir(const std::string& path, mode_t mode) = 0;
    virtual bool remove_file(const std::string& path) = 0;
    virtual bool remove_all(const std::string& path) = 0;
    virtual bool is_empty_dir(const std::string& path) const = 0;

    virtual std::expected<void, std::error_code> send_signal(int pid, int sig) = 0;

    virtual double now() const = 0;
};
