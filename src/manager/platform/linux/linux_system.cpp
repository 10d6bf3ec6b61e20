#include "platform/linux/linux_system.hpp"

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <signal.h>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

std::vector<std::string> LinuxSystem::list_dir(const std::string& path) const {
    std::vector<std::string> names;
    std::error_code ec;
    for (auto& entry : fs::directory_iterator(path, ec)) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

std::optional<FileStatus> LinuxSystem::lstat(const std::string& path) const {
    struct stat st{};
    if (::lstat(path.c_str(), &st) < 0) return std::nullopt;

    FileStatus status;
    if (S_ISREG(st.st_mode)) status.type = FileType::Regular;
    else if (S_ISDIR(st.st_mode)) status.type = FileType::Directory;
    else if (S_ISSOCK(st.st_mode)) status.type = FileType::Socket;
    else if (S_ISLNK(st.st_mode)) status.type = FileType::Symlink;
    status.owner = st.st_uid;
    status.mtime = static_cast<double>(st.st_mtim.tv_sec) +
                   static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
    return status;
}

bool LinuxSystem::process_alive(int pid) const {
    if (pid <= 0) return false;
    return ::kill(pid, 0) == 0;
}

std::optional<double> LinuxSystem::process_start_time(int pid) const {
    if (pid <= 0) return std::nullopt;

    auto ticks = parse_start_ticks(read_file(std::format("/proc/{}/stat", pid)));
    if (!ticks) return std::nullopt;

    auto boot = parse_boot_time(read_file("/proc/stat"));
    if (!boot) return std::nullopt;

    long hz = ::sysconf(_SC_CLK_TCK);
    if (hz <= 0) return std::nullopt;

    return static_cast<double>(*boot) + static_cast<double>(*ticks) / static_cast<double>(hz);
}

std::string LinuxSystem::read_file(const std::string& path) const {
    std::ifstream f(path);
    if (!f.is_open()) return {};
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::expected<void, std::string>
LinuxSystem::write_file(const std::string& path, const std::string& content, mode_t mode) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        return std::unexpected(std::format("open({}) failed: {}", path, std::strerror(errno)));
    }

    size_t total_written = 0;
    while (total_written < content.size()) {
        ssize_t n = ::write(fd, content.data() + total_written, content.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            return std::unexpected(std::format("write({}) failed: {}", path, std::strerror(err)));
        }
        total_written += static_cast<size_t>(n);
    }

    if (::close(fd) < 0) {
        return std::unexpected(std::format("close({}) failed: {}", path, std::strerror(errno)));
    }
    return {};
}

std::expected<void, std::error_code> LinuxSystem::make_dir(const std::string& path, mode_t mode) {
    if (::mkdir(path.c_str(), mode) < 0) {
        return std::unexpected(std::error_code(errno, std::generic_category()));
    }
    // mkdir honours the umask; force the requested bits.
    if (::chmod(path.c_str(), mode) < 0) {
        return std::unexpected(std::error_code(errno, std::generic_category()));
    }
    return {};
}

bool LinuxSystem::remove_file(const std::string& path) {
    return ::unlink(path.c_str()) == 0;
}

bool LinuxSystem::remove_all(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool LinuxSystem::is_empty_dir(const std::string& path) const {
    std::error_code ec;
    bool empty = fs::is_empty(path, ec);
    return !ec && empty;
}

std::expected<void, std::error_code> LinuxSystem::send_signal(int pid, int sig) {
    if (::kill(pid, sig) < 0) {
        return std::unexpected(std::error_code(errno, std::generic_category()));
    }
    return {};
}

double LinuxSystem::now() const {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

std::optional<uint64_t> LinuxSystem::parse_start_ticks(const std::string& stat_line) {
    auto close = stat_line.rfind(')');
    if (close == std::string::npos) return std::nullopt;

    std::istringstream fields(stat_line.substr(close + 1));
    std::string field;
    // Field 3 (state) is the first after the command; starttime is field 22.
    for (int i = 3; i <= 22; ++i) {
        if (!(fields >> field)) return std::nullopt;
    }

    uint64_t ticks = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), ticks);
    if (ec != std::errc{} || ptr != field.data() + field.size()) return std::nullopt;
    return ticks;
}

std::optional<int64_t> LinuxSystem::parse_boot_time(const std::string& proc_stat) {
    std::istringstream in(proc_stat);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.starts_with("btime ")) continue;
        auto value = line.substr(6);
        int64_t btime = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), btime);
        if (ec != std::errc{}) return std::nullopt;
        return btime;
    }
    return std::nullopt;
}
