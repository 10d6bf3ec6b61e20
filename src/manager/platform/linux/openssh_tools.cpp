#include "platform/linux/openssh_tools.hpp"
#include "platform/linux/subprocess.hpp"

#include <charconv>
#include <format>
#include <sstream>
#include <string_view>

namespace {

std::vector<std::pair<std::string, std::string>> agent_env(const std::string& pid,
                                                           const std::string& socket_path) {
    return {{"SSH_AGENT_PID", pid}, {"SSH_AUTH_SOCK", socket_path}};
}

} // namespace

OpenSshTools::OpenSshTools(std::string agent_bin, std::string add_bin, std::string keygen_bin)
    : agent_bin_(std::move(agent_bin)), add_bin_(std::move(add_bin)),
      keygen_bin_(std::move(keygen_bin)) {}

std::expected<int, std::string>
OpenSshTools::spawn_agent(int lifetime_s, const std::string& socket_path) {
    auto res = run_command({agent_bin_, "-s", "-t", std::to_string(lifetime_s), "-a", socket_path});
    if (!res) return std::unexpected(res.error());

    if (res->exit_code != 0) {
        return std::unexpected(std::format("{} exited with code {}", agent_bin_, res->exit_code));
    }

    int pid = parse_agent_pid(res->out);
    if (pid <= 0) {
        return std::unexpected(std::format("{} printed no agent pid", agent_bin_));
    }
    return pid;
}

std::expected<void, std::string>
OpenSshTools::add_identity(const std::string& pid, const std::string& socket_path,
                           const std::string& key_path) {
    auto res = run_command({add_bin_, key_path}, agent_env(pid, socket_path));
    if (!res) return std::unexpected(res.error());

    if (res->exit_code != 0) {
        return std::unexpected(std::format("{} exited with code {}", add_bin_, res->exit_code));
    }
    return {};
}

std::expected<std::string, std::string> OpenSshTools::fingerprint(const std::string& key_path) {
    auto res = run_command({keygen_bin_, "-l", "-f", key_path});
    if (!res) return std::unexpected(res.error());

    if (res->exit_code != 0) {
        return std::unexpected(std::format("{} exited with code {} for {}",
                                           keygen_bin_, res->exit_code, key_path));
    }

    auto fp = fingerprint_field(res->out);
    if (fp.empty()) {
        return std::unexpected(std::format("{} printed no fingerprint for {}", keygen_bin_, key_path));
    }
    return fp;
}

std::expected<std::vector<std::string>, std::string>
OpenSshTools::list_fingerprints(const std::string& pid, const std::string& socket_path) {
    auto res = run_command({add_bin_, "-l"}, agent_env(pid, socket_path));
    if (!res) return std::unexpected(res.error());

    // ssh-add -l exits 1 when the agent holds nothing, 2 when unreachable.
    if (res->exit_code == 1) return std::vector<std::string>{};
    if (res->exit_code != 0) {
        return std::unexpected(std::format("{} -l exited with code {}", add_bin_, res->exit_code));
    }

    std::vector<std::string> fingerprints;
    std::istringstream in(res->out);
    std::string line;
    while (std::getline(in, line)) {
        auto fp = fingerprint_field(line);
        if (!fp.empty()) fingerprints.push_back(std::move(fp));
    }
    return fingerprints;
}

std::string OpenSshTools::fingerprint_field(const std::string& line) {
    std::istringstream in(line);
    std::string bits, fp;
    if (!(in >> bits >> fp)) return {};
    return fp;
}

int OpenSshTools::parse_agent_pid(const std::string& output) {
    static constexpr std::string_view key = "SSH_AGENT_PID=";
    auto pos = output.find(key);
    if (pos == std::string::npos) return -1;

    const char* begin = output.data() + pos + key.size();
    const char* end = output.data() + output.size();
    int pid = -1;
    auto [ptr, ec] = std::from_chars(begin, end, pid);
    if (ec != std::errc{} || ptr == begin) return -1;
    return pid;
}
