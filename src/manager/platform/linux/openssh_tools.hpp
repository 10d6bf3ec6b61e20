#pragma once

#include "platform/key_tools.hpp"

#include <string>

class OpenSshTools : public KeyTools {
public:
    OpenSshTools(std::string agent_bin = "ssh-agent", std::string add_bin = "ssh-add",
                 std::string keygen_bin = "ssh-keygen");

    std::expected<int, std::string>
        spawn_agent(int lifetime_s, const std::string& socket_path) override;

    std::expected<void, std::string>
        add_identity(const std::string& pid, const std::string& socket_path,
                     const std::string& key_path) override;

    std::expected<std::string, std::string> fingerprint(const std::string& key_path) override;

    std::expected<std::vector<std::string>, std::string>
        list_fingerprints(const std::string& pid, const std::string& socket_path) override;

    // "256 SHA256:abc... comment (ED25519)" -> "SHA256:abc..."
    static std::string fingerprint_field(const std::string& line);
    // Extracts <n> from the "SSH_AGENT_PID=<n>;" line of `ssh-agent -s` output.
    static int parse_agent_pid(const std::string& output);

private:
    std::string agent_bin_;
    std::string add_bin_;
    std::string keygen_bin_;
};
