#pragma once

#include <expected>
#include <string>
#include <vector>

// External OpenSSH executables, one method per invocation.
class KeyTools {
public:
    virtual ~KeyTools() = default;

    // Returns the pid of the spawned agent, which listens on `socket_path`.
    virtual std::expected<int, std::string>
        spawn_agent(int lifetime_s, const std::string& socket_path) = 0;

    virtual std::expected<void, std::string>
        add_identity(const std::string& pid, const std::string& socket_path,
                     const std::string& key_path) = 0;

    virtual std::expected<std::string, std::string> fingerprint(const std::string& key_path) = 0;

    // Empty vector when the agent holds no identities.
    virtual std::expected<std::vector<std::string>, std::string>
        list_fingerprints(const std::string& pid, const std::string& socket_path) = 0;
};
