#pragma once

#include <expected>
#include <string>
#include <sys/types.h>

struct Config {
    std::string key_dir;
    std::string tmp_dir;
    int lifetime = 14400; // seconds an agent keeps its identities

    struct Tools {
        std::string agent = "ssh-agent";
        std::string add = "ssh-add";
        std::string keygen = "ssh-keygen";
    } tools;

    Config();

    static Config load(const std::string& path);
    static Config load_default();

    // SSH_AGENT_MANAGER_KEY_DIR and SSH_AGENT_MANAGER_TMP_DIR win over the file.
    void apply_env();

    // Both directories must exist and be readable, writable and searchable.
    std::expected<void, std::string> validate() const;
};

// What the calling shell hands us: the exported agent variables and who we are.
struct Ambient {
    std::string agent_pid;  // SSH_AGENT_PID
    std::string auth_sock;  // SSH_AUTH_SOCK
    uid_t euid = 0;

    static Ambient capture();
};
