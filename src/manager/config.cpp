#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config::Config()
    : key_dir(platform::default_key_dir()), tmp_dir(platform::default_tmp_dir()) {}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("key_dir")) cfg.key_dir = j["key_dir"].get<std::string>();
        if (j.contains("tmp_dir")) cfg.tmp_dir = j["tmp_dir"].get<std::string>();
        if (j.contains("lifetime")) cfg.lifetime = j["lifetime"].get<int>();

        if (j.contains("tools")) {
            auto& t = j["tools"];
            if (t.contains("agent")) cfg.tools.agent = t["agent"].get<std::string>();
            if (t.contains("add")) cfg.tools.add = t["add"].get<std::string>();
            if (t.contains("keygen")) cfg.tools.keygen = t["keygen"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    if (cfg.lifetime <= 0) {
        std::println(stderr, "config: lifetime must be positive, using default");
        cfg.lifetime = Config{}.lifetime;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_env() {
    if (const char* keys = std::getenv("SSH_AGENT_MANAGER_KEY_DIR"); keys && *keys) {
        key_dir = keys;
    }
    if (const char* tmp = std::getenv("SSH_AGENT_MANAGER_TMP_DIR"); tmp && *tmp) {
        tmp_dir = tmp;
    }
}

std::expected<void, std::string> Config::validate() const {
    auto check = [](const char* what, const std::string& dir) -> std::expected<void, std::string> {
        std::error_code ec;
        if (dir.empty() || !fs::is_directory(dir, ec)) {
            return std::unexpected(std::string(what) + " '" + dir + "' does not exist");
        }
        if (::access(dir.c_str(), R_OK | W_OK | X_OK) != 0) {
            return std::unexpected(std::string(what) + " '" + dir + "' is not accessible");
        }
        return {};
    };

    if (auto res = check("key directory", key_dir); !res) return res;
    return check("temp directory", tmp_dir);
}

Ambient Ambient::capture() {
    Ambient a;
    if (const char* pid = std::getenv("SSH_AGENT_PID")) a.agent_pid = pid;
    if (const char* sock = std::getenv("SSH_AUTH_SOCK")) a.auth_sock = sock;
    a.euid = ::geteuid();
    return a;
}
