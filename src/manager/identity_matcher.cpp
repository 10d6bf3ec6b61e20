#include "identity_matcher.hpp"

#include <filesystem>
#include <print>
#include <regex>

namespace fs = std::filesystem;

IdentityMatcher::IdentityMatcher(const System& system, KeyTools& tools, std::string key_dir)
    : system_(system), tools_(tools), key_dir_(std::move(key_dir)) {}

bool IdentityMatcher::is_private_key(const std::string& content) {
    static const std::regex header(R"(^-----BEGIN [A-Z0-9 ]*PRIVATE KEY-----)");
    auto eol = content.find('\n');
    return std::regex_search(content.substr(0, eol), header);
}

const std::map<std::string, std::string>& IdentityMatcher::key_index() {
    if (indexed_) return index_;
    indexed_ = true;

    for (auto& name : system_.list_dir(key_dir_)) {
        auto path = (fs::path(key_dir_) / name).string();
        auto st = system_.lstat(path);
        if (!st || st->type != FileType::Regular) continue;
        if (!is_private_key(system_.read_file(path))) continue;

        auto fp = tools_.fingerprint(path);
        if (!fp) {
            std::println(stderr, "identity: {}", fp.error());
            continue;
        }
        index_.emplace(*fp, name);
    }
    return index_;
}

std::vector<std::string> IdentityMatcher::resolve(const std::string& pid, const std::string& socket) {
    auto held = tools_.list_fingerprints(pid, socket);
    if (!held) {
        std::println(stderr, "identity: {}", held.error());
        return {};
    }
    if (held->empty()) return {};

    auto& index = key_index();
    for (auto& fp : *held) {
        auto it = index.find(fp);
        if (it != index.end()) return {it->second};
    }

    std::println(stderr, "identity: agent {} holds {} key(s) with no match in {}",
                 pid, held->size(), key_dir_);
    return *held;
}
