#pragma once

#include "platform/key_tools.hpp"
#include "platform/system.hpp"

#include <map>
#include <string>
#include <vector>

// Maps the fingerprints a live agent holds back to key file names in the
// key directory.
class IdentityMatcher {
public:
    IdentityMatcher(const System& system, KeyTools& tools, std::string key_dir);

    // Only the first fingerprint that resolves is reported. If none resolve,
    // the raw fingerprints are returned instead.
    std::vector<std::string> resolve(const std::string& pid, const std::string& socket);

    // fingerprint -> file name, over files starting with a PEM private key header.
    // Built on first use and kept for the lifetime of the matcher.
    const std::map<std::string, std::string>& key_index();

    static bool is_private_key(const std::string& content);

private:
    const System& system_;
    KeyTools& tools_;
    std::string key_dir_;
    std::map<std::string, std::string> index_;
    bool indexed_ = false;
};
