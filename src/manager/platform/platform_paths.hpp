#pragma once

#include <string>

namespace platform {

std::string config_dir();
std::string default_key_dir();
std::string default_tmp_dir();

} // namespace platform
