#pragma once
#include <ctime>
#include <string>

namespace todochat {

// System turn for one run, anchored to `now` in local time
std::string format_system_prompt(std::time_t now);

} // namespace todochat
