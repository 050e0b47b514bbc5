#pragma once
#include <string>

namespace todochat {

int cmd_init();
int cmd_serve(const std::string& host, int port);
int cmd_chat(const std::string& message, bool token_from_stdin, const std::string& history_file);

} // namespace todochat
