#pragma once
#include "../credential.hpp"
#include "../orchestrator.hpp"
#include "../rate_limiter.hpp"
#include <httplib.h>
#include <functional>
#include <optional>
#include <string>

namespace todochat {

// Bearer token -> caller credential, nullopt when unknown or expired
using CredentialResolver = std::function<std::optional<Credential>(const std::string& token)>;

// POST /api/chat {message, conversation_history} -> {response}
void register_chat_routes(httplib::Server& server, const Orchestrator& orchestrator,
                          CredentialResolver resolve, RateLimiter& limiter);

} // namespace todochat
