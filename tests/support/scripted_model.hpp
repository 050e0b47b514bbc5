#pragma once
#include "provider.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace todochat::testing {

// Model that replays scripted decisions. Steps run in order; once they run
// out the responder (if any) answers every further turn.
class ScriptedModel : public Model {
public:
    using Step = std::function<Decision(const std::vector<Message>&)>;

    ScriptedModel& then(Step step) {
        std::lock_guard<std::mutex> lock(mutex_);
        steps_.push_back(std::move(step));
        return *this;
    }

    ScriptedModel& then_answer(const std::string& text) {
        return then([text](const std::vector<Message>&) -> Decision { return FinalAnswer{text}; });
    }

    ScriptedModel& then_call(const std::string& name, const nlohmann::json& args, const std::string& id = "") {
        return then([name, args, id](const std::vector<Message>&) -> Decision {
            return ToolCall{id, name, args.dump()};
        });
    }

    ScriptedModel& then_fail(const std::string& message) {
        return then([message](const std::vector<Message>&) -> Decision {
            throw std::runtime_error(message);
        });
    }

    void set_responder(Step step) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(step);
    }

    Decision decide(const std::vector<Message>& transcript, const nlohmann::json& tools_spec) override {
        Step step;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_.push_back(transcript);
            last_tools_spec_ = tools_spec;
            if (!steps_.empty()) {
                step = std::move(steps_.front());
                steps_.pop_front();
            } else {
                step = responder_;
            }
        }
        if (!step) throw std::runtime_error("no scripted step left");
        return step(transcript);
    }

    size_t turns() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_.size();
    }

    std::vector<Message> transcript_at(size_t turn) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_.at(turn);
    }

    nlohmann::json last_tools_spec() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_tools_spec_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<Step> steps_;
    Step responder_;
    std::vector<std::vector<Message>> seen_;
    nlohmann::json last_tools_spec_;
};

// Content of the newest tool observation in a transcript, parsed
inline nlohmann::json last_observation(const std::vector<Message>& transcript) {
    for (auto it = transcript.rbegin(); it != transcript.rend(); ++it) {
        if (it->role == "tool") return nlohmann::json::parse(it->content);
    }
    return nullptr;
}

} // namespace todochat::testing
