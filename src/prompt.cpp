#include "prompt.hpp"
#include "utils.hpp"

namespace todochat {

std::string format_system_prompt(std::time_t now) {
    const std::time_t day = 24 * 60 * 60;
    std::string today = format_time(now, "%Y-%m-%d", false);
    std::string tomorrow = format_time(now + day, "%Y-%m-%d", false);
    std::string next_week = format_time(now + 7 * day, "%Y-%m-%d", false);
    std::string year = format_time(now, "%Y", false);

    std::string prompt;
    prompt += "You are a helpful assistant that helps users manage their todo list.\n";
    prompt += "You can create, read, update, and delete todos. Always be helpful and concise.\n\n";
    prompt += "Current date and time: " + format_time(now, "%A, %B %d, %Y at %I:%M %p", false) + "\n";
    prompt += "Today's date: " + today + "\n";
    prompt += "Tomorrow's date: " + tomorrow + "\n\n";
    prompt += "IMPORTANT: When users mention dates or times, convert them to ISO 8601 format "
              "(YYYY-MM-DDTHH:MM:SS) before passing them to tools.\n";
    prompt += "- \"tomorrow\" means " + tomorrow + "T10:00:00\n";
    prompt += "- \"next week\" means " + next_week + "T10:00:00\n";
    prompt += "- Always use the current year (" + year + ")\n";
    prompt += "- If no time is specified, use 10:00:00\n";
    prompt += "- Call at most one tool at a time and wait for its result.\n";
    prompt += "- If a tool reports that a todo was not found, tell the user instead of retrying.";
    return prompt;
}

} // namespace todochat
