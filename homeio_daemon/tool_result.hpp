#ifndef TOOL_RESULT_HPP
#define TOOL_RESULT_HPP

#include <string>
#include <nlohmann/json.hpp>

extern "C" {
#include "tool_protocol.h"
}

/**
 * Inbound tool call: name plus argument object.
 */
struct ToolCall {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

/**
 * Outcome of a tool call.
 *
 * Success and soft failure share the content envelope; a soft failure
 * sets is_error and explains itself in text. A hard failure carries a
 * protocol error code instead of content.
 */
struct ToolResult {
    bool hard_failure = false;
    bool is_error = false;
    std::string text;
    int error_code = 0;
    std::string error_message;

    static ToolResult success(const std::string &text) {
        ToolResult r;
        r.text = text;
        return r;
    }

    static ToolResult softError(const std::string &text) {
        ToolResult r;
        r.is_error = true;
        r.text = text;
        return r;
    }

    static ToolResult failure(int code, const std::string &message) {
        ToolResult r;
        r.hard_failure = true;
        r.error_code = code;
        r.error_message = message;
        return r;
    }

    bool ok() const { return !hard_failure && !is_error; }

    /**
     * Success envelope: {content:[{type:"text",text}], isError?}
     */
    nlohmann::json toContent() const {
        nlohmann::json item = {{"type", "text"}, {"text", text}};
        nlohmann::json out = {{"content", nlohmann::json::array({item})}};
        if (is_error) {
            out["isError"] = true;
        }
        return out;
    }
};

#endif // TOOL_RESULT_HPP
