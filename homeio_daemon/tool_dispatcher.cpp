/**
 * ToolDispatcher Implementation
 */

#include "tool_dispatcher.hpp"
#include "logger.h"

#include <exception>

static const char *TAG = "Dispatch";

ToolDispatcher::ToolDispatcher(ErrorHandler &error_handler)
    : m_error_handler(error_handler) {
}

void ToolDispatcher::registerTool(const ToolSchema &schema, Handler handler) {
    for (auto &entry : m_tools) {
        if (entry.schema.name() == schema.name()) {
            entry.schema = schema;
            entry.handler = handler;
            return;
        }
    }
    m_tools.push_back(Entry{schema, handler});
    LOG_DEBUG(TAG, "Registered tool %s", schema.name().c_str());
}

bool ToolDispatcher::hasTool(const std::string &name) const {
    return find(name) != nullptr;
}

const ToolDispatcher::Entry *ToolDispatcher::find(const std::string &name) const {
    for (const auto &entry : m_tools) {
        if (entry.schema.name() == name) {
            return &entry;
        }
    }
    return nullptr;
}

nlohmann::json ToolDispatcher::listTools() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto &entry : m_tools) {
        tools.push_back(entry.schema.toJson());
    }
    return tools;
}

ToolResult ToolDispatcher::dispatch(const ToolCall &call) {
    const Entry *entry = find(call.name);
    if (!entry) {
        std::string msg = "Unknown tool: " + call.name;
        m_error_handler.report(ErrorLevel::WARNING, msg);
        return ToolResult::failure(RPC_ERR_METHOD_NOT_FOUND, msg);
    }

    nlohmann::json arguments = call.arguments.is_null() ? nlohmann::json::object() : call.arguments;

    std::string field;
    std::string reason;
    if (!entry->schema.validate(arguments, field, reason)) {
        std::string msg = "Invalid argument '" + field + "': " + reason;
        m_error_handler.report(ErrorLevel::WARNING, call.name + ": " + msg);
        return ToolResult::failure(RPC_ERR_INVALID_PARAMS, msg);
    }

    LOG_INFO(TAG, "%s %s", call.name.c_str(), arguments.dump().c_str());

    ToolResult result;
    try {
        result = entry->handler(arguments);
    } catch (const std::exception &e) {
        result = ToolResult::failure(RPC_ERR_INTERNAL, e.what());
    }

    if (result.hard_failure) {
        // Handlers report backend faults with the bare message
        if (result.error_code == RPC_ERR_INTERNAL || result.error_code == 0) {
            result.error_code = RPC_ERR_INTERNAL;
            result.error_message = "Tool execution failed: " + result.error_message;
        }
        m_error_handler.report(ErrorLevel::ERROR, call.name + ": " + result.error_message);
        return result;
    }

    if (result.is_error) {
        LOG_WARN(TAG, "%s: %s", call.name.c_str(), result.text.c_str());
    }

    result.text += m_marker;
    return result;
}
