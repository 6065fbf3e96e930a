/**
 * JsonRpc Implementation
 */

#include "json_rpc.hpp"
#include "logger.h"

using json = nlohmann::json;

static const char *TAG = "RPC";

JsonRpc::JsonRpc(ToolDispatcher &dispatcher, const std::string &server_name)
    : m_dispatcher(dispatcher), m_server_name(server_name) {
}

std::string JsonRpc::createResultResponse(const json &id, const json &result) {
    json msg = {{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"result", result}};
    return msg.dump();
}

std::string JsonRpc::createErrorResponse(const json &id, int code, const std::string &message) {
    json msg = {
        {"jsonrpc", JSONRPC_VERSION},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
    return msg.dump();
}

bool JsonRpc::handleLine(const std::string &line, std::string &response) {
    json msg;
    try {
        msg = json::parse(line);
    } catch (const json::parse_error &e) {
        LOG_WARN(TAG, "Parse error: %s", e.what());
        response = createErrorResponse(nullptr, RPC_ERR_PARSE, "Parse error");
        return true;
    }

    if (!msg.is_object()) {
        response = createErrorResponse(nullptr, RPC_ERR_INVALID_REQUEST, "Invalid Request");
        return true;
    }

    bool has_id = msg.contains("id");
    json id = has_id ? msg["id"] : json();
    if (has_id && !(id.is_string() || id.is_number() || id.is_null())) {
        response = createErrorResponse(nullptr, RPC_ERR_INVALID_REQUEST, "Invalid Request");
        return true;
    }

    auto method_it = msg.find("method");
    if (method_it == msg.end() || !method_it->is_string()) {
        // A reply without a method is not addressed to us
        if (!has_id) {
            return false;
        }
        response = createErrorResponse(id, RPC_ERR_INVALID_REQUEST, "Invalid Request");
        return true;
    }

    const std::string method = method_it->get<std::string>();
    json params = msg.value("params", json::object());

    if (!has_id) {
        LOG_DEBUG(TAG, "Notification %s", method.c_str());
        if (method == "notifications/initialized") {
            m_initialized = true;
        }
        return false;
    }

    m_requests++;
    response = handleRequest(id, method, params);
    return true;
}

std::string JsonRpc::handleRequest(const json &id, const std::string &method, const json &params) {
    LOG_DEBUG(TAG, "Request %s id=%s", method.c_str(), id.dump().c_str());

    if (method == "initialize") {
        return createResultResponse(id, handleInitialize(params));
    }
    if (method == "ping") {
        return createResultResponse(id, json::object());
    }
    if (method == "tools/list") {
        return createResultResponse(id, {{"tools", m_dispatcher.listTools()}});
    }
    if (method == "tools/call") {
        return handleToolsCall(id, params);
    }

    return createErrorResponse(id, RPC_ERR_METHOD_NOT_FOUND, "Method not found: " + method);
}

json JsonRpc::handleInitialize(const json &params) {
    if (params.is_object() && params.contains("clientInfo")) {
        LOG_INFO(TAG, "Client: %s", params["clientInfo"].dump().c_str());
    }

    m_initialized = true;
    return {
        {"protocolVersion", TOOL_PROTOCOL_VERSION},
        {"capabilities", {{"tools", json::object()}}},
        {"serverInfo", {{"name", m_server_name}, {"version", SERVER_VERSION}}}
    };
}

std::string JsonRpc::handleToolsCall(const json &id, const json &params) {
    if (!params.is_object()) {
        return createErrorResponse(id, RPC_ERR_INVALID_PARAMS, "params must be an object");
    }

    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return createErrorResponse(id, RPC_ERR_INVALID_PARAMS, "Missing tool name");
    }

    ToolCall call;
    call.name = name_it->get<std::string>();
    call.arguments = params.value("arguments", json::object());

    ToolResult result = m_dispatcher.dispatch(call);
    if (result.hard_failure) {
        return createErrorResponse(id, result.error_code, result.error_message);
    }
    return createResultResponse(id, result.toContent());
}
