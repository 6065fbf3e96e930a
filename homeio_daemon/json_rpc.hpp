#ifndef JSON_RPC_HPP
#define JSON_RPC_HPP

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

#include "tool_dispatcher.hpp"

/**
 * JsonRpc - JSON-RPC 2.0 request handling for the tool API
 *
 * Methods: initialize, ping, tools/list, tools/call.
 * Requests without an id are notifications and get no reply.
 */
class JsonRpc {
public:
    JsonRpc(ToolDispatcher &dispatcher, const std::string &server_name);

    /**
     * Handle one framed message. Returns true and fills response when a
     * reply is due.
     */
    bool handleLine(const std::string &line, std::string &response);

    bool isInitialized() const { return m_initialized; }
    uint32_t getRequestCount() const { return m_requests; }

    static std::string createResultResponse(const nlohmann::json &id, const nlohmann::json &result);
    static std::string createErrorResponse(const nlohmann::json &id, int code, const std::string &message);

private:
    std::string handleRequest(const nlohmann::json &id, const std::string &method,
                              const nlohmann::json &params);
    nlohmann::json handleInitialize(const nlohmann::json &params);
    std::string handleToolsCall(const nlohmann::json &id, const nlohmann::json &params);

    ToolDispatcher &m_dispatcher;
    std::string m_server_name;
    bool m_initialized = false;
    uint32_t m_requests = 0;
};

#endif // JSON_RPC_HPP
