#ifndef TOOL_DISPATCHER_HPP
#define TOOL_DISPATCHER_HPP

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "tool_result.hpp"
#include "tool_schema.hpp"
#include "error_handler.hpp"

/**
 * ToolDispatcher - Single entry point for tool calls
 *
 * Resolves a call by name, validates its arguments against the tool's
 * schema before any handler runs, and maps failures onto the protocol
 * error codes:
 *   unknown name          -> RPC_ERR_METHOD_NOT_FOUND
 *   schema violation      -> RPC_ERR_INVALID_PARAMS
 *   handler/backend fault -> RPC_ERR_INTERNAL
 *
 * Holds no per-call state.
 */
class ToolDispatcher {
public:
    using Handler = std::function<ToolResult(const nlohmann::json &arguments)>;

    explicit ToolDispatcher(ErrorHandler &error_handler);

    /**
     * Register a tool. A later registration under the same name replaces it.
     */
    void registerTool(const ToolSchema &schema, Handler handler);

    ToolResult dispatch(const ToolCall &call);

    bool hasTool(const std::string &name) const;

    /**
     * Tool descriptors for tools/list, in registration order.
     */
    nlohmann::json listTools() const;

    /**
     * Text appended to every content result, e.g. " [simulated]".
     */
    void setResultMarker(const std::string &marker) { m_marker = marker; }

private:
    struct Entry {
        ToolSchema schema;
        Handler handler;
    };

    const Entry *find(const std::string &name) const;

    ErrorHandler &m_error_handler;
    std::vector<Entry> m_tools;
    std::string m_marker;
};

#endif // TOOL_DISPATCHER_HPP
