#ifndef TOOL_SCHEMA_HPP
#define TOOL_SCHEMA_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * One argument of a tool.
 */
struct ArgSpec {
    enum class Type {
        INTEGER,
        NUMBER,
        STRING
    };

    std::string name;
    Type type = Type::INTEGER;
    std::string description;
    bool required = false;

    bool has_minimum = false;
    double minimum = 0.0;
    bool has_maximum = false;
    double maximum = 0.0;

    // Enumerated values; empty means unrestricted
    std::vector<int> int_values;
    std::vector<std::string> string_values;
};

/**
 * ToolSchema - Argument schema for a named tool
 *
 * Validates call arguments and renders the JSON Schema advertised
 * by tools/list.
 */
class ToolSchema {
public:
    ToolSchema() = default;
    ToolSchema(const std::string &name, const std::string &description);

    ToolSchema &integer(const std::string &name, const std::string &description,
                        bool required, int min, int max);
    ToolSchema &number(const std::string &name, const std::string &description,
                       bool required, double min);
    ToolSchema &number(const std::string &name, const std::string &description,
                       bool required, double min, double max);
    ToolSchema &oneOf(const std::string &name, const std::string &description,
                      bool required, const std::vector<int> &values);
    ToolSchema &oneOf(const std::string &name, const std::string &description,
                      bool required, const std::vector<std::string> &values);

    const std::string &name() const { return m_name; }
    const std::string &description() const { return m_description; }
    const std::vector<ArgSpec> &args() const { return m_args; }

    /**
     * Check arguments. On failure, field names the offending key and
     * reason says what is wrong with it.
     */
    bool validate(const nlohmann::json &arguments, std::string &field, std::string &reason) const;

    /**
     * {name, description, inputSchema}
     */
    nlohmann::json toJson() const;

private:
    bool validateArg(const ArgSpec &spec, const nlohmann::json &value, std::string &reason) const;

    std::string m_name;
    std::string m_description;
    std::vector<ArgSpec> m_args;
};

/**
 * Render a JSON number the way the caller wrote it: 3 -> "3", 1.5 -> "1.5",
 * and an integral float 3.0 -> "3".
 */
std::string numberText(const nlohmann::json &value);

/**
 * Read an integer argument; integral floats are accepted.
 */
int intArg(const nlohmann::json &arguments, const std::string &key);

#endif // TOOL_SCHEMA_HPP
