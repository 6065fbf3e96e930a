/**
 * ToolSchema Implementation
 */

#include "tool_schema.hpp"

#include <cmath>
#include <sstream>

using json = nlohmann::json;

static std::string formatDouble(double v) {
    if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 1e15) {
        return std::to_string(static_cast<long long>(v));
    }
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

std::string numberText(const json &value) {
    if (value.is_number_integer()) {
        return value.dump();
    }
    if (value.is_number_float()) {
        return formatDouble(value.get<double>());
    }
    return value.dump();
}

int intArg(const json &arguments, const std::string &key) {
    const json &v = arguments.at(key);
    if (v.is_number_integer()) {
        return v.get<int>();
    }
    return static_cast<int>(v.get<double>());
}

ToolSchema::ToolSchema(const std::string &name, const std::string &description)
    : m_name(name), m_description(description) {
}

ToolSchema &ToolSchema::integer(const std::string &name, const std::string &description,
                                bool required, int min, int max) {
    ArgSpec spec;
    spec.name = name;
    spec.type = ArgSpec::Type::INTEGER;
    spec.description = description;
    spec.required = required;
    spec.has_minimum = true;
    spec.minimum = min;
    spec.has_maximum = true;
    spec.maximum = max;
    m_args.push_back(spec);
    return *this;
}

ToolSchema &ToolSchema::number(const std::string &name, const std::string &description,
                               bool required, double min) {
    ArgSpec spec;
    spec.name = name;
    spec.type = ArgSpec::Type::NUMBER;
    spec.description = description;
    spec.required = required;
    spec.has_minimum = true;
    spec.minimum = min;
    m_args.push_back(spec);
    return *this;
}

ToolSchema &ToolSchema::number(const std::string &name, const std::string &description,
                               bool required, double min, double max) {
    number(name, description, required, min);
    m_args.back().has_maximum = true;
    m_args.back().maximum = max;
    return *this;
}

ToolSchema &ToolSchema::oneOf(const std::string &name, const std::string &description,
                              bool required, const std::vector<int> &values) {
    ArgSpec spec;
    spec.name = name;
    spec.type = ArgSpec::Type::INTEGER;
    spec.description = description;
    spec.required = required;
    spec.int_values = values;
    m_args.push_back(spec);
    return *this;
}

ToolSchema &ToolSchema::oneOf(const std::string &name, const std::string &description,
                              bool required, const std::vector<std::string> &values) {
    ArgSpec spec;
    spec.name = name;
    spec.type = ArgSpec::Type::STRING;
    spec.description = description;
    spec.required = required;
    spec.string_values = values;
    m_args.push_back(spec);
    return *this;
}

bool ToolSchema::validate(const json &arguments, std::string &field, std::string &reason) const {
    if (!arguments.is_object()) {
        field = "arguments";
        reason = "must be an object";
        return false;
    }

    for (const auto &spec : m_args) {
        auto it = arguments.find(spec.name);
        if (it == arguments.end() || it->is_null()) {
            if (spec.required) {
                field = spec.name;
                reason = "is required";
                return false;
            }
            continue;
        }

        if (!validateArg(spec, *it, reason)) {
            field = spec.name;
            return false;
        }
    }

    return true;
}

bool ToolSchema::validateArg(const ArgSpec &spec, const json &value, std::string &reason) const {
    if (spec.type == ArgSpec::Type::STRING) {
        if (!value.is_string()) {
            reason = "must be a string";
            return false;
        }
        if (!spec.string_values.empty()) {
            const std::string s = value.get<std::string>();
            for (const auto &allowed : spec.string_values) {
                if (s == allowed) return true;
            }
            std::string list;
            for (size_t i = 0; i < spec.string_values.size(); i++) {
                if (i > 0) list += ", ";
                list += spec.string_values[i];
            }
            reason = "must be one of [" + list + "]";
            return false;
        }
        return true;
    }

    if (!value.is_number()) {
        reason = "must be a number";
        return false;
    }

    double v = value.get<double>();

    if (spec.type == ArgSpec::Type::INTEGER && !value.is_number_integer()) {
        if (!std::isfinite(v) || std::floor(v) != v) {
            reason = "must be an integer";
            return false;
        }
    }

    if (!spec.int_values.empty()) {
        for (int allowed : spec.int_values) {
            if (v == allowed) return true;
        }
        std::string list;
        for (size_t i = 0; i < spec.int_values.size(); i++) {
            if (i > 0) list += ", ";
            list += std::to_string(spec.int_values[i]);
        }
        reason = "must be one of [" + list + "]";
        return false;
    }

    bool below = spec.has_minimum && v < spec.minimum;
    bool above = spec.has_maximum && v > spec.maximum;
    if (below || above) {
        if (spec.has_minimum && spec.has_maximum) {
            reason = "must be between " + formatDouble(spec.minimum) + " and " +
                     formatDouble(spec.maximum);
        } else if (spec.has_minimum) {
            reason = "must be >= " + formatDouble(spec.minimum);
        } else {
            reason = "must be <= " + formatDouble(spec.maximum);
        }
        return false;
    }

    return true;
}

json ToolSchema::toJson() const {
    json properties = json::object();
    json required = json::array();

    for (const auto &spec : m_args) {
        json prop;
        switch (spec.type) {
            case ArgSpec::Type::INTEGER: prop["type"] = "integer"; break;
            case ArgSpec::Type::NUMBER:  prop["type"] = "number"; break;
            case ArgSpec::Type::STRING:  prop["type"] = "string"; break;
        }
        prop["description"] = spec.description;
        if (spec.has_minimum) prop["minimum"] = spec.minimum;
        if (spec.has_maximum) prop["maximum"] = spec.maximum;
        if (!spec.int_values.empty()) prop["enum"] = spec.int_values;
        if (!spec.string_values.empty()) prop["enum"] = spec.string_values;

        properties[spec.name] = prop;
        if (spec.required) {
            required.push_back(spec.name);
        }
    }

    json input_schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        input_schema["required"] = required;
    }

    return {{"name", m_name}, {"description", m_description}, {"inputSchema", input_schema}};
}
