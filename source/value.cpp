// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value.cpp - Value utilities and JSON text output

#include <live_tree/value.h>
#include <live_tree/builders.h>

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace live_tree {

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(15) << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, Value::boxed_bytes>) {
            return "<bytes:" + std::to_string(arg.get().size()) + ">";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[vector:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

// ============================================================
// JSON Serialization / Deserialization
// ============================================================

namespace {

std::string json_escape_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level) {
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << std::setprecision(15) << arg;
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, Value::boxed_bytes>) {
            oss << "[";
            const auto& bytes = arg.get();
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                if (i > 0) oss << ",";
                oss << static_cast<unsigned>(bytes[i]);
            }
            oss << "]";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.size() == 0) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& [k, v] : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(k) << "\":" << space_after_colon;
                    to_json_impl(*v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.size() == 0) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(*v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        }
    }, val.data);
}

} // anonymous namespace

std::string to_json(const Value& val, bool compact) {
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

// ============================================================
// Explicit Template Instantiations
// ============================================================

template struct BasicValue<unsafe_memory_policy>;
template class BasicMapBuilder<unsafe_memory_policy>;
template class BasicVectorBuilder<unsafe_memory_policy>;

} // namespace live_tree
