// value.cpp - Value type utilities

#include <jsonrfc/value.h>

#include <algorithm>
#include <iostream>
#include <sstream>
#include <vector>

namespace jsonrfc {

namespace {

std::string quote(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    out += '"';
    return out;
}

std::vector<std::string> sorted_keys(const ValueMap& map)
{
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [k, v] : map) {
        keys.push_back(k);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // anonymous namespace

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return quote(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            std::string out = "[";
            for (std::size_t i = 0; i < arg.size(); ++i) {
                if (i > 0) out += ",";
                out += value_to_string(*arg[i]);
            }
            return out + "]";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            std::string out = "{";
            bool first = true;
            for (const auto& key : sorted_keys(arg)) {
                if (!first) out += ",";
                first = false;
                out += quote(key) + ":" + value_to_string(arg.find(key)->get());
            }
            return out + "}";
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    std::visit(
        [&](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, ValueMap>) {
                for (const auto& key : sorted_keys(arg)) {
                    std::cout << std::string(depth * 2, ' ') << prefix << key << ":\n";
                    print_value(arg.find(key)->get(), "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << std::string(depth * 2, ' ') << prefix << "["
                              << i << "]:\n";
                    print_value(*arg[i], "", depth + 1);
                }
            } else {
                std::cout << std::string(depth * 2, ' ') << prefix
                          << value_to_string(val) << "\n";
            }
        },
        val.data);
}

JSONRFC_EXPORT_TEMPLATE BasicValue<immer::default_memory_policy>;

} // namespace jsonrfc
