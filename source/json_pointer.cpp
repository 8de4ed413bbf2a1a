// json_pointer.cpp
// Implementation of JSON Pointer (RFC 6901) parsing and formatting

#include <jsonrfc/json_pointer.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace jsonrfc {

// ============================================================
// JSON Pointer parsing
// ============================================================

namespace {

void replace_all(std::string& s, std::string_view from, std::string_view to)
{
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

/// Unescape a JSON Pointer token.
/// Order is significant: \" and \\ first, then ~1 -> /, then ~0 -> ~.
/// Decoding ~1 before ~0 keeps "~01" as "~1" instead of "/1".
std::string unescape_token(std::string_view token)
{
    std::string result{token};
    replace_all(result, "\\\"", "\"");
    replace_all(result, "\\\\", "\\");
    replace_all(result, "~1", "/");
    replace_all(result, "~0", "~");
    return result;
}

/// Index value of a token, or nullopt when the token must stay a key.
/// "0" is an index; any other token starting with '0' is a key since a
/// canonical number never has a leading zero.
std::optional<std::size_t> to_array_index(const std::string& token)
{
    if (token == "0") {
        return std::size_t{0};
    }
    if (token.empty() || token.front() == '0') {
        return std::nullopt;
    }
    if (!std::ranges::all_of(token, [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    std::size_t index = 0;
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, index);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;  // too large for an index; still a valid key
    }
    return index;
}

Segment classify_token(std::string token)
{
    if (auto index = to_array_index(token)) {
        return *index;
    }
    return std::move(token);
}

std::string escape_key(const std::string& key)
{
    std::string result;
    result.reserve(key.size());
    for (char c : key) {
        switch (c) {
            case '~':  result += "~0"; break;
            case '/':  result += "~1"; break;
            case '\\': result += "\\\\"; break;
            case '"':  result += "\\\""; break;
            default:   result += c; break;
        }
    }
    return result;
}

} // anonymous namespace

Result<Path> parse_json_pointer(std::string_view pointer)
{
    // Empty pointer refers to root
    if (pointer.empty()) {
        return Path{};
    }

    if (pointer.front() != '/') {
        auto error = make_error(ErrorCode::InvalidPointer,
                                "pointer must be empty or start with '/': \"" + std::string{pointer} + "\"");
        detail::log_failure("parse_json_pointer", error);
        return error;
    }

    Path path;
    pointer.remove_prefix(1);

    // Split by '/'; "/" alone yields one empty key, a trailing '/' an empty last key
    while (true) {
        auto pos = pointer.find('/');
        std::string_view token = (pos == std::string_view::npos)
                                 ? pointer
                                 : pointer.substr(0, pos);

        path.push_back(classify_token(unescape_token(token)));

        if (pos == std::string_view::npos) {
            break;
        }
        pointer.remove_prefix(pos + 1);
    }

    return path;
}

std::string path_to_json_pointer(const Path& path)
{
    std::string result;
    for (const auto& segment : path) {
        result += '/';
        if (auto* key = std::get_if<std::string>(&segment)) {
            result += escape_key(*key);
        } else {
            result += std::to_string(std::get<std::size_t>(segment));
        }
    }
    return result;
}

Result<Path> resolve_pointer(const PointerRef& pointer)
{
    if (auto* path = std::get_if<Path>(&pointer)) {
        return *path;
    }
    return parse_json_pointer(std::get<std::string>(pointer));
}

std::string pointer_text(const PointerRef& pointer)
{
    if (auto* path = std::get_if<Path>(&pointer)) {
        return path_to_json_pointer(*path);
    }
    return std::get<std::string>(pointer);
}

} // namespace jsonrfc
