// path_parser.cpp
// Implementation of the dotted path grammar

#include <jsonb_delta/path_parser.h>

#include <charconv>
#include <optional>
#include <system_error>

namespace jsonb_delta {

namespace {

bool is_reserved(char c) noexcept
{
    return c == '.' || c == '[' || c == ']';
}

Error parse_error(std::string_view text, std::size_t offset, std::string reason)
{
    return detail::make_error("parse_path", ErrorCode::ParseError,
                              std::move(reason) + " in path \"" + std::string{text} + "\"", offset);
}

/// Parse "[digits]" starting at text[pos] == '['.
/// On success appends the index and moves pos past the ']'.
std::optional<Error> parse_index(std::string_view text, std::size_t& pos, Path& path)
{
    const std::size_t open = pos;
    const std::size_t content = open + 1;
    const std::size_t close = text.find(']', content);
    if (close == std::string_view::npos) {
        return parse_error(text, open, "unterminated '['");
    }

    const std::string_view digits = text.substr(content, close - content);
    if (digits.empty()) {
        return parse_error(text, content, "empty index");
    }
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (digits[i] < '0' || digits[i] > '9') {
            return parse_error(text, content, "index must be a non-negative integer");
        }
    }

    std::size_t index = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return parse_error(text, content, "index out of range");
    }

    path.emplace_back(index);
    pos = close + 1;
    return std::nullopt;
}

} // anonymous namespace

Result<Path> parse_path(std::string_view text, PathRequirement requirement)
{
    Path path;

    if (text.empty()) {
        if (requirement == PathRequirement::NonRoot) {
            return parse_error(text, 0, "empty path where a non-root path is required");
        }
        return path;
    }

    std::size_t pos = 0;
    const std::size_t n = text.size();

    while (true) {
        // segment := identifier index*
        const std::size_t start = pos;
        while (pos < n && !is_reserved(text[pos])) {
            ++pos;
        }
        if (pos == start) {
            return parse_error(text, start, "empty identifier");
        }
        path.emplace_back(std::string{text.substr(start, pos - start)});

        // ("." segment | index)*
        while (true) {
            if (pos == n) {
                return path;
            }
            const char c = text[pos];
            if (c == '[') {
                if (auto err = parse_index(text, pos, path)) {
                    return *err;
                }
                continue;
            }
            if (c == '.') {
                ++pos;
                break;
            }
            return parse_error(text, pos, std::string{"unexpected character '"} + c + "'");
        }
    }
}

} // namespace jsonb_delta
