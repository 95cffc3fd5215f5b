#include "safeterm/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace safeterm::utils {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto shell_split(std::string_view line) -> Result<std::vector<std::string>> {
    enum class State { Normal, Single, Double };

    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    State state = State::Normal;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        switch (state) {
            case State::Normal:
                if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                    if (in_word) {
                        words.push_back(std::move(current));
                        current.clear();
                        in_word = false;
                    }
                } else if (c == '\\') {
                    if (i + 1 >= line.size()) {
                        return std::unexpected(make_error(ErrorCode::ParseError,
                            "No escaped character", std::string(line)));
                    }
                    current += line[++i];
                    in_word = true;
                } else if (c == '\'') {
                    state = State::Single;
                    in_word = true;
                } else if (c == '"') {
                    state = State::Double;
                    in_word = true;
                } else {
                    current += c;
                    in_word = true;
                }
                break;

            case State::Single:
                if (c == '\'') {
                    state = State::Normal;
                } else {
                    current += c;
                }
                break;

            case State::Double:
                if (c == '"') {
                    state = State::Normal;
                } else if (c == '\\' && i + 1 < line.size() &&
                           (line[i + 1] == '"' || line[i + 1] == '\\' || line[i + 1] == '$')) {
                    current += line[++i];
                } else {
                    current += c;
                }
                break;
        }
    }

    if (state != State::Normal) {
        return std::unexpected(make_error(ErrorCode::ParseError,
            "No closing quotation", std::string(line)));
    }
    if (in_word) {
        words.push_back(std::move(current));
    }
    return words;
}

} // namespace safeterm::utils
