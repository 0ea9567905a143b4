#include "linewire/net/command.hpp"

#include <algorithm>
#include <cctype>

#include "linewire/util/logger.hpp"

namespace linewire::net {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_space(line[i])) {
            ++i;
        }
        size_t start = i;
        while (i < line.size() && !is_space(line[i])) {
            ++i;
        }
        if (i > start) {
            tokens.emplace_back(line, start, i - start);
        }
    }
    return tokens;
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

namespace detail {

void normalize_tokens(std::vector<std::string>& tokens) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        std::string& token = tokens[i];
        if (token.empty()) {
            if (i != 0) {
                throw std::invalid_argument("empty command token at position " +
                                            std::to_string(i) +
                                            "; only the greeting at position 0 may be empty");
            }
            continue;
        }
        if (std::any_of(token.begin(), token.end(), is_space)) {
            throw std::invalid_argument("command token '" + token + "' contains whitespace");
        }
        token = to_lower(std::move(token));
    }
}

std::unordered_map<std::string, size_t> index_tokens(const std::vector<std::string>& tokens) {
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].empty()) {
            continue;
        }
        // emplace keeps the existing mapping, so registration order decides
        auto [it, inserted] = index.emplace(tokens[i], i);
        if (!inserted) {
            LOG_WARN("command '" + tokens[i] + "' at position " + std::to_string(i) +
                     " is shadowed by position " + std::to_string(it->second) +
                     " and will never be called");
        }
    }
    return index;
}

}  // namespace detail

}  // namespace linewire::net
