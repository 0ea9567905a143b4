#ifndef LINEWIRE_NET_COMMAND_HPP
#define LINEWIRE_NET_COMMAND_HPP

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "linewire/net/session.hpp"
#include "linewire/net/types.hpp"

namespace linewire::net {

// arguments are the whitespace separated words after the command token
template <typename Context>
using Handler = std::function<Reply(const std::vector<std::string>& args, Session<Context>& session)>;

template <typename Context>
struct CommandEntry {
    std::string token;
    Handler<Context> handler;
};

// splits on ASCII whitespace, dropping empty fields
std::vector<std::string> tokenize(const std::string& line);
std::string to_lower(std::string str);

namespace detail {
// lowercases every token in place and validates its position. throws std::invalid_argument
void normalize_tokens(std::vector<std::string>& tokens);
// token -> position of its first occurrence, greeting excluded. warns about shadowed duplicates
std::unordered_map<std::string, std::size_t> index_tokens(const std::vector<std::string>& tokens);
}  // namespace detail

/*
    ordered command table. built once, then shared read-only by every session, so it
    needs no locking.

    an entry at index 0 with an empty token is the greeting: run() calls it with no
    arguments as soon as the session starts, and it is never matched against input.
    tokens match case-insensitively. when a token is registered twice the first entry
    wins and the later one is unreachable.
*/
template <typename Context>
class ProtocolTable {
   public:
    using Entry = CommandEntry<Context>;

    ProtocolTable(std::initializer_list<Entry> entries)
        : ProtocolTable(std::vector<Entry>(entries)) {}

    explicit ProtocolTable(std::vector<Entry> entries) : entries_(std::move(entries)) {
        std::vector<std::string> tokens;
        tokens.reserve(entries_.size());
        for (std::size_t i = 0; i < entries_.size(); ++i) {
            if (!entries_[i].handler) {
                throw std::invalid_argument("command entry " + std::to_string(i) +
                                            " has no handler");
            }
            tokens.push_back(entries_[i].token);
        }
        detail::normalize_tokens(tokens);
        for (std::size_t i = 0; i < entries_.size(); ++i) {
            entries_[i].token = tokens[i];
        }
        index_ = detail::index_tokens(tokens);
    }

    [[nodiscard]] const Entry* greeting() const noexcept {
        if (!entries_.empty() && entries_.front().token.empty()) {
            return &entries_.front();
        }
        return nullptr;
    }

    // token in any case; nullptr when nothing matches
    [[nodiscard]] const Entry* find(const std::string& token) const {
        auto it = index_.find(to_lower(token));
        if (it == index_.end()) {
            return nullptr;
        }
        return &entries_[it->second];
    }

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept {
        return entries_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return entries_.size();
    }

   private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace linewire::net

#endif
