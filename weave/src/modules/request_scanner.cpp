//! # Request Scanner
//!
//! One pass per import form over the keyword occurrences, left to right.
//! A failed `from` clause scan ends at a quote, backtick or semicolon, and
//! no later keyword before that point is scanned again, so the work stays
//! linear in the source length however long a clause grows.

#include "modules/request_scanner.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>
#include <utility>

namespace weave::modules {

namespace {

using Match = std::pair<size_t, std::string>; // position, request

bool is_word_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool is_quote(char c) {
    return c == '"' || c == '\'';
}

// ============================================================================
// Cursor
// ============================================================================

/// Character access over the source.
class Cursor {
public:
    Cursor(std::string_view src, size_t pos) : src_(src), pos_(pos) {}

    [[nodiscard]] bool is_at_end() const {
        return pos_ >= src_.size();
    }

    [[nodiscard]] char peek() const {
        return is_at_end() ? '\0' : src_[pos_];
    }

    void advance() {
        ++pos_;
    }

    [[nodiscard]] size_t pos() const {
        return pos_;
    }

    /// Skips whitespace and returns how many characters were skipped.
    size_t skip_whitespace() {
        size_t start = pos_;
        while (!is_at_end() && is_space(peek())) {
            advance();
        }
        return pos_ - start;
    }

    /// Consumes `text` if the source continues with it.
    bool match(std::string_view text) {
        if (src_.substr(pos_, text.size()) != text) {
            return false;
        }
        pos_ += text.size();
        return true;
    }

    /// Consumes a quoted, non-empty request. Either quote closes it.
    std::optional<Match> quoted() {
        if (!is_quote(peek())) {
            return std::nullopt;
        }
        advance();
        size_t start = pos_;
        while (!is_at_end() && !is_quote(peek())) {
            advance();
        }
        if (is_at_end() || pos_ == start) {
            return std::nullopt;
        }
        Match request{start, std::string(src_.substr(start, pos_ - start))};
        advance();
        return request;
    }

private:
    std::string_view src_;
    size_t pos_;
};

/// Next occurrence of `keyword` at or after `from`, or npos. A keyword
/// starting with a word character must not continue an identifier.
size_t find_keyword(std::string_view src, std::string_view keyword, size_t from) {
    for (size_t at = src.find(keyword, from); at != std::string_view::npos;
         at = src.find(keyword, at + 1)) {
        if (at == 0 || !is_word_char(keyword.front()) || !is_word_char(src[at - 1])) {
            return at;
        }
    }
    return std::string_view::npos;
}

/// A match, or nullopt, and the position below which no later occurrence
/// of the keyword can match.
using FormResult = std::pair<std::optional<Match>, size_t>;

/// Tries the next occurrence.
FormResult no_match() {
    return {std::nullopt, 0};
}

FormResult matched(Match request, size_t end) {
    return {std::move(request), end};
}

/// Runs `form` at every occurrence of `keyword`. Matches never overlap.
template <typename Form>
void scan_keyword(std::string_view src, std::string_view keyword, std::vector<Match>& out,
                  Form form) {
    size_t resume = 0;
    for (size_t at = find_keyword(src, keyword, 0); at != std::string_view::npos;
         at = find_keyword(src, keyword, std::max(at + 1, resume))) {
        Cursor cursor(src, at + keyword.size());
        auto [request, next] = form(cursor);
        if (request) {
            out.push_back(std::move(*request));
        }
        resume = next;
    }
}

// ============================================================================
// ECMAScript forms
// ============================================================================

/// `import x from '...'` / `export x from '...'`. The clause between the
/// keyword and `from` contains no quote, backtick or semicolon.
FormResult from_clause(Cursor& cursor, std::string_view src) {
    if (!is_space(cursor.peek())) {
        return no_match();
    }
    cursor.advance();

    while (!cursor.is_at_end()) {
        char c = cursor.peek();
        if (is_quote(c) || c == '`' || c == ';') {
            break;
        }
        size_t at = cursor.pos();
        if (c == 'f' && (at == 0 || !is_word_char(src[at - 1]))) {
            Cursor from(src, at);
            if (from.match("from")) {
                from.skip_whitespace();
                if (auto request = from.quoted()) {
                    return matched(std::move(*request), from.pos());
                }
            }
        }
        cursor.advance();
    }
    // Every later keyword before this point sees a subset of this clause
    return {std::nullopt, cursor.pos()};
}

/// `import '...'`.
FormResult side_effect(Cursor& cursor) {
    cursor.skip_whitespace();
    auto request = cursor.quoted();
    if (!request) {
        return no_match();
    }
    return matched(std::move(*request), cursor.pos());
}

/// `import('...')` and `require('...')` with a literal argument.
FormResult call(Cursor& cursor) {
    cursor.skip_whitespace();
    if (!cursor.match("(")) {
        return no_match();
    }
    cursor.skip_whitespace();
    auto request = cursor.quoted();
    cursor.skip_whitespace();
    if (!request || !cursor.match(")")) {
        return no_match();
    }
    return matched(std::move(*request), cursor.pos());
}

// ============================================================================
// CSS forms
// ============================================================================

/// `@import '...'` and `@import url('...')`.
FormResult css_quoted(Cursor& cursor) {
    if (cursor.skip_whitespace() == 0) {
        return no_match();
    }
    if (cursor.match("url(")) {
        cursor.skip_whitespace();
    }
    auto request = cursor.quoted();
    if (!request) {
        return no_match();
    }
    return matched(std::move(*request), cursor.pos());
}

/// `@import url(...)` without quotes.
FormResult css_bare_url(Cursor& cursor, std::string_view src) {
    if (cursor.skip_whitespace() == 0 || !cursor.match("url(")) {
        return no_match();
    }
    cursor.skip_whitespace();
    size_t start = cursor.pos();
    while (!cursor.is_at_end()) {
        char c = cursor.peek();
        if (is_quote(c) || is_space(c) || c == ')') {
            break;
        }
        cursor.advance();
    }
    size_t end = cursor.pos();
    cursor.skip_whitespace();
    if (end == start || !cursor.match(")")) {
        return no_match();
    }
    return matched(Match{start, std::string(src.substr(start, end - start))}, cursor.pos());
}

std::vector<std::string> in_source_order(std::vector<Match> matches) {
    std::sort(matches.begin(), matches.end(),
              [](const Match& a, const Match& b) { return a.first < b.first; });

    std::vector<std::string> requests;
    std::unordered_set<std::string> seen;
    for (auto& [pos, request] : matches) {
        if (seen.insert(request).second) {
            requests.push_back(std::move(request));
        }
    }
    return requests;
}

} // namespace

std::vector<std::string> scan_ecmascript_requests(std::string_view source) {
    std::vector<Match> matches;
    for (std::string_view keyword : {"import", "export"}) {
        scan_keyword(source, keyword, matches,
                     [source](Cursor& cursor) { return from_clause(cursor, source); });
    }
    scan_keyword(source, "import", matches, side_effect);
    scan_keyword(source, "import", matches, call);
    scan_keyword(source, "require", matches, call);
    return in_source_order(std::move(matches));
}

std::vector<std::string> scan_css_requests(std::string_view source) {
    std::vector<Match> matches;
    scan_keyword(source, "@import", matches, css_quoted);
    scan_keyword(source, "@import", matches,
                 [source](Cursor& cursor) { return css_bare_url(cursor, source); });

    for (auto& [pos, request] : matches) {
        bool explicit_path = request.starts_with("./") || request.starts_with("../") ||
                             request.starts_with("/") || request.find(':') != std::string::npos;
        if (request.starts_with("~")) {
            // "~pkg/x.css" names a package
            request.erase(0, 1);
        } else if (!explicit_path) {
            request = "./" + request;
        }
    }
    return in_source_order(std::move(matches));
}

} // namespace weave::modules
