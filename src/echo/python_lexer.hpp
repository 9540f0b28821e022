#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandkeep::echo {

class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, int line)
        : std::runtime_error(message + " (line " + std::to_string(line) + ")"), line_(line) {}

    int Line() const { return line_; }

private:
    int line_;
};

enum class TokenKind {
    kName,
    kNumber,
    kString,
    kOperator,
    kOpen,
    kClose,
    kNewline
};

struct Token {
    TokenKind kind = TokenKind::kOperator;
    std::string text;
    // Byte offsets into the source, end exclusive.
    std::size_t begin = 0;
    std::size_t end = 0;
    // 1-based lines, 0-based byte columns.
    int line = 1;
    int col = 0;
    int end_line = 1;
    int end_col = 0;
    // Bracket nesting outside this token.
    int depth = 0;
};

// Tokenizes Python source. Comments, blank lines and joined physical lines do
// not produce tokens; each logical line ends with a kNewline token. Throws
// ParseError on unterminated strings, unbalanced brackets and stray characters.
std::vector<Token> Tokenize(const std::string& source);

}  // namespace sandkeep::echo
