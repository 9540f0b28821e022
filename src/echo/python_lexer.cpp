#include "echo/python_lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "utils/common.hpp"

namespace sandkeep::echo {
namespace {

constexpr std::array<const char*, 24> kMultiCharOperators = {
    "**=", "//=", ">>=", "<<=", "...",
    "->", ":=", "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=",
    "&=", "|=", "^=", "@=", "**", "//", "<<", ">>",
};

constexpr const char* kSingleCharOperators = "+-*/%@&|^~<>=.,:;!";

bool IsNameStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool IsNameChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

bool IsStringPrefix(const std::string& word) {
    static const std::array<const char*, 8> kPrefixes = {"r", "u", "b", "f", "br", "rb", "fr", "rf"};
    const auto lowered = utils::ToLower(word);
    return std::find_if(kPrefixes.begin(), kPrefixes.end(), [&](const char* prefix) {
        return lowered == prefix;
    }) != kPrefixes.end();
}

char Closing(char open) {
    switch (open) {
        case '(': return ')';
        case '[': return ']';
        default: return '}';
    }
}

class Lexer {
public:
    explicit Lexer(const std::string& source) : src_(source) {}

    std::vector<Token> Run() {
        while (pos_ < src_.size()) {
            const auto c = static_cast<unsigned char>(src_[pos_]);
            if (c == ' ' || c == '\t' || c == '\f') {
                Advance(1);
            } else if (c == '#') {
                while (pos_ < src_.size() && src_[pos_] != '\n' && src_[pos_] != '\r') {
                    Advance(1);
                }
            } else if (c == '\\') {
                JoinLines();
            } else if (c == '\n' || c == '\r') {
                EndPhysicalLine();
            } else if (IsNameStart(c)) {
                LexNameOrString();
            } else if (std::isdigit(c) || (c == '.' && pos_ + 1 < src_.size() &&
                                           std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])))) {
                LexNumber();
            } else if (c == '"' || c == '\'') {
                LexString(pos_, line_, col_);
            } else if (c == '(' || c == '[' || c == '{') {
                const auto start = Mark();
                Advance(1);
                Emit(TokenKind::kOpen, start, static_cast<int>(brackets_.size()));
                brackets_.push_back(static_cast<char>(c));
            } else if (c == ')' || c == ']' || c == '}') {
                if (brackets_.empty() || Closing(brackets_.back()) != static_cast<char>(c)) {
                    throw ParseError("unmatched '" + std::string(1, static_cast<char>(c)) + "'", line_);
                }
                brackets_.pop_back();
                const auto start = Mark();
                Advance(1);
                Emit(TokenKind::kClose, start, static_cast<int>(brackets_.size()));
            } else {
                LexOperator();
            }
        }
        if (!brackets_.empty()) {
            throw ParseError("'" + std::string(1, brackets_.back()) + "' was never closed", line_);
        }
        EndLogicalLine();
        return std::move(tokens_);
    }

private:
    struct Position {
        std::size_t pos;
        int line;
        int col;
    };

    Position Mark() const {
        return Position{pos_, line_, col_};
    }

    void Advance(std::size_t count) {
        pos_ += count;
        col_ += static_cast<int>(count);
    }

    // Consumes "\n", "\r\n" or "\r".
    void ConsumeNewline() {
        if (src_[pos_] == '\r' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') {
            ++pos_;
        }
        ++pos_;
        ++line_;
        col_ = 0;
    }

    void Emit(TokenKind kind, const Position& start, int depth) {
        Token token{};
        token.kind = kind;
        token.text = src_.substr(start.pos, pos_ - start.pos);
        token.begin = start.pos;
        token.end = pos_;
        token.line = start.line;
        token.col = start.col;
        token.end_line = line_;
        token.end_col = col_;
        token.depth = depth;
        tokens_.push_back(std::move(token));
        line_has_tokens_ = true;
    }

    void EndLogicalLine() {
        if (!line_has_tokens_) {
            return;
        }
        Token token{};
        token.kind = TokenKind::kNewline;
        token.begin = pos_;
        token.end = pos_;
        token.line = line_;
        token.col = col_;
        token.end_line = line_;
        token.end_col = col_;
        tokens_.push_back(std::move(token));
        line_has_tokens_ = false;
    }

    void EndPhysicalLine() {
        if (brackets_.empty()) {
            EndLogicalLine();
        }
        ConsumeNewline();
    }

    void JoinLines() {
        Advance(1);
        if (pos_ >= src_.size() || (src_[pos_] != '\n' && src_[pos_] != '\r')) {
            throw ParseError("unexpected character after line continuation character", line_);
        }
        ConsumeNewline();
    }

    void LexNameOrString() {
        const auto start = Mark();
        while (pos_ < src_.size() && IsNameChar(static_cast<unsigned char>(src_[pos_]))) {
            Advance(1);
        }
        const auto word = src_.substr(start.pos, pos_ - start.pos);
        if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') && IsStringPrefix(word)) {
            LexString(start.pos, start.line, start.col);
            return;
        }
        Emit(TokenKind::kName, start, static_cast<int>(brackets_.size()));
    }

    void LexNumber() {
        const auto start = Mark();
        while (pos_ < src_.size()) {
            const auto c = static_cast<unsigned char>(src_[pos_]);
            const auto prev = pos_ > start.pos ? static_cast<unsigned char>(src_[pos_ - 1]) : 0;
            if (std::isalnum(c) || c == '_' || c == '.') {
                Advance(1);
            } else if ((c == '+' || c == '-') && (prev == 'e' || prev == 'E')) {
                Advance(1);
            } else {
                break;
            }
        }
        Emit(TokenKind::kNumber, start, static_cast<int>(brackets_.size()));
    }

    // `begin` may precede pos_ when a prefix such as rb was already consumed.
    void LexString(std::size_t begin, int line, int col) {
        const char quote = src_[pos_];
        const bool triple = pos_ + 2 < src_.size() && src_[pos_ + 1] == quote && src_[pos_ + 2] == quote;
        Advance(triple ? 3 : 1);
        while (true) {
            if (pos_ >= src_.size()) {
                throw ParseError("unterminated string literal", line);
            }
            const char c = src_[pos_];
            if (c == '\\') {
                Advance(1);
                if (pos_ < src_.size()) {
                    if (src_[pos_] == '\n' || src_[pos_] == '\r') {
                        ConsumeNewline();
                    } else {
                        Advance(1);
                    }
                }
                continue;
            }
            if (c == '\n' || c == '\r') {
                if (!triple) {
                    throw ParseError("unterminated string literal", line);
                }
                ConsumeNewline();
                continue;
            }
            if (c == quote) {
                if (!triple) {
                    Advance(1);
                    break;
                }
                if (pos_ + 2 < src_.size() && src_[pos_ + 1] == quote && src_[pos_ + 2] == quote) {
                    Advance(3);
                    break;
                }
            }
            Advance(1);
        }
        Emit(TokenKind::kString, Position{begin, line, col}, static_cast<int>(brackets_.size()));
    }

    void LexOperator() {
        const auto start = Mark();
        for (const auto* op : kMultiCharOperators) {
            const std::string text(op);
            if (src_.compare(pos_, text.size(), text) == 0) {
                Advance(text.size());
                Emit(TokenKind::kOperator, start, static_cast<int>(brackets_.size()));
                return;
            }
        }
        const char c = src_[pos_];
        if (std::string(kSingleCharOperators).find(c) == std::string::npos) {
            throw ParseError("invalid character '" + std::string(1, c) + "'", line_);
        }
        Advance(1);
        Emit(TokenKind::kOperator, start, static_cast<int>(brackets_.size()));
    }

    const std::string& src_;
    std::size_t pos_ = 0;
    int line_ = 1;
    int col_ = 0;
    bool line_has_tokens_ = false;
    std::vector<char> brackets_;
    std::vector<Token> tokens_;
};

}  // namespace

std::vector<Token> Tokenize(const std::string& source) {
    return Lexer(source).Run();
}

}  // namespace sandkeep::echo
