#include "echo/statement_splitter.hpp"

#include <algorithm>
#include <array>

namespace sandkeep::echo {
namespace {

constexpr std::array<const char*, 11> kCompoundKeywords = {
    "if", "elif", "else", "for", "while", "def", "class", "with", "try", "except", "finally",
};

constexpr std::array<const char*, 11> kSimpleKeywords = {
    "pass", "break", "continue", "return", "raise", "import", "from", "global", "nonlocal", "del", "assert",
};

constexpr std::array<const char*, 14> kAssignOperators = {
    "=", "+=", "-=", "*=", "/=", "//=", "%=", "**=", "@=", "&=", "|=", "^=", ">>=", "<<=",
};

template <std::size_t N>
bool Contains(const std::array<const char*, N>& words, const std::string& text) {
    return std::find_if(words.begin(), words.end(), [&](const char* word) {
        return text == word;
    }) != words.end();
}

using TokenRange = std::pair<std::size_t, std::size_t>;

Span SpanOf(const std::vector<Token>& tokens, const TokenRange& range) {
    const auto& first = tokens[range.first];
    const auto& last = tokens[range.second - 1];
    Span span{};
    span.begin = first.begin;
    span.end = last.end;
    span.start_line = first.line;
    span.start_col = first.col;
    span.end_line = last.end_line;
    span.end_col = last.end_col;
    return span;
}

bool IsAssignOperator(const Token& token) {
    return token.kind == TokenKind::kOperator && Contains(kAssignOperators, token.text);
}

bool EndsWithColon(const std::vector<Token>& tokens, const TokenRange& range) {
    const auto& last = tokens[range.second - 1];
    return last.kind == TokenKind::kOperator && last.text == ":";
}

std::optional<std::string> CallTarget(const std::vector<Token>& tokens, const TokenRange& range) {
    const auto count = range.second - range.first;
    if (count < 3) {
        return std::nullopt;
    }
    const auto& name = tokens[range.first];
    const auto& open = tokens[range.first + 1];
    const auto& close = tokens[range.second - 1];
    if (name.kind != TokenKind::kName || open.kind != TokenKind::kOpen || open.text != "(" ||
        close.kind != TokenKind::kClose || close.depth != 0) {
        return std::nullopt;
    }
    // The closing paren must match the opening one, not a later group.
    for (auto i = range.first + 2; i + 1 < range.second; ++i) {
        if (tokens[i].kind == TokenKind::kClose && tokens[i].depth == 0) {
            return std::nullopt;
        }
    }
    return name.text;
}

Statement Classify(const std::vector<Token>& tokens, const TokenRange& range) {
    Statement statement{};
    statement.span = SpanOf(tokens, range);
    const auto& first = tokens[range.first];

    if (first.kind == TokenKind::kOperator && first.text == "@") {
        statement.kind = StatementKind::kCompound;
        return statement;
    }
    if (first.kind == TokenKind::kName) {
        if (Contains(kCompoundKeywords, first.text)) {
            statement.kind = StatementKind::kCompound;
            return statement;
        }
        if (first.text == "async" || ((first.text == "match" || first.text == "case") &&
                                      range.second - range.first > 1 && EndsWithColon(tokens, range))) {
            statement.kind = StatementKind::kCompound;
            return statement;
        }
        if (Contains(kSimpleKeywords, first.text)) {
            statement.kind = StatementKind::kKeyword;
            return statement;
        }
    }

    int open_lambdas = 0;
    for (auto i = range.first; i < range.second; ++i) {
        const auto& token = tokens[i];
        if (token.depth != 0) {
            continue;
        }
        if (token.kind == TokenKind::kName && token.text == "lambda") {
            ++open_lambdas;
            continue;
        }
        if (token.kind != TokenKind::kOperator) {
            continue;
        }
        if (token.text == ":") {
            if (open_lambdas > 0) {
                --open_lambdas;
                continue;
            }
            // Annotated assignment.
            statement.kind = StatementKind::kAssignment;
            return statement;
        }
        if (token.text == ":=" || (open_lambdas == 0 && IsAssignOperator(token))) {
            statement.kind = StatementKind::kAssignment;
            return statement;
        }
    }

    statement.kind = StatementKind::kExpression;
    Expression expression{};
    expression.span = statement.span;
    expression.call_target = CallTarget(tokens, range);
    statement.expression = std::move(expression);
    return statement;
}

}  // namespace

std::vector<Statement> ParseModule(const std::string& source) {
    const auto tokens = Tokenize(source);
    std::vector<Statement> statements;

    std::size_t line_start = 0;
    bool previous_compound = false;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind != TokenKind::kNewline) {
            continue;
        }
        const TokenRange line{line_start, i};
        line_start = i + 1;
        if (line.first == line.second) {
            continue;
        }
        if (tokens[line.first].col > 0) {
            if (!previous_compound) {
                throw ParseError("unexpected indent", tokens[line.first].line);
            }
            // Body line of the current compound statement: extend its span.
            auto& owner = statements.back();
            const auto& last = tokens[line.second - 1];
            owner.span.end = last.end;
            owner.span.end_line = last.end_line;
            owner.span.end_col = last.end_col;
            continue;
        }

        auto segment_start = line.first;
        for (auto j = line.first; j <= line.second; ++j) {
            const bool at_end = j == line.second;
            const bool separator = !at_end && tokens[j].kind == TokenKind::kOperator &&
                                   tokens[j].text == ";" && tokens[j].depth == 0;
            if (!at_end && !separator) {
                continue;
            }
            if (j > segment_start) {
                statements.push_back(Classify(tokens, TokenRange{segment_start, j}));
            } else if (separator) {
                throw ParseError("invalid syntax", tokens[j].line);
            }
            segment_start = j + 1;
        }
        // Only a header ending in ':' opens an indented block; "if x: y" does not.
        previous_compound = !statements.empty() && statements.back().kind == StatementKind::kCompound &&
                            EndsWithColon(tokens, line);
    }
    return statements;
}

}  // namespace sandkeep::echo
