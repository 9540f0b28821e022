#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "echo/python_lexer.hpp"

namespace sandkeep::echo {

struct Span {
    std::optional<std::size_t> begin;
    std::optional<std::size_t> end;
    int start_line = 0;
    int start_col = 0;
    int end_line = 0;
    int end_col = 0;
};

struct Expression {
    Span span;
    // Set when the whole expression is `name(...)`.
    std::optional<std::string> call_target;
};

enum class StatementKind {
    kExpression,
    kAssignment,
    kKeyword,
    kCompound
};

struct Statement {
    StatementKind kind = StatementKind::kExpression;
    Span span;
    std::optional<Expression> expression;
};

// Top-level statements of a module in source order. Indented blocks belong to
// the compound statement that opens them; ';' separates simple statements.
// Throws ParseError.
std::vector<Statement> ParseModule(const std::string& source);

}  // namespace sandkeep::echo
