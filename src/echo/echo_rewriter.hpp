#pragma once

#include <optional>
#include <string>

#include "echo/statement_splitter.hpp"

namespace sandkeep::echo {

// Makes a trailing bare expression print its repr(), the way an interactive
// interpreter would. Everything before the appended line is left untouched.
class EchoRewriter {
public:
    explicit EchoRewriter(bool enabled = true) : enabled_(enabled) {}

    // Never throws; unparsable input comes back unchanged.
    std::string Rewrite(const std::string& source) const;

    bool Enabled() const { return enabled_; }

    // Exact text for `span`: byte offsets first, then line/column bounds.
    static std::optional<std::string> SourceSegment(const std::string& source, const Span& span);

    static std::optional<std::string> LastNonBlankLine(const std::string& source);

    // Expression text, falling back to the last non-blank line.
    static std::optional<std::string> RecoverExpressionText(const std::string& source, const Expression& expression);

private:
    bool enabled_;
};

}  // namespace sandkeep::echo
