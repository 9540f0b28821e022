#include "echo/echo_rewriter.hpp"

#include <sstream>
#include <vector>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandkeep::echo {
namespace {

std::vector<std::string> SplitLines(const std::string& source) {
    std::vector<std::string> lines;
    std::istringstream stream(source);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::optional<std::string> SegmentFromLines(const std::string& source, const Span& span) {
    if (span.start_line <= 0 || span.end_line < span.start_line) {
        return std::nullopt;
    }
    const auto lines = SplitLines(source);
    const auto start = static_cast<std::size_t>(span.start_line);
    const auto end = static_cast<std::size_t>(span.end_line);
    if (end > lines.size()) {
        return std::nullopt;
    }
    const auto& first = lines[start - 1];
    const auto& last = lines[end - 1];
    const auto start_col = static_cast<std::size_t>(span.start_col);
    const auto end_col = static_cast<std::size_t>(span.end_col);
    if (start_col > first.size() || end_col > last.size()) {
        return std::nullopt;
    }
    std::string segment;
    if (start == end) {
        if (end_col < start_col) {
            return std::nullopt;
        }
        segment = first.substr(start_col, end_col - start_col);
    } else {
        segment = first.substr(start_col);
        for (auto i = start; i < end - 1; ++i) {
            segment += "\n" + lines[i];
        }
        segment += "\n" + last.substr(0, end_col);
    }
    segment = utils::Trim(segment);
    if (segment.empty()) {
        return std::nullopt;
    }
    return segment;
}

}  // namespace

std::optional<std::string> EchoRewriter::SourceSegment(const std::string& source, const Span& span) {
    if (span.begin && span.end && *span.begin < *span.end && *span.end <= source.size()) {
        return source.substr(*span.begin, *span.end - *span.begin);
    }
    return SegmentFromLines(source, span);
}

std::optional<std::string> EchoRewriter::LastNonBlankLine(const std::string& source) {
    const auto lines = SplitLines(source);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        const auto trimmed = utils::Trim(*it);
        if (!trimmed.empty()) {
            return trimmed;
        }
    }
    return std::nullopt;
}

std::optional<std::string> EchoRewriter::RecoverExpressionText(const std::string& source,
                                                                const Expression& expression) {
    auto text = SourceSegment(source, expression.span);
    if (text) {
        return text;
    }
    return LastNonBlankLine(source);
}

std::string EchoRewriter::Rewrite(const std::string& source) const {
    if (!enabled_) {
        return source;
    }
    std::vector<Statement> statements;
    try {
        statements = ParseModule(source);
    } catch (const std::exception& ex) {
        utils::LogDebug("echo", std::string("leaving source unchanged: ") + ex.what());
        return source;
    }
    if (statements.empty()) {
        return source;
    }
    const auto& last = statements.back();
    if (last.kind != StatementKind::kExpression || !last.expression) {
        return source;
    }
    if (last.expression->call_target && *last.expression->call_target == "print") {
        return source;
    }
    const auto text = RecoverExpressionText(source, *last.expression);
    if (!text) {
        return source;
    }
    return source + "\nprint(repr((" + *text + ")))";
}

}  // namespace sandkeep::echo
