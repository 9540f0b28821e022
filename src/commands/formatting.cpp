#include "commands/formatting.hpp"

#include <algorithm>

#include "utils/common.hpp"

namespace sandkeep::commands {

std::string ExtractCodeBlock(const std::string& raw) {
    const auto content = utils::Trim(raw);
    if (content.size() >= 6 && content.rfind("```", 0) == 0 &&
        content.compare(content.size() - 3, 3, "```") == 0) {
        auto inner = content.substr(3, content.size() - 6);
        const auto newline = inner.find('\n');
        const auto hint = newline == std::string::npos ? inner : inner.substr(0, newline);
        if (hint == "python" || hint == "py") {
            inner = newline == std::string::npos ? std::string() : inner.substr(newline + 1);
        }
        return utils::Trim(inner);
    }
    if (content.size() >= 2 && content.front() == '`' && content.back() == '`') {
        return utils::Trim(content.substr(1, content.size() - 2));
    }
    return content;
}

std::string FormatResult(const sandbox::ExecResult& result) {
    std::string text;
    if (!result.stdout_text.empty()) {
        text += result.stdout_text;
    }
    if (!result.stderr_text.empty()) {
        if (!result.stdout_text.empty()) {
            text += "\n--- stderr ---\n";
        }
        text += result.stderr_text;
    }
    if (result.stdout_text.empty() && result.stderr_text.empty()) {
        text += "(no output, exit code " + std::to_string(result.exit_code) + ")";
    }
    if (result.truncated) {
        text += "\n[output truncated]";
    }
    return text;
}

std::vector<std::string> RenderListing(const session::Listing& listing) {
    std::vector<std::string> lines;
    lines.push_back("cwd: /" + (listing.cwd == "." ? std::string() : listing.cwd));
    for (const auto& entry : listing.entries) {
        if (entry.is_dir) {
            lines.push_back(entry.name + "/");
        } else {
            lines.push_back(entry.name + " (" + std::to_string(entry.size) + " B)");
        }
    }
    return lines;
}

std::string Paginate(const std::vector<std::string>& lines, std::size_t page, std::size_t page_size) {
    page_size = std::max<std::size_t>(page_size, 1);
    const auto total_pages = std::max<std::size_t>(1, (lines.size() + page_size - 1) / page_size);
    page = std::min(page, total_pages - 1);
    const auto begin = std::min(lines.size(), page * page_size);
    const auto end = std::min(lines.size(), begin + page_size);
    const std::vector<std::string> slice(lines.begin() + static_cast<std::ptrdiff_t>(begin),
                                         lines.begin() + static_cast<std::ptrdiff_t>(end));
    auto body = utils::Join(slice, "\n");
    if (body.empty()) {
        body = "(empty)";
    }
    return "Page " + std::to_string(page + 1) + "/" + std::to_string(total_pages) + "\n\n" + body;
}

}  // namespace sandkeep::commands
