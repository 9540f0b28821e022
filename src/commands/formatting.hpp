#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sandbox/exec_types.hpp"
#include "session/session_types.hpp"

namespace sandkeep::commands {

// Strips `inline` and ```fenced``` markers; a python/py hint after the opening
// fence is dropped as well.
std::string ExtractCodeBlock(const std::string& raw);

// stdout, then stderr under a separator, then a truncation notice. Empty
// output renders as "(no output, exit code N)".
std::string FormatResult(const sandbox::ExecResult& result);

// "cwd: /sub" followed by "dir/" and "file (N B)" lines.
std::vector<std::string> RenderListing(const session::Listing& listing);

// "Page i/n" header and one page of lines; out of range pages are clamped.
std::string Paginate(const std::vector<std::string>& lines, std::size_t page, std::size_t page_size = 20);

}  // namespace sandkeep::commands
