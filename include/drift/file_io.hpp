#pragma once

#include <drift/result.hpp>
#include <filesystem>
#include <string>
#include <string_view>

namespace drift {

// Read a whole file. NotFound when the path does not exist, IO otherwise.
Result<std::string> read_file(const std::filesystem::path& path);

// Replace `path` with `content`: write a sibling temp file, fsync, rename
// over the target. Parent directories are created as needed.
Status write_file_atomic(const std::filesystem::path& path, std::string_view content);

// Convert CRLF and lone CR line endings to LF.
std::string to_lf(std::string_view text);

} // namespace drift
