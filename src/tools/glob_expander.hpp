#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace warden::tools {

struct GlobExpansion {
    std::vector<std::string> paths;  // sorted
    bool truncated = false;          // stopped at the limit
};

// Expands an absolute glob pattern. Components may use fnmatch syntax
// (`*`, `?`, `[...]`); a component that is exactly `**` matches zero or more
// directories. Symlinked directories are not descended into.
GlobExpansion expand_glob(const std::string& absolute_pattern, std::size_t limit);

// Leading components of an absolute pattern that hold no wildcard. This is
// the directory the expansion starts from (the whole path for a literal).
std::string literal_prefix(const std::string& absolute_pattern);

}  // namespace warden::tools
