#include "tools/glob_expander.hpp"

#include <filesystem>
#include <fnmatch.h>
#include <set>
#include <system_error>
#include <utility>

namespace warden::tools {

namespace {

bool has_wildcard(const std::string& component) {
    return component.find_first_of("*?[") != std::string::npos;
}

std::vector<std::string> split_components(const std::string& pattern) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= pattern.size()) {
        std::size_t end = pattern.find('/', start);
        if (end == std::string::npos) {
            end = pattern.size();
        }
        if (end > start) {
            const std::string part = pattern.substr(start, end - start);
            if (part != ".") {
                parts.push_back(part);
            }
        }
        start = end + 1;
    }
    return parts;
}

bool is_real_directory(const std::filesystem::directory_entry& entry) {
    std::error_code ec;
    return entry.is_directory(ec) && !ec && !entry.is_symlink(ec);
}

class Expander {
public:
    Expander(std::vector<std::string> parts, const std::size_t limit)
        : parts_(std::move(parts)), limit_(limit) {}

    void run(const std::filesystem::path& start_dir, const std::size_t first_index) {
        std::vector<std::pair<std::filesystem::path, std::size_t>> pending;
        pending.emplace_back(start_dir, first_index);

        while (!pending.empty() && !full()) {
            auto [dir, index] = std::move(pending.back());
            pending.pop_back();

            const std::string& part = parts_[index];
            const bool last = index + 1 == parts_.size();
            std::error_code ec;
            const auto options = std::filesystem::directory_options::skip_permission_denied;

            if (part == "**") {
                if (last) {
                    add_tree(dir);
                    continue;
                }
                pending.emplace_back(dir, index + 1);
                for (std::filesystem::directory_iterator it(dir, options, ec), end;
                     !ec && it != end; it.increment(ec)) {
                    if (is_real_directory(*it)) {
                        pending.emplace_back(it->path(), index);
                    }
                }
                continue;
            }

            for (std::filesystem::directory_iterator it(dir, options, ec), end;
                 !ec && it != end; it.increment(ec)) {
                const std::string name = it->path().filename().string();
                if (fnmatch(part.c_str(), name.c_str(), 0) != 0) {
                    continue;
                }
                if (last) {
                    add(it->path());
                    if (full()) {
                        return;
                    }
                } else if (is_real_directory(*it)) {
                    pending.emplace_back(it->path(), index + 1);
                }
            }
        }
    }

    GlobExpansion finish() {
        GlobExpansion expansion;
        expansion.truncated = truncated_;
        expansion.paths.assign(found_.begin(), found_.end());
        return expansion;
    }

private:
    bool full() const { return truncated_; }

    void add(const std::filesystem::path& path) {
        if (found_.size() >= limit_) {
            truncated_ = true;
            return;
        }
        found_.insert(path.string());
    }

    void add_tree(const std::filesystem::path& dir) {
        std::error_code ec;
        const auto options = std::filesystem::directory_options::skip_permission_denied;
        for (std::filesystem::recursive_directory_iterator it(dir, options, ec), end;
             !ec && it != end; it.increment(ec)) {
            add(it->path());
            if (full()) {
                return;
            }
        }
    }

    std::vector<std::string> parts_;
    std::size_t limit_;
    std::set<std::string> found_;
    bool truncated_ = false;
};

std::size_t literal_component_count(const std::vector<std::string>& parts) {
    std::size_t count = 0;
    while (count < parts.size() && !has_wildcard(parts[count])) {
        ++count;
    }
    return count;
}

std::filesystem::path join_components(const std::vector<std::string>& parts,
                                      const std::size_t count) {
    std::filesystem::path prefix("/");
    for (std::size_t i = 0; i < count; ++i) {
        prefix /= parts[i];
    }
    return prefix;
}

}  // namespace

std::string literal_prefix(const std::string& absolute_pattern) {
    const std::vector<std::string> parts = split_components(absolute_pattern);
    return join_components(parts, literal_component_count(parts)).string();
}

GlobExpansion expand_glob(const std::string& absolute_pattern, const std::size_t limit) {
    const std::vector<std::string> parts = split_components(absolute_pattern);
    const std::size_t index = literal_component_count(parts);
    const std::filesystem::path prefix = join_components(parts, index);

    std::error_code ec;
    if (index == parts.size()) {
        GlobExpansion literal;
        if (std::filesystem::exists(std::filesystem::symlink_status(prefix, ec)) && limit > 0) {
            literal.paths.push_back(prefix.string());
        }
        return literal;
    }
    if (!std::filesystem::is_directory(prefix, ec) || ec) {
        return GlobExpansion{};
    }

    Expander expander(parts, limit);
    expander.run(prefix, index);
    return expander.finish();
}

}  // namespace warden::tools
