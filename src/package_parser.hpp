#pragma once

#include "package.hpp"

#include <string>
#include <vector>

namespace dastore {

// Parse `pacman -Ss` / `yay -Ss` output (escape sequences already stripped):
//   repo/name version [installed]
//       description
PackageList parse_search_output(const std::string &output);

// Merge `pacman -Si` fields into a copy of `base`.
PackageInfo parse_info_output(const std::string &output, const PackageInfo &base);

struct PendingUpdate {
    std::string name;
    std::string old_version;
    std::string new_version;
};

// `pacman -Qu`: "name old -> new"
std::vector<PendingUpdate> parse_update_list(const std::string &output);

// Cut `text` to `max_chars` UTF-8 characters, adding "..." when cut.
// Invalid sequences are replaced before counting.
std::string truncate_text(const std::string &text, size_t max_chars);

// One package name per line (`pacman -Qq`, `pacman -Qdtq`).
std::vector<std::string> parse_name_list(const std::string &output);

} // namespace dastore
