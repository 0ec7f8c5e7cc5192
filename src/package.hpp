#pragma once

#include <string>
#include <vector>

namespace dastore {

struct PackageInfo {
    std::string name;
    std::string version;
    std::string description;
    std::string repo;            // e.g., "core", "extra", "aur"
    std::string size;            // download size, as printed by pacman
    std::string installed_size;
    std::string depends;
    std::string url;
    std::string licenses;
    std::string groups;
    bool installed = false;
    bool update_available = false;
    int relevance_score = 0;
};

using PackageList = std::vector<PackageInfo>;

enum class OperationType {
    Install,
    Uninstall,
    Update,
    SystemUpdate,
    QueueInstall,
    CleanOrphans,
};

const char *operation_name(OperationType op);

} // namespace dastore
