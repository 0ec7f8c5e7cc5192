#pragma once

#include "backend.hpp"
#include "package.hpp"
#include "process.hpp"

#include <string>
#include <vector>

namespace dastore {

// Result of a search operation
struct SearchResult {
    PackageList packages;
    std::string error;  // Empty if no error

    bool has_error() const { return !error.empty(); }
};

// Read-only queries against the package databases. Transactions are run by
// Transaction; this class only builds their inputs.
class PackageManager {
public:
    PackageManager(const Backend &backend, CommandRunner &runner)
        : backend_(backend), runner_(runner) {}

    // Search, mark installed packages, score and sort best first.
    SearchResult search_packages(const std::string &query);

    // Fill in the `-Si` fields. Returns `pkg` unchanged when the lookup fails.
    PackageInfo get_package_details(const PackageInfo &pkg);

    // One local-database query for all names.
    void refresh_installed(PackageList &packages);

    // Set update_available on installed packages with a pending upgrade.
    void mark_updates(PackageList &packages);

    std::vector<std::string> list_orphans();

    const Backend &backend() const { return backend_; }

private:
    const Backend &backend_;
    CommandRunner &runner_;
};

} // namespace dastore
