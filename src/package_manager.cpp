#include "package_manager.hpp"
#include "package_parser.hpp"
#include "relevance.hpp"

#include <glib.h>

#include <set>

namespace dastore {

namespace {

std::string first_line(const std::string &text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find('\n', start);
    std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
    return line;
}

bool too_many_results(const std::string &text) {
    return text.find("Query arg too small") != std::string::npos ||
           text.find("Too many package results") != std::string::npos;
}

} // anonymous namespace

SearchResult PackageManager::search_packages(const std::string &query) {
    SearchResult result;

    if (query.empty()) {
        return result;
    }

    CommandResult r = runner_.capture(backend_.search_command(query));
    if (!r.error.empty()) {
        g_warning("search for '%s' failed to start: %s", query.c_str(), r.error.c_str());
        result.error = r.error;
        return result;
    }

    std::string out = strip_ansi_and_osc(r.out);
    std::string err = strip_ansi_and_osc(r.err);

    if (too_many_results(out) || too_many_results(err)) {
        result.error = "Too many results! Try a more specific search.";
        return result;
    }

    result.packages = parse_search_output(out);

    // pacman exits 1 with no output when nothing matches; anything on
    // stderr is a real failure (bad regex, locked database, ...).
    if (r.exit_code != 0 && result.packages.empty()) {
        std::string reason = first_line(err);
        if (!reason.empty()) {
            g_warning("%s search failed (%d): %s",
                      backend_.name().c_str(), r.exit_code, reason.c_str());
            result.error = reason;
        }
        return result;
    }

    refresh_installed(result.packages);
    sort_by_relevance(result.packages, query);

    g_debug("search '%s': %zu packages", query.c_str(), result.packages.size());
    return result;
}

PackageInfo PackageManager::get_package_details(const PackageInfo &pkg) {
    CommandResult r = runner_.capture(backend_.info_command(pkg.name));
    if (!r.ok()) {
        g_warning("no details for %s: %s", pkg.name.c_str(),
                  r.error.empty() ? first_line(r.err).c_str() : r.error.c_str());
        return pkg;
    }

    PackageInfo details = parse_info_output(strip_ansi_and_osc(r.out), pkg);

    if (details.installed) {
        PackageList one = {details};
        mark_updates(one);
        details.update_available = one.front().update_available;
    }

    return details;
}

void PackageManager::refresh_installed(PackageList &packages) {
    if (packages.empty()) return;

    std::vector<std::string> names;
    names.reserve(packages.size());
    for (const auto &pkg : packages) {
        names.push_back(pkg.name);
    }

    // Exit status is 1 whenever one name is missing; stdout is still valid.
    CommandResult r = runner_.capture(backend_.installed_command(names));
    if (!r.error.empty()) {
        g_warning("installed check failed: %s", r.error.c_str());
        return;
    }

    auto installed_names = parse_name_list(r.out);
    std::set<std::string> installed(installed_names.begin(), installed_names.end());

    for (auto &pkg : packages) {
        pkg.installed = installed.count(pkg.name) > 0;
    }
}

void PackageManager::mark_updates(PackageList &packages) {
    std::vector<std::string> names;
    for (const auto &pkg : packages) {
        if (pkg.installed) names.push_back(pkg.name);
    }
    if (names.empty()) return;

    Argv argv = backend_.updates_command();
    argv.insert(argv.end(), names.begin(), names.end());

    // Exit status 1 means "nothing to upgrade".
    CommandResult r = runner_.capture(argv);
    if (!r.error.empty()) {
        g_warning("update check failed: %s", r.error.c_str());
        return;
    }

    std::set<std::string> upgradable;
    for (const auto &update : parse_update_list(r.out)) {
        upgradable.insert(update.name);
    }

    for (auto &pkg : packages) {
        pkg.update_available = pkg.installed && upgradable.count(pkg.name) > 0;
    }
}

std::vector<std::string> PackageManager::list_orphans() {
    CommandResult r = runner_.capture(backend_.orphans_command());
    if (!r.error.empty()) {
        g_warning("orphan query failed: %s", r.error.c_str());
        return {};
    }
    return parse_name_list(r.out);
}

} // namespace dastore
