#include "package_parser.hpp"

#include <glib.h>

#include <sstream>

namespace dastore {

namespace {

std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

bool marks_installed(const std::string &rest) {
    return rest.find("[installed") != std::string::npos ||
           rest.find("(installed") != std::string::npos ||
           rest.find("(Installed") != std::string::npos;
}

} // anonymous namespace

PackageList parse_search_output(const std::string &output) {
    PackageList pkgs;

    std::istringstream iss(output);
    std::string line;
    PackageInfo current;
    bool has_package = false;

    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        // Description lines: leading space or tab
        if (line[0] == ' ' || line[0] == '\t') {
            if (has_package && current.description.empty()) {
                current.description = trim(line);
            }
            continue;
        }

        // Header line: "repo/name version [installed]"
        std::istringstream header(line);
        std::string repo_name, version;
        if (!(header >> repo_name >> version)) {
            continue;
        }

        size_t slash_pos = repo_name.find('/');
        if (slash_pos == std::string::npos || slash_pos == 0 ||
            slash_pos + 1 == repo_name.size()) {
            continue;
        }

        if (has_package) {
            pkgs.push_back(current);
        }

        current = PackageInfo{};
        current.repo = repo_name.substr(0, slash_pos);
        current.name = repo_name.substr(slash_pos + 1);
        current.version = version;

        std::string rest;
        std::getline(header, rest);
        current.installed = marks_installed(rest);

        has_package = true;
    }

    if (has_package) {
        pkgs.push_back(current);
    }

    return pkgs;
}

PackageInfo parse_info_output(const std::string &output, const PackageInfo &base) {
    PackageInfo details = base;

    std::istringstream iss(output);
    std::string line;
    std::string *last_field = nullptr;

    while (std::getline(iss, line)) {
        if (line.empty()) {
            last_field = nullptr;
            continue;
        }

        // Wrapped value: indented, belongs to the previous key
        if (line[0] == ' ' || line[0] == '\t') {
            std::string more = trim(line);
            if (last_field && !more.empty()) {
                if (!last_field->empty()) *last_field += "  ";
                *last_field += more;
            }
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            last_field = nullptr;
            continue;
        }

        std::string key = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));
        if (value == "None") value.clear();

        last_field = nullptr;
        if (key == "Description") {
            last_field = &details.description;
        } else if (key == "URL") {
            last_field = &details.url;
        } else if (key == "Licenses") {
            last_field = &details.licenses;
        } else if (key == "Groups") {
            last_field = &details.groups;
        } else if (key == "Download Size") {
            last_field = &details.size;
        } else if (key == "Installed Size") {
            last_field = &details.installed_size;
        } else if (key == "Depends On") {
            last_field = &details.depends;
        } else if (key == "Repository" && details.repo.empty()) {
            last_field = &details.repo;
        } else if (key == "Version" && details.version.empty()) {
            last_field = &details.version;
        }

        if (last_field) {
            *last_field = value;
        }
    }

    return details;
}

std::vector<PendingUpdate> parse_update_list(const std::string &output) {
    std::vector<PendingUpdate> updates;

    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        std::istringstream fields(line);
        PendingUpdate update;
        std::string arrow;
        if (!(fields >> update.name >> update.old_version >> arrow >> update.new_version)) {
            continue;
        }
        if (arrow != "->") continue;
        updates.push_back(update);
    }

    return updates;
}

std::vector<std::string> parse_name_list(const std::string &output) {
    std::vector<std::string> names;

    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        std::string name = trim(line);
        if (name.empty()) continue;
        // "pacman -Q" prints "name version"; keep the name only
        size_t space = name.find_first_of(" \t");
        if (space != std::string::npos) name.resize(space);
        names.push_back(name);
    }

    return names;
}

std::string truncate_text(const std::string &text, size_t max_chars) {
    char *valid = g_utf8_make_valid(text.c_str(), static_cast<gssize>(text.size()));
    std::string result = valid;

    if (static_cast<size_t>(g_utf8_strlen(valid, -1)) > max_chars) {
        const char *end = g_utf8_offset_to_pointer(valid, static_cast<glong>(max_chars));
        result.assign(valid, static_cast<size_t>(end - valid));
        result += "...";
    }
    g_free(valid);
    return result;
}

} // namespace dastore
