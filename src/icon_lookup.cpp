#include "icon_lookup.hpp"

#include <glib.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace dastore {

namespace {

const std::pair<const char *, const char *> CATEGORY_ICONS[] = {
    {"firefox",  "web-browser"},
    {"chromium", "web-browser"},
    {"vlc",      "multimedia-player"},
    {"gimp",     "image-x-generic"},
    {"code",     "text-editor"},
    {"git",      "terminal"},
    {"docker",   "container"},
    {"steam",    "applications-games"},
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_file(const std::string &path) {
    return g_file_test(path.c_str(), G_FILE_TEST_IS_REGULAR);
}

} // anonymous namespace

std::vector<std::string> icon_name_variations(const std::string &name) {
    std::string underscored = name;
    std::replace(underscored.begin(), underscored.end(), '-', '_');

    return {
        name,
        underscored,
        to_lower(name),
        "org." + name,
        "com." + name,
        "io." + name,
    };
}

std::string category_icon(const std::string &package_name) {
    std::string lower = to_lower(package_name);
    for (const auto &entry : CATEGORY_ICONS) {
        if (lower.find(entry.first) != std::string::npos) {
            return entry.second;
        }
    }
    return "";
}

std::string desktop_file_icon(const std::string &path) {
    GKeyFile *key_file = g_key_file_new();
    GError *error = nullptr;
    std::string icon;

    if (g_key_file_load_from_file(key_file, path.c_str(), G_KEY_FILE_NONE, &error)) {
        char *value = g_key_file_get_string(key_file, G_KEY_FILE_DESKTOP_GROUP,
                                            G_KEY_FILE_DESKTOP_KEY_ICON, nullptr);
        if (value) {
            icon = value;
            g_free(value);
        }
    } else {
        g_debug("skipping %s: %s", path.c_str(), error->message);
        g_clear_error(&error);
    }

    g_key_file_free(key_file);
    return icon;
}

IconChoice resolve_package_icon(const std::string &package_name,
                                const ThemeLookup &theme_has_icon,
                                const IconSearchPaths &paths) {
    IconChoice choice;

    auto variations = icon_name_variations(package_name);
    for (const auto &name : variations) {
        if (theme_has_icon(name)) {
            choice.value = name;
            return choice;
        }
    }

    for (const auto &name : variations) {
        for (const auto &dir : paths.icon_dirs) {
            std::string path = dir + "/" + name + ".png";
            if (is_file(path)) {
                choice.kind = IconChoice::Kind::File;
                choice.value = path;
                return choice;
            }
        }
    }

    const std::string desktop_files[] = {
        paths.applications_dir + "/" + package_name + ".desktop",
        paths.applications_dir + "/org." + package_name + ".desktop",
    };
    for (const auto &desktop : desktop_files) {
        if (!is_file(desktop)) continue;

        std::string icon = desktop_file_icon(desktop);
        if (icon.empty()) continue;

        if (g_path_is_absolute(icon.c_str())) {
            if (is_file(icon)) {
                choice.kind = IconChoice::Kind::File;
                choice.value = icon;
                return choice;
            }
        } else if (theme_has_icon(icon)) {
            choice.value = icon;
            return choice;
        }
    }

    std::string category = category_icon(package_name);
    choice.value = category.empty() ? FALLBACK_ICON : category;
    return choice;
}

} // namespace dastore
