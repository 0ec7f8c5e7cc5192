#pragma once

#include <functional>
#include <string>
#include <vector>

namespace dastore {

constexpr const char *FALLBACK_ICON = "package-x-generic";

struct IconChoice {
    enum class Kind { ThemeName, File };
    Kind kind = Kind::ThemeName;
    std::string value;  // icon name or absolute path
};

struct IconSearchPaths {
    std::vector<std::string> icon_dirs = {
        "/usr/share/icons/hicolor/64x64/apps",
        "/usr/share/pixmaps",
    };
    std::string applications_dir = "/usr/share/applications";
};

using ThemeLookup = std::function<bool(const std::string &icon_name)>;

// name, name with '-' -> '_', lowercase, org./com./io. prefixes
std::vector<std::string> icon_name_variations(const std::string &name);

// Generic icon for well-known package families, empty if none.
std::string category_icon(const std::string &package_name);

// Icon= of a desktop file's [Desktop Entry] group, empty if unreadable.
std::string desktop_file_icon(const std::string &path);

// Theme name, its variations, PNGs on disk, desktop files, category,
// then FALLBACK_ICON.
IconChoice resolve_package_icon(const std::string &package_name,
                                const ThemeLookup &theme_has_icon,
                                const IconSearchPaths &paths = IconSearchPaths());

} // namespace dastore
