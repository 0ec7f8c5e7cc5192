#pragma once

#include <string>

namespace dastore {

struct Settings {
    std::string backend = "pacman";          // "pacman" or "yay"
    std::string privilege_helper = "pkexec";
    int result_limit = 50;
    int search_delay_ms = 500;
    int min_query_length = 2;
    bool prefer_dark_theme = false;
};

// $XDG_CONFIG_HOME/dastore/dastore.conf
std::string default_settings_path();

// Missing file: defaults. Bad values are reported and replaced by the
// default; a file that fails to parse is reported and ignored.
Settings load_settings(const std::string &path);

// Writes the file, creating its directory. Returns false and fills
// `error` on failure.
bool save_settings(const Settings &settings, const std::string &path, std::string &error);

} // namespace dastore
