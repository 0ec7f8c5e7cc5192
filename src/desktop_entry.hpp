#pragma once

#include <string>

namespace dastore {

struct DesktopEntry {
    std::string type = "Application";
    std::string name = "Dastore";
    std::string comment = "A graphical package manager for Arch Linux";
    std::string exec;
    std::string icon;
    std::string categories = "System;PackageManager;";
    bool terminal = false;
};

// [Desktop Entry] key file, keys in the order Type, Name, Comment, Exec,
// Icon, Categories, Terminal.
std::string render_desktop_entry(const DesktopEntry &entry);

} // namespace dastore
