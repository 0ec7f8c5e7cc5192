#include "desktop_entry.hpp"

#include <glib.h>

namespace dastore {

std::string render_desktop_entry(const DesktopEntry &entry) {
    GKeyFile *key_file = g_key_file_new();
    const char *group = G_KEY_FILE_DESKTOP_GROUP;

    g_key_file_set_string(key_file, group, G_KEY_FILE_DESKTOP_KEY_TYPE, entry.type.c_str());
    g_key_file_set_string(key_file, group, G_KEY_FILE_DESKTOP_KEY_NAME, entry.name.c_str());
    g_key_file_set_string(key_file, group, G_KEY_FILE_DESKTOP_KEY_COMMENT, entry.comment.c_str());
    g_key_file_set_string(key_file, group, G_KEY_FILE_DESKTOP_KEY_EXEC, entry.exec.c_str());
    g_key_file_set_string(key_file, group, G_KEY_FILE_DESKTOP_KEY_ICON, entry.icon.c_str());
    // Already a ';'-terminated list; set_string keeps it verbatim.
    g_key_file_set_string(key_file, group, G_KEY_FILE_DESKTOP_KEY_CATEGORIES, entry.categories.c_str());
    g_key_file_set_boolean(key_file, group, G_KEY_FILE_DESKTOP_KEY_TERMINAL, entry.terminal);

    gsize length = 0;
    char *data = g_key_file_to_data(key_file, &length, nullptr);
    std::string out(data, length);
    g_free(data);
    g_key_file_free(key_file);
    return out;
}

} // namespace dastore
