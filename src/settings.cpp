#include "settings.hpp"

#include <glib.h>

#include <cerrno>

namespace dastore {

namespace {

constexpr const char *GROUP = "Dastore";

std::string read_string(GKeyFile *key_file, const char *key, const std::string &fallback) {
    char *value = g_key_file_get_string(key_file, GROUP, key, nullptr);
    if (!value) return fallback;
    std::string out = value;
    g_free(value);
    return out;
}

int read_int(GKeyFile *key_file, const char *key, int fallback, int min_value) {
    if (!g_key_file_has_key(key_file, GROUP, key, nullptr)) return fallback;

    GError *error = nullptr;
    int value = g_key_file_get_integer(key_file, GROUP, key, &error);
    if (error) {
        g_warning("config: %s: %s, using %d", key, error->message, fallback);
        g_clear_error(&error);
        return fallback;
    }
    if (value < min_value) {
        g_warning("config: %s=%d is below %d, using %d", key, value, min_value, fallback);
        return fallback;
    }
    return value;
}

bool read_bool(GKeyFile *key_file, const char *key, bool fallback) {
    if (!g_key_file_has_key(key_file, GROUP, key, nullptr)) return fallback;

    GError *error = nullptr;
    gboolean value = g_key_file_get_boolean(key_file, GROUP, key, &error);
    if (error) {
        g_warning("config: %s: %s", key, error->message);
        g_clear_error(&error);
        return fallback;
    }
    return value;
}

} // anonymous namespace

std::string default_settings_path() {
    char *path = g_build_filename(g_get_user_config_dir(), "dastore", "dastore.conf", nullptr);
    std::string out = path;
    g_free(path);
    return out;
}

Settings load_settings(const std::string &path) {
    Settings settings;

    GKeyFile *key_file = g_key_file_new();
    GError *error = nullptr;

    if (!g_key_file_load_from_file(key_file, path.c_str(), G_KEY_FILE_NONE, &error)) {
        if (g_error_matches(error, G_FILE_ERROR, G_FILE_ERROR_NOENT)) {
            g_debug("no config at %s, using defaults", path.c_str());
        } else {
            g_warning("ignoring config %s: %s", path.c_str(), error->message);
        }
        g_clear_error(&error);
        g_key_file_free(key_file);
        return settings;
    }

    std::string backend = read_string(key_file, "backend", settings.backend);
    if (backend == "pacman" || backend == "yay") {
        settings.backend = backend;
    } else {
        g_warning("config: unknown backend '%s', using %s", backend.c_str(), settings.backend.c_str());
    }

    settings.privilege_helper = read_string(key_file, "privilege_helper", settings.privilege_helper);
    settings.result_limit = read_int(key_file, "result_limit", settings.result_limit, 1);
    settings.search_delay_ms = read_int(key_file, "search_delay_ms", settings.search_delay_ms, 0);
    settings.min_query_length = read_int(key_file, "min_query_length", settings.min_query_length, 1);
    settings.prefer_dark_theme = read_bool(key_file, "prefer_dark_theme", settings.prefer_dark_theme);

    g_key_file_free(key_file);
    return settings;
}

bool save_settings(const Settings &settings, const std::string &path, std::string &error) {
    char *dir = g_path_get_dirname(path.c_str());
    if (g_mkdir_with_parents(dir, 0755) != 0) {
        error = std::string("cannot create ") + dir + ": " + g_strerror(errno);
        g_free(dir);
        return false;
    }
    g_free(dir);

    GKeyFile *key_file = g_key_file_new();
    g_key_file_set_string(key_file, GROUP, "backend", settings.backend.c_str());
    g_key_file_set_string(key_file, GROUP, "privilege_helper", settings.privilege_helper.c_str());
    g_key_file_set_integer(key_file, GROUP, "result_limit", settings.result_limit);
    g_key_file_set_integer(key_file, GROUP, "search_delay_ms", settings.search_delay_ms);
    g_key_file_set_integer(key_file, GROUP, "min_query_length", settings.min_query_length);
    g_key_file_set_boolean(key_file, GROUP, "prefer_dark_theme", settings.prefer_dark_theme);

    GError *gerror = nullptr;
    bool ok = g_key_file_save_to_file(key_file, path.c_str(), &gerror);
    if (!ok) {
        error = gerror->message;
        g_clear_error(&gerror);
    }

    g_key_file_free(key_file);
    return ok;
}

} // namespace dastore
