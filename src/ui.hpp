#pragma once

#include "async_runner.hpp"
#include "backend.hpp"
#include "package.hpp"
#include "package_manager.hpp"
#include "package_queue.hpp"
#include "process.hpp"
#include "settings.hpp"

#include <gtk/gtk.h>

#include <memory>
#include <string>
#include <vector>

// ───────────────────────────────────────────────
//  Application state (main loop only)
// ───────────────────────────────────────────────

struct DastoreApp {
    GtkApplication *application = nullptr;
    GtkWidget *window = nullptr;
    GtkWidget *search_entry = nullptr;
    GtkWidget *stack = nullptr;
    GtkWidget *status_label = nullptr;
    GtkWidget *results_list = nullptr;
    GtkWidget *info_bar = nullptr;
    GtkWidget *info_label = nullptr;

    guint search_timer = 0;
    guint info_timer = 0;
    unsigned search_generation = 0;
    std::string current_query;

    dastore::Settings settings;
    dastore::SpawnRunner runner;
    dastore::BackendPtr backend;
    std::unique_ptr<dastore::PackageManager> manager;
    dastore::PackageQueue queue;
    dastore::AsyncRunner async;
    dastore::PackageList packages;
};

extern DastoreApp *g_app;

// main.cpp
void perform_search(const std::string &query);
void refresh_search();
void show_notification(const std::string &message);
void show_error(GtkWindow *parent, const std::string &message);
bool confirm(GtkWindow *parent, const std::string &question);

// ui_package_row.cpp
GtkWidget *create_package_icon(const std::string &package_name);
GtkWidget *create_package_row(const dastore::PackageInfo &pkg, bool queue_button);
const dastore::PackageInfo *row_package(GtkListBoxRow *row);
void clear_list(GtkWidget *list_box);

// ui_dialogs.cpp
void show_package_details(const dastore::PackageInfo &pkg);
void show_queue_dialog();
void start_orphan_cleanup();

// ui_progress_window.cpp
void show_progress_window(dastore::OperationType op,
                          const std::vector<std::string> &targets,
                          const std::string &package_name = "");
