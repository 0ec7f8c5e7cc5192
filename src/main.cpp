#include "ui.hpp"

#include <utility>

using dastore::OperationType;
using dastore::PackageInfo;

DastoreApp *g_app = nullptr;

namespace {

constexpr int NOTIFICATION_SECONDS = 3;

const std::pair<const char *, const char *> FEATURES[] = {
    {"Search Packages", "Find and install packages from official repositories"},
    {"Quick Install", "Install packages with a single click"},
    {"Queue Management", "Queue multiple packages for batch installation"},
    {"System Update", "Update your system with one click"},
    {"Smart Search", "Relevant results with intelligent scoring"},
};

void add_class(GtkWidget *widget, const char *css_class) {
    gtk_style_context_add_class(gtk_widget_get_style_context(widget), css_class);
}

void set_status(const std::string &text) {
    gtk_label_set_text(GTK_LABEL(g_app->status_label), text.c_str());
    gtk_widget_show(g_app->status_label);
}

std::string trimmed(const char *text) {
    std::string s = text ? text : "";
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

void show_home() {
    ++g_app->search_generation;
    g_app->current_query.clear();
    g_app->packages.clear();
    clear_list(g_app->results_list);
    gtk_stack_set_visible_child_name(GTK_STACK(g_app->stack), "home");
}

// Icon shipped next to the binary in the install directory.
std::string executable_icon_path() {
    GError *error = nullptr;
    char *exe = g_file_read_link("/proc/self/exe", &error);
    if (!exe) {
        g_debug("cannot resolve executable: %s", error->message);
        g_clear_error(&error);
        return {};
    }
    char *dir = g_path_get_dirname(exe);
    char *icon = g_build_filename(dir, "dastore.png", nullptr);
    std::string path = icon;
    g_free(icon);
    g_free(dir);
    g_free(exe);
    return path;
}

} // anonymous namespace

// ───────────────────────────────────────────────
//  Notifications and dialogs
// ───────────────────────────────────────────────

extern "C" gboolean on_info_timeout(gpointer user_data) {
    (void)user_data;
    gtk_widget_hide(g_app->info_bar);
    g_app->info_timer = 0;
    return G_SOURCE_REMOVE;
}

extern "C" void on_info_bar_response(GtkInfoBar *bar, gint response, gpointer user_data) {
    (void)response;
    (void)user_data;
    gtk_widget_hide(GTK_WIDGET(bar));
}

void show_notification(const std::string &message) {
    gtk_label_set_text(GTK_LABEL(g_app->info_label), message.c_str());
    gtk_widget_show(g_app->info_bar);

    if (g_app->info_timer) {
        g_source_remove(g_app->info_timer);
    }
    g_app->info_timer = g_timeout_add_seconds(NOTIFICATION_SECONDS, on_info_timeout, nullptr);
}

void show_error(GtkWindow *parent, const std::string &message) {
    GtkWidget *dialog = gtk_message_dialog_new(
        parent,
        GTK_DIALOG_MODAL,
        GTK_MESSAGE_ERROR,
        GTK_BUTTONS_OK,
        "%s",
        message.c_str()
    );
    gtk_dialog_run(GTK_DIALOG(dialog));
    gtk_widget_destroy(dialog);
}

bool confirm(GtkWindow *parent, const std::string &question) {
    GtkWidget *dialog = gtk_message_dialog_new(
        parent,
        GTK_DIALOG_MODAL,
        GTK_MESSAGE_QUESTION,
        GTK_BUTTONS_YES_NO,
        "%s",
        question.c_str()
    );
    gint response = gtk_dialog_run(GTK_DIALOG(dialog));
    gtk_widget_destroy(dialog);
    return response == GTK_RESPONSE_YES;
}

// ───────────────────────────────────────────────
//  Search
// ───────────────────────────────────────────────

void populate_results(const dastore::PackageList &pkgs) {
    clear_list(g_app->results_list);

    size_t limit = static_cast<size_t>(g_app->settings.result_limit);
    size_t count = 0;
    for (const auto &pkg : pkgs) {
        if (count++ >= limit) break;
        gtk_container_add(GTK_CONTAINER(g_app->results_list), create_package_row(pkg, true));
    }
}

void perform_search(const std::string &query) {
    g_app->current_query = query;
    gtk_stack_set_visible_child_name(GTK_STACK(g_app->stack), "packages");
    set_status("Searching for '" + query + "'...");

    // Results of an older search are dropped when they arrive late.
    unsigned generation = ++g_app->search_generation;
    dastore::PackageManager *manager = g_app->manager.get();

    g_app->async.run<dastore::SearchResult>(
        [manager, query]() { return manager->search_packages(query); },
        [generation](dastore::SearchResult result, const std::string &error) {
            if (generation != g_app->search_generation) return;

            if (!error.empty()) result.error = error;
            if (result.has_error()) {
                set_status("Search error: " + result.error);
                return;
            }

            g_app->packages = std::move(result.packages);
            populate_results(g_app->packages);

            if (g_app->packages.empty()) {
                set_status("No packages found");
            } else {
                gtk_widget_hide(g_app->status_label);
            }
        });
}

void refresh_search() {
    if (!g_app->current_query.empty()) {
        perform_search(g_app->current_query);
    }
}

extern "C" gboolean on_search_timeout(gpointer user_data) {
    (void)user_data;
    g_app->search_timer = 0;

    perform_search(trimmed(gtk_entry_get_text(GTK_ENTRY(g_app->search_entry))));
    return G_SOURCE_REMOVE;
}

extern "C" void on_search_changed(GtkSearchEntry *entry, gpointer user_data) {
    (void)user_data;
    if (g_app->search_timer) {
        g_source_remove(g_app->search_timer);
        g_app->search_timer = 0;
    }

    std::string query = trimmed(gtk_entry_get_text(GTK_ENTRY(entry)));
    if (query.length() < static_cast<size_t>(g_app->settings.min_query_length)) {
        show_home();
        return;
    }

    g_app->search_timer = g_timeout_add(static_cast<guint>(g_app->settings.search_delay_ms),
                                        on_search_timeout, nullptr);
}

extern "C" void on_result_activated(GtkListBox *list, GtkListBoxRow *row, gpointer user_data) {
    (void)list;
    (void)user_data;
    const PackageInfo *row_pkg = row_package(row);
    if (!row_pkg) return;

    PackageInfo pkg = *row_pkg;
    dastore::PackageManager *manager = g_app->manager.get();

    g_app->async.run<PackageInfo>(
        [manager, pkg]() { return manager->get_package_details(pkg); },
        [](PackageInfo details, const std::string &error) {
            if (!error.empty()) {
                show_notification("Error: " + error);
                return;
            }
            show_package_details(details);
        });
}

// ───────────────────────────────────────────────
//  Menu actions
// ───────────────────────────────────────────────

extern "C" void on_update_system(GSimpleAction *action, GVariant *parameter, gpointer user_data) {
    (void)action;
    (void)parameter;
    (void)user_data;
    if (confirm(GTK_WINDOW(g_app->window), "Do you want to update all packages?")) {
        show_progress_window(OperationType::SystemUpdate, {});
    }
}

extern "C" void on_clean_orphans(GSimpleAction *action, GVariant *parameter, gpointer user_data) {
    (void)action;
    (void)parameter;
    (void)user_data;
    start_orphan_cleanup();
}

extern "C" void on_about(GSimpleAction *action, GVariant *parameter, gpointer user_data) {
    (void)action;
    (void)parameter;
    (void)user_data;
    const char *authors[] = {"Ali Safamanesh", nullptr};
    gtk_show_about_dialog(
        GTK_WINDOW(g_app->window),
        "program-name", "Dastore",
        "version", DASTORE_VERSION,
        "comments", "A modern package manager for Arch Linux",
        "website", "https://daradege.ir",
        "authors", authors,
        "license-type", GTK_LICENSE_GPL_3_0,
        "logo-icon-name", "system-software-install",
        nullptr
    );
}

extern "C" void on_queue_clicked(GtkWidget *button, gpointer user_data) {
    (void)button;
    (void)user_data;
    show_queue_dialog();
}

// ───────────────────────────────────────────────
//  App setup
// ───────────────────────────────────────────────

GtkWidget *build_home_page() {
    GtkWidget *box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 24);
    gtk_widget_set_valign(box, GTK_ALIGN_CENTER);
    gtk_widget_set_halign(box, GTK_ALIGN_CENTER);
    gtk_widget_set_size_request(box, 600, -1);

    GtkWidget *title = gtk_label_new(nullptr);
    gtk_label_set_markup(GTK_LABEL(title), "<span size='xx-large' weight='bold'>Dastore</span>");
    gtk_box_pack_start(GTK_BOX(box), title, FALSE, FALSE, 0);

    GtkWidget *subtitle = gtk_label_new(nullptr);
    gtk_label_set_markup(GTK_LABEL(subtitle), "<span size='large'>Package Manager for Arch Linux</span>");
    add_class(subtitle, "dim-label");
    gtk_box_pack_start(GTK_BOX(box), subtitle, FALSE, FALSE, 0);

    GtkWidget *features = gtk_grid_new();
    gtk_grid_set_row_spacing(GTK_GRID(features), 12);
    gtk_grid_set_column_spacing(GTK_GRID(features), 12);
    gtk_widget_set_margin_top(features, 24);
    gtk_widget_set_margin_bottom(features, 24);
    int row = 0;
    for (const auto &feature : FEATURES) {
        GtkWidget *name = gtk_label_new(nullptr);
        char *markup = g_markup_printf_escaped("<b>%s</b>", feature.first);
        gtk_label_set_markup(GTK_LABEL(name), markup);
        g_free(markup);
        gtk_label_set_xalign(GTK_LABEL(name), 0.0);

        GtkWidget *desc = gtk_label_new(feature.second);
        gtk_label_set_xalign(GTK_LABEL(desc), 0.0);
        add_class(desc, "dim-label");

        gtk_grid_attach(GTK_GRID(features), name, 0, row, 1, 1);
        gtk_grid_attach(GTK_GRID(features), desc, 1, row, 1, 1);
        row++;
    }
    gtk_box_pack_start(GTK_BOX(box), features, FALSE, FALSE, 0);

    return box;
}

GtkWidget *build_packages_page() {
    GtkWidget *vbox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);

    g_app->status_label = gtk_label_new("Search for packages...");
    gtk_label_set_xalign(GTK_LABEL(g_app->status_label), 0.0);
    gtk_widget_set_margin_start(g_app->status_label, 12);
    gtk_widget_set_margin_top(g_app->status_label, 6);
    gtk_box_pack_start(GTK_BOX(vbox), g_app->status_label, FALSE, FALSE, 0);

    g_app->results_list = gtk_list_box_new();
    gtk_list_box_set_selection_mode(GTK_LIST_BOX(g_app->results_list), GTK_SELECTION_NONE);
    gtk_list_box_set_activate_on_single_click(GTK_LIST_BOX(g_app->results_list), TRUE);
    g_signal_connect(g_app->results_list, "row-activated", G_CALLBACK(on_result_activated), nullptr);

    GtkWidget *scroll = gtk_scrolled_window_new(nullptr, nullptr);
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroll),
                                   GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);
    gtk_container_add(GTK_CONTAINER(scroll), g_app->results_list);
    gtk_box_pack_start(GTK_BOX(vbox), scroll, TRUE, TRUE, 0);

    return vbox;
}

void install_actions(GtkApplication *app) {
    static const GActionEntry actions[] = {
        {"update_system", on_update_system, nullptr, nullptr, nullptr, {0, 0, 0}},
        {"clean_orphans", on_clean_orphans, nullptr, nullptr, nullptr, {0, 0, 0}},
        {"about", on_about, nullptr, nullptr, nullptr, {0, 0, 0}},
    };
    g_action_map_add_action_entries(G_ACTION_MAP(app), actions, G_N_ELEMENTS(actions), nullptr);
}

static void activate(GtkApplication *app, gpointer) {
    if (g_app->window) {
        gtk_window_present(GTK_WINDOW(g_app->window));
        return;
    }

    if (g_app->settings.prefer_dark_theme) {
        g_object_set(gtk_settings_get_default(), "gtk-application-prefer-dark-theme", TRUE, nullptr);
    }

    g_app->window = gtk_application_window_new(app);
    gtk_window_set_title(GTK_WINDOW(g_app->window), "Dastore");
    gtk_window_set_default_size(GTK_WINDOW(g_app->window), 1000, 700);

    std::string icon = executable_icon_path();
    if (!icon.empty() && g_file_test(icon.c_str(), G_FILE_TEST_EXISTS)) {
        GError *error = nullptr;
        if (!gtk_window_set_icon_from_file(GTK_WINDOW(g_app->window), icon.c_str(), &error)) {
            g_debug("cannot load window icon: %s", error->message);
            g_clear_error(&error);
        }
    }

    // Header bar: search, queue and menu
    GtkWidget *header = gtk_header_bar_new();
    gtk_header_bar_set_show_close_button(GTK_HEADER_BAR(header), TRUE);

    g_app->search_entry = gtk_search_entry_new();
    gtk_entry_set_placeholder_text(GTK_ENTRY(g_app->search_entry), "Search packages...");
    gtk_widget_set_size_request(g_app->search_entry, 400, -1);
    g_signal_connect(g_app->search_entry, "search-changed", G_CALLBACK(on_search_changed), nullptr);
    gtk_header_bar_set_custom_title(GTK_HEADER_BAR(header), g_app->search_entry);

    GMenu *menu = g_menu_new();
    g_menu_append(menu, "Update System", "app.update_system");
    g_menu_append(menu, "Clean Orphans", "app.clean_orphans");
    g_menu_append(menu, "About", "app.about");

    GtkWidget *menu_button = gtk_menu_button_new();
    gtk_button_set_image(GTK_BUTTON(menu_button),
                         gtk_image_new_from_icon_name("open-menu-symbolic", GTK_ICON_SIZE_BUTTON));
    gtk_menu_button_set_menu_model(GTK_MENU_BUTTON(menu_button), G_MENU_MODEL(menu));
    g_object_unref(menu);
    gtk_header_bar_pack_end(GTK_HEADER_BAR(header), menu_button);

    GtkWidget *queue_button = gtk_button_new_from_icon_name("view-list-symbolic", GTK_ICON_SIZE_BUTTON);
    gtk_widget_set_tooltip_text(queue_button, "Install queue");
    g_signal_connect(queue_button, "clicked", G_CALLBACK(on_queue_clicked), nullptr);
    gtk_header_bar_pack_end(GTK_HEADER_BAR(header), queue_button);

    gtk_window_set_titlebar(GTK_WINDOW(g_app->window), header);

    GtkWidget *vbox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
    gtk_container_add(GTK_CONTAINER(g_app->window), vbox);

    // Notifications
    g_app->info_bar = gtk_info_bar_new();
    gtk_info_bar_set_show_close_button(GTK_INFO_BAR(g_app->info_bar), TRUE);
    g_app->info_label = gtk_label_new("");
    gtk_container_add(GTK_CONTAINER(gtk_info_bar_get_content_area(GTK_INFO_BAR(g_app->info_bar))),
                      g_app->info_label);
    g_signal_connect(g_app->info_bar, "response", G_CALLBACK(on_info_bar_response), nullptr);
    gtk_box_pack_start(GTK_BOX(vbox), g_app->info_bar, FALSE, FALSE, 0);

    g_app->stack = gtk_stack_new();
    gtk_stack_set_transition_type(GTK_STACK(g_app->stack), GTK_STACK_TRANSITION_TYPE_CROSSFADE);
    gtk_stack_add_named(GTK_STACK(g_app->stack), build_home_page(), "home");
    gtk_stack_add_named(GTK_STACK(g_app->stack), build_packages_page(), "packages");
    gtk_box_pack_start(GTK_BOX(vbox), g_app->stack, TRUE, TRUE, 0);

    gtk_widget_show_all(g_app->window);
    gtk_widget_hide(g_app->info_bar);
    gtk_stack_set_visible_child_name(GTK_STACK(g_app->stack), "home");
}

static void on_shutdown(GApplication *app, gpointer) {
    (void)app;
    g_app->async.shutdown();
}

static void load_configuration(DastoreApp &state) {
    std::string path = dastore::default_settings_path();
    state.settings = dastore::load_settings(path);

    if (!g_file_test(path.c_str(), G_FILE_TEST_EXISTS)) {
        std::string error;
        if (!dastore::save_settings(state.settings, path, error)) {
            g_warning("%s", error.c_str());
        }
    }

    state.backend = dastore::create_backend(state.settings.backend, state.settings.privilege_helper);
    if (!state.backend) {
        g_warning("unknown backend '%s', using pacman", state.settings.backend.c_str());
        state.backend = dastore::create_backend("pacman", state.settings.privilege_helper);
    }
    state.manager = std::make_unique<dastore::PackageManager>(*state.backend, state.runner);
}

int main(int argc, char **argv) {
    DastoreApp state;
    g_app = &state;
    load_configuration(state);

    GtkApplication *app = gtk_application_new(
        "com.daradege.dastore",
        G_APPLICATION_DEFAULT_FLAGS
    );
    state.application = app;
    install_actions(app);
    g_signal_connect(app, "activate", G_CALLBACK(activate), nullptr);
    g_signal_connect(app, "shutdown", G_CALLBACK(on_shutdown), nullptr);
    int status = g_application_run(G_APPLICATION(app), argc, argv);
    g_object_unref(app);

    g_app = nullptr;
    return status;
}
