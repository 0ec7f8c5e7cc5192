#include "ui.hpp"

#include <memory>

using dastore::OperationType;
using dastore::PackageInfo;

namespace {

enum DetailResponse {
    RESPONSE_INSTALL = 1,
    RESPONSE_QUEUE,
    RESPONSE_UNINSTALL,
    RESPONSE_UPDATE,
};

void add_class(GtkWidget *widget, const char *css_class) {
    gtk_style_context_add_class(gtk_widget_get_style_context(widget), css_class);
}

void add_info_row(GtkWidget *grid, int &row, const char *title, const std::string &value) {
    if (value.empty()) return;

    GtkWidget *key = gtk_label_new(title);
    gtk_label_set_xalign(GTK_LABEL(key), 0.0);
    add_class(key, "dim-label");

    GtkWidget *val = gtk_label_new(value.c_str());
    gtk_label_set_xalign(GTK_LABEL(val), 0.0);
    gtk_label_set_line_wrap(GTK_LABEL(val), TRUE);
    gtk_label_set_selectable(GTK_LABEL(val), TRUE);
    gtk_widget_set_hexpand(val, TRUE);

    gtk_grid_attach(GTK_GRID(grid), key, 0, row, 1, 1);
    gtk_grid_attach(GTK_GRID(grid), val, 1, row, 1, 1);
    row++;
}

} // anonymous namespace

// ───────────────────────────────────────────────
//  Package details
// ───────────────────────────────────────────────

void show_package_details(const PackageInfo &pkg) {
    GtkWidget *dialog = gtk_dialog_new();
    gtk_window_set_title(GTK_WINDOW(dialog), pkg.name.c_str());
    gtk_window_set_transient_for(GTK_WINDOW(dialog), GTK_WINDOW(g_app->window));
    gtk_window_set_modal(GTK_WINDOW(dialog), TRUE);
    gtk_window_set_default_size(GTK_WINDOW(dialog), 600, 500);

    GtkWidget *content = gtk_dialog_get_content_area(GTK_DIALOG(dialog));

    GtkWidget *scroll = gtk_scrolled_window_new(nullptr, nullptr);
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroll),
                                   GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);
    gtk_widget_set_vexpand(scroll, TRUE);
    gtk_box_pack_start(GTK_BOX(content), scroll, TRUE, TRUE, 0);

    GtkWidget *inner = gtk_box_new(GTK_ORIENTATION_VERTICAL, 12);
    gtk_widget_set_margin_start(inner, 24);
    gtk_widget_set_margin_end(inner, 24);
    gtk_widget_set_margin_top(inner, 24);
    gtk_widget_set_margin_bottom(inner, 24);
    gtk_container_add(GTK_CONTAINER(scroll), inner);

    GtkWidget *name_label = gtk_label_new(nullptr);
    char *markup = g_markup_printf_escaped("<span size='xx-large' weight='bold'>%s</span>",
                                           pkg.name.c_str());
    gtk_label_set_markup(GTK_LABEL(name_label), markup);
    g_free(markup);
    gtk_label_set_xalign(GTK_LABEL(name_label), 0.0);
    gtk_box_pack_start(GTK_BOX(inner), name_label, FALSE, FALSE, 0);

    std::string version_text = "Version: " + pkg.version;
    GtkWidget *version_label = gtk_label_new(version_text.c_str());
    gtk_label_set_xalign(GTK_LABEL(version_label), 0.0);
    add_class(version_label, "dim-label");
    gtk_box_pack_start(GTK_BOX(inner), version_label, FALSE, FALSE, 0);

    if (!pkg.description.empty()) {
        GtkWidget *desc_label = gtk_label_new(pkg.description.c_str());
        gtk_label_set_line_wrap(GTK_LABEL(desc_label), TRUE);
        gtk_label_set_xalign(GTK_LABEL(desc_label), 0.0);
        gtk_widget_set_margin_top(desc_label, 12);
        gtk_box_pack_start(GTK_BOX(inner), desc_label, FALSE, FALSE, 0);
    }

    GtkWidget *frame = gtk_frame_new("Information");
    gtk_widget_set_margin_top(frame, 24);
    GtkWidget *grid = gtk_grid_new();
    gtk_grid_set_row_spacing(GTK_GRID(grid), 6);
    gtk_grid_set_column_spacing(GTK_GRID(grid), 24);
    gtk_container_set_border_width(GTK_CONTAINER(grid), 12);
    int row = 0;
    add_info_row(grid, row, "Repository", pkg.repo);
    add_info_row(grid, row, "Download Size", pkg.size);
    add_info_row(grid, row, "Installed Size", pkg.installed_size);
    add_info_row(grid, row, "License", pkg.licenses);
    add_info_row(grid, row, "Groups", pkg.groups);
    add_info_row(grid, row, "URL", pkg.url);
    add_info_row(grid, row, "Depends On", pkg.depends);
    gtk_container_add(GTK_CONTAINER(frame), grid);
    gtk_box_pack_start(GTK_BOX(inner), frame, FALSE, FALSE, 0);

    if (!pkg.installed) {
        GtkWidget *install = gtk_dialog_add_button(GTK_DIALOG(dialog), "Install", RESPONSE_INSTALL);
        add_class(install, "suggested-action");
        gtk_dialog_add_button(GTK_DIALOG(dialog), "Add to Queue", RESPONSE_QUEUE);
    } else {
        if (pkg.update_available) {
            GtkWidget *update = gtk_dialog_add_button(GTK_DIALOG(dialog), "Update", RESPONSE_UPDATE);
            add_class(update, "suggested-action");
        }
        GtkWidget *uninstall = gtk_dialog_add_button(GTK_DIALOG(dialog), "Uninstall", RESPONSE_UNINSTALL);
        add_class(uninstall, "destructive-action");
    }
    gtk_dialog_add_button(GTK_DIALOG(dialog), "Close", GTK_RESPONSE_CLOSE);

    gtk_widget_show_all(dialog);
    gint response = gtk_dialog_run(GTK_DIALOG(dialog));
    gtk_widget_destroy(dialog);

    switch (response) {
        case RESPONSE_INSTALL:
            show_progress_window(OperationType::Install, {pkg.name}, pkg.name);
            break;
        case RESPONSE_UNINSTALL:
            show_progress_window(OperationType::Uninstall, {pkg.name}, pkg.name);
            break;
        case RESPONSE_UPDATE:
            show_progress_window(OperationType::Update, {pkg.name}, pkg.name);
            break;
        case RESPONSE_QUEUE:
            if (g_app->queue.add(pkg)) {
                show_notification("Added " + pkg.name + " to queue");
            } else {
                show_notification(pkg.name + " is already queued");
            }
            break;
        default:
            break;
    }
}

// ───────────────────────────────────────────────
//  Install queue
// ───────────────────────────────────────────────

namespace {

struct QueueDialog {
    GtkWidget *window = nullptr;
    GtkWidget *list = nullptr;
    GtkWidget *install_button = nullptr;
    unsigned listener_id = 0;
};

QueueDialog *g_queue_dialog = nullptr;

void update_queue_list(QueueDialog *qd) {
    clear_list(qd->list);
    for (const auto &pkg : g_app->queue.packages()) {
        gtk_container_add(GTK_CONTAINER(qd->list), create_package_row(pkg, false));
    }
    gtk_widget_set_sensitive(qd->install_button, !g_app->queue.empty());
}

} // anonymous namespace

extern "C" void on_queue_row_activated(GtkListBox *list, GtkListBoxRow *row, gpointer user_data) {
    (void)list;
    (void)user_data;
    const PackageInfo *pkg = row_package(row);
    if (!pkg) return;
    // Copy: removing rebuilds the list and frees the row's package.
    std::string name = pkg->name;
    g_app->queue.remove(name);
}

extern "C" void on_queue_install_clicked(GtkWidget *button, gpointer user_data) {
    (void)button;
    auto *qd = static_cast<QueueDialog *>(user_data);
    if (g_app->queue.empty()) return;

    std::vector<std::string> names = g_app->queue.names();
    gtk_widget_destroy(qd->window);
    show_progress_window(OperationType::QueueInstall, names);
}

extern "C" void on_queue_clear_clicked(GtkWidget *button, gpointer user_data) {
    (void)button;
    (void)user_data;
    g_app->queue.clear();
}

extern "C" void on_queue_dialog_destroy(GtkWidget *window, gpointer user_data) {
    (void)window;
    std::unique_ptr<QueueDialog> qd(static_cast<QueueDialog *>(user_data));
    g_app->queue.remove_listener(qd->listener_id);
    if (g_queue_dialog == qd.get()) g_queue_dialog = nullptr;
}

void show_queue_dialog() {
    if (g_queue_dialog) {
        gtk_window_present(GTK_WINDOW(g_queue_dialog->window));
        return;
    }

    QueueDialog *qd = std::make_unique<QueueDialog>().release();
    g_queue_dialog = qd;

    qd->window = gtk_window_new(GTK_WINDOW_TOPLEVEL);
    gtk_window_set_transient_for(GTK_WINDOW(qd->window), GTK_WINDOW(g_app->window));
    gtk_window_set_default_size(GTK_WINDOW(qd->window), 600, 500);
    g_signal_connect(qd->window, "destroy", G_CALLBACK(on_queue_dialog_destroy), qd);

    GtkWidget *header = gtk_header_bar_new();
    gtk_header_bar_set_title(GTK_HEADER_BAR(header), "Install Queue");
    gtk_header_bar_set_show_close_button(GTK_HEADER_BAR(header), TRUE);
    gtk_window_set_titlebar(GTK_WINDOW(qd->window), header);

    GtkWidget *content = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
    gtk_container_add(GTK_CONTAINER(qd->window), content);

    GtkWidget *scroll = gtk_scrolled_window_new(nullptr, nullptr);
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroll),
                                   GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);
    gtk_widget_set_vexpand(scroll, TRUE);

    qd->list = gtk_list_box_new();
    gtk_widget_set_margin_start(qd->list, 24);
    gtk_widget_set_margin_end(qd->list, 24);
    gtk_widget_set_margin_top(qd->list, 24);
    g_signal_connect(qd->list, "row-activated", G_CALLBACK(on_queue_row_activated), qd);

    GtkWidget *placeholder = gtk_label_new("The queue is empty.");
    add_class(placeholder, "dim-label");
    gtk_widget_show(placeholder);
    gtk_list_box_set_placeholder(GTK_LIST_BOX(qd->list), placeholder);

    gtk_container_add(GTK_CONTAINER(scroll), qd->list);
    gtk_box_pack_start(GTK_BOX(content), scroll, TRUE, TRUE, 0);

    GtkWidget *button_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
    gtk_widget_set_margin_start(button_box, 24);
    gtk_widget_set_margin_end(button_box, 24);
    gtk_widget_set_margin_top(button_box, 12);
    gtk_widget_set_margin_bottom(button_box, 24);
    gtk_widget_set_halign(button_box, GTK_ALIGN_CENTER);

    qd->install_button = gtk_button_new_with_label("Install All");
    add_class(qd->install_button, "suggested-action");
    g_signal_connect(qd->install_button, "clicked", G_CALLBACK(on_queue_install_clicked), qd);
    gtk_box_pack_start(GTK_BOX(button_box), qd->install_button, FALSE, FALSE, 0);

    GtkWidget *clear_button = gtk_button_new_with_label("Clear Queue");
    g_signal_connect(clear_button, "clicked", G_CALLBACK(on_queue_clear_clicked), nullptr);
    gtk_box_pack_start(GTK_BOX(button_box), clear_button, FALSE, FALSE, 0);

    gtk_box_pack_end(GTK_BOX(content), button_box, FALSE, FALSE, 0);

    qd->listener_id = g_app->queue.add_listener([qd]() { update_queue_list(qd); });
    update_queue_list(qd);

    gtk_widget_show_all(qd->window);
}

// ───────────────────────────────────────────────
//  Orphans
// ───────────────────────────────────────────────

void start_orphan_cleanup() {
    if (!confirm(GTK_WINDOW(g_app->window),
                 "Clean up orphaned packages?\n\n"
                 "This removes dependencies that no installed package needs.")) {
        return;
    }

    // yay -Yc finds them itself.
    if (g_app->backend->name() == "yay") {
        show_progress_window(OperationType::CleanOrphans, {});
        return;
    }

    dastore::PackageManager *manager = g_app->manager.get();
    g_app->async.run<std::vector<std::string>>(
        [manager]() { return manager->list_orphans(); },
        [](std::vector<std::string> orphans, const std::string &error) {
            if (!error.empty()) {
                show_notification("Error: " + error);
            } else if (orphans.empty()) {
                show_notification("No orphaned packages to remove.");
            } else {
                show_progress_window(OperationType::CleanOrphans, orphans);
            }
        });
}
