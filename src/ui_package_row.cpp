#include "ui.hpp"
#include "icon_lookup.hpp"
#include "package_parser.hpp"

#include <memory>

using dastore::PackageInfo;

namespace {

constexpr int ICON_SIZE = 32;
constexpr size_t DESC_MAX_LEN = 80;
constexpr const char *PACKAGE_KEY = "dastore-package";

void add_class(GtkWidget *widget, const char *css_class) {
    gtk_style_context_add_class(gtk_widget_get_style_context(widget), css_class);
}

void free_package(gpointer data) {
    std::unique_ptr<PackageInfo> pkg(static_cast<PackageInfo *>(data));
}

} // anonymous namespace

extern "C" void on_queue_button_clicked(GtkWidget *button, gpointer user_data) {
    (void)user_data;
    GtkWidget *row = gtk_widget_get_ancestor(button, GTK_TYPE_LIST_BOX_ROW);
    const PackageInfo *pkg = row ? row_package(GTK_LIST_BOX_ROW(row)) : nullptr;
    if (!pkg) return;

    if (g_app->queue.add(*pkg)) {
        show_notification("Added " + pkg->name + " to queue");
    } else {
        show_notification(pkg->name + " is already queued");
    }
}

GtkWidget *create_package_icon(const std::string &package_name) {
    GtkIconTheme *theme = gtk_icon_theme_get_default();
    auto has_icon = [theme](const std::string &name) {
        return gtk_icon_theme_has_icon(theme, name.c_str()) == TRUE;
    };

    dastore::IconChoice choice = dastore::resolve_package_icon(package_name, has_icon);

    if (choice.kind == dastore::IconChoice::Kind::File) {
        GError *error = nullptr;
        GdkPixbuf *pixbuf = gdk_pixbuf_new_from_file_at_scale(
            choice.value.c_str(), ICON_SIZE, ICON_SIZE, TRUE, &error);
        if (pixbuf) {
            GtkWidget *image = gtk_image_new_from_pixbuf(pixbuf);
            g_object_unref(pixbuf);
            return image;
        }
        g_debug("unusable icon %s: %s", choice.value.c_str(), error->message);
        g_clear_error(&error);
        choice.value = dastore::FALLBACK_ICON;
    }

    GtkWidget *image = gtk_image_new_from_icon_name(choice.value.c_str(), GTK_ICON_SIZE_DND);
    gtk_image_set_pixel_size(GTK_IMAGE(image), ICON_SIZE);
    return image;
}

GtkWidget *create_package_row(const PackageInfo &pkg, bool queue_button) {
    GtkWidget *row = gtk_list_box_row_new();
    g_object_set_data_full(G_OBJECT(row), PACKAGE_KEY,
                           std::make_unique<PackageInfo>(pkg).release(), free_package);

    // Row content: HBox (icon + text + button)
    GtkWidget *box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 12);
    gtk_widget_set_margin_start(box, 12);
    gtk_widget_set_margin_end(box, 12);
    gtk_widget_set_margin_top(box, 8);
    gtk_widget_set_margin_bottom(box, 8);

    gtk_box_pack_start(GTK_BOX(box), create_package_icon(pkg.name), FALSE, FALSE, 0);

    GtkWidget *info_box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 4);

    // First line: name plus "Installed" badge
    GtkWidget *name_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    GtkWidget *name_label = gtk_label_new(nullptr);
    char *markup = g_markup_printf_escaped("<b>%s</b>", pkg.name.c_str());
    gtk_label_set_markup(GTK_LABEL(name_label), markup);
    g_free(markup);
    gtk_label_set_xalign(GTK_LABEL(name_label), 0.0);
    gtk_box_pack_start(GTK_BOX(name_box), name_label, FALSE, FALSE, 0);

    if (pkg.installed) {
        GtkWidget *badge = gtk_label_new("Installed");
        add_class(badge, "success");
        gtk_box_pack_start(GTK_BOX(name_box), badge, FALSE, FALSE, 0);
    }
    if (pkg.update_available) {
        GtkWidget *badge = gtk_label_new("Update available");
        add_class(badge, "warning");
        gtk_box_pack_start(GTK_BOX(name_box), badge, FALSE, FALSE, 0);
    }
    gtk_box_pack_start(GTK_BOX(info_box), name_box, FALSE, FALSE, 0);

    std::string description = dastore::truncate_text(pkg.description, DESC_MAX_LEN);
    GtkWidget *desc_label = gtk_label_new(description.c_str());
    gtk_label_set_xalign(GTK_LABEL(desc_label), 0.0);
    add_class(desc_label, "dim-label");
    gtk_box_pack_start(GTK_BOX(info_box), desc_label, FALSE, FALSE, 0);

    std::string version_line = pkg.version + " • " + pkg.repo;
    GtkWidget *version_label = gtk_label_new(version_line.c_str());
    gtk_label_set_xalign(GTK_LABEL(version_label), 0.0);
    gtk_box_pack_start(GTK_BOX(info_box), version_label, FALSE, FALSE, 0);

    gtk_box_pack_start(GTK_BOX(box), info_box, TRUE, TRUE, 0);

    if (queue_button && !pkg.installed) {
        GtkWidget *btn = gtk_button_new_from_icon_name("list-add-symbolic", GTK_ICON_SIZE_BUTTON);
        gtk_widget_set_tooltip_text(btn, "Add to queue");
        gtk_button_set_relief(GTK_BUTTON(btn), GTK_RELIEF_NONE);
        gtk_widget_set_valign(btn, GTK_ALIGN_CENTER);
        g_signal_connect(btn, "clicked", G_CALLBACK(on_queue_button_clicked), nullptr);
        gtk_box_pack_end(GTK_BOX(box), btn, FALSE, FALSE, 0);
    }

    gtk_container_add(GTK_CONTAINER(row), box);
    gtk_widget_show_all(row);
    return row;
}

const PackageInfo *row_package(GtkListBoxRow *row) {
    return static_cast<const PackageInfo *>(g_object_get_data(G_OBJECT(row), PACKAGE_KEY));
}

void clear_list(GtkWidget *list_box) {
    GList *children = gtk_container_get_children(GTK_CONTAINER(list_box));
    for (GList *iter = children; iter != nullptr; iter = iter->next) {
        gtk_widget_destroy(GTK_WIDGET(iter->data));
    }
    g_list_free(children);
}
