#include "ui.hpp"
#include "transaction.hpp"

#include <cstdio>
#include <memory>
#include <utility>

using dastore::OperationType;
using dastore::Transaction;

namespace {

struct ProgressWindow {
    OperationType op;
    GtkWidget *window = nullptr;
    GtkWidget *progress_bar = nullptr;
    GtkWidget *status_label = nullptr;
    GtkWidget *text_view = nullptr;
    GtkWidget *cancel_button = nullptr;
    GtkWidget *close_button = nullptr;
    std::unique_ptr<Transaction> transaction;
};

std::string window_title(OperationType op, const std::string &name) {
    switch (op) {
        case OperationType::Install:      return name.empty() ? "Installing" : "Installing " + name;
        case OperationType::Uninstall:    return "Uninstalling " + name;
        case OperationType::Update:       return "Updating " + name;
        case OperationType::SystemUpdate: return "System Update";
        case OperationType::QueueInstall: return "Installing Queue";
        case OperationType::CleanOrphans: return "Cleaning Orphans";
    }
    return "Operation";
}

void set_progress(ProgressWindow *pw, double fraction, const std::string &status) {
    char text[8];
    std::snprintf(text, sizeof(text), "%d%%", static_cast<int>(fraction * 100));
    gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(pw->progress_bar), fraction);
    gtk_progress_bar_set_text(GTK_PROGRESS_BAR(pw->progress_bar), text);
    gtk_label_set_text(GTK_LABEL(pw->status_label), status.c_str());
}

void append_log(ProgressWindow *pw, const std::string &text) {
    GtkTextBuffer *buffer = gtk_text_view_get_buffer(GTK_TEXT_VIEW(pw->text_view));
    GtkTextIter end;
    gtk_text_buffer_get_end_iter(buffer, &end);
    // Package output is not guaranteed to be UTF-8.
    char *valid = g_utf8_make_valid(text.c_str(), static_cast<gssize>(text.size()));
    gtk_text_buffer_insert(buffer, &end, valid, -1);
    g_free(valid);

    gtk_text_buffer_get_end_iter(buffer, &end);
    GtkTextMark *mark = gtk_text_buffer_get_insert(buffer);
    gtk_text_buffer_place_cursor(buffer, &end);
    gtk_text_view_scroll_mark_onscreen(GTK_TEXT_VIEW(pw->text_view), mark);
}

void operation_complete(ProgressWindow *pw, Transaction::Outcome outcome) {
    gtk_widget_hide(pw->cancel_button);
    gtk_widget_show(pw->close_button);

    if (outcome == Transaction::Outcome::Succeeded && pw->op == OperationType::QueueInstall) {
        g_app->queue.clear();
    }
    if (outcome != Transaction::Outcome::Cancelled) {
        refresh_search();
    }
}

} // anonymous namespace

extern "C" void on_progress_cancel_clicked(GtkWidget *button, gpointer user_data) {
    auto *pw = static_cast<ProgressWindow *>(user_data);
    gtk_widget_set_sensitive(button, FALSE);
    if (pw->transaction) {
        pw->transaction->cancel();
    }
}

extern "C" void on_progress_close_clicked(GtkWidget *button, gpointer user_data) {
    (void)button;
    auto *pw = static_cast<ProgressWindow *>(user_data);
    gtk_widget_destroy(pw->window);
}

extern "C" void on_progress_window_destroy(GtkWidget *window, gpointer user_data) {
    (void)window;
    // Kills a still-running child.
    std::unique_ptr<ProgressWindow> pw(static_cast<ProgressWindow *>(user_data));
}

void show_progress_window(OperationType op,
                          const std::vector<std::string> &targets,
                          const std::string &package_name) {
    dastore::TransactionCommand cmd = g_app->backend->transaction(op, targets);
    if (cmd.has_error()) {
        show_error(GTK_WINDOW(g_app->window), cmd.error);
        return;
    }

    ProgressWindow *pw = std::make_unique<ProgressWindow>().release();
    pw->op = op;

    pw->window = gtk_window_new(GTK_WINDOW_TOPLEVEL);
    gtk_window_set_transient_for(GTK_WINDOW(pw->window), GTK_WINDOW(g_app->window));
    gtk_window_set_default_size(GTK_WINDOW(pw->window), 700, 500);
    g_signal_connect(pw->window, "destroy", G_CALLBACK(on_progress_window_destroy), pw);

    GtkWidget *header = gtk_header_bar_new();
    gtk_header_bar_set_title(GTK_HEADER_BAR(header), window_title(op, package_name).c_str());
    gtk_header_bar_set_show_close_button(GTK_HEADER_BAR(header), TRUE);
    gtk_window_set_titlebar(GTK_WINDOW(pw->window), header);

    GtkWidget *content = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
    gtk_container_add(GTK_CONTAINER(pw->window), content);

    // Progress bar + status
    GtkWidget *progress_box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
    gtk_widget_set_margin_start(progress_box, 12);
    gtk_widget_set_margin_end(progress_box, 12);
    gtk_widget_set_margin_top(progress_box, 12);
    gtk_widget_set_margin_bottom(progress_box, 12);

    pw->progress_bar = gtk_progress_bar_new();
    gtk_progress_bar_set_show_text(GTK_PROGRESS_BAR(pw->progress_bar), TRUE);
    gtk_progress_bar_set_text(GTK_PROGRESS_BAR(pw->progress_bar), "0%");
    gtk_box_pack_start(GTK_BOX(progress_box), pw->progress_bar, FALSE, FALSE, 0);

    pw->status_label = gtk_label_new("Preparing...");
    gtk_label_set_xalign(GTK_LABEL(pw->status_label), 0.0);
    gtk_box_pack_start(GTK_BOX(progress_box), pw->status_label, FALSE, FALSE, 0);
    gtk_box_pack_start(GTK_BOX(content), progress_box, FALSE, FALSE, 0);

    // Log, collapsed by default
    GtkWidget *expander = gtk_expander_new("Show details");
    gtk_widget_set_margin_start(expander, 12);
    gtk_widget_set_margin_end(expander, 12);
    gtk_expander_set_resize_toplevel(GTK_EXPANDER(expander), FALSE);

    GtkWidget *scroll = gtk_scrolled_window_new(nullptr, nullptr);
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroll),
                                   GTK_POLICY_AUTOMATIC, GTK_POLICY_AUTOMATIC);
    gtk_scrolled_window_set_min_content_height(GTK_SCROLLED_WINDOW(scroll), 200);
    gtk_widget_set_vexpand(scroll, TRUE);

    pw->text_view = gtk_text_view_new();
    gtk_text_view_set_editable(GTK_TEXT_VIEW(pw->text_view), FALSE);
    gtk_text_view_set_cursor_visible(GTK_TEXT_VIEW(pw->text_view), FALSE);
    gtk_text_view_set_monospace(GTK_TEXT_VIEW(pw->text_view), TRUE);
    gtk_text_view_set_wrap_mode(GTK_TEXT_VIEW(pw->text_view), GTK_WRAP_WORD_CHAR);
    gtk_text_view_set_left_margin(GTK_TEXT_VIEW(pw->text_view), 12);
    gtk_text_view_set_right_margin(GTK_TEXT_VIEW(pw->text_view), 12);
    gtk_container_add(GTK_CONTAINER(scroll), pw->text_view);
    gtk_container_add(GTK_CONTAINER(expander), scroll);
    gtk_box_pack_start(GTK_BOX(content), expander, TRUE, TRUE, 0);

    // Cancel while running, Close afterwards
    GtkWidget *button_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
    gtk_widget_set_margin_start(button_box, 12);
    gtk_widget_set_margin_end(button_box, 12);
    gtk_widget_set_margin_bottom(button_box, 12);
    gtk_widget_set_halign(button_box, GTK_ALIGN_END);

    pw->cancel_button = gtk_button_new_with_label("Cancel");
    g_signal_connect(pw->cancel_button, "clicked", G_CALLBACK(on_progress_cancel_clicked), pw);
    gtk_box_pack_start(GTK_BOX(button_box), pw->cancel_button, FALSE, FALSE, 0);

    pw->close_button = gtk_button_new_with_label("Close");
    g_signal_connect(pw->close_button, "clicked", G_CALLBACK(on_progress_close_clicked), pw);
    gtk_box_pack_start(GTK_BOX(button_box), pw->close_button, FALSE, FALSE, 0);

    gtk_box_pack_end(GTK_BOX(content), button_box, FALSE, FALSE, 0);

    gtk_widget_show_all(pw->window);
    gtk_widget_hide(pw->close_button);

    Transaction::Callbacks callbacks;
    callbacks.on_output = [pw](const std::string &text) { append_log(pw, text); };
    callbacks.on_progress = [pw](double fraction, const std::string &status) {
        set_progress(pw, fraction, status);
    };
    callbacks.on_finished = [pw](Transaction::Outcome outcome, int exit_code) {
        (void)exit_code;
        operation_complete(pw, outcome);
    };

    pw->transaction = std::make_unique<Transaction>(cmd.argv, std::move(callbacks));
    pw->transaction->start();
}
