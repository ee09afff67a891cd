#include "ui/main_window.hpp"
#include "ui/image_sender.hpp"
#include "ui/feed_grid.hpp"
#include <string>

namespace ui {

// Dark monitoring theme: the feed grid is the focus, controls stay muted
static const char* CSS_STYLE = R"(
window {
    background-color: #0c1116;
    color: #c9d1d9;
}

headerbar {
    background-color: #121a21;
    border-bottom: 1px solid #22303b;
}

.header-endpoint {
    font-family: monospace;
    font-size: 12px;
    color: #6e8799;
}

/* Dashboard */

.feed-tile {
    background-color: #05080b;
    border: 2px solid #2f8f5b;
    border-radius: 4px;
    padding: 4px;
}

.feed-tile.idle {
    border: 2px dotted #2a3640;
}

.feed-tile:hover {
    border-color: #58c48a;
}

.feed-picture {
    background-color: #000000;
}

.event-log text {
    background-color: #080c10;
    color: #8fa3b1;
    font-family: monospace;
    font-size: 11px;
}

/* Transmit page */

.drop-zone {
    border: 2px dashed #3a5566;
    border-radius: 6px;
    padding: 28px;
}

.file-item {
    font-family: monospace;
    padding: 4px 8px;
}

/* Shared */

.section-box {
    background-color: #121a21;
    border-radius: 6px;
    padding: 10px;
}

.title-text {
    font-size: 16px;
    font-weight: bold;
}

.subtitle-text {
    color: #8fa3b1;
    font-size: 12px;
}

.status-text {
    color: #8fa3b1;
    font-size: 13px;
}

button.suggested-action {
    background-color: #2f8f5b;
    color: #ffffff;
}

button.destructive-action {
    background-color: #a8432f;
    color: #ffffff;
}

progressbar progress {
    background-color: #2f8f5b;
}
)";

void MainWindow::setup_css() {
    GtkCssProvider* provider = gtk_css_provider_new();
    gtk_css_provider_load_from_string(provider, CSS_STYLE);
    gtk_style_context_add_provider_for_display(
        gdk_display_get_default(),
        GTK_STYLE_PROVIDER(provider),
        GTK_STYLE_PROVIDER_PRIORITY_APPLICATION
    );
    g_object_unref(provider);
}

void MainWindow::on_destroy(GtkWidget* /*widget*/, gpointer data) {
    auto* self = static_cast<MainWindow*>(data);
    if (self->feed_panel_) {
        self->feed_panel_->shutdown();
    }
}

MainWindow::MainWindow(GtkApplication* app, const config::AppConfig& cfg) {
    setup_css();

    window_ = gtk_application_window_new(app);
    gtk_window_set_title(GTK_WINDOW(window_), "GridRelay");
    gtk_window_set_default_size(GTK_WINDOW(window_), 1100, 820);

    stack_ = gtk_stack_new();
    gtk_stack_set_transition_type(GTK_STACK(stack_), GTK_STACK_TRANSITION_TYPE_CROSSFADE);

    feed_panel_ = new FeedGridPanel(GTK_WINDOW(window_), cfg.receiver);
    send_panel_ = new ImageSenderPanel(GTK_WINDOW(window_), cfg.transmitter);
    gtk_stack_add_titled(GTK_STACK(stack_), feed_panel_->get_widget(), "dashboard", "Dashboard");
    gtk_stack_add_titled(GTK_STACK(stack_), send_panel_->get_widget(), "transmit", "Transmit");

    // Page switcher centred, receiver endpoint on the right
    header_bar_ = gtk_header_bar_new();
    GtkWidget* switcher = gtk_stack_switcher_new();
    gtk_stack_switcher_set_stack(GTK_STACK_SWITCHER(switcher), GTK_STACK(stack_));
    gtk_header_bar_set_title_widget(GTK_HEADER_BAR(header_bar_), switcher);

    std::string endpoint = "RX " + cfg.receiver.host + ":" + std::to_string(cfg.receiver.port) + "  |  " +
                           std::to_string(cfg.receiver.slot_count) + " feeds";
    GtkWidget* endpoint_label = gtk_label_new(endpoint.c_str());
    gtk_widget_add_css_class(endpoint_label, "header-endpoint");
    gtk_header_bar_pack_end(GTK_HEADER_BAR(header_bar_), endpoint_label);
    gtk_window_set_titlebar(GTK_WINDOW(window_), header_bar_);

    gtk_window_set_child(GTK_WINDOW(window_), stack_);
    g_signal_connect(window_, "destroy", G_CALLBACK(on_destroy), this);

    gtk_window_present(GTK_WINDOW(window_));
}

MainWindow::~MainWindow() {
    delete send_panel_;
    delete feed_panel_;
}

int run_gui(const config::AppConfig& cfg) {
    GtkApplication* app = gtk_application_new("dev.gridrelay.app", G_APPLICATION_DEFAULT_FLAGS);
    // The window lives until the process exits
    g_signal_connect(app, "activate", G_CALLBACK(+[](GtkApplication* application, gpointer user_data) {
        new MainWindow(application, *static_cast<const config::AppConfig*>(user_data));
    }), const_cast<config::AppConfig*>(&cfg));
    int status = g_application_run(G_APPLICATION(app), 0, nullptr);
    g_object_unref(app);
    return status;
}

} // namespace ui
