#pragma once

#include <gtk/gtk.h>
#include "config.hpp"

namespace ui {

class ImageSenderPanel;
class FeedGridPanel;

class MainWindow {
public:
    MainWindow(GtkApplication* app, const config::AppConfig& cfg);
    ~MainWindow();

    GtkWidget* get_window() const { return window_; }

private:
    GtkWidget* window_;
    GtkWidget* stack_;
    GtkWidget* header_bar_;

    ImageSenderPanel* send_panel_;
    FeedGridPanel* feed_panel_;

    void setup_css();
    static void on_destroy(GtkWidget* widget, gpointer data);
};

int run_gui(const config::AppConfig& cfg);

} // namespace ui
