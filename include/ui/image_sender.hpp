#pragma once

#include <gtk/gtk.h>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "imaging.hpp"
#include "networking.hpp"

namespace ui {

// Transmit page: queue images and stream them to a receiver
class ImageSenderPanel {
public:
    ImageSenderPanel(GtkWindow* parent_window, const config::TransmitterConfig& cfg);
    ~ImageSenderPanel();

    GtkWidget* get_widget() const { return panel_; }

private:
    GtkWidget* panel_;
    GtkWidget* drop_area_;
    GtkWidget* file_list_box_;
    GtkWidget* identity_entry_;
    GtkWidget* host_entry_;
    GtkWidget* port_spin_;
    GtkWidget* frame_size_spin_;
    GtkWidget* columns_spin_;
    GtkWidget* quality_spin_;
    GtkWidget* reencode_check_;
    GtkWidget* send_button_;
    GtkWidget* clear_button_;
    GtkWidget* cancel_button_;
    GtkWidget* status_label_;
    GtkWidget* progress_bar_;
    GtkWidget* progress_label_;
    GtkWindow* parent_window_;

    config::TransmitterConfig cfg_;
    // Shared with the detached send thread, which may outlive the panel
    std::shared_ptr<imaging::PixbufCodec> codec_;
    std::shared_ptr<std::atomic<bool>> sending_;
    std::shared_ptr<std::atomic<bool>> cancel_flag_;
    std::vector<std::string> queued_files_;

    void add_path(const std::string& path);
    void clear_files();
    void start_sending();
    void update_file_list_ui();
    config::TransmitterConfig read_settings() const;

    static void on_choose_files(GtkButton* button, gpointer user_data);
    static void on_send_clicked(GtkButton* button, gpointer user_data);
    static void on_clear_clicked(GtkButton* button, gpointer user_data);
    static void on_cancel_clicked(GtkButton* button, gpointer user_data);
    static gboolean on_drop(GtkDropTarget* target, const GValue* value,
                            double x, double y, gpointer user_data);
};

} // namespace ui
