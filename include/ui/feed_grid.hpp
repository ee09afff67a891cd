#pragma once

#include <gtk/gtk.h>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "feed_slots.hpp"
#include "imaging.hpp"
#include "networking.hpp"
#include "transfer_history.hpp"

namespace ui {

// Receiver dashboard: server controls, one tile per feed slot and the
// event log.
class FeedGridPanel {
public:
    FeedGridPanel(GtkWindow* parent_window, const config::ReceiverConfig& cfg);
    ~FeedGridPanel();

    GtkWidget* get_widget() const { return panel_; }

    void start_receiver();
    void stop_receiver();

    // Stops the receiver and detaches from the event log
    void shutdown();

    // Redraws every tile from a snapshot of the slot table
    void refresh_tiles();
    void append_log(const std::string& line);

private:
    struct Tile {
        GtkWidget* frame;
        GtkWidget* title;
        GtkWidget* picture;
    };

    GtkWidget* panel_;
    GtkWidget* start_button_;
    GtkWidget* stop_button_;
    GtkWidget* status_label_;
    GtkWidget* progress_label_;
    GtkWidget* log_view_;
    GtkWindow* parent_window_;
    std::vector<Tile> tiles_;

    config::ReceiverConfig cfg_;
    imaging::PixbufCodec codec_;
    feed::FeedSlotTable slots_;
    history::TransferHistory history_;
    std::unique_ptr<networking::ConnectionManager> manager_;

    GtkWidget* build_tile(std::size_t index);
    void open_detail(std::size_t slot);

    static void on_start_clicked(GtkButton* button, gpointer user_data);
    static void on_stop_clicked(GtkButton* button, gpointer user_data);
    static void on_tile_pressed(GtkGestureClick* gesture, int n_press, double x, double y, gpointer user_data);
};

} // namespace ui
