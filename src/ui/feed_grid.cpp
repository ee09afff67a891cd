#include "ui/feed_grid.hpp"
#include "ui/feed_detail.hpp"
#include "digest.hpp"
#include "event_log.hpp"
#include <cmath>

namespace ui {

// ─── Idle callback data structs ─────────────────────────────────────────────

struct LabelUpdateData {
    GtkWidget* label;
    std::string text;
};

struct LogLineData {
    FeedGridPanel* panel;
    std::string line;
};

// ─── Idle callbacks (run on main thread) ────────────────────────────────────

static gboolean update_label_idle(gpointer data) {
    auto* d = static_cast<LabelUpdateData*>(data);
    if (GTK_IS_LABEL(d->label))
        gtk_label_set_text(GTK_LABEL(d->label), d->text.c_str());
    delete d;
    return G_SOURCE_REMOVE;
}

static gboolean refresh_tiles_idle(gpointer data) {
    static_cast<FeedGridPanel*>(data)->refresh_tiles();
    return G_SOURCE_REMOVE;
}

static gboolean append_log_idle(gpointer data) {
    auto* d = static_cast<LogLineData*>(data);
    d->panel->append_log(d->line);
    delete d;
    return G_SOURCE_REMOVE;
}

// ─── FeedGridPanel ──────────────────────────────────────────────────────────

FeedGridPanel::FeedGridPanel(GtkWindow* parent_window, const config::ReceiverConfig& cfg)
    : parent_window_(parent_window),
      cfg_(cfg),
      slots_(cfg.slot_count, cfg.preferred_slots),
      history_(cfg.history_path()) {

    panel_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_set_margin_start(panel_, 12);
    gtk_widget_set_margin_end(panel_, 12);
    gtk_widget_set_margin_top(panel_, 12);
    gtk_widget_set_margin_bottom(panel_, 12);

    // ─── Server controls ────────────────────────────────────────────────
    GtkWidget* control_row = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);

    GtkWidget* header = gtk_label_new("📡 Receiver");
    gtk_widget_add_css_class(header, "title-text");
    gtk_label_set_xalign(GTK_LABEL(header), 0.0);
    gtk_widget_set_hexpand(header, TRUE);
    gtk_box_append(GTK_BOX(control_row), header);

    start_button_ = gtk_button_new_with_label("▶ Start Receiver");
    gtk_widget_add_css_class(start_button_, "suggested-action");
    g_signal_connect(start_button_, "clicked", G_CALLBACK(on_start_clicked), this);
    gtk_box_append(GTK_BOX(control_row), start_button_);

    stop_button_ = gtk_button_new_with_label("⏹ Stop");
    gtk_widget_add_css_class(stop_button_, "destructive-action");
    gtk_widget_set_sensitive(stop_button_, FALSE);
    g_signal_connect(stop_button_, "clicked", G_CALLBACK(on_stop_clicked), this);
    gtk_box_append(GTK_BOX(control_row), stop_button_);

    gtk_box_append(GTK_BOX(panel_), control_row);

    status_label_ = gtk_label_new(("Stopped. Will listen on " + cfg_.host + ":" +
                                   std::to_string(cfg_.port) + ", saving to " + cfg_.output_dir).c_str());
    gtk_widget_add_css_class(status_label_, "subtitle-text");
    gtk_label_set_xalign(GTK_LABEL(status_label_), 0.0);
    gtk_box_append(GTK_BOX(panel_), status_label_);

    // ─── Feed tiles ─────────────────────────────────────────────────────
    GtkWidget* grid = gtk_grid_new();
    gtk_grid_set_row_spacing(GTK_GRID(grid), 8);
    gtk_grid_set_column_spacing(GTK_GRID(grid), 8);
    gtk_grid_set_row_homogeneous(GTK_GRID(grid), TRUE);
    gtk_grid_set_column_homogeneous(GTK_GRID(grid), TRUE);
    gtk_widget_set_vexpand(grid, TRUE);

    const std::size_t count = slots_.size();
    const auto grid_columns = static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<double>(count))));
    for (std::size_t i = 0; i < count; ++i) {
        gtk_grid_attach(GTK_GRID(grid), build_tile(i),
                        static_cast<int>(i % grid_columns), static_cast<int>(i / grid_columns), 1, 1);
    }
    gtk_box_append(GTK_BOX(panel_), grid);

    // ─── Progress / Event log ───────────────────────────────────────────
    GtkWidget* section = gtk_box_new(GTK_ORIENTATION_VERTICAL, 4);
    gtk_widget_add_css_class(section, "section-box");

    progress_label_ = gtk_label_new("Waiting for frames...");
    gtk_widget_add_css_class(progress_label_, "status-text");
    gtk_label_set_xalign(GTK_LABEL(progress_label_), 0.0);
    gtk_box_append(GTK_BOX(section), progress_label_);

    GtkWidget* scroll = gtk_scrolled_window_new();
    gtk_scrolled_window_set_min_content_height(GTK_SCROLLED_WINDOW(scroll), 140);
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroll),
                                   GTK_POLICY_AUTOMATIC, GTK_POLICY_AUTOMATIC);

    log_view_ = gtk_text_view_new();
    gtk_text_view_set_editable(GTK_TEXT_VIEW(log_view_), FALSE);
    gtk_text_view_set_cursor_visible(GTK_TEXT_VIEW(log_view_), FALSE);
    gtk_text_view_set_monospace(GTK_TEXT_VIEW(log_view_), TRUE);
    gtk_widget_add_css_class(log_view_, "event-log");
    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(scroll), log_view_);
    gtk_box_append(GTK_BOX(section), scroll);

    gtk_box_append(GTK_BOX(panel_), section);

    event_log::set_sink([this](event_log::Level level, const std::string& message) {
        g_idle_add(append_log_idle, new LogLineData{this, std::string(event_log::level_name(level)) + " " + message});
    });
}

FeedGridPanel::~FeedGridPanel() {
    shutdown();
}

GtkWidget* FeedGridPanel::build_tile(std::size_t index) {
    Tile tile;
    tile.frame = gtk_box_new(GTK_ORIENTATION_VERTICAL, 4);
    gtk_widget_add_css_class(tile.frame, "feed-tile");
    gtk_widget_add_css_class(tile.frame, "idle");

    tile.title = gtk_label_new(("Live feed " + std::to_string(index + 1) + ": (waiting)").c_str());
    gtk_widget_add_css_class(tile.title, "subtitle-text");
    gtk_box_append(GTK_BOX(tile.frame), tile.title);

    tile.picture = gtk_picture_new();
    gtk_picture_set_can_shrink(GTK_PICTURE(tile.picture), TRUE);
    gtk_widget_set_size_request(tile.picture, 240, 160);
    gtk_widget_set_vexpand(tile.picture, TRUE);
    gtk_box_append(GTK_BOX(tile.frame), tile.picture);

    GtkGesture* click = gtk_gesture_click_new();
    g_object_set_data(G_OBJECT(click), "slot", GSIZE_TO_POINTER(index));
    g_signal_connect(click, "pressed", G_CALLBACK(on_tile_pressed), this);
    gtk_widget_add_controller(tile.frame, GTK_EVENT_CONTROLLER(click));

    tiles_.push_back(tile);
    return tile.frame;
}

void FeedGridPanel::start_receiver() {
    if (manager_ && manager_->is_running()) return;

    GtkWidget* status_lbl = status_label_;
    GtkWidget* progress_lbl = progress_label_;

    session::ReceiverCallbacks callbacks;
    callbacks.on_status = [status_lbl](const std::string& msg) {
        g_idle_add(update_label_idle, new LabelUpdateData{status_lbl, msg});
    };
    callbacks.on_frame_progress = [progress_lbl](const std::string& identity, std::size_t received, std::size_t expected) {
        std::string text = "frame " + std::to_string(received) + "/" + std::to_string(expected) + " from " + identity;
        g_idle_add(update_label_idle, new LabelUpdateData{progress_lbl, text});
    };
    callbacks.on_transfer_complete = [this](const std::string&, imaging::ImagePtr, const protocol::TransferRecord&) {
        g_idle_add(refresh_tiles_idle, this);
    };
    callbacks.on_transfer_failed = [progress_lbl](const std::string& identity, session::FailureReason reason,
                                                  const std::string& detail) {
        std::string text = "❌ " + identity + ": " + session::to_string(reason) + " (" + detail + ")";
        g_idle_add(update_label_idle, new LabelUpdateData{progress_lbl, text});
    };

    try {
        manager_ = std::make_unique<networking::ConnectionManager>(
            cfg_, codec_, session::SharedState{slots_, history_}, callbacks);
        manager_->start();
    } catch (const std::exception& e) {
        manager_.reset();
        event_log::error(std::string("Could not start receiver: ") + e.what());
        gtk_label_set_text(GTK_LABEL(status_label_), (std::string("❌ ") + e.what()).c_str());
        return;
    }

    gtk_widget_set_sensitive(start_button_, FALSE);
    gtk_widget_set_sensitive(stop_button_, TRUE);
}

void FeedGridPanel::stop_receiver() {
    if (!manager_) return;

    std::vector<std::string> stragglers = manager_->stop();
    manager_.reset();

    std::string text = "Stopped.";
    if (!stragglers.empty()) {
        text += " Aborted " + std::to_string(stragglers.size()) + " unfinished session(s).";
    }
    gtk_label_set_text(GTK_LABEL(status_label_), text.c_str());
    gtk_widget_set_sensitive(start_button_, TRUE);
    gtk_widget_set_sensitive(stop_button_, FALSE);
}

void FeedGridPanel::shutdown() {
    if (manager_) {
        manager_->stop();
        manager_.reset();
    }
    event_log::set_sink(nullptr);
}

void FeedGridPanel::refresh_tiles() {
    std::vector<feed::FeedSlot> snapshot = slots_.snapshot();
    for (std::size_t i = 0; i < snapshot.size() && i < tiles_.size(); ++i) {
        const feed::FeedSlot& slot = snapshot[i];
        std::string title = "Live feed " + std::to_string(i + 1) + ": " +
                            (slot.identity ? *slot.identity : std::string("(waiting)"));
        gtk_label_set_text(GTK_LABEL(tiles_[i].title), title.c_str());
        if (slot.identity) {
            gtk_widget_remove_css_class(tiles_[i].frame, "idle");
        } else {
            gtk_widget_add_css_class(tiles_[i].frame, "idle");
        }

        if (slot.last_image) {
            GdkTexture* texture = make_texture(*slot.last_image);
            gtk_picture_set_paintable(GTK_PICTURE(tiles_[i].picture), GDK_PAINTABLE(texture));
            g_object_unref(texture);
        } else {
            gtk_picture_set_paintable(GTK_PICTURE(tiles_[i].picture), nullptr);
        }
    }
}

void FeedGridPanel::append_log(const std::string& line) {
    GtkTextBuffer* buffer = gtk_text_view_get_buffer(GTK_TEXT_VIEW(log_view_));
    GtkTextIter end;
    gtk_text_buffer_get_end_iter(buffer, &end);
    gtk_text_buffer_insert(buffer, &end, (line + "\n").c_str(), -1);

    gtk_text_buffer_get_end_iter(buffer, &end);
    GtkTextMark* mark = gtk_text_buffer_create_mark(buffer, nullptr, &end, FALSE);
    gtk_text_view_scroll_mark_onscreen(GTK_TEXT_VIEW(log_view_), mark);
    gtk_text_buffer_delete_mark(buffer, mark);
}

void FeedGridPanel::open_detail(std::size_t slot) {
    std::vector<feed::FeedSlot> snapshot = slots_.snapshot();
    if (slot >= snapshot.size() || !snapshot[slot].identity) return;
    const std::string& identity = *snapshot[slot].identity;

    auto* detail = new FeedDetailWindow(parent_window_, "Live feed " + std::to_string(slot + 1) + ": " + identity);
    detail->set_image(snapshot[slot].last_image);

    // Latest record from this transmitter
    std::vector<protocol::TransferRecord> records = history_.snapshot();
    for (auto it = records.rbegin(); it != records.rend(); ++it) {
        if (it->identity != identity) continue;
        detail->set_details("Transmitter: " + it->identity + "\n" +
                            "File: " + it->filename + "\n" +
                            "Saved: " + it->save_path + "\n" +
                            "Time: " + it->timestamp + "\n" +
                            "Frames: " + std::to_string(it->frames) + ", " + std::to_string(it->bytes) + " bytes\n" +
                            "BLAKE2b: " + digest::short_fingerprint(it->digest));
        break;
    }

    g_signal_connect(detail->get_widget(), "destroy", G_CALLBACK(+[](GtkWidget*, gpointer data) {
        delete static_cast<FeedDetailWindow*>(data);
    }), detail);
    detail->show();
}

// ─── GTK Callbacks ──────────────────────────────────────────────────────────

void FeedGridPanel::on_start_clicked(GtkButton* /*button*/, gpointer user_data) {
    static_cast<FeedGridPanel*>(user_data)->start_receiver();
}

void FeedGridPanel::on_stop_clicked(GtkButton* /*button*/, gpointer user_data) {
    static_cast<FeedGridPanel*>(user_data)->stop_receiver();
}

void FeedGridPanel::on_tile_pressed(GtkGestureClick* gesture, int n_press, double /*x*/, double /*y*/,
                                    gpointer user_data) {
    if (n_press != 2) return;
    auto* self = static_cast<FeedGridPanel*>(user_data);
    auto slot = GPOINTER_TO_SIZE(g_object_get_data(G_OBJECT(gesture), "slot"));
    self->open_detail(slot);
}

} // namespace ui
