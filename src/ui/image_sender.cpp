#include "ui/image_sender.hpp"
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace ui {

// ─── Idle callback data structs ─────────────────────────────────────────────

struct StatusUpdateData {
    GtkWidget* label;
    std::string text;
};

struct ProgressUpdateData {
    GtkWidget* progress_bar;
    GtkWidget* progress_label;
    double fraction;
    std::string text;
};

struct SendFinishedData {
    GtkWidget *status, *send, *clear, *cancel;
    std::string message;
};

// ─── Idle callbacks (run on main thread) ────────────────────────────────────

static gboolean update_status_idle(gpointer data) {
    auto* d = static_cast<StatusUpdateData*>(data);
    if (GTK_IS_LABEL(d->label))
        gtk_label_set_text(GTK_LABEL(d->label), d->text.c_str());
    delete d;
    return G_SOURCE_REMOVE;
}

static gboolean update_progress_idle(gpointer data) {
    auto* d = static_cast<ProgressUpdateData*>(data);
    if (GTK_IS_PROGRESS_BAR(d->progress_bar))
        gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(d->progress_bar), d->fraction);
    if (GTK_IS_LABEL(d->progress_label))
        gtk_label_set_text(GTK_LABEL(d->progress_label), d->text.c_str());
    delete d;
    return G_SOURCE_REMOVE;
}

static gboolean send_finished_idle(gpointer data) {
    auto* d = static_cast<SendFinishedData*>(data);
    if (GTK_IS_LABEL(d->status)) gtk_label_set_text(GTK_LABEL(d->status), d->message.c_str());
    if (GTK_IS_WIDGET(d->send)) { gtk_widget_set_visible(d->send, TRUE); gtk_widget_set_sensitive(d->send, TRUE); }
    if (GTK_IS_WIDGET(d->clear)) gtk_widget_set_visible(d->clear, TRUE);
    if (GTK_IS_WIDGET(d->cancel)) gtk_widget_set_visible(d->cancel, FALSE);
    delete d;
    return G_SOURCE_REMOVE;
}

static GtkWidget* labelled_row(const char* caption, GtkWidget* field) {
    GtkWidget* row = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    GtkWidget* label = gtk_label_new(caption);
    gtk_widget_add_css_class(label, "status-text");
    gtk_label_set_xalign(GTK_LABEL(label), 0.0);
    gtk_widget_set_size_request(label, 110, -1);
    gtk_box_append(GTK_BOX(row), label);
    gtk_widget_set_hexpand(field, TRUE);
    gtk_box_append(GTK_BOX(row), field);
    return row;
}

// ─── ImageSenderPanel ───────────────────────────────────────────────────────

ImageSenderPanel::ImageSenderPanel(GtkWindow* parent_window, const config::TransmitterConfig& cfg)
    : parent_window_(parent_window), cfg_(cfg),
      codec_(std::make_shared<imaging::PixbufCodec>()),
      sending_(std::make_shared<std::atomic<bool>>(false)) {

    panel_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_set_margin_start(panel_, 12);
    gtk_widget_set_margin_end(panel_, 12);
    gtk_widget_set_margin_top(panel_, 12);
    gtk_widget_set_margin_bottom(panel_, 12);

    // ─── Drop zone ──────────────────────────────────────────────────────
    drop_area_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_add_css_class(drop_area_, "drop-zone");

    GtkWidget* drop_label = gtk_label_new("🖼️  Drop Images Here");
    gtk_widget_add_css_class(drop_label, "title-text");
    gtk_box_append(GTK_BOX(drop_area_), drop_label);

    GtkWidget* choose_button = gtk_button_new_with_label("📄 Choose Images");
    gtk_widget_add_css_class(choose_button, "suggested-action");
    gtk_widget_set_halign(choose_button, GTK_ALIGN_CENTER);
    g_signal_connect(choose_button, "clicked", G_CALLBACK(on_choose_files), this);
    gtk_box_append(GTK_BOX(drop_area_), choose_button);

    gtk_box_append(GTK_BOX(panel_), drop_area_);

    GtkDropTarget* drop_target = gtk_drop_target_new(GDK_TYPE_FILE_LIST, GDK_ACTION_COPY);
    g_signal_connect(drop_target, "drop", G_CALLBACK(on_drop), this);
    gtk_widget_add_controller(drop_area_, GTK_EVENT_CONTROLLER(drop_target));

    // ─── File list ──────────────────────────────────────────────────────
    GtkWidget* scroll = gtk_scrolled_window_new();
    gtk_scrolled_window_set_min_content_height(GTK_SCROLLED_WINDOW(scroll), 100);
    gtk_widget_set_vexpand(scroll, TRUE);
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroll),
                                   GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);

    file_list_box_ = gtk_list_box_new();
    gtk_list_box_set_selection_mode(GTK_LIST_BOX(file_list_box_), GTK_SELECTION_NONE);
    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(scroll), file_list_box_);
    gtk_box_append(GTK_BOX(panel_), scroll);

    // ─── Settings ───────────────────────────────────────────────────────
    GtkWidget* settings = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
    gtk_widget_add_css_class(settings, "section-box");

    identity_entry_ = gtk_entry_new();
    gtk_editable_set_text(GTK_EDITABLE(identity_entry_), cfg_.identity.c_str());
    gtk_entry_set_max_length(GTK_ENTRY(identity_entry_), 50);
    gtk_box_append(GTK_BOX(settings), labelled_row("Identity", identity_entry_));

    host_entry_ = gtk_entry_new();
    gtk_editable_set_text(GTK_EDITABLE(host_entry_), cfg_.host.c_str());
    gtk_box_append(GTK_BOX(settings), labelled_row("Receiver host", host_entry_));

    port_spin_ = gtk_spin_button_new_with_range(1, 65535, 1);
    gtk_spin_button_set_value(GTK_SPIN_BUTTON(port_spin_), cfg_.port);
    gtk_box_append(GTK_BOX(settings), labelled_row("Port", port_spin_));

    frame_size_spin_ = gtk_spin_button_new_with_range(11, 65536, 1);
    gtk_spin_button_set_value(GTK_SPIN_BUTTON(frame_size_spin_), cfg_.frame_size);
    gtk_box_append(GTK_BOX(settings), labelled_row("Frame size", frame_size_spin_));

    columns_spin_ = gtk_spin_button_new_with_range(1, 65535, 1);
    gtk_spin_button_set_value(GTK_SPIN_BUTTON(columns_spin_), cfg_.columns);
    gtk_box_append(GTK_BOX(settings), labelled_row("Grid columns", columns_spin_));

    GtkWidget* quality_row = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    reencode_check_ = gtk_check_button_new_with_label("Re-encode as JPEG");
    gtk_check_button_set_active(GTK_CHECK_BUTTON(reencode_check_), cfg_.reencode);
    gtk_box_append(GTK_BOX(quality_row), reencode_check_);
    quality_spin_ = gtk_spin_button_new_with_range(1, 100, 1);
    gtk_spin_button_set_value(GTK_SPIN_BUTTON(quality_spin_), cfg_.jpeg_quality);
    gtk_box_append(GTK_BOX(quality_row), quality_spin_);
    gtk_box_append(GTK_BOX(settings), labelled_row("Quality", quality_row));

    gtk_box_append(GTK_BOX(panel_), settings);

    // ─── Action row ─────────────────────────────────────────────────────
    GtkWidget* action_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_widget_set_halign(action_box, GTK_ALIGN_CENTER);

    send_button_ = gtk_button_new_with_label("🚀 Send");
    gtk_widget_add_css_class(send_button_, "suggested-action");
    gtk_widget_set_sensitive(send_button_, FALSE);
    g_signal_connect(send_button_, "clicked", G_CALLBACK(on_send_clicked), this);
    gtk_box_append(GTK_BOX(action_box), send_button_);

    clear_button_ = gtk_button_new_with_label("🗑️ Clear");
    gtk_widget_add_css_class(clear_button_, "destructive-action");
    g_signal_connect(clear_button_, "clicked", G_CALLBACK(on_clear_clicked), this);
    gtk_box_append(GTK_BOX(action_box), clear_button_);

    cancel_button_ = gtk_button_new_with_label("⏹ Cancel");
    gtk_widget_add_css_class(cancel_button_, "destructive-action");
    gtk_widget_set_visible(cancel_button_, FALSE);
    g_signal_connect(cancel_button_, "clicked", G_CALLBACK(on_cancel_clicked), this);
    gtk_box_append(GTK_BOX(action_box), cancel_button_);

    gtk_box_append(GTK_BOX(panel_), action_box);

    // ─── Status / Progress ──────────────────────────────────────────────
    status_label_ = gtk_label_new("");
    gtk_widget_add_css_class(status_label_, "status-text");
    gtk_box_append(GTK_BOX(panel_), status_label_);

    progress_bar_ = gtk_progress_bar_new();
    gtk_widget_set_visible(progress_bar_, FALSE);
    gtk_box_append(GTK_BOX(panel_), progress_bar_);

    progress_label_ = gtk_label_new("");
    gtk_widget_add_css_class(progress_label_, "status-text");
    gtk_box_append(GTK_BOX(panel_), progress_label_);
}

ImageSenderPanel::~ImageSenderPanel() {
    if (cancel_flag_) cancel_flag_->store(true);
}

void ImageSenderPanel::add_path(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (fs::is_directory(p, ec)) {
        for (const auto& entry : fs::directory_iterator(p, ec)) {
            if (entry.is_regular_file(ec)) {
                queued_files_.push_back(entry.path().string());
            }
        }
    } else if (fs::is_regular_file(p, ec)) {
        queued_files_.push_back(path);
    }
    update_file_list_ui();
}

void ImageSenderPanel::clear_files() {
    queued_files_.clear();
    update_file_list_ui();
}

void ImageSenderPanel::update_file_list_ui() {
    GtkWidget* child;
    while ((child = gtk_widget_get_first_child(file_list_box_)) != nullptr) {
        gtk_list_box_remove(GTK_LIST_BOX(file_list_box_), child);
    }

    for (const auto& file : queued_files_) {
        std::string display = "🖼️ " + fs::path(file).filename().string();

        std::error_code ec;
        auto fsize = fs::file_size(file, ec);
        if (!ec) {
            char buf[64];
            snprintf(buf, sizeof(buf), " (%.1f KB)", static_cast<double>(fsize) / 1024.0);
            display += buf;
        }

        GtkWidget* label = gtk_label_new(display.c_str());
        gtk_label_set_xalign(GTK_LABEL(label), 0.0);
        gtk_widget_add_css_class(label, "file-item");
        gtk_list_box_append(GTK_LIST_BOX(file_list_box_), label);
    }

    gtk_widget_set_sensitive(send_button_, !queued_files_.empty() && !sending_->load());
}

config::TransmitterConfig ImageSenderPanel::read_settings() const {
    config::TransmitterConfig settings = cfg_;
    settings.identity = gtk_editable_get_text(GTK_EDITABLE(identity_entry_));
    settings.host = gtk_editable_get_text(GTK_EDITABLE(host_entry_));
    settings.port = static_cast<unsigned short>(gtk_spin_button_get_value_as_int(GTK_SPIN_BUTTON(port_spin_)));
    settings.frame_size = static_cast<uint32_t>(gtk_spin_button_get_value_as_int(GTK_SPIN_BUTTON(frame_size_spin_)));
    settings.columns = static_cast<uint32_t>(gtk_spin_button_get_value_as_int(GTK_SPIN_BUTTON(columns_spin_)));
    settings.jpeg_quality = gtk_spin_button_get_value_as_int(GTK_SPIN_BUTTON(quality_spin_));
    settings.reencode = gtk_check_button_get_active(GTK_CHECK_BUTTON(reencode_check_));
    return settings;
}

void ImageSenderPanel::start_sending() {
    if (queued_files_.empty() || sending_->load()) return;

    std::shared_ptr<networking::Transmitter> transmitter;
    try {
        transmitter = std::make_shared<networking::Transmitter>(read_settings(), codec_.get());
    } catch (const std::exception& e) {
        gtk_label_set_text(GTK_LABEL(status_label_), (std::string("❌ ") + e.what()).c_str());
        return;
    }

    sending_->store(true);
    cancel_flag_ = std::make_shared<std::atomic<bool>>(false);

    gtk_widget_set_visible(send_button_, FALSE);
    gtk_widget_set_visible(clear_button_, FALSE);
    gtk_widget_set_visible(cancel_button_, TRUE);
    gtk_widget_set_visible(progress_bar_, TRUE);
    gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(progress_bar_), 0.0);

    GtkWidget* status_lbl = status_label_;
    GtkWidget* progress_br = progress_bar_;
    GtkWidget* progress_lbl = progress_label_;

    networking::TransmitterCallbacks callbacks;
    callbacks.on_status = [status_lbl](const std::string& msg) {
        g_idle_add(update_status_idle, new StatusUpdateData{status_lbl, msg});
    };
    callbacks.on_progress = [progress_br, progress_lbl](const std::string& filename, std::size_t sent, std::size_t total) {
        double frac = (total > 0) ? (static_cast<double>(sent) / total) : 0.0;
        std::string text = filename + ": frame " + std::to_string(sent) + "/" + std::to_string(total);
        g_idle_add(update_progress_idle, new ProgressUpdateData{progress_br, progress_lbl, frac, text});
    };
    callbacks.on_error = [status_lbl](const std::string& filename, const std::string& err) {
        g_idle_add(update_status_idle, new StatusUpdateData{status_lbl, "❌ " + filename + ": " + err});
    };

    auto files = queued_files_;
    auto cancel = cancel_flag_;
    auto sending = sending_;
    auto codec = codec_;
    GtkWidget* send_btn = send_button_;
    GtkWidget* clear_btn = clear_button_;
    GtkWidget* cancel_btn = cancel_button_;

    std::thread([transmitter, codec, files, callbacks, cancel, sending,
                 status_lbl, send_btn, clear_btn, cancel_btn]() {
        std::size_t delivered = transmitter->send_files(files, callbacks, cancel.get());
        sending->store(false);

        std::string message = (cancel->load() ? "⏹ Cancelled after " : "✅ Sent ") +
                              std::to_string(delivered) + " of " + std::to_string(files.size()) + " image(s)";
        g_idle_add(send_finished_idle, new SendFinishedData{status_lbl, send_btn, clear_btn, cancel_btn, message});
    }).detach();
}

// ─── GTK Callbacks ──────────────────────────────────────────────────────────

void ImageSenderPanel::on_choose_files(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<ImageSenderPanel*>(user_data);

G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    GtkFileChooserNative* native = gtk_file_chooser_native_new(
        "Select Images", self->parent_window_,
        GTK_FILE_CHOOSER_ACTION_OPEN, "_Open", "_Cancel");
    gtk_file_chooser_set_select_multiple(GTK_FILE_CHOOSER(native), TRUE);

    GtkFileFilter* filter = gtk_file_filter_new();
    gtk_file_filter_set_name(filter, "Images");
    gtk_file_filter_add_pixbuf_formats(filter);
    gtk_file_chooser_add_filter(GTK_FILE_CHOOSER(native), filter);
    g_object_unref(filter);

    g_signal_connect(native, "response", G_CALLBACK(+[](GtkNativeDialog* dialog, int response, gpointer data) {
        if (response == GTK_RESPONSE_ACCEPT) {
            auto* panel = static_cast<ImageSenderPanel*>(data);
            GListModel* files = gtk_file_chooser_get_files(GTK_FILE_CHOOSER(dialog));
            for (guint i = 0; i < g_list_model_get_n_items(files); i++) {
                GFile* file = G_FILE(g_list_model_get_item(files, i));
                char* path = g_file_get_path(file);
                if (path) {
                    panel->add_path(path);
                    g_free(path);
                }
                g_object_unref(file);
            }
            g_object_unref(files);
        }
        g_object_unref(dialog);
    }), self);

    gtk_native_dialog_show(GTK_NATIVE_DIALOG(native));
G_GNUC_END_IGNORE_DEPRECATIONS
}

void ImageSenderPanel::on_send_clicked(GtkButton* /*button*/, gpointer user_data) {
    static_cast<ImageSenderPanel*>(user_data)->start_sending();
}

void ImageSenderPanel::on_clear_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<ImageSenderPanel*>(user_data);
    self->clear_files();
    gtk_widget_set_visible(self->progress_bar_, FALSE);
    gtk_label_set_text(GTK_LABEL(self->status_label_), "");
    gtk_label_set_text(GTK_LABEL(self->progress_label_), "");
}

void ImageSenderPanel::on_cancel_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<ImageSenderPanel*>(user_data);
    if (self->cancel_flag_) {
        self->cancel_flag_->store(true);
    }
    gtk_label_set_text(GTK_LABEL(self->status_label_), "Cancelling after the current frame...");
}

gboolean ImageSenderPanel::on_drop(GtkDropTarget* /*target*/, const GValue* value,
                                   double /*x*/, double /*y*/, gpointer user_data) {
    auto* self = static_cast<ImageSenderPanel*>(user_data);

    if (G_VALUE_HOLDS(value, GDK_TYPE_FILE_LIST)) {
        GdkFileList* file_list = static_cast<GdkFileList*>(g_value_get_boxed(value));
        GSList* files = gdk_file_list_get_files(file_list);
        for (GSList* l = files; l != nullptr; l = l->next) {
            char* path = g_file_get_path(G_FILE(l->data));
            if (path) {
                self->add_path(path);
                g_free(path);
            }
        }
        g_slist_free(files);
        return TRUE;
    }
    return FALSE;
}

} // namespace ui
