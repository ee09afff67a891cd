#include "ui/feed_detail.hpp"

namespace ui {

GdkTexture* make_texture(const imaging::Image& image) {
    GBytes* bytes = g_bytes_new(image.pixels.data(), image.pixels.size());
    GdkTexture* texture = gdk_memory_texture_new(
        image.width, image.height,
        image.has_alpha() ? GDK_MEMORY_R8G8B8A8 : GDK_MEMORY_R8G8B8,
        bytes, image.rowstride);
    g_bytes_unref(bytes);
    return texture;
}

FeedDetailWindow::FeedDetailWindow(GtkWindow* parent, const std::string& title) {
    window_ = gtk_window_new();
    gtk_window_set_title(GTK_WINDOW(window_), title.c_str());
    gtk_window_set_default_size(GTK_WINDOW(window_), 800, 640);
    if (parent) {
        gtk_window_set_transient_for(GTK_WINDOW(window_), parent);
    }

    GtkWidget* vbox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 12);
    gtk_widget_set_margin_start(vbox, 16);
    gtk_widget_set_margin_end(vbox, 16);
    gtk_widget_set_margin_top(vbox, 16);
    gtk_widget_set_margin_bottom(vbox, 16);

    picture_ = gtk_picture_new();
    gtk_picture_set_can_shrink(GTK_PICTURE(picture_), TRUE);
    gtk_widget_set_vexpand(picture_, TRUE);
    gtk_widget_add_css_class(picture_, "feed-picture");
    gtk_box_append(GTK_BOX(vbox), picture_);

    details_label_ = gtk_label_new("");
    gtk_widget_add_css_class(details_label_, "status-text");
    gtk_label_set_xalign(GTK_LABEL(details_label_), 0.0);
    gtk_label_set_selectable(GTK_LABEL(details_label_), TRUE);
    gtk_box_append(GTK_BOX(vbox), details_label_);

    gtk_window_set_child(GTK_WINDOW(window_), vbox);
}

void FeedDetailWindow::set_image(const imaging::ImagePtr& image) {
    if (!image) {
        gtk_picture_set_paintable(GTK_PICTURE(picture_), nullptr);
        return;
    }
    GdkTexture* texture = make_texture(*image);
    gtk_picture_set_paintable(GTK_PICTURE(picture_), GDK_PAINTABLE(texture));
    g_object_unref(texture);
}

void FeedDetailWindow::set_details(const std::string& text) {
    gtk_label_set_text(GTK_LABEL(details_label_), text.c_str());
}

void FeedDetailWindow::show() {
    gtk_window_present(GTK_WINDOW(window_));
}

} // namespace ui
