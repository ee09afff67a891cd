#pragma once

#include <gtk/gtk.h>
#include <string>
#include "imaging.hpp"

namespace ui {

// New reference to a texture holding a copy of the image pixels
GdkTexture* make_texture(const imaging::Image& image);

// Full-size view of one feed slot's latest image
class FeedDetailWindow {
public:
    FeedDetailWindow(GtkWindow* parent, const std::string& title);

    void set_image(const imaging::ImagePtr& image);
    void set_details(const std::string& text);
    void show();

    GtkWidget* get_widget() const { return window_; }

private:
    GtkWidget* window_;
    GtkWidget* picture_;
    GtkWidget* details_label_;
};

} // namespace ui
