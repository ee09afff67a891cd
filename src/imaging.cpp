#include "imaging.hpp"
#include "errors.hpp"
#include <gdk-pixbuf/gdk-pixbuf.h>
#include <stdexcept>

namespace imaging {

namespace {

std::string take_message(GError* error, const char* fallback) {
    if (!error) return fallback;
    std::string message = error->message ? error->message : fallback;
    g_error_free(error);
    return message;
}

} // namespace

ImagePtr PixbufCodec::decode(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw errors::DecodeError("no image data to decode");
    }

    GdkPixbufLoader* loader = gdk_pixbuf_loader_new();
    GError* error = nullptr;

    // A failed write leaves the loader closed already
    if (!gdk_pixbuf_loader_write(loader, bytes.data(), bytes.size(), &error)) {
        g_object_unref(loader);
        throw errors::DecodeError(take_message(error, "image loader rejected the data"));
    }
    if (!gdk_pixbuf_loader_close(loader, &error)) {
        g_object_unref(loader);
        throw errors::DecodeError(take_message(error, "image data is truncated or corrupt"));
    }

    GdkPixbuf* pixbuf = gdk_pixbuf_loader_get_pixbuf(loader);
    if (!pixbuf) {
        g_object_unref(loader);
        throw errors::DecodeError("image loader produced no picture");
    }

    auto image = std::make_shared<Image>();
    image->width = gdk_pixbuf_get_width(pixbuf);
    image->height = gdk_pixbuf_get_height(pixbuf);
    image->channels = gdk_pixbuf_get_n_channels(pixbuf);
    image->rowstride = gdk_pixbuf_get_rowstride(pixbuf);

    gsize length = gdk_pixbuf_get_byte_length(pixbuf);
    const guint8* pixels = gdk_pixbuf_read_pixels(pixbuf);
    image->pixels.assign(pixels, pixels + length);

    g_object_unref(loader);
    return image;
}

std::vector<uint8_t> PixbufCodec::encode(const Image& image, const std::string& format, int quality) {
    if (format != "jpeg" && format != "png") {
        throw errors::ConfigurationError("unsupported image format: " + format);
    }
    if (image.pixels.empty() || image.width <= 0 || image.height <= 0) {
        throw std::invalid_argument("cannot encode an empty image");
    }

    GBytes* data = g_bytes_new(image.pixels.data(), image.pixels.size());
    GdkPixbuf* pixbuf = gdk_pixbuf_new_from_bytes(data, GDK_COLORSPACE_RGB, image.has_alpha(), 8,
                                                  image.width, image.height, image.rowstride);
    g_bytes_unref(data);

    gchar* buffer = nullptr;
    gsize size = 0;
    GError* error = nullptr;
    gboolean saved;
    if (format == "jpeg") {
        std::string q = std::to_string(quality < 1 ? 1 : (quality > 100 ? 100 : quality));
        saved = gdk_pixbuf_save_to_buffer(pixbuf, &buffer, &size, "jpeg", &error, "quality", q.c_str(), nullptr);
    } else {
        saved = gdk_pixbuf_save_to_buffer(pixbuf, &buffer, &size, "png", &error, nullptr);
    }
    g_object_unref(pixbuf);

    if (!saved) {
        throw std::runtime_error("image encode failed: " + take_message(error, format.c_str()));
    }

    std::vector<uint8_t> out(reinterpret_cast<uint8_t*>(buffer), reinterpret_cast<uint8_t*>(buffer) + size);
    g_free(buffer);
    return out;
}

} // namespace imaging
