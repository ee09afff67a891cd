#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace imaging {

// Decoded 8-bit RGB(A) image, rows `rowstride` bytes apart
struct Image {
    int width = 0;
    int height = 0;
    int channels = 0;
    int rowstride = 0;
    std::vector<uint8_t> pixels;

    bool has_alpha() const { return channels == 4; }
};

using ImagePtr = std::shared_ptr<const Image>;

// Compressed-image codec used by the receiver (decode) and by the
// transmitter when re-encoding before send.
class ImageCodec {
public:
    virtual ~ImageCodec() = default;

    // Throws errors::DecodeError when the bytes are not a supported image
    virtual ImagePtr decode(const std::vector<uint8_t>& bytes) = 0;

    // format is "jpeg" or "png"; quality applies to jpeg only
    virtual std::vector<uint8_t> encode(const Image& image, const std::string& format, int quality) = 0;
};

// gdk-pixbuf backed codec (JPEG, PNG and whatever loaders are installed)
class PixbufCodec : public ImageCodec {
public:
    ImagePtr decode(const std::vector<uint8_t>& bytes) override;
    std::vector<uint8_t> encode(const Image& image, const std::string& format, int quality) override;
};

} // namespace imaging
