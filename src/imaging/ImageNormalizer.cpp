#include "imaging/ImageNormalizer.hpp"
#include <algorithm>
#include <iterator>
#include <memory>
#include <string>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_JPEG
#define STBI_ONLY_PNG
#define STBI_ONLY_GIF
#define STBI_ONLY_BMP
#include <stb/stb_image.h>

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb/stb_image_resize2.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

namespace tankobon::imaging {

namespace {

struct StbiDeleter {
    void operator()(unsigned char* p) const { stbi_image_free(p); }
};
using StbiPixels = std::unique_ptr<unsigned char, StbiDeleter>;

void append_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

}  // namespace

Dimensions ImageNormalizer::target_dimensions(int source_width, int source_height) {
    const double ow = source_width;
    const double oh = source_height;

    // Kept in double until clamped: extreme ratios overflow int
    double width = PREFERRED_WIDTH;
    double height = oh * (width / ow);

    // Height-driven correction first
    if (height > MAX_DIMENSION) {
        width = ow * (MAX_DIMENSION / oh);
        height = MAX_DIMENSION;
    }

    // Then width-driven correction
    if (width > MAX_DIMENSION) {
        height = oh * (MAX_DIMENSION / ow);
        width = MAX_DIMENSION;
    }

    width = std::clamp(width, static_cast<double>(MIN_DIMENSION), static_cast<double>(MAX_DIMENSION));
    height = std::clamp(height, static_cast<double>(MIN_DIMENSION), static_cast<double>(MAX_DIMENSION));

    return {static_cast<int>(width), static_cast<int>(height)};
}

util::Result<model::EncodedImage> ImageNormalizer::normalize(const std::vector<uint8_t>& raw) {
    using R = util::Result<model::EncodedImage>;

    if (raw.empty()) {
        return R::failure(util::ErrorKind::Decode, "empty payload");
    }

    // Servers may ignore Accept; name the format instead of a generic decoder failure
    if (raw.size() >= 12 && std::equal(raw.begin(), raw.begin() + 4, "RIFF") &&
        std::equal(raw.begin() + 8, raw.begin() + 12, "WEBP")) {
        return R::failure(util::ErrorKind::Decode, "WebP images are not supported");
    }

    // Structural check before committing to a full decode
    int w = 0, h = 0, channels = 0;
    if (!stbi_info_from_memory(raw.data(), static_cast<int>(raw.size()), &w, &h, &channels)) {
        const char* reason = stbi_failure_reason();
        return R::failure(util::ErrorKind::Decode,
                          std::string("not a recognised image: ") + (reason ? reason : "unknown"));
    }
    if (w <= 0 || h <= 0) {
        return R::failure(util::ErrorKind::InvalidDimensions,
                          "invalid image dimensions " + std::to_string(w) + "x" + std::to_string(h));
    }

    // Three channels requested: alpha is dropped, palette and grey are expanded
    StbiPixels pixels(stbi_load_from_memory(raw.data(), static_cast<int>(raw.size()), &w, &h, &channels, 3));
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        return R::failure(util::ErrorKind::Decode,
                          std::string("decode failed: ") + (reason ? reason : "unknown"));
    }

    const Dimensions target = target_dimensions(w, h);

    std::vector<uint8_t> resized(static_cast<size_t>(target.width) * target.height * 3);
    const bool shrinking = static_cast<int64_t>(target.width) * target.height < static_cast<int64_t>(w) * h;
    auto* ok = stbir_resize(pixels.get(), w, h, 0, resized.data(), target.width, target.height, 0,
                            STBIR_RGB, STBIR_TYPE_UINT8, STBIR_EDGE_CLAMP,
                            shrinking ? STBIR_FILTER_BOX : STBIR_FILTER_CATMULLROM);
    pixels.reset();
    if (!ok) {
        return R::failure(util::ErrorKind::Decode, "resize failed");
    }

    model::EncodedImage image;
    image.data = encode_jpeg(resized.data(), target.width, target.height);
    if (image.data.empty()) {
        return R::failure(util::ErrorKind::Decode, "jpeg encode failed");
    }
    image.width = target.width;
    image.height = target.height;
    return image;
}

std::vector<uint8_t> ImageNormalizer::encode_jpeg(const uint8_t* rgb, int width, int height, int quality) {
    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(width) * height / 4);

    if (!stbi_write_jpg_to_func(append_to_vector, &out, width, height, 3, rgb, quality)) {
        return {};
    }
    set_jpeg_density(out, OUTPUT_DPI);
    return out;
}

bool ImageNormalizer::set_jpeg_density(std::vector<uint8_t>& jpeg, int dpi) {
    if (jpeg.size() < 4 || jpeg[0] != 0xFF || jpeg[1] != 0xD8) {
        return false;
    }

    const uint8_t hi = static_cast<uint8_t>((dpi >> 8) & 0xFF);
    const uint8_t lo = static_cast<uint8_t>(dpi & 0xFF);

    // Existing JFIF APP0: FF E0 <len:2> "JFIF\0" <ver:2> <units> <xd:2> <yd:2> ...
    static constexpr uint8_t JFIF_ID[5] = {'J', 'F', 'I', 'F', 0};
    if (jpeg.size() >= 18 && jpeg[2] == 0xFF && jpeg[3] == 0xE0 &&
        std::equal(std::begin(JFIF_ID), std::end(JFIF_ID), jpeg.begin() + 6)) {
        jpeg[13] = 1;  // dots per inch
        jpeg[14] = hi;
        jpeg[15] = lo;
        jpeg[16] = hi;
        jpeg[17] = lo;
        return true;
    }

    const uint8_t app0[] = {
        0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F', 0x00, 0x01, 0x01,
        0x01, hi, lo, hi, lo, 0x00, 0x00
    };
    jpeg.insert(jpeg.begin() + 2, std::begin(app0), std::end(app0));
    return true;
}

}  // namespace tankobon::imaging
