#pragma once

#include "model/Book.hpp"
#include "util/Result.hpp"
#include <cstdint>
#include <vector>

namespace tankobon::imaging {

struct Dimensions {
    int width = 0;
    int height = 0;

    bool operator==(const Dimensions&) const = default;
};

// Decodes, validates, resizes and re-encodes one raw image payload.
// Stateless and thread-safe; no I/O beyond the given buffer.
class ImageNormalizer {
public:
    static constexpr int PREFERRED_WIDTH = 1600;
    static constexpr int MAX_DIMENSION = 65500;
    static constexpr int MIN_DIMENSION = 4;
    static constexpr int JPEG_QUALITY = 90;
    static constexpr int OUTPUT_DPI = 72;

    [[nodiscard]] static util::Result<model::EncodedImage> normalize(const std::vector<uint8_t>& raw);

    // Target size for a source size: preferred width keeping aspect ratio,
    // then height-driven correction, width-driven correction, floor.
    // Source dimensions must be non-zero.
    [[nodiscard]] static Dimensions target_dimensions(int source_width, int source_height);

    // RGB8 pixels -> baseline JPEG with the output DPI in its JFIF header
    [[nodiscard]] static std::vector<uint8_t> encode_jpeg(const uint8_t* rgb, int width, int height,
                                                          int quality = JPEG_QUALITY);

    // Rewrites (or inserts) the JFIF APP0 segment density as dots per inch.
    // Returns false if the buffer is not a JPEG stream.
    static bool set_jpeg_density(std::vector<uint8_t>& jpeg, int dpi);
};

}  // namespace tankobon::imaging
