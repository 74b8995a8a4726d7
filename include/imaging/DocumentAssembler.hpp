#pragma once

#include "model/Book.hpp"
#include "util/Result.hpp"
#include <cstdint>
#include <vector>

namespace tankobon::imaging {

/**
 * Builds one PDF from an ordered list of JPEG pages (qpdf).
 *
 * Each page's MediaBox is the image's own pixel size in points (72 DPI,
 * no margins). A page longer than MAX_PAGE_EXTENT on either side gets a
 * /UserUnit instead and a MediaBox scaled down by it, which raises the
 * file to PDF 1.6. JPEG data is embedded unchanged through /DCTDecode and
 * the file ID is derived from the content, so the output is deterministic
 * for identical input.
 */
class DocumentAssembler {
public:
    static constexpr const char* EXTENSION = "pdf";
    // Largest page side in default user space units (PDF 1.4 implementation limits)
    static constexpr int MAX_PAGE_EXTENT = 14400;

    [[nodiscard]] static util::Result<std::vector<uint8_t>> assemble(const std::vector<model::EncodedImage>& images);

    // Page count of any readable PDF
    [[nodiscard]] static util::Result<int> count_pages(const std::vector<uint8_t>& document);

    // 1.0 for pages within MAX_PAGE_EXTENT, else the factor that brings the longest side back under it
    [[nodiscard]] static double user_unit(int width, int height);
};

}  // namespace tankobon::imaging
