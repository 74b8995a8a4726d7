#include "imaging/DocumentAssembler.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <memory>
#include <string>
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <qpdf/QUtil.hh>

namespace tankobon::imaging {

namespace {

// Whole numbers stay integers so ordinary pages read "[0 0 1600 2400]"
QPDFObjectHandle make_number(double value) {
    if (value == std::floor(value)) {
        return QPDFObjectHandle::newInteger(static_cast<long long>(value));
    }
    return QPDFObjectHandle::newReal(value, 4);
}

std::string format_number(double value) {
    if (value == std::floor(value)) {
        return std::to_string(static_cast<long long>(value));
    }
    return QUtil::double_to_string(value, 4);
}

void add_image_page(QPDF& pdf, QPDFPageDocumentHelper& pages, const model::EncodedImage& image) {
    const double unit = DocumentAssembler::user_unit(image.width, image.height);
    const double width = image.width / unit;
    const double height = image.height / unit;

    // JPEG bytes go in as-is; the writer leaves DCT streams alone
    QPDFObjectHandle picture = QPDFObjectHandle::newStream(&pdf);
    QPDFObjectHandle picture_dict = picture.getDict();
    picture_dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    picture_dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
    picture_dict.replaceKey("/Width", QPDFObjectHandle::newInteger(image.width));
    picture_dict.replaceKey("/Height", QPDFObjectHandle::newInteger(image.height));
    picture_dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName("/DeviceRGB"));
    picture_dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
    picture.replaceStreamData(std::string(image.data.begin(), image.data.end()),
                              QPDFObjectHandle::newName("/DCTDecode"), QPDFObjectHandle::newNull());

    QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
    xobjects.replaceKey("/Im0", picture);
    QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/XObject", xobjects);

    const std::string draw = "q\n" + format_number(width) + " 0 0 " + format_number(height) + " 0 0 cm\n/Im0 Do\nQ\n";
    QPDFObjectHandle content = QPDFObjectHandle::newStream(&pdf, draw);

    QPDFObjectHandle media_box = QPDFObjectHandle::newArray();
    media_box.appendItem(QPDFObjectHandle::newInteger(0));
    media_box.appendItem(QPDFObjectHandle::newInteger(0));
    media_box.appendItem(make_number(width));
    media_box.appendItem(make_number(height));

    QPDFObjectHandle page = pdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
    page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
    page.replaceKey("/MediaBox", media_box);
    page.replaceKey("/Resources", resources);
    page.replaceKey("/Contents", content);
    if (unit > 1.0) {
        page.replaceKey("/UserUnit", QPDFObjectHandle::newReal(unit, 4));
    }

    pages.addPage(QPDFPageObjectHelper(page), false);
}

}  // namespace

double DocumentAssembler::user_unit(int width, int height) {
    const int longest = std::max(width, height);
    if (longest <= MAX_PAGE_EXTENT) {
        return 1.0;
    }
    // Rounded up at 4 decimals so the scaled side never exceeds the limit
    return std::ceil(static_cast<double>(longest) / MAX_PAGE_EXTENT * 10000.0) / 10000.0;
}

util::Result<std::vector<uint8_t>> DocumentAssembler::assemble(const std::vector<model::EncodedImage>& images) {
    using R = util::Result<std::vector<uint8_t>>;

    if (images.empty()) {
        return R::failure(util::ErrorKind::Assembly, "no images to assemble");
    }

    bool oversized = false;
    for (size_t i = 0; i < images.size(); ++i) {
        const auto& image = images[i];
        if (image.data.empty() || image.width <= 0 || image.height <= 0) {
            return R::failure(util::ErrorKind::Assembly, "page " + std::to_string(i + 1) + " has no image data");
        }
        oversized = oversized || user_unit(image.width, image.height) > 1.0;
    }

    try {
        QPDF pdf;
        pdf.emptyPDF();
        QPDFPageDocumentHelper pages(pdf);
        for (const auto& image : images) {
            add_image_page(pdf, pages, image);
        }

        QPDFWriter writer(pdf);
        writer.setOutputMemory();
        writer.setDeterministicID(true);
        // UserUnit arrived with PDF 1.6
        writer.setMinimumPDFVersion(oversized ? "1.6" : "1.4");
        writer.write();

        std::unique_ptr<Buffer> buffer(writer.getBuffer());
        const unsigned char* bytes = buffer->getBuffer();
        return std::vector<uint8_t>(bytes, bytes + buffer->getSize());
    } catch (const std::exception& e) {
        return R::failure(util::ErrorKind::Assembly, std::string("pdf write failed: ") + e.what());
    }
}

util::Result<int> DocumentAssembler::count_pages(const std::vector<uint8_t>& document) {
    using R = util::Result<int>;

    if (document.empty()) {
        return R::failure(util::ErrorKind::Assembly, "empty document");
    }
    try {
        QPDF pdf;
        pdf.setSuppressWarnings(true);
        pdf.processMemoryFile("document", reinterpret_cast<const char*>(document.data()), document.size());
        return static_cast<int>(QPDFPageDocumentHelper(pdf).getAllPages().size());
    } catch (const std::exception& e) {
        return R::failure(util::ErrorKind::Assembly, std::string("unreadable pdf: ") + e.what());
    }
}

}  // namespace tankobon::imaging
