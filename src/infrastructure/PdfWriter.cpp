/**
 * @file PdfWriter.cpp
 * @brief Implementation of PdfWriter.
 */

#include "infrastructure/PdfWriter.hpp"
#include "domain/PipelineError.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <functional>
#include <iostream>
#include <memory>
#include <sstream>

namespace marklens::infrastructure {

using domain::ErrorKind;
using domain::PipelineError;
using domain::PipelineStage;

namespace {

PipelineError ConversionFailure(const std::string& message) {
    std::cerr << "[PdfWriter] " << message << std::endl;
    return PipelineError(ErrorKind::ConversionError, PipelineStage::Normalize, message);
}

double ToPoints(int pixels) {
    return pixels * 72.0 / PdfWriter::kDefaultDpi;
}

// Builds a document with a single page painting `image` over the whole media box.
std::string WriteSinglePage(int width, int height,
                            const std::function<void(QPDF&, QPDFObjectHandle&)>& fillImage) {
    try {
        QPDF pdf;
        pdf.emptyPDF();

        QPDFObjectHandle image = QPDFObjectHandle::newStream(&pdf);
        fillImage(pdf, image);
        QPDFObjectHandle dict = image.getDict();
        dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
        dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
        dict.replaceKey("/Width", QPDFObjectHandle::newInteger(width));
        dict.replaceKey("/Height", QPDFObjectHandle::newInteger(height));
        dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));

        const double pageWidth = ToPoints(width);
        const double pageHeight = ToPoints(height);

        std::ostringstream content;
        content << "q " << pageWidth << " 0 0 " << pageHeight << " 0 0 cm /Im0 Do Q\n";
        QPDFObjectHandle contents = QPDFObjectHandle::newStream(&pdf, content.str());

        QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
        xobjects.replaceKey("/Im0", image);
        QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
        resources.replaceKey("/XObject", xobjects);

        QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
        page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
        page.replaceKey("/MediaBox",
                        QPDFObjectHandle::newArray(QPDFObjectHandle::Rectangle(0, 0, pageWidth, pageHeight)));
        page.replaceKey("/Contents", contents);
        page.replaceKey("/Resources", resources);
        page = pdf.makeIndirectObject(page);

        QPDFPageDocumentHelper(pdf).addPage(QPDFPageObjectHelper(page), false);

        QPDFWriter writer(pdf);
        writer.setOutputMemory();
        writer.setStaticID(true);
        writer.write();
        std::unique_ptr<Buffer> buffer(writer.getBuffer());
        return std::string(reinterpret_cast<const char*>(buffer->getBuffer()), buffer->getSize());
    } catch (const std::exception& e) {
        throw ConversionFailure(std::string("PDF encoding failed: ") + e.what());
    }
}

} // namespace

std::size_t PdfWriter::CountPages(const std::string& pdfBytes) {
    try {
        QPDF pdf;
        pdf.setSuppressWarnings(true);
        pdf.processMemoryFile("input.pdf", pdfBytes.data(), pdfBytes.size());
        return QPDFPageDocumentHelper(pdf).getAllPages().size();
    } catch (const std::exception& e) {
        throw ConversionFailure(std::string("Not a readable PDF: ") + e.what());
    }
}

std::string PdfWriter::FromRaster(const DecodedImage& image) {
    if (image.width <= 0 || image.height <= 0) {
        throw ConversionFailure("Image has no pixels");
    }
    return WriteSinglePage(image.width, image.height, [&image](QPDF&, QPDFObjectHandle& stream) {
        // No filter: QPDFWriter compresses unfiltered streams with Flate.
        stream.replaceStreamData(image.samples, QPDFObjectHandle::newNull(), QPDFObjectHandle::newNull());
        stream.getDict().replaceKey("/ColorSpace",
                                    QPDFObjectHandle::newName(image.components == 1 ? "/DeviceGray" : "/DeviceRGB"));
    });
}

std::string PdfWriter::FromJpeg(const std::string& jpegBytes, const JpegHeader& header) {
    return WriteSinglePage(header.width, header.height, [&](QPDF&, QPDFObjectHandle& stream) {
        stream.replaceStreamData(jpegBytes, QPDFObjectHandle::newName("/DCTDecode"), QPDFObjectHandle::newNull());
        stream.getDict().replaceKey("/ColorSpace",
                                    QPDFObjectHandle::newName(header.components == 1 ? "/DeviceGray" : "/DeviceRGB"));
    });
}

} // namespace marklens::infrastructure
