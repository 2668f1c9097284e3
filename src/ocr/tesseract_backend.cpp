#include <quarry/ocr/tesseract_backend.h>

#include <spdlog/spdlog.h>

#include <leptonica/allheaders.h>
#include <tesseract/baseapi.h>

namespace quarry::ocr {

namespace {

struct PixDeleter {
    void operator()(Pix* pix) const {
        if (pix) {
            pixDestroy(&pix);
        }
    }
};
using PixPtr = std::unique_ptr<Pix, PixDeleter>;

struct ApiDeleter {
    void operator()(tesseract::TessBaseAPI* api) const {
        api->End();
        delete api;
    }
};
using ApiPtr = std::unique_ptr<tesseract::TessBaseAPI, ApiDeleter>;

} // namespace

Result<void> TesseractBackend::initialize() {
    if (supportedLanguages().empty()) {
        return missingDependency("tesseract",
                                 "Tesseract is installed but no traineddata files were found; "
                                 "check TESSDATA_PREFIX");
    }
    return {};
}

std::vector<std::string> TesseractBackend::supportedLanguages() const {
    std::call_once(languagesOnce_, [this] {
        ApiPtr api(new tesseract::TessBaseAPI());
        if (api->Init(nullptr, nullptr) != 0) {
            spdlog::warn("Tesseract Init failed while listing languages");
            return;
        }
        std::vector<std::string> langs;
        api->GetAvailableLanguagesAsVector(&langs);
        languages_ = std::move(langs);
        spdlog::debug("Tesseract languages available: {}", languages_.size());
    });
    return languages_;
}

Result<OcrResult> TesseractBackend::processImage(std::span<const std::byte> image,
                                                 const std::string& language) {
    ApiPtr api(new tesseract::TessBaseAPI());
    if (api->Init(nullptr, language.c_str()) != 0) {
        return Error{ErrorCode::Ocr, "Tesseract Init failed for language '" + language + "'"};
    }

    PixPtr pix(pixReadMem(reinterpret_cast<const l_uint8*>(image.data()), image.size()));
    if (!pix) {
        return Error{ErrorCode::ImageProcessing, "Leptonica failed to decode image"};
    }
    if (pixGetDepth(pix.get()) > 8) {
        // Grayscale improves recognition on colour scans
        PixPtr gray(pixConvertRGBToGray(pix.get(), 0.0f, 0.0f, 0.0f));
        if (gray) {
            pix = std::move(gray);
        }
    }

    api->SetImage(pix.get());
    if (api->Recognize(nullptr) != 0) {
        return Error{ErrorCode::Ocr, "Tesseract recognition failed"};
    }

    OcrResult result;
    std::unique_ptr<char[]> text(api->GetUTF8Text());
    if (text) {
        result.text = text.get();
    }

    std::unique_ptr<tesseract::ResultIterator> it(api->GetIterator());
    if (it) {
        const auto level = tesseract::RIL_WORD;
        do {
            std::unique_ptr<char[]> word(it->GetUTF8Text(level));
            if (!word) {
                continue;
            }
            OcrElement element;
            element.text = word.get();
            element.confidence = static_cast<double>(it->Confidence(level)) / 100.0;
            int x1 = 0, y1 = 0, x2 = 0, y2 = 0;
            if (it->BoundingBox(level, &x1, &y1, &x2, &y2)) {
                element.geometry = {x1, y1, x2 - x1, y2 - y1};
            }
            result.elements.push_back(std::move(element));
        } while (it->Next(level));
    }

    int orientation = 0;
    float orientationConfidence = 0.0f;
    const char* script = nullptr;
    float scriptConfidence = 0.0f;
    if (api->DetectOrientationScript(&orientation, &orientationConfidence, &script,
                                     &scriptConfidence)) {
        result.rotationDegrees = static_cast<double>(orientation);
    }

    api->Clear();
    spdlog::debug("Tesseract recognized {} words ({} chars)", result.elements.size(),
                  result.text.size());
    return result;
}

} // namespace quarry::ocr
