#pragma once

#include <quarry/ocr/ocr_backend.h>

#include <memory>
#include <mutex>
#include <optional>

namespace quarry::ocr {

/**
 * @brief Tesseract OCR engine (compiled in with QUARRY_HAVE_TESSERACT).
 *
 * A fresh TessBaseAPI is created per image so concurrent calls do not share
 * engine state. The available language list is read once from tessdata.
 */
class TesseractBackend : public OcrBackend {
public:
    std::string name() const override { return "tesseract"; }

    Result<void> initialize() override;
    std::vector<std::string> supportedLanguages() const override;
    Result<OcrResult> processImage(std::span<const std::byte> image,
                                   const std::string& language) override;

private:
    mutable std::once_flag languagesOnce_;
    mutable std::vector<std::string> languages_;
};

} // namespace quarry::ocr
