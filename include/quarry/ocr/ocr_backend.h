#pragma once

#include <quarry/core/types.h>
#include <quarry/plugins/plugin.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace quarry::ocr {

struct BoundingBox {
    int32_t left = 0;
    int32_t top = 0;
    int32_t width = 0;
    int32_t height = 0;
};

struct OcrElement {
    std::string text;
    double confidence = 0.0; // 0..1
    BoundingBox geometry;
};

struct OcrResult {
    std::string text;
    std::vector<OcrElement> elements;
    std::optional<double> rotationDegrees;

    [[nodiscard]] double meanConfidence() const {
        if (elements.empty()) {
            return 0.0;
        }
        double sum = 0.0;
        for (const auto& e : elements) {
            sum += e.confidence;
        }
        return sum / static_cast<double>(elements.size());
    }
};

/**
 * @brief OCR engine behind a stable interface.
 *
 * Implementations may wrap an in-process library or an out-of-process engine;
 * processImage() may be slow and is never called with registry locks held.
 */
class OcrBackend : public plugins::Plugin {
public:
    virtual std::vector<std::string> supportedLanguages() const = 0;

    virtual Result<OcrResult> processImage(std::span<const std::byte> image,
                                           const std::string& language) = 0;

    // Accepts "eng" as well as multi-language requests like "eng+deu"
    bool supportsLanguage(const std::string& language) const;
};

} // namespace quarry::ocr
