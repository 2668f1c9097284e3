#include <quarry/ocr/ocr_backend.h>

#include <algorithm>

namespace quarry::ocr {

bool OcrBackend::supportsLanguage(const std::string& language) const {
    if (language.empty()) {
        return false;
    }
    const auto supported = supportedLanguages();
    size_t start = 0;
    while (start <= language.size()) {
        auto plus = language.find('+', start);
        auto lang = language.substr(start, plus == std::string::npos ? std::string::npos
                                                                     : plus - start);
        if (lang.empty() || std::find(supported.begin(), supported.end(), lang) == supported.end()) {
            return false;
        }
        if (plus == std::string::npos) {
            break;
        }
        start = plus + 1;
    }
    return true;
}

} // namespace quarry::ocr
