#include <quarry/core/mime.h>

#include <algorithm>
#include <cctype>

namespace quarry::mime {

std::string normalize(std::string_view mimeType) {
    auto semi = mimeType.find(';');
    if (semi != std::string_view::npos) {
        mimeType = mimeType.substr(0, semi);
    }
    while (!mimeType.empty() && std::isspace(static_cast<unsigned char>(mimeType.front()))) {
        mimeType.remove_prefix(1);
    }
    while (!mimeType.empty() && std::isspace(static_cast<unsigned char>(mimeType.back()))) {
        mimeType.remove_suffix(1);
    }
    std::string out(mimeType);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (out == "text/x-markdown") {
        return std::string(kMarkdown);
    }
    if (out == "image/jpg") {
        return std::string(kJpeg);
    }
    return out;
}

bool isImage(std::string_view mimeType) {
    return mimeType.starts_with("image/") && mimeType != kSvg;
}

bool isGeneric(std::string_view mimeType) {
    return mimeType.empty() || mimeType == kOctetStream || mimeType == kZip ||
           mimeType == kPlainText || mimeType == kOle2;
}

} // namespace quarry::mime
