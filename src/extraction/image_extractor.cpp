#include <quarry/core/mime.h>
#include <quarry/extraction/image_extractor.h>

#include <spdlog/spdlog.h>

#include <cstring>

namespace quarry::extraction {

namespace {

uint8_t at(std::span<const std::byte> d, size_t i) {
    return static_cast<uint8_t>(d[i]);
}

uint32_t be16(std::span<const std::byte> d, size_t i) {
    return (uint32_t{at(d, i)} << 8) | at(d, i + 1);
}

uint32_t be32(std::span<const std::byte> d, size_t i) {
    return (be16(d, i) << 16) | be16(d, i + 2);
}

uint32_t le16(std::span<const std::byte> d, size_t i) {
    return uint32_t{at(d, i)} | (uint32_t{at(d, i + 1)} << 8);
}

uint32_t le32(std::span<const std::byte> d, size_t i) {
    return le16(d, i) | (le16(d, i + 2) << 16);
}

std::optional<ImageInfo> probeJpeg(std::span<const std::byte> d) {
    size_t pos = 2;
    while (pos + 9 < d.size()) {
        if (at(d, pos) != 0xFF) {
            return std::nullopt;
        }
        const uint8_t marker = at(d, pos + 1);
        if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
            pos += 2;
            continue;
        }
        const uint32_t length = be16(d, pos + 2);
        const bool sof = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 &&
                         marker != 0xCC;
        if (sof) {
            return ImageInfo{"jpeg", be16(d, pos + 7), be16(d, pos + 5)};
        }
        if (length < 2) {
            return std::nullopt;
        }
        pos += 2 + length;
    }
    return std::nullopt;
}

} // namespace

std::optional<ImageInfo> ImageExtractor::probe(std::span<const std::byte> d) {
    if (d.size() >= 24 && at(d, 0) == 0x89 && at(d, 1) == 'P' && at(d, 2) == 'N' &&
        at(d, 3) == 'G') {
        return ImageInfo{"png", be32(d, 16), be32(d, 20)};
    }
    if (d.size() >= 4 && at(d, 0) == 0xFF && at(d, 1) == 0xD8) {
        auto info = probeJpeg(d);
        return info ? info : ImageInfo{"jpeg", 0, 0};
    }
    if (d.size() >= 10 && at(d, 0) == 'G' && at(d, 1) == 'I' && at(d, 2) == 'F') {
        return ImageInfo{"gif", le16(d, 6), le16(d, 8)};
    }
    if (d.size() >= 26 && at(d, 0) == 'B' && at(d, 1) == 'M') {
        const auto height = static_cast<int32_t>(le32(d, 22));
        return ImageInfo{"bmp", le32(d, 18),
                         static_cast<uint32_t>(height < 0 ? -static_cast<int64_t>(height) : height)};
    }
    if (d.size() >= 30 && at(d, 0) == 'R' && at(d, 8) == 'W' && at(d, 9) == 'E' &&
        at(d, 10) == 'B' && at(d, 11) == 'P') {
        if (at(d, 12) == 'V' && at(d, 13) == 'P' && at(d, 14) == '8' && at(d, 15) == 'X') {
            const uint32_t w = 1 + (uint32_t{at(d, 24)} | (uint32_t{at(d, 25)} << 8) |
                                    (uint32_t{at(d, 26)} << 16));
            const uint32_t h = 1 + (uint32_t{at(d, 27)} | (uint32_t{at(d, 28)} << 8) |
                                    (uint32_t{at(d, 29)} << 16));
            return ImageInfo{"webp", w, h};
        }
        if (at(d, 12) == 'V' && at(d, 13) == 'P' && at(d, 14) == '8' && at(d, 15) == ' ') {
            return ImageInfo{"webp", le16(d, 26) & 0x3FFF, le16(d, 28) & 0x3FFF};
        }
        return ImageInfo{"webp", 0, 0};
    }
    if (d.size() >= 4 && ((at(d, 0) == 'I' && at(d, 1) == 'I') || (at(d, 0) == 'M' && at(d, 1) == 'M'))) {
        return ImageInfo{"tiff", 0, 0};
    }
    return std::nullopt;
}

std::vector<std::string> ImageExtractor::supportedMimeTypes() const {
    return {std::string(mime::kPng),  std::string(mime::kJpeg), std::string(mime::kGif),
            std::string(mime::kBmp),  std::string(mime::kTiff), std::string(mime::kWebp)};
}

Result<ExtractionResult> ImageExtractor::extract(std::span<const std::byte> data,
                                                 const std::string& mimeType,
                                                 const ExtractionConfig& config) {
    if (data.empty()) {
        return Error{ErrorCode::ImageProcessing, "Empty image input"};
    }
    auto info = probe(data);
    if (!info) {
        return Error{ErrorCode::ImageProcessing, "Unrecognized image header for " + mimeType};
    }

    ExtractionResult result;
    result.mimeType = mimeType;
    result.metadata.set("format", info->format);
    if (info->width > 0 && info->height > 0) {
        result.metadata.set("width", info->width);
        result.metadata.set("height", info->height);
        const auto limit = config.images.value_or(ImageExtractionConfig{}).maxImageDimension;
        if (limit > 0 && (info->width > static_cast<uint32_t>(limit) ||
                          info->height > static_cast<uint32_t>(limit))) {
            result.addWarning("extraction", "Image exceeds the configured maximum dimension of " +
                                                std::to_string(limit) + " pixels");
        }
    }

    PageContent page;
    page.pageNumber = 1;
    page.hasVisualContent = true;
    page.textCoverage = 0.0;
    result.pages = std::vector<PageContent>{std::move(page)};

    if (config.images && config.images->extractImages) {
        ExtractedImage image;
        image.data.resize(data.size());
        std::memcpy(image.data.data(), data.data(), data.size());
        image.format = info->format;
        image.pageNumber = 1;
        if (info->width > 0) {
            image.width = info->width;
            image.height = info->height;
        }
        result.images = std::vector<ExtractedImage>{std::move(image)};
    }
    spdlog::debug("Image input {}x{} ({})", info->width, info->height, info->format);
    return result;
}

} // namespace quarry::extraction
