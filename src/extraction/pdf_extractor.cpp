#include <quarry/core/mime.h>
#include <quarry/extraction/pdf_extractor.h>
#include <quarry/extraction/text_utils.h>

#include <spdlog/spdlog.h>

// QPDF headers
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <memory>
#include <optional>

namespace quarry::extraction {

namespace {

// Collects text-showing operators and a rough glyph area estimate
class TextCollector : public QPDFObjectHandle::ParserCallbacks {
public:
    void handleObject(QPDFObjectHandle obj) override {
        if (!obj.isOperator()) {
            operands_.push_back(obj);
            return;
        }
        const auto op = obj.getOperatorValue();
        if (op == "Tf" && operands_.size() >= 2 && operands_.back().isNumber()) {
            fontSize_ = std::abs(operands_.back().getNumericValue());
        } else if (op == "Tj") {
            showString(lastString());
        } else if (op == "'" || op == "\"") {
            newLine();
            showString(lastString());
        } else if (op == "TJ") {
            if (!operands_.empty() && operands_.back().isArray()) {
                for (auto& item : operands_.back().getArrayAsVector()) {
                    if (item.isString()) {
                        showString(item.getUTF8Value());
                    } else if (item.isNumber() && item.getNumericValue() < -200) {
                        // Large negative kerning is a word gap
                        space();
                    }
                }
            }
        } else if (op == "T*") {
            newLine();
        } else if ((op == "Td" || op == "TD") && operands_.size() >= 2) {
            if (operands_.back().isNumber() && operands_.back().getNumericValue() != 0.0) {
                newLine();
            } else {
                space();
            }
        } else if (op == "ET") {
            newLine();
        }
        operands_.clear();
    }

    void handleEOF() override {}

    std::string text() const { return text_; }
    double glyphArea() const { return glyphArea_; }

private:
    std::string lastString() const {
        if (!operands_.empty() && operands_.back().isString()) {
            return operands_.back().getUTF8Value();
        }
        return {};
    }

    void showString(const std::string& s) {
        if (s.empty()) {
            return;
        }
        text_ += s;
        // Average glyph is about half as wide as the font size
        glyphArea_ += static_cast<double>(s.size()) * fontSize_ * fontSize_ * 0.5;
    }

    void space() {
        if (!text_.empty() && text_.back() != ' ' && text_.back() != '\n') {
            text_ += ' ';
        }
    }

    void newLine() {
        if (!text_.empty() && text_.back() != '\n') {
            if (text_.back() == ' ') {
                text_.pop_back();
            }
            text_ += '\n';
        }
    }

    std::vector<QPDFObjectHandle> operands_;
    std::string text_;
    double fontSize_ = 12.0;
    double glyphArea_ = 0.0;
};

std::string infoString(QPDFObjectHandle& info, const std::string& key) {
    if (info.hasKey(key)) {
        auto val = info.getKey(key);
        if (val.isString()) {
            return normalizeWhitespace(val.getUTF8Value());
        }
    }
    return {};
}

double pageArea(QPDFPageObjectHelper& page) {
    auto box = page.getMediaBox();
    if (!box.isRectangle()) {
        return 612.0 * 792.0;
    }
    auto rect = box.getArrayAsRectangle();
    double area = std::abs((rect.urx - rect.llx) * (rect.ury - rect.lly));
    return area > 0.0 ? area : 612.0 * 792.0;
}

std::optional<std::string> imageFormat(QPDFObjectHandle& image) {
    auto filter = image.getDict().getKey("/Filter");
    if (filter.isArray() && filter.getArrayNItems() == 1) {
        filter = filter.getArrayItem(0);
    }
    if (!filter.isName()) {
        return std::nullopt;
    }
    const auto name = filter.getName();
    if (name == "/DCTDecode") {
        return "jpeg";
    }
    if (name == "/JPXDecode") {
        return "jp2";
    }
    return std::nullopt;
}

} // namespace

std::vector<std::string> PdfExtractor::supportedMimeTypes() const {
    return {std::string(mime::kPdf)};
}

std::string PdfExtractor::normalizePdfDate(std::string_view value) {
    if (value.starts_with("D:")) {
        value.remove_prefix(2);
    }
    size_t digits = 0;
    while (digits < value.size() && digits < 14 &&
           std::isdigit(static_cast<unsigned char>(value[digits]))) {
        ++digits;
    }
    if (digits < 4) {
        return std::string(value);
    }
    auto part = [&](size_t pos, size_t len, const char* fallback) {
        return pos + len <= digits ? std::string(value.substr(pos, len)) : std::string(fallback);
    };
    std::string out = part(0, 4, "0000") + "-" + part(4, 2, "01") + "-" + part(6, 2, "01") + "T" +
                      part(8, 2, "00") + ":" + part(10, 2, "00") + ":" + part(12, 2, "00");
    auto tz = value.substr(digits);
    if (tz.empty() || tz.front() == 'Z') {
        return out + "Z";
    }
    if ((tz.front() == '+' || tz.front() == '-') && tz.size() >= 3) {
        std::string offset(1, tz.front());
        offset += std::string(tz.substr(1, 2)) + ":";
        auto minutes = tz.size() >= 6 ? tz.substr(4, 2) : std::string_view("00");
        offset += std::string(minutes);
        return out + offset;
    }
    return out;
}

Result<ExtractionResult> PdfExtractor::extract(std::span<const std::byte> data,
                                               const std::string& mimeType,
                                               const ExtractionConfig& config) {
    const PdfConfig pdfConfig = config.pdfOptions.value_or(PdfConfig{});
    std::vector<std::string> passwords{""};
    passwords.insert(passwords.end(), pdfConfig.passwords.begin(), pdfConfig.passwords.end());

    std::unique_ptr<QPDF> opened;
    bool passwordRejected = false;
    for (const auto& password : passwords) {
        auto candidate = std::make_unique<QPDF>();
        candidate->setSuppressWarnings(true);
        try {
            candidate->processMemoryFile("input.pdf", reinterpret_cast<const char*>(data.data()),
                                  data.size(), password.empty() ? nullptr : password.c_str());
            opened = std::move(candidate);
            break;
        } catch (const QPDFExc& e) {
            if (e.getErrorCode() == qpdf_e_password) {
                passwordRejected = true;
                continue;
            }
            return Error{ErrorCode::Parsing, "Failed to load PDF: " + std::string(e.what())};
        } catch (const std::exception& e) {
            return Error{ErrorCode::Parsing, "Failed to load PDF: " + std::string(e.what())};
        }
    }
    if (!opened) {
        return Error{ErrorCode::Parsing,
                     passwordRejected
                         ? "PDF is encrypted and none of the configured passwords was accepted"
                         : "Failed to load PDF"};
    }

    QPDF& pdf = *opened;
    ExtractionResult result;
    result.mimeType = mimeType;
    try {
        if (pdfConfig.extractMetadata) {
            extractMetadata(pdf, result);
        }
        result.metadata.set("encrypted", pdf.isEncrypted());

        QPDFPageDocumentHelper dh(pdf);
        auto pages = dh.getAllPages();
        if (pages.empty()) {
            return Error{ErrorCode::Parsing, "PDF has no pages"};
        }

        const bool extractImages = pdfConfig.extractImages;
        std::vector<PageContent> pageContents;
        pageContents.reserve(pages.size());
        for (size_t i = 0; i < pages.size(); ++i) {
            pageContents.push_back(extractPage(pages[i], i + 1, result, extractImages));
        }
        // Page breakdown is always kept; OCR decisions need it
        assemblePages(result, std::move(pageContents), config, true);
    } catch (const std::exception& e) {
        return Error{ErrorCode::Parsing, "Failed to read PDF structure: " + std::string(e.what())};
    }
    return result;
}

void PdfExtractor::extractMetadata(QPDF& pdf, ExtractionResult& result) {
    try {
        auto trailer = pdf.getTrailer();
        if (trailer.hasKey("/Info")) {
            QPDFObjectHandle info = trailer.getKey("/Info");
            if (info.isDictionary()) {
                if (auto title = infoString(info, "/Title"); !title.empty()) {
                    result.metadata.title = title;
                }
                if (auto author = infoString(info, "/Author"); !author.empty()) {
                    result.metadata.authors.push_back(author);
                }
                if (auto subject = infoString(info, "/Subject"); !subject.empty()) {
                    result.metadata.subject = subject;
                }
                if (auto keywords = infoString(info, "/Keywords"); !keywords.empty()) {
                    size_t start = 0;
                    while (start <= keywords.size()) {
                        auto sep = keywords.find_first_of(",;", start);
                        auto token = normalizeWhitespace(keywords.substr(
                            start, sep == std::string::npos ? std::string::npos : sep - start));
                        if (!token.empty()) {
                            result.metadata.keywords.push_back(token);
                        }
                        if (sep == std::string::npos) {
                            break;
                        }
                        start = sep + 1;
                    }
                }
                if (auto created = infoString(info, "/CreationDate"); !created.empty()) {
                    result.metadata.createdAt = normalizePdfDate(created);
                }
                if (auto modified = infoString(info, "/ModDate"); !modified.empty()) {
                    result.metadata.modifiedAt = normalizePdfDate(modified);
                }
                if (auto creator = infoString(info, "/Creator"); !creator.empty()) {
                    result.metadata.set("creator", creator);
                }
                if (auto producer = infoString(info, "/Producer"); !producer.empty()) {
                    result.metadata.set("producer", producer);
                }
            }
        }

        result.metadata.set("pdf_version", pdf.getPDFVersion());
    } catch (const std::exception& e) {
        spdlog::warn("Failed to extract PDF metadata: {}", e.what());
        result.addWarning("extraction", std::string("PDF metadata unreadable: ") + e.what());
    }
}

PageContent PdfExtractor::extractPage(QPDFPageObjectHelper& page, size_t pageNumber,
                                      ExtractionResult& result, bool extractImages) {
    PageContent content;
    content.pageNumber = pageNumber;

    TextCollector collector;
    try {
        page.parsePageContents(&collector);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to extract text from page {}: {}", pageNumber, e.what());
        result.addWarning("extraction",
                          "Page " + std::to_string(pageNumber) + " text unreadable: " + e.what());
    }
    content.content = normalizeWhitespace(collector.text());
    content.textCoverage = std::min(1.0, collector.glyphArea() / pageArea(page));

    std::map<std::string, QPDFObjectHandle> images;
    try {
        images = page.getImages();
    } catch (const std::exception& e) {
        spdlog::debug("Page {} image resources unreadable: {}", pageNumber, e.what());
    }
    content.hasVisualContent = !images.empty();

    if (extractImages) {
        if (!result.images) {
            result.images.emplace();
        }
        for (auto& [resourceName, image] : images) {
            auto format = imageFormat(image);
            if (!format) {
                continue;
            }
            try {
                auto raw = image.getRawStreamData();
                ExtractedImage extracted;
                extracted.data.assign(raw->getBuffer(), raw->getBuffer() + raw->getSize());
                extracted.format = *format;
                extracted.imageIndex = result.images->size();
                extracted.pageNumber = pageNumber;
                auto dict = image.getDict();
                if (dict.getKey("/Width").isInteger()) {
                    extracted.width = static_cast<uint32_t>(dict.getKey("/Width").getIntValue());
                }
                if (dict.getKey("/Height").isInteger()) {
                    extracted.height = static_cast<uint32_t>(dict.getKey("/Height").getIntValue());
                }
                result.images->push_back(std::move(extracted));
            } catch (const std::exception& e) {
                spdlog::debug("Skipping image {} on page {}: {}", resourceName, pageNumber,
                              e.what());
            }
        }
    }
    return content;
}

} // namespace quarry::extraction
