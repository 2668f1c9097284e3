#include <quarry/postprocess/quality.h>
#include <quarry/postprocess/text_analysis.h>

#include <algorithm>
#include <cctype>

namespace quarry::postprocess {

namespace {

constexpr double kLengthWeight = 0.2;
constexpr double kPrintableWeight = 0.35;
constexpr double kStructureWeight = 0.2;
constexpr double kWordShapeWeight = 0.25;

double printableRatio(const std::string& content) {
    size_t printable = 0;
    size_t total = 0;
    for (unsigned char c : content) {
        // Count UTF-8 lead bytes only
        if ((c & 0xC0) == 0x80) {
            continue;
        }
        ++total;
        if (c >= 0x80 || std::isprint(c) || c == '\n' || c == '\t' || c == '\r') {
            ++printable;
        }
    }
    if (content.find("\xEF\xBF\xBD") != std::string::npos) {
        // U+FFFD replacement characters mark lossy decoding
        size_t replacements = 0;
        for (size_t pos = 0; (pos = content.find("\xEF\xBF\xBD", pos)) != std::string::npos; pos += 3) {
            ++replacements;
        }
        printable -= std::min(printable, replacements);
    }
    return total == 0 ? 0.0 : static_cast<double>(printable) / static_cast<double>(total);
}

double structureScore(const ExtractionResult& result) {
    const auto& content = result.content;
    size_t paragraphs = 0;
    size_t headings = 0;
    size_t lines = 0;
    bool inParagraph = false;
    size_t pos = 0;
    while (pos <= content.size()) {
        auto eol = content.find('\n', pos);
        std::string_view line(content.data() + pos,
                              (eol == std::string::npos ? content.size() : eol) - pos);
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string_view::npos) {
            inParagraph = false;
        } else {
            ++lines;
            if (line[first] == '#') {
                ++headings;
            }
            if (!inParagraph) {
                ++paragraphs;
                inParagraph = true;
            }
        }
        if (eol == std::string::npos) {
            break;
        }
        pos = eol + 1;
    }
    if (lines == 0) {
        return 0.0;
    }
    double score = 0.4;
    if (paragraphs > 1) {
        score += 0.3;
    }
    if (headings > 0 || result.metadata.title) {
        score += 0.15;
    }
    if (!result.tables.empty()) {
        score += 0.15;
    }
    // One enormous line is a sign of lost layout
    const double avgLine = static_cast<double>(content.size()) / static_cast<double>(lines);
    if (avgLine > 2000.0) {
        score -= 0.3;
    }
    return std::clamp(score, 0.0, 1.0);
}

double wordShapeScore(const std::string& content) {
    auto tokens = tokenizeWords(content);
    if (tokens.empty()) {
        return 0.0;
    }
    size_t plausible = 0;
    for (const auto& token : tokens) {
        if (token.length > 40) {
            continue;
        }
        size_t alpha = 0;
        for (unsigned char c : token.lower) {
            if (std::isalpha(c) || c >= 0x80) {
                ++alpha;
            }
        }
        if (alpha * 2 >= token.lower.size() || std::all_of(token.lower.begin(), token.lower.end(),
                                                           [](unsigned char c) { return std::isdigit(c); })) {
            ++plausible;
        }
    }
    return static_cast<double>(plausible) / static_cast<double>(tokens.size());
}

} // namespace

QualityBreakdown scoreQuality(const ExtractionResult& result) {
    QualityBreakdown q;
    if (result.content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return q;
    }
    q.length = std::min(1.0, static_cast<double>(result.content.size()) /
                                 static_cast<double>(kQualityTargetLength));
    q.printable = printableRatio(result.content);
    q.structure = structureScore(result);
    q.wordShape = wordShapeScore(result.content);

    const auto& extra = result.metadata.additional;
    if (extra.contains("ocr_status") && extra["ocr_status"] == "failed") {
        q.ocrFactor = kOcrFailurePenalty;
    } else if (extra.contains("ocr_confidence") && extra["ocr_confidence"].is_number()) {
        // Blend toward OCR confidence; perfect recognition keeps the score
        const double confidence = std::clamp(extra["ocr_confidence"].get<double>(), 0.0, 1.0);
        q.ocrFactor = 0.5 + 0.5 * confidence;
    }

    const double weighted = kLengthWeight * q.length + kPrintableWeight * q.printable +
                            kStructureWeight * q.structure + kWordShapeWeight * q.wordShape;
    q.score = std::clamp(weighted * q.ocrFactor, 0.0, 1.0);
    return q;
}

void applyQualityScore(ExtractionResult& result) {
    auto q = scoreQuality(result);
    result.qualityScore = q.score;
    result.metadata.set("quality_breakdown", {{"length", q.length},
                                              {"printable", q.printable},
                                              {"structure", q.structure},
                                              {"word_shape", q.wordShape},
                                              {"ocr_factor", q.ocrFactor}});
}

} // namespace quarry::postprocess
