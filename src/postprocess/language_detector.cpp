#include <quarry/postprocess/language_detector.h>
#include <quarry/postprocess/text_analysis.h>

#include <algorithm>
#include <map>
#include <unordered_map>

namespace quarry::postprocess {

namespace {

// Minimum share of segments a secondary language needs in multi-language mode
constexpr double kMinSegmentShare = 0.15;
constexpr size_t kSegmentTarget = 400;

const std::unordered_map<std::string, std::string>& distinctiveWords() {
    static const std::unordered_map<std::string, std::string> index = [] {
        std::unordered_map<std::string, std::vector<std::string>> owners;
        for (const auto& lang : stopwordLanguages()) {
            for (const auto& word : stopwords(lang)) {
                owners[word].push_back(lang);
            }
        }
        std::unordered_map<std::string, std::string> unique;
        for (auto& [word, langs] : owners) {
            if (langs.size() == 1) {
                unique.emplace(word, langs.front());
            }
        }
        return unique;
    }();
    return index;
}

// Paragraph-aligned segments of roughly kSegmentTarget bytes
std::vector<std::string_view> segments(std::string_view text) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (start < text.size()) {
        size_t cut = text.find("\n\n", start + std::min(kSegmentTarget, text.size() - start));
        if (cut == std::string_view::npos) {
            cut = text.size();
        }
        out.push_back(text.substr(start, cut - start));
        start = cut + (cut < text.size() ? 2 : 0);
    }
    return out;
}

} // namespace

std::vector<LanguageScore> LanguageDetector::score(std::string_view text) {
    const auto& index = distinctiveWords();
    std::map<std::string, size_t> hits;
    size_t total = 0;
    for (const auto& token : tokenizeWords(text)) {
        if (auto it = index.find(token.lower); it != index.end()) {
            ++hits[it->second];
            ++total;
        }
    }
    std::vector<LanguageScore> scores;
    if (total < kMinHits) {
        return scores;
    }
    for (const auto& [lang, count] : hits) {
        scores.push_back({lang, static_cast<double>(count) / static_cast<double>(total), count});
    }
    std::sort(scores.begin(), scores.end(), [](const auto& a, const auto& b) {
        if (a.confidence != b.confidence) {
            return a.confidence > b.confidence;
        }
        return a.language < b.language;
    });
    return scores;
}

std::vector<std::string> LanguageDetector::detect(std::string_view text,
                                                  const LanguageDetectionConfig& config) {
    std::vector<std::string> languages;
    if (!config.detectMultiple) {
        auto scores = score(text);
        if (!scores.empty() && scores.front().confidence >= config.minConfidence) {
            languages.push_back(scores.front().language);
        }
        return languages;
    }

    std::map<std::string, size_t> wins;
    size_t decided = 0;
    for (auto segment : segments(text)) {
        auto scores = score(segment);
        if (scores.empty() || scores.front().confidence < config.minConfidence) {
            continue;
        }
        ++wins[scores.front().language];
        ++decided;
    }
    std::vector<std::pair<std::string, size_t>> ranked(wins.begin(), wins.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    for (const auto& [lang, count] : ranked) {
        if (static_cast<double>(count) / static_cast<double>(decided) >= kMinSegmentShare) {
            languages.push_back(lang);
        }
    }
    return languages;
}

void LanguageDetector::apply(ExtractionResult& result, const LanguageDetectionConfig& config) {
    auto languages = detect(result.content, config);
    if (!languages.empty() && !result.metadata.language) {
        result.metadata.language = languages.front();
    }
    result.detectedLanguages = std::move(languages);
}

} // namespace quarry::postprocess
