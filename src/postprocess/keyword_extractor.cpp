#include <quarry/postprocess/keyword_extractor.h>
#include <quarry/postprocess/text_analysis.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace quarry::postprocess {

namespace {

struct Candidate {
    std::string text;
    double score = 0.0;
    std::vector<size_t> positions;
};

bool usableWord(const WordToken& token, const std::unordered_set<std::string>& stops) {
    if (token.lower.size() < 2 || stops.contains(token.lower)) {
        return false;
    }
    return !std::all_of(token.lower.begin(), token.lower.end(),
                        [](unsigned char c) { return std::isdigit(c) || c == '\''; });
}

bool punctuationBetween(std::string_view text, const WordToken& a, const WordToken& b) {
    for (size_t i = a.offset + a.length; i < b.offset; ++i) {
        const char c = text[i];
        if (c != ' ' && c != '\t' && c != '-') {
            return true;
        }
    }
    return false;
}

// Runs of usable words not interrupted by stopwords or punctuation
std::vector<std::vector<const WordToken*>> phrases(std::string_view text,
                                                   const std::vector<WordToken>& tokens,
                                                   const std::unordered_set<std::string>& stops) {
    std::vector<std::vector<const WordToken*>> out;
    std::vector<const WordToken*> current;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (!usableWord(token, stops)) {
            if (!current.empty()) {
                out.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        if (!current.empty() && punctuationBetween(text, *current.back(), token)) {
            out.push_back(std::move(current));
            current.clear();
        }
        current.push_back(&token);
    }
    if (!current.empty()) {
        out.push_back(std::move(current));
    }
    return out;
}

std::string joinWords(const std::vector<const WordToken*>& words, size_t from, size_t count) {
    std::string out;
    for (size_t i = from; i < from + count; ++i) {
        if (!out.empty()) {
            out += ' ';
        }
        out += words[i]->lower;
    }
    return out;
}

std::vector<Candidate> frequencyCandidates(std::string_view text,
                                           const std::vector<WordToken>& tokens,
                                           const std::unordered_set<std::string>& stops,
                                           const KeywordConfig& config) {
    std::unordered_map<std::string, size_t> tf;
    std::unordered_map<std::string, std::set<std::string>> neighbours;
    std::vector<const WordToken*> usable;
    for (const auto& token : tokens) {
        if (usableWord(token, stops)) {
            usable.push_back(&token);
        }
    }
    const size_t window = std::max<size_t>(config.windowSize, 1);
    for (size_t i = 0; i < usable.size(); ++i) {
        ++tf[usable[i]->lower];
        for (size_t j = i + 1; j < usable.size() && j <= i + window; ++j) {
            if (usable[j]->lower != usable[i]->lower) {
                neighbours[usable[i]->lower].insert(usable[j]->lower);
                neighbours[usable[j]->lower].insert(usable[i]->lower);
            }
        }
    }
    auto wordScore = [&](const std::string& w) {
        return static_cast<double>(tf[w]) * (1.0 + std::log1p(static_cast<double>(neighbours[w].size())));
    };

    const size_t minN = std::max<size_t>(config.ngramMin, 1);
    const size_t maxN = std::max(config.ngramMax, minN);
    std::map<std::string, Candidate> candidates;
    for (const auto& phrase : phrases(text, tokens, stops)) {
        for (size_t n = minN; n <= maxN && n <= phrase.size(); ++n) {
            for (size_t start = 0; start + n <= phrase.size(); ++start) {
                auto key = joinWords(phrase, start, n);
                auto& c = candidates[key];
                c.text = key;
                c.positions.push_back(phrase[start]->offset);
            }
        }
    }
    std::vector<Candidate> out;
    for (auto& [key, c] : candidates) {
        double sum = 0.0;
        size_t words = 0;
        size_t pos = 0;
        while (pos <= key.size()) {
            auto space = key.find(' ', pos);
            sum += wordScore(key.substr(pos, space == std::string::npos ? std::string::npos : space - pos));
            ++words;
            if (space == std::string::npos) {
                break;
            }
            pos = space + 1;
        }
        // Repeated multi-word phrases outrank their parts
        c.score = (sum / static_cast<double>(words)) *
                  (words > 1 ? std::sqrt(static_cast<double>(c.positions.size())) : 1.0);
        if (words > 1 && c.positions.size() < 2) {
            c.score *= 0.5;
        }
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<Candidate> rakeCandidates(std::string_view text, const std::vector<WordToken>& tokens,
                                      const std::unordered_set<std::string>& stops,
                                      const KeywordConfig& config) {
    auto all = phrases(text, tokens, stops);
    const size_t maxN = std::max<size_t>(config.ngramMax, 1);
    const size_t minN = std::clamp<size_t>(config.ngramMin, 1, maxN);

    // Long runs are cut into ngramMax-sized pieces
    std::vector<std::vector<const WordToken*>> pieces;
    for (auto& phrase : all) {
        for (size_t start = 0; start < phrase.size(); start += maxN) {
            size_t len = std::min(maxN, phrase.size() - start);
            pieces.emplace_back(phrase.begin() + static_cast<std::ptrdiff_t>(start),
                                phrase.begin() + static_cast<std::ptrdiff_t>(start + len));
        }
    }

    std::unordered_map<std::string, double> freq;
    std::unordered_map<std::string, double> degree;
    for (const auto& piece : pieces) {
        for (const auto* word : piece) {
            freq[word->lower] += 1.0;
            degree[word->lower] += static_cast<double>(piece.size());
        }
    }

    std::map<std::string, Candidate> candidates;
    for (const auto& piece : pieces) {
        if (piece.size() < minN) {
            continue;
        }
        auto key = joinWords(piece, 0, piece.size());
        auto& c = candidates[key];
        if (c.positions.empty()) {
            c.text = key;
            for (const auto* word : piece) {
                c.score += degree[word->lower] / freq[word->lower];
            }
        }
        c.positions.push_back(piece.front()->offset);
    }
    std::vector<Candidate> out;
    for (auto& [_, c] : candidates) {
        out.push_back(std::move(c));
    }
    return out;
}

} // namespace

std::vector<Keyword> KeywordExtractor::extract(std::string_view text, const KeywordConfig& config,
                                               std::string_view language) {
    std::vector<Keyword> keywords;
    if (config.maxKeywords == 0) {
        return keywords;
    }
    const auto tokens = tokenizeWords(text);
    const auto& stops = stopwords(language);
    const bool rake = config.algorithm == KeywordAlgorithm::Cooccurrence;
    auto candidates = rake ? rakeCandidates(text, tokens, stops, config)
                           : frequencyCandidates(text, tokens, stops, config);
    if (candidates.empty()) {
        return keywords;
    }

    double best = 0.0;
    for (const auto& c : candidates) {
        best = std::max(best, c.score);
    }
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.text < b.text;
    });

    for (auto& c : candidates) {
        if (keywords.size() >= config.maxKeywords) {
            break;
        }
        const double normalized = best > 0.0 ? c.score / best : 0.0;
        if (normalized < config.minScore) {
            break;
        }
        keywords.push_back(
            Keyword{std::move(c.text), normalized, toString(config.algorithm), std::move(c.positions)});
    }
    return keywords;
}

void KeywordExtractor::apply(ExtractionResult& result, const KeywordConfig& config) {
    std::string language = "eng";
    if (config.language) {
        language = *config.language;
    } else if (result.detectedLanguages && !result.detectedLanguages->empty()) {
        language = result.detectedLanguages->front();
    } else if (result.metadata.language) {
        language = *result.metadata.language;
    }
    result.keywords = extract(result.content, config, language);
}

} // namespace quarry::postprocess
