#include <quarry/postprocess/text_analysis.h>
#include <quarry/postprocess/token_reducer.h>

#include <array>
#include <cctype>

namespace quarry::postprocess {

namespace {

constexpr std::array<std::string_view, 5> kInvisible = {
    "\xE2\x80\x8B", // zero width space
    "\xE2\x80\x8C", // zero width non-joiner
    "\xE2\x80\x8D", // zero width joiner
    "\xE2\x81\xA0", // word joiner
    "\xEF\xBB\xBF", // BOM
};

std::string stripInvisible(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        bool skipped = false;
        for (auto seq : kInvisible) {
            if (text.substr(i, seq.size()) == seq) {
                i += seq.size();
                skipped = true;
                break;
            }
        }
        if (skipped) {
            continue;
        }
        const auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x20 && c != '\n' && c != '\t') {
            ++i;
            continue;
        }
        out += text[i++];
    }
    return out;
}

// Collapse blanks in lines, trim lines, keep at most one empty line in a row
std::string collapseWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    bool pendingBlank = false;
    while (pos <= text.size()) {
        auto eol = text.find('\n', pos);
        auto line = text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        std::string collapsed;
        bool space = false;
        for (char c : line) {
            if (c == ' ' || c == '\t') {
                space = true;
                continue;
            }
            if (space && !collapsed.empty()) {
                collapsed += ' ';
            }
            space = false;
            collapsed += c;
        }
        if (collapsed.empty()) {
            pendingBlank = !out.empty();
        } else {
            if (!out.empty()) {
                out += pendingBlank ? "\n\n" : "\n";
            }
            out += collapsed;
            pendingBlank = false;
        }
        if (eol == std::string_view::npos) {
            break;
        }
        pos = eol + 1;
    }
    return out;
}

// @p drop sees each token, its original spelling and the token before it in the input
template <typename Drop>
std::string removeWords(std::string_view text, Drop&& drop) {
    std::string out;
    out.reserve(text.size());
    size_t cursor = 0;
    const WordToken* previous = nullptr;
    auto tokens = tokenizeWords(text);
    for (const auto& token : tokens) {
        out.append(text.substr(cursor, token.offset - cursor));
        cursor = token.offset + token.length;
        const bool dropped = drop(token, text.substr(token.offset, token.length), previous);
        previous = &token;
        if (dropped) {
            while (cursor < text.size() && (text[cursor] == ' ' || text[cursor] == '\t')) {
                ++cursor;
            }
            continue;
        }
        out.append(text.substr(token.offset, token.length));
    }
    out.append(text.substr(cursor));
    return out;
}

bool important(std::string_view original) {
    const auto first = static_cast<unsigned char>(original.front());
    if (std::isupper(first)) {
        return true;
    }
    for (unsigned char c : original) {
        if (std::isdigit(c)) {
            return true;
        }
    }
    return false;
}

bool onlyBlanksBetween(std::string_view text, const WordToken& a, const WordToken& b) {
    for (size_t i = a.offset + a.length; i < b.offset; ++i) {
        if (text[i] != ' ' && text[i] != '\t') {
            return false;
        }
    }
    return true;
}

std::string collapsePunctuationRuns(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        const auto c = static_cast<unsigned char>(text[i]);
        size_t run = 1;
        while (i + run < text.size() && text[i + run] == text[i]) {
            ++run;
        }
        if (std::ispunct(c) && run >= 3) {
            out += text[i];
        } else {
            out.append(text.substr(i, run));
        }
        i += run;
    }
    return out;
}

} // namespace

std::string TokenReducer::reduce(std::string_view text, const TokenReductionConfig& config,
                                 std::string_view language) {
    if (config.mode == ReductionMode::Off) {
        return std::string(text);
    }
    std::string current = stripInvisible(text);
    if (config.mode == ReductionMode::Light) {
        return collapseWhitespace(current);
    }

    const auto& stops = stopwords(language);
    const bool aggressive = config.mode == ReductionMode::Aggressive;
    current = removeWords(current, [&](const WordToken& token, std::string_view original,
                                       const WordToken*) {
        if (!stops.contains(token.lower)) {
            return false;
        }
        return aggressive || !config.preserveImportantWords || !important(original);
    });

    if (aggressive) {
        // Stopword removal can make words adjacent, so repeats are collapsed after it
        std::string_view view = current;
        current = removeWords(view, [&](const WordToken& token, std::string_view,
                                        const WordToken* previous) {
            return previous && previous->lower == token.lower &&
                   onlyBlanksBetween(view, *previous, token);
        });
        current = collapsePunctuationRuns(current);
    }
    return collapseWhitespace(current);
}

void TokenReducer::apply(ExtractionResult& result, const TokenReductionConfig& config) {
    if (config.mode == ReductionMode::Off) {
        return;
    }
    std::string language = "eng";
    if (result.detectedLanguages && !result.detectedLanguages->empty()) {
        language = result.detectedLanguages->front();
    } else if (result.metadata.language) {
        language = *result.metadata.language;
    }
    const size_t before = result.content.size();
    result.content = reduce(result.content, config, language);
    result.metadata.set("token_reduction",
                        {{"mode", toString(config.mode)},
                         {"original_length", before},
                         {"reduced_length", result.content.size()},
                         {"reduction_ratio",
                          before == 0 ? 0.0
                                      : 1.0 - static_cast<double>(result.content.size()) /
                                                  static_cast<double>(before)}});
}

} // namespace quarry::postprocess
