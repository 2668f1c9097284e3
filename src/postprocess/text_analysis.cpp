#include <quarry/postprocess/text_analysis.h>

#include <algorithm>
#include <cctype>
#include <map>

namespace quarry::postprocess {

namespace {

bool isWordByte(unsigned char c) {
    return std::isalnum(c) || c == '\'' || c >= 0x80;
}

const std::map<std::string, std::unordered_set<std::string>, std::less<>>& stopwordTable() {
    static const std::map<std::string, std::unordered_set<std::string>, std::less<>> table = {
        {"eng",
         {"a",     "about", "above", "after", "again", "all",   "also",  "am",    "an",
          "and",   "any",   "are",   "as",    "at",    "be",    "been",  "before", "being",
          "but",   "by",    "can",   "could", "did",   "do",    "does",  "for",   "from",
          "had",   "has",   "have",  "he",    "her",   "here",  "him",   "his",   "how",
          "i",     "if",    "in",    "into",  "is",    "it",    "its",   "just",  "may",
          "me",    "more",  "most",  "my",    "no",    "not",   "of",    "on",    "only",
          "or",    "other", "our",   "out",   "over",  "she",   "should", "so",   "some",
          "such",  "than",  "that",  "the",   "their", "them",  "then",  "there", "these",
          "they",  "this",  "those", "through", "to",  "too",   "under", "up",    "very",
          "was",   "we",    "were",  "what",  "when",  "where", "which", "while", "who",
          "why",   "will",  "with",  "would", "you",   "your"}},
        {"deu",
         {"der",   "die",   "das",   "und",   "ist",   "nicht", "ein",   "eine",  "einer",
          "mit",   "auf",   "für",   "von",   "zu",    "dem",   "den",   "des",   "sich",
          "auch",  "als",   "wird",  "werden", "sind", "noch",  "wie",   "aus",   "bei",
          "oder",  "nach",  "über",  "hat",   "haben", "wir",   "ich",   "sie",   "es",
          "im",    "zum",   "zur",   "dass",  "aber",  "wenn",  "nur",   "kann"}},
        {"fra",
         {"de",   "le",   "la",    "les",   "un",    "une",   "et",    "est",   "pour",  "dans",
          "que",  "qui",   "avec",  "des",   "du",    "au",    "aux",   "ce",    "cette",
          "il",   "elle",  "nous",  "vous",  "ils",   "sont",  "pas",   "plus",  "par",
          "sur",  "mais",  "ou",    "leur",  "se",    "ne",    "été",   "être",  "comme"}},
        {"spa",
         {"de",   "en",   "el",   "la",    "los",   "las",   "que",   "y",     "un",    "una",   "es",
          "por",  "con",   "para",  "del",   "al",    "lo",    "como",  "más",   "pero",
          "sus",  "le",    "ya",    "este",  "esta",  "son",   "entre", "cuando", "muy",
          "sin",  "sobre", "también", "hay", "donde", "desde", "todo",  "nos",   "porque"}},
        {"ita",
         {"il",   "lo",    "gli",   "una",   "di",    "che",   "è",     "per",   "non",
          "con",  "sono",  "della", "delle", "degli", "nel",   "nella", "alla",  "anche",
          "come", "più",   "ma",    "questo", "questa", "essere", "ha",  "hanno", "dei"}},
        {"por",
         {"o",    "os",    "as",    "um",    "uma",   "que",   "não",   "para",  "com",
          "do",   "da",    "dos",   "das",   "no",    "na",    "nos",   "nas",   "ao",
          "é",    "mais",  "como",  "mas",   "foi",   "pelo",  "pela",  "também", "são",
          "seu",  "sua",   "isso",  "ser",   "está",  "tem",   "quando"}},
        {"nld",
         {"de",   "het",   "een",   "en",    "van",   "ik",    "te",    "dat",   "die",
          "niet", "zijn",  "op",    "aan",   "met",   "als",   "voor",  "er",    "maar",
          "om",   "hem",   "dan",   "zou",   "wat",   "mijn",  "men",   "dit",   "zo",
          "door", "over",  "ze",    "bij",   "ook",   "tot",   "je",    "naar",  "wordt"}},
    };
    return table;
}

} // namespace

std::string toLowerAscii(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(c < 0x80 ? std::tolower(c) : c);
    });
    return out;
}

std::vector<WordToken> tokenizeWords(std::string_view text) {
    std::vector<WordToken> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && !isWordByte(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        size_t start = i;
        while (i < text.size() && isWordByte(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        // Leading/trailing apostrophes are quotes, not part of the word
        size_t end = i;
        while (start < end && text[start] == '\'') {
            ++start;
        }
        while (end > start && text[end - 1] == '\'') {
            --end;
        }
        if (end > start) {
            tokens.push_back({toLowerAscii(text.substr(start, end - start)), start, end - start});
        }
    }
    return tokens;
}

const std::vector<std::string>& stopwordLanguages() {
    static const std::vector<std::string> languages = [] {
        std::vector<std::string> out;
        for (const auto& [code, _] : stopwordTable()) {
            out.push_back(code);
        }
        return out;
    }();
    return languages;
}

std::string toIso639_3(std::string_view language) {
    static const std::map<std::string, std::string, std::less<>> twoToThree = {
        {"en", "eng"}, {"de", "deu"}, {"fr", "fra"}, {"es", "spa"},
        {"it", "ita"}, {"pt", "por"}, {"nl", "nld"}};
    auto lower = toLowerAscii(language);
    if (auto dash = lower.find_first_of("-_"); dash != std::string::npos) {
        lower.resize(dash);
    }
    if (auto it = twoToThree.find(lower); it != twoToThree.end()) {
        return it->second;
    }
    return lower;
}

const std::unordered_set<std::string>& stopwords(std::string_view language) {
    const auto& table = stopwordTable();
    if (auto it = table.find(toIso639_3(language)); it != table.end()) {
        return it->second;
    }
    return table.find("eng")->second;
}

} // namespace quarry::postprocess
