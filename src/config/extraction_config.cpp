#include <quarry/config/extraction_config.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <thread>

namespace quarry {

namespace {

using nlohmann::json;

std::string snakeToCamel(std::string_view snake) {
    std::string out;
    out.reserve(snake.size());
    bool upper = false;
    for (char c : snake) {
        if (c == '_') {
            upper = true;
            continue;
        }
        out.push_back(upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
        upper = false;
    }
    return out;
}

// Looks up a field by its snake_case name or the camelCase equivalent.
const json* findField(const json& j, std::string_view snake) {
    auto it = j.find(std::string(snake));
    if (it != j.end()) {
        return &*it;
    }
    auto camel = snakeToCamel(snake);
    it = j.find(camel);
    if (it != j.end()) {
        return &*it;
    }
    return nullptr;
}

std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

class FieldReader {
public:
    FieldReader(const json& j, std::string section) : j_(j), section_(std::move(section)) {}

    template <typename T> Result<void> read(std::string_view key, T& out) const {
        const json* v = findField(j_, key);
        if (!v || v->is_null()) {
            return {};
        }
        try {
            out = v->get<T>();
        } catch (const json::exception& e) {
            return Error{ErrorCode::Validation,
                         std::format("Invalid value for {}{}: {}", prefix(), key, e.what())};
        }
        return {};
    }

    template <typename T> Result<void> read(std::string_view key, std::optional<T>& out) const {
        const json* v = findField(j_, key);
        if (!v || v->is_null()) {
            return {};
        }
        T tmp{};
        try {
            tmp = v->get<T>();
        } catch (const json::exception& e) {
            return Error{ErrorCode::Validation,
                         std::format("Invalid value for {}{}: {}", prefix(), key, e.what())};
        }
        out = std::move(tmp);
        return {};
    }

    const json* sub(std::string_view key) const {
        const json* v = findField(j_, key);
        if (!v || v->is_null()) {
            return nullptr;
        }
        return v;
    }

    std::string prefix() const { return section_.empty() ? "" : section_ + "."; }

private:
    const json& j_;
    std::string section_;
};

#define QUARRY_TRY_READ(expr)                                                                      \
    do {                                                                                           \
        if (auto _r = (expr); !_r) {                                                               \
            return _r.error();                                                                     \
        }                                                                                          \
    } while (0)

Result<OutputFormat> parseOutputFormat(const std::string& raw) {
    auto s = lowered(raw);
    if (s == "plain" || s == "text")
        return OutputFormat::Plain;
    if (s == "markdown" || s == "md")
        return OutputFormat::Markdown;
    if (s == "html")
        return OutputFormat::Html;
    if (s == "structured" || s == "json")
        return OutputFormat::Structured;
    return Error{ErrorCode::Validation, "Invalid output_format: " + raw};
}

Result<ChunkingStrategy> parseStrategy(const std::string& raw) {
    auto s = lowered(raw);
    if (s == "characters" || s == "chars" || s == "character")
        return ChunkingStrategy::Characters;
    if (s == "sentence" || s == "sentences")
        return ChunkingStrategy::Sentence;
    if (s == "paragraph" || s == "paragraphs")
        return ChunkingStrategy::Paragraph;
    return Error{ErrorCode::Validation, "Invalid chunking strategy: " + raw};
}

Result<KeywordAlgorithm> parseAlgorithm(const std::string& raw) {
    auto s = lowered(raw);
    if (s == "frequency" || s == "yake" || s == "graph")
        return KeywordAlgorithm::Frequency;
    if (s == "cooccurrence" || s == "co-occurrence" || s == "rake")
        return KeywordAlgorithm::Cooccurrence;
    return Error{ErrorCode::Validation, "Invalid keyword algorithm: " + raw};
}

Result<ReductionMode> parseReductionMode(const std::string& raw) {
    auto s = lowered(raw);
    if (s == "off" || s == "none")
        return ReductionMode::Off;
    if (s == "light")
        return ReductionMode::Light;
    if (s == "moderate")
        return ReductionMode::Moderate;
    if (s == "aggressive" || s == "maximum")
        return ReductionMode::Aggressive;
    return Error{ErrorCode::Validation, "Invalid token reduction mode: " + raw};
}

Result<std::set<std::string>> readNameSet(const json& v, std::string_view key) {
    if (!v.is_array()) {
        return Error{ErrorCode::Validation, std::format("{} must be an array of names", key)};
    }
    std::set<std::string> names;
    for (const auto& item : v) {
        if (!item.is_string()) {
            return Error{ErrorCode::Validation, std::format("{} must contain strings", key)};
        }
        names.insert(item.get<std::string>());
    }
    return names;
}

Result<EmbeddingConfig> parseEmbedding(const json& j) {
    EmbeddingConfig cfg;
    FieldReader r(j, "chunking.embedding");
    QUARRY_TRY_READ(r.read("backend", cfg.backend));
    QUARRY_TRY_READ(r.read("normalize", cfg.normalize));
    QUARRY_TRY_READ(r.read("batch_size", cfg.batchSize));
    if (const json* model = r.sub("model")) {
        // Either a bare preset name or {"type": "preset", "name": "..."}
        if (model->is_string()) {
            cfg.model = model->get<std::string>();
        } else if (model->is_object()) {
            if (auto it = model->find("name"); it != model->end() && it->is_string()) {
                cfg.model = it->get<std::string>();
            } else if (auto mit = model->find("model"); mit != model->end() && mit->is_string()) {
                cfg.model = mit->get<std::string>();
            }
        }
    }
    if (cfg.batchSize == 0) {
        return Error{ErrorCode::Validation, "chunking.embedding.batch_size must be positive"};
    }
    return cfg;
}

Result<ChunkingConfig> parseChunking(const json& j) {
    ChunkingConfig cfg;
    FieldReader r(j, "chunking");
    QUARRY_TRY_READ(r.read("max_chars", cfg.maxChars));
    QUARRY_TRY_READ(r.read("max_overlap", cfg.maxOverlap));
    std::optional<std::string> strategy;
    QUARRY_TRY_READ(r.read("strategy", strategy));
    if (strategy) {
        auto parsed = parseStrategy(*strategy);
        if (!parsed)
            return parsed.error();
        cfg.strategy = parsed.value();
    }
    if (const json* emb = r.sub("embedding")) {
        auto parsed = parseEmbedding(*emb);
        if (!parsed)
            return parsed.error();
        cfg.embedding = std::move(parsed).value();
    }
    if (cfg.maxChars == 0) {
        return Error{ErrorCode::Validation, "chunking.max_chars must be positive"};
    }
    if (cfg.maxOverlap >= cfg.maxChars) {
        return Error{ErrorCode::Validation,
                     std::format("chunking.max_overlap ({}) must be smaller than max_chars ({})",
                                 cfg.maxOverlap, cfg.maxChars)};
    }
    return cfg;
}

} // namespace

const char* toString(OutputFormat format) {
    switch (format) {
        case OutputFormat::Plain:
            return "plain";
        case OutputFormat::Markdown:
            return "markdown";
        case OutputFormat::Html:
            return "html";
        case OutputFormat::Structured:
            return "structured";
    }
    return "plain";
}

const char* toString(ChunkingStrategy strategy) {
    switch (strategy) {
        case ChunkingStrategy::Characters:
            return "characters";
        case ChunkingStrategy::Sentence:
            return "sentence";
        case ChunkingStrategy::Paragraph:
            return "paragraph";
    }
    return "characters";
}

const char* toString(KeywordAlgorithm algorithm) {
    switch (algorithm) {
        case KeywordAlgorithm::Frequency:
            return "frequency";
        case KeywordAlgorithm::Cooccurrence:
            return "cooccurrence";
    }
    return "frequency";
}

const char* toString(ReductionMode mode) {
    switch (mode) {
        case ReductionMode::Off:
            return "off";
        case ReductionMode::Light:
            return "light";
        case ReductionMode::Moderate:
            return "moderate";
        case ReductionMode::Aggressive:
            return "aggressive";
    }
    return "off";
}

bool PostProcessorConfig::isProcessorEnabled(std::string_view name) const {
    if (!enabled) {
        return false;
    }
    const std::string key(name);
    if (disabledProcessors && disabledProcessors->contains(key)) {
        return false;
    }
    if (enabledProcessors) {
        return enabledProcessors->contains(key);
    }
    return true;
}

size_t ExtractionConfig::effectiveConcurrency() const {
    if (maxConcurrentExtractions && *maxConcurrentExtractions > 0) {
        return *maxConcurrentExtractions;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw == 0 ? 4 : static_cast<size_t>(hw);
}

nlohmann::json ExtractionConfig::toJson() const {
    json j;
    j["use_cache"] = useCache;
    j["enable_quality_processing"] = enableQualityProcessing;
    j["force_ocr"] = forceOcr;
    j["output_format"] = toString(outputFormat);
    j["max_file_size"] = maxFileSize;
    j["max_concurrent_extractions"] =
        maxConcurrentExtractions ? json(*maxConcurrentExtractions) : json(nullptr);

    if (ocr) {
        j["ocr"] = {{"backend", ocr->backend},
                    {"language", ocr->language},
                    {"coverage_threshold", ocr->coverageThreshold}};
    } else {
        j["ocr"] = nullptr;
    }
    if (chunking) {
        json c{{"max_chars", chunking->maxChars},
               {"max_overlap", chunking->maxOverlap},
               {"strategy", toString(chunking->strategy)}};
        if (chunking->embedding) {
            c["embedding"] = {{"backend", chunking->embedding->backend},
                              {"model", chunking->embedding->model},
                              {"normalize", chunking->embedding->normalize},
                              {"batch_size", chunking->embedding->batchSize}};
        } else {
            c["embedding"] = nullptr;
        }
        j["chunking"] = std::move(c);
    } else {
        j["chunking"] = nullptr;
    }
    if (images) {
        j["images"] = {{"extract_images", images->extractImages},
                       {"target_dpi", images->targetDpi},
                       {"max_image_dimension", images->maxImageDimension},
                       {"auto_adjust_dpi", images->autoAdjustDpi},
                       {"min_dpi", images->minDpi},
                       {"max_dpi", images->maxDpi}};
    } else {
        j["images"] = nullptr;
    }
    if (pdfOptions) {
        j["pdf_options"] = {{"extract_images", pdfOptions->extractImages},
                            {"extract_metadata", pdfOptions->extractMetadata},
                            {"passwords", pdfOptions->passwords}};
    } else {
        j["pdf_options"] = nullptr;
    }
    if (pages) {
        j["pages"] = {{"extract_pages", pages->extractPages},
                      {"insert_page_markers", pages->insertPageMarkers},
                      {"marker_format", pages->markerFormat}};
    } else {
        j["pages"] = nullptr;
    }
    if (languageDetection) {
        j["language_detection"] = {{"enabled", languageDetection->enabled},
                                   {"min_confidence", languageDetection->minConfidence},
                                   {"detect_multiple", languageDetection->detectMultiple}};
    } else {
        j["language_detection"] = nullptr;
    }
    if (keywords) {
        j["keywords"] = {{"algorithm", toString(keywords->algorithm)},
                         {"max_keywords", keywords->maxKeywords},
                         {"min_score", keywords->minScore},
                         {"ngram_range", {keywords->ngramMin, keywords->ngramMax}},
                         {"window_size", keywords->windowSize},
                         {"language", keywords->language ? json(*keywords->language) : json()}};
    } else {
        j["keywords"] = nullptr;
    }
    if (tokenReduction) {
        j["token_reduction"] = {{"mode", toString(tokenReduction->mode)},
                                {"preserve_important_words",
                                 tokenReduction->preserveImportantWords}};
    } else {
        j["token_reduction"] = nullptr;
    }
    if (postprocessor) {
        json p{{"enabled", postprocessor->enabled}};
        p["enabled_processors"] = postprocessor->enabledProcessors
                                      ? json(*postprocessor->enabledProcessors)
                                      : json(nullptr);
        p["disabled_processors"] = postprocessor->disabledProcessors
                                       ? json(*postprocessor->disabledProcessors)
                                       : json(nullptr);
        j["postprocessor"] = std::move(p);
    } else {
        j["postprocessor"] = nullptr;
    }
    return j;
}

Result<ExtractionConfig> ExtractionConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::Validation, "Extraction config must be a JSON object"};
    }
    ExtractionConfig cfg;
    FieldReader r(j, "");
    QUARRY_TRY_READ(r.read("use_cache", cfg.useCache));
    QUARRY_TRY_READ(r.read("enable_quality_processing", cfg.enableQualityProcessing));
    QUARRY_TRY_READ(r.read("force_ocr", cfg.forceOcr));
    QUARRY_TRY_READ(r.read("max_concurrent_extractions", cfg.maxConcurrentExtractions));
    QUARRY_TRY_READ(r.read("max_file_size", cfg.maxFileSize));

    std::optional<std::string> output;
    QUARRY_TRY_READ(r.read("output_format", output));
    if (output) {
        auto parsed = parseOutputFormat(*output);
        if (!parsed)
            return parsed.error();
        cfg.outputFormat = parsed.value();
    }

    if (const json* v = r.sub("ocr")) {
        OcrConfig ocr;
        FieldReader o(*v, "ocr");
        QUARRY_TRY_READ(o.read("backend", ocr.backend));
        QUARRY_TRY_READ(o.read("language", ocr.language));
        QUARRY_TRY_READ(o.read("coverage_threshold", ocr.coverageThreshold));
        if (ocr.coverageThreshold < 0.0 || ocr.coverageThreshold > 1.0) {
            return Error{ErrorCode::Validation, "ocr.coverage_threshold must be within [0, 1]"};
        }
        cfg.ocr = std::move(ocr);
    }

    if (const json* v = r.sub("chunking")) {
        auto parsed = parseChunking(*v);
        if (!parsed)
            return parsed.error();
        cfg.chunking = std::move(parsed).value();
    }

    if (const json* v = r.sub("images")) {
        ImageExtractionConfig img;
        FieldReader o(*v, "images");
        QUARRY_TRY_READ(o.read("extract_images", img.extractImages));
        QUARRY_TRY_READ(o.read("target_dpi", img.targetDpi));
        QUARRY_TRY_READ(o.read("max_image_dimension", img.maxImageDimension));
        QUARRY_TRY_READ(o.read("auto_adjust_dpi", img.autoAdjustDpi));
        QUARRY_TRY_READ(o.read("min_dpi", img.minDpi));
        QUARRY_TRY_READ(o.read("max_dpi", img.maxDpi));
        if (img.minDpi > img.maxDpi) {
            return Error{ErrorCode::Validation, "images.min_dpi must not exceed images.max_dpi"};
        }
        cfg.images = std::move(img);
    }

    if (const json* v = r.sub("pdf_options")) {
        PdfConfig pdf;
        FieldReader o(*v, "pdf_options");
        QUARRY_TRY_READ(o.read("extract_images", pdf.extractImages));
        QUARRY_TRY_READ(o.read("extract_metadata", pdf.extractMetadata));
        QUARRY_TRY_READ(o.read("passwords", pdf.passwords));
        cfg.pdfOptions = std::move(pdf);
    }

    if (const json* v = r.sub("pages")) {
        PageConfig pages;
        FieldReader o(*v, "pages");
        QUARRY_TRY_READ(o.read("extract_pages", pages.extractPages));
        QUARRY_TRY_READ(o.read("insert_page_markers", pages.insertPageMarkers));
        QUARRY_TRY_READ(o.read("marker_format", pages.markerFormat));
        cfg.pages = std::move(pages);
    }

    if (const json* v = r.sub("language_detection")) {
        LanguageDetectionConfig lang;
        FieldReader o(*v, "language_detection");
        QUARRY_TRY_READ(o.read("enabled", lang.enabled));
        QUARRY_TRY_READ(o.read("min_confidence", lang.minConfidence));
        QUARRY_TRY_READ(o.read("detect_multiple", lang.detectMultiple));
        if (lang.minConfidence < 0.0 || lang.minConfidence > 1.0) {
            return Error{ErrorCode::Validation,
                         "language_detection.min_confidence must be within [0, 1]"};
        }
        cfg.languageDetection = lang;
    }

    if (const json* v = r.sub("keywords")) {
        KeywordConfig kw;
        FieldReader o(*v, "keywords");
        std::optional<std::string> algorithm;
        QUARRY_TRY_READ(o.read("algorithm", algorithm));
        if (algorithm) {
            auto parsed = parseAlgorithm(*algorithm);
            if (!parsed)
                return parsed.error();
            kw.algorithm = parsed.value();
        }
        QUARRY_TRY_READ(o.read("max_keywords", kw.maxKeywords));
        QUARRY_TRY_READ(o.read("min_score", kw.minScore));
        QUARRY_TRY_READ(o.read("window_size", kw.windowSize));
        QUARRY_TRY_READ(o.read("language", kw.language));
        if (const json* range = o.sub("ngram_range")) {
            if (!range->is_array() || range->size() != 2 || !(*range)[0].is_number_unsigned() ||
                !(*range)[1].is_number_unsigned()) {
                return Error{ErrorCode::Validation,
                             "keywords.ngram_range must be [min, max] with positive integers"};
            }
            kw.ngramMin = (*range)[0].get<size_t>();
            kw.ngramMax = (*range)[1].get<size_t>();
        }
        if (kw.ngramMin == 0 || kw.ngramMin > kw.ngramMax) {
            return Error{ErrorCode::Validation, "keywords.ngram_range is invalid"};
        }
        cfg.keywords = std::move(kw);
    }

    if (const json* v = r.sub("token_reduction")) {
        TokenReductionConfig tr;
        FieldReader o(*v, "token_reduction");
        std::optional<std::string> mode;
        QUARRY_TRY_READ(o.read("mode", mode));
        if (mode) {
            auto parsed = parseReductionMode(*mode);
            if (!parsed)
                return parsed.error();
            tr.mode = parsed.value();
        }
        QUARRY_TRY_READ(o.read("preserve_important_words", tr.preserveImportantWords));
        cfg.tokenReduction = tr;
    }

    if (const json* v = r.sub("postprocessor")) {
        PostProcessorConfig pp;
        FieldReader o(*v, "postprocessor");
        QUARRY_TRY_READ(o.read("enabled", pp.enabled));
        if (const json* names = o.sub("enabled_processors")) {
            auto parsed = readNameSet(*names, "postprocessor.enabled_processors");
            if (!parsed)
                return parsed.error();
            pp.enabledProcessors = std::move(parsed).value();
        }
        if (const json* names = o.sub("disabled_processors")) {
            auto parsed = readNameSet(*names, "postprocessor.disabled_processors");
            if (!parsed)
                return parsed.error();
            pp.disabledProcessors = std::move(parsed).value();
        }
        cfg.postprocessor = std::move(pp);
    }

    return cfg;
}

std::string ExtractionConfig::fingerprint() const {
    // Concurrency does not change the output of a single run
    auto j = toJson();
    j.erase("max_concurrent_extractions");
    j.erase("use_cache");
    return j.dump();
}

} // namespace quarry
