#include <quarry/embedding/embedding_backend.h>
#include <quarry/postprocess/text_analysis.h>

#include <cmath>
#include <cstdint>

namespace quarry::embedding {

namespace {

uint64_t fnv1a(std::string_view s, uint64_t seed = 1469598103934665603ULL) {
    uint64_t h = seed;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

void addFeature(Vector& v, std::string_view feature, float weight) {
    const uint64_t h = fnv1a(feature);
    const size_t index = static_cast<size_t>(h % v.size());
    const float sign = ((h >> 63) & 1U) ? -1.0f : 1.0f;
    v[index] += sign * weight;
}

} // namespace

std::optional<size_t> presetDimensions(std::string_view preset) {
    if (preset == "fast") {
        return 384;
    }
    if (preset == "balanced" || preset == "multilingual") {
        return 768;
    }
    if (preset == "quality") {
        return 1024;
    }
    return std::nullopt;
}

void l2Normalize(Vector& v) {
    double norm = 0.0;
    for (float x : v) {
        norm += static_cast<double>(x) * x;
    }
    if (norm <= 0.0) {
        return;
    }
    const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (float& x : v) {
        x *= inv;
    }
}

Result<size_t> HashingEmbeddingBackend::dimensions(const std::string& model) const {
    if (auto dims = presetDimensions(model)) {
        return *dims;
    }
    return Error{ErrorCode::Validation, "Unknown embedding preset '" + model +
                                            "' (expected fast, balanced, quality or multilingual)"};
}

Result<std::vector<Vector>> HashingEmbeddingBackend::embed(const std::vector<std::string>& texts,
                                                           const std::string& model) {
    auto dims = dimensions(model);
    if (!dims) {
        return dims.error();
    }
    std::vector<Vector> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        Vector v(dims.value(), 0.0f);
        for (const auto& token : postprocess::tokenizeWords(text)) {
            addFeature(v, token.lower, 1.0f);
            if (token.lower.size() >= 4) {
                const std::string padded = "#" + token.lower + "#";
                for (size_t i = 0; i + 3 <= padded.size(); ++i) {
                    addFeature(v, std::string_view(padded).substr(i, 3), 0.25f);
                }
            }
        }
        out.push_back(std::move(v));
    }
    return out;
}

} // namespace quarry::embedding
