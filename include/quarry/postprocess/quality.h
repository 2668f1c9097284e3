#pragma once

#include <quarry/extraction/extraction_result.h>

namespace quarry::postprocess {

struct QualityBreakdown {
    double length = 0.0;     // saturates at kQualityTargetLength characters
    double printable = 0.0;  // share of printable characters
    double structure = 0.0;  // paragraphs, headings, tables
    double wordShape = 0.0;  // share of plausible words
    double ocrFactor = 1.0;  // multiplier from OCR outcome
    double score = 0.0;      // weighted total in [0,1]
};

inline constexpr size_t kQualityTargetLength = 500;
// Applied when OCR was needed but failed
inline constexpr double kOcrFailurePenalty = 0.6;

QualityBreakdown scoreQuality(const ExtractionResult& result);

// Sets result.qualityScore and metadata["quality_breakdown"]
void applyQualityScore(ExtractionResult& result);

} // namespace quarry::postprocess
