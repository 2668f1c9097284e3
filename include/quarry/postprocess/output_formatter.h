#pragma once

#include <quarry/config/extraction_config.h>
#include <quarry/extraction/extraction_result.h>

#include <string>
#include <string_view>

namespace quarry::postprocess {

std::string escapeHtml(std::string_view text);

/**
 * @brief Renders content in the requested output format.
 *
 * Plain and structured leave content untouched (structured consumers read the
 * JSON result). Markdown adds the title as a heading unless the content is
 * already markdown. HTML wraps escaped content in a minimal document.
 * The chosen format is recorded as metadata "output_format".
 */
void applyOutputFormat(ExtractionResult& result, OutputFormat format);

} // namespace quarry::postprocess
