#pragma once

#include <quarry/core/types.h>
#include <quarry/extraction/extraction_result.h>
#include <quarry/extraction/archive_reader.h>

#include <map>
#include <string>

namespace quarry::extraction::ooxml {

// Fills Metadata from docProps/core.xml and docProps/app.xml when present
void applyCoreProperties(const std::map<std::string, std::string>& parts, Metadata& metadata);

// True for the parts applyCoreProperties reads
bool isPropertiesPart(const std::string& name);

// Trailing number of a part name: "ppt/slides/slide12.xml" -> 12
size_t partNumber(const std::string& name);

} // namespace quarry::extraction::ooxml
