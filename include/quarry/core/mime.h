#pragma once

#include <string>
#include <string_view>

namespace quarry::mime {

inline constexpr std::string_view kPlainText = "text/plain";
inline constexpr std::string_view kMarkdown = "text/markdown";
inline constexpr std::string_view kHtml = "text/html";
inline constexpr std::string_view kCsv = "text/csv";
inline constexpr std::string_view kTsv = "text/tab-separated-values";
inline constexpr std::string_view kRst = "text/x-rst";
inline constexpr std::string_view kJson = "application/json";
inline constexpr std::string_view kXml = "application/xml";
inline constexpr std::string_view kXmlText = "text/xml";
inline constexpr std::string_view kYaml = "application/x-yaml";
inline constexpr std::string_view kToml = "application/toml";
inline constexpr std::string_view kPdf = "application/pdf";
inline constexpr std::string_view kRtf = "application/rtf";

inline constexpr std::string_view kDocx =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
inline constexpr std::string_view kXlsx =
    "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
inline constexpr std::string_view kXlsm = "application/vnd.ms-excel.sheet.macroEnabled.12";
inline constexpr std::string_view kPptx =
    "application/vnd.openxmlformats-officedocument.presentationml.presentation";
inline constexpr std::string_view kPpsx =
    "application/vnd.openxmlformats-officedocument.presentationml.slideshow";
inline constexpr std::string_view kLegacyWord = "application/msword";
inline constexpr std::string_view kLegacyExcel = "application/vnd.ms-excel";
inline constexpr std::string_view kLegacyPowerPoint = "application/vnd.ms-powerpoint";
inline constexpr std::string_view kOdt = "application/vnd.oasis.opendocument.text";
inline constexpr std::string_view kOds = "application/vnd.oasis.opendocument.spreadsheet";
inline constexpr std::string_view kOdp = "application/vnd.oasis.opendocument.presentation";
inline constexpr std::string_view kEpub = "application/epub+zip";

inline constexpr std::string_view kPng = "image/png";
inline constexpr std::string_view kJpeg = "image/jpeg";
inline constexpr std::string_view kGif = "image/gif";
inline constexpr std::string_view kBmp = "image/bmp";
inline constexpr std::string_view kTiff = "image/tiff";
inline constexpr std::string_view kWebp = "image/webp";
inline constexpr std::string_view kSvg = "image/svg+xml";

inline constexpr std::string_view kZip = "application/zip";
inline constexpr std::string_view kTar = "application/x-tar";
inline constexpr std::string_view kGzip = "application/gzip";
inline constexpr std::string_view kSevenZip = "application/x-7z-compressed";
inline constexpr std::string_view kOle2 = "application/x-ole-storage";
inline constexpr std::string_view kOctetStream = "application/octet-stream";

// Lowercase and strip parameters ("Text/HTML; charset=utf-8" -> "text/html")
std::string normalize(std::string_view mimeType);

// Raster formats that only carry text through OCR
bool isImage(std::string_view mimeType);

// Container or catch-all types that need further sniffing before dispatch
bool isGeneric(std::string_view mimeType);

} // namespace quarry::mime
