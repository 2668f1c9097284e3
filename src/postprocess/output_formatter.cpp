#include <quarry/postprocess/output_formatter.h>

namespace quarry::postprocess {

std::string escapeHtml(std::string_view text) {
    std::string out;
    out.reserve(text.size() + text.size() / 8);
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&#39;";
                break;
            default:
                out += c;
        }
    }
    return out;
}

namespace {

std::string renderMarkdown(const ExtractionResult& result) {
    if (result.mimeType == "text/markdown" || !result.metadata.title) {
        return result.content;
    }
    const std::string heading = "# " + *result.metadata.title;
    if (result.content.compare(0, heading.size(), heading) == 0) {
        return result.content;
    }
    return heading + "\n\n" + result.content;
}

std::string renderHtml(const ExtractionResult& result) {
    std::string out = "<!DOCTYPE html>\n<html";
    if (result.metadata.language) {
        out += " lang=\"" + escapeHtml(*result.metadata.language) + "\"";
    }
    out += ">\n<head>\n<meta charset=\"utf-8\">\n";
    if (result.metadata.title) {
        out += "<title>" + escapeHtml(*result.metadata.title) + "</title>\n";
    }
    out += "</head>\n<body>\n<pre>" + escapeHtml(result.content) + "</pre>\n</body>\n</html>\n";
    return out;
}

} // namespace

void applyOutputFormat(ExtractionResult& result, OutputFormat format) {
    result.metadata.set("output_format", toString(format));
    switch (format) {
        case OutputFormat::Plain:
        case OutputFormat::Structured:
            break;
        case OutputFormat::Markdown:
            result.content = renderMarkdown(result);
            break;
        case OutputFormat::Html:
            result.content = renderHtml(result);
            break;
    }
}

} // namespace quarry::postprocess
