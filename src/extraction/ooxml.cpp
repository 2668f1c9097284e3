#include <quarry/extraction/ooxml.h>
#include <quarry/extraction/text_utils.h>
#include <quarry/extraction/xml_document.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <optional>

namespace quarry::extraction::ooxml {

bool isPropertiesPart(const std::string& name) {
    return name == "docProps/core.xml" || name == "docProps/app.xml";
}

size_t partNumber(const std::string& name) {
    auto dot = name.rfind('.');
    size_t end = dot == std::string::npos ? name.size() : dot;
    size_t start = end;
    while (start > 0 && std::isdigit(static_cast<unsigned char>(name[start - 1]))) {
        --start;
    }
    if (start == end) {
        return 0;
    }
    size_t value = 0;
    for (size_t i = start; i < end && i - start < 9; ++i) {
        value = value * 10 + static_cast<size_t>(name[i] - '0');
    }
    return value;
}

void applyCoreProperties(const std::map<std::string, std::string>& parts, Metadata& metadata) {
    if (auto it = parts.find("docProps/core.xml"); it != parts.end()) {
        auto doc = XmlDocument::parse(it->second, it->first);
        if (!doc) {
            spdlog::debug("Ignoring unreadable core properties: {}", doc.error().message);
        } else {
            auto root = doc.value().root();
            auto field = [&](std::string_view name) -> std::optional<std::string> {
                auto value = normalizeWhitespace(XmlDocument::text(XmlDocument::firstChild(root, name)));
                if (value.empty()) {
                    return std::nullopt;
                }
                return value;
            };
            if (auto v = field("title")) {
                metadata.title = v;
            }
            if (auto v = field("subject")) {
                metadata.subject = v;
            }
            if (auto v = field("creator")) {
                metadata.authors.push_back(*v);
            }
            if (auto v = field("keywords")) {
                size_t start = 0;
                while (start <= v->size()) {
                    auto sep = v->find_first_of(",;", start);
                    auto token = normalizeWhitespace(
                        v->substr(start, sep == std::string::npos ? std::string::npos : sep - start));
                    if (!token.empty()) {
                        metadata.keywords.push_back(token);
                    }
                    if (sep == std::string::npos) {
                        break;
                    }
                    start = sep + 1;
                }
            }
            if (auto v = field("created")) {
                metadata.createdAt = v;
            }
            if (auto v = field("modified")) {
                metadata.modifiedAt = v;
            }
            if (auto v = field("language")) {
                metadata.language = v;
            }
            if (auto v = field("lastModifiedBy")) {
                metadata.set("last_modified_by", *v);
            }
            if (auto v = field("description")) {
                metadata.set("description", *v);
            }
        }
    }
    if (auto it = parts.find("docProps/app.xml"); it != parts.end()) {
        auto doc = XmlDocument::parse(it->second, it->first);
        if (doc) {
            auto root = doc.value().root();
            if (auto app = normalizeWhitespace(XmlDocument::text(XmlDocument::firstChild(root, "Application")));
                !app.empty()) {
                metadata.set("application", app);
            }
        }
    }
}

} // namespace quarry::extraction::ooxml
