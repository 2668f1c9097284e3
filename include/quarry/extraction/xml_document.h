#pragma once

#include <quarry/core/types.h>

#include <pugixml.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace quarry::extraction {

using XmlNode = pugi::xml_node;

/**
 * @brief Owning wrapper for a pugixml DOM parsed from memory.
 *
 * Only the predefined and numeric entities are expanded; DTDs are never
 * loaded. Element and attribute lookups compare local names so namespace
 * prefixes (w:, a:, p:, r:) do not matter.
 */
class XmlDocument {
public:
    static Result<XmlDocument> parse(std::string_view xml, const std::string& partName);

    XmlNode root() const;

    static std::string localName(XmlNode node);
    static std::string attribute(XmlNode node, std::string_view localName);
    // Concatenated character data of the node and all its descendants
    static std::string text(XmlNode node);

    // Element children with the given local name
    static std::vector<XmlNode> children(XmlNode node, std::string_view localName);
    static XmlNode firstChild(XmlNode node, std::string_view localName);
    // All descendant elements with the given local name, document order
    static std::vector<XmlNode> descendants(XmlNode node, std::string_view localName);

private:
    explicit XmlDocument(std::unique_ptr<pugi::xml_document> doc) : doc_(std::move(doc)) {}

    std::unique_ptr<pugi::xml_document> doc_;
};

} // namespace quarry::extraction
