#include <quarry/extraction/xml_document.h>

namespace quarry::extraction {

namespace {

std::string_view stripPrefix(const char* qualified) {
    std::string_view name(qualified ? qualified : "");
    if (auto colon = name.find(':'); colon != std::string_view::npos) {
        name.remove_prefix(colon + 1);
    }
    return name;
}

bool isElement(XmlNode node, std::string_view localName) {
    return node.type() == pugi::node_element && stripPrefix(node.name()) == localName;
}

} // namespace

Result<XmlDocument> XmlDocument::parse(std::string_view xml, const std::string& partName) {
    auto doc = std::make_unique<pugi::xml_document>();
    // Whitespace-only runs survive when they are an element's only content (<w:t> </w:t>)
    const unsigned int options = pugi::parse_default | pugi::parse_ws_pcdata_single;
    pugi::xml_parse_result parsed = doc->load_buffer(xml.data(), xml.size(), options);
    if (!parsed) {
        return Error{ErrorCode::Parsing, "Malformed XML in " + partName + ": " +
                                             parsed.description() + " at offset " +
                                             std::to_string(parsed.offset)};
    }
    if (!doc->document_element()) {
        return Error{ErrorCode::Parsing, "Empty XML document: " + partName};
    }
    return XmlDocument(std::move(doc));
}

XmlNode XmlDocument::root() const {
    return doc_->document_element();
}

std::string XmlDocument::localName(XmlNode node) {
    return std::string(stripPrefix(node.name()));
}

std::string XmlDocument::attribute(XmlNode node, std::string_view name) {
    for (pugi::xml_attribute attr = node.first_attribute(); attr; attr = attr.next_attribute()) {
        if (stripPrefix(attr.name()) == name) {
            return attr.value();
        }
    }
    return {};
}

std::string XmlDocument::text(XmlNode node) {
    std::string out;
    if (!node) {
        return out;
    }
    if (node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata) {
        return node.value();
    }
    std::vector<XmlNode> stack;
    for (XmlNode child = node.last_child(); child; child = child.previous_sibling()) {
        stack.push_back(child);
    }
    while (!stack.empty()) {
        XmlNode current = stack.back();
        stack.pop_back();
        if (current.type() == pugi::node_pcdata || current.type() == pugi::node_cdata) {
            out += current.value();
            continue;
        }
        for (XmlNode child = current.last_child(); child; child = child.previous_sibling()) {
            stack.push_back(child);
        }
    }
    return out;
}

std::vector<XmlNode> XmlDocument::children(XmlNode node, std::string_view name) {
    std::vector<XmlNode> out;
    for (XmlNode child = node.first_child(); child; child = child.next_sibling()) {
        if (isElement(child, name)) {
            out.push_back(child);
        }
    }
    return out;
}

XmlNode XmlDocument::firstChild(XmlNode node, std::string_view name) {
    for (XmlNode child = node.first_child(); child; child = child.next_sibling()) {
        if (isElement(child, name)) {
            return child;
        }
    }
    return {};
}

std::vector<XmlNode> XmlDocument::descendants(XmlNode node, std::string_view name) {
    std::vector<XmlNode> out;
    // Iterative pre-order walk; deeply nested input must not exhaust the stack
    std::vector<XmlNode> stack;
    for (XmlNode child = node.last_child(); child; child = child.previous_sibling()) {
        stack.push_back(child);
    }
    while (!stack.empty()) {
        XmlNode current = stack.back();
        stack.pop_back();
        if (current.type() != pugi::node_element) {
            continue;
        }
        if (isElement(current, name)) {
            out.push_back(current);
        }
        for (XmlNode child = current.last_child(); child; child = child.previous_sibling()) {
            stack.push_back(child);
        }
    }
    return out;
}

} // namespace quarry::extraction
