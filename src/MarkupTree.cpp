#include "MarkupTree.h"
#include "TranslationErrors.h"

#include <cctype>
#include <limits>
#include <new>

namespace {

constexpr std::size_t kNoParagraph = std::numeric_limits<std::size_t>::max();

bool hasEdgeWhitespace(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    return std::isspace(static_cast<unsigned char>(text.front())) || std::isspace(static_cast<unsigned char>(text.back()));
}

}  // namespace

MarkupTree::MarkupTree(const std::string& partBytes, const std::string& partName) : partName(partName) {
    if (partBytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw MalformedPackage("Markup part is too large: " + partName);
    }

    // Keep blank text nodes so untouched whitespace survives the round trip
    xmlDocPtr parsed = xmlReadMemory(partBytes.data(), static_cast<int>(partBytes.size()), partName.c_str(), nullptr, XML_PARSE_NONET | XML_PARSE_HUGE);
    if (parsed == nullptr) {
        throw MalformedPackage("Failed to parse markup part: " + partName);
    }
    doc.reset(parsed);

    if (xmlDocGetRootElement(doc.get()) == nullptr) {
        throw MalformedPackage("Markup part has no root element: " + partName);
    }
}

xmlNodePtr MarkupTree::root() const {
    return xmlDocGetRootElement(doc.get());
}

bool MarkupTree::isWordElement(const xmlNode* node, const char* localName) {
    return node != nullptr
        && node->type == XML_ELEMENT_NODE
        && xmlStrcmp(node->name, BAD_CAST localName) == 0
        && node->ns != nullptr
        && xmlStrcmp(node->ns->href, BAD_CAST kWordNamespace) == 0;
}

std::string MarkupTree::leafText(xmlNodePtr node) {
    std::string text;
    xmlChar* content = xmlNodeGetContent(node);
    if (content) {
        text = reinterpret_cast<const char*>(content);
        xmlFree(content);
    }
    return text;
}

// Walks the tree in document order. Every <w:p> opens a paragraph for its own
// subtree, so text of a nested paragraph (text boxes) is never attributed to
// the outer one.
void MarkupTree::extractTextNodesRecursive(xmlNode* node, std::size_t paragraph, std::size_t& paragraphCount, std::vector<TextLeaf>& nodes) const {
    for (; node; node = node->next) {
        if (node->type != XML_ELEMENT_NODE) {
            continue;
        }

        if (isWordElement(node, "p")) {
            const std::size_t index = paragraphCount++;
            extractTextNodesRecursive(node->children, index, paragraphCount, nodes);
            continue;
        }

        if (isWordElement(node, "t")) {
            if (paragraph == kNoParagraph) {
                continue;
            }
            std::string text = leafText(node);
            // Whitespace-only leaves stay: they join or close a segment
            if (text.empty()) {
                continue;
            }
            nodes.push_back({node, paragraph, formatKeyOf(node), std::move(text)});
            continue;
        }

        extractTextNodesRecursive(node->children, paragraph, paragraphCount, nodes);
    }
}

std::vector<TextLeaf> MarkupTree::leaves() const {
    std::vector<TextLeaf> nodes;
    std::size_t paragraphCount = 0;
    extractTextNodesRecursive(root(), kNoParagraph, paragraphCount, nodes);
    return nodes;
}

std::string MarkupTree::formatKeyOf(xmlNode* textNode) const {
    xmlNode* run = textNode->parent;
    if (!isWordElement(run, "r")) {
        return {};
    }

    for (xmlNode* child = run->children; child; child = child->next) {
        if (!isWordElement(child, "rPr")) {
            continue;
        }

        std::string key;
        xmlBufferPtr buffer = xmlBufferCreate();
        if (buffer == nullptr) {
            throw std::bad_alloc();
        }
        if (xmlNodeDump(buffer, doc.get(), child, 0, 0) >= 0) {
            key = reinterpret_cast<const char*>(xmlBufferContent(buffer));
        }
        xmlBufferFree(buffer);
        return key;
    }
    return {};
}

std::vector<MergedSegment> MarkupTree::mergeAdjacent() const {
    std::vector<MergedSegment> segments;

    for (auto& leaf : leaves()) {
        if (!segments.empty()) {
            MergedSegment& current = segments.back();
            // Same paragraph and same formatting: extend the current segment
            if (current.paragraphIndex == leaf.paragraphIndex && current.formatKey == leaf.formatKey) {
                current.leaves.push_back(leaf.node);
                current.text += leaf.text;
                continue;
            }
        }

        MergedSegment segment;
        segment.paragraphIndex = leaf.paragraphIndex;
        segment.leaves.push_back(leaf.node);
        segment.formatKey = std::move(leaf.formatKey);
        segment.text = std::move(leaf.text);
        segments.push_back(std::move(segment));
    }

    return segments;
}

void MarkupTree::writeBack(const MergedSegment& segment, const std::string& translatedText) {
    if (segment.leaves.empty()) {
        return;
    }

    // The anchor owns the whole segment, the other leaves are emptied
    updateNodeWithTranslation(segment.leaves.front(), translatedText);
    for (std::size_t i = 1; i < segment.leaves.size(); ++i) {
        updateNodeWithTranslation(segment.leaves[i], "");
    }
    changed = true;
}

void MarkupTree::updateNodeWithTranslation(xmlNode* node, const std::string& translation) {
    // xmlNodeSetContent resolves entity references, so escape first
    xmlNodeSetContent(node, BAD_CAST escapeForDocx(translation).c_str());

    if (hasEdgeWhitespace(translation)) {
        xmlSetProp(node, BAD_CAST "xml:space", BAD_CAST "preserve");
    }
}

std::string MarkupTree::escapeForDocx(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());

    for (char ch : input) {
        switch (ch) {
            case '&':
                escaped.append("&amp;");
                break;
            case '<':
                escaped.append("&lt;");
                break;
            case '>':
                escaped.append("&gt;");
                break;
            case '"':
                escaped.append("&quot;");
                break;
            case '\'':
                escaped.append("&apos;");
                break;
            default:
                escaped.push_back(ch);
                break;
        }
    }
    return escaped;
}

std::string MarkupTree::serialize() const {
    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpMemoryEnc(doc.get(), &buffer, &size, "UTF-8");
    if (buffer == nullptr || size < 0) {
        throw PackagingError("Failed to serialize markup part: " + partName);
    }

    std::string bytes(reinterpret_cast<const char*>(buffer), static_cast<std::size_t>(size));
    xmlFree(buffer);
    return bytes;
}
