#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlstring.h>

// A <w:t> element holding literal text
struct TextLeaf {
    xmlNodePtr node = nullptr;
    std::size_t paragraphIndex = 0;
    std::string formatKey;   // serialized <w:rPr> of the enclosing run
    std::string text;
};

// Adjacent leaves of one paragraph sharing identical run properties. The first
// leaf is the anchor that receives the translated text.
struct MergedSegment {
    std::size_t paragraphIndex = 0;
    std::vector<xmlNodePtr> leaves;
    std::string formatKey;
    std::string text;
};

class MarkupTree {
public:
    static constexpr const char* kWordNamespace = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

    // Throws MalformedPackage when the part is not well-formed XML
    explicit MarkupTree(const std::string& partBytes, const std::string& partName = "document.xml");

    MarkupTree(const MarkupTree&) = delete;
    MarkupTree& operator=(const MarkupTree&) = delete;

    std::vector<TextLeaf> leaves() const;
    std::vector<MergedSegment> mergeAdjacent() const;

    void writeBack(const MergedSegment& segment, const std::string& translatedText);

    std::string serialize() const;

    // True once any segment has been written back
    bool modified() const { return changed; }

    const std::string& name() const { return partName; }
    xmlNodePtr root() const;

    static std::string leafText(xmlNodePtr node);

protected:
    void extractTextNodesRecursive(xmlNode* node, std::size_t paragraph, std::size_t& paragraphCount, std::vector<TextLeaf>& nodes) const;
    std::string formatKeyOf(xmlNode* textNode) const;
    void updateNodeWithTranslation(xmlNode* node, const std::string& translation);
    static bool isWordElement(const xmlNode* node, const char* localName);
    static std::string escapeForDocx(const std::string& input);

private:
    struct XmlDocDeleter {
        void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
    };

    std::unique_ptr<xmlDoc, XmlDocDeleter> doc;
    std::string partName;
    bool changed = false;
};
