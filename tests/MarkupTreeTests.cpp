#include <catch2/catch_test_macros.hpp>
#include "DocTranslatorTests.h"

using fixtures::documentXml;
using fixtures::paragraph;
using fixtures::run;

TEST_CASE("MarkupTree: parsing") {
    SECTION("Malformed markup is rejected") {
        REQUIRE_THROWS_AS(MarkupTree("<w:document><w:body>"), MalformedPackage);
        REQUIRE_THROWS_AS(MarkupTree(""), MalformedPackage);
    }

    SECTION("The part name is kept") {
        MarkupTree tree(documentXml(""), "word/header1.xml");
        REQUIRE(tree.name() == "word/header1.xml");
        REQUIRE_FALSE(tree.modified());
    }
}

TEST_CASE("MarkupTree: leaves") {
    const std::string xml = documentXml(
        paragraph(run("First ") + run("paragraph.")) +
        paragraph(run("   ") + run("Second.")) +
        "<w:tbl><w:tr><w:tc>" + paragraph(run("Cell")) + "</w:tc></w:tr></w:tbl>");
    MarkupTree tree(xml);

    std::vector<TextLeaf> leaves = tree.leaves();

    SECTION("Leaves follow document order and keep whitespace-only text") {
        REQUIRE(leaves.size() == 5);
        REQUIRE(leaves[0].text == "First ");
        REQUIRE(leaves[1].text == "paragraph.");
        REQUIRE(leaves[2].text == "   ");
        REQUIRE(leaves[3].text == "Second.");
        REQUIRE(leaves[4].text == "Cell");
    }

    SECTION("Every paragraph gets its own index") {
        REQUIRE(leaves[0].paragraphIndex == leaves[1].paragraphIndex);
        REQUIRE(leaves[2].paragraphIndex != leaves[1].paragraphIndex);
        REQUIRE(leaves[3].paragraphIndex == leaves[2].paragraphIndex);
        REQUIRE(leaves[4].paragraphIndex != leaves[3].paragraphIndex);
    }

    SECTION("Empty text elements are not leaves") {
        MarkupTree withEmpty(documentXml(paragraph(run("Text") + "<w:r><w:t/></w:r>")));
        REQUIRE(withEmpty.leaves().size() == 1);
    }

    SECTION("Leaves can be listed again") {
        REQUIRE(tree.leaves().size() == leaves.size());
    }
}

TEST_CASE("MarkupTree: text outside the word namespace is ignored") {
    const std::string xml =
        "<?xml version=\"1.0\"?>"
        "<w:document xmlns:w=\"" + fixtures::kWordNs + "\" xmlns:o=\"urn:other\"><w:body>"
        "<w:p><w:r><o:t>foreign</o:t><w:t>native</w:t></w:r></w:p>"
        "</w:body></w:document>";
    MarkupTree tree(xml);

    std::vector<TextLeaf> leaves = tree.leaves();
    REQUIRE(leaves.size() == 1);
    REQUIRE(leaves[0].text == "native");
}

TEST_CASE("MarkupTree: format keys") {
    const std::string xml = documentXml(paragraph(run("Bold", "<w:b/>") + run("Plain") + run("Also bold", "<w:b/>")));
    TestableMarkupTree tree(xml);

    std::vector<TextLeaf> leaves = tree.leaves();
    REQUIRE(leaves.size() == 3);
    REQUIRE(leaves[0].formatKey == leaves[2].formatKey);
    REQUIRE(leaves[0].formatKey != leaves[1].formatKey);
    REQUIRE(leaves[1].formatKey.empty());
    REQUIRE(leaves[0].formatKey.find("w:b") != std::string::npos);
}

TEST_CASE("MarkupTree: mergeAdjacent") {
    SECTION("Same-format runs of one paragraph merge into one segment") {
        MarkupTree tree(documentXml(paragraph(run("Hel") + run("lo ") + run("world."))));
        std::vector<MergedSegment> segments = tree.mergeAdjacent();
        REQUIRE(segments.size() == 1);
        REQUIRE(segments[0].text == "Hello world.");
        REQUIRE(segments[0].leaves.size() == 3);
    }

    SECTION("A space run between same-format words joins the segment") {
        MarkupTree tree(documentXml(paragraph(run("Hello") + run(" ") + run("world."))));
        std::vector<MergedSegment> segments = tree.mergeAdjacent();
        REQUIRE(segments.size() == 1);
        REQUIRE(segments[0].text == "Hello world.");
        REQUIRE(segments[0].leaves.size() == 3);

        tree.writeBack(segments[0], "Hallo Welt.");
        REQUIRE(fixtures::allTextElements(tree.serialize()) == std::vector<std::string>{"Hallo Welt.", "", ""});
    }

    SECTION("A differently formatted space run closes the segment") {
        MarkupTree tree(documentXml(paragraph(run("Hello") + run(" ", "<w:b/>") + run("world."))));
        std::vector<MergedSegment> segments = tree.mergeAdjacent();
        REQUIRE(segments.size() == 3);
        REQUIRE(segments[0].text == "Hello");
        REQUIRE(segments[1].text == " ");
        REQUIRE(segments[2].text == "world.");
    }

    SECTION("A formatting change closes the segment") {
        MarkupTree tree(documentXml(paragraph(run("Hello ", "<w:b/>") + run("world."))));
        std::vector<MergedSegment> segments = tree.mergeAdjacent();
        REQUIRE(segments.size() == 2);
        REQUIRE(segments[0].text == "Hello ");
        REQUIRE(segments[1].text == "world.");
    }

    SECTION("Segments never span paragraphs") {
        MarkupTree tree(documentXml(paragraph(run("One.")) + paragraph(run("Two."))));
        std::vector<MergedSegment> segments = tree.mergeAdjacent();
        REQUIRE(segments.size() == 2);
        REQUIRE(segments[0].paragraphIndex != segments[1].paragraphIndex);
    }

    SECTION("Merging leaves the tree unchanged") {
        const std::string xml = documentXml(paragraph(run("Hel") + run("lo")));
        MarkupTree tree(xml);
        tree.mergeAdjacent();
        REQUIRE(fixtures::allTextElements(tree.serialize()) == std::vector<std::string>{"Hel", "lo"});
        REQUIRE_FALSE(tree.modified());
    }
}

TEST_CASE("MarkupTree: writeBack") {
    MarkupTree tree(documentXml(paragraph(run("Hel") + run("lo ") + run("world."))));
    std::vector<MergedSegment> segments = tree.mergeAdjacent();
    REQUIRE(segments.size() == 1);

    SECTION("The anchor receives the whole text and the other leaves are emptied") {
        tree.writeBack(segments[0], "Hallo Welt.");
        REQUIRE(tree.modified());

        std::vector<std::string> texts = fixtures::allTextElements(tree.serialize());
        REQUIRE(texts == std::vector<std::string>{"Hallo Welt.", "", ""});
    }

    SECTION("Markup characters are escaped") {
        tree.writeBack(segments[0], "A & B <C>");
        const std::string xml = tree.serialize();
        REQUIRE(xml.find("A &amp; B &lt;C&gt;") != std::string::npos);
        REQUIRE(fixtures::allTextElements(xml)[0] == "A & B <C>");
    }

    SECTION("Edge whitespace is marked as preserved") {
        MarkupTree plain(documentXml("<w:p><w:r><w:t>word</w:t></w:r></w:p>"));
        std::vector<MergedSegment> plainSegments = plain.mergeAdjacent();
        plain.writeBack(plainSegments[0], "Wort ");
        REQUIRE(plain.serialize().find("xml:space=\"preserve\"") != std::string::npos);
    }

    SECTION("Non-ASCII text survives serialization") {
        tree.writeBack(segments[0], "Gr\xC3\xBC\xC3\x9F" "e");
        REQUIRE(fixtures::allTextElements(tree.serialize())[0] == "Gr\xC3\xBC\xC3\x9F" "e");
    }
}

TEST_CASE("MarkupTree: escapeForDocx") {
    REQUIRE(TestableMarkupTree::escapeForDocx("a<b>&\"c'") == "a&lt;b&gt;&amp;&quot;c&apos;");
    REQUIRE(TestableMarkupTree::escapeForDocx("plain") == "plain");
}

TEST_CASE("MarkupTree: serialized parts parse again") {
    MarkupTree tree(documentXml(paragraph(run("Fish &amp; chips") + run(" for ") + run("&lt;two&gt;", "<w:i/>"))));
    std::vector<MergedSegment> segments = tree.mergeAdjacent();
    REQUIRE(segments.size() == 2);
    tree.writeBack(segments[0], "Fisch & Pommes f\xC3\xBCr ");
    tree.writeBack(segments[1], "<zwei>");

    MarkupTree reparsed(tree.serialize());
    std::vector<MergedSegment> again = reparsed.mergeAdjacent();
    REQUIRE(again.size() == 2);
    REQUIRE(again[0].text == "Fisch & Pommes f\xC3\xBCr ");
    REQUIRE(again[1].text == "<zwei>");
    REQUIRE(again[1].formatKey.find("w:i") != std::string::npos);
}

TEST_CASE("MarkupTree: serialize keeps the XML declaration") {
    MarkupTree tree(documentXml(paragraph(run("Text"))));
    const std::string xml = tree.serialize();
    REQUIRE(xml.rfind("<?xml", 0) == 0);
    REQUIRE(xml.find("standalone=\"yes\"") != std::string::npos);
}
