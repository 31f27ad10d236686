#include <catch2/catch_test_macros.hpp>
#include "DocTranslatorTests.h"

using fixtures::documentXml;
using fixtures::paragraph;
using fixtures::run;

namespace {

std::string wrap(const std::string& text) {
    return std::string(PromptBuilder::kOpenMarker) + text + PromptBuilder::kCloseMarker;
}

}  // namespace

TEST_CASE("TranslationDriver: units are translated in order with rolling context") {
    FakeTranslationService service;
    FakeLanguageDetector detector;
    TranslationConfig config;
    config.sourceLanguage = "English";
    TranslationDriver driver(service, detector, PipelineOptions());

    MarkupTree tree(documentXml(paragraph(run("One.")) + paragraph(run("Two.")) + paragraph(run("Three.")) + paragraph(run("Four."))));
    TranslationContext context(1000);
    TranslationReport report;
    driver.translateDocument(tree, config, context, report);

    // Each unit sees only the translation of the unit before it
    const auto& requests = service.state->requests;
    REQUIRE(requests.size() == 4);
    REQUIRE(requests[0].text == "One.");
    REQUIRE(requests[0].context.empty());
    REQUIRE(requests[1].context == "DE[One.]");
    REQUIRE(requests[2].context == "DE[Two.]");
    REQUIRE(requests[3].context == "DE[Three.]");
    REQUIRE(context.str() == "DE[Four.]");

    SECTION("Request carries the configuration") {
        REQUIRE(requests[0].sourceLanguage == "English");
        REQUIRE(requests[0].targetLanguage == "German");
        REQUIRE(requests[0].tone == Tone::Neutral);
        REQUIRE(detector.state->calls == 0);
    }

    SECTION("Translations are written back in place") {
        REQUIRE(fixtures::leafTexts(tree.serialize()) == std::vector<std::string>{"DE[One.]", "DE[Two.]", "DE[Three.]", "DE[Four.]"});
        REQUIRE(report.unitsTotal == 4);
        REQUIRE(report.unitsTranslated == 4);
        REQUIRE(report.warnings.empty());
    }
}

TEST_CASE("TranslationDriver: trivial units are not sent") {
    FakeTranslationService service;
    FakeLanguageDetector detector;
    TestableTranslationDriver driver(service, detector, PipelineOptions());
    TranslationConfig config;
    TranslationContext context;
    TranslationReport report;

    SECTION("Empty, whitespace and single-character text is returned unchanged") {
        REQUIRE(*driver.translateUnit("", config, context, report) == "");
        REQUIRE(*driver.translateUnit(" \t", config, context, report) == " \t");
        REQUIRE(*driver.translateUnit("A", config, context, report) == "A");
        REQUIRE(*driver.translateUnit(" \xC3\xA4 ", config, context, report) == " \xC3\xA4 ");
        REQUIRE(service.callCount() == 0);
        REQUIRE(detector.state->calls == 0);
        REQUIRE(report.unitsSkipped == 4);
    }

    SECTION("isTrivial") {
        REQUIRE(TestableTranslationDriver::isTrivial(""));
        REQUIRE(TestableTranslationDriver::isTrivial("7"));
        REQUIRE_FALSE(TestableTranslationDriver::isTrivial("ab"));
    }

    SECTION("Single-character leaves keep their markup") {
        MarkupTree tree(documentXml(paragraph(run("A")) + paragraph(run("Real text."))));
        driver.translateDocument(tree, config, context, report);
        REQUIRE(service.callCount() == 1);
        REQUIRE(fixtures::leafTexts(tree.serialize()) == std::vector<std::string>{"A", "DE[Real text.]"});
    }
}

TEST_CASE("TranslationDriver: source language resolution") {
    FakeTranslationService service;
    FakeLanguageDetector detector;
    TestableTranslationDriver driver(service, detector, PipelineOptions());
    TranslationConfig config;
    config.sourceLanguage = "auto";

    SECTION("Auto detects the language per unit") {
        detector.state->code = "fr";
        REQUIRE(driver.resolveSourceLanguage("Bonjour.", config) == "fr");
        REQUIRE(detector.state->calls == 1);
    }

    SECTION("Detection failure leaves the source language empty") {
        detector.state->fail = true;
        REQUIRE(driver.resolveSourceLanguage("Bonjour.", config).empty());

        TranslationContext context;
        TranslationReport report;
        REQUIRE(driver.translateText("Bonjour tout le monde.", config, context, report) == "DE[Bonjour tout le monde.]");
        REQUIRE(service.state->requests.back().sourceLanguage.empty());
    }

    SECTION("A configured language skips detection") {
        config.sourceLanguage = "French";
        REQUIRE(driver.resolveSourceLanguage("Bonjour.", config) == "French");
        REQUIRE(detector.state->calls == 0);
    }
}

TEST_CASE("TranslationDriver: failed units") {
    FakeTranslationService service;
    FakeLanguageDetector detector;
    TranslationConfig config;
    config.sourceLanguage = "English";
    MarkupTree tree(documentXml(paragraph(run("One.")) + paragraph(run("Two.")) + paragraph(run("Three."))));
    TranslationContext context;
    TranslationReport report;

    SECTION("Keep their original text and are reported") {
        service.state->failingCalls = {1};
        TranslationDriver driver(service, detector, PipelineOptions());
        driver.translateDocument(tree, config, context, report);

        REQUIRE(fixtures::leafTexts(tree.serialize()) == std::vector<std::string>{"DE[One.]", "Two.", "DE[Three.]"});
        REQUIRE(report.countWarnings(WarningKind::TranslationUnitFailed) == 1);
        REQUIRE(report.warnings[0].unitIndex == 1);
        REQUIRE(report.unitsTranslated == 2);
        // The failed unit contributes nothing to the context
        REQUIRE(service.state->requests[2].context == "DE[One.]");
    }

    SECTION("Empty results count as failures") {
        service.state->responder = [](const TranslationRequest& request) {
            return request.text == "Two." ? wrap("  ") : wrap("DE[" + request.text + "]");
        };
        TranslationDriver driver(service, detector, PipelineOptions());
        driver.translateDocument(tree, config, context, report);

        REQUIRE(fixtures::leafTexts(tree.serialize())[1] == "Two.");
        REQUIRE(report.countWarnings(WarningKind::TranslationUnitFailed) == 1);
    }

    SECTION("Abort the document in strict mode") {
        service.state->failingCalls = {1};
        PipelineOptions options;
        options.abortOnFirstFailure = true;
        TranslationDriver driver(service, detector, options);

        try {
            driver.translateDocument(tree, config, context, report);
            FAIL("TranslationFailed was not thrown");
        } catch (const TranslationFailed& e) {
            REQUIRE(e.unitIndex() == 1);
        }
        REQUIRE(service.callCount() == 2);
    }
}

TEST_CASE("TranslationDriver: cancellation is checked before every unit") {
    FakeTranslationService service;
    FakeLanguageDetector detector;
    TranslationDriver driver(service, detector, PipelineOptions());
    TranslationConfig config;
    config.sourceLanguage = "English";

    CancellationFlag cancel{false};
    driver.setCancellationFlag(&cancel);

    SECTION("A set flag stops before the first call") {
        cancel.store(true);
        MarkupTree tree(documentXml(paragraph(run("One."))));
        TranslationContext context;
        TranslationReport report;
        REQUIRE_THROWS_AS(driver.translateDocument(tree, config, context, report), TranslationCancelled);
        REQUIRE(service.callCount() == 0);
    }

    SECTION("Setting the flag during a call stops at the next unit") {
        service.state->responder = [&cancel](const TranslationRequest& request) {
            cancel.store(true);
            return wrap("DE[" + request.text + "]");
        };
        MarkupTree tree(documentXml(paragraph(run("One.")) + paragraph(run("Two."))));
        TranslationContext context;
        TranslationReport report;
        REQUIRE_THROWS_AS(driver.translateDocument(tree, config, context, report), TranslationCancelled);
        REQUIRE(service.callCount() == 1);
    }
}

TEST_CASE("TranslationDriver: whitespace around a unit is restored") {
    SECTION("restoreWhitespace") {
        REQUIRE(TestableTranslationDriver::restoreWhitespace("Hello world.\r", "Hallo Welt.") == "Hallo Welt.\r");
        REQUIRE(TestableTranslationDriver::restoreWhitespace(" Hello ", "Hallo") == " Hallo ");
        REQUIRE(TestableTranslationDriver::restoreWhitespace("Hello", "Hallo") == "Hallo");
        REQUIRE(TestableTranslationDriver::restoreWhitespace("Hello ", "Hallo ") == "Hallo ");
        REQUIRE(TestableTranslationDriver::restoreWhitespace("   ", "") == "   ");
    }

    SECTION("A trailing carriage return survives translation") {
        FakeTranslationService service;
        FakeLanguageDetector detector;
        TranslationDriver driver(service, detector, PipelineOptions());
        TranslationConfig config;
        config.sourceLanguage = "English";
        TranslationContext context;
        TranslationReport report;

        REQUIRE(driver.translateText("Hello world.\r", config, context, report) == "DE[Hello world.]\r");
        REQUIRE(context.str() == "DE[Hello world.]");
    }

    SECTION("Separate runs keep the space between them") {
        FakeTranslationService service;
        FakeLanguageDetector detector;
        TranslationDriver driver(service, detector, PipelineOptions());
        TranslationConfig config;
        config.sourceLanguage = "English";
        MarkupTree tree(documentXml(paragraph(run("Hello ", "<w:b/>") + run("world."))));
        TranslationContext context;
        TranslationReport report;
        driver.translateDocument(tree, config, context, report);

        REQUIRE(fixtures::allTextElements(tree.serialize()) == std::vector<std::string>{"DE[Hello] ", "DE[world.]"});
    }

    SECTION("A space run between same-format words is sent with them") {
        FakeTranslationService service;
        FakeLanguageDetector detector;
        TranslationDriver driver(service, detector, PipelineOptions());
        TranslationConfig config;
        config.sourceLanguage = "English";
        MarkupTree tree(documentXml(paragraph(run("Hello") + run(" ") + run("world."))));
        TranslationContext context;
        TranslationReport report;
        driver.translateDocument(tree, config, context, report);

        REQUIRE(service.callCount() == 1);
        REQUIRE(service.state->requests[0].text == "Hello world.");
        REQUIRE(fixtures::allTextElements(tree.serialize()) == std::vector<std::string>{"DE[Hello world.]", "", ""});
    }

    SECTION("A differently formatted space run stays untouched") {
        FakeTranslationService service;
        FakeLanguageDetector detector;
        TranslationDriver driver(service, detector, PipelineOptions());
        TranslationConfig config;
        config.sourceLanguage = "English";
        MarkupTree tree(documentXml(paragraph(run("Hello") + run(" ", "<w:u w:val=\"single\"/>") + run("world."))));
        TranslationContext context;
        TranslationReport report;
        driver.translateDocument(tree, config, context, report);

        REQUIRE(service.callCount() == 2);
        REQUIRE(service.state->requests[0].text == "Hello");
        REQUIRE(service.state->requests[1].text == "world.");
        REQUIRE(fixtures::allTextElements(tree.serialize()) == std::vector<std::string>{"DE[Hello]", " ", "DE[world.]"});
        REQUIRE(report.unitsSkipped == 1);
    }
}

TEST_CASE("TranslationDriver: paragraph units") {
    FakeTranslationService service;
    FakeLanguageDetector detector;
    TranslationConfig config;
    config.sourceLanguage = "English";
    PipelineOptions options;
    options.unitMode = UnitMode::Paragraph;
    TranslationDriver driver(service, detector, options);

    MarkupTree tree(documentXml(paragraph(run("Hello ", "<w:b/>") + run("world."))));
    TranslationContext context;
    TranslationReport report;

    SECTION("Segments of a paragraph are sent together and split back") {
        service.state->responder = [](const TranslationRequest&) {
            return wrap("Hallo\x1EWelt.");
        };
        driver.translateDocument(tree, config, context, report);

        REQUIRE(service.callCount() == 1);
        REQUIRE(service.state->requests[0].text == "Hello \x1Eworld.");
        REQUIRE(fixtures::allTextElements(tree.serialize()) == std::vector<std::string>{"Hallo ", "Welt."});
        REQUIRE(report.warnings.empty());
        REQUIRE(context.str() == "Hallo Welt.");
    }

    SECTION("A missing delimiter is repaired with a warning") {
        service.state->responder = [](const TranslationRequest&) {
            return wrap("Hallo Welt.");
        };
        REQUIRE_NOTHROW(driver.translateDocument(tree, config, context, report));

        REQUIRE(fixtures::allTextElements(tree.serialize()) == std::vector<std::string>{"Hallo Welt. ", ""});
        REQUIRE(report.countWarnings(WarningKind::SegmentCountMismatch) == 1);
    }

    SECTION("A failed paragraph keeps all of its segments") {
        service.state->failingCalls = {0};
        driver.translateDocument(tree, config, context, report);

        REQUIRE(fixtures::allTextElements(tree.serialize()) == std::vector<std::string>{"Hello ", "world."});
        REQUIRE(report.countWarnings(WarningKind::TranslationUnitFailed) == 1);
    }

    SECTION("Whitespace-only segments are left out of the paragraph unit") {
        MarkupTree spaced(documentXml(paragraph(run("Hello") + run(" ", "<w:b/>") + run("world."))));
        service.state->responder = [](const TranslationRequest&) {
            return wrap("Hallo\x1EWelt.");
        };
        driver.translateDocument(spaced, config, context, report);

        REQUIRE(service.callCount() == 1);
        REQUIRE(service.state->requests[0].text == "Hello\x1Eworld.");
        REQUIRE(fixtures::allTextElements(spaced.serialize()) == std::vector<std::string>{"Hallo", " ", "Welt."});
        REQUIRE(report.warnings.empty());
    }

    SECTION("Single-segment paragraphs are sent without delimiters") {
        MarkupTree single(documentXml(paragraph(run("Only one run."))));
        driver.translateDocument(single, config, context, report);
        REQUIRE(service.state->requests.back().text == "Only one run.");
    }
}
