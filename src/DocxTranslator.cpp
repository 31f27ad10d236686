#include "DocxTranslator.h"
#include "MarkupTree.h"
#include "PackageExtractor.h"
#include "PackageReassembler.h"
#include "TranslationContext.h"

#include <iostream>
#include <map>

TranslationReport DocxTranslator::translate(const std::string& inputPath, const std::string& outputPath) {
    PackageExtractor extractor;
    const DocumentPackage package = extractor.extract(inputPath);

    TranslationReport result;
    TranslationContext context(options.maxContextLength);
    std::map<std::string, std::string> mutatedParts;

    for (const auto& partName : package.targetParts) {
        const PackageEntry* entry = package.find(partName);
        if (entry == nullptr) {
            continue;
        }

        MarkupTree tree(entry->data, partName);
        driver.translateDocument(tree, config, context, result);

        // Parts without a single replaced segment keep their original bytes
        if (tree.modified()) {
            mutatedParts[partName] = tree.serialize();
            std::cout << "Modified XML part: " << partName << "\n";
        }
    }

    ensureNotEmpty(result, inputPath);

    PackageReassembler reassembler;
    reassembler.reassemble(package, mutatedParts, outputPath);
    return result;
}
