#pragma once

#include "Document.h"

#include <string>
#include <zip.h>

class PackageExtractor {
public:
    static constexpr const char* kPrimaryPart = "word/document.xml";

    // Reads every member of the package and selects the markup parts to
    // translate. Throws MalformedPackage.
    DocumentPackage extract(const std::string& packagePath) const;

    static bool isHeaderOrFooterPart(const std::string& name);

protected:
    std::string readEntry(zip_t* archive, zip_uint64_t index, const std::string& name) const;
};
