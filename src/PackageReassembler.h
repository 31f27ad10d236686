#pragma once

#include "Document.h"

#include <map>
#include <string>
#include <zip.h>

class PackageReassembler {
public:
    // Writes a copy of the original package with the given parts replaced.
    // Untouched members are copied raw, in their original order and with
    // their original compression. Throws PackagingError; on failure nothing
    // is left at outputPath.
    std::string reassemble(const DocumentPackage& original, const std::map<std::string, std::string>& mutatedParts, const std::string& outputPath) const;

protected:
    void replaceEntry(zip_t* archive, const DocumentPackage& original, const std::string& name, const std::string& bytes) const;
};
