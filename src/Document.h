#pragma once
#include <cstdint>
#include <string>
#include <vector>

// One member of the zip container
struct PackageEntry {
    std::string name;
    std::string data;
    std::int32_t compressionMethod = 0;
    std::uint64_t index = 0;
};

struct DocumentPackage {
    std::string sourcePath;
    std::vector<PackageEntry> entries;     // archive order
    std::vector<std::string> targetParts;  // markup parts to translate, body first

    const PackageEntry* find(const std::string& name) const {
        for (const auto& entry : entries) {
            if (entry.name == name) {
                return &entry;
            }
        }
        return nullptr;
    }
};
