#include "PackageExtractor.h"
#include "TranslationErrors.h"

#include <iostream>
#include <memory>

namespace {

struct ZipDiscard {
    void operator()(zip_t* archive) const { zip_discard(archive); }
};

struct ZipFileClose {
    void operator()(zip_file_t* file) const { zip_fclose(file); }
};

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

bool PackageExtractor::isHeaderOrFooterPart(const std::string& name) {
    const std::string folder = "word/";
    if (!startsWith(name, folder) || !endsWith(name, ".xml")) {
        return false;
    }

    // Only parts directly under word/, never their relationship files
    const std::string fileName = name.substr(folder.size());
    if (fileName.find('/') != std::string::npos) {
        return false;
    }
    return startsWith(fileName, "header") || startsWith(fileName, "footer");
}

DocumentPackage PackageExtractor::extract(const std::string& packagePath) const {
    int err = 0;
    std::unique_ptr<zip_t, ZipDiscard> archive(zip_open(packagePath.c_str(), ZIP_RDONLY, &err));
    if (!archive) {
        zip_error_t error;
        zip_error_init_with_code(&error, err);
        const std::string reason = zip_error_strerror(&error);
        zip_error_fini(&error);
        throw MalformedPackage("Error opening ZIP archive " + packagePath + ": " + reason);
    }

    DocumentPackage package;
    package.sourcePath = packagePath;

    // Get the number of entries (files) in the archive
    const zip_int64_t numEntries = zip_get_num_entries(archive.get(), 0);
    if (numEntries < 0) {
        throw MalformedPackage("Cannot list entries of " + packagePath);
    }

    for (zip_uint64_t i = 0; i < static_cast<zip_uint64_t>(numEntries); ++i) {
        zip_stat_t stat;
        zip_stat_init(&stat);
        if (zip_stat_index(archive.get(), i, 0, &stat) != 0 || !(stat.valid & ZIP_STAT_NAME)) {
            throw MalformedPackage("Error getting file name in ZIP archive " + packagePath);
        }

        PackageEntry entry;
        entry.name = stat.name;
        entry.index = i;
        entry.compressionMethod = (stat.valid & ZIP_STAT_COMP_METHOD) ? stat.comp_method : ZIP_CM_DEFAULT;

        // Directory entries carry no data
        if (!entry.name.empty() && entry.name.back() != '/') {
            entry.data = readEntry(archive.get(), i, entry.name);
        }

        package.entries.push_back(std::move(entry));
    }

    if (package.find(kPrimaryPart) == nullptr) {
        throw MalformedPackage(std::string(kPrimaryPart) + " file not found in DOCX archive " + packagePath);
    }

    package.targetParts.push_back(kPrimaryPart);
    for (const auto& entry : package.entries) {
        if (isHeaderOrFooterPart(entry.name)) {
            package.targetParts.push_back(entry.name);
        }
    }

    std::cout << "Read " << package.entries.size() << " entries from " << packagePath << ", "
              << package.targetParts.size() << " markup part(s) to translate\n";
    return package;
}

std::string PackageExtractor::readEntry(zip_t* archive, zip_uint64_t index, const std::string& name) const {
    std::unique_ptr<zip_file_t, ZipFileClose> file(zip_fopen_index(archive, index, 0));
    if (!file) {
        throw MalformedPackage("Error opening file in ZIP archive: " + name);
    }

    std::string data;
    char buffer[4096];
    zip_int64_t bytesRead;
    while ((bytesRead = zip_fread(file.get(), buffer, sizeof(buffer))) > 0) {
        data.append(buffer, static_cast<std::size_t>(bytesRead));
    }

    if (bytesRead < 0) {
        throw MalformedPackage("Error reading file in ZIP archive: " + name);
    }
    return data;
}
