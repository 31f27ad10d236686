#include "PackageReassembler.h"
#include "ScratchDirectory.h"
#include "TranslationErrors.h"

#include <filesystem>
#include <iostream>
#include <memory>

namespace {

struct ZipDiscard {
    void operator()(zip_t* archive) const { zip_discard(archive); }
};

std::string archiveError(zip_t* archive) {
    return zip_error_strerror(zip_get_error(archive));
}

}  // namespace

std::string PackageReassembler::reassemble(const DocumentPackage& original, const std::map<std::string, std::string>& mutatedParts, const std::string& outputPath) const {
    const std::filesystem::path output = std::filesystem::u8path(outputPath);

    // Stage next to the output so the final rename stays on one filesystem
    ScratchDirectory scratch(output.parent_path());
    const std::filesystem::path staged = scratch.file("package.tmp");

    std::error_code ec;
    std::filesystem::copy_file(std::filesystem::u8path(original.sourcePath), staged, ec);
    if (ec) {
        throw PackagingError("Failed to stage package " + original.sourcePath + ": " + ec.message());
    }

    int err = 0;
    std::unique_ptr<zip_t, ZipDiscard> archive(zip_open(staged.string().c_str(), 0, &err));
    if (!archive) {
        throw PackagingError("Error opening staged ZIP archive: " + staged.string());
    }

    for (const auto& [name, bytes] : mutatedParts) {
        replaceEntry(archive.get(), original, name, bytes);
    }

    // zip_close writes the archive; the sources above must stay alive until here
    if (zip_close(archive.get()) < 0) {
        throw PackagingError("Error closing ZIP archive " + staged.string() + ": " + archiveError(archive.get()));
    }
    archive.release();

    std::filesystem::rename(staged, output, ec);
    if (ec) {
        throw PackagingError("Failed to move translated package to " + outputPath + ": " + ec.message());
    }

    std::cout << "DOCX file created: " << outputPath << "\n";
    return outputPath;
}

void PackageReassembler::replaceEntry(zip_t* archive, const DocumentPackage& original, const std::string& name, const std::string& bytes) const {
    const zip_int64_t index = zip_name_locate(archive, name.c_str(), 0);
    if (index < 0) {
        throw PackagingError("Part not found in package: " + name);
    }

    zip_source_t* source = zip_source_buffer(archive, bytes.data(), bytes.size(), 0);
    if (source == nullptr) {
        throw PackagingError("Error creating zip_source_t for part: " + name);
    }

    // Replacing keeps the member at its original position
    if (zip_file_replace(archive, static_cast<zip_uint64_t>(index), source, ZIP_FL_ENC_UTF_8) < 0) {
        zip_source_free(source);
        throw PackagingError("Error replacing part " + name + ": " + archiveError(archive));
    }

    const PackageEntry* entry = original.find(name);
    const zip_int32_t method = (entry != nullptr && entry->compressionMethod == ZIP_CM_STORE) ? ZIP_CM_STORE : ZIP_CM_DEFLATE;
    if (zip_set_file_compression(archive, static_cast<zip_uint64_t>(index), method, 0) < 0) {
        throw PackagingError("Error setting compression for part " + name + ": " + archiveError(archive));
    }
}
