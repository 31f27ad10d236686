#include "ScratchDirectory.h"
#include "TranslationErrors.h"

#include <boost/filesystem.hpp>
#include <iostream>

ScratchDirectory::ScratchDirectory(const std::filesystem::path& parent) {
    const boost::filesystem::path base = parent.empty() ? boost::filesystem::path(".") : boost::filesystem::path(parent.native());
    const boost::filesystem::path unique = base / boost::filesystem::unique_path(".doctranslator-%%%%-%%%%-%%%%");

    boost::system::error_code ec;
    if (!boost::filesystem::create_directories(unique, ec) || ec) {
        throw PackagingError("Failed to create working directory " + unique.string() + ": " + ec.message());
    }
    directory = unique.native();
}

ScratchDirectory::~ScratchDirectory() {
    boost::system::error_code ec;
    boost::filesystem::remove_all(boost::filesystem::path(directory.native()), ec);
    if (ec) {
        std::cerr << "Failed to remove working directory " << directory.string() << ": " << ec.message() << "\n";
    }
}
