#pragma once

#include <filesystem>
#include <string>

// Uniquely named working directory owned by one document translation. It is
// removed with everything in it when the object goes out of scope.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::filesystem::path& parent);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return directory; }
    std::filesystem::path file(const std::string& name) const { return directory / name; }

private:
    std::filesystem::path directory;
};
