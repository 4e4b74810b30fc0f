#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

namespace scriptor::test_support {

using PackageEntry = std::pair<std::string, std::string>; // archive path, file body

inline std::string readFileBytes(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in)
        throw std::runtime_error("cannot read " + p.string());
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

using PackageSymlink = std::pair<std::string, std::string>; // archive path, link target

// Write a zip archive holding the given symlinks followed by the given regular files.
inline void writeZipPackage(const std::filesystem::path& out,
                            const std::vector<PackageEntry>& entries,
                            const std::vector<PackageSymlink>& symlinks = {}) {
    struct archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    if (archive_write_open_filename(a, out.string().c_str()) != ARCHIVE_OK) {
        std::string err = archive_error_string(a) ? archive_error_string(a) : "unknown";
        archive_write_free(a);
        throw std::runtime_error("cannot create " + out.string() + ": " + err);
    }
    for (const auto& [path, target] : symlinks) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, path.c_str());
        archive_entry_set_filetype(entry, AE_IFLNK);
        archive_entry_set_symlink(entry, target.c_str());
        archive_entry_set_perm(entry, 0777);
        archive_entry_set_size(entry, 0);
        archive_write_header(a, entry);
        archive_entry_free(entry);
    }
    for (const auto& [path, body] : entries) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, path.c_str());
        archive_entry_set_size(entry, static_cast<la_int64_t>(body.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0755);
        archive_write_header(a, entry);
        archive_write_data(a, body.data(), body.size());
        archive_entry_free(entry);
    }
    archive_write_close(a);
    archive_write_free(a);
}

} // namespace scriptor::test_support
