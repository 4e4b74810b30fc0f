/**
 * @file plugin_package.cpp
 * @brief Zip package inspection and extraction (libarchive) and checksums (OpenSSL)
 */

#include <scriptor/plugins/abi.h>
#include <scriptor/plugins/plugin_package.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

#include <archive.h>
#include <archive_entry.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace scriptor::plugins {

namespace fs = std::filesystem;

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};
struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};
using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriter = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

std::string archiveError(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown archive error";
}

Result<ArchiveReader> openZip(const fs::path& packagePath) {
    std::error_code ec;
    if (!fs::is_regular_file(packagePath, ec)) {
        return Error{ErrorCode::FileNotFound, "Package not found: " + packagePath.string()};
    }
    ArchiveReader reader(archive_read_new());
    if (!reader) {
        return Error{ErrorCode::InternalError, "archive_read_new failed"};
    }
    archive_read_support_format_zip(reader.get());
    if (archive_read_open_filename(reader.get(), packagePath.string().c_str(), 10240) !=
        ARCHIVE_OK) {
        return Error{ErrorCode::PackageFormatError, "Failed to open package " +
                                                        packagePath.string() + ": " +
                                                        archiveError(reader.get())};
    }
    return Result<ArchiveReader>(std::move(reader));
}

// Entry paths as stored, minus a leading "./"
std::string normalizedEntryName(struct archive_entry* entry) {
    const char* raw = archive_entry_pathname(entry);
    std::string name = raw ? raw : "";
    if (name.rfind("./", 0) == 0)
        name.erase(0, 2);
    return name;
}

} // namespace

bool isSafeEntryPath(const std::string& entryPath) {
    if (entryPath.empty())
        return false;
    fs::path p(entryPath);
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory())
        return false;
    for (const auto& part : p) {
        if (part == "..")
            return false;
    }
    return true;
}

namespace {

// Entry name after validation: the path must stay under the extraction root and
// a symlink may only point inside the package.
Result<std::string> checkedEntryName(struct archive_entry* entry) {
    std::string name = normalizedEntryName(entry);
    if (!isSafeEntryPath(name)) {
        return Error{ErrorCode::PackageFormatError,
                     "Unsafe entry path in package: '" + name + "'"};
    }
    if (archive_entry_filetype(entry) == AE_IFLNK) {
        const char* target = archive_entry_symlink(entry);
        if (!target || !isSafeEntryPath(target)) {
            return Error{ErrorCode::PackageFormatError,
                         "Unsafe symlink in package: '" + name + "' -> '" +
                             (target ? target : "") + "'"};
        }
    }
    if (archive_entry_hardlink(entry)) {
        return Error{ErrorCode::PackageFormatError,
                     "Hard links are not allowed in packages: '" + name + "'"};
    }
    return name;
}

} // namespace

Result<PackageContents> inspectPackage(const fs::path& packagePath) {
    auto readerRes = openZip(packagePath);
    if (!readerRes)
        return readerRes.error();
    auto reader = std::move(readerRes).value();

    PackageContents contents;
    struct archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
        auto checked = checkedEntryName(entry);
        if (!checked)
            return checked.error();
        std::string name = std::move(checked).value();
        if (name == SCRIPTOR_PLUGIN_ENTRYPOINT &&
            archive_entry_filetype(entry) == AE_IFREG) {
            contents.hasEntrypoint = true;
        }
        if (archive_entry_size(entry) > 0)
            contents.uncompressedBytes += static_cast<uint64_t>(archive_entry_size(entry));
        contents.entries.push_back(std::move(name));
        archive_read_data_skip(reader.get());
    }
    if (r != ARCHIVE_EOF) {
        return Error{ErrorCode::PackageFormatError, "Failed to read package " +
                                                        packagePath.string() + ": " +
                                                        archiveError(reader.get())};
    }
    return contents;
}

Result<uint64_t> extractPackage(const fs::path& packagePath, const fs::path& destDir) {
    auto readerRes = openZip(packagePath);
    if (!readerRes)
        return readerRes.error();
    auto reader = std::move(readerRes).value();

    ArchiveWriter writer(archive_write_disk_new());
    if (!writer) {
        return Error{ErrorCode::InternalError, "archive_write_disk_new failed"};
    }
    archive_write_disk_set_options(writer.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                                     ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                                     ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(writer.get());

    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Failed to create destination directory: " + ec.message()};
    }
    // Entry paths are rooted here; symlinks in the root itself would trip the
    // secure-symlink check.
    fs::path root = fs::canonical(destDir, ec);
    if (ec)
        root = destDir.lexically_normal();

    uint64_t written = 0;
    struct archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
        auto checked = checkedEntryName(entry);
        if (!checked)
            return checked.error();
        std::string name = std::move(checked).value();
        fs::path entryPath = root / name;
        archive_entry_set_pathname(entry, entryPath.string().c_str());

        if (archive_write_header(writer.get(), entry) != ARCHIVE_OK) {
            return Error{ErrorCode::IOError,
                         "Failed to extract '" + name + "': " + archiveError(writer.get())};
        }
        if (archive_entry_size(entry) > 0) {
            const void* buff = nullptr;
            size_t size = 0;
            la_int64_t offset = 0;
            int rr = ARCHIVE_OK;
            while ((rr = archive_read_data_block(reader.get(), &buff, &size, &offset)) ==
                   ARCHIVE_OK) {
                if (archive_write_data_block(writer.get(), buff, size, offset) < ARCHIVE_OK) {
                    return Error{ErrorCode::IOError, "Failed to write '" + name +
                                                         "': " + archiveError(writer.get())};
                }
                written += size;
            }
            if (rr != ARCHIVE_EOF) {
                return Error{ErrorCode::PackageFormatError,
                             "Corrupt entry '" + name + "': " + archiveError(reader.get())};
            }
        }
        if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
            return Error{ErrorCode::IOError,
                         "Failed to finish '" + name + "': " + archiveError(writer.get())};
        }
    }
    if (r != ARCHIVE_EOF) {
        return Error{ErrorCode::PackageFormatError, "Failed to read package " +
                                                        packagePath.string() + ": " +
                                                        archiveError(reader.get())};
    }
    spdlog::debug("Extracted {} bytes from {} into {}", written, packagePath.string(),
                  destDir.string());
    return written;
}

Result<std::string> computePackageChecksum(const fs::path& packagePath) {
    std::ifstream file(packagePath, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot read package: " + packagePath.string()};
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                 &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Error{ErrorCode::InternalError, "SHA-256 initialisation failed"};
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            return Error{ErrorCode::InternalError, "SHA-256 update failed"};
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) {
        return Error{ErrorCode::InternalError, "SHA-256 finalisation failed"};
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hashLen; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return "sha256:" + oss.str();
}

} // namespace scriptor::plugins
