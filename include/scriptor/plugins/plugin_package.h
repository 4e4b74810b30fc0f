#pragma once
/**
 * @file plugin_package.h
 * @brief Reading plugin packages (.scpl / .zip archives)
 *
 * A package is a zip archive whose root holds the plugin entrypoint. Installing
 * it extracts every entry verbatim into a fresh plugin directory.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <scriptor/core/types.h>

namespace scriptor::plugins {

/**
 * Summary of a package's contents.
 */
struct PackageContents {
    std::vector<std::string> entries; // archive paths, in archive order
    bool hasEntrypoint{false};        // entrypoint present at the archive root
    uint64_t uncompressedBytes{0};
};

/**
 * List a package without extracting it.
 * Fails with FileNotFound when the file is missing and PackageFormatError when
 * it is not a readable zip archive, contains an unsafe entry path, a symlink
 * pointing outside the package, or a hard link.
 */
Result<PackageContents> inspectPackage(const std::filesystem::path& packagePath);

/**
 * Extract every entry of a package under @p destDir (created if needed).
 * @return number of bytes written
 */
Result<uint64_t> extractPackage(const std::filesystem::path& packagePath,
                                const std::filesystem::path& destDir);

/**
 * SHA-256 of the package file, formatted "sha256:<hex>".
 */
Result<std::string> computePackageChecksum(const std::filesystem::path& packagePath);

/**
 * True when an archive entry path stays inside the extraction root
 * (relative, no ".." components).
 */
bool isSafeEntryPath(const std::string& entryPath);

} // namespace scriptor::plugins
