/**
 * @file checksum.h
 * @brief SHA-256 digests for confirming collected copies
 */

#ifndef KCENON_LOG_COLLECTOR_CORE_CHECKSUM_H
#define KCENON_LOG_COLLECTOR_CORE_CHECKSUM_H

#include <kcenon/log_collector/core/types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace kcenon::log_collector {

/**
 * @brief SHA-256 utilities backed by OpenSSL EVP
 *
 * Used to confirm that a collected copy is identical to its source
 * before the source is deleted.
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return Lowercase hex digest, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return Lowercase hex digest
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Check whether two files have identical content
     * @return true when both digests are computable and equal
     */
    [[nodiscard]] static auto files_match(const std::filesystem::path& a,
                                          const std::filesystem::path& b) -> result<bool>;
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_CORE_CHECKSUM_H
