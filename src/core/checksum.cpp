/**
 * @file checksum.cpp
 * @brief Implementation of SHA-256 utilities
 */

#include <kcenon/log_collector/core/checksum.h>

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace kcenon::log_collector {

namespace {

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

auto to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

auto new_sha256_context() -> md_ctx_ptr {
    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

}  // namespace

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_not_found, "cannot open file: " + path.string()});
    }

    auto ctx = new_sha256_context();
    if (!ctx) {
        return unexpected(error{error_code::internal_error, "EVP digest init failed"});
    }

    std::array<char, 64 * 1024> buffer{};
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(bytes_read)) != 1) {
            return unexpected(error{error_code::internal_error, "EVP digest update failed"});
        }
    }
    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        return unexpected(error{error_code::internal_error, "EVP digest final failed"});
    }
    return to_hex(digest.data(), length);
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(),
                   nullptr) != 1) {
        return {};
    }
    return to_hex(digest.data(), length);
}

auto checksum::files_match(const std::filesystem::path& a, const std::filesystem::path& b)
    -> result<bool> {
    auto first = sha256_file(a);
    if (!first) {
        return unexpected(first.error());
    }
    auto second = sha256_file(b);
    if (!second) {
        return unexpected(second.error());
    }
    return first.value() == second.value();
}

}  // namespace kcenon::log_collector
