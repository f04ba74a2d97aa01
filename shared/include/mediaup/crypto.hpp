/**
 * MediaUp - Hashing and identifier helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

namespace mediaup::crypto
{

    void ensure_sodium_init();

    // BLAKE2b digest as lowercase hex. Part ETags are this digest of the part bytes.
    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // Hex encoding of `bytes` random bytes.
    std::string random_token(std::size_t bytes = 16);

} // namespace mediaup::crypto
