#include "mediaup/crypto.hpp"

#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace mediaup::crypto
{

    namespace
    {

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

    } // namespace

    void ensure_sodium_init()
    {
        std::call_once(sodium_once_flag(), []()
                       {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            } });
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ensure_sodium_init();
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash(digest.data(), digest.size(),
                               reinterpret_cast<const unsigned char *>(data.data()), data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    std::string hash_stream(std::istream &input)
    {
        ensure_sodium_init();
        crypto_generichash_state state;
        if (crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }

        std::vector<unsigned char> buffer(256 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0 && crypto_generichash_update(&state, buffer.data(), read_count) != 0)
            {
                throw std::runtime_error("crypto_generichash_update failed");
            }
        }

        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash_final(&state, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return to_hex(digest);
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

    std::string random_token(std::size_t bytes)
    {
        ensure_sodium_init();
        std::vector<unsigned char> buffer(bytes);
        randombytes_buf(buffer.data(), buffer.size());
        return to_hex(buffer);
    }

} // namespace mediaup::crypto
