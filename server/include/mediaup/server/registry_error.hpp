#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "mediaup/error_codes.hpp"

namespace mediaup::server
{

    // Rejection of a request by the upload registry or the progress board.
    class RegistryError : public std::runtime_error
    {
    public:
        RegistryError(mediaup::ErrorCode code, std::string message)
            : std::runtime_error(std::move(message)), code_(code) {}

        mediaup::ErrorCode code() const noexcept { return code_; }

    private:
        mediaup::ErrorCode code_;
    };

} // namespace mediaup::server
