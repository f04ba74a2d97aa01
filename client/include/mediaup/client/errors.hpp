#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "mediaup/error_codes.hpp"

namespace mediaup::client
{

    // Failure reported by, or while talking to, an upstream collaborator.
    class ServiceError : public std::runtime_error
    {
    public:
        ServiceError(mediaup::ErrorCode code, std::string message);

        mediaup::ErrorCode code() const noexcept { return code_; }
        bool retryable() const noexcept { return mediaup::is_retryable(code_); }

    private:
        mediaup::ErrorCode code_;
    };

    enum class UploadErrorKind
    {
        Initialization,
        PartUpload,
        Completion,
        ProgressPublish,
        Cancelled
    };

    std::string_view to_string(UploadErrorKind kind) noexcept;

    class UploadError : public std::runtime_error
    {
    public:
        UploadError(UploadErrorKind kind, std::string message,
                    mediaup::ErrorCode code = mediaup::ErrorCode::InternalError);

        UploadErrorKind kind() const noexcept { return kind_; }
        mediaup::ErrorCode code() const noexcept { return code_; }

    private:
        UploadErrorKind kind_;
        mediaup::ErrorCode code_;
    };

} // namespace mediaup::client
