#include "mediaup/client/errors.hpp"

#include <utility>

namespace mediaup::client
{

    ServiceError::ServiceError(mediaup::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    UploadError::UploadError(UploadErrorKind kind, std::string message, mediaup::ErrorCode code)
        : std::runtime_error(std::move(message)), kind_(kind), code_(code) {}

    std::string_view to_string(UploadErrorKind kind) noexcept
    {
        switch (kind)
        {
        case UploadErrorKind::Initialization:
            return "initialization";
        case UploadErrorKind::PartUpload:
            return "part_upload";
        case UploadErrorKind::Completion:
            return "completion";
        case UploadErrorKind::ProgressPublish:
            return "progress_publish";
        case UploadErrorKind::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

} // namespace mediaup::client
