#include "mediaup/client/part_uploader.hpp"

#include <algorithm>
#include <fstream>
#include <string>

#include "mediaup/crypto.hpp"

namespace mediaup::client
{

    std::chrono::milliseconds RetryPolicy::backoff(std::uint32_t attempt) const
    {
        auto delay = base_delay;
        for (std::uint32_t i = 1; i < attempt && delay < max_delay; ++i)
        {
            delay *= 2;
        }
        return std::min(delay, max_delay);
    }

    PartUploader::PartUploader(StorageService &storage, Logger logger, RetryPolicy policy)
        : storage_(storage), logger_(std::move(logger)), policy_(policy)
    {
        if (policy_.max_attempts == 0)
        {
            policy_.max_attempts = 1;
        }
    }

    template <typename Result>
    Result PartUploader::with_retry(const std::string &what, const CancellationToken &cancel,
                                    const std::function<Result()> &attempt) const
    {
        for (std::uint32_t n = 1;; ++n)
        {
            cancel.throw_if_cancelled();
            try
            {
                return attempt();
            }
            catch (const ServiceError &ex)
            {
                if (!ex.retryable() || n >= policy_.max_attempts)
                {
                    logger_.error("upload", what, " failed after ", n, " attempt(s): ", ex.what());
                    throw UploadError(UploadErrorKind::PartUpload,
                                      what + " failed: " + ex.what(), ex.code());
                }
                const auto delay = policy_.backoff(n);
                logger_.warn("upload", what, " attempt ", n, " failed (", mediaup::to_string(ex.code()),
                             "): ", ex.what(), "; retrying in ", delay.count(), "ms");
                if (!cancel.wait_for(delay))
                {
                    throw UploadError(UploadErrorKind::Cancelled, "Upload cancelled", mediaup::ErrorCode::Cancelled);
                }
            }
        }
    }

    PartRecord PartUploader::upload_part(const UploadSession &session, std::uint32_t part_number,
                                         const CancellationToken &cancel) const
    {
        cancel.throw_if_cancelled();
        const auto range = byte_range(session.plan, part_number);
        const auto bytes = read_range(session.source, range);
        const auto expected_etag = mediaup::crypto::hash_bytes(bytes);

        const auto what = "part " + std::to_string(part_number) + "/" + std::to_string(session.total_parts());
        auto result = with_retry<PartResult>(what, cancel, [&]
                                             {
            auto part = storage_.upload_part(session.session_id, part_number, bytes);
            if (part.etag.empty())
            {
                throw ServiceError(mediaup::ErrorCode::InvalidPayload, "Response carried no ETag");
            }
            if (part.part_number != part_number)
            {
                throw ServiceError(mediaup::ErrorCode::InvalidPayload,
                                   "Acknowledged part " + std::to_string(part.part_number));
            }
            if (part.etag != expected_etag)
            {
                throw ServiceError(mediaup::ErrorCode::IntegrityMismatch, "ETag does not match part contents");
            }
            return part; });

        if (part_number == 1 || part_number % 20 == 0 || part_number == session.total_parts())
        {
            logger_.info("upload", session.session_id, " ", what, " etag=", result.etag);
        }
        return PartRecord{.part_number = part_number, .range = range, .etag = std::move(result.etag)};
    }

    CompletionResult PartUploader::upload_direct(const UploadSession &session, const CancellationToken &cancel) const
    {
        cancel.throw_if_cancelled();
        const auto bytes = read_range(session.source, ByteRange{.offset = 0, .length = session.file_size()});
        auto ack = with_retry<CompletionResult>("direct upload", cancel, [&]
                                                { return storage_.direct_upload(session.session_id, bytes); });
        if (ack.size != session.file_size())
        {
            throw UploadError(UploadErrorKind::PartUpload,
                              "Storage acknowledged " + std::to_string(ack.size) + " of " +
                                  std::to_string(session.file_size()) + " bytes",
                              mediaup::ErrorCode::IntegrityMismatch);
        }
        logger_.info("upload", session.session_id, " direct upload of ", ack.size, " bytes acknowledged");
        return ack;
    }

    std::vector<std::byte> PartUploader::read_range(const std::filesystem::path &path, const ByteRange &range)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw UploadError(UploadErrorKind::PartUpload, "Could not open " + path.string() + " for reading");
        }
        std::vector<std::byte> buffer(static_cast<std::size_t>(range.length));
        in.seekg(static_cast<std::streamoff>(range.offset));
        in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (static_cast<std::uint64_t>(in.gcount()) != range.length)
        {
            throw UploadError(UploadErrorKind::PartUpload,
                              "Short read of " + path.string() + " at offset " + std::to_string(range.offset));
        }
        return buffer;
    }

} // namespace mediaup::client
