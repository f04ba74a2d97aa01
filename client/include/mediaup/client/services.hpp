#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "mediaup/client/errors.hpp"
#include "mediaup/protocol.hpp"

namespace mediaup::client
{

    struct InitResult
    {
        std::string session_id;
        std::optional<std::string> upload_id;
    };

    struct PartResult
    {
        std::uint32_t part_number{};
        std::string etag;
    };

    struct CompletionResult
    {
        std::string session_id;
        std::uint64_t size{};
    };

    // The object-storage side of the pipeline. Implementations throw ServiceError.
    class StorageService
    {
    public:
        virtual ~StorageService() = default;

        virtual InitResult initialize(const mediaup::protocol::InitializeUploadRequest &request) = 0;

        virtual PartResult upload_part(const std::string &session_id, std::uint32_t part_number,
                                       std::span<const std::byte> bytes) = 0;

        virtual CompletionResult direct_upload(const std::string &session_id, std::span<const std::byte> bytes) = 0;

        virtual CompletionResult complete_upload(const std::string &session_id,
                                                 const std::vector<mediaup::protocol::PartETag> &parts) = 0;

        virtual void abort_upload(const std::string &session_id) = 0;
    };

    // Session-keyed latest-record store shared by the uploader and any number of observers.
    class ProgressStore
    {
    public:
        virtual ~ProgressStore() = default;

        virtual void publish(const mediaup::protocol::ProgressRecord &record) = 0;

        // std::nullopt when the store has no record for the session.
        virtual std::optional<mediaup::protocol::ProgressRecord> fetch(const std::string &session_id) = 0;
    };

} // namespace mediaup::client
