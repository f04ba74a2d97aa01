#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mediaup/protocol.hpp"
#include "mediaup/server/config.hpp"
#include "mediaup/server/registry_error.hpp"

namespace mediaup::server
{

    struct UploadState
    {
        std::string session_id;
        std::optional<std::string> upload_id;
        std::string filename;
        std::string content_type;
        std::uint32_t speaker_count{};
        mediaup::protocol::UploadStrategy strategy{mediaup::protocol::UploadStrategy::Direct};
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::uint32_t total_parts{};
        // part number -> ETag of the bytes currently stored for it
        std::map<std::uint32_t, std::string> parts;
        std::chrono::system_clock::time_point last_update{};
        // Set while complete() assembles the object outside the registry lock.
        bool completing{false};
    };

    // Media types accepted at initialization, compared case-insensitively.
    bool is_accepted_media_type(const std::string &content_type);

    /**
     * Upload sessions of the gateway, persisted as JSON metadata beside their part files.
     *
     * Layout under the storage root:
     *   .mediaup/uploads/<session>.json   session metadata
     *   .mediaup/parts/<session>/<n>.part  stored multipart parts
     *   objects/<session>/<filename>       finished objects
     *
     * All operations throw RegistryError with the code reported to the client.
     *
     * A finished session leaves a receipt behind until the next cleanup, so a repeated direct
     * upload or completion with the same content answers with the original result.
     */
    class UploadRegistry
    {
    public:
        explicit UploadRegistry(std::filesystem::path storage_root,
                                std::uint64_t max_file_size = kDefaultMaxFileSize);

        UploadState create(const mediaup::protocol::InitializeUploadRequest &request);

        // Stores (or replaces) one part and returns its ETag.
        std::string store_part(const std::string &session_id, std::uint32_t part_number,
                               const std::vector<std::byte> &data, const std::string &part_hash);

        // Writes the whole object of a direct session and closes it. Returns the stored size.
        std::uint64_t store_direct(const std::string &session_id, const std::vector<std::byte> &data,
                                   const std::string &content_hash);

        // Assembles the parts in order and closes the session. Returns the object size.
        std::uint64_t complete(const std::string &session_id, const std::vector<mediaup::protocol::PartETag> &parts);

        void abort(const std::string &session_id);

        std::optional<UploadState> find(const std::string &session_id) const;

        std::filesystem::path object_path(const std::string &session_id, const std::string &filename) const;

        // Drops sessions idle for longer than max_age, and receipts older than that.
        // Returns how many sessions were removed.
        std::size_t cleanup_expired(std::chrono::seconds max_age);

    private:
        struct Receipt
        {
            // Content hash of a direct upload, or the joined ETags of a completion.
            std::string fingerprint;
            std::uint64_t size{};
            std::chrono::system_clock::time_point finished_at{};
        };

        std::filesystem::path metadata_path(const std::string &session_id) const;
        std::filesystem::path parts_dir(const std::string &session_id) const;
        std::filesystem::path part_path(const std::string &session_id, std::uint32_t part_number) const;

        UploadState &require(const std::string &session_id);
        // require() that also refuses a session whose completion is in progress.
        UploadState &require_idle(const std::string &session_id);
        std::optional<std::uint64_t> replay(const std::string &session_id, const std::string &fingerprint) const;
        std::uint64_t assemble(const UploadState &state) const;
        void load_existing();
        void persist_state(const UploadState &state) const;
        void discard(const std::string &session_id);

        std::filesystem::path root_;
        std::filesystem::path registry_dir_;
        std::filesystem::path parts_root_;
        std::uint64_t max_file_size_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, UploadState> uploads_;
        std::unordered_map<std::string, Receipt> finished_;
    };

} // namespace mediaup::server
