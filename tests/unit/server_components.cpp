#include <cassert>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "mediaup/crypto.hpp"
#include "mediaup/server/progress_board.hpp"
#include "mediaup/server/upload_registry.hpp"

using namespace mediaup;
using namespace mediaup::server;
using mediaup::protocol::InitializeUploadRequest;
using mediaup::protocol::PartETag;
using mediaup::protocol::ProgressRecord;
using mediaup::protocol::SessionStatus;
using mediaup::protocol::UploadStrategy;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        cleanup_path(root);
        std::filesystem::create_directories(root);
        return root;
    }

    std::vector<std::byte> bytes_of(std::size_t size, unsigned seed)
    {
        std::vector<std::byte> data(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<std::byte>((i + seed) % 256);
        }
        return data;
    }

    std::vector<std::byte> read_all(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::vector<std::byte> data(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i)
        {
            data[i] = static_cast<std::byte>(raw[i]);
        }
        return data;
    }

    InitializeUploadRequest multipart_request(std::uint64_t size, std::uint64_t chunk)
    {
        return InitializeUploadRequest{
            .filename = "meeting.mp4",
            .file_size = size,
            .content_type = "video/mp4",
            .speaker_count = 2,
            .strategy = UploadStrategy::Multipart,
            .chunk_size = chunk,
            .total_parts = static_cast<std::uint32_t>((size + chunk - 1) / chunk),
        };
    }

    template <typename Fn>
    std::optional<ErrorCode> registry_error_code(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const RegistryError &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    void test_multipart_assembles_in_order()
    {
        const auto root = fresh_root("mediaup_registry_multipart");
        UploadRegistry registry(root);

        const auto state = registry.create(multipart_request(10, 4));
        assert(state.total_parts == 3);
        assert(state.upload_id);
        assert(!state.session_id.empty());

        const auto p1 = bytes_of(4, 1);
        const auto p2 = bytes_of(4, 50);
        const auto p3 = bytes_of(2, 99);
        std::vector<PartETag> parts(3);
        parts[2] = PartETag{3, registry.store_part(state.session_id, 3, p3, crypto::hash_bytes(p3))};
        parts[0] = PartETag{1, registry.store_part(state.session_id, 1, p1, crypto::hash_bytes(p1))};
        parts[1] = PartETag{2, registry.store_part(state.session_id, 2, p2, crypto::hash_bytes(p2))};
        assert(parts[0].etag == crypto::hash_bytes(p1));
        assert(registry.find(state.session_id)->parts.size() == 3);

        assert(registry.complete(state.session_id, parts) == 10);
        assert(!registry.find(state.session_id));

        std::vector<std::byte> expected = p1;
        expected.insert(expected.end(), p2.begin(), p2.end());
        expected.insert(expected.end(), p3.begin(), p3.end());
        assert(read_all(registry.object_path(state.session_id, "meeting.mp4")) == expected);

        cleanup_path(root);
    }

    void test_invalid_part_lists_rejected()
    {
        const auto root = fresh_root("mediaup_registry_parts");
        UploadRegistry registry(root);

        const auto state = registry.create(multipart_request(12, 4));
        std::vector<PartETag> parts;
        for (std::uint32_t n = 1; n <= 3; ++n)
        {
            const auto data = bytes_of(4, n);
            parts.push_back(PartETag{n, registry.store_part(state.session_id, n, data, crypto::hash_bytes(data))});
        }

        const auto gapped = std::vector<PartETag>{parts[0], parts[2]};
        assert(registry_error_code([&]
                                   { registry.complete(state.session_id, gapped); }) == ErrorCode::PartsInvalid);

        const auto reordered = std::vector<PartETag>{parts[1], parts[0], parts[2]};
        assert(registry_error_code([&]
                                   { registry.complete(state.session_id, reordered); }) == ErrorCode::PartsInvalid);

        auto wrong_etag = parts;
        wrong_etag[1].etag = "deadbeef";
        assert(registry_error_code([&]
                                   { registry.complete(state.session_id, wrong_etag); }) == ErrorCode::PartsInvalid);

        assert(registry.find(state.session_id));
        assert(registry.complete(state.session_id, parts) == 12);

        cleanup_path(root);
    }

    void test_part_validation()
    {
        const auto root = fresh_root("mediaup_registry_validation");
        UploadRegistry registry(root);
        const auto state = registry.create(multipart_request(10, 4));

        const auto short_part = bytes_of(3, 0);
        assert(registry_error_code([&]
                                   { registry.store_part(state.session_id, 1, short_part, crypto::hash_bytes(short_part)); }) ==
               ErrorCode::InvalidPayload);

        const auto data = bytes_of(4, 0);
        assert(registry_error_code([&]
                                   { registry.store_part(state.session_id, 1, data, "bogus"); }) ==
               ErrorCode::IntegrityMismatch);
        assert(registry_error_code([&]
                                   { registry.store_part(state.session_id, 4, data, crypto::hash_bytes(data)); }) ==
               ErrorCode::InvalidPayload);
        assert(registry_error_code([&]
                                   { registry.store_part("missing", 1, data, crypto::hash_bytes(data)); }) ==
               ErrorCode::NotFound);

        const auto first = registry.store_part(state.session_id, 1, data, crypto::hash_bytes(data));
        const auto replacement = bytes_of(4, 7);
        const auto second = registry.store_part(state.session_id, 1, replacement, crypto::hash_bytes(replacement));
        assert(first != second);
        assert(registry.find(state.session_id)->parts.at(1) == second);

        cleanup_path(root);
    }

    void test_create_validation()
    {
        const auto root = fresh_root("mediaup_registry_create");
        UploadRegistry registry(root);

        auto empty = multipart_request(10, 4);
        empty.file_size = 0;
        assert(registry_error_code([&]
                                   { registry.create(empty); }) == ErrorCode::InvalidPayload);

        auto miscounted = multipart_request(10, 4);
        miscounted.total_parts = 2;
        assert(registry_error_code([&]
                                   { registry.create(miscounted); }) == ErrorCode::InvalidPayload);

        cleanup_path(root);
    }

    void test_direct_upload()
    {
        const auto root = fresh_root("mediaup_registry_direct");
        UploadRegistry registry(root);

        const auto state = registry.create(InitializeUploadRequest{
            .filename = "memo.mp3",
            .file_size = 16,
            .content_type = "audio/mpeg",
            .speaker_count = 1,
            .strategy = UploadStrategy::Direct,
            .chunk_size = 0,
            .total_parts = 0,
        });
        assert(!state.upload_id);
        assert(state.total_parts == 1);

        const auto data = bytes_of(16, 3);
        assert(registry_error_code([&]
                                   { registry.store_part(state.session_id, 1, data, crypto::hash_bytes(data)); }) ==
               ErrorCode::Conflict);
        assert(registry_error_code([&]
                                   { registry.store_direct(state.session_id, bytes_of(15, 3), "x"); }) ==
               ErrorCode::InvalidPayload);

        assert(registry.store_direct(state.session_id, data, crypto::hash_bytes(data)) == 16);
        assert(read_all(registry.object_path(state.session_id, "memo.mp3")) == data);
        assert(!registry.find(state.session_id));

        cleanup_path(root);
    }

    void test_abort_and_cleanup()
    {
        const auto root = fresh_root("mediaup_registry_abort");
        UploadRegistry registry(root);

        const auto aborted = registry.create(multipart_request(8, 4));
        const auto data = bytes_of(4, 0);
        registry.store_part(aborted.session_id, 1, data, crypto::hash_bytes(data));
        registry.abort(aborted.session_id);
        assert(!registry.find(aborted.session_id));
        assert(registry_error_code([&]
                                   { registry.abort(aborted.session_id); }) == ErrorCode::NotFound);

        const auto stale = registry.create(multipart_request(8, 4));
        assert(registry.cleanup_expired(std::chrono::hours{1}) == 0);
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
        assert(registry.cleanup_expired(std::chrono::seconds{0}) == 1);
        assert(!registry.find(stale.session_id));

        cleanup_path(root);
    }

    void test_registry_reload()
    {
        const auto root = fresh_root("mediaup_registry_reload");
        std::string session_id;
        const auto data = bytes_of(4, 9);
        {
            UploadRegistry registry(root);
            session_id = registry.create(multipart_request(8, 4)).session_id;
            registry.store_part(session_id, 1, data, crypto::hash_bytes(data));
        }

        UploadRegistry reloaded(root);
        const auto state = reloaded.find(session_id);
        assert(state);
        assert(state->filename == "meeting.mp4");
        assert(state->total_parts == 2);
        assert(state->parts.at(1) == crypto::hash_bytes(data));

        cleanup_path(root);
    }

    InitializeUploadRequest direct_request(std::uint64_t size)
    {
        return InitializeUploadRequest{
            .filename = "memo.mp3",
            .file_size = size,
            .content_type = "audio/mpeg",
            .speaker_count = 1,
            .strategy = UploadStrategy::Direct,
            .chunk_size = 0,
            .total_parts = 0,
        };
    }

    void test_repeated_direct_upload_returns_same_ack()
    {
        const auto root = fresh_root("mediaup_registry_direct_repeat");
        UploadRegistry registry(root);
        const auto state = registry.create(direct_request(16));

        const auto data = bytes_of(16, 5);
        assert(registry.store_direct(state.session_id, data, crypto::hash_bytes(data)) == 16);
        assert(registry.store_direct(state.session_id, data, crypto::hash_bytes(data)) == 16);
        assert(read_all(registry.object_path(state.session_id, "memo.mp3")) == data);

        const auto other = bytes_of(16, 6);
        assert(registry_error_code([&]
                                   { registry.store_direct(state.session_id, other, crypto::hash_bytes(other)); }) ==
               ErrorCode::Conflict);

        // Receipts go with the next cleanup.
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
        registry.cleanup_expired(std::chrono::seconds{0});
        assert(registry_error_code([&]
                                   { registry.store_direct(state.session_id, data, crypto::hash_bytes(data)); }) ==
               ErrorCode::NotFound);

        cleanup_path(root);
    }

    void test_repeated_completion_returns_same_ack()
    {
        const auto root = fresh_root("mediaup_registry_complete_repeat");
        UploadRegistry registry(root);
        const auto state = registry.create(multipart_request(8, 4));

        std::vector<PartETag> parts;
        for (std::uint32_t n = 1; n <= 2; ++n)
        {
            const auto data = bytes_of(4, n);
            parts.push_back(PartETag{n, registry.store_part(state.session_id, n, data, crypto::hash_bytes(data))});
        }
        assert(registry.complete(state.session_id, parts) == 8);
        assert(registry.complete(state.session_id, parts) == 8);

        auto changed = parts;
        changed[0].etag = "deadbeef";
        assert(registry_error_code([&]
                                   { registry.complete(state.session_id, changed); }) == ErrorCode::Conflict);

        cleanup_path(root);
    }

    void test_failed_assembly_reopens_session()
    {
        const auto root = fresh_root("mediaup_registry_assembly_failure");
        UploadRegistry registry(root);
        const auto state = registry.create(multipart_request(8, 4));

        std::vector<PartETag> parts;
        for (std::uint32_t n = 1; n <= 2; ++n)
        {
            const auto data = bytes_of(4, n);
            parts.push_back(PartETag{n, registry.store_part(state.session_id, n, data, crypto::hash_bytes(data))});
        }
        std::filesystem::remove(root / ".mediaup/parts" / state.session_id / "2.part");

        assert(registry_error_code([&]
                                   { registry.complete(state.session_id, parts); }) == ErrorCode::InternalError);
        const auto reopened = registry.find(state.session_id);
        assert(reopened);
        assert(!reopened->completing);

        const auto again = bytes_of(4, 2);
        registry.store_part(state.session_id, 2, again, crypto::hash_bytes(again));
        assert(registry.complete(state.session_id, parts) == 8);

        cleanup_path(root);
    }

    void test_assembly_runs_outside_registry_lock()
    {
        const auto root = fresh_root("mediaup_registry_assembly_lock");
        UploadRegistry registry(root);

        constexpr std::uint64_t kChunk = 1024 * 1024;
        constexpr std::uint32_t kParts = 24;
        const auto big = registry.create(multipart_request(kChunk * kParts, kChunk));
        const auto chunk = bytes_of(kChunk, 11);
        const auto chunk_hash = crypto::hash_bytes(chunk);
        std::vector<PartETag> parts;
        for (std::uint32_t n = 1; n <= kParts; ++n)
        {
            parts.push_back(PartETag{n, registry.store_part(big.session_id, n, chunk, chunk_hash)});
        }
        const auto small = registry.create(multipart_request(8, 4));

        std::uint64_t assembled = 0;
        std::thread completer([&]
                              { assembled = registry.complete(big.session_id, parts); });

        bool saw_completing = false;
        while (true)
        {
            const auto state = registry.find(big.session_id);
            if (!state)
            {
                break;
            }
            if (state->completing)
            {
                saw_completing = true;
                break;
            }
            std::this_thread::yield();
        }
        if (saw_completing)
        {
            const auto code = registry_error_code([&]
                                                  { registry.store_part(big.session_id, 1, chunk, chunk_hash); });
            assert(code == ErrorCode::Conflict || code == ErrorCode::NotFound);
            const auto abort_code = registry_error_code([&]
                                                        { registry.abort(big.session_id); });
            assert(abort_code == ErrorCode::Conflict || abort_code == ErrorCode::NotFound);
        }
        const auto data = bytes_of(4, 1);
        assert(registry.store_part(small.session_id, 1, data, crypto::hash_bytes(data)) == crypto::hash_bytes(data));

        completer.join();
        assert(assembled == kChunk * kParts);
        assert(!registry.find(big.session_id));
        assert(std::filesystem::file_size(registry.object_path(big.session_id, "meeting.mp4")) == kChunk * kParts);

        cleanup_path(root);
    }

    void test_create_enforces_size_limit_and_media_types()
    {
        const auto root = fresh_root("mediaup_registry_limits");
        {
            UploadRegistry registry(root);
            auto huge = multipart_request(kDefaultMaxFileSize + 1, 10 * 1024 * 1024);
            assert(registry_error_code([&]
                                       { registry.create(huge); }) == ErrorCode::InvalidPayload);

            auto document = direct_request(16);
            document.content_type = "application/pdf";
            assert(registry_error_code([&]
                                       { registry.create(document); }) == ErrorCode::Unsupported);

            auto unknown = direct_request(16);
            unknown.content_type = "application/octet-stream";
            assert(registry_error_code([&]
                                       { registry.create(unknown); }) == ErrorCode::Unsupported);

            auto shouting = direct_request(16);
            shouting.content_type = "VIDEO/QuickTime";
            assert(!registry_error_code([&]
                                        { registry.create(shouting); }));
        }

        UploadRegistry small_limit(root, 100);
        assert(registry_error_code([&]
                                   { small_limit.create(direct_request(101)); }) == ErrorCode::InvalidPayload);
        assert(small_limit.create(direct_request(100)).file_size == 100);

        for (const auto *type : {"video/mp4", "video/webm", "video/x-matroska", "video/x-msvideo", "audio/wav",
                                 "audio/mp4", "audio/ogg", "audio/flac", "audio/aac"})
        {
            assert(is_accepted_media_type(type));
        }

        cleanup_path(root);
    }

    ProgressRecord record_for(const std::string &session_id, SessionStatus status, double progress)
    {
        return ProgressRecord{
            .session_id = session_id,
            .status = status,
            .progress = progress,
            .message = "working",
            .stage = "uploading",
            .timestamp = {},
        };
    }

    void test_progress_board()
    {
        ProgressBoard board;
        const auto missing = board.fetch("nobody");
        assert(missing.status == SessionStatus::Unknown);
        assert(missing.session_id == "nobody");

        const auto stored = board.publish(record_for("s1", SessionStatus::Uploading, 25));
        assert(!stored.timestamp.empty());
        assert(stored.timestamp.back() == 'Z');

        board.publish(record_for("s1", SessionStatus::Processing, 50));
        const auto latest = board.fetch("s1");
        assert(latest.status == SessionStatus::Processing);
        assert(latest.progress == 50.0);
        assert(latest.message == "working");
        assert(board.size() == 1);

        assert(registry_error_code([&]
                                   { board.publish(record_for("", SessionStatus::Uploading, 1)); }) ==
               ErrorCode::InvalidPayload);
        assert(registry_error_code([&]
                                   { board.publish(record_for("s2", SessionStatus::Unknown, 1)); }) ==
               ErrorCode::InvalidPayload);
    }

    void test_progress_board_expiry()
    {
        ProgressBoard board(std::chrono::seconds{0});
        board.publish(record_for("s1", SessionStatus::Uploading, 10));
        board.publish(record_for("s2", SessionStatus::Uploading, 10));
        assert(board.fetch("s1").status == SessionStatus::Unknown);
        assert(board.purge_expired() == 1);
        assert(board.size() == 0);
    }

} // namespace

void run_server_component_tests()
{
    test_multipart_assembles_in_order();
    test_invalid_part_lists_rejected();
    test_part_validation();
    test_create_validation();
    test_direct_upload();
    test_abort_and_cleanup();
    test_registry_reload();
    test_repeated_direct_upload_returns_same_ack();
    test_repeated_completion_returns_same_ack();
    test_failed_assembly_reopens_session();
    test_assembly_runs_outside_registry_lock();
    test_create_enforces_size_limit_and_media_types();
    test_progress_board();
    test_progress_board_expiry();
}
