#include "mediaup/server/upload_registry.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "mediaup/crypto.hpp"

namespace mediaup::server
{

    namespace
    {
        constexpr auto kMetadataDir = ".mediaup/uploads";
        constexpr auto kPartsDir = ".mediaup/parts";
        constexpr auto kObjectsDir = "objects";

        // Every type the uploader guesses from a media extension, plus the legacy video aliases.
        constexpr std::array<std::string_view, 13> kMediaTypes{
            "video/mp4", "video/quicktime", "video/webm", "video/x-matroska", "video/x-msvideo",
            "video/mov", "video/avi",
            "audio/mpeg", "audio/wav", "audio/mp4", "audio/ogg", "audio/flac", "audio/aac"};

        nlohmann::json to_json(const UploadState &state)
        {
            nlohmann::json parts = nlohmann::json::array();
            for (const auto &[number, etag] : state.parts)
            {
                parts.push_back({{"part_number", number}, {"etag", etag}});
            }
            nlohmann::json json = {
                {"session_id", state.session_id},
                {"filename", state.filename},
                {"content_type", state.content_type},
                {"num_speakers", state.speaker_count},
                {"strategy", mediaup::protocol::to_string(state.strategy)},
                {"file_size", state.file_size},
                {"chunk_size", state.chunk_size},
                {"total_parts", state.total_parts},
                {"parts", std::move(parts)},
                {"last_update", std::chrono::duration_cast<std::chrono::seconds>(state.last_update.time_since_epoch()).count()},
            };
            if (state.upload_id)
            {
                json["upload_id"] = *state.upload_id;
            }
            return json;
        }

        UploadState state_from_json(const nlohmann::json &json)
        {
            UploadState state{};
            state.session_id = json.at("session_id").get<std::string>();
            if (json.contains("upload_id"))
            {
                state.upload_id = json.at("upload_id").get<std::string>();
            }
            state.filename = json.at("filename").get<std::string>();
            state.content_type = json.value("content_type", std::string{});
            state.speaker_count = json.value("num_speakers", 2u);
            state.strategy = mediaup::protocol::upload_strategy_from_string(json.value("strategy", std::string{"direct"}))
                                 .value_or(mediaup::protocol::UploadStrategy::Direct);
            state.file_size = json.value("file_size", 0ULL);
            state.chunk_size = json.value("chunk_size", 0ULL);
            state.total_parts = json.value("total_parts", 0u);
            for (const auto &part : json.value("parts", nlohmann::json::array()))
            {
                state.parts[part.at("part_number").get<std::uint32_t>()] = part.at("etag").get<std::string>();
            }
            const auto seconds = json.value("last_update", 0LL);
            state.last_update = std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
            return state;
        }

        std::string safe_filename(const std::string &requested)
        {
            const auto name = std::filesystem::path(requested).filename().string();
            if (name.empty() || name == "." || name == "..")
            {
                throw RegistryError(mediaup::ErrorCode::InvalidPayload, "Invalid filename: '" + requested + "'");
            }
            return name;
        }

        std::uint64_t expected_part_length(const UploadState &state, std::uint32_t part_number)
        {
            if (part_number < state.total_parts)
            {
                return state.chunk_size;
            }
            return state.file_size - state.chunk_size * (static_cast<std::uint64_t>(state.total_parts) - 1);
        }

        std::string completion_fingerprint(const std::vector<mediaup::protocol::PartETag> &parts)
        {
            std::string joined;
            for (const auto &part : parts)
            {
                joined += std::to_string(part.part_number) + ':' + part.etag + ';';
            }
            return joined;
        }

        void write_file(const std::filesystem::path &path, const std::vector<std::byte> &data)
        {
            std::filesystem::create_directories(path.parent_path());
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            out.close();
            if (!out)
            {
                throw RegistryError(mediaup::ErrorCode::InternalError, "Failed to write " + path.string());
            }
        }

    } // namespace

    bool is_accepted_media_type(const std::string &content_type)
    {
        auto lowered = content_type;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });
        return std::find(kMediaTypes.begin(), kMediaTypes.end(), lowered) != kMediaTypes.end();
    }

    UploadRegistry::UploadRegistry(std::filesystem::path storage_root, std::uint64_t max_file_size)
        : root_(std::move(storage_root)),
          registry_dir_(root_ / kMetadataDir),
          parts_root_(root_ / kPartsDir),
          max_file_size_(max_file_size)
    {
        std::filesystem::create_directories(registry_dir_);
        std::filesystem::create_directories(parts_root_);
        load_existing();
    }

    UploadState UploadRegistry::create(const mediaup::protocol::InitializeUploadRequest &request)
    {
        using mediaup::protocol::UploadStrategy;

        UploadState state{};
        state.filename = safe_filename(request.filename);
        if (request.file_size == 0)
        {
            throw RegistryError(mediaup::ErrorCode::InvalidPayload, "file_size must be greater than zero");
        }
        if (request.file_size > max_file_size_)
        {
            throw RegistryError(mediaup::ErrorCode::InvalidPayload,
                                "file_size " + std::to_string(request.file_size) + " exceeds the limit of " +
                                    std::to_string(max_file_size_) + " bytes");
        }
        if (!is_accepted_media_type(request.content_type))
        {
            throw RegistryError(mediaup::ErrorCode::Unsupported,
                                "Unsupported content type '" + request.content_type + "'");
        }
        if (request.strategy == UploadStrategy::Multipart)
        {
            if (request.chunk_size == 0)
            {
                throw RegistryError(mediaup::ErrorCode::InvalidPayload, "chunk_size must be greater than zero");
            }
            const auto expected_parts = (request.file_size + request.chunk_size - 1) / request.chunk_size;
            if (request.total_parts != expected_parts)
            {
                throw RegistryError(mediaup::ErrorCode::InvalidPayload,
                                    "total_parts " + std::to_string(request.total_parts) + " does not match " +
                                        std::to_string(expected_parts) + " parts of " +
                                        std::to_string(request.chunk_size) + " bytes");
            }
            state.chunk_size = request.chunk_size;
            state.total_parts = request.total_parts;
            state.upload_id = mediaup::crypto::random_token(12);
        }
        else
        {
            state.chunk_size = request.file_size;
            state.total_parts = 1;
        }

        state.session_id = mediaup::crypto::random_token(16);
        state.content_type = request.content_type;
        state.speaker_count = request.speaker_count;
        state.strategy = request.strategy;
        state.file_size = request.file_size;
        state.last_update = std::chrono::system_clock::now();

        std::lock_guard lock(mutex_);
        uploads_[state.session_id] = state;
        persist_state(state);
        return state;
    }

    std::string UploadRegistry::store_part(const std::string &session_id, std::uint32_t part_number,
                                           const std::vector<std::byte> &data, const std::string &part_hash)
    {
        std::lock_guard lock(mutex_);
        auto &state = require_idle(session_id);
        if (state.strategy != mediaup::protocol::UploadStrategy::Multipart)
        {
            throw RegistryError(mediaup::ErrorCode::Conflict, "Session " + session_id + " is not a multipart upload");
        }
        if (part_number == 0 || part_number > state.total_parts)
        {
            throw RegistryError(mediaup::ErrorCode::InvalidPayload,
                                "Part " + std::to_string(part_number) + " outside 1.." +
                                    std::to_string(state.total_parts));
        }
        const auto expected = expected_part_length(state, part_number);
        if (data.size() != expected)
        {
            throw RegistryError(mediaup::ErrorCode::InvalidPayload,
                                "Part " + std::to_string(part_number) + " has " + std::to_string(data.size()) +
                                    " bytes, expected " + std::to_string(expected));
        }
        const auto etag = mediaup::crypto::hash_bytes(data);
        if (etag != part_hash)
        {
            throw RegistryError(mediaup::ErrorCode::IntegrityMismatch, "Part hash mismatch");
        }

        write_file(part_path(session_id, part_number), data);
        state.parts[part_number] = etag;
        state.last_update = std::chrono::system_clock::now();
        persist_state(state);
        return etag;
    }

    std::uint64_t UploadRegistry::store_direct(const std::string &session_id, const std::vector<std::byte> &data,
                                               const std::string &content_hash)
    {
        std::lock_guard lock(mutex_);
        if (const auto size = replay(session_id, content_hash))
        {
            spdlog::info("Repeated direct upload for {} answered from its receipt", session_id);
            return *size;
        }
        auto &state = require_idle(session_id);
        if (state.strategy != mediaup::protocol::UploadStrategy::Direct)
        {
            throw RegistryError(mediaup::ErrorCode::Conflict, "Session " + session_id + " expects multipart parts");
        }
        if (data.size() != state.file_size)
        {
            throw RegistryError(mediaup::ErrorCode::InvalidPayload,
                                "Received " + std::to_string(data.size()) + " bytes, declared " +
                                    std::to_string(state.file_size));
        }
        if (mediaup::crypto::hash_bytes(data) != content_hash)
        {
            throw RegistryError(mediaup::ErrorCode::IntegrityMismatch, "Content hash mismatch");
        }

        write_file(object_path(session_id, state.filename), data);
        const auto size = state.file_size;
        discard(session_id);
        finished_[session_id] = Receipt{content_hash, size, std::chrono::system_clock::now()};
        return size;
    }

    std::uint64_t UploadRegistry::complete(const std::string &session_id,
                                           const std::vector<mediaup::protocol::PartETag> &parts)
    {
        const auto fingerprint = completion_fingerprint(parts);
        UploadState snapshot;
        {
            std::lock_guard lock(mutex_);
            if (const auto size = replay(session_id, fingerprint))
            {
                spdlog::info("Repeated completion for {} answered from its receipt", session_id);
                return *size;
            }
            auto &state = require_idle(session_id);
            if (state.strategy != mediaup::protocol::UploadStrategy::Multipart)
            {
                throw RegistryError(mediaup::ErrorCode::Conflict, "Session " + session_id + " is not a multipart upload");
            }
            if (parts.size() != state.total_parts)
            {
                throw RegistryError(mediaup::ErrorCode::PartsInvalid,
                                    "Expected " + std::to_string(state.total_parts) + " parts, got " +
                                        std::to_string(parts.size()));
            }
            for (std::size_t i = 0; i < parts.size(); ++i)
            {
                const auto number = static_cast<std::uint32_t>(i + 1);
                if (parts[i].part_number != number)
                {
                    throw RegistryError(mediaup::ErrorCode::PartsInvalid,
                                        "Part list out of order at position " + std::to_string(number));
                }
                const auto stored = state.parts.find(number);
                if (stored == state.parts.end())
                {
                    throw RegistryError(mediaup::ErrorCode::PartsInvalid, "Part " + std::to_string(number) + " was never uploaded");
                }
                if (stored->second != parts[i].etag)
                {
                    throw RegistryError(mediaup::ErrorCode::PartsInvalid, "ETag mismatch for part " + std::to_string(number));
                }
            }
            state.completing = true;
            snapshot = state;
        }

        // Other sessions keep moving while the parts are copied.
        std::uint64_t written = 0;
        try
        {
            written = assemble(snapshot);
        }
        catch (const std::exception &)
        {
            std::lock_guard lock(mutex_);
            if (auto it = uploads_.find(session_id); it != uploads_.end())
            {
                it->second.completing = false;
            }
            throw;
        }

        std::lock_guard lock(mutex_);
        discard(session_id);
        finished_[session_id] = Receipt{fingerprint, written, std::chrono::system_clock::now()};
        return written;
    }

    std::uint64_t UploadRegistry::assemble(const UploadState &state) const
    {
        const auto target = object_path(state.session_id, state.filename);
        auto staging = target;
        staging += ".assembling";
        std::filesystem::create_directories(target.parent_path());
        std::uint64_t written = 0;
        {
            std::ofstream out(staging, std::ios::binary | std::ios::trunc);
            for (std::uint32_t number = 1; number <= state.total_parts; ++number)
            {
                std::ifstream in(part_path(state.session_id, number), std::ios::binary);
                if (!in.is_open())
                {
                    out.close();
                    std::error_code ec;
                    std::filesystem::remove(staging, ec);
                    throw RegistryError(mediaup::ErrorCode::InternalError,
                                        "Stored part " + std::to_string(number) + " is missing");
                }
                out << in.rdbuf();
                written = static_cast<std::uint64_t>(out.tellp());
            }
            if (!out)
            {
                throw RegistryError(mediaup::ErrorCode::InternalError, "Failed to assemble " + target.string());
            }
        }
        if (written != state.file_size)
        {
            std::error_code ec;
            std::filesystem::remove(staging, ec);
            throw RegistryError(mediaup::ErrorCode::IntegrityMismatch,
                                "Assembled " + std::to_string(written) + " bytes, declared " +
                                    std::to_string(state.file_size));
        }
        std::filesystem::rename(staging, target);
        spdlog::info("Assembled {} from {} parts ({} bytes)", target.string(), state.total_parts, written);
        return written;
    }

    void UploadRegistry::abort(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        require_idle(session_id);
        discard(session_id);
    }

    std::optional<UploadState> UploadRegistry::find(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(session_id);
        if (it != uploads_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    std::filesystem::path UploadRegistry::object_path(const std::string &session_id, const std::string &filename) const
    {
        return root_ / kObjectsDir / session_id / filename;
    }

    std::size_t UploadRegistry::cleanup_expired(std::chrono::seconds max_age)
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::system_clock::now();
        std::vector<std::string> expired;
        for (const auto &[session_id, state] : uploads_)
        {
            if (!state.completing && now - state.last_update > max_age)
            {
                expired.push_back(session_id);
            }
        }
        for (const auto &session_id : expired)
        {
            spdlog::info("Reaping stale upload session {}", session_id);
            discard(session_id);
        }
        std::erase_if(finished_, [&](const auto &entry)
                      { return now - entry.second.finished_at > max_age; });
        return expired.size();
    }

    std::filesystem::path UploadRegistry::metadata_path(const std::string &session_id) const
    {
        return registry_dir_ / (session_id + ".json");
    }

    std::filesystem::path UploadRegistry::parts_dir(const std::string &session_id) const
    {
        return parts_root_ / session_id;
    }

    std::filesystem::path UploadRegistry::part_path(const std::string &session_id, std::uint32_t part_number) const
    {
        return parts_dir(session_id) / (std::to_string(part_number) + ".part");
    }

    UploadState &UploadRegistry::require(const std::string &session_id)
    {
        auto it = uploads_.find(session_id);
        if (it == uploads_.end())
        {
            throw RegistryError(mediaup::ErrorCode::NotFound, "Unknown upload session " + session_id);
        }
        return it->second;
    }

    UploadState &UploadRegistry::require_idle(const std::string &session_id)
    {
        auto &state = require(session_id);
        if (state.completing)
        {
            throw RegistryError(mediaup::ErrorCode::Conflict, "Session " + session_id + " is being completed");
        }
        return state;
    }

    std::optional<std::uint64_t> UploadRegistry::replay(const std::string &session_id,
                                                        const std::string &fingerprint) const
    {
        const auto it = finished_.find(session_id);
        if (it == finished_.end())
        {
            return std::nullopt;
        }
        if (it->second.fingerprint != fingerprint)
        {
            throw RegistryError(mediaup::ErrorCode::Conflict,
                                "Session " + session_id + " already finished with different content");
        }
        return it->second.size;
    }

    void UploadRegistry::load_existing()
    {
        for (const auto &entry : std::filesystem::directory_iterator(registry_dir_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
            {
                continue;
            }
            std::ifstream in(entry.path());
            if (!in.is_open())
            {
                continue;
            }
            try
            {
                nlohmann::json json;
                in >> json;
                auto state = state_from_json(json);
                const auto session_id = state.session_id;
                uploads_[session_id] = std::move(state);
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::warn("Skipping unreadable upload metadata {}: {}", entry.path().string(), ex.what());
            }
        }
        if (!uploads_.empty())
        {
            spdlog::info("Recovered {} pending upload session(s)", uploads_.size());
        }
    }

    void UploadRegistry::persist_state(const UploadState &state) const
    {
        const auto path = metadata_path(state.session_id);
        std::ofstream out(path, std::ios::trunc);
        out << to_json(state).dump(2);
        if (!out)
        {
            throw RegistryError(mediaup::ErrorCode::InternalError, "Failed to persist " + path.string());
        }
    }

    void UploadRegistry::discard(const std::string &session_id)
    {
        std::error_code ec;
        std::filesystem::remove_all(parts_dir(session_id), ec);
        std::filesystem::remove(metadata_path(session_id), ec);
        uploads_.erase(session_id);
    }

} // namespace mediaup::server
