#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "mediaup/client/rpc_channel.hpp"
#include "mediaup/client/services.hpp"

namespace mediaup::client
{

    // StorageService backed by the gateway's upload commands.
    class RpcStorageService : public StorageService
    {
    public:
        explicit RpcStorageService(RpcChannel &channel);

        InitResult initialize(const mediaup::protocol::InitializeUploadRequest &request) override;
        PartResult upload_part(const std::string &session_id, std::uint32_t part_number,
                               std::span<const std::byte> bytes) override;
        CompletionResult direct_upload(const std::string &session_id, std::span<const std::byte> bytes) override;
        CompletionResult complete_upload(const std::string &session_id,
                                         const std::vector<mediaup::protocol::PartETag> &parts) override;
        void abort_upload(const std::string &session_id) override;

    private:
        RpcChannel &channel_;
    };

    // ProgressStore backed by the gateway's progress board.
    class RpcProgressStore : public ProgressStore
    {
    public:
        explicit RpcProgressStore(RpcChannel &channel);

        void publish(const mediaup::protocol::ProgressRecord &record) override;
        std::optional<mediaup::protocol::ProgressRecord> fetch(const std::string &session_id) override;

    private:
        RpcChannel &channel_;
    };

} // namespace mediaup::client
