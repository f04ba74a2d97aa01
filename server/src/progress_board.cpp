#include "mediaup/server/progress_board.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace mediaup::server
{

    namespace
    {

        std::string utc_timestamp()
        {
            using namespace std::chrono;
            const auto now = system_clock::now();
            const auto seconds = system_clock::to_time_t(now);
            const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
            std::tm tm{};
            gmtime_r(&seconds, &tm);
            std::ostringstream oss;
            oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
            return oss.str();
        }

    } // namespace

    ProgressBoard::ProgressBoard(std::chrono::seconds ttl) : ttl_(ttl) {}

    mediaup::protocol::ProgressRecord ProgressBoard::publish(mediaup::protocol::ProgressRecord record)
    {
        if (record.session_id.empty())
        {
            throw RegistryError(mediaup::ErrorCode::InvalidPayload, "Progress record without session_id");
        }
        if (record.status == mediaup::protocol::SessionStatus::Unknown)
        {
            throw RegistryError(mediaup::ErrorCode::InvalidPayload, "Progress record without a known status");
        }
        record.timestamp = utc_timestamp();

        std::lock_guard lock(mutex_);
        records_[record.session_id] = Entry{.record = record, .expires_at = Clock::now() + ttl_};
        return record;
    }

    mediaup::protocol::ProgressRecord ProgressBoard::fetch(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        auto it = records_.find(session_id);
        if (it != records_.end() && Clock::now() >= it->second.expires_at)
        {
            records_.erase(it);
            it = records_.end();
        }
        if (it == records_.end())
        {
            mediaup::protocol::ProgressRecord unknown{};
            unknown.session_id = session_id;
            unknown.status = mediaup::protocol::SessionStatus::Unknown;
            return unknown;
        }
        return it->second.record;
    }

    std::size_t ProgressBoard::purge_expired()
    {
        std::lock_guard lock(mutex_);
        const auto now = Clock::now();
        std::size_t removed = 0;
        for (auto it = records_.begin(); it != records_.end();)
        {
            if (now >= it->second.expires_at)
            {
                it = records_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    std::size_t ProgressBoard::size() const
    {
        std::lock_guard lock(mutex_);
        return records_.size();
    }

} // namespace mediaup::server
