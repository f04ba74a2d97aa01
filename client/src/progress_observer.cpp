#include "mediaup/client/progress_observer.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace mediaup::client
{

    using mediaup::protocol::SessionStatus;

    ProgressObserver::ProgressObserver(ProgressStore &store, Logger logger, std::chrono::milliseconds interval)
        : store_(store), logger_(std::move(logger)), interval_(interval) {}

    void ProgressObserver::watch(const std::string &session_id, std::optional<double> baseline)
    {
        std::lock_guard lock(mutex_);
        auto &entry = sessions_[session_id];
        entry.state.session_id = session_id;
        if (baseline)
        {
            entry.baseline = std::clamp(*baseline, 0.0, 100.0);
            entry.state.progress = std::max(entry.state.progress, entry.baseline);
        }
    }

    void ProgressObserver::on_update(Listener listener)
    {
        std::lock_guard lock(mutex_);
        listener_ = std::move(listener);
    }

    std::size_t ProgressObserver::poll_once()
    {
        std::vector<std::string> due;
        {
            std::lock_guard lock(mutex_);
            for (const auto &[session_id, entry] : sessions_)
            {
                if (!entry.state.seen || !mediaup::protocol::is_terminal(entry.state.status))
                {
                    due.push_back(session_id);
                }
            }
        }

        std::vector<ObservedSession> updates;
        Listener listener;
        for (const auto &session_id : due)
        {
            std::optional<mediaup::protocol::ProgressRecord> record;
            try
            {
                record = store_.fetch(session_id);
            }
            catch (const std::exception &ex)
            {
                logger_.debug("observer", session_id, " fetch failed: ", ex.what());
                continue;
            }
            if (!record || record->status == SessionStatus::Unknown)
            {
                logger_.debug("observer", session_id, " has no progress record yet");
                continue;
            }

            std::lock_guard lock(mutex_);
            auto &entry = sessions_[session_id];
            auto &state = entry.state;
            state.progress = std::max({state.progress, record->progress, entry.baseline});
            if (!state.seen || mediaup::protocol::phase_rank(record->status) >= mediaup::protocol::phase_rank(state.status))
            {
                state.status = record->status;
                state.message = record->message;
                state.stage = record->stage;
            }
            state.timestamp = record->timestamp;
            state.seen = true;
            updates.push_back(state);
            listener = listener_;
        }

        if (listener)
        {
            for (const auto &update : updates)
            {
                listener(update);
            }
        }
        return due.size();
    }

    std::optional<ObservedSession> ProgressObserver::snapshot(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            return std::nullopt;
        }
        return it->second.state;
    }

    std::vector<ObservedSession> ProgressObserver::snapshot() const
    {
        std::lock_guard lock(mutex_);
        std::vector<ObservedSession> states;
        states.reserve(sessions_.size());
        for (const auto &[session_id, entry] : sessions_)
        {
            states.push_back(entry.state);
        }
        return states;
    }

    bool ProgressObserver::all_terminal() const
    {
        std::lock_guard lock(mutex_);
        return std::all_of(sessions_.begin(), sessions_.end(), [](const auto &item)
                           { return item.second.state.seen && mediaup::protocol::is_terminal(item.second.state.status); });
    }

    void ProgressObserver::run()
    {
        if (stopped_)
        {
            return;
        }
        poll_once();
        if (all_terminal() || stopped_)
        {
            return;
        }
        io_context_.restart();
        asio::steady_timer timer(io_context_);
        arm(timer);
        io_context_.run();
    }

    void ProgressObserver::stop()
    {
        stopped_ = true;
        io_context_.stop();
    }

    void ProgressObserver::arm(asio::steady_timer &timer)
    {
        timer.expires_after(interval_);
        timer.async_wait([this, &timer](const asio::error_code &ec)
                         {
            if (ec || stopped_)
            {
                return;
            }
            poll_once();
            if (!all_terminal() && !stopped_)
            {
                arm(timer);
            } });
    }

} // namespace mediaup::client
