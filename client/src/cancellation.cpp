#include "mediaup/client/cancellation.hpp"

#include "mediaup/client/errors.hpp"

namespace mediaup::client
{

    CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

    void CancellationToken::cancel()
    {
        {
            std::lock_guard lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool CancellationToken::cancelled() const
    {
        std::lock_guard lock(state_->mutex);
        return state_->cancelled;
    }

    bool CancellationToken::wait_for(std::chrono::milliseconds duration) const
    {
        std::unique_lock lock(state_->mutex);
        return !state_->cv.wait_for(lock, duration, [this]
                                    { return state_->cancelled; });
    }

    void CancellationToken::throw_if_cancelled() const
    {
        if (cancelled())
        {
            throw UploadError(UploadErrorKind::Cancelled, "Upload cancelled", mediaup::ErrorCode::Cancelled);
        }
    }

} // namespace mediaup::client
