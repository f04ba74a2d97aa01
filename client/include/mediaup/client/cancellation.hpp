#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace mediaup::client
{

    // Shared cancellation flag. Copies observe the same state.
    class CancellationToken
    {
    public:
        CancellationToken();

        void cancel();

        bool cancelled() const;

        // Sleeps for `duration` unless cancelled first. Returns false when cancelled.
        bool wait_for(std::chrono::milliseconds duration) const;

        // Throws UploadError(Cancelled) once cancelled.
        void throw_if_cancelled() const;

    private:
        struct State
        {
            mutable std::mutex mutex;
            std::condition_variable cv;
            bool cancelled{false};
        };

        std::shared_ptr<State> state_;
    };

} // namespace mediaup::client
