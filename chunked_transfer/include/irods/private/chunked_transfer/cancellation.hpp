#ifndef IRODS_CHUNKED_TRANSFER_CANCELLATION_HPP
#define IRODS_CHUNKED_TRANSFER_CANCELLATION_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace irods::experimental::io::chunked_transfer
{

    // Copies share one cancellation state.  The caller keeps a copy and calls
    // request_cancellation() from any thread; every component holding another
    // copy observes it.
    class cancellation_token
    {
    public:

        cancellation_token()
            : state_{std::make_shared<state>()}
        {
        }

        void request_cancellation()
        {
            {
                std::lock_guard<std::mutex> lk(state_->mutex);
                state_->cancelled = true;
            }
            state_->cv.notify_all();
        }

        bool is_cancellation_requested() const
        {
            std::lock_guard<std::mutex> lk(state_->mutex);
            return state_->cancelled;
        }

        // Blocks for _duration or until cancellation is requested.
        // Returns false when woken by cancellation.
        bool wait_for(std::chrono::milliseconds _duration) const
        {
            std::unique_lock<std::mutex> lk(state_->mutex);
            return !state_->cv.wait_for(lk, _duration, [this] { return state_->cancelled; });
        }

    private:

        struct state
        {
            std::mutex              mutex;
            std::condition_variable cv;
            bool                    cancelled{false};
        };

        std::shared_ptr<state> state_;

    }; // end class cancellation_token

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_CANCELLATION_HPP
