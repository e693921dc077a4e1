#include "irods/private/chunked_transfer/clock.hpp"

namespace irods::experimental::io::chunked_transfer
{

    auto system_transfer_clock::now() const -> time_point
    {
        return std::chrono::steady_clock::now();
    }

    bool system_transfer_clock::sleep_for(std::chrono::milliseconds _duration, const cancellation_token& _token)
    {
        if (_duration.count() <= 0) {
            return !_token.is_cancellation_requested();
        }
        return _token.wait_for(_duration);
    }

    auto default_clock() -> transfer_clock&
    {
        static system_transfer_clock clock;
        return clock;
    }

} // irods::experimental::io::chunked_transfer
