#ifndef IRODS_CHUNKED_TRANSFER_CLOCK_HPP
#define IRODS_CHUNKED_TRANSFER_CLOCK_HPP

#include "irods/private/chunked_transfer/cancellation.hpp"

#include <chrono>

namespace irods::experimental::io::chunked_transfer
{

    // Source of time for retries and copy polling.  Tests substitute a
    // virtual clock so that backoff runs without real delay.
    class transfer_clock
    {
    public:

        using time_point = std::chrono::steady_clock::time_point;

        virtual ~transfer_clock() = default;

        virtual auto now() const -> time_point = 0;

        // returns false if the sleep was interrupted by cancellation
        virtual bool sleep_for(std::chrono::milliseconds _duration, const cancellation_token& _token) = 0;

    }; // end class transfer_clock

    class system_transfer_clock : public transfer_clock
    {
    public:

        auto now() const -> time_point override;

        bool sleep_for(std::chrono::milliseconds _duration, const cancellation_token& _token) override;

    }; // end class system_transfer_clock

    auto default_clock() -> transfer_clock&;

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_CLOCK_HPP
