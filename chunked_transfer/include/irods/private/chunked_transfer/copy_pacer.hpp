#ifndef IRODS_CHUNKED_TRANSFER_COPY_PACER_HPP
#define IRODS_CHUNKED_TRANSFER_COPY_PACER_HPP

#include "irods/private/chunked_transfer/cancellation.hpp"
#include "irods/private/chunked_transfer/clock.hpp"
#include "irods/private/chunked_transfer/config.hpp"
#include "irods/private/chunked_transfer/object_store.hpp"
#include "irods/private/chunked_transfer/types.hpp"

#include <irods/irods_error.hpp>

#include <chrono>

namespace irods::experimental::io::chunked_transfer
{

    struct pacer_settings
    {
        std::chrono::milliseconds min_sleep;
        std::chrono::milliseconds max_sleep;
        unsigned int              decay_constant;     // bigger for slower growth

        static auto from_config(const transfer_config& _config) -> pacer_settings
        {
            return {_config.copy_min_sleep, _config.copy_max_sleep, _config.copy_decay_constant};
        }
    };

    // Interval to sleep after the one that was just slept.  The interval is
    // multiplied by 2^k / (2^k - 1) for decay constant k, grows by at least
    // one millisecond and never exceeds max_sleep.
    auto next_sleep_interval(std::chrono::milliseconds _current, const pacer_settings& _settings) noexcept
        -> std::chrono::milliseconds;

    // Polls an asynchronous copy until the service reports a terminal
    // status, the deadline passes or the token is cancelled.  Giving up does
    // not cancel the remote copy.
    class copy_pacer
    {
    public:

        copy_pacer(object_store&             _store,
                   const pacer_settings&     _settings,
                   transfer_clock&           _clock,
                   const cancellation_token& _token);

        irods::error wait_for_copy(const copy_handle& _handle, transfer_clock::time_point _deadline, copy_state& _state);

        auto poll_count() const noexcept -> int { return poll_count_; }

    private:

        object_store&      store_;
        pacer_settings     settings_;
        transfer_clock&    clock_;
        cancellation_token token_;
        int                poll_count_;

    }; // end class copy_pacer

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_COPY_PACER_HPP
