#ifndef IRODS_CHUNKED_TRANSFER_UTIL_HPP
#define IRODS_CHUNKED_TRANSFER_UTIL_HPP

#include "irods/private/chunked_transfer/cancellation.hpp"
#include "irods/private/chunked_transfer/clock.hpp"
#include "irods/private/chunked_transfer/config.hpp"
#include "irods/private/chunked_transfer/logging_category.hpp"
#include "irods/private/chunked_transfer/object_store.hpp"

#include <irods/irods_error.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>

namespace irods::experimental::io::chunked_transfer
{

    auto get_thread_identifier() -> std::uint64_t;

    // Sleep between _wait / 2 and _wait.
    // The random addition ensures that threads don't all cluster up and retry
    // at the same time (dogpile effect).
    // Returns false if cancellation interrupted the sleep.
    bool sleep_with_jitter(transfer_clock& _clock, std::chrono::milliseconds _wait, const cancellation_token& _token);

    // Runs _operation until it succeeds, fails with an error the store does not
    // consider retryable, or the retry limit is reached.  The wait between
    // attempts doubles up to max_retry_wait.
    template <typename Operation>
    irods::error retry_remote_call(const object_store&       _store,
                                   const transfer_config&    _config,
                                   transfer_clock&           _clock,
                                   const cancellation_token& _token,
                                   const std::string&        _description,
                                   Operation                 _operation)
    {
        unsigned int retry_count = 0;
        auto retry_wait = _config.retry_wait;

        irods::error ret = _operation();

        while (!ret.ok() && retry_count < _config.retry_count_limit && _store.is_retryable(ret)) {

            if (_token.is_cancellation_requested()) {
                break;
            }

            ++retry_count;

            logger::debug("{}:{} ({}) [[{}]] {} failed [{}], retry {} of {} in up to {} ms",
                    __FILE__, __LINE__, __func__, get_thread_identifier(), _description,
                    ret.result(), retry_count, _config.retry_count_limit, retry_wait.count());

            if (!sleep_with_jitter(_clock, retry_wait, _token)) {
                break;
            }

            retry_wait = std::min(retry_wait * 2, _config.max_retry_wait);

            ret = _operation();
        }

        return ret;
    } // end retry_remote_call

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_UTIL_HPP
