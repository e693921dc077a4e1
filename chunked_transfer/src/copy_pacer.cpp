#include "irods/private/chunked_transfer/copy_pacer.hpp"
#include "irods/private/chunked_transfer/logging_category.hpp"
#include "irods/private/chunked_transfer/util.hpp"

#include <irods/rodsErrorTable.h>

#include <fmt/format.h>

#include <algorithm>

namespace irods::experimental::io::chunked_transfer
{

    auto next_sleep_interval(std::chrono::milliseconds _current, const pacer_settings& _settings) noexcept
        -> std::chrono::milliseconds
    {
        using std::chrono::milliseconds;

        const auto current = std::max(_current, _settings.min_sleep);
        if (current >= _settings.max_sleep) {
            return _settings.max_sleep;
        }

        const std::int64_t factor = std::int64_t{1} << _settings.decay_constant;
        const auto grown = milliseconds{current.count() * factor / (factor - 1)};

        return std::min(std::max(grown, current + milliseconds{1}), _settings.max_sleep);
    } // end next_sleep_interval

    copy_pacer::copy_pacer(object_store&             _store,
                           const pacer_settings&     _settings,
                           transfer_clock&           _clock,
                           const cancellation_token& _token)
        : store_{_store}
        , settings_{_settings}
        , clock_{_clock}
        , token_{_token}
        , poll_count_{0}
    {
    }

    irods::error copy_pacer::wait_for_copy(const copy_handle&         _handle,
                                           transfer_clock::time_point _deadline,
                                           copy_state&                _state)
    {
        if (_handle.completed) {
            _state = copy_state::SUCCEEDED;
            return SUCCESS();
        }

        _state = copy_state::IN_PROGRESS;
        auto interval = settings_.min_sleep;

        while (true) {

            if (token_.is_cancellation_requested()) {
                _state = copy_state::TIMED_OUT;
                return ERROR(S3_FILE_COPY_ERR, fmt::format("polling of copy [{}] cancelled", _handle.token));
            }

            copy_status status = copy_status::IN_PROGRESS;
            irods::error ret = store_.get_copy_status(_handle, status, token_);
            ++poll_count_;

            if (!ret.ok()) {
                if (!store_.is_retryable(ret)) {
                    _state = copy_state::FAILED;
                    return PASS(ret);
                }

                // a transient status error says nothing about the copy itself
                logger::debug("{}:{} ({}) [[{}]] status of copy [{}] unavailable [{}]", __FILE__, __LINE__, __func__,
                        get_thread_identifier(), _handle.token, ret.result());
                status = copy_status::IN_PROGRESS;
            }

            if (copy_status::SUCCEEDED == status) {
                _state = copy_state::SUCCEEDED;
                return SUCCESS();
            }

            if (copy_status::FAILED == status) {
                _state = copy_state::FAILED;
                return ERROR(S3_FILE_COPY_ERR, fmt::format("copy [{}] failed remotely", _handle.token));
            }

            // the deadline is checked after each poll, so polling may run past
            // it by at most one interval
            if (clock_.now() >= _deadline) {
                _state = copy_state::TIMED_OUT;
                logger::warn("{}:{} ({}) gave up on copy [{}] after {} polls, it may still complete", __FILE__, __LINE__,
                        __func__, _handle.token, poll_count_);
                return ERROR(S3_FILE_COPY_ERR, fmt::format("timed out waiting for copy [{}]", _handle.token));
            }

            logger::debug("{}:{} ({}) [[{}]] copy [{}] in progress, sleeping {} ms", __FILE__, __LINE__, __func__,
                    get_thread_identifier(), _handle.token, interval.count());

            if (!clock_.sleep_for(interval, token_)) {
                _state = copy_state::TIMED_OUT;
                return ERROR(S3_FILE_COPY_ERR, fmt::format("polling of copy [{}] cancelled", _handle.token));
            }

            interval = next_sleep_interval(interval, settings_);
        }
    } // end wait_for_copy

} // irods::experimental::io::chunked_transfer
