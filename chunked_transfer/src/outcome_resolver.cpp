#include "irods/private/chunked_transfer/outcome_resolver.hpp"
#include "irods/private/chunked_transfer/logging_category.hpp"
#include "irods/private/chunked_transfer/util.hpp"

#include <irods/rodsErrorTable.h>

#include <fmt/format.h>

namespace irods::experimental::io::chunked_transfer
{

    outcome_resolver::outcome_resolver(object_store&             _store,
                                       const transfer_config&    _config,
                                       transfer_clock&           _clock,
                                       const cancellation_token& _token)
        : store_{_store}
        , config_{_config}
        , clock_{_clock}
        , token_{_token}
    {
    }

    irods::error outcome_resolver::resolve(multipart_session&      _session,
                                           const scheduler_result& _scheduled,
                                           transfer_result&        _result)
    {
        _result.mode = transfer_mode::CHUNKED;
        _result.key = _session.key;
        _result.part_count = static_cast<std::int64_t>(_session.tasks.size());
        _result.failed_part_number = _scheduled.failed_part_number;

        if (error_codes::SUCCESS != _scheduled.code) {
            return clean_up(_session, _scheduled.code, _scheduled.error, _result);
        }

        if (!_session.all_parts_succeeded()) {
            // the scheduler reported success for a session missing parts
            return clean_up(_session, error_codes::UPLOAD_PART_ERROR,
                    ERROR(S3_PUT_ERROR, fmt::format("[{}] has parts that did not succeed", _session.key)), _result);
        }

        if (token_.is_cancellation_requested()) {
            return clean_up(_session, error_codes::CANCELLED, ERROR(S3_PUT_ERROR, "transfer cancelled"), _result);
        }

        return complete(_session, _result);
    } // end resolve

    irods::error outcome_resolver::complete(multipart_session& _session, transfer_result& _result)
    {
        _session.state = session_state::COMPLETING;

        const auto parts = _session.completed_parts();

        logger::debug("{}:{} ({}) [[{}]] [key={}][upload_id={}] completing {} parts", __FILE__, __LINE__, __func__,
                get_thread_identifier(), _session.key, _session.upload_id, parts.size());

        irods::error ret = retry_remote_call(store_, config_, clock_, token_, "complete_multipart_upload",
                [&]() { return store_.complete_multipart_upload(_session.key, _session.upload_id, parts, token_); });

        if (!ret.ok()) {
            const auto code = token_.is_cancellation_requested()
                ? error_codes::CANCELLED
                : error_codes::COMPLETE_MULTIPART_UPLOAD_ERROR;
            return clean_up(_session, code, ret, _result);
        }

        _session.state = session_state::COMPLETED;
        _result.state = session_state::COMPLETED;
        _result.code = error_codes::SUCCESS;
        _result.completed_parts = parts;

        return SUCCESS();
    } // end complete

    irods::error outcome_resolver::clean_up(multipart_session&  _session,
                                            error_codes         _code,
                                            const irods::error& _error,
                                            transfer_result&    _result)
    {
        _result.mode = transfer_mode::CHUNKED;
        _result.key = _session.key;
        _result.code = _code;
        _result.message = _error.result();
        _result.completed_parts = _session.completed_parts();

        logger::error("{}:{} ({}) [[{}]] [key={}][upload_id={}] transfer failed [{}] {}", __FILE__, __LINE__, __func__,
                get_thread_identifier(), _session.key, _session.upload_id, _code, _error.result());

        if (_session.upload_id.empty()) {
            // the session was never created, there is nothing to clean up
            _session.state = session_state::ABORTED;
            _result.state = session_state::ABORTED;
            return PASS(_error);
        }

        if (config_.leave_parts_on_error) {
            _session.state = session_state::LEFT_OPEN;
            _result.state = session_state::LEFT_OPEN;
            _result.upload_id = _session.upload_id;

            logger::warn("{}:{} ({}) [key={}] leaving multipart upload [{}] with {} parts in place, "
                    "storage costs may accrue until it is resumed or aborted", __FILE__, __LINE__, __func__,
                    _session.key, _session.upload_id, _result.completed_parts.size());

            return PASS(_error);
        }

        // a fresh token so that a cancelled transfer is still cleaned up
        const cancellation_token abort_token;

        _result.abort_attempted = true;
        irods::error ret = retry_remote_call(store_, config_, clock_, abort_token, "abort_multipart_upload",
                [&]() { return store_.abort_multipart_upload(_session.key, _session.upload_id, abort_token); });

        _session.state = session_state::ABORTED;
        _result.state = session_state::ABORTED;

        if (!ret.ok()) {
            _result.abort_failed = true;
            _result.abort_message = ret.result();
            _result.upload_id = _session.upload_id;

            logger::error("{}:{} ({}) [key={}] abort of multipart upload [{}] failed, parts may remain [{}] {}",
                    __FILE__, __LINE__, __func__, _session.key, _session.upload_id,
                    error_codes::ABORT_MULTIPART_UPLOAD_ERROR, ret.result());
        }

        return PASS(_error);
    } // end clean_up

} // irods::experimental::io::chunked_transfer
