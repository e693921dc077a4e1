#ifndef IRODS_CHUNKED_TRANSFER_UPLOAD_SCHEDULER_HPP
#define IRODS_CHUNKED_TRANSFER_UPLOAD_SCHEDULER_HPP

#include "irods/private/chunked_transfer/cancellation.hpp"
#include "irods/private/chunked_transfer/chunk_planner.hpp"
#include "irods/private/chunked_transfer/clock.hpp"
#include "irods/private/chunked_transfer/config.hpp"
#include "irods/private/chunked_transfer/data_source.hpp"
#include "irods/private/chunked_transfer/multipart_session.hpp"
#include "irods/private/chunked_transfer/object_store.hpp"

#include <irods/irods_error.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace irods::experimental::io::chunked_transfer
{

    struct scheduler_result
    {
        scheduler_result()
            : code{error_codes::SUCCESS}
            , error{SUCCESS()}
            , failed_part_number{0}
            , parts_dispatched{0}
            , bytes_dispatched{0}
        {}

        error_codes  code;
        irods::error error;
        int          failed_part_number;       // lowest failing part, 0 when none failed
        int          parts_dispatched;
        std::int64_t bytes_dispatched;
    };

    // Feeds the parts of one multipart session to a pool of
    // upload_concurrency workers.  Parts are produced on the calling thread
    // only when a worker slot is free, so no more than upload_concurrency
    // parts are buffered or in flight at once.  After the first failure no
    // new part is dispatched and the in flight parts are allowed to settle.
    class upload_scheduler
    {
    public:

        upload_scheduler(object_store&             _store,
                         const transfer_config&    _config,
                         transfer_clock&           _clock,
                         const cancellation_token& _token);

        // Reads _source chunk by chunk in order and uploads each chunk as a part.
        auto upload(data_source& _source, const chunk_plan& _plan, multipart_session& _session) -> scheduler_result;

        // Copies the ranges of _source_key described by _plan as parts.
        auto copy(const std::string& _source_key, const chunk_plan& _plan, multipart_session& _session) -> scheduler_result;

    private:

        // Fills in the task for a part.  Sets _last when no part follows.
        // Returns SUCCESS with _produced false when the source has no
        // further part to offer.
        using task_producer = std::function<irods::error(chunk_task& _task, bool& _produced, bool& _last, error_codes& _code)>;

        auto dispatch(const std::string& _source_key, multipart_session& _session, const task_producer& _produce) -> scheduler_result;

        auto transfer_part(const std::string& _source_key, const multipart_session& _session, const chunk_task& _task, std::string& _etag) -> irods::error;

        object_store&             store_;
        const transfer_config&    config_;
        transfer_clock&           clock_;
        cancellation_token        token_;

    }; // end class upload_scheduler

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_UPLOAD_SCHEDULER_HPP
