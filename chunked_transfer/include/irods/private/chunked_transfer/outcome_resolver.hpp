#ifndef IRODS_CHUNKED_TRANSFER_OUTCOME_RESOLVER_HPP
#define IRODS_CHUNKED_TRANSFER_OUTCOME_RESOLVER_HPP

#include "irods/private/chunked_transfer/cancellation.hpp"
#include "irods/private/chunked_transfer/clock.hpp"
#include "irods/private/chunked_transfer/config.hpp"
#include "irods/private/chunked_transfer/multipart_session.hpp"
#include "irods/private/chunked_transfer/object_store.hpp"
#include "irods/private/chunked_transfer/transfer_result.hpp"
#include "irods/private/chunked_transfer/upload_scheduler.hpp"

#include <irods/irods_error.hpp>

namespace irods::experimental::io::chunked_transfer
{

    // Ends a multipart session.  A session whose parts all succeeded is
    // completed.  Otherwise, or when the service rejects the completion, the
    // session is aborted, or left open when leave_parts_on_error is set.
    class outcome_resolver
    {
    public:

        outcome_resolver(object_store&             _store,
                         const transfer_config&    _config,
                         transfer_clock&           _clock,
                         const cancellation_token& _token);

        // Fills _result from the session and returns the overall error.
        irods::error resolve(multipart_session& _session, const scheduler_result& _scheduled, transfer_result& _result);

        // Applies the cleanup policy after a failure described by _code and _error.
        irods::error clean_up(multipart_session& _session, error_codes _code, const irods::error& _error, transfer_result& _result);

    private:

        irods::error complete(multipart_session& _session, transfer_result& _result);

        object_store&          store_;
        const transfer_config& config_;
        transfer_clock&        clock_;
        cancellation_token     token_;

    }; // end class outcome_resolver

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_OUTCOME_RESOLVER_HPP
