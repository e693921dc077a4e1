#ifndef IRODS_CHUNKED_TRANSFER_TRANSFER_ENGINE_HPP
#define IRODS_CHUNKED_TRANSFER_TRANSFER_ENGINE_HPP

#include "irods/private/chunked_transfer/cancellation.hpp"
#include "irods/private/chunked_transfer/clock.hpp"
#include "irods/private/chunked_transfer/config.hpp"
#include "irods/private/chunked_transfer/data_source.hpp"
#include "irods/private/chunked_transfer/object_store.hpp"
#include "irods/private/chunked_transfer/transfer_result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace irods::experimental::io::chunked_transfer
{

    struct transfer_request
    {
        transfer_request(const std::string& _key, std::int64_t _size, data_source& _source)
            : key{_key}
            , size{_size}
            , source{_source}
        {
        }

        std::string                 key;
        std::int64_t                size;      // constants::UNKNOWN_OBJECT_SIZE for a stream
        data_source&                source;
        std::optional<storage_tier> tier;      // overrides the configured tier
    };

    // Moves objects to and within an object store.  One engine may run any
    // number of transfers of different keys at the same time.
    class transfer_engine
    {
    public:

        transfer_engine(object_store& _store, const transfer_config& _config, transfer_clock& _clock = default_clock());

        auto upload(const transfer_request& _request, const cancellation_token& _token = cancellation_token{}) -> transfer_result;

        // Server side copy of _source_key to _destination_key.
        auto copy(const std::string&          _source_key,
                  const std::string&          _destination_key,
                  std::optional<storage_tier> _tier = std::nullopt,
                  const cancellation_token&   _token = cancellation_token{}) -> copy_result;

    private:

        auto simple_upload(const transfer_request& _request, storage_tier _tier, const cancellation_token& _token) -> transfer_result;

        auto chunked_upload(const transfer_request& _request, storage_tier _tier, const cancellation_token& _token) -> transfer_result;

        void multipart_copy(copy_result& _result, storage_tier _tier, const cancellation_token& _token);

        object_store&         store_;
        const transfer_config config_;
        transfer_clock&       clock_;

    }; // end class transfer_engine

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_TRANSFER_ENGINE_HPP
