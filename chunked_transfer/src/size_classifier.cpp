#include "irods/private/chunked_transfer/size_classifier.hpp"

namespace irods::experimental::io::chunked_transfer
{

    auto classify_transfer(std::int64_t _object_size, std::int64_t _upload_cutoff) noexcept -> transfer_mode
    {
        if (_object_size < 0) {
            return transfer_mode::CHUNKED;
        }

        return _object_size <= _upload_cutoff ? transfer_mode::SIMPLE : transfer_mode::CHUNKED;
    } // end classify_transfer

} // irods::experimental::io::chunked_transfer
