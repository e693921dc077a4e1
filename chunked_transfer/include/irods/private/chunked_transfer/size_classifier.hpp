#ifndef IRODS_CHUNKED_TRANSFER_SIZE_CLASSIFIER_HPP
#define IRODS_CHUNKED_TRANSFER_SIZE_CLASSIFIER_HPP

#include "irods/private/chunked_transfer/types.hpp"

#include <cstdint>

namespace irods::experimental::io::chunked_transfer
{

    // SIMPLE when the size is known and no larger than _upload_cutoff.
    // An unknown size (constants::UNKNOWN_OBJECT_SIZE) is always CHUNKED.
    auto classify_transfer(std::int64_t _object_size, std::int64_t _upload_cutoff) noexcept -> transfer_mode;

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_SIZE_CLASSIFIER_HPP
