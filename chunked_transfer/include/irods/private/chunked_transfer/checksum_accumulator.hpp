#ifndef IRODS_CHUNKED_TRANSFER_CHECKSUM_ACCUMULATOR_HPP
#define IRODS_CHUNKED_TRANSFER_CHECKSUM_ACCUMULATOR_HPP

#include "irods/private/chunked_transfer/data_source.hpp"

#include <irods/irods_error.hpp>

#include <openssl/evp.h>

#include <cstdint>
#include <memory>
#include <string>

namespace irods::experimental::io::chunked_transfer
{

    // Wraps a data source and feeds every byte it hands out into an MD5
    // digest.  Bytes pass through unchanged and nothing is read ahead.
    class checksum_accumulator : public data_source
    {
    public:

        explicit checksum_accumulator(data_source& _source);

        irods::error read(char* _buffer, std::int64_t _length, std::int64_t& _bytes_read) override;

        // Base64 of the MD5 digest.  Fails until the wrapped source has
        // reported end of stream.
        irods::error digest(std::string& _digest);

        auto bytes_consumed() const noexcept -> std::int64_t { return bytes_consumed_; }

    private:

        struct context_deleter
        {
            void operator()(EVP_MD_CTX* _context) const { EVP_MD_CTX_free(_context); }
        };

        data_source&                                  source_;
        std::unique_ptr<EVP_MD_CTX, context_deleter> context_;
        std::int64_t                                  bytes_consumed_;
        bool                                          exhausted_;
        std::string                                   digest_;

    }; // end class checksum_accumulator

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_CHECKSUM_ACCUMULATOR_HPP
