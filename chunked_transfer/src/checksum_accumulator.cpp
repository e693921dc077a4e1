#include "irods/private/chunked_transfer/checksum_accumulator.hpp"

#include <irods/rodsErrorTable.h>

#include <fmt/format.h>

#include <vector>

namespace irods::experimental::io::chunked_transfer
{

    namespace
    {
        std::string encode_base64(const unsigned char* _data, int _length)
        {
            // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminator
            std::vector<unsigned char> encoded(4 * ((_length + 2) / 3) + 1);
            const int encoded_length = EVP_EncodeBlock(encoded.data(), _data, _length);
            return std::string(reinterpret_cast<const char*>(encoded.data()), encoded_length);
        } // end encode_base64

    } // namespace

    checksum_accumulator::checksum_accumulator(data_source& _source)
        : source_{_source}
        , context_{EVP_MD_CTX_new()}
        , bytes_consumed_{0}
        , exhausted_{false}
    {
        if (context_) {
            EVP_DigestInit_ex(context_.get(), EVP_md5(), nullptr);
        }
    }

    irods::error checksum_accumulator::read(char* _buffer, std::int64_t _length, std::int64_t& _bytes_read)
    {
        if (!context_) {
            return ERROR(SYS_MALLOC_ERR, "failed to allocate digest context");
        }

        irods::error ret = source_.read(_buffer, _length, _bytes_read);
        if (!ret.ok()) {
            return PASS(ret);
        }

        if (0 == _bytes_read) {
            if (_length > 0) {
                exhausted_ = true;
            }
            return SUCCESS();
        }

        if (1 != EVP_DigestUpdate(context_.get(), _buffer, _bytes_read)) {
            return ERROR(SYS_LIBRARY_ERROR, "EVP_DigestUpdate failed");
        }

        bytes_consumed_ += _bytes_read;
        return SUCCESS();
    } // end checksum_accumulator::read

    irods::error checksum_accumulator::digest(std::string& _digest)
    {
        if (!digest_.empty()) {
            _digest = digest_;
            return SUCCESS();
        }

        if (!exhausted_) {
            return ERROR(SYS_INVALID_INPUT_PARAM,
                    fmt::format("digest requested after {} bytes before the end of the source", bytes_consumed_));
        }

        if (!context_) {
            return ERROR(SYS_MALLOC_ERR, "failed to allocate digest context");
        }

        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_length = 0;
        if (1 != EVP_DigestFinal_ex(context_.get(), md, &md_length)) {
            return ERROR(SYS_LIBRARY_ERROR, "EVP_DigestFinal_ex failed");
        }

        digest_ = encode_base64(md, static_cast<int>(md_length));
        _digest = digest_;
        return SUCCESS();
    } // end checksum_accumulator::digest

} // irods::experimental::io::chunked_transfer
