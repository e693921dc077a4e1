#include "irods/private/chunked_transfer/data_source.hpp"

#include <irods/rodsErrorTable.h>

#include <fmt/format.h>

namespace irods::experimental::io::chunked_transfer
{

    irods::error istream_data_source::read(char* _buffer, std::int64_t _length, std::int64_t& _bytes_read)
    {
        _bytes_read = 0;

        if (_length <= 0 || stream_.eof()) {
            return SUCCESS();
        }

        stream_.read(_buffer, _length);
        _bytes_read = stream_.gcount();

        if (stream_.bad()) {
            return ERROR(UNIX_FILE_READ_ERR, fmt::format("stream read failed after {} bytes", _bytes_read));
        }

        return SUCCESS();
    } // end istream_data_source::read

    irods::error read_fully(data_source& _source, char* _buffer, std::int64_t _length, std::int64_t& _bytes_read)
    {
        _bytes_read = 0;

        while (_bytes_read < _length) {

            std::int64_t bytes_this_read = 0;
            irods::error ret = _source.read(_buffer + _bytes_read, _length - _bytes_read, bytes_this_read);
            if (!ret.ok()) {
                return PASS(ret);
            }

            if (0 == bytes_this_read) {
                break;
            }

            _bytes_read += bytes_this_read;
        }

        return SUCCESS();
    } // end read_fully

} // irods::experimental::io::chunked_transfer
