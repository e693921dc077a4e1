#ifndef IRODS_CHUNKED_TRANSFER_DATA_SOURCE_HPP
#define IRODS_CHUNKED_TRANSFER_DATA_SOURCE_HPP

#include <irods/irods_error.hpp>

#include <cstdint>
#include <istream>

namespace irods::experimental::io::chunked_transfer
{

    // A byte stream read once from front to back.  Only the thread driving a
    // transfer reads from it.
    class data_source
    {
    public:

        virtual ~data_source() = default;

        // Reads at most _length bytes.  _bytes_read is zero only at end of stream.
        virtual irods::error read(char* _buffer, std::int64_t _length, std::int64_t& _bytes_read) = 0;

    }; // end class data_source

    class istream_data_source : public data_source
    {
    public:

        explicit istream_data_source(std::istream& _stream)
            : stream_{_stream}
        {
        }

        irods::error read(char* _buffer, std::int64_t _length, std::int64_t& _bytes_read) override;

    private:

        std::istream& stream_;

    }; // end class istream_data_source

    // Repeats read() until _length bytes arrive or the stream ends.
    irods::error read_fully(data_source& _source, char* _buffer, std::int64_t _length, std::int64_t& _bytes_read);

} // irods::experimental::io::chunked_transfer

#endif // IRODS_CHUNKED_TRANSFER_DATA_SOURCE_HPP
