#ifndef BEAMPROTO_BYTE_STREAM_HPP
#define BEAMPROTO_BYTE_STREAM_HPP

#include <cstddef>
#include <cstdint>

namespace BeamProto {

    /**
     * @brief A connected, ordered, reliable byte stream (TCP socket, RFCOMM socket, ...).
     */
    class ByteStream {
    public:
        virtual ~ByteStream() = default;

        /**
         * @brief Reads up to size bytes, blocking until at least one is available.
         * @return Number of bytes read, 0 once the peer closed the stream.
         * @throws BeamProto::IoError on a transport failure.
         */
        virtual size_t read_some(uint8_t* data, size_t size) = 0;

        /**
         * @brief Writes all bytes or throws BeamProto::IoError.
         */
        virtual void write_all(const uint8_t* data, size_t size) = 0;

        /**
         * @brief Closes the stream. Safe to call more than once and from another thread;
         * a blocked read or write then fails.
         */
        virtual void close() = 0;
    };

    // Readable local content (a file being sent).
    class ByteSource {
    public:
        virtual ~ByteSource() = default;

        // Returns 0 at end of data.
        virtual size_t read_some(uint8_t* data, size_t size) = 0;
    };

    // Writable local content (a file being received).
    class ByteSink {
    public:
        virtual ~ByteSink() = default;

        virtual void write_all(const uint8_t* data, size_t size) = 0;
        virtual void flush() = 0;
    };

} // namespace BeamProto

#endif // BEAMPROTO_BYTE_STREAM_HPP
