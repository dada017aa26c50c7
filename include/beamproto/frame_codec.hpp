#ifndef BEAMPROTO_FRAME_CODEC_HPP
#define BEAMPROTO_FRAME_CODEC_HPP

#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <functional>
#include <string>

#include "byte_stream.hpp"
#include "config.hpp"
#include "keys.hpp"

namespace BeamProto {

    namespace detail {
        inline void put_u32(uint8_t* out, uint32_t val) {
            uint32_t be_val = htonl(val);
            std::memcpy(out, &be_val, sizeof(be_val));
        }
        inline void put_u64(uint8_t* out, uint64_t val) {
            put_u32(out, static_cast<uint32_t>(val >> 32));
            put_u32(out + sizeof(uint32_t), static_cast<uint32_t>(val));
        }
        inline uint32_t get_u32(const uint8_t* in) {
            uint32_t be_val;
            std::memcpy(&be_val, in, sizeof(be_val));
            return ntohl(be_val);
        }
        inline uint64_t get_u64(const uint8_t* in) {
            return (static_cast<uint64_t>(get_u32(in)) << 32) + get_u32(in + sizeof(uint32_t));
        }
    }

    // Called with (bytes transferred so far in this session, declared total size).
    using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

    /**
     * @brief Cumulative progress over all files of one session.
     *
     * The total is the size announced in the handshake, not the sum of the file headers.
     */
    class ProgressTracker {
    public:
        ProgressTracker(uint64_t total, ProgressCallback callback)
            : total_(total), callback_(std::move(callback)) {}

        void advance(uint64_t bytes) {
            done_ += bytes;
            if (callback_) {
                callback_(done_, total_);
            }
        }

        uint64_t done() const { return done_; }
        uint64_t total() const { return total_; }

    private:
        uint64_t total_;
        uint64_t done_ = 0;
        ProgressCallback callback_;
    };

    struct FileHeader {
        std::string name;  // UTF-8
        uint64_t size = 0;
    };

    /**
     * @brief Writes the session wire format:
     *
     *   HandshakeFrame := u32 len | bytes[len]
     *   FileCount      := u32 count
     *   FileHeader     := u32 nameLen | bytes[nameLen] | u64 size
     *   FilePayload    := bytes[size]
     *
     * All integers are big-endian.
     */
    class FrameWriter {
    public:
        explicit FrameWriter(ByteStream& stream, size_t chunk_size = DEFAULT_CHUNK_SIZE);

        void write_handshake(const byte_vector& sealed);
        void write_file_count(uint32_t count);
        void write_file_header(const FileHeader& header);

        /**
         * @brief Copies exactly size bytes from source in chunks, advancing progress per chunk.
         * @throws BeamProto::IoError if the source ends before size bytes.
         */
        void write_payload(ByteSource& source, uint64_t size, ProgressTracker& progress);

    private:
        ByteStream& stream_;
        size_t chunk_size_;
    };

    class FrameReader {
    public:
        explicit FrameReader(ByteStream& stream, const SessionConfig& config = SessionConfig{});

        /**
         * @throws BeamProto::TruncatedStream if the stream ends inside the frame.
         * @throws BeamProto::ProtocolError if the length exceeds max_handshake_bytes.
         */
        byte_vector read_handshake();

        uint32_t read_file_count();

        /**
         * @throws BeamProto::ProtocolError if the name exceeds max_name_bytes.
         */
        FileHeader read_file_header();

        /**
         * @brief Copies exactly size bytes from the stream into sink.
         * @throws BeamProto::TruncatedStream if the stream ends early; bytes already
         *         copied stay in the sink.
         */
        void read_payload(ByteSink& sink, uint64_t size, ProgressTracker& progress);

        // Reads exactly size bytes. A short read throws TruncatedStream naming the field.
        void read_fully(uint8_t* data, size_t size, const char* field);

    private:
        ByteStream& stream_;
        SessionConfig config_;
    };

} // namespace BeamProto

#endif // BEAMPROTO_FRAME_CODEC_HPP
