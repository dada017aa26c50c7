#include "beamproto/frame_codec.hpp"

#include <algorithm>
#include <vector>

#include "beamproto/errors.hpp"

namespace BeamProto {

// --- FrameWriter ---

FrameWriter::FrameWriter(ByteStream& stream, size_t chunk_size)
    : stream_(stream), chunk_size_(chunk_size == 0 ? DEFAULT_CHUNK_SIZE : chunk_size) {}

void FrameWriter::write_handshake(const byte_vector& sealed) {
    if (sealed.size() > UINT32_MAX) {
        throw InvalidArgument("Handshake message exceeds the 32-bit length field.");
    }
    uint8_t len[sizeof(uint32_t)];
    detail::put_u32(len, static_cast<uint32_t>(sealed.size()));
    stream_.write_all(len, sizeof(len));
    stream_.write_all(sealed.data(), sealed.size());
}

void FrameWriter::write_file_count(uint32_t count) {
    uint8_t buf[sizeof(uint32_t)];
    detail::put_u32(buf, count);
    stream_.write_all(buf, sizeof(buf));
}

void FrameWriter::write_file_header(const FileHeader& header) {
    if (header.name.size() > UINT32_MAX) {
        throw InvalidArgument("File name exceeds the 32-bit length field.");
    }
    byte_vector buffer(sizeof(uint32_t) + header.name.size() + sizeof(uint64_t));
    detail::put_u32(buffer.data(), static_cast<uint32_t>(header.name.size()));
    std::copy(header.name.begin(), header.name.end(), buffer.begin() + sizeof(uint32_t));
    detail::put_u64(buffer.data() + sizeof(uint32_t) + header.name.size(), header.size);
    stream_.write_all(buffer.data(), buffer.size());
}

void FrameWriter::write_payload(ByteSource& source, uint64_t size, ProgressTracker& progress) {
    std::vector<uint8_t> chunk(chunk_size_);
    uint64_t remaining = size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, chunk.size()));
        size_t got = source.read_some(chunk.data(), want);
        if (got == 0) {
            throw IoError("File ended " + std::to_string(remaining) + " bytes before its declared size.");
        }
        stream_.write_all(chunk.data(), got);
        remaining -= got;
        progress.advance(got);
    }
}

// --- FrameReader ---

FrameReader::FrameReader(ByteStream& stream, const SessionConfig& config) : stream_(stream), config_(config) {
    if (config_.chunk_size == 0) {
        config_.chunk_size = DEFAULT_CHUNK_SIZE;
    }
}

void FrameReader::read_fully(uint8_t* data, size_t size, const char* field) {
    size_t offset = 0;
    while (offset < size) {
        size_t got = stream_.read_some(data + offset, size - offset);
        if (got == 0) {
            throw TruncatedStream(std::string("Stream closed while reading ") + field + " (" +
                                  std::to_string(offset) + " of " + std::to_string(size) + " bytes).");
        }
        offset += got;
    }
}

byte_vector FrameReader::read_handshake() {
    uint8_t len_buf[sizeof(uint32_t)];
    read_fully(len_buf, sizeof(len_buf), "handshake length");
    uint32_t len = detail::get_u32(len_buf);
    if (len > config_.max_handshake_bytes) {
        throw ProtocolError("Handshake frame of " + std::to_string(len) + " bytes exceeds the limit.");
    }

    byte_vector sealed(len);
    read_fully(sealed.data(), sealed.size(), "handshake");
    return sealed;
}

uint32_t FrameReader::read_file_count() {
    uint8_t buf[sizeof(uint32_t)];
    read_fully(buf, sizeof(buf), "file count");
    return detail::get_u32(buf);
}

FileHeader FrameReader::read_file_header() {
    uint8_t len_buf[sizeof(uint32_t)];
    read_fully(len_buf, sizeof(len_buf), "file name length");
    uint32_t name_len = detail::get_u32(len_buf);
    if (name_len > config_.max_name_bytes) {
        throw ProtocolError("File name of " + std::to_string(name_len) + " bytes exceeds the limit.");
    }

    FileHeader header;
    header.name.resize(name_len);
    read_fully(reinterpret_cast<uint8_t*>(&header.name[0]), name_len, "file name");

    uint8_t size_buf[sizeof(uint64_t)];
    read_fully(size_buf, sizeof(size_buf), "file size");
    header.size = detail::get_u64(size_buf);
    return header;
}

void FrameReader::read_payload(ByteSink& sink, uint64_t size, ProgressTracker& progress) {
    std::vector<uint8_t> chunk(config_.chunk_size);
    uint64_t remaining = size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, chunk.size()));
        size_t got = stream_.read_some(chunk.data(), want);
        if (got == 0) {
            sink.flush();
            throw TruncatedStream("Stream closed with " + std::to_string(remaining) +
                                  " payload bytes outstanding.");
        }
        sink.write_all(chunk.data(), got);
        remaining -= got;
        progress.advance(got);
    }
    sink.flush();
}

} // namespace BeamProto
