#include "beamproto/frame_codec.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "beamproto/errors.hpp"
#include "test_support.hpp"

using BeamProtoTest::BufferStream;
using BeamProtoTest::VectorSink;
using BeamProtoTest::VectorSource;
using BeamProtoTest::bytes_of;

namespace {

struct FramedFile {
    std::string name;
    BeamProto::byte_vector content;
};

// Encodes a whole session body the way a sender does.
BeamProto::byte_vector frame_session(const BeamProto::byte_vector& handshake, const std::vector<FramedFile>& files,
                                     size_t chunk_size = 4) {
    BufferStream out;
    BeamProto::FrameWriter writer(out, chunk_size);
    writer.write_handshake(handshake);
    writer.write_file_count(static_cast<uint32_t>(files.size()));

    uint64_t total = 0;
    for (const auto& file : files) {
        total += file.content.size();
    }
    BeamProto::ProgressTracker tracker(total, nullptr);
    for (const auto& file : files) {
        writer.write_file_header({file.name, file.content.size()});
        VectorSource source(file.content);
        writer.write_payload(source, file.content.size(), tracker);
    }
    return out.written;
}

std::vector<FramedFile> read_session(BeamProto::FrameReader& reader, BeamProto::byte_vector& handshake) {
    handshake = reader.read_handshake();
    uint32_t count = reader.read_file_count();

    std::vector<FramedFile> files;
    BeamProto::ProgressTracker tracker(0, nullptr);
    for (uint32_t i = 0; i < count; ++i) {
        auto header = reader.read_file_header();
        VectorSink sink;
        reader.read_payload(sink, header.size, tracker);
        files.push_back({header.name, sink.data()});
    }
    return files;
}

} // namespace

TEST(FrameCodecTest, BigEndianHelpers) {
    uint8_t buf[8];
    BeamProto::detail::put_u32(buf, 0x01020304);
    ASSERT_EQ(buf[0], 0x01);
    ASSERT_EQ(buf[3], 0x04);
    ASSERT_EQ(BeamProto::detail::get_u32(buf), 0x01020304u);

    BeamProto::detail::put_u64(buf, 0x0102030405060708ULL);
    ASSERT_EQ(buf[0], 0x01);
    ASSERT_EQ(buf[7], 0x08);
    ASSERT_EQ(BeamProto::detail::get_u64(buf), 0x0102030405060708ULL);
}

TEST(FrameCodecTest, WireLayout) {
    auto wire = frame_session({0xaa, 0xbb}, {{"ab", {1, 2, 3}}});

    BeamProto::byte_vector expected = {
        0x00, 0x00, 0x00, 0x02, 0xaa, 0xbb,                    // handshake frame
        0x00, 0x00, 0x00, 0x01,                                // file count
        0x00, 0x00, 0x00, 0x02, 'a', 'b',                      // name
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03,        // size
        0x01, 0x02, 0x03,                                      // payload
    };
    ASSERT_EQ(wire, expected);
}

TEST(FrameCodecTest, EmptySession) {
    auto wire = frame_session(bytes_of("hs"), {});
    ASSERT_EQ(wire.size(), 4u + 2u + 4u);

    BufferStream in(wire);
    BeamProto::FrameReader reader(in);
    BeamProto::byte_vector handshake;
    auto files = read_session(reader, handshake);

    ASSERT_EQ(handshake, bytes_of("hs"));
    ASSERT_TRUE(files.empty());
}

TEST(FrameCodecTest, FilesArriveInOrderWithPartialReads) {
    std::vector<FramedFile> sent = {
        {"x.bin", {}},
        {"y.bin", {0x01, 0x02, 0x03, 0x04, 0x05}},
        {"\xc3\xa9t\xc3\xa9.txt", bytes_of("summer holiday notes")},
    };
    auto wire = frame_session(bytes_of("sealed handshake"), sent, 3);

    // One byte per read exercises every reassembly path.
    BufferStream in(wire, 1);
    BeamProto::FrameReader reader(in);
    BeamProto::byte_vector handshake;
    auto received = read_session(reader, handshake);

    ASSERT_EQ(handshake, bytes_of("sealed handshake"));
    ASSERT_EQ(received.size(), sent.size());
    for (size_t i = 0; i < sent.size(); ++i) {
        ASSERT_EQ(received[i].name, sent[i].name);
        ASSERT_EQ(received[i].content, sent[i].content);
    }
}

TEST(FrameCodecTest, TruncationAnywhereIsDetected) {
    auto wire = frame_session(bytes_of("hs"), {{"a.txt", bytes_of("hello world")}});

    // Every proper prefix must fail with TruncatedStream, never hang or succeed.
    for (size_t cut = 0; cut < wire.size(); ++cut) {
        BufferStream in(BeamProto::byte_vector(wire.begin(), wire.begin() + cut));
        BeamProto::FrameReader reader(in);
        BeamProto::byte_vector handshake;
        ASSERT_THROW(read_session(reader, handshake), BeamProto::TruncatedStream) << "cut at " << cut;
    }
}

TEST(FrameCodecTest, TruncatedPayloadKeepsReceivedBytes) {
    BeamProto::byte_vector wire = {0x01, 0x02, 0x03, 0x04};
    BufferStream in(wire);
    BeamProto::FrameReader reader(in);
    BeamProto::ProgressTracker tracker(10, nullptr);
    VectorSink sink;

    ASSERT_THROW(reader.read_payload(sink, 10, tracker), BeamProto::TruncatedStream);
    ASSERT_EQ(sink.data(), wire);
    ASSERT_GE(sink.flushes, 1);
    ASSERT_EQ(tracker.done(), 4u);
}

TEST(FrameCodecTest, OversizedHandshakeIsRejected) {
    BeamProto::byte_vector wire(4);
    BeamProto::detail::put_u32(wire.data(), 0xffffffffu);
    BufferStream in(wire);

    BeamProto::FrameReader reader(in);
    ASSERT_THROW(reader.read_handshake(), BeamProto::ProtocolError);
}

TEST(FrameCodecTest, OversizedNameIsRejected) {
    BeamProto::SessionConfig config;
    config.max_name_bytes = 8;

    BufferStream out;
    BeamProto::FrameWriter writer(out);
    writer.write_file_header({"a-much-too-long-name.txt", 1});

    BufferStream in(out.written);
    BeamProto::FrameReader reader(in, config);
    ASSERT_THROW(reader.read_file_header(), BeamProto::ProtocolError);
}

TEST(FrameCodecTest, ProgressIsCumulativeAndEndsAtTotal) {
    std::vector<std::pair<uint64_t, uint64_t>> reports;
    BeamProto::ProgressTracker tracker(10, [&](uint64_t done, uint64_t total) { reports.emplace_back(done, total); });

    BufferStream out;
    BeamProto::FrameWriter writer(out, 4);
    VectorSource first(BeamProto::byte_vector(6, 0x11));
    VectorSource second(BeamProto::byte_vector(4, 0x22));
    writer.write_payload(first, 6, tracker);
    writer.write_payload(second, 4, tracker);

    std::vector<std::pair<uint64_t, uint64_t>> expected = {{4, 10}, {6, 10}, {10, 10}};
    ASSERT_EQ(reports, expected);
}

TEST(FrameCodecTest, ShortSourceIsAnIoError) {
    BufferStream out;
    BeamProto::FrameWriter writer(out, 4);
    BeamProto::ProgressTracker tracker(10, nullptr);
    VectorSource source(BeamProto::byte_vector(3, 0x00));

    ASSERT_THROW(writer.write_payload(source, 10, tracker), BeamProto::IoError);
}
