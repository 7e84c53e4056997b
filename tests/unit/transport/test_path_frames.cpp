/**
 * @file test_path_frames.cpp
 * @brief Unit tests for packet envelope encoding and decoding
 */

#include <gtest/gtest.h>

#include <kcenon/path_migration/transport/path_frames.h>

#include <vector>

namespace kcenon::path_migration::test {

namespace {

auto bytes(std::initializer_list<uint8_t> values) -> std::vector<std::byte> {
    std::vector<std::byte> out;
    for (auto v : values) {
        out.push_back(static_cast<std::byte>(v));
    }
    return out;
}

const auto dcid = bytes({0xde, 0xad, 0xbe, 0xef});

}  // namespace

class PathFramesTest : public ::testing::Test {};

TEST_F(PathFramesTest, ShortHeaderLayout) {
    path_response_frame frame;
    frame.token.fill(std::byte{0x11});

    auto packet = encode_packet(dcid, frame);

    ASSERT_EQ(packet.size(), 1u + 1u + 4u + 1u + 8u);
    EXPECT_EQ(packet[0], std::byte{0x40});
    EXPECT_EQ(packet[1], std::byte{4});
    EXPECT_EQ(packet[2], std::byte{0xde});
    EXPECT_EQ(packet[6], std::byte{0x1b});
    EXPECT_EQ(packet[7], std::byte{0x11});
}

TEST_F(PathFramesTest, StreamFrameIsBigEndian) {
    stream_frame frame;
    frame.stream = 1;
    frame.offset = 0x0102;
    frame.fin = true;
    frame.data = bytes({0xaa, 0xbb});

    auto packet = encode_packet(dcid, frame);

    // header(6) + type(1) + stream(8) + offset(8) + flags(1) + len(2) + data(2)
    ASSERT_EQ(packet.size(), 28u);
    EXPECT_EQ(packet[6], std::byte{0x08});
    EXPECT_EQ(packet[14], std::byte{0x01});
    EXPECT_EQ(packet[21], std::byte{0x01});
    EXPECT_EQ(packet[22], std::byte{0x02});
    EXPECT_EQ(packet[23], std::byte{0x01});
    EXPECT_EQ(packet[24], std::byte{0x00});
    EXPECT_EQ(packet[25], std::byte{0x02});

    auto decoded = decode_packet(packet);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value().destination_cid, dcid);
    const auto* stream = std::get_if<stream_frame>(&decoded.value().frame);
    ASSERT_NE(stream, nullptr);
    EXPECT_EQ(stream->stream, 1u);
    EXPECT_EQ(stream->offset, 0x0102u);
    EXPECT_TRUE(stream->fin);
    EXPECT_EQ(stream->data, frame.data);
}

TEST_F(PathFramesTest, NewConnectionIdFrame) {
    new_connection_id_frame frame;
    frame.sequence = 5;
    frame.retire_prior_to = 2;
    frame.connection_id = bytes({1, 2, 3, 4, 5, 6, 7, 8});

    auto decoded = decode_packet(encode_packet(dcid, frame));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(type_of(decoded.value().frame), frame_type::new_connection_id);

    const auto& ncid = std::get<new_connection_id_frame>(decoded.value().frame);
    EXPECT_EQ(ncid.sequence, 5u);
    EXPECT_EQ(ncid.retire_prior_to, 2u);
    EXPECT_EQ(ncid.connection_id, frame.connection_id);
}

TEST_F(PathFramesTest, AckAndRetireFrames) {
    auto ack = decode_packet(encode_packet(dcid, ack_frame{3, 1200, 800}));
    ASSERT_TRUE(ack.has_value());
    const auto& a = std::get<ack_frame>(ack.value().frame);
    EXPECT_EQ(a.stream, 3u);
    EXPECT_EQ(a.offset, 1200u);
    EXPECT_EQ(a.length, 800u);

    auto retire = decode_packet(encode_packet(dcid, retire_connection_id_frame{9}));
    ASSERT_TRUE(retire.has_value());
    EXPECT_EQ(std::get<retire_connection_id_frame>(retire.value().frame).sequence, 9u);
}

TEST_F(PathFramesTest, EmptyDestinationCid) {
    auto decoded = decode_packet(encode_packet({}, path_challenge_frame{}));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded.value().destination_cid.empty());
    EXPECT_EQ(type_of(decoded.value().frame), frame_type::path_challenge);
}

TEST_F(PathFramesTest, RejectsMissingHeader) {
    auto decoded = decode_packet(bytes({0xc0, 0x00, 0x1a}));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::malformed_frame);
}

TEST_F(PathFramesTest, RejectsEmptyInput) {
    EXPECT_FALSE(decode_packet({}).has_value());
}

TEST_F(PathFramesTest, RejectsOversizedCidLength) {
    EXPECT_FALSE(decode_packet(bytes({0x40, 21})).has_value());
}

TEST_F(PathFramesTest, RejectsUnknownFrameType) {
    auto decoded = decode_packet(bytes({0x40, 0x00, 0x7f}));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::malformed_frame);
}

TEST_F(PathFramesTest, RejectsTruncatedFrame) {
    auto packet = encode_packet(dcid, path_challenge_frame{});
    packet.pop_back();
    EXPECT_FALSE(decode_packet(packet).has_value());

    auto stream = encode_packet(dcid, stream_frame{0, 0, false, bytes({1, 2, 3})});
    stream.pop_back();
    EXPECT_FALSE(decode_packet(stream).has_value());
}

TEST_F(PathFramesTest, RejectsTrailingBytes) {
    auto packet = encode_packet(dcid, retire_connection_id_frame{1});
    packet.push_back(std::byte{0});
    EXPECT_FALSE(decode_packet(packet).has_value());
}

TEST_F(PathFramesTest, RejectsZeroLengthNewConnectionId) {
    new_connection_id_frame frame;
    frame.sequence = 1;
    auto decoded = decode_packet(encode_packet(dcid, frame));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::malformed_frame);
}

TEST_F(PathFramesTest, FrameTypeToString) {
    EXPECT_STREQ(to_string(frame_type::path_challenge), "PATH_CHALLENGE");
    EXPECT_STREQ(to_string(frame_type::retire_connection_id), "RETIRE_CONNECTION_ID");
}

}  // namespace kcenon::path_migration::test
