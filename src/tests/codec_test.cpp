#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include "rpc/codec.hpp"
#include "rpc/frame.hpp"
#include "rpc/status.hpp"
#include "test_utils.hpp"

using namespace rcopy::rpc;
using rcopy::test::MemoryConnection;

class CodecTest : public ::testing::Test {
protected:
  static std::string bytes(std::initializer_list<int> values) {
    std::string result;
    for (int value : values) {
      result.push_back(static_cast<char>(value));
    }
    return result;
  }

  // Writes a frame and reads it back through a second connection
  Frame pass_through(FrameType type, const std::string& payload) {
    MemoryConnection writer;
    Codec::write_frame(writer, type, payload);
    MemoryConnection reader(writer.outbound());
    Frame frame = Codec::read_frame(reader);
    EXPECT_EQ(reader.remaining(), 0u);
    return frame;
  }
};

//==============================================
// FRAMING
//==============================================

TEST_F(CodecTest, FrameHeaderIsTypeThenBigEndianLength) {
  MemoryConnection connection;
  Codec::write_frame(connection, FrameType::STATUS, "ab");
  EXPECT_EQ(connection.outbound(), bytes({3, 0, 0, 0, 2, 'a', 'b'}));
}

TEST_F(CodecTest, EmptyFrameHasHeaderOnly) {
  MemoryConnection connection;
  Codec::write_frame(connection, FrameType::HALF_CLOSE, std::string());
  EXPECT_EQ(connection.outbound().size(), FRAME_HEADER_SIZE);

  Frame frame = pass_through(FrameType::HALF_CLOSE, std::string());
  EXPECT_EQ(frame.type, FrameType::HALF_CLOSE);
  EXPECT_TRUE(frame.payload.empty());
}

TEST_F(CodecTest, FramePreservesBinaryPayload) {
  std::string payload = rcopy::test::generate_data(70000);
  payload[10] = '\0';

  Frame frame = pass_through(FrameType::MESSAGE, payload);
  EXPECT_EQ(frame.type, FrameType::MESSAGE);
  EXPECT_EQ(frame.payload, payload);
}

TEST_F(CodecTest, RejectsUnknownFrameType) {
  MemoryConnection connection(bytes({9, 0, 0, 0, 0}));
  EXPECT_THROW(Codec::read_frame(connection), ProtocolError);
}

TEST_F(CodecTest, RejectsOversizedIncomingFrame) {
  // 16 MiB + 1
  MemoryConnection connection(bytes({1, 0x01, 0x00, 0x00, 0x01}));
  EXPECT_THROW(Codec::read_frame(connection), ProtocolError);
}

TEST_F(CodecTest, RefusesToSendOversizedPayload) {
  MemoryConnection connection;
  std::string payload(MAX_FRAME_PAYLOAD + 1, 'x');
  EXPECT_THROW(Codec::write_frame(connection, FrameType::MESSAGE, payload), ProtocolError);
  EXPECT_TRUE(connection.outbound().empty());
}

TEST_F(CodecTest, TruncatedFrameRaisesTransferError) {
  MemoryConnection connection(bytes({1, 0, 0, 0, 10, 'a', 'b', 'c'}));
  EXPECT_THROW(Codec::read_frame(connection), rcopy::network::TransferError);
}

TEST_F(CodecTest, TruncatedHeaderRaisesTransferError) {
  MemoryConnection connection(bytes({1, 0}));
  EXPECT_THROW(Codec::read_frame(connection), rcopy::network::TransferError);
}

//==============================================
// MESSAGES
//==============================================

TEST_F(CodecTest, StringsAreLengthPrefixed) {
  PingRequest request;
  request.message = "hi";
  EXPECT_EQ(Codec::serialize(request), bytes({0, 0, 0, 2, 'h', 'i'}));
}

TEST_F(CodecTest, UploadRequestLayout) {
  FileUploadRequest request;
  request.filename = "f";
  request.content = "xy";
  request.size = 258;

  EXPECT_EQ(Codec::serialize(request),
            bytes({0, 0, 0, 1, 'f', 0, 0, 0, 2, 'x', 'y', 0, 0, 0, 0, 0, 0, 1, 2}));

  FileUploadRequest decoded;
  Codec::deserialize(Codec::serialize(request), decoded);
  EXPECT_EQ(decoded.filename, "f");
  EXPECT_EQ(decoded.content, "xy");
  EXPECT_EQ(decoded.size, 258);
}

TEST_F(CodecTest, DownloadResponseCarriesAllFields) {
  FileDownloadResponse response;
  response.message = "";
  response.filename = "/tmp/data.bin";
  response.content = std::string("\0\x01\x02", 3);
  response.size = 5000000000LL;

  FileDownloadResponse decoded;
  Codec::deserialize(Codec::serialize(response), decoded);
  EXPECT_EQ(decoded.filename, response.filename);
  EXPECT_EQ(decoded.content, response.content);
  EXPECT_EQ(decoded.size, 5000000000LL);
}

TEST_F(CodecTest, StatusLayout) {
  Status status;
  status.code = StatusCode::NOT_FOUND;
  status.message = "gone";
  EXPECT_EQ(Codec::serialize(status), bytes({4, 0, 0, 0, 4, 'g', 'o', 'n', 'e'}));

  Status decoded;
  Codec::deserialize(Codec::serialize(status), decoded);
  EXPECT_EQ(decoded.code, StatusCode::NOT_FOUND);
  EXPECT_EQ(decoded.message, "gone");
  EXPECT_FALSE(decoded.ok());
}

TEST_F(CodecTest, RejectsUnknownStatusCode) {
  Status status;
  EXPECT_THROW(Codec::deserialize(bytes({42, 0, 0, 0, 0}), status), ProtocolError);
}

TEST_F(CodecTest, MethodIsSingleByte) {
  EXPECT_EQ(Codec::serialize(Method::DOWNLOAD), bytes({1}));

  Method method;
  Codec::deserialize(bytes({3}), method);
  EXPECT_EQ(method, Method::SHUTDOWN);

  EXPECT_THROW(Codec::deserialize(bytes({4}), method), ProtocolError);
  EXPECT_THROW(Codec::deserialize(bytes({0, 0}), method), ProtocolError);
}

TEST_F(CodecTest, TruncatedMessageIsProtocolError) {
  PingRequest request;
  // Declares 5 bytes, carries 2
  EXPECT_THROW(Codec::deserialize(bytes({0, 0, 0, 5, 'h', 'i'}), request), ProtocolError);
}

TEST_F(CodecTest, TrailingBytesAreProtocolError) {
  PingRequest request;
  EXPECT_THROW(Codec::deserialize(bytes({0, 0, 0, 1, 'h', 'i'}), request), ProtocolError);
}

TEST_F(CodecTest, ShutdownMessagesAreEmpty) {
  EXPECT_TRUE(Codec::serialize(ShutdownRequest()).empty());

  ShutdownRequest request;
  EXPECT_NO_THROW(Codec::deserialize(std::string(), request));
  EXPECT_THROW(Codec::deserialize(bytes({0}), request), ProtocolError);
}
