#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include "client/file_transfer_client.hpp"
#include "network/listener.hpp"
#include "rpc/codec.hpp"
#include "server/file_transfer_server.hpp"
#include "transfer/transfer_error.hpp"
#include "test_utils.hpp"

using namespace rcopy;
using namespace std::chrono_literals;

//==============================================
// COPY TARGETS
//==============================================

TEST(CopyTargetTest, PlainPathIsLocal) {
  auto target = client::parse_copy_target("/tmp/file.txt");
  EXPECT_FALSE(target.is_remote());
  EXPECT_EQ(target.path, "/tmp/file.txt");
}

TEST(CopyTargetTest, HostPrefixIsRemote) {
  auto target = client::parse_copy_target("example.org:/srv/data.bin");
  EXPECT_TRUE(target.is_remote());
  EXPECT_EQ(target.host, "example.org");
  EXPECT_EQ(target.path, "/srv/data.bin");
}

TEST(CopyTargetTest, RelativeRemotePath) {
  auto target = client::parse_copy_target("localhost:notes.txt");
  EXPECT_EQ(target.host, "localhost");
  EXPECT_EQ(target.path, "notes.txt");
}

TEST(CopyTargetTest, ColonAfterSlashIsLocal) {
  auto target = client::parse_copy_target("./dir/a:b.txt");
  EXPECT_FALSE(target.is_remote());
  EXPECT_EQ(target.path, "./dir/a:b.txt");
}

TEST(CopyTargetTest, LeadingColonIsLocal) {
  EXPECT_FALSE(client::parse_copy_target(":file").is_remote());
}

//==============================================
// ARGUMENT VALIDATION
//==============================================

class ClientTest : public ::testing::Test {
protected:
  client::ClientOptions options() {
    client::ClientOptions result;
    result.host = "127.0.0.1";
    result.port = port;
    return result;
  }

  uint16_t port = 1;
  test::TempDir dir{"client_test"};
};

TEST_F(ClientTest, CopyNeedsExactlyOneRemoteSide) {
  client::FileTransferClient client(options());
  EXPECT_THROW(client.copy("a.txt", "b.txt"), std::invalid_argument);
  EXPECT_THROW(client.copy("host:a.txt", "other:b.txt"), std::invalid_argument);
  EXPECT_THROW(client.copy("host:", "b.txt"), std::invalid_argument);
}

TEST_F(ClientTest, OversizedBufferIsRejected) {
  client::ClientOptions oversized = options();
  oversized.buffer_size = rpc::MAX_FRAME_PAYLOAD;
  EXPECT_THROW(client::FileTransferClient client(oversized), std::invalid_argument);
}

TEST_F(ClientTest, MissingLocalSourceFailsBeforeConnecting) {
  client::FileTransferClient client(options());
  EXPECT_THROW(client.upload(dir.file("absent"), "/remote"), transfer::FileOpenError);
}

TEST_F(ClientTest, UnreachableServerIsTransferError) {
  // Bind and release a port so nothing listens on it
  boost::asio::io_context io_context;
  {
    network::TcpListener listener(io_context, "127.0.0.1", 0);
    port = listener.port();
  }
  client::FileTransferClient client(options());
  EXPECT_THROW(client.ping(), network::TransferError);
}

//==============================================
// COPY AGAINST A SERVER
//==============================================

TEST_F(ClientTest, CopyUsesHostFromArgument) {
  server::ServerOptions server_options;
  server_options.host = "127.0.0.1";
  server_options.port = 0;
  server::FileTransferServer server(server_options);
  server.start();
  port = server.port();

  client::ClientOptions client_options = options();
  client_options.host = "unused.invalid";
  client::FileTransferClient client(client_options);

  test::write_file(dir.file("local.txt"), "copied both ways");
  EXPECT_EQ(client.copy(dir.file("local.txt"), "127.0.0.1:" + dir.file("remote.txt")), 16);
  EXPECT_EQ(test::read_file(dir.file("remote.txt")), "copied both ways");

  EXPECT_EQ(client.copy("127.0.0.1:" + dir.file("remote.txt"), dir.file("back.txt")), 16);
  EXPECT_EQ(test::read_file(dir.file("back.txt")), "copied both ways");

  server.stop();
}

// A server that announces more bytes than it sends
TEST_F(ClientTest, ShortDownloadIsSizeMismatch) {
  boost::asio::io_context io_context;
  network::TcpListener listener(io_context, "127.0.0.1", 0);
  port = listener.port();

  listener.start_accept([](std::unique_ptr<network::Connection> connection) {
    rpc::Codec::read_frame(*connection);  // CALL
    rpc::Codec::read_frame(*connection);  // request

    rpc::FileDownloadResponse chunk;
    chunk.content = "abc";
    chunk.size = 10;
    rpc::Codec::write_frame(*connection, rpc::FrameType::MESSAGE, rpc::Codec::serialize(chunk));
    rpc::Codec::write_frame(*connection, rpc::FrameType::STATUS, rpc::Codec::serialize(rpc::Status()));
  });
  std::thread io_thread([&io_context]() { io_context.run(); });

  client::FileTransferClient client(options());
  try {
    client.download("/remote", dir.file("short"));
    ADD_FAILURE() << "Expected SizeMismatchError";
  } catch (const transfer::SizeMismatchError& e) {
    EXPECT_EQ(e.expected(), 10);
    EXPECT_EQ(e.actual(), 3);
  }

  io_context.stop();
  io_thread.join();
}

// A server whose chunks disagree on the total size
TEST_F(ClientTest, ChangingDownloadSizeIsProtocolError) {
  boost::asio::io_context io_context;
  network::TcpListener listener(io_context, "127.0.0.1", 0);
  port = listener.port();

  listener.start_accept([](std::unique_ptr<network::Connection> connection) {
    rpc::Codec::read_frame(*connection);  // CALL
    rpc::Codec::read_frame(*connection);  // request

    rpc::FileDownloadResponse chunk;
    chunk.content = "abcde";
    chunk.size = 10;
    rpc::Codec::write_frame(*connection, rpc::FrameType::MESSAGE, rpc::Codec::serialize(chunk));
    chunk.content = "fghij";
    chunk.size = 12;
    rpc::Codec::write_frame(*connection, rpc::FrameType::MESSAGE, rpc::Codec::serialize(chunk));
    rpc::Codec::write_frame(*connection, rpc::FrameType::STATUS, rpc::Codec::serialize(rpc::Status()));
  });
  std::thread io_thread([&io_context]() { io_context.run(); });

  client::FileTransferClient client(options());
  EXPECT_THROW(client.download("/remote", dir.file("inconsistent")), rpc::ProtocolError);

  io_context.stop();
  io_thread.join();
}
