#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <string>
#include <vector>
#include <sys/stat.h>
#include "network/network_error.hpp"
#include "transfer/transfer_error.hpp"
#include "transfer/upload_handler.hpp"
#include "test_utils.hpp"

using namespace rcopy::transfer;
using rcopy::rpc::FileUploadRequest;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgReferee;
using ::testing::Throw;

class MockUploadReader : public rcopy::rpc::ServerReader<FileUploadRequest> {
public:
  MOCK_METHOD(bool, read, (FileUploadRequest& message), (override));
};

// Replays a fixed list of chunks, then reports the half-close
class ChunkReader : public rcopy::rpc::ServerReader<FileUploadRequest> {
public:
  explicit ChunkReader(std::vector<FileUploadRequest> chunks) : chunks_(std::move(chunks)) {}

  bool read(FileUploadRequest& message) override {
    if (next_ >= chunks_.size()) {
      return false;
    }
    message = chunks_[next_++];
    return true;
  }

private:
  std::vector<FileUploadRequest> chunks_;
  std::size_t next_ = 0;
};

class UploadHandlerTest : public ::testing::Test {
protected:
  static FileUploadRequest chunk(const std::string& content,
                                 const std::string& filename = std::string(), int64_t size = 0) {
    FileUploadRequest request;
    request.filename = filename;
    request.content = content;
    request.size = size;
    return request;
  }

  // Splits data into chunks of chunk_size, the first one naming the file
  static std::vector<FileUploadRequest> chunks_for(const std::string& path, const std::string& data,
                                                   std::size_t chunk_size) {
    std::vector<FileUploadRequest> chunks;
    std::size_t offset = 0;
    do {
      std::string piece = data.substr(offset, chunk_size);
      chunks.push_back(chunks.empty() ? chunk(piece, path, static_cast<int64_t>(data.size())) : chunk(piece));
      offset += piece.size();
    } while (offset < data.size());
    return chunks;
  }

  rcopy::test::TempDir dir{"upload_test"};
};

//==============================================
// SUCCESSFUL UPLOADS
//==============================================

TEST_F(UploadHandlerTest, WritesChunksInOrder) {
  std::string data = rcopy::test::generate_data(10 * 1024 + 17);
  ChunkReader reader(chunks_for(dir.file("out.bin"), data, 1024));

  auto response = handle_upload(reader);

  EXPECT_EQ(response.message, "Upload received successfully");
  EXPECT_EQ(rcopy::test::read_file(dir.file("out.bin")), data);
}

TEST_F(UploadHandlerTest, CreatesFileWithMode0644) {
  ::umask(022);
  ChunkReader reader({chunk("abc", dir.file("mode.txt"), 3)});
  handle_upload(reader);

  auto perms = std::filesystem::status(dir.file("mode.txt")).permissions();
  EXPECT_EQ(perms & std::filesystem::perms::all,
            std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
            std::filesystem::perms::group_read | std::filesystem::perms::others_read);
}

TEST_F(UploadHandlerTest, SingleEmptyChunkCreatesEmptyFile) {
  ChunkReader reader({chunk("", dir.file("empty.txt"), 0)});
  auto response = handle_upload(reader);

  EXPECT_EQ(response.message, UPLOAD_SUCCESS_MESSAGE);
  EXPECT_TRUE(std::filesystem::exists(dir.file("empty.txt")));
  EXPECT_EQ(std::filesystem::file_size(dir.file("empty.txt")), 0u);
}

TEST_F(UploadHandlerTest, EmptyStreamSucceedsWithoutFile) {
  ChunkReader reader({});
  auto response = handle_upload(reader);

  EXPECT_EQ(response.message, UPLOAD_SUCCESS_MESSAGE);
  EXPECT_TRUE(std::filesystem::is_empty(dir.path()));
}

TEST_F(UploadHandlerTest, LongerExistingFileIsCutToUploadedSize) {
  rcopy::test::write_file(dir.file("existing.txt"), "this is much longer than the upload");
  ChunkReader reader({chunk("short", dir.file("existing.txt"), 5)});

  handle_upload(reader);

  EXPECT_EQ(rcopy::test::read_file(dir.file("existing.txt")), "short");
}

//==============================================
// FAILURES
//==============================================

TEST_F(UploadHandlerTest, DeclaredSizeMismatch) {
  ChunkReader reader({chunk("abc", dir.file("short.bin"), 10)});

  try {
    handle_upload(reader);
    FAIL() << "Expected SizeMismatchError";
  } catch (const SizeMismatchError& e) {
    EXPECT_EQ(e.expected(), 10);
    EXPECT_EQ(e.actual(), 3);
  }
  // The partial file is left in place
  EXPECT_EQ(rcopy::test::read_file(dir.file("short.bin")), "abc");
}

TEST_F(UploadHandlerTest, UnwritableDestinationIsOpenError) {
  ChunkReader reader({chunk("abc", dir.file("missing/dir/file.txt"), 3)});
  EXPECT_THROW(handle_upload(reader), FileOpenError);
}

TEST_F(UploadHandlerTest, DirectoryDestinationIsOpenError) {
  ChunkReader reader({chunk("abc", dir.path().string(), 3)});
  EXPECT_THROW(handle_upload(reader), FileOpenError);
}

TEST_F(UploadHandlerTest, TransportErrorPropagates) {
  MockUploadReader reader;
  EXPECT_CALL(reader, read(_))
    .WillOnce(DoAll(SetArgReferee<0>(chunk("abc", dir.file("broken.bin"), 6)), Return(true)))
    .WillOnce(Throw(rcopy::network::TransferError("connection reset")));

  EXPECT_THROW(handle_upload(reader), rcopy::network::TransferError);
  EXPECT_EQ(rcopy::test::read_file(dir.file("broken.bin")), "abc");
}

TEST_F(UploadHandlerTest, ReaderIsDrainedUntilHalfClose) {
  MockUploadReader reader;
  EXPECT_CALL(reader, read(_))
    .WillOnce(DoAll(SetArgReferee<0>(chunk("ab", dir.file("drained.txt"), 4)), Return(true)))
    .WillOnce(DoAll(SetArgReferee<0>(chunk("cd")), Return(true)))
    .WillOnce(Return(false));

  auto response = handle_upload(reader);
  EXPECT_EQ(response.message, UPLOAD_SUCCESS_MESSAGE);
  EXPECT_EQ(rcopy::test::read_file(dir.file("drained.txt")), "abcd");
}

TEST_F(UploadHandlerTest, ChunkAboveBufferSizeIsRejected) {
  TransferOptions options;
  options.buffer_size = 4;
  ChunkReader reader({chunk("1234", dir.file("bounded.txt"), 9), chunk("56789")});

  EXPECT_THROW(handle_upload(reader, options), ChunkTooLargeError);
  EXPECT_EQ(rcopy::test::read_file(dir.file("bounded.txt")), "1234");
}

//==============================================
// SESSION STATE
//==============================================

TEST_F(UploadHandlerTest, SessionTracksState) {
  UploadSession session;
  EXPECT_EQ(session.state(), UploadState::State::AWAITING_FIRST_CHUNK);

  session.on_chunk(chunk("12", dir.file("state.txt"), 4));
  EXPECT_EQ(session.state(), UploadState::State::RECEIVING);
  EXPECT_EQ(session.filename(), dir.file("state.txt"));
  EXPECT_EQ(session.declared_size(), 4);

  // Later chunks do not change the destination or declared size
  session.on_chunk(chunk("34", dir.file("other.txt"), 99));
  EXPECT_EQ(session.declared_size(), 4);
  EXPECT_EQ(session.bytes_written(), 4);
  EXPECT_FALSE(std::filesystem::exists(dir.file("other.txt")));

  session.on_end_of_stream();
  EXPECT_EQ(session.state(), UploadState::State::COMPLETED);
  EXPECT_THROW(session.on_chunk(chunk("5")), std::logic_error);
}

TEST_F(UploadHandlerTest, FailureIsTerminal) {
  UploadSession session;
  EXPECT_THROW(session.on_chunk(chunk("x", dir.file("no/such/dir"), 1)), FileOpenError);
  EXPECT_EQ(session.state(), UploadState::State::FAILED);
  EXPECT_THROW(session.on_end_of_stream(), std::logic_error);
}
