#include "transfer/download_handler.hpp"
#include <boost/log/trivial.hpp>
#include <string>
#include "transfer/file_handle.hpp"
#include "transfer/transfer_error.hpp"

namespace rcopy {
namespace transfer {

int64_t handle_download(const rpc::FileDownloadRequest& request,
                        rpc::ServerWriter<rpc::FileDownloadResponse>& writer,
                        const TransferOptions& options) {
  int64_t sent = 0;
  try {
    FileHandle file = FileHandle::open_for_read(request.filename);
    const int64_t expected = file.size();
    BOOST_LOG_TRIVIAL(debug) << "Download: Sending " << request.filename << ", " << expected << " bytes";

    std::string buffer(options.buffer_size > 0 ? options.buffer_size : DEFAULT_BUFFER_SIZE, '\0');
    rpc::FileDownloadResponse chunk;
    chunk.filename = request.filename;
    chunk.size = expected;

    while (true) {
      std::size_t got = file.read(&buffer[0], buffer.size());
      if (got == 0) {
        break;
      }
      chunk.content.assign(buffer.data(), got);
      writer.write(chunk);
      sent += static_cast<int64_t>(got);
    }

    if (sent != expected) {
      throw SizeMismatchError(expected, sent);
    }
  } catch (const TransferIoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Download: " << e.what();
    throw;
  } catch (const network::TransferError& e) {
    BOOST_LOG_TRIVIAL(error) << "Download: Failed to send " << request.filename << " after "
                             << sent << " bytes: " << e.what();
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Download: Sent " << sent << " bytes of " << request.filename;
  return sent;
}

} // namespace transfer
} // namespace rcopy
