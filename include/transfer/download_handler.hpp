#ifndef RCOPY_TRANSFER_DOWNLOAD_HANDLER_HPP
#define RCOPY_TRANSFER_DOWNLOAD_HANDLER_HPP

#include <cstdint>
#include "rpc/call.hpp"
#include "rpc/messages.hpp"
#include "transfer/transfer_options.hpp"

namespace rcopy {
namespace transfer {

/**
 * Streams the requested file to the writer in chunks of at most
 * options.buffer_size bytes. Each chunk repeats the stat size of the file.
 *
 * @return Number of bytes sent
 * @throws FileOpenError if the file is missing, unreadable or a directory
 * @throws ReadError on a read failure
 * @throws SizeMismatchError if the file changed size while it was being sent
 * @throws network::TransferError if a chunk cannot be sent
 */
int64_t handle_download(const rpc::FileDownloadRequest& request,
                        rpc::ServerWriter<rpc::FileDownloadResponse>& writer,
                        const TransferOptions& options = TransferOptions());

} // namespace transfer
} // namespace rcopy

#endif // RCOPY_TRANSFER_DOWNLOAD_HANDLER_HPP
