#ifndef RCOPY_TRANSFER_OPTIONS_HPP
#define RCOPY_TRANSFER_OPTIONS_HPP

#include <cstddef>

namespace rcopy {
namespace transfer {

// Upper bound on one chunk, and so on per-transfer buffer memory
constexpr std::size_t DEFAULT_BUFFER_SIZE = 1024 * 1024;

struct TransferOptions {
  std::size_t buffer_size = DEFAULT_BUFFER_SIZE;
};

} // namespace transfer
} // namespace rcopy

#endif // RCOPY_TRANSFER_OPTIONS_HPP
