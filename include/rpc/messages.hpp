#ifndef RCOPY_RPC_MESSAGES_HPP
#define RCOPY_RPC_MESSAGES_HPP

#include <cstdint>
#include <string>

namespace rcopy {
namespace rpc {

// Remote procedure selected by the CALL frame
enum class Method : uint8_t {
    UPLOAD = 0,
    DOWNLOAD = 1,
    PING = 2,
    SHUTDOWN = 3
};

inline const char* method_to_string(Method method) {
    switch (method) {
        case Method::UPLOAD: return "Upload";
        case Method::DOWNLOAD: return "Download";
        case Method::PING: return "Ping";
        case Method::SHUTDOWN: return "Shutdown";
        default: return "Unknown";
    }
}

// One chunk of an upload. size is the declared total, read from the first chunk.
struct FileUploadRequest {
    std::string filename;
    std::string content;
    int64_t size = 0;
};

struct FileUploadResponse {
    std::string message;
};

struct FileDownloadRequest {
    std::string filename;
};

// One chunk of a download. size is the whole file's size, repeated on every chunk.
struct FileDownloadResponse {
    std::string message;
    std::string filename;
    std::string content;
    int64_t size = 0;
};

struct PingRequest {
    std::string message;
};

struct PingResponse {
    std::string message;
};

struct ShutdownRequest {};

struct ShutdownResponse {};

} // namespace rpc
} // namespace rcopy

#endif // RCOPY_RPC_MESSAGES_HPP
