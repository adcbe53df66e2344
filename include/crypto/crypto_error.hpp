#ifndef RCOPY_CRYPTO_ERROR_HPP
#define RCOPY_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace rcopy::crypto {

class CertificateError : public std::runtime_error {
public:
    explicit CertificateError(const std::string& message) 
        : std::runtime_error(message) {}
};

// Externally supplied certificate/key pair could not be read, parsed or matched
class CertificateLoadError : public CertificateError {
public:
    explicit CertificateLoadError(const std::string& message) 
        : CertificateError("Certificate load error: " + message) {}
};

// Self-signed key pair or certificate could not be produced
class CertificateGenerationError : public CertificateError {
public:
    explicit CertificateGenerationError(const std::string& message) 
        : CertificateError("Certificate generation error: " + message) {}
};

} // namespace rcopy::crypto

#endif // RCOPY_CRYPTO_ERROR_HPP
