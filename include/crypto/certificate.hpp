#ifndef RCOPY_CRYPTO_CERTIFICATE_HPP
#define RCOPY_CRYPTO_CERTIFICATE_HPP

#include <chrono>
#include <memory>
#include <string>
#include <boost/asio/ssl/context.hpp>
#include "crypto_error.hpp"

namespace rcopy::crypto {

// Where the server certificate comes from. Without both files a self-signed
// certificate is generated in memory.
struct TlsOptions {
  bool enabled = false;
  std::string cert_file;
  std::string key_file;

  bool has_certificate_files() const {
    return !cert_file.empty() && !key_file.empty();
  }
};

// PEM encoded key pair plus the certificate validity window. Held in memory only.
struct CertificateMaterial {
  std::string certificate_pem;
  std::string private_key_pem;
  std::chrono::system_clock::time_point not_before;
  std::chrono::system_clock::time_point not_after;
  bool self_signed = false;
};

/**
 * CertificateProvisioner produces the TLS server configuration.
 *
 * Self-signed material gives transport encryption only. Nothing signs it, so a
 * client has no way to authenticate the server's identity.
 */
class CertificateProvisioner {
public:
  static constexpr const char* DEFAULT_COMMON_NAME = "rcopy";
  static constexpr int DEFAULT_VALIDITY_DAYS = 365;
  static constexpr int RSA_KEY_BITS = 2048;

  // ---- SELF-SIGNED GENERATION ----
  // Generates an RSA key pair and a certificate signed by it. Writes nothing to disk.
  static CertificateMaterial generate_self_signed(
    const std::string& common_name = DEFAULT_COMMON_NAME,
    int validity_days = DEFAULT_VALIDITY_DAYS);


  // ---- LOADING ----
  // Reads and validates a PEM certificate and private key
  static CertificateMaterial load_from_files(const std::string& cert_file, const std::string& key_file);


  // ---- TLS CONFIGURATION ----
  // Loads the configured files, or generates material when none are configured
  static CertificateMaterial provision(const TlsOptions& options);
  // Builds a TLS 1.2+ server context around the material
  static std::shared_ptr<boost::asio::ssl::context> make_server_context(const CertificateMaterial& material);


  // ---- INSPECTION ----
  static std::string subject_common_name(const std::string& certificate_pem);
  static bool key_matches_certificate(const std::string& certificate_pem, const std::string& private_key_pem);
};

} // namespace rcopy::crypto

#endif // RCOPY_CRYPTO_CERTIFICATE_HPP
