#include "crypto/certificate.hpp"
#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <boost/log/trivial.hpp>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <sstream>

namespace rcopy::crypto {

//==============================================
// RAII WRAPPERS FOR OPENSSL OBJECTS
//==============================================

namespace {

struct BioDeleter {
  void operator()(BIO* bio) const { BIO_free(bio); }
};
struct X509Deleter {
  void operator()(X509* cert) const { X509_free(cert); }
};
struct PkeyDeleter {
  void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};
struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

// Most recent OpenSSL error as text, for error messages
std::string openssl_error() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "no OpenSSL error reported";
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  ERR_clear_error();
  return buffer;
}

BioPtr memory_bio(const std::string& pem) {
  return BioPtr(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
}

std::string bio_to_string(BIO* bio) {
  char* data = nullptr;
  long length = BIO_get_mem_data(bio, &data);
  if (length <= 0 || data == nullptr) {
    return {};
  }
  return std::string(data, static_cast<std::size_t>(length));
}

X509Ptr parse_certificate(const std::string& pem) {
  BioPtr bio = memory_bio(pem);
  if (!bio) {
    return nullptr;
  }
  return X509Ptr(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
}

PkeyPtr parse_private_key(const std::string& pem) {
  BioPtr bio = memory_bio(pem);
  if (!bio) {
    return nullptr;
  }
  return PkeyPtr(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
}

std::chrono::system_clock::time_point to_time_point(const ASN1_TIME* time) {
  std::tm tm{};
  if (ASN1_TIME_to_tm(time, &tm) != 1) {
    return {};
  }
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string read_file(const std::string& path, const char* what) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Certificate: Cannot open " << what << " file: " << path;
    throw CertificateLoadError(std::string("cannot open ") + what + " file: " + path);
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    throw CertificateLoadError(std::string("cannot read ") + what + " file: " + path);
  }
  return contents.str();
}

void add_extension(X509* cert, int nid, const char* value) {
  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
  X509_EXTENSION* extension = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
  if (!extension) {
    throw CertificateGenerationError("failed to build extension: " + openssl_error());
  }
  int added = X509_add_ext(cert, extension, -1);
  X509_EXTENSION_free(extension);
  if (added != 1) {
    throw CertificateGenerationError("failed to add extension: " + openssl_error());
  }
}

} // namespace

//==============================================
// SELF-SIGNED GENERATION
//==============================================

CertificateMaterial CertificateProvisioner::generate_self_signed(const std::string& common_name,
                                                                 int validity_days) {
  BOOST_LOG_TRIVIAL(info) << "Certificate: Generating self-signed certificate for CN=" << common_name
                          << " valid for " << validity_days << " days";

  if (validity_days <= 0) {
    throw CertificateGenerationError("validity must be at least one day");
  }

  // Generate RSA key pair
  PkeyCtxPtr key_ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
  if (!key_ctx) {
    throw CertificateGenerationError("failed to create key context: " + openssl_error());
  }
  if (EVP_PKEY_keygen_init(key_ctx.get()) <= 0) {
    throw CertificateGenerationError("failed to initialize key generation: " + openssl_error());
  }
  if (EVP_PKEY_CTX_set_rsa_keygen_bits(key_ctx.get(), RSA_KEY_BITS) <= 0) {
    throw CertificateGenerationError("failed to set RSA key size: " + openssl_error());
  }
  EVP_PKEY* raw_key = nullptr;
  if (EVP_PKEY_keygen(key_ctx.get(), &raw_key) <= 0) {
    throw CertificateGenerationError("failed to generate RSA key: " + openssl_error());
  }
  PkeyPtr pkey(raw_key);
  BOOST_LOG_TRIVIAL(debug) << "Certificate: Generated " << RSA_KEY_BITS << "-bit RSA key";

  X509Ptr cert(X509_new());
  if (!cert) {
    throw CertificateGenerationError("failed to allocate certificate: " + openssl_error());
  }

  // X509v3 with a random positive serial
  if (X509_set_version(cert.get(), 2) != 1) {
    throw CertificateGenerationError("failed to set certificate version");
  }
  uint32_t serial = 0;
  if (RAND_bytes(reinterpret_cast<unsigned char*>(&serial), sizeof(serial)) != 1) {
    throw CertificateGenerationError("failed to generate serial number: " + openssl_error());
  }
  ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), static_cast<long>(serial & 0x7fffffff) + 1);

  // Validity window starts now
  auto not_before = std::chrono::system_clock::now();
  auto not_after = not_before + std::chrono::hours(24 * validity_days);
  std::time_t start = std::chrono::system_clock::to_time_t(not_before);
  std::time_t end = std::chrono::system_clock::to_time_t(not_after);
  if (!X509_time_adj_ex(X509_getm_notBefore(cert.get()), 0, 0, &start) ||
      !X509_time_adj_ex(X509_getm_notAfter(cert.get()), 0, 0, &end)) {
    throw CertificateGenerationError("failed to set validity period");
  }

  if (X509_set_pubkey(cert.get(), pkey.get()) != 1) {
    throw CertificateGenerationError("failed to set public key: " + openssl_error());
  }

  // Subject and issuer are the same placeholder identity
  X509_NAME* name = X509_get_subject_name(cert.get());
  if (X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                 reinterpret_cast<const unsigned char*>(common_name.c_str()),
                                 -1, -1, 0) != 1 ||
      X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                 reinterpret_cast<const unsigned char*>(DEFAULT_COMMON_NAME),
                                 -1, -1, 0) != 1) {
    throw CertificateGenerationError("failed to set subject name: " + openssl_error());
  }
  if (X509_set_issuer_name(cert.get(), name) != 1) {
    throw CertificateGenerationError("failed to set issuer name: " + openssl_error());
  }

  add_extension(cert.get(), NID_basic_constraints, "critical,CA:FALSE");
  add_extension(cert.get(), NID_subject_alt_name, "DNS:localhost,IP:127.0.0.1");

  if (X509_sign(cert.get(), pkey.get(), EVP_sha256()) <= 0) {
    throw CertificateGenerationError("failed to sign certificate: " + openssl_error());
  }

  // Encode both halves as PEM in memory
  BioPtr cert_bio(BIO_new(BIO_s_mem()));
  BioPtr key_bio(BIO_new(BIO_s_mem()));
  if (!cert_bio || !key_bio) {
    throw CertificateGenerationError("failed to allocate memory BIO");
  }
  if (PEM_write_bio_X509(cert_bio.get(), cert.get()) != 1) {
    throw CertificateGenerationError("failed to encode certificate: " + openssl_error());
  }
  if (PEM_write_bio_PrivateKey(key_bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    throw CertificateGenerationError("failed to encode private key: " + openssl_error());
  }

  CertificateMaterial material;
  material.certificate_pem = bio_to_string(cert_bio.get());
  material.private_key_pem = bio_to_string(key_bio.get());
  material.not_before = std::chrono::system_clock::from_time_t(start);
  material.not_after = std::chrono::system_clock::from_time_t(end);
  material.self_signed = true;

  BOOST_LOG_TRIVIAL(info) << "Certificate: Self-signed certificate generated";
  return material;
}

//==============================================
// LOADING
//==============================================

CertificateMaterial CertificateProvisioner::load_from_files(const std::string& cert_file,
                                                            const std::string& key_file) {
  BOOST_LOG_TRIVIAL(info) << "Certificate: Loading certificate " << cert_file << " and key " << key_file;

  CertificateMaterial material;
  material.certificate_pem = read_file(cert_file, "certificate");
  material.private_key_pem = read_file(key_file, "key");

  X509Ptr cert = parse_certificate(material.certificate_pem);
  if (!cert) {
    throw CertificateLoadError("not a PEM certificate: " + cert_file + " (" + openssl_error() + ")");
  }
  PkeyPtr pkey = parse_private_key(material.private_key_pem);
  if (!pkey) {
    throw CertificateLoadError("not a PEM private key: " + key_file + " (" + openssl_error() + ")");
  }
  if (X509_check_private_key(cert.get(), pkey.get()) != 1) {
    ERR_clear_error();
    throw CertificateLoadError("private key " + key_file + " does not match certificate " + cert_file);
  }

  material.not_before = to_time_point(X509_get0_notBefore(cert.get()));
  material.not_after = to_time_point(X509_get0_notAfter(cert.get()));
  material.self_signed = false;

  BOOST_LOG_TRIVIAL(debug) << "Certificate: Loaded certificate for CN=" << subject_common_name(material.certificate_pem);
  return material;
}

//==============================================
// TLS CONFIGURATION
//==============================================

CertificateMaterial CertificateProvisioner::provision(const TlsOptions& options) {
  if (options.has_certificate_files()) {
    return load_from_files(options.cert_file, options.key_file);
  }

  BOOST_LOG_TRIVIAL(warning) << "Certificate: No certificate configured, using a self-signed one. "
                             << "Traffic is encrypted but clients cannot verify the server identity";
  return generate_self_signed();
}

std::shared_ptr<boost::asio::ssl::context> CertificateProvisioner::make_server_context(
    const CertificateMaterial& material) {
  namespace ssl = boost::asio::ssl;

  try {
    auto context = std::make_shared<ssl::context>(ssl::context::tls_server);
    context->set_options(ssl::context::default_workarounds |
                         ssl::context::no_sslv2 |
                         ssl::context::no_sslv3 |
                         ssl::context::no_tlsv1 |
                         ssl::context::no_tlsv1_1 |
                         ssl::context::single_dh_use);
    context->use_certificate_chain(boost::asio::buffer(material.certificate_pem));
    context->use_private_key(boost::asio::buffer(material.private_key_pem), ssl::context::pem);

    if (SSL_CTX_check_private_key(context->native_handle()) != 1) {
      throw CertificateLoadError("private key does not match certificate");
    }

    BOOST_LOG_TRIVIAL(debug) << "Certificate: TLS server context ready";
    return context;
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Certificate: Failed to configure TLS context: " << e.what();
    throw CertificateLoadError(std::string("failed to configure TLS context: ") + e.what());
  }
}

//==============================================
// INSPECTION
//==============================================

std::string CertificateProvisioner::subject_common_name(const std::string& certificate_pem) {
  X509Ptr cert = parse_certificate(certificate_pem);
  if (!cert) {
    throw CertificateLoadError("not a PEM certificate");
  }

  X509_NAME* name = X509_get_subject_name(cert.get());
  int index = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
  if (index < 0) {
    return {};
  }
  ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, index));
  return std::string(reinterpret_cast<const char*>(ASN1_STRING_get0_data(data)),
                     static_cast<std::size_t>(ASN1_STRING_length(data)));
}

bool CertificateProvisioner::key_matches_certificate(const std::string& certificate_pem,
                                                     const std::string& private_key_pem) {
  X509Ptr cert = parse_certificate(certificate_pem);
  PkeyPtr pkey = parse_private_key(private_key_pem);
  if (!cert || !pkey) {
    ERR_clear_error();
    return false;
  }
  bool matches = X509_check_private_key(cert.get(), pkey.get()) == 1;
  ERR_clear_error();
  return matches;
}

} // namespace rcopy::crypto
