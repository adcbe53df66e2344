#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include "crypto/certificate.hpp"
#include "crypto/crypto_error.hpp"
#include "test_utils.hpp"

using namespace rcopy::crypto;

class CertificateTest : public ::testing::Test {
protected:
  // RSA key generation is slow enough to share one result across tests
  static void SetUpTestSuite() {
    material_ = new CertificateMaterial(CertificateProvisioner::generate_self_signed());
  }

  static void TearDownTestSuite() {
    delete material_;
    material_ = nullptr;
  }

  static const CertificateMaterial& material() { return *material_; }

  rcopy::test::TempDir dir{"certificate_test"};

private:
  static CertificateMaterial* material_;
};

CertificateMaterial* CertificateTest::material_ = nullptr;

//==============================================
// SELF-SIGNED GENERATION
//==============================================

TEST_F(CertificateTest, GeneratesPemEncodedPair) {
  EXPECT_NE(material().certificate_pem.find("-----BEGIN CERTIFICATE-----"), std::string::npos);
  EXPECT_NE(material().private_key_pem.find("PRIVATE KEY-----"), std::string::npos);
  EXPECT_TRUE(material().self_signed);
}

TEST_F(CertificateTest, SubjectIsDefaultCommonName) {
  EXPECT_EQ(CertificateProvisioner::subject_common_name(material().certificate_pem), "rcopy");
}

TEST_F(CertificateTest, KeySignsItsOwnCertificate) {
  EXPECT_TRUE(CertificateProvisioner::key_matches_certificate(material().certificate_pem,
                                                              material().private_key_pem));
}

TEST_F(CertificateTest, ValidForOneYearFromNow) {
  auto now = std::chrono::system_clock::now();
  auto validity = std::chrono::duration_cast<std::chrono::hours>(material().not_after - material().not_before);

  EXPECT_LE(material().not_before, now);
  EXPECT_GT(material().not_after, now);
  EXPECT_EQ(validity.count(), 365 * 24);
}

TEST_F(CertificateTest, EachGenerationUsesAFreshKey) {
  CertificateMaterial other = CertificateProvisioner::generate_self_signed("other-host", 1);

  EXPECT_NE(other.private_key_pem, material().private_key_pem);
  EXPECT_EQ(CertificateProvisioner::subject_common_name(other.certificate_pem), "other-host");
  EXPECT_FALSE(CertificateProvisioner::key_matches_certificate(material().certificate_pem,
                                                               other.private_key_pem));
}

TEST_F(CertificateTest, RejectsNonPositiveValidity) {
  EXPECT_THROW(CertificateProvisioner::generate_self_signed("rcopy", 0), CertificateGenerationError);
}

//==============================================
// LOADING
//==============================================

TEST_F(CertificateTest, LoadsMatchingFiles) {
  rcopy::test::write_file(dir.file("cert.pem"), material().certificate_pem);
  rcopy::test::write_file(dir.file("key.pem"), material().private_key_pem);

  CertificateMaterial loaded = CertificateProvisioner::load_from_files(dir.file("cert.pem"), dir.file("key.pem"));
  EXPECT_EQ(loaded.certificate_pem, material().certificate_pem);
  EXPECT_EQ(loaded.private_key_pem, material().private_key_pem);
  EXPECT_FALSE(loaded.self_signed);
  EXPECT_LT(loaded.not_before, loaded.not_after);
}

TEST_F(CertificateTest, MissingFileIsLoadError) {
  rcopy::test::write_file(dir.file("key.pem"), material().private_key_pem);
  EXPECT_THROW(CertificateProvisioner::load_from_files(dir.file("absent.pem"), dir.file("key.pem")),
               CertificateLoadError);
}

TEST_F(CertificateTest, GarbageIsLoadError) {
  rcopy::test::write_file(dir.file("cert.pem"), "not a certificate");
  rcopy::test::write_file(dir.file("key.pem"), material().private_key_pem);
  EXPECT_THROW(CertificateProvisioner::load_from_files(dir.file("cert.pem"), dir.file("key.pem")),
               CertificateLoadError);
}

TEST_F(CertificateTest, MismatchedKeyIsLoadError) {
  CertificateMaterial other = CertificateProvisioner::generate_self_signed("other-host", 1);
  rcopy::test::write_file(dir.file("cert.pem"), material().certificate_pem);
  rcopy::test::write_file(dir.file("key.pem"), other.private_key_pem);

  try {
    CertificateProvisioner::load_from_files(dir.file("cert.pem"), dir.file("key.pem"));
    FAIL() << "Expected CertificateLoadError";
  } catch (const CertificateLoadError& e) {
    EXPECT_NE(std::string(e.what()).find("does not match"), std::string::npos);
  }
}

//==============================================
// TLS CONFIGURATION
//==============================================

TEST_F(CertificateTest, ProvisionGeneratesWithoutFiles) {
  TlsOptions options;
  options.enabled = true;
  options.cert_file = dir.file("cert.pem");  // key missing, so files are not used

  EXPECT_FALSE(options.has_certificate_files());
  CertificateMaterial provisioned = CertificateProvisioner::provision(options);
  EXPECT_TRUE(provisioned.self_signed);
}

TEST_F(CertificateTest, ProvisionLoadsConfiguredFiles) {
  rcopy::test::write_file(dir.file("cert.pem"), material().certificate_pem);
  rcopy::test::write_file(dir.file("key.pem"), material().private_key_pem);

  TlsOptions options;
  options.enabled = true;
  options.cert_file = dir.file("cert.pem");
  options.key_file = dir.file("key.pem");

  CertificateMaterial provisioned = CertificateProvisioner::provision(options);
  EXPECT_FALSE(provisioned.self_signed);
  EXPECT_EQ(provisioned.certificate_pem, material().certificate_pem);
}

TEST_F(CertificateTest, BuildsServerContext) {
  auto context = CertificateProvisioner::make_server_context(material());
  ASSERT_NE(context, nullptr);
  EXPECT_NE(context->native_handle(), nullptr);
}

TEST_F(CertificateTest, ServerContextRejectsBrokenMaterial) {
  CertificateMaterial broken = material();
  broken.private_key_pem = "garbage";
  EXPECT_THROW(CertificateProvisioner::make_server_context(broken), CertificateLoadError);
}
