#pragma once
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include <chrono>
#include <ctime>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace testing {

struct CertSpec {
  std::string common_name{"test.example"};
  std::string organization{"Example Org"};   // empty: attribute omitted
  std::string issuer_cn{};                   // empty: self-issued
  std::string issuer_org{};
  long serial{4242};
  std::string serial_decimal{};              // non-empty: overrides serial
  std::chrono::system_clock::time_point not_before{std::chrono::system_clock::now() - std::chrono::hours(24)};
  std::chrono::system_clock::time_point not_after{std::chrono::system_clock::now() + std::chrono::hours(24 * 30)};
};

struct KeyFree { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };

// DER certificate plus the private key that signed it, for serving it.
struct TestCert {
  std::vector<unsigned char> der;
  std::unique_ptr<EVP_PKEY, KeyFree> key;
};

// Self-signed EC certificate built in memory.
inline TestCert make_cert(const CertSpec& spec) {
  struct X509Free { void operator()(X509* p) const { X509_free(p); } };
  struct NameFree { void operator()(X509_NAME* p) const { X509_NAME_free(p); } };

  std::unique_ptr<EVP_PKEY, KeyFree> key(EVP_EC_gen("P-256"));
  if (!key) throw std::runtime_error("EVP_EC_gen failed");
  std::unique_ptr<X509, X509Free> x(X509_new());
  if (!x) throw std::runtime_error("X509_new failed");

  X509_set_version(x.get(), 2);
  if (spec.serial_decimal.empty()) {
    ASN1_INTEGER_set(X509_get_serialNumber(x.get()), spec.serial);
  } else {
    BIGNUM* bn = nullptr;
    if (BN_dec2bn(&bn, spec.serial_decimal.c_str()) == 0) throw std::runtime_error("bad serial");
    ASN1_INTEGER* ok = BN_to_ASN1_INTEGER(bn, X509_get_serialNumber(x.get()));
    BN_free(bn);
    if (!ok) throw std::runtime_error("BN_to_ASN1_INTEGER failed");
  }
  time_t nb = std::chrono::system_clock::to_time_t(spec.not_before);
  time_t na = std::chrono::system_clock::to_time_t(spec.not_after);
  X509_time_adj_ex(X509_getm_notBefore(x.get()), 0, 0, &nb);
  X509_time_adj_ex(X509_getm_notAfter(x.get()), 0, 0, &na);
  X509_set_pubkey(x.get(), key.get());

  auto add = [](X509_NAME* n, const char* field, const std::string& v) {
    if (v.empty()) return;
    X509_NAME_add_entry_by_txt(n, field, MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(v.c_str()), -1, -1, 0);
  };
  std::unique_ptr<X509_NAME, NameFree> subject(X509_NAME_new());
  add(subject.get(), "CN", spec.common_name);
  add(subject.get(), "O", spec.organization);
  X509_set_subject_name(x.get(), subject.get());

  if (spec.issuer_cn.empty() && spec.issuer_org.empty()) {
    X509_set_issuer_name(x.get(), subject.get());
  } else {
    std::unique_ptr<X509_NAME, NameFree> issuer(X509_NAME_new());
    add(issuer.get(), "CN", spec.issuer_cn);
    add(issuer.get(), "O", spec.issuer_org);
    X509_set_issuer_name(x.get(), issuer.get());
  }

  if (X509_sign(x.get(), key.get(), EVP_sha256()) == 0) throw std::runtime_error("X509_sign failed");

  int len = i2d_X509(x.get(), nullptr);
  if (len <= 0) throw std::runtime_error("i2d_X509 failed");
  std::vector<unsigned char> der(static_cast<size_t>(len));
  unsigned char* p = der.data();
  i2d_X509(x.get(), &p);
  return TestCert{std::move(der), std::move(key)};
}

inline std::vector<unsigned char> make_cert_der(const CertSpec& spec) { return make_cert(spec).der; }

} // namespace testing
