#include "net/X509Cert.hpp"
#include "net/Errors.hpp"

#include <openssl/asn1.h>
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/objects.h>
#include <openssl/x509.h>

#include <ctime>
#include <memory>

namespace netdiag::net {

namespace {
struct X509Free { void operator()(X509* p) const { X509_free(p); } };
struct BNFree { void operator()(BIGNUM* p) const { BN_free(p); } };
struct OsslStrFree { void operator()(char* p) const { OPENSSL_free(p); } };
struct Utf8Free { void operator()(unsigned char* p) const { OPENSSL_free(p); } };
}

static std::string name_attr(const X509_NAME* name, int nid) {
  if (!name) return netdiag::model::kUnknownAttr;
  int idx = X509_NAME_get_index_by_NID(const_cast<X509_NAME*>(name), nid, -1);
  if (idx < 0) return netdiag::model::kUnknownAttr;
  const X509_NAME_ENTRY* entry = X509_NAME_get_entry(name, idx);
  const ASN1_STRING* data = entry ? X509_NAME_ENTRY_get_data(entry) : nullptr;
  if (!data) return netdiag::model::kUnknownAttr;
  unsigned char* utf8 = nullptr;
  int len = ASN1_STRING_to_UTF8(&utf8, data);
  if (len < 0) return netdiag::model::kUnknownAttr;
  std::unique_ptr<unsigned char, Utf8Free> guard(utf8);
  return std::string(reinterpret_cast<const char*>(utf8), static_cast<size_t>(len));
}

static std::chrono::system_clock::time_point asn1_time(const ASN1_TIME* t, const char* which) {
  std::tm tm{};
  if (!t || ASN1_TIME_to_tm(t, &tm) != 1) throw CertParseError(std::string("invalid ") + which + " time");
  std::time_t secs = ::timegm(&tm);
  return std::chrono::system_clock::from_time_t(secs);
}

static std::string serial_decimal(const X509* x) {
  const ASN1_INTEGER* serial = X509_get0_serialNumber(x);
  std::unique_ptr<BIGNUM, BNFree> bn(serial ? ASN1_INTEGER_to_BN(serial, nullptr) : nullptr);
  if (!bn) throw CertParseError("invalid serial number");
  std::unique_ptr<char, OsslStrFree> dec(BN_bn2dec(bn.get()));
  if (!dec) throw CertParseError("invalid serial number");
  return std::string(dec.get());
}

X509Cert X509Cert::from_der(const std::vector<unsigned char>& der) {
  const unsigned char* p = der.data();
  std::unique_ptr<X509, X509Free> x(d2i_X509(nullptr, &p, static_cast<long>(der.size())));
  if (!x) throw CertParseError("not a DER encoded X.509 certificate");

  netdiag::model::CertificateInfo f;
  f.subject.common_name  = name_attr(X509_get_subject_name(x.get()), NID_commonName);
  f.subject.organization = name_attr(X509_get_subject_name(x.get()), NID_organizationName);
  f.issuer.common_name   = name_attr(X509_get_issuer_name(x.get()), NID_commonName);
  f.issuer.organization  = name_attr(X509_get_issuer_name(x.get()), NID_organizationName);
  f.not_before = asn1_time(X509_get0_notBefore(x.get()), "notBefore");
  f.not_after  = asn1_time(X509_get0_notAfter(x.get()), "notAfter");
  f.serial_number = serial_decimal(x.get());
  f.version = "v" + std::to_string(X509_get_version(x.get()) + 1);
  return X509Cert(std::move(f));
}

netdiag::model::CertificateInfo X509Cert::describe(std::chrono::system_clock::time_point now) const {
  auto info = fields_;
  info.days_until_expiry = days_until(fields_.not_after, now);
  return info;
}

long days_until(std::chrono::system_clock::time_point not_after,
                std::chrono::system_clock::time_point now) {
  return static_cast<long>(std::chrono::floor<std::chrono::days>(not_after - now).count());
}

std::string format_utc_iso(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  char buf[40];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S+00:00", &tm);
  return buf;
}

} // namespace netdiag::net
