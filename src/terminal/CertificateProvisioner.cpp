#include "CertificateProvisioner.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace sb {
namespace {
const int KEY_BITS = 4096;
const long VALIDITY_SECONDS = 365L * 24 * 60 * 60;

struct EvpPkeyDeleter {
  void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct X509Deleter {
  void operator()(X509* p) const { X509_free(p); }
};
struct X509ExtensionDeleter {
  void operator()(X509_EXTENSION* p) const { X509_EXTENSION_free(p); }
};
struct FileCloser {
  void operator()(FILE* p) const { fclose(p); }
};

string lastOpenSslError() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown OpenSSL error";
  }
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return string(buf);
}

void checkSsl(int rc, const char* what) {
  if (rc <= 0) {
    throw std::runtime_error(string(what) + ": " + lastOpenSslError());
  }
}

std::unique_ptr<FILE, FileCloser> openPrivateFile(const string& path) {
  ::unlink(path.c_str());
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, 0600);
  if (fd < 0) {
    throw std::runtime_error("Cannot create " + path + ": " +
                             strerror(GetErrno()));
  }
  FILE* fp = ::fdopen(fd, "w");
  if (!fp) {
    ::close(fd);
    throw std::runtime_error("Cannot open " + path + ": " +
                             strerror(GetErrno()));
  }
  return std::unique_ptr<FILE, FileCloser>(fp);
}

void addNameEntry(X509_NAME* name, const char* field, const char* value) {
  checkSsl(X509_NAME_add_entry_by_txt(
               name, field, MBSTRING_ASC,
               reinterpret_cast<const unsigned char*>(value), -1, -1, 0),
           "X509_NAME_add_entry_by_txt");
}
}  // namespace

CertificateProvisioner::CertificateProvisioner(const string& _certDir)
    : certDir(_certDir) {}

bool CertificateProvisioner::hasCertificate() const {
  return fs::exists(getKeyPath()) && fs::exists(getCertPath());
}

bool CertificateProvisioner::ensureCertificate() {
  if (hasCertificate()) {
    VLOG(1) << "Using certificate in " << certDir;
    return false;
  }
  LOG(INFO) << "Generating self-signed certificate in " << certDir;
  std::error_code ec;
  fs::create_directories(certDir, ec);
  if (ec) {
    throw std::runtime_error("Cannot create " + certDir + ": " +
                             ec.message());
  }
  fs::permissions(certDir, fs::perms::owner_all, fs::perm_options::replace,
                  ec);
  generate();
  LOG(INFO) << "Self-signed certificate generated";
  return true;
}

void CertificateProvisioner::generate() {
  std::unique_ptr<EVP_PKEY, EvpPkeyDeleter> pkey(EVP_RSA_gen(KEY_BITS));
  if (!pkey) {
    throw std::runtime_error("RSA key generation failed: " +
                             lastOpenSslError());
  }

  std::unique_ptr<X509, X509Deleter> cert(X509_new());
  if (!cert) {
    throw std::runtime_error("X509_new failed: " + lastOpenSslError());
  }
  checkSsl(X509_set_version(cert.get(), 2), "X509_set_version");
  checkSsl(ASN1_INTEGER_set(X509_get_serialNumber(cert.get()),
                            long(randombytes_uniform(0x7fffffff)) + 1),
           "ASN1_INTEGER_set");
  if (!X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) ||
      !X509_gmtime_adj(X509_getm_notAfter(cert.get()), VALIDITY_SECONDS)) {
    throw std::runtime_error("X509_gmtime_adj failed: " + lastOpenSslError());
  }
  checkSsl(X509_set_pubkey(cert.get(), pkey.get()), "X509_set_pubkey");

  X509_NAME* name = X509_get_subject_name(cert.get());
  addNameEntry(name, "C", "US");
  addNameEntry(name, "O", "ShellBridge");
  addNameEntry(name, "CN", "localhost");
  // Self-signed: the issuer is the subject
  checkSsl(X509_set_issuer_name(cert.get(), name), "X509_set_issuer_name");

  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, cert.get(), cert.get(), NULL, NULL, 0);
  std::unique_ptr<X509_EXTENSION, X509ExtensionDeleter> san(
      X509V3_EXT_conf_nid(NULL, &ctx, NID_subject_alt_name,
                          "DNS:localhost,IP:127.0.0.1"));
  if (!san) {
    throw std::runtime_error("subjectAltName failed: " + lastOpenSslError());
  }
  checkSsl(X509_add_ext(cert.get(), san.get(), -1), "X509_add_ext");

  checkSsl(X509_sign(cert.get(), pkey.get(), EVP_sha256()), "X509_sign");

  {
    auto keyFile = openPrivateFile(getKeyPath());
    checkSsl(PEM_write_PrivateKey(keyFile.get(), pkey.get(), NULL, NULL, 0,
                                  NULL, NULL),
             "PEM_write_PrivateKey");
  }
  {
    auto certFile = openPrivateFile(getCertPath());
    checkSsl(PEM_write_X509(certFile.get(), cert.get()), "PEM_write_X509");
  }
}

shared_ptr<boost::asio::ssl::context>
CertificateProvisioner::createServerContext() const {
  auto context = make_shared<boost::asio::ssl::context>(
      boost::asio::ssl::context::tls_server);
  context->set_options(boost::asio::ssl::context::default_workarounds |
                       boost::asio::ssl::context::no_sslv2 |
                       boost::asio::ssl::context::no_sslv3 |
                       boost::asio::ssl::context::no_tlsv1 |
                       boost::asio::ssl::context::no_tlsv1_1);
  context->use_certificate_chain_file(getCertPath());
  context->use_private_key_file(getKeyPath(),
                                boost::asio::ssl::context::pem);
  return context;
}
}  // namespace sb
