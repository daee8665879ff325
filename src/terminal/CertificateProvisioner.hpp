#ifndef __SB_CERTIFICATE_PROVISIONER_HPP__
#define __SB_CERTIFICATE_PROVISIONER_HPP__

#include <boost/asio/ssl.hpp>

#include "Headers.hpp"

namespace sb {
/**
 * @brief Keeps a self-signed key and certificate pair under a directory and
 * turns it into a TLS server context.
 */
class CertificateProvisioner {
 public:
  explicit CertificateProvisioner(const string& _certDir);

  string getKeyPath() const { return certDir + "/key.pem"; }
  string getCertPath() const { return certDir + "/cert.pem"; }
  bool hasCertificate() const;

  /**
   * @brief Generates the pair when either file is missing.
   * @return true if a new pair was written.
   * @throws std::runtime_error when generation or writing fails.
   */
  bool ensureCertificate();

  /**
   * @brief Loads the pair into a TLS server context.
   * @throws boost::system::system_error when the files cannot be used.
   */
  shared_ptr<boost::asio::ssl::context> createServerContext() const;

 protected:
  string certDir;

  void generate();
};
}  // namespace sb

#endif  // __SB_CERTIFICATE_PROVISIONER_HPP__
