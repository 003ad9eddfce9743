#pragma once

#include <boost/asio/ssl.hpp>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <memory>
#include <string>

namespace tether {

using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using X509_ptr = std::unique_ptr<X509, decltype(&X509_free)>;

// Per-process key pair and self-signed certificate. Peers authenticate each
// other by the certificate fingerprint published in the session descriptor.
class Identity {
public:
    // Generates a fresh P-256 key and certificate. Throws std::runtime_error.
    static Identity generate();

    Identity(Identity&&) = default;
    Identity& operator=(Identity&&) = default;

    // "sha-256 AB:CD:..."
    const std::string& fingerprint() const { return fingerprint_; }

    X509* certificate() const { return cert_.get(); }

    // Loads the certificate and key into a TLS context
    void apply_to(boost::asio::ssl::context& ctx) const;

private:
    Identity(EVP_PKEY_ptr key, X509_ptr cert);

    EVP_PKEY_ptr key_;
    X509_ptr cert_;
    std::string fingerprint_;
};

// Fingerprint of an arbitrary certificate in the same notation
std::string certificate_fingerprint(X509* cert);

} // namespace tether
