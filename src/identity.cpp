#include "tether/identity.hpp"
#include "tether/hex.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <stdexcept>

namespace tether {

using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using BIGNUM_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

namespace {

const long VALIDITY_SECONDS = 30L * 24 * 60 * 60;
const int SERIAL_BITS = 63;

[[noreturn]] void throw_openssl(const std::string& what) {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    throw std::runtime_error(what + ": " + buf);
}

EVP_PKEY_ptr generate_key() {
    EVP_PKEY_CTX_ptr pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr), &EVP_PKEY_CTX_free);
    if (!pctx || EVP_PKEY_keygen_init(pctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx.get(), NID_X9_62_prime256v1) <= 0) {
        throw_openssl("Cannot set up key generation");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(pctx.get(), &raw) <= 0) {
        throw_openssl("Key generation failed");
    }
    return EVP_PKEY_ptr(raw, &EVP_PKEY_free);
}

X509_ptr self_sign(EVP_PKEY* key) {
    X509_ptr cert(X509_new(), &X509_free);
    if (!cert) {
        throw_openssl("X509_new failed");
    }

    // Random 63-bit serial, never negative
    BIGNUM_ptr serial(BN_new(), &BN_free);
    if (!serial || BN_rand(serial.get(), SERIAL_BITS, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1 ||
        !BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert.get()))) {
        throw_openssl("Cannot generate certificate serial");
    }

    X509_set_version(cert.get(), 2);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -3600);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), VALIDITY_SECONDS);
    X509_set_pubkey(cert.get(), key);

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("tether"), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);

    if (X509_sign(cert.get(), key, EVP_sha256()) <= 0) {
        throw_openssl("Certificate signing failed");
    }
    return cert;
}

} // namespace

std::string certificate_fingerprint(X509* cert) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (!cert || X509_digest(cert, EVP_sha256(), md, &md_len) != 1) {
        return {};
    }
    return "sha-256 " + to_colon_hex(md, md_len);
}

Identity::Identity(EVP_PKEY_ptr key, X509_ptr cert)
    : key_(std::move(key)),
      cert_(std::move(cert)),
      fingerprint_(certificate_fingerprint(cert_.get())) {}

Identity Identity::generate() {
    EVP_PKEY_ptr key = generate_key();
    X509_ptr cert = self_sign(key.get());
    return Identity(std::move(key), std::move(cert));
}

void Identity::apply_to(boost::asio::ssl::context& ctx) const {
    if (SSL_CTX_use_certificate(ctx.native_handle(), cert_.get()) != 1) {
        throw_openssl("Cannot install certificate");
    }
    if (SSL_CTX_use_PrivateKey(ctx.native_handle(), key_.get()) != 1) {
        throw_openssl("Cannot install private key");
    }
}

} // namespace tether
