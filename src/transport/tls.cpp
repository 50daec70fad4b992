/**
 * @file tls.cpp
 * @brief TLS material checks using OpenSSL PEM readers.
 * @author Dimitris Kafetzis
 */

#include "transport/tls.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <memory>
#include <string>

namespace remote_shipper {

namespace {

struct BioDeleter  { void operator()(BIO* p) const noexcept { BIO_free(p); } };
struct X509Deleter { void operator()(X509* p) const noexcept { X509_free(p); } };
struct PKeyDeleter { void operator()(EVP_PKEY* p) const noexcept { EVP_PKEY_free(p); } };

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

/**
 * @brief Pop the most recent OpenSSL error as text.
 */
std::string openssl_reason() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) return "no PEM data";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

Result<BioPtr> open_pem(const std::string& path, std::string_view what) {
    BioPtr bio(BIO_new_file(path.c_str(), "r"));
    if (!bio) {
        ERR_clear_error();
        return Error{ErrorKind::Configuration,
                     "Cannot read " + std::string(what) + " file: " + path};
    }
    return bio;
}

Result<X509Ptr> load_certificate(const std::string& path, std::string_view what) {
    auto bio = open_pem(path, what);
    if (!bio) return bio.error();
    X509Ptr cert(PEM_read_bio_X509(bio->get(), nullptr, nullptr, nullptr));
    if (!cert) {
        return Error{ErrorKind::Configuration,
                     "Invalid " + std::string(what) + " in " + path + ": " + openssl_reason()};
    }
    return cert;
}

}  // anonymous namespace

Result<void> validate_tls(const TlsConfig& tls) {
    if (!tls.ca_path.empty()) {
        auto ca = load_certificate(tls.ca_path, "CA certificate");
        if (!ca) return ca.error();
    }

    if (!tls.has_client_cert()) {
        return Result<void>{};
    }
    if (tls.cert_path.empty() || tls.key_path.empty()) {
        return Error{ErrorKind::Configuration,
                     "tls_cert and tls_key must be configured together"};
    }

    auto cert = load_certificate(tls.cert_path, "client certificate");
    if (!cert) return cert.error();

    auto key_bio = open_pem(tls.key_path, "client key");
    if (!key_bio) return key_bio.error();
    PKeyPtr key(PEM_read_bio_PrivateKey(key_bio->get(), nullptr, nullptr, nullptr));
    if (!key) {
        return Error{ErrorKind::Configuration,
                     "Invalid client key in " + tls.key_path + ": " + openssl_reason()};
    }

    if (X509_check_private_key(cert->get(), key.get()) != 1) {
        return Error{ErrorKind::Configuration,
                     "Client key " + tls.key_path + " does not match certificate "
                     + tls.cert_path + ": " + openssl_reason()};
    }

    return Result<void>{};
}

}  // namespace remote_shipper
