#pragma once

#include <fconv/core/types.h>

#include <filesystem>
#include <string>

namespace fconv::tls {

struct CertificateOptions {
    std::filesystem::path certPath = "cert.pem";
    std::filesystem::path keyPath = "key.pem";
    std::string commonName = "localhost";
    int days = 365;
    int keyBits = 2048;
    bool overwrite = false;
};

/**
 * Generate a self-signed RSA certificate (SHA-256) for local TLS.
 *
 * Subject and issuer are identical; subjectAltName carries DNS:<commonName>
 * plus IP:127.0.0.1 when the name is localhost. The key is written as
 * unencrypted PKCS#8 PEM with owner-only permissions.
 *
 * Existing files are left untouched unless overwrite is set (InvalidState).
 */
Result<void> generate_self_signed(const CertificateOptions& options);

} // namespace fconv::tls
