#pragma once

#include <fconv/tls/cert_generator.h>
#include <support/temp_dir_scope.hpp>

#include <stdexcept>

namespace fconv::test {

struct TestCertificate {
    std::filesystem::path cert;
    std::filesystem::path key;
};

// Self-signed localhost certificate inside `dir`; throws if generation fails
inline TestCertificate makeTestCertificate(const test_support::TempDirScope& dir) {
    tls::CertificateOptions opts;
    opts.certPath = dir.path() / "cert.pem";
    opts.keyPath = dir.path() / "key.pem";
    opts.days = 1;
    opts.overwrite = true;
    auto r = tls::generate_self_signed(opts);
    if (!r)
        throw std::runtime_error("test certificate generation failed: " + r.error().message);
    return {opts.certPath, opts.keyPath};
}

} // namespace fconv::test
