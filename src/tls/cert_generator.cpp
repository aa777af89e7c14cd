#include <fconv/tls/cert_generator.h>

#include <spdlog/spdlog.h>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <fstream>
#include <memory>
#include <utility>

namespace fconv::tls {

namespace fs = std::filesystem;

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};
struct X509Deleter {
    void operator()(X509* p) const { X509_free(p); }
};
struct X509ExtDeleter {
    void operator()(X509_EXTENSION* p) const { X509_EXTENSION_free(p); }
};
struct BioDeleter {
    void operator()(BIO* p) const { BIO_free_all(p); }
};
struct BnDeleter {
    void operator()(BIGNUM* p) const { BN_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using X509ExtPtr = std::unique_ptr<X509_EXTENSION, X509ExtDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;

Error openssl_error(const std::string& what) {
    std::string detail;
    while (unsigned long code = ERR_get_error()) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!detail.empty())
            detail += "; ";
        detail += buf;
    }
    return Error{ErrorCode::InternalError,
                 detail.empty() ? what : what + ": " + detail};
}

Result<PkeyPtr> generate_rsa_key(int bits) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) {
        return openssl_error("cannot initialize RSA key generation");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        return openssl_error("RSA key generation failed");
    }
    return PkeyPtr(raw);
}

Result<void> add_extension(X509* cert, int nid, const std::string& value) {
    X509V3_CTX v3;
    X509V3_set_ctx_nodb(&v3);
    X509V3_set_ctx(&v3, cert, cert, nullptr, nullptr, 0);
    X509ExtPtr ext(X509V3_EXT_conf_nid(nullptr, &v3, nid, value.c_str()));
    if (!ext || X509_add_ext(cert, ext.get(), -1) != 1) {
        return openssl_error("cannot add extension " + value);
    }
    return Result<void>();
}

Result<X509Ptr> build_certificate(EVP_PKEY* key, const CertificateOptions& options) {
    X509Ptr cert(X509_new());
    if (!cert)
        return openssl_error("X509_new failed");

    X509_set_version(cert.get(), 2); // v3

    BnPtr serial(BN_new());
    if (!serial || BN_rand(serial.get(), 64, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1 ||
        !BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert.get()))) {
        return openssl_error("cannot assign serial number");
    }

    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 60L * 60 * 24 * options.days);

    if (X509_set_pubkey(cert.get(), key) != 1)
        return openssl_error("cannot set public key");

    X509_NAME* name = X509_get_subject_name(cert.get());
    const std::pair<const char*, std::string> fields[] = {{"C", "US"},
                                                          {"ST", "State"},
                                                          {"L", "City"},
                                                          {"O", "Organization"},
                                                          {"CN", options.commonName}};
    for (const auto& [field, value] : fields) {
        if (X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                                       reinterpret_cast<const unsigned char*>(value.c_str()), -1,
                                       -1, 0) != 1) {
            return openssl_error(std::string("cannot set subject field ") + field);
        }
    }
    if (X509_set_issuer_name(cert.get(), name) != 1)
        return openssl_error("cannot set issuer name");

    std::string san = "DNS:" + options.commonName;
    if (options.commonName == "localhost")
        san += ",IP:127.0.0.1";
    if (auto ok = add_extension(cert.get(), NID_subject_alt_name, san); !ok)
        return ok.error();

    if (X509_sign(cert.get(), key, EVP_sha256()) <= 0)
        return openssl_error("certificate signing failed");
    return std::move(cert);
}

template <typename WriteFn> Result<std::string> to_pem(WriteFn&& write) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || write(bio.get()) != 1)
        return openssl_error("PEM encoding failed");
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

Result<void> write_file(const fs::path& path, const std::string& content, fs::perms perms) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out)
            return Error{ErrorCode::IOError, "cannot open " + path.string() + " for writing"};
        fs::permissions(path, perms, fs::perm_options::replace, ec);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out)
            return Error{ErrorCode::IOError, "cannot write " + path.string()};
    }
    return Result<void>();
}

} // namespace

Result<void> generate_self_signed(const CertificateOptions& options) {
    if (options.days <= 0) {
        return Error{ErrorCode::InvalidArgument, "certificate validity must be at least one day"};
    }
    if (options.keyBits < 2048) {
        return Error{ErrorCode::InvalidArgument, "RSA keys shorter than 2048 bits are refused"};
    }
    if (options.commonName.empty()) {
        return Error{ErrorCode::InvalidArgument, "certificate common name is empty"};
    }

    std::error_code ec;
    if (!options.overwrite &&
        (fs::exists(options.certPath, ec) || fs::exists(options.keyPath, ec))) {
        return Error{ErrorCode::InvalidState,
                     "certificate files already exist (" + options.certPath.string() + ", " +
                         options.keyPath.string() + "); use --force to overwrite"};
    }

    auto key = generate_rsa_key(options.keyBits);
    if (!key)
        return key.error();
    auto cert = build_certificate(key.value().get(), options);
    if (!cert)
        return cert.error();

    auto certPem = to_pem([&](BIO* bio) { return PEM_write_bio_X509(bio, cert.value().get()); });
    if (!certPem)
        return certPem.error();
    auto keyPem = to_pem([&](BIO* bio) {
        return PEM_write_bio_PKCS8PrivateKey(bio, key.value().get(), nullptr, nullptr, 0, nullptr,
                                             nullptr);
    });
    if (!keyPem)
        return keyPem.error();

    if (auto ok = write_file(options.keyPath, keyPem.value(),
                             fs::perms::owner_read | fs::perms::owner_write);
        !ok)
        return ok.error();
    if (auto ok = write_file(options.certPath, certPem.value(),
                             fs::perms::owner_read | fs::perms::owner_write |
                                 fs::perms::group_read | fs::perms::others_read);
        !ok)
        return ok.error();

    spdlog::info("Generated self-signed certificate for '{}' ({} days): {}, {}",
                 options.commonName, options.days, options.certPath.string(),
                 options.keyPath.string());
    return Result<void>();
}

} // namespace fconv::tls
