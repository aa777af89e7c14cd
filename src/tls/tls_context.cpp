#include <fconv/tls/tls_context.h>

#include <spdlog/spdlog.h>

namespace fconv::tls {

namespace ssl = boost::asio::ssl;
namespace fs = std::filesystem;

namespace {

const ssl::context::options BASE_OPTIONS =
    ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
    ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1;

Result<void> require_file(const fs::path& path, const char* what) {
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        return Error{ErrorCode::FileNotFound,
                     std::string(what) + " not found: '" + path.string() + "'"};
    }
    return Result<void>();
}

} // namespace

Result<SslContextPtr> make_server_context(const fs::path& certPath, const fs::path& keyPath) {
    if (auto ok = require_file(certPath, "certificate"); !ok)
        return ok.error();
    if (auto ok = require_file(keyPath, "private key"); !ok)
        return ok.error();

    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
    boost::system::error_code ec;
    ctx->set_options(BASE_OPTIONS | ssl::context::single_dh_use, ec);
    if (ec) {
        return Error{ErrorCode::InternalError, "cannot set TLS options: " + ec.message()};
    }

    ctx->use_certificate_chain_file(certPath.string(), ec);
    if (ec) {
        return Error{ErrorCode::InvalidArgument,
                     "cannot load certificate '" + certPath.string() + "': " + ec.message()};
    }
    ctx->use_private_key_file(keyPath.string(), ssl::context::pem, ec);
    if (ec) {
        return Error{ErrorCode::InvalidArgument,
                     "cannot load private key '" + keyPath.string() + "': " + ec.message()};
    }
    if (SSL_CTX_check_private_key(ctx->native_handle()) != 1) {
        return Error{ErrorCode::InvalidArgument, "private key '" + keyPath.string() +
                                                     "' does not match certificate '" +
                                                     certPath.string() + "'"};
    }

    spdlog::debug("TLS server context ready (cert={}, key={})", certPath.string(),
                  keyPath.string());
    return ctx;
}

Result<SslContextPtr> make_client_context(const fs::path& certPath, bool verifyPeer) {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    boost::system::error_code ec;
    ctx->set_options(BASE_OPTIONS, ec);
    if (ec) {
        return Error{ErrorCode::InternalError, "cannot set TLS options: " + ec.message()};
    }

    if (!verifyPeer) {
        ctx->set_verify_mode(ssl::verify_none, ec);
        if (ec) {
            return Error{ErrorCode::InternalError, "cannot set verify mode: " + ec.message()};
        }
        spdlog::debug("TLS client context: peer verification disabled");
        return ctx;
    }

    if (auto ok = require_file(certPath, "certificate"); !ok)
        return ok.error();
    ctx->load_verify_file(certPath.string(), ec);
    if (ec) {
        return Error{ErrorCode::InvalidArgument,
                     "cannot load trusted certificate '" + certPath.string() + "': " +
                         ec.message()};
    }
    ctx->set_verify_mode(ssl::verify_peer, ec);
    if (ec) {
        return Error{ErrorCode::InternalError, "cannot set verify mode: " + ec.message()};
    }
    return ctx;
}

} // namespace fconv::tls
