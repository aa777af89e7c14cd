#pragma once

#include <fconv/core/types.h>

#include <boost/asio/ssl/context.hpp>

#include <filesystem>
#include <memory>

namespace fconv::tls {

using SslContextPtr = std::shared_ptr<boost::asio::ssl::context>;

// TLS 1.2+ server context with the certificate chain and private key loaded.
// Missing files -> FileNotFound; unreadable PEM or mismatched key -> InvalidArgument.
Result<SslContextPtr> make_server_context(const std::filesystem::path& certPath,
                                          const std::filesystem::path& keyPath);

// Client context trusting certPath (the server's self-signed certificate).
// With verifyPeer off the certificate is not checked at all.
Result<SslContextPtr> make_client_context(const std::filesystem::path& certPath, bool verifyPeer);

} // namespace fconv::tls
