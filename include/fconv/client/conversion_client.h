#pragma once

#include <fconv/core/types.h>
#include <fconv/ipc/conversion_protocol.h>
#include <fconv/tls/tls_context.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fconv::client {

struct ClientConfig {
    std::string host = "localhost";
    uint16_t port = DEFAULT_PORT;
    std::filesystem::path certPath = "cert.pem"; // trusted server certificate
    std::filesystem::path outputDir = "converted_files";
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds requestTimeout{60000}; // whole exchange after connect
    size_t maxPayloadBytes = DEFAULT_MAX_PAYLOAD_SIZE;
    bool verifyPeer = true;
};

struct ConversionResult {
    std::string requestId;
    std::vector<std::filesystem::path> outputPaths; // in output order
};

/**
 * Blocking client for the conversion server.
 *
 * Every call opens one TLS connection, performs one exchange and closes it;
 * there is no retry. Errors reported by the server keep the server's kind and
 * message. Local failures are ConnectionRefused (nothing listening), Timeout,
 * NetworkError (socket or TLS failure) and FramingError (bad response).
 */
class ConversionClient {
public:
    explicit ConversionClient(ClientConfig config = {});

    // Read a file, convert it and store the results in the output directory
    Result<ConversionResult> convert(const std::filesystem::path& path, ipc::Operation operation,
                                     const ipc::OperationParams& params = ipc::NoParams{});

    // Same as convert() for bytes already in memory (upload boundary for a UI)
    Result<ConversionResult> submit(ByteVector bytes, std::string sourceName,
                                    ipc::Operation operation,
                                    const ipc::OperationParams& params = ipc::NoParams{});

    // One exchange, nothing written to disk. Server-side failures come back
    // as a response with an error status, not as an Error.
    Result<ipc::ConversionResponse> roundTrip(const ipc::ConversionRequest& request);

    // Whether something accepts TCP connections on host:port
    bool probe();

    const ClientConfig& config() const noexcept { return config_; }

private:
    Result<tls::SslContextPtr> sslContext();

    ClientConfig config_;
    tls::SslContextPtr sslContext_;
};

} // namespace fconv::client
