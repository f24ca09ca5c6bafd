#pragma once

/*
 * dlkit HTTP client download surface.
 *
 * Issues the request (libcurl), validates the status code and hands the response body to the
 * download manager as a pull-based byte source.
 */

#include <dlkit/core/scope.h>
#include <dlkit/core/types.h>
#include <dlkit/downloader/downloader.hpp>
#include <dlkit/downloader/queue.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dlkit::http {

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

struct ClientConfig {
    std::chrono::milliseconds timeout{0}; // whole transfer, 0 = no limit
    std::chrono::milliseconds connectTimeout{30000};
    bool followRedirects{true};
    std::string userAgent{"dlkit/1.0"};
    TlsConfig tls{};
    std::optional<std::string> proxy;
};

struct Request {
    std::string url;
    std::string method{"GET"};
    std::vector<Header> headers;
};

// Effective client config: environment, then config.toml [http], then defaults.
ClientConfig resolveClientConfig();

class HttpClient {
public:
    explicit HttpClient(ClientConfig config = {});

    /**
     * Performs `request` and waits until the first body bytes arrived (or the response ended).
     * A status other than `expectedStatus` is a NetworkError and the response is discarded.
     */
    Result<downloader::Body> open(const Scope& scope, const Request& request,
                                  long expectedStatus) const;

    // Deferred open(), for asynchronous and batched downloads.
    downloader::BodyOpener opener(Request request, long expectedStatus) const;

    // Streams the response body of `request` to `destPath`.
    Result<void> download(const Scope& scope, const Request& request, long expectedStatus,
                          const std::filesystem::path& destPath,
                          const std::vector<downloader::Option>& opts = {}) const;

    /**
     * Asynchronous download; pass downloader::withBatch(n) to start a batch and add siblings
     * with result->add(client.opener(req, status), path).
     */
    Result<std::shared_ptr<downloader::DownloadResult>>
    downloadAsync(const Scope& scope, Request request, long expectedStatus,
                  std::filesystem::path destPath, std::vector<downloader::Option> opts = {}) const;

    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

private:
    ClientConfig config_;
};

} // namespace dlkit::http
