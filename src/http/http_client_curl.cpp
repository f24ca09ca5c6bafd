/*
 * dlkit/src/http/http_client_curl.cpp
 *
 * Notes
 * - The response body is exposed as a pull-based IByteSource on top of the libcurl multi
 *   interface: each read() drives curl until data is buffered or the transfer ended
 * - The scope is checked between poll cycles, so an idle server cannot delay cancellation by
 *   more than one cycle
 * - Honors timeouts, TLS verify/CA, proxy, headers, user agent and redirects
 *
 * Build
 * - Linked against CURL::libcurl; logs through spdlog.
 */

#include <dlkit/http/http_client.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dlkit::http {

namespace {

constexpr int kPollTimeoutMs = 100;

std::once_flag g_curl_global_once;

void ensure_curl_global() {
    std::call_once(g_curl_global_once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where, const char* detail) {
    std::string message = std::string(where) + ": " + curl_easy_strerror(code);
    if (detail != nullptr && *detail != '\0') {
        message += " (";
        message += detail;
        message += ")";
    }
    switch (code) {
        case CURLE_OK:
            return Error{};
        case CURLE_OPERATION_TIMEDOUT:
            return Error{ErrorCode::Timeout, std::move(message)};
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            return Error{ErrorCode::InvalidArgument, std::move(message)};
        case CURLE_WRITE_ERROR:
            return Error{ErrorCode::IoError, std::move(message)};
        default:
            return Error{ErrorCode::NetworkError, std::move(message)};
    }
}

// Helper to build curl_slist from headers
curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, const ClientConfig& cfg) {
    // Timeouts
    if (cfg.timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(cfg.timeout.count()));
    }
    if (cfg.connectTimeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(cfg.connectTimeout.count()));
    }

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, cfg.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, cfg.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, cfg.tls.insecure ? 0L : 2L);
    if (!cfg.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, cfg.tls.caPath.c_str());
    }

    // Proxy
    if (cfg.proxy && !cfg.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, cfg.proxy->c_str());
    }

    if (!cfg.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, cfg.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
}

class CurlBodySource final : public downloader::IByteSource {
public:
    static Result<std::shared_ptr<CurlBodySource>> start(const Scope& scope, const Request& request,
                                                         const ClientConfig& cfg) {
        ensure_curl_global();

        auto src = std::shared_ptr<CurlBodySource>(new CurlBodySource(scope));
        src->multi_ = curl_multi_init();
        src->easy_ = curl_easy_init();
        if (!src->multi_ || !src->easy_) {
            return Error{ErrorCode::InternalError, "curl init failed"};
        }

        CURL* curl = src->easy_;
        src->headers_ = build_header_list(request.headers);
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        if (request.method.empty() || request.method == "GET") {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        } else {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
        if (src->headers_) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, src->headers_);
        }
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlBodySource::write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, src.get());
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, src->errbuf_);
        configure_common(curl, cfg);

        CURLMcode mc = curl_multi_add_handle(src->multi_, curl);
        if (mc != CURLM_OK) {
            return Error{ErrorCode::InternalError,
                         std::string("curl_multi_add_handle: ") + curl_multi_strerror(mc)};
        }
        src->added_ = true;
        return src;
    }

    CurlBodySource(const CurlBodySource&) = delete;
    CurlBodySource& operator=(const CurlBodySource&) = delete;

    ~CurlBodySource() override {
        if (multi_ && easy_ && added_) {
            curl_multi_remove_handle(multi_, easy_);
        }
        if (easy_) {
            curl_easy_cleanup(easy_);
        }
        if (headers_) {
            curl_slist_free_all(headers_);
        }
        if (multi_) {
            curl_multi_cleanup(multi_);
        }
    }

    Result<std::size_t> read(std::span<std::byte> buffer) override {
        if (buffer.empty()) {
            return std::size_t{0};
        }
        if (offset_ >= pending_.size()) {
            pending_.clear();
            offset_ = 0;
            if (auto r = fill(); !r) {
                return r.error();
            }
        }
        if (offset_ < pending_.size()) {
            const std::size_t n = std::min(buffer.size(), pending_.size() - offset_);
            std::memcpy(buffer.data(), pending_.data() + offset_, n);
            offset_ += n;
            return n;
        }
        if (result_ != CURLE_OK) {
            return makeCurlError(result_, "reading response body", errbuf_);
        }
        return std::size_t{0};
    }

    // Drives the transfer until body bytes are buffered or the response ended.
    Result<void> fill() {
        while (offset_ >= pending_.size() && !finished_) {
            if (scope_.done()) {
                return scope_.error();
            }
            if (auto r = pump(); !r) {
                return r;
            }
        }
        return {};
    }

    [[nodiscard]] bool failedWithoutBody() const noexcept {
        return finished_ && result_ != CURLE_OK && offset_ >= pending_.size();
    }

    [[nodiscard]] Error transferError() const { return makeCurlError(result_, "exec http do", errbuf_); }

    [[nodiscard]] long status() const {
        long code = 0;
        curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &code);
        return code;
    }

    [[nodiscard]] std::int64_t contentLength() const {
        curl_off_t cl = -1;
        if (curl_easy_getinfo(easy_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) != CURLE_OK ||
            cl < 0) {
            return downloader::kUnknownLength;
        }
        return static_cast<std::int64_t>(cl);
    }

private:
    explicit CurlBodySource(Scope scope) : scope_(std::move(scope)) {}

    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
        const size_t total = size * nmemb;
        if (userdata == nullptr) {
            return 0;
        }
        auto* self = static_cast<CurlBodySource*>(userdata);
        self->pending_.insert(self->pending_.end(), ptr, ptr + total);
        return total;
    }

    Result<void> pump() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            return Error{ErrorCode::NetworkError,
                         std::string("curl_multi_perform: ") + curl_multi_strerror(mc)};
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                finished_ = true;
                result_ = msg->data.result;
            }
        }

        if (!finished_ && offset_ >= pending_.size()) {
            mc = curl_multi_poll(multi_, nullptr, 0, kPollTimeoutMs, nullptr);
            if (mc != CURLM_OK) {
                return Error{ErrorCode::NetworkError,
                             std::string("curl_multi_poll: ") + curl_multi_strerror(mc)};
            }
        }
        return {};
    }

    Scope scope_;
    CURLM* multi_{nullptr};
    CURL* easy_{nullptr};
    curl_slist* headers_{nullptr};
    bool added_{false};
    std::vector<char> pending_;
    std::size_t offset_{0};
    bool finished_{false};
    CURLcode result_{CURLE_OK};
    char errbuf_[CURL_ERROR_SIZE]{};
};

} // namespace

HttpClient::HttpClient(ClientConfig config) : config_(std::move(config)) {
    ensure_curl_global();
}

Result<downloader::Body> HttpClient::open(const Scope& scope, const Request& request,
                                          long expectedStatus) const {
    if (request.url.empty()) {
        return Error{ErrorCode::InvalidArgument, "request url must not be empty"};
    }

    auto started = CurlBodySource::start(scope, request, config_);
    if (!started) {
        return started.error();
    }
    auto source = std::move(started).value();

    if (auto r = source->fill(); !r) {
        return r.error();
    }
    if (source->failedWithoutBody()) {
        return source->transferError();
    }

    const long status = source->status();
    if (status != expectedStatus) {
        spdlog::debug("discarding response body of {} (status {})", request.url, status);
        return Error{ErrorCode::NetworkError, "unexpected status code: got " +
                                                  std::to_string(status) + ", want " +
                                                  std::to_string(expectedStatus)};
    }

    return downloader::Body{source, source->contentLength()};
}

downloader::BodyOpener HttpClient::opener(Request request, long expectedStatus) const {
    return [client = *this, request = std::move(request),
            expectedStatus](const Scope& scope) -> Result<downloader::Body> {
        return client.open(scope, request, expectedStatus);
    };
}

Result<void> HttpClient::download(const Scope& scope, const Request& request,
                                  long expectedStatus, const std::filesystem::path& destPath,
                                  const std::vector<downloader::Option>& opts) const {
    if (destPath.empty()) {
        return Error{ErrorCode::InvalidArgument, "destPath must not be empty"};
    }

    auto resolved = downloader::applyOptions(opts);
    if (!resolved) {
        return resolved.error();
    }
    const auto& options = resolved.value();

    if (options.skipExisting) {
        std::error_code ec;
        if (std::filesystem::exists(destPath, ec) && !ec) {
            auto logger = options.logger ? options.logger : spdlog::default_logger();
            logger->info("skipping existing file: {}", destPath.string());
            return {};
        }
    }

    auto body = open(scope, request, expectedStatus);
    if (!body) {
        return body.error();
    }
    const auto& opened = body.value();
    if (auto r = downloader::transfer(scope, *opened.stream, opened.contentLength, destPath,
                                      options);
        !r) {
        return wrapError("download", r.error());
    }
    return {};
}

Result<std::shared_ptr<downloader::DownloadResult>>
HttpClient::downloadAsync(const Scope& scope, Request request, long expectedStatus,
                          std::filesystem::path destPath,
                          std::vector<downloader::Option> opts) const {
    return downloader::downloadAsync(scope, opener(std::move(request), expectedStatus),
                                     std::move(destPath), std::move(opts));
}

} // namespace dlkit::http
