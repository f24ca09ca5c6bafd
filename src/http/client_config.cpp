#include <dlkit/config/config_helpers.h>
#include <dlkit/http/http_client.h>

#include <spdlog/spdlog.h>

namespace dlkit::http {

namespace {

void apply_ms(const char* env_name, const char* key, std::chrono::milliseconds& out) {
    auto v = config::resolve_value(env_name, "http", key);
    if (v.empty()) {
        return;
    }
    auto ms = config::parse_ms(v);
    if (ms.count() < 0 || (ms.count() == 0 && v != "0")) {
        spdlog::warn("ignoring invalid http {} '{}'", key, v);
        return;
    }
    out = ms;
}

void apply_bool(const char* key, bool& out) {
    auto v = config::resolve_value(nullptr, "http", key);
    if (v.empty()) {
        return;
    }
    if (auto b = config::parse_bool(v)) {
        out = *b;
    } else {
        spdlog::warn("ignoring invalid http {} '{}'", key, v);
    }
}

} // namespace

ClientConfig resolveClientConfig() {
    ClientConfig cfg;

    apply_ms("DLKIT_HTTP_TIMEOUT_MS", "timeout_ms", cfg.timeout);
    apply_ms(nullptr, "connect_timeout_ms", cfg.connectTimeout);
    apply_bool("follow_redirects", cfg.followRedirects);
    apply_bool("insecure", cfg.tls.insecure);

    if (auto v = config::resolve_value(nullptr, "http", "user_agent"); !v.empty()) {
        cfg.userAgent = v;
    }
    if (auto v = config::resolve_value(nullptr, "http", "ca_path"); !v.empty()) {
        cfg.tls.caPath = config::expand_tilde(v).string();
    }
    if (auto v = config::resolve_value("DLKIT_HTTP_PROXY", "http", "proxy"); !v.empty()) {
        cfg.proxy = v;
    }

    if (cfg.tls.insecure) {
        spdlog::warn("TLS peer verification is disabled for dlkit http downloads");
    }
    return cfg;
}

} // namespace dlkit::http
