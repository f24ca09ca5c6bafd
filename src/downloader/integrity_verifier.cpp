/*
 * dlkit/src/downloader/integrity_verifier.cpp
 *
 * IntegrityVerifier via OpenSSL EVP, plus the ChecksumVerifier that compares the streamed
 * digest to the expected one.
 *
 * - reset() selects the algorithm and (re)initializes the digest context.
 * - update() accepts byte spans and feeds them to the active digest context.
 * - finalize() returns a Checksum { algo, hex } and resets the internal context.
 *
 * Dependencies:
 * - OpenSSL::Crypto
 */

#include <dlkit/downloader/downloader.hpp>

#include <openssl/evp.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace dlkit::downloader {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
    void release() noexcept {
        if (ctx)
            EVP_MD_CTX_free(ctx);
        ctx = nullptr;
    }
};

inline const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha256:
            return EVP_sha256();
        case HashAlgo::Sha512:
            return EVP_sha512();
        case HashAlgo::Sha1:
            return EVP_sha1();
        case HashAlgo::Md5:
            return EVP_md5();
    }
    return EVP_sha256();
}

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

inline std::string to_lower_copy(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'F') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    explicit OpenSslIntegrityVerifier(HashAlgo algo) { reset(algo); }

    ~OpenSslIntegrityVerifier() override = default;

    void reset(HashAlgo algo) override {
        _algo = algo;
        _md = resolve_algo(_algo);
        _ctx = EvpMdCtx{};
        _finalized = false;
        if (!_ctx || !_md) {
            // update/finalize become no-ops; finalize() yields an empty digest, which never
            // matches an expected value.
            spdlog::warn("integrity verifier: failed to allocate digest context");
            return;
        }
        if (EVP_DigestInit_ex(_ctx.ctx, _md, nullptr) != 1) {
            spdlog::warn("integrity verifier: EVP_DigestInit_ex failed");
            _ctx.release();
        }
    }

    void update(std::span<const std::byte> data) override {
        if (!_ctx || _finalized || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1) {
            spdlog::warn("integrity verifier: EVP_DigestUpdate failed");
            _ctx.release();
        }
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = _algo;

        if (!_ctx || _finalized) {
            return out;
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;

        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) != 1) {
            _finalized = true;
            return out;
        }

        out.hex = to_hex_lower(md_buf.data(), md_len);
        _finalized = true;

        // Prepare for potential reuse: re-init with same algo
        reset(_algo);
        return out;
    }

private:
    HashAlgo _algo{HashAlgo::Sha256};
    const EVP_MD* _md{nullptr};
    EvpMdCtx _ctx{};
    bool _finalized{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo) {
    return std::make_unique<OpenSslIntegrityVerifier>(algo);
}

ChecksumVerifier::ChecksumVerifier(std::shared_ptr<IIntegrityVerifier> hasher,
                                   std::string expectedHex)
    : hasher_(std::move(hasher)), expected_(to_lower_copy(expectedHex)) {}

Result<void> ChecksumVerifier::verify() {
    auto actual = hasher_->finalize().hex;
    if (actual != expected_) {
        return Error{ErrorCode::ChecksumMismatch,
                     "checksum mismatch: expected " + expected_ + ", got " + actual};
    }
    return {};
}

} // namespace dlkit::downloader
