#pragma once

/*
 * dlkit Downloader - byte sources
 *
 * A byte source is the pull side of a transfer: the response body handed to the download
 * manager after the producer (typically the HTTP client) validated the status code.
 */

#include <dlkit/core/scope.h>
#include <dlkit/core/types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dlkit::downloader {

// Declared length of a body whose size is not known in advance.
inline constexpr std::int64_t kUnknownLength = -1;

/**
 * Readable byte stream.
 * read() fills at most buffer.size() bytes and returns the count; 0 signals end of stream.
 */
class IByteSource {
public:
    virtual ~IByteSource() = default;
    virtual Result<std::size_t> read(std::span<std::byte> buffer) = 0;
};

/**
 * An opened body: the stream plus its declared length (kUnknownLength if unknown).
 */
struct Body {
    std::shared_ptr<IByteSource> stream;
    std::int64_t contentLength{kUnknownLength};
};

/**
 * Deferred body. Asynchronous transfers open their body only after they were admitted by
 * the queue's concurrency gate.
 */
using BodyOpener = std::function<Result<Body>(const Scope&)>;

// Wraps an already opened body.
BodyOpener openerFor(Body body);

/**
 * Source over an in-memory buffer.
 */
class MemorySource final : public IByteSource {
public:
    explicit MemorySource(std::vector<std::byte> data) : data_(std::move(data)) {}
    explicit MemorySource(std::string_view data);

    Result<std::size_t> read(std::span<std::byte> buffer) override;

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - offset_; }

private:
    std::vector<std::byte> data_;
    std::size_t offset_{0};
};

/**
 * Source over a std::istream (files, string streams). The stream must outlive the source.
 */
class StreamSource final : public IByteSource {
public:
    explicit StreamSource(std::istream& in) : in_(in) {}

    Result<std::size_t> read(std::span<std::byte> buffer) override;

private:
    std::istream& in_;
};

} // namespace dlkit::downloader
