#include <dlkit/downloader/byte_source.hpp>

#include <algorithm>
#include <cstring>

namespace dlkit::downloader {

BodyOpener openerFor(Body body) {
    return [body = std::move(body)](const Scope&) -> Result<Body> { return body; };
}

MemorySource::MemorySource(std::string_view data) {
    data_.resize(data.size());
    if (!data.empty()) {
        std::memcpy(data_.data(), data.data(), data.size());
    }
}

Result<std::size_t> MemorySource::read(std::span<std::byte> buffer) {
    const std::size_t n = std::min(buffer.size(), remaining());
    if (n > 0) {
        std::memcpy(buffer.data(), data_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

Result<std::size_t> StreamSource::read(std::span<std::byte> buffer) {
    if (buffer.empty() || in_.eof()) {
        return std::size_t{0};
    }
    in_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (in_.bad()) {
        return Error{ErrorCode::IoError, "read failed on input stream"};
    }
    return static_cast<std::size_t>(in_.gcount());
}

} // namespace dlkit::downloader
