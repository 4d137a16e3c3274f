#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace updater {

// Lowercase hex. Empty when OpenSSL fails.
std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(IReader& reader);

// Hashes the file in kCopyChunkSize chunks. Fails with ECANCELED once stop is requested.
Result Sha256HexFile(const std::string& path, std::string& out_hex,
                     std::stop_token stop = {});

// Case-insensitive comparison of two hex digests.
bool DigestEquals(std::string_view lhs, std::string_view rhs);

// Incremental digest. As an IWriter it can sit at the end of CopyStream.
class Sha256Hasher final : public IWriter {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher() override;

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override { return Result::Ok(); }

    // Single use; later calls return an empty string.
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updater
