#include "crypto/sha256.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <cstdint>

namespace updater {

namespace {

constexpr size_t kDigestSize = 32;

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

struct Sha256Hasher::Impl {
    std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter> ctx{EVP_MD_CTX_new()};
    // Set after FinalHex or after OpenSSL reported an error.
    bool done = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    if (!impl_->ctx || EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1) {
        impl_->done = true;
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

Result Sha256Hasher::WriteAll(std::span<const std::uint8_t> in) {
    if (!impl_ || impl_->done) return Result::Fail(-1, "sha256: digest already finalized");
    if (in.empty()) return Result::Ok();
    if (EVP_DigestUpdate(impl_->ctx.get(), in.data(), in.size()) != 1) {
        impl_->done = true;
        return Result::Fail(-1, "sha256: EVP_DigestUpdate failed");
    }
    return Result::Ok();
}

std::string Sha256Hasher::FinalHex() {
    if (!impl_ || impl_->done) return {};
    impl_->done = true;

    std::array<std::uint8_t, kDigestSize> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &len) != 1 || len != digest.size()) {
        return {};
    }
    return HexEncode(digest);
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    Sha256Hasher hasher;
    if (!hasher.WriteAll(data).is_ok()) return {};
    return hasher.FinalHex();
}

std::string Sha256Hex(IReader& reader) {
    Sha256Hasher hasher;
    if (!CopyStream(reader, hasher).is_ok()) return {};
    return hasher.FinalHex();
}

Result Sha256HexFile(const std::string& path, std::string& out_hex, std::stop_token stop) {
    out_hex.clear();

    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return r;

    Sha256Hasher hasher;
    r = CopyStream(reader, hasher, stop);
    if (r.cancelled()) return Result::Fail(ECANCELED, "hashing cancelled: " + path);
    if (!r.is_ok()) return r.WithContext("hashing " + path);

    out_hex = hasher.FinalHex();
    if (out_hex.empty()) return Result::Fail(-1, "sha256 failed: " + path);
    return Result::Ok();
}

bool DigestEquals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace updater
