/*
 * integrity_verifier.cpp
 *
 * Streaming SHA-256 via OpenSSL EVP.
 * - update() feeds byte spans to the active digest context.
 * - finalize() returns the lower-case hex digest and re-initializes for reuse.
 * - sha256File() hashes a file (or a prefix of it); used to verify Ready downloads and to
 *   re-seed the digest when a transfer resumes from a staged prefix.
 */

#include <modelflux/downloader/downloader.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace modelflux::downloader {

namespace {

// RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

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

class OpenSslSha256Verifier final : public IIntegrityVerifier {
public:
    OpenSslSha256Verifier() { reset(); }

    void reset() override {
        ready_ = _ctx && EVP_DigestInit_ex(_ctx.ctx, EVP_sha256(), nullptr) == 1;
    }

    void update(std::span<const std::byte> data) override {
        if (!ready_ || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1) {
            ready_ = false;
        }
    }

    std::string finalize() override {
        if (!ready_) {
            reset();
            return {};
        }
        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        std::string out;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) == 1) {
            out = to_hex_lower(md_buf.data(), md_len);
        }
        reset();
        return out;
    }

private:
    EvpMdCtx _ctx{};
    bool ready_{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeSha256Verifier() {
    return std::make_unique<OpenSslSha256Verifier>();
}

Result<std::string> sha256File(const std::filesystem::path& path,
                               std::optional<std::uint64_t> limit) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open for hashing: " + path.string()};
    }
    OpenSslSha256Verifier verifier;
    std::vector<char> buffer(DEFAULT_BUFFER_SIZE);
    std::uint64_t remaining = limit.value_or(UINT64_MAX);
    while (in && remaining > 0) {
        const auto want = static_cast<std::streamsize>(
            std::min<std::uint64_t>(remaining, static_cast<std::uint64_t>(buffer.size())));
        in.read(buffer.data(), want);
        const auto got = in.gcount();
        if (got <= 0)
            break;
        verifier.update(std::span<const std::byte>(reinterpret_cast<const std::byte*>(buffer.data()),
                                                   static_cast<std::size_t>(got)));
        remaining -= static_cast<std::uint64_t>(got);
    }
    if (limit && remaining > 0) {
        return Error{ErrorCode::CorruptedData,
                     "File shorter than expected while hashing: " + path.string()};
    }
    auto hex = verifier.finalize();
    if (hex.empty()) {
        return Error{ErrorCode::InternalError, "Failed to finalize SHA-256"};
    }
    return hex;
}

} // namespace modelflux::downloader
