#include "crypto/md5.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <vector>

namespace geoupdate {

namespace {

constexpr size_t kMd5Bytes = 16;

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

std::span<const std::uint8_t> AsBytes(std::string_view s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

bool InitMd5(EvpCtx& ctx) {
    return ctx.ok() && EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) == 1;
}

bool UpdateMd5(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

bool FinalMd5(EvpCtx& ctx, std::array<std::uint8_t, kMd5Bytes>& out) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return false;
    return len == out.size();
}

} // namespace

struct Md5Hasher::Impl {
    EvpCtx ctx;
    bool initialized = false;
    bool finalized = false;
};

Md5Hasher::Md5Hasher() : impl_(std::make_unique<Impl>()) {
    if (InitMd5(impl_->ctx)) {
        impl_->initialized = true;
    }
}

Md5Hasher::Md5Hasher(Md5Hasher&&) noexcept = default;
Md5Hasher& Md5Hasher::operator=(Md5Hasher&&) noexcept = default;
Md5Hasher::~Md5Hasher() = default;

void Md5Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->initialized || impl_->finalized) return;
    if (!UpdateMd5(impl_->ctx, data)) {
        impl_->finalized = true;
    }
}

void Md5Hasher::Update(std::string_view data) { Update(AsBytes(data)); }

std::string Md5Hasher::FinalHex() {
    if (!impl_ || !impl_->initialized || impl_->finalized) return {};
    impl_->finalized = true;
    std::array<std::uint8_t, kMd5Bytes> digest{};
    if (!FinalMd5(impl_->ctx, digest)) return {};
    return HexEncode(digest);
}

std::string Md5Hex(std::span<const std::uint8_t> data) {
    EvpCtx ctx;
    if (!InitMd5(ctx)) return {};
    if (!UpdateMd5(ctx, data)) return {};
    std::array<std::uint8_t, kMd5Bytes> digest{};
    if (!FinalMd5(ctx, digest)) return {};
    return HexEncode(digest);
}

std::string Md5Hex(std::string_view data) { return Md5Hex(AsBytes(data)); }

std::string Md5Hex(IReader& reader) {
    Md5Hasher hasher;

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }

    return hasher.FinalHex();
}

Result Md5HexFile(const std::string& path, std::string& out_hex) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.ok) return r;
    out_hex = Md5Hex(reader);
    if (out_hex.empty()) return Result::Fail(-1, "md5 of " + path + " failed");
    return Result::Ok();
}

} // namespace geoupdate
