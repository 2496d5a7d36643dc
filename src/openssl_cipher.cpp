#include "sstun/openssl_cipher.hpp"

#include "sstun/protocol.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <system_error>

namespace sstun {

struct StreamCipher::MethodInfo {
    const char* name;
    const EVP_CIPHER* (*cipher)();
    size_t iv_len;
    // EVP_chacha20 takes a 16-byte IV: 32-bit block counter, then the 96-bit nonce.
    bool counter_prefix;
};

std::span<const StreamCipher::MethodInfo> StreamCipher::method_table() {
    static const std::array<MethodInfo, 7> table = {{
        {"aes-128-cfb", EVP_aes_128_cfb128, 16, false},
        {"aes-192-cfb", EVP_aes_192_cfb128, 16, false},
        {"aes-256-cfb", EVP_aes_256_cfb128, 16, false},
        {"aes-128-ctr", EVP_aes_128_ctr, 16, false},
        {"aes-192-ctr", EVP_aes_192_ctr, 16, false},
        {"aes-256-ctr", EVP_aes_256_ctr, 16, false},
        {"chacha20-ietf", EVP_chacha20, 12, true},
    }};
    return table;
}

const StreamCipher::MethodInfo* StreamCipher::find_method(const std::string& method) {
    for (const auto& info : method_table()) {
        if (method == info.name)
            return &info;
    }
    return nullptr;
}

StreamCipher::StreamCipher(const std::string& method, const std::string& password)
    : method_(method), info_(find_method(method)) {
    if (!info_)
        throw std::system_error(make_error_code(Error::UNSUPPORTED_CIPHER), method);

    const EVP_CIPHER* cipher = info_->cipher();
    key_.resize(static_cast<size_t>(EVP_CIPHER_get_key_length(cipher)));
    int n = EVP_BytesToKey(cipher, EVP_md5(), nullptr, reinterpret_cast<const unsigned char*>(password.data()),
                           static_cast<int>(password.size()), 1, key_.data(), nullptr);
    if (n != static_cast<int>(key_.size()))
        throw std::system_error(make_error_code(Error::UNSUPPORTED_CIPHER), "key derivation failed for " + method);
}

StreamCipher::StreamCipher(CopyTag, const StreamCipher& other)
    : method_(other.method_), info_(other.info_), key_(other.key_) {}

StreamCipher::~StreamCipher() {
    std::fill(key_.begin(), key_.end(), uint8_t{0});
}

std::unique_ptr<Cipher> StreamCipher::copy() const {
    return std::make_unique<StreamCipher>(CopyTag{}, *this);
}

size_t StreamCipher::iv_size() const {
    return info_->iv_len;
}

bool StreamCipher::supported(const std::string& method) {
    return find_method(method) != nullptr;
}

std::vector<std::string> StreamCipher::methods() {
    std::vector<std::string> names;
    for (const auto& info : method_table())
        names.emplace_back(info.name);
    return names;
}

StreamCipher::Context StreamCipher::start(std::span<const uint8_t> iv, bool encrypting) const {
    if (iv.size() != info_->iv_len)
        return nullptr;

    Context ctx(EVP_CIPHER_CTX_new());
    if (!ctx)
        return nullptr;

    std::array<uint8_t, 16> full_iv{};
    const uint8_t* iv_ptr = iv.data();
    if (info_->counter_prefix) {
        std::copy(iv.begin(), iv.end(), full_iv.begin() + 4);
        iv_ptr = full_iv.data();
    }

    if (EVP_CipherInit_ex(ctx.get(), info_->cipher(), nullptr, key_.data(), iv_ptr, encrypting ? 1 : 0) != 1)
        return nullptr;
    return ctx;
}

bool StreamCipher::update(EVP_CIPHER_CTX* ctx, std::span<uint8_t> inout) {
    if (!ctx)
        return false;
    if (inout.empty())
        return true;
    int outl = 0;
    if (EVP_CipherUpdate(ctx, inout.data(), &outl, inout.data(), static_cast<int>(inout.size())) != 1)
        return false;
    return outl == static_cast<int>(inout.size());
}

bool StreamCipher::init_encrypt(std::vector<uint8_t>& iv) {
    iv.resize(info_->iv_len);
    if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1)
        return false;
    enc_ = start(iv, true);
    return enc_ != nullptr;
}

bool StreamCipher::init_decrypt(std::span<const uint8_t> iv) {
    dec_ = start(iv, false);
    return dec_ != nullptr;
}

bool StreamCipher::encrypt(std::span<uint8_t> inout) {
    return update(enc_.get(), inout);
}

bool StreamCipher::decrypt(std::span<uint8_t> inout) {
    return update(dec_.get(), inout);
}

} // namespace sstun
