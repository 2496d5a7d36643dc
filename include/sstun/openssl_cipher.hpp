#pragma once

#include "sstun/cipher.hpp"

#include <openssl/evp.h>

#include <memory>
#include <span>
#include <string>
#include <vector>

namespace sstun {

// Password-keyed stream cipher on OpenSSL EVP. The key is derived with
// EVP_BytesToKey(MD5); every direction starts from its own random IV.
class StreamCipher : public Cipher {
    struct CopyTag {
        explicit CopyTag() = default;
    };

  public:
    // Throws std::system_error(Error::UNSUPPORTED_CIPHER) for an unknown method.
    StreamCipher(const std::string& method, const std::string& password);
    // Used by copy(): same method and key, no stream state.
    StreamCipher(CopyTag, const StreamCipher& other);
    ~StreamCipher() override;

    std::unique_ptr<Cipher> copy() const override;
    size_t iv_size() const override;
    bool init_encrypt(std::vector<uint8_t>& iv) override;
    bool init_decrypt(std::span<const uint8_t> iv) override;
    bool encrypt(std::span<uint8_t> inout) override;
    bool decrypt(std::span<uint8_t> inout) override;

    const std::string& method() const { return method_; }

    static bool supported(const std::string& method);
    static std::vector<std::string> methods();

  private:
    struct MethodInfo;
    struct ContextDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
    };
    using Context = std::unique_ptr<EVP_CIPHER_CTX, ContextDeleter>;

    static std::span<const MethodInfo> method_table();
    static const MethodInfo* find_method(const std::string& method);

    Context start(std::span<const uint8_t> iv, bool encrypting) const;
    static bool update(EVP_CIPHER_CTX* ctx, std::span<uint8_t> inout);

    std::string method_;
    const MethodInfo* info_;
    std::vector<uint8_t> key_;
    Context enc_;
    Context dec_;
};

} // namespace sstun
