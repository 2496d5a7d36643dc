#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace sstun {

// Per-connection stream cipher state. A configured instance acts as a
// template: connections work on copy(), never on the template itself.
class Cipher {
  public:
    virtual ~Cipher() = default;

    // Same key, fresh stream state.
    virtual std::unique_ptr<Cipher> copy() const = 0;

    virtual size_t iv_size() const = 0;

    // Starts the encrypting stream with a random IV and returns it in `iv`.
    virtual bool init_encrypt(std::vector<uint8_t>& iv) = 0;
    // Starts the decrypting stream from the peer's IV.
    virtual bool init_decrypt(std::span<const uint8_t> iv) = 0;

    virtual bool encrypt(std::span<uint8_t> inout) = 0;
    virtual bool decrypt(std::span<uint8_t> inout) = 0;
};

} // namespace sstun
