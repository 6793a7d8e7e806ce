#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include <openssl/evp.h>
#include <openssl/sha.h>

using digest_t = std::array<unsigned char, SHA256_DIGEST_LENGTH>;
using hexdigest_t = std::array<char, SHA256_DIGEST_LENGTH * 2>;

/// Incremental hash primitive fed by the assembler
class Hasher {
  public:
    virtual ~Hasher() = default;

    virtual void update(std::span<const std::uint8_t> bytes) = 0;

    /// Completes the computation, the hasher can't be updated afterwards
    virtual digest_t finalize() = 0;
};

class Sha256Hasher : public Hasher {
  public:
    Sha256Hasher();

    void update(std::span<const std::uint8_t> bytes) override;
    digest_t finalize() override;

  private:
    struct ContextDeleter
    {
        void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
    };

    std::unique_ptr<EVP_MD_CTX, ContextDeleter> m_ctx;
    bool m_finalized{false};
};

/// Lower-case hexadecimal rendering of `digest`
hexdigest_t get_hexdigest(const digest_t &digest);

std::string to_hex(const digest_t &digest);
