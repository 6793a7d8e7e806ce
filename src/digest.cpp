#include <stdexcept>

#include <fmt/core.h>

#include "digest.hpp"

Sha256Hasher::Sha256Hasher() : m_ctx(EVP_MD_CTX_new())
{
    if (!m_ctx || EVP_DigestInit_ex(m_ctx.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("unable to initialize SHA-256 context");
    }
}

void Sha256Hasher::update(std::span<const std::uint8_t> bytes)
{
    if (m_finalized)
    {
        throw std::logic_error("SHA-256 context already finalized");
    }
    if (EVP_DigestUpdate(m_ctx.get(), bytes.data(), bytes.size()) != 1)
    {
        throw std::runtime_error("SHA-256 update failed");
    }
}

digest_t Sha256Hasher::finalize()
{
    if (m_finalized)
    {
        throw std::logic_error("SHA-256 context already finalized");
    }
    digest_t digest;
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(m_ctx.get(), digest.data(), &length) != 1 ||
        length != digest.size())
    {
        throw std::runtime_error("SHA-256 finalization failed");
    }
    m_finalized = true;
    return digest;
}

hexdigest_t get_hexdigest(const digest_t &digest)
{
    hexdigest_t hex;
    auto hex_output = hex.begin();
    for (std::size_t i = 0; i != digest.size(); i++)
    {
        hex_output = fmt::format_to(hex_output, "{:02x}", digest[i]);
    }
    return hex;
}

std::string to_hex(const digest_t &digest)
{
    auto hex = get_hexdigest(digest);
    return std::string(hex.begin(), hex.end());
}
