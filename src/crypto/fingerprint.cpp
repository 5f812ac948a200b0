#include <array>
#include <cstring>
#include <optional>
#include <sodium.h>
#include <string>

#include "crypto/fingerprint.hpp"
#include "util/log.hpp"

namespace crypto
{

static_assert(SHA256_SIZE == crypto_hash_sha256_BYTES, "sha256 size mismatch");
static_assert(BLAKE2B_SIZE == crypto_generichash_BYTES, "blake2b size mismatch");
static_assert(CHUNK_TAG_SIZE >= crypto_generichash_BYTES_MIN, "chunk tag too short");

bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

Bytes Sha256Fingerprinter::compute(const std::uint8_t *data, std::size_t len) const
{
    if (!ensure_sodium_init())
        LOG_FATAL("sodium_init failed");

    Bytes out(SHA256_SIZE);
    crypto_hash_sha256(out.data(), data, static_cast<unsigned long long>(len));
    return out;
}

Bytes Blake2bFingerprinter::compute(const std::uint8_t *data, std::size_t len) const
{
    if (!ensure_sodium_init())
        LOG_FATAL("sodium_init failed");

    Bytes out(BLAKE2B_SIZE);
    if (crypto_generichash(out.data(), out.size(), data, static_cast<unsigned long long>(len),
                           nullptr, 0) != 0)
    {
        LOG_FATAL("crypto_generichash failed (len=%zu)", len);
    }
    return out;
}

std::array<std::uint8_t, CHUNK_TAG_SIZE> chunk_tag(const std::uint8_t *data, std::size_t len)
{
    ensure_sodium_init();
    std::array<std::uint8_t, CHUNK_TAG_SIZE> tag{};
    if (crypto_generichash(tag.data(), tag.size(), data, static_cast<unsigned long long>(len),
                           nullptr, 0) != 0)
    {
        LOG_FATAL("crypto_generichash failed (len=%zu)", len);
    }
    return tag;
}

std::string to_hex(const Bytes &b)
{
    std::string out(b.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), b.data(), b.size());
    out.resize(b.size() * 2);  // drop terminator
    return out;
}

std::optional<Bytes> from_hex(std::string_view hex)
{
    if (hex.size() % 2)
        return std::nullopt;
    Bytes       out(hex.size() / 2);
    std::size_t out_len = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &out_len,
                       nullptr) != 0 ||
        out_len != out.size())
    {
        return std::nullopt;
    }
    return out;
}

std::string to_base64(const std::uint8_t *data, std::size_t len)
{
    ensure_sodium_init();
    const std::size_t cap = sodium_base64_ENCODED_LEN(len, sodium_base64_VARIANT_ORIGINAL);
    std::string       out(cap, '\0');
    sodium_bin2base64(out.data(), out.size(), data, len, sodium_base64_VARIANT_ORIGINAL);
    out.resize(std::strlen(out.c_str()));
    return out;
}

std::optional<Bytes> from_base64(std::string_view b64)
{
    ensure_sodium_init();
    std::size_t maxlen = b64.size() / 4 * 3 + 3;
    Bytes       out(maxlen);
    std::size_t real_len = 0;
    if (sodium_base642bin(out.data(), out.size(), b64.data(), b64.size(), nullptr, &real_len,
                          nullptr, sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        return std::nullopt;
    }
    out.resize(real_len);
    return out;
}

}  // namespace crypto
