#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crypto
{

using Bytes = std::vector<std::uint8_t>;

constexpr std::size_t SHA256_SIZE    = 32;  // crypto_hash_sha256_BYTES
constexpr std::size_t BLAKE2B_SIZE   = 32;  // crypto_generichash_BYTES
constexpr std::size_t CHUNK_TAG_SIZE = 16;  // crypto_generichash_BYTES_MIN

/*
A fingerprint is a content hash over the assembled bytes, nothing more. It is
called an "embedding" at the API edge but carries no semantic information;
two files share a fingerprint iff their bytes are identical. A real embedding
provider can be plugged in behind this interface without touching assembly.
*/
class Fingerprinter
{
  public:
    virtual ~Fingerprinter() = default;

    virtual Bytes       compute(const std::uint8_t *data, std::size_t len) const = 0;
    virtual std::size_t size() const                                         = 0;
    virtual const char *name() const                                         = 0;

    Bytes compute(const Bytes &data) const { return compute(data.data(), data.size()); }
};

// libsodium crypto_hash_sha256
class Sha256Fingerprinter : public Fingerprinter
{
  public:
    using Fingerprinter::compute;

    Bytes       compute(const std::uint8_t *data, std::size_t len) const override;
    std::size_t size() const override { return SHA256_SIZE; }
    const char *name() const override { return "sha256"; }
};

// libsodium crypto_generichash (BLAKE2b-256, unkeyed)
class Blake2bFingerprinter : public Fingerprinter
{
  public:
    using Fingerprinter::compute;

    Bytes       compute(const std::uint8_t *data, std::size_t len) const override;
    std::size_t size() const override { return BLAKE2B_SIZE; }
    const char *name() const override { return "blake2b"; }
};

// Short digest used to recognise a chunk payload that was already assembled.
std::array<std::uint8_t, CHUNK_TAG_SIZE> chunk_tag(const std::uint8_t *data, std::size_t len);

// Lowercase hex, the only encoding used for fingerprints outside the process.
std::string          to_hex(const Bytes &b);
std::optional<Bytes> from_hex(std::string_view hex);

std::string          to_base64(const std::uint8_t *data, std::size_t len);
std::optional<Bytes> from_base64(std::string_view b64);

bool ensure_sodium_init();

}  // namespace crypto
