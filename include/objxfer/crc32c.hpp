#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace objxfer {

/// Anything that can report a CRC32C in its base64 wire form.
class Crc32cValidator {
public:
    virtual ~Crc32cValidator() = default;

    virtual void update(std::span<const uint8_t> data) = 0;

    /// Base64 encoding of the 4-byte big-endian checksum.
    virtual std::string to_string() const = 0;
};

/// Streaming CRC32C (Castagnoli) accumulator.
///
/// The register is kept as an unsigned 32-bit value; value() exposes the
/// signed two's-complement interpretation used on the wire, so negative
/// results are normal. Checksums of two adjacent ranges can be merged with
/// combine() without re-reading the first range.
class Crc32c : public Crc32cValidator {
public:
    Crc32c() = default;
    explicit Crc32c(int32_t initial_value)
        : crc_(static_cast<uint32_t>(initial_value)) {}

    void update(std::span<const uint8_t> data) override;
    void update(std::string_view data);

    std::array<uint8_t, 4> to_buffer() const;
    std::string to_string() const override;
    int32_t value() const { return static_cast<int32_t>(crc_); }

    /// True iff the other representation encodes exactly this checksum.
    bool validate(int32_t other) const;
    bool validate(std::string_view base64) const;
    bool validate(std::span<const uint8_t> buffer) const;
    bool validate(const Crc32cValidator& other) const;

    /// Build an independent accumulator seeded to an existing checksum.
    /// Throws std::range_error (reporting the received size) unless the
    /// source holds exactly 4 bytes or exactly one 32-bit element.
    static Crc32c from(std::span<const uint8_t> bytes);
    static Crc32c from(std::span<const int32_t> words);
    static Crc32c from(std::string_view base64);
    static Crc32c from(int64_t value);
    static Crc32c from(const Crc32cValidator& other);

    /// Checksum an entire file.
    static Crc32c from_file(const std::filesystem::path& path);

    /// CRC of A||B given CRC(A), CRC(B) and len(B).
    static Crc32c combine(const Crc32c& first, const Crc32c& second, uint64_t second_length);

    /// 256-entry byte table for the reflected Castagnoli polynomial.
    static const std::array<uint32_t, 256>& extension_table();

private:
    uint32_t crc_ = 0;
};

}  // namespace objxfer
