#include "objxfer/crc32c.hpp"
#include "objxfer/net/http.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace objxfer {

namespace {

// Reflected form of the Castagnoli polynomial 0x1EDC6F41
constexpr uint32_t CRC32C_POLYNOMIAL = 0x82F63B78;

constexpr std::array<uint32_t, 256> build_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1) ? (c >> 1) ^ CRC32C_POLYNOMIAL : c >> 1;
        }
        table[i] = c;
    }
    return table;
}

constexpr std::array<uint32_t, 256> CRC32C_TABLE = build_table();

// GF(2) matrix helpers for combine(), as in zlib's crc32_combine
uint32_t gf2_matrix_times(const uint32_t* mat, uint32_t vec) {
    uint32_t sum = 0;
    while (vec) {
        if (vec & 1) sum ^= *mat;
        vec >>= 1;
        ++mat;
    }
    return sum;
}

void gf2_matrix_square(uint32_t* square, const uint32_t* mat) {
    for (int n = 0; n < 32; ++n) {
        square[n] = gf2_matrix_times(mat, mat[n]);
    }
}

std::string invalid_length_message(size_t length) {
    return "CRC32C initializer must be exactly 4 bytes, received " +
           std::to_string(length);
}

}  // namespace

const std::array<uint32_t, 256>& Crc32c::extension_table() {
    return CRC32C_TABLE;
}

void Crc32c::update(std::span<const uint8_t> data) {
    uint32_t current = crc_ ^ 0xFFFFFFFFu;
    for (uint8_t byte : data) {
        current = CRC32C_TABLE[(current ^ byte) & 0xFF] ^ (current >> 8);
    }
    crc_ = current ^ 0xFFFFFFFFu;
}

void Crc32c::update(std::string_view data) {
    update(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

std::array<uint8_t, 4> Crc32c::to_buffer() const {
    return {
        static_cast<uint8_t>(crc_ >> 24),
        static_cast<uint8_t>(crc_ >> 16),
        static_cast<uint8_t>(crc_ >> 8),
        static_cast<uint8_t>(crc_),
    };
}

std::string Crc32c::to_string() const {
    auto buffer = to_buffer();
    return net::base64_encode(std::vector<uint8_t>(buffer.begin(), buffer.end()));
}

bool Crc32c::validate(int32_t other) const {
    return value() == other;
}

bool Crc32c::validate(std::string_view base64) const {
    return to_string() == base64;
}

bool Crc32c::validate(std::span<const uint8_t> buffer) const {
    auto mine = to_buffer();
    return buffer.size() == mine.size() &&
           std::equal(mine.begin(), mine.end(), buffer.begin());
}

bool Crc32c::validate(const Crc32cValidator& other) const {
    return to_string() == other.to_string();
}

Crc32c Crc32c::from(std::span<const uint8_t> bytes) {
    if (bytes.size() != 4) {
        throw std::range_error(invalid_length_message(bytes.size()));
    }
    uint32_t v = (static_cast<uint32_t>(bytes[0]) << 24) |
                 (static_cast<uint32_t>(bytes[1]) << 16) |
                 (static_cast<uint32_t>(bytes[2]) << 8) |
                 static_cast<uint32_t>(bytes[3]);
    return Crc32c(static_cast<int32_t>(v));
}

Crc32c Crc32c::from(std::span<const int32_t> words) {
    if (words.size() != 1) {
        throw std::range_error(invalid_length_message(words.size() * sizeof(int32_t)));
    }
    return Crc32c(words[0]);
}

Crc32c Crc32c::from(std::string_view base64) {
    auto decoded = net::base64_decode(std::string(base64));
    if (decoded.size() != 4) {
        throw std::range_error("CRC32C base64 initializer must decode to 4 bytes, received " +
                               std::to_string(decoded.size()));
    }
    return from(std::span<const uint8_t>(decoded));
}

Crc32c Crc32c::from(int64_t value) {
    if (value < std::numeric_limits<int32_t>::min() ||
        value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw std::range_error("CRC32C integer initializer must fit in 32 bits, received " +
                               std::to_string(value));
    }
    return Crc32c(static_cast<int32_t>(static_cast<uint32_t>(value)));
}

Crc32c Crc32c::from(const Crc32cValidator& other) {
    return from(std::string_view(other.to_string()));
}

Crc32c Crc32c::from_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Cannot open file for checksum: " + path.string());
    }

    Crc32c crc;
    std::vector<uint8_t> buffer(64 * 1024);
    while (ifs) {
        ifs.read(reinterpret_cast<char*>(buffer.data()),
                 static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<size_t>(ifs.gcount());
        if (got == 0) break;
        crc.update(std::span<const uint8_t>(buffer.data(), got));
    }
    if (ifs.bad()) {
        throw std::runtime_error("Read error while checksumming: " + path.string());
    }
    return crc;
}

Crc32c Crc32c::combine(const Crc32c& first, const Crc32c& second, uint64_t second_length) {
    if (second_length == 0) return first;

    uint32_t even[32];  // even-power-of-two zeros operator
    uint32_t odd[32];   // odd-power-of-two zeros operator

    // Operator for one zero bit
    odd[0] = CRC32C_POLYNOMIAL;
    uint32_t row = 1;
    for (int n = 1; n < 32; ++n) {
        odd[n] = row;
        row <<= 1;
    }

    gf2_matrix_square(even, odd);  // two zero bits
    gf2_matrix_square(odd, even);  // four zero bits

    // Apply len(B) zero bytes to CRC(A)
    uint32_t crc1 = first.crc_;
    uint64_t len = second_length;
    do {
        gf2_matrix_square(even, odd);
        if (len & 1) crc1 = gf2_matrix_times(even, crc1);
        len >>= 1;
        if (len == 0) break;

        gf2_matrix_square(odd, even);
        if (len & 1) crc1 = gf2_matrix_times(odd, crc1);
        len >>= 1;
    } while (len != 0);

    return Crc32c(static_cast<int32_t>(crc1 ^ second.crc_));
}

}  // namespace objxfer
