#include "helpers.hpp"
#include "crypto/ecgroup.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <sodium.h>

namespace grpsig {
namespace utils {

using ecgroup::Bytes;
using ecgroup::DecodeError;

std::string bytes_to_hex(const Bytes& bytes) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (const auto& byte : bytes) ss << std::setw(2) << static_cast<int>(byte);
    return ss.str();
}

Bytes hex_to_bytes(const std::string& hex) {
    if (hex.length() % 2 != 0) throw DecodeError("Hex string length must be even.");
    Bytes bytes(hex.length() / 2);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(),
                       nullptr, &bin_len, &end) != 0 ||
        bin_len != bytes.size() || end != hex.data() + hex.size()) {
        throw DecodeError("Invalid hex string.");
    }
    return bytes;
}

std::string to_base64(const Bytes& bytes) {
    const int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string out(sodium_base64_ENCODED_LEN(bytes.size(), variant), '\0');
    sodium_bin2base64(&out[0], out.size(), bytes.data(), bytes.size(), variant);
    out.resize(out.size() - 1); // drop the terminating NUL
    return out;
}

Bytes from_base64(const std::string& b64) {
    Bytes out(b64.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), b64.data(), b64.size(),
                          nullptr, &bin_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != b64.data() + b64.size()) {
        throw DecodeError("Invalid base64 string.");
    }
    out.resize(bin_len);
    return out;
}

Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

void append_u32_be(Bytes& out, uint32_t v) {
    out.push_back(uint8_t((v >> 24) & 0xFF));
    out.push_back(uint8_t((v >> 16) & 0xFF));
    out.push_back(uint8_t((v >>  8) & 0xFF));
    out.push_back(uint8_t((v >>  0) & 0xFF));
}

uint32_t read_u32_be(const Bytes& in, std::size_t& off) {
    if (off + 4 > in.size()) throw DecodeError("decode: truncated u32");
    uint32_t v = (uint32_t(in[off+0]) << 24) |
                 (uint32_t(in[off+1]) << 16) |
                 (uint32_t(in[off+2]) <<  8) |
                 (uint32_t(in[off+3]) <<  0);
    off += 4;
    return v;
}

void append_lp(Bytes& out, const Bytes& b) {
    append_u32_be(out, static_cast<uint32_t>(b.size()));
    out.insert(out.end(), b.begin(), b.end());
}

Bytes read_lp(const Bytes& in, std::size_t& off) {
    uint32_t n = read_u32_be(in, off);
    return read_raw(in, off, n);
}

void append_raw(Bytes& out, const Bytes& b) {
    out.insert(out.end(), b.begin(), b.end());
}

Bytes read_raw(const Bytes& in, std::size_t& off, std::size_t n) {
    if (off > in.size() || n > in.size() - off) throw DecodeError("decode: truncated field");
    Bytes out(in.begin() + off, in.begin() + off + n);
    off += n;
    return out;
}

std::string read_string(const Bytes& in, std::size_t& off) {
    Bytes b = read_lp(in, off);
    return std::string(b.begin(), b.end());
}

Bytes hash_all(std::initializer_list<Bytes> inputs) {
    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);

    for (const auto& input : inputs) {
        crypto_hash_sha256_update(&state, input.data(), input.size());
    }

    Bytes result(crypto_hash_sha256_BYTES);
    crypto_hash_sha256_final(&state, result.data());
    return result;
}

Bytes hash_all(const std::vector<Bytes>& inputs) {
    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);

    for (const auto& input : inputs) {
        crypto_hash_sha256_update(&state, input.data(), input.size());
    }

    Bytes result(crypto_hash_sha256_BYTES);
    crypto_hash_sha256_final(&state, result.data());
    return result;
}

Bytes random_bytes(std::size_t len) {
    Bytes out(len);
    randombytes_buf(out.data(), out.size());
    return out;
}

} // namespace utils
} // namespace grpsig
