#ifndef GRPSIG_HELPERS_HPP
#define GRPSIG_HELPERS_HPP

#include "crypto/ecgroup.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <initializer_list>
#include <vector>

namespace grpsig {
namespace utils {

    // Hex helpers
    std::string bytes_to_hex(const ecgroup::Bytes& bytes);
    ecgroup::Bytes hex_to_bytes(const std::string& hex);

    // Base64 (standard alphabet, padded). Decoding throws ecgroup::DecodeError.
    std::string    to_base64(const ecgroup::Bytes& bytes);
    ecgroup::Bytes from_base64(const std::string& b64);

    // Generic serialization primitives
    ecgroup::Bytes to_bytes(const std::string& s);

    void        append_u32_be(ecgroup::Bytes& out, uint32_t v);
    uint32_t    read_u32_be(const ecgroup::Bytes& in, std::size_t& off);

    void            append_lp(ecgroup::Bytes& out, const ecgroup::Bytes& b);
    ecgroup::Bytes  read_lp(const ecgroup::Bytes& in, std::size_t& off);

    // Fixed-width field readers for the raw key/signature layouts
    void            append_raw(ecgroup::Bytes& out, const ecgroup::Bytes& b);
    ecgroup::Bytes  read_raw(const ecgroup::Bytes& in, std::size_t& off, std::size_t n);

    // Strings as LP
    std::string read_string(const ecgroup::Bytes& in, std::size_t& off);

    // Hash utilities (SHA-256)
    ecgroup::Bytes hash_all(std::initializer_list<ecgroup::Bytes> inputs);
    ecgroup::Bytes hash_all(const std::vector<ecgroup::Bytes>& inputs);

    // CSPRNG bytes
    ecgroup::Bytes random_bytes(std::size_t len);

} // namespace utils
} // namespace grpsig

#endif // GRPSIG_HELPERS_HPP
