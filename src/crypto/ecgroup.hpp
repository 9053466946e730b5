#ifndef GRPSIG_ECGROUP_HPP
#define GRPSIG_ECGROUP_HPP

#include <mcl/bn.hpp>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace ecgroup {

    // Define a byte vector type for clarity
    using Bytes = std::vector<uint8_t>;

    // Serialized sizes for BLS12-381 (G1/G2 compressed)
    constexpr size_t FR_SERIALIZED_SIZE = 32;
    constexpr size_t G1_SERIALIZED_SIZE = 48;
    constexpr size_t G2_SERIALIZED_SIZE = 96;
    constexpr size_t GT_SERIALIZED_SIZE = 576;

    /** Thrown when serialized input cannot be turned back into an element. */
    class DecodeError : public std::runtime_error {
    public:
        explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {}
    };

    class G1Point;
    class G2Point;
    class PairingResult;
    class Scalar;

    /**
     * Initialise the pairing backend on BLS12-381, fix the generators and
     * enable subgroup checks on deserialization. Safe to call repeatedly and
     * from several threads; only the first call does any work.
     */
    void init_pairing();

    class Scalar {
    public:
        Scalar();
        Scalar(const mcl::bn::Fr& v): value(v) {};

        void set_random();
        static Scalar get_random();
        static Scalar from_int(int64_t v);
        Scalar inverse() const;
        Scalar negate() const;
        bool is_zero() const;
        static Scalar add(const Scalar& a, const Scalar& b);
        static Scalar sub(const Scalar& a, const Scalar& b);
        static Scalar mul(const Scalar& a, const Scalar& b);
        static Scalar neg(const Scalar& s);

        std::string to_string() const;
        Bytes to_bytes() const;

        static Scalar hash_to_scalar(const std::string& message);
        static Scalar hash_to_scalar(const Bytes& data);
        static Scalar from_string(const std::string& s);
        static Scalar from_bytes(const Bytes& b);

        bool operator==(const Scalar& other) const;
        bool operator!=(const Scalar& other) const { return !(*this == other); }
        Scalar operator+(const Scalar& other) const;
        Scalar operator-(const Scalar& other) const;
        Scalar operator*(const Scalar& other) const;
        Scalar operator-() const;

        const mcl::bn::Fr& get_underlying() const;
        mcl::bn::Fr& get_underlying();

    private:
        mcl::bn::Fr value;
    };

    class G1Point {
    public:
        G1Point();

        std::string to_string() const;
        Bytes to_bytes() const;

        static G1Point get_generator();
        static G1Point get_random();
        static G1Point hash_and_map_to(const std::string& message);
        static G1Point hash_and_map_to(const Bytes& data);
        static G1Point mul(const G1Point& p, const Scalar& s);
        /** Σ s_i·p_i. Both vectors must have the same length. */
        static G1Point mul_sum(const std::vector<G1Point>& points,
                               const std::vector<Scalar>& scalars);
        static G1Point from_string(const std::string& s);
        static G1Point from_bytes(const Bytes& b);
        G1Point add(const G1Point& other) const;
        G1Point sub(const G1Point& other) const;
        G1Point negate() const;
        bool is_zero() const;

        bool operator==(const G1Point& other) const;
        bool operator!=(const G1Point& other) const { return !(*this == other); }
        G1Point operator+(const G1Point& other) const { return add(other); }
        G1Point operator-(const G1Point& other) const { return sub(other); }
        G1Point operator*(const Scalar& s) const { return mul(*this, s); }

        const mcl::bn::G1& get_underlying() const;

    private:
        mcl::bn::G1 value;
    };

    class G2Point {
    public:
        G2Point();

        std::string to_string() const;
        Bytes to_bytes() const;

        static G2Point get_random();
        static G2Point get_generator();
        static G2Point hash_and_map_to(const std::string& message);
        static G2Point mul(const G2Point& p, const Scalar& s);
        static G2Point from_string(const std::string& s);
        static G2Point from_bytes(const Bytes& b);
        G2Point add(const G2Point& other) const;
        G2Point sub(const G2Point& other) const;
        G2Point negate() const;
        bool is_zero() const;

        bool operator==(const G2Point& other) const;
        bool operator!=(const G2Point& other) const { return !(*this == other); }
        G2Point operator+(const G2Point& other) const { return add(other); }
        G2Point operator*(const Scalar& s) const { return mul(*this, s); }

        const mcl::bn::G2& get_underlying() const;

    private:
        mcl::bn::G2 value;
    };

    class PairingResult {
    public:
        PairingResult();
        explicit PairingResult(const mcl::bn::Fp12& v);

        bool operator==(const PairingResult& other) const;
        bool operator!=(const PairingResult& other) const { return !(*this == other); }
        const mcl::bn::Fp12& get_underlying() const;

        Bytes to_bytes() const;
        static PairingResult from_bytes(const Bytes& b);
        bool is_one() const;

        // Exponentiation and multiplication
        PairingResult pow(const Scalar& s) const;
        static PairingResult mul(const PairingResult& a, const PairingResult& b);
        PairingResult operator*(const PairingResult& other) const;
        /** Π b_i^{e_i}. Both vectors must have the same length. */
        static PairingResult pow_prod(const std::vector<PairingResult>& bases,
                                      const std::vector<Scalar>& exps);

        // Division
        static PairingResult div(const PairingResult& a, const PairingResult& b);
        PairingResult operator/(const PairingResult& other) const;
        PairingResult inverse() const;

    private:
        mcl::bn::Fp12 value;
    };

    PairingResult pairing(const G1Point& p, const G2Point& q);

} // namespace ecgroup

#endif // GRPSIG_ECGROUP_HPP
