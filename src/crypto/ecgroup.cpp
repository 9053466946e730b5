#include "ecgroup.hpp"

#include <mutex>

namespace ecgroup {

    namespace {

        // Standard BLS12-381 generators (decimal, "1 x y" affine form)
        const char* const G1_GENERATOR =
            "1 3685416753713387016781088315183077757961620795782546409894578378688607592378376318836054947676345821548104185464507 "
            "1339506544944476473020471379941921221584933875938349620426543736416511423956333506472724655353366534992391756441569";
        const char* const G2_GENERATOR =
            "1 352701069587466618187139116011060144890029952792775240219908644239793785735715026873347600343865175952761926303160 "
            "3059144344244213709971259814753781636986470325476647558659373206291635324768958432433509563104347017837885763365758 "
            "1985150602287291935568054521177171638300868978215655730859378665066344726373823718423869104263333984641494340347905 "
            "927553665492332455747201965776037880757740193453592970025027978793976877002675564980949289727957565575433344219582";

        std::once_flag init_flag;
        mcl::bn::G1 g1_generator;
        mcl::bn::G2 g2_generator;

        template <typename T>
        void deserialize_exact(T& v, const Bytes& b, std::size_t expected, const char* what) {
            if (b.size() != expected) {
                throw DecodeError(std::string(what) + ": expected " + std::to_string(expected) +
                                  " bytes, got " + std::to_string(b.size()));
            }
            std::size_t n = v.deserialize(b.data(), b.size());
            if (n != expected) {
                throw DecodeError(std::string(what) + ": invalid encoding");
            }
        }

    } // namespace

    void init_pairing() {
        std::call_once(init_flag, []() {
            mcl::bn::initPairing(mcl::BLS12_381);
            mcl::bn::verifyOrderG1(true);
            mcl::bn::verifyOrderG2(true);
            g1_generator.setStr(G1_GENERATOR, 10);
            g2_generator.setStr(G2_GENERATOR, 10);
        });
    }

    // --- Scalar Implementation ---
    Scalar::Scalar() { value.clear(); }

    void Scalar::set_random() { value.setByCSPRNG(); }

    Scalar Scalar::get_random() {
        Scalar s;
        s.set_random();
        return s;
    }

    Scalar Scalar::from_int(int64_t v) {
        Scalar s;
        s.value = mcl::bn::Fr(v);
        return s;
    }

    Scalar Scalar::inverse() const {
        Scalar inv;
        mcl::bn::Fr::inv(inv.value, this->value);
        return inv;
    }

    Scalar Scalar::negate() const {
        Scalar result;
        mcl::bn::Fr::neg(result.value, this->value);
        return result;
    }

    bool Scalar::is_zero() const { return value.isZero(); }

    Scalar Scalar::add(const Scalar& a, const Scalar& b) {
        Scalar result;
        mcl::bn::Fr::add(result.value, a.value, b.value);
        return result;
    }

    Scalar Scalar::sub(const Scalar& a, const Scalar& b) {
        Scalar result;
        mcl::bn::Fr::sub(result.value, a.value, b.value);
        return result;
    }

    Scalar Scalar::mul(const Scalar& a, const Scalar& b) {
        Scalar result;
        mcl::bn::Fr::mul(result.value, a.get_underlying(), b.get_underlying());
        return result;
    }

    Scalar Scalar::neg(const Scalar& s) {
        Scalar result;
        mcl::bn::Fr::neg(result.value, s.get_underlying());
        return result;
    }

    std::string Scalar::to_string() const { return value.getStr(16); }
    Bytes Scalar::to_bytes() const {
        Bytes b(FR_SERIALIZED_SIZE);
        value.serialize(b.data(), b.size());
        return b;
    }
    Scalar Scalar::hash_to_scalar(const std::string& message) {
        Scalar s;
        s.value.setHashOf(message);
        return s;
    }
    Scalar Scalar::hash_to_scalar(const Bytes& data) {
        Scalar s;
        s.value.setHashOf(data.data(), data.size());
        return s;
    }
    Scalar Scalar::from_string(const std::string& s) {
        Scalar scalar;
        bool ok = false;
        scalar.value.setStr(&ok, s.c_str(), 16);
        if (!ok) throw DecodeError("Scalar::from_string: invalid hex");
        return scalar;
    }
    Scalar Scalar::from_bytes(const Bytes& b) {
        Scalar scalar;
        deserialize_exact(scalar.value, b, FR_SERIALIZED_SIZE, "Scalar::from_bytes");
        return scalar;
    }
    bool Scalar::operator==(const Scalar& other) const { return value == other.value; }

    Scalar Scalar::operator+(const Scalar& other) const {
        return Scalar::add(*this, other);
    }

    Scalar Scalar::operator-(const Scalar& other) const {
        return Scalar::sub(*this, other);
    }

    Scalar Scalar::operator*(const Scalar& other) const {
        return Scalar::mul(*this, other);
    }

    Scalar Scalar::operator-() const { return negate(); }

    const mcl::bn::Fr& Scalar::get_underlying() const { return value; }
    mcl::bn::Fr& Scalar::get_underlying() { return value; }

    // --- G1Point Implementation ---
    G1Point::G1Point() { value.clear(); }
    std::string G1Point::to_string() const { return value.getStr(16); }
    Bytes G1Point::to_bytes() const {
        Bytes b(G1_SERIALIZED_SIZE);
        value.serialize(b.data(), b.size());
        return b;
    }
    G1Point G1Point::get_generator() {
        init_pairing();
        G1Point g;
        g.value = g1_generator;
        return g;
    }
    G1Point G1Point::get_random() {
        Scalar s;
        s.set_random();
        return G1Point::mul(get_generator(), s);
    }
    G1Point G1Point::hash_and_map_to(const std::string& message) {
        G1Point p;
        mcl::bn::hashAndMapToG1(p.value, message.c_str(), message.length());
        return p;
    }
    G1Point G1Point::hash_and_map_to(const Bytes& data) {
        G1Point p;
        mcl::bn::hashAndMapToG1(p.value, data.data(), data.size());
        return p;
    }
    G1Point G1Point::mul(const G1Point& p, const Scalar& s) {
        G1Point result;
        mcl::bn::G1::mul(result.value, p.value, s.get_underlying());
        return result;
    }
    G1Point G1Point::mul_sum(const std::vector<G1Point>& points,
                             const std::vector<Scalar>& scalars) {
        if (points.size() != scalars.size()) {
            throw std::invalid_argument("G1Point::mul_sum: size mismatch");
        }
        G1Point acc;
        for (std::size_t i = 0; i < points.size(); ++i) {
            acc = acc.add(G1Point::mul(points[i], scalars[i]));
        }
        return acc;
    }
    G1Point G1Point::from_string(const std::string& s) {
        G1Point p;
        bool ok = false;
        p.value.setStr(&ok, s.c_str(), 16);
        if (!ok || !p.value.isValid()) throw DecodeError("G1Point::from_string: invalid point");
        return p;
    }
    G1Point G1Point::from_bytes(const Bytes& b) {
        G1Point p;
        deserialize_exact(p.value, b, G1_SERIALIZED_SIZE, "G1Point::from_bytes");
        if (!p.value.isValid()) throw DecodeError("G1Point::from_bytes: point not in G1");
        return p;
    }
    G1Point G1Point::add(const G1Point& other) const {
        G1Point result;
        mcl::bn::G1::add(result.value, this->value, other.value);
        return result;
    }
    G1Point G1Point::sub(const G1Point& other) const {
        G1Point result;
        mcl::bn::G1::sub(result.value, this->value, other.value);
        return result;
    }
    G1Point G1Point::negate() const {
        G1Point result;
        mcl::bn::G1::neg(result.value, this->value);
        return result;
    }
    bool G1Point::is_zero() const { return value.isZero(); }
    bool G1Point::operator==(const G1Point& other) const { return value == other.value; }
    const mcl::bn::G1& G1Point::get_underlying() const { return value; }

    // --- G2Point Implementation ---
    G2Point::G2Point() { value.clear(); }
    std::string G2Point::to_string() const { return value.getStr(16); }
    Bytes G2Point::to_bytes() const {
        Bytes b(G2_SERIALIZED_SIZE);
        value.serialize(b.data(), b.size());
        return b;
    }
    G2Point G2Point::get_random() {
        Scalar s;
        s.set_random();
        return G2Point::mul(get_generator(), s);
    }
    G2Point G2Point::get_generator() {
        init_pairing();
        G2Point g;
        g.value = g2_generator;
        return g;
    }
    G2Point G2Point::hash_and_map_to(const std::string& message) {
        G2Point p;
        mcl::bn::hashAndMapToG2(p.value, message.c_str(), message.length());
        return p;
    }
    G2Point G2Point::mul(const G2Point& p, const Scalar& s) {
        G2Point result;
        mcl::bn::G2::mul(result.value, p.value, s.get_underlying());
        return result;
    }
    G2Point G2Point::from_string(const std::string& s) {
        G2Point p;
        bool ok = false;
        p.value.setStr(&ok, s.c_str(), 16);
        if (!ok || !p.value.isValid()) throw DecodeError("G2Point::from_string: invalid point");
        return p;
    }
    G2Point G2Point::from_bytes(const Bytes& b) {
        G2Point p;
        deserialize_exact(p.value, b, G2_SERIALIZED_SIZE, "G2Point::from_bytes");
        if (!p.value.isValid()) throw DecodeError("G2Point::from_bytes: point not in G2");
        return p;
    }
    G2Point G2Point::add(const G2Point& other) const {
        G2Point result;
        mcl::bn::G2::add(result.value, this->value, other.value);
        return result;
    }
    G2Point G2Point::sub(const G2Point& other) const {
        G2Point result;
        mcl::bn::G2::sub(result.value, this->value, other.value);
        return result;
    }
    G2Point G2Point::negate() const {
        G2Point result;
        mcl::bn::G2::neg(result.value, this->value);
        return result;
    }
    bool G2Point::is_zero() const { return value.isZero(); }
    bool G2Point::operator==(const G2Point& other) const { return value == other.value; }
    const mcl::bn::G2& G2Point::get_underlying() const { return value; }

    // --- PairingResult Implementation ---
    PairingResult::PairingResult() {
        value.clear();
        value.a.a.a = 1;
    }
    PairingResult::PairingResult(const mcl::bn::Fp12& v) : value(v) {}
    bool PairingResult::operator==(const PairingResult& other) const { return value == other.value; }
    const mcl::bn::Fp12& PairingResult::get_underlying() const { return value; }

    bool PairingResult::is_one() const { return value.isOne(); }

    PairingResult PairingResult::pow(const Scalar& s) const {
        PairingResult result;
        mcl::bn::Fp12::pow(result.value, this->value, s.get_underlying());
        return result;
    }

    PairingResult PairingResult::mul(const PairingResult& a, const PairingResult& b) {
        PairingResult result;
        result.value = a.get_underlying() * b.get_underlying();
        return result;
    }

    PairingResult PairingResult::operator*(const PairingResult& other) const {
        return PairingResult::mul(*this, other);
    }

    PairingResult PairingResult::pow_prod(const std::vector<PairingResult>& bases,
                                          const std::vector<Scalar>& exps) {
        if (bases.size() != exps.size()) {
            throw std::invalid_argument("PairingResult::pow_prod: size mismatch");
        }
        PairingResult acc;
        for (std::size_t i = 0; i < bases.size(); ++i) {
            acc = acc * bases[i].pow(exps[i]);
        }
        return acc;
    }

    PairingResult PairingResult::div(const PairingResult& a, const PairingResult& b) {
        PairingResult result;
        // mcl::bn::Fp12 overloads the division operator
        result.value = a.get_underlying() / b.get_underlying();
        return result;
    }

    PairingResult PairingResult::operator/(const PairingResult& other) const {
        return PairingResult::div(*this, other);
    }

    PairingResult PairingResult::inverse() const {
        PairingResult result;
        mcl::bn::Fp12::inv(result.value, this->value);
        return result;
    }

    // --- Pairing Function Implementation ---
    PairingResult pairing(const G1Point& p, const G2Point& q) {
        mcl::bn::Fp12 e;
        mcl::bn::pairing(e, p.get_underlying(), q.get_underlying());
        return PairingResult(e);
    }

    Bytes PairingResult::to_bytes() const {
        Bytes b(GT_SERIALIZED_SIZE);
        value.serialize(b.data(), b.size());
        return b;
    }

    PairingResult PairingResult::from_bytes(const Bytes& b) {
        PairingResult r;
        deserialize_exact(r.value, b, GT_SERIALIZED_SIZE, "PairingResult::from_bytes");
        // GT is the order-r subgroup of Fp12*: require x != 0 and x^r == 1.
        mcl::bn::GT check;
        mcl::bn::GT::pow(check, r.value, mcl::bn::Fr::getOp().mp);
        if (r.value.isZero() || !check.isOne()) {
            throw DecodeError("PairingResult::from_bytes: element not in GT");
        }
        return r;
    }

} // namespace ecgroup
