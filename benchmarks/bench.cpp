#include <iostream>
#include <chrono>
#include <vector>
#include <string>
#include <iomanip>
#include <functional>
#include <memory>
#include <stdexcept>

#include <sodium.h>

#include "crypto/ecgroup.hpp"
#include "groupsig/cpy06.hpp"
#include "groupsig/cpy06_join.hpp"
#include "groupsig/registry.hpp"
#include "logging.hpp"

using ecgroup::Bytes;

/**
 * @brief A simple class to run benchmarks and print formatted results.
 */
class BenchmarkRunner {
public:
    int num_iters;

    explicit BenchmarkRunner(int iterations) : num_iters(iterations) {}

    void run(const std::string& name, const std::function<void()>& func) {
        // Warm-up
        func();

        auto start = std::chrono::high_resolution_clock::now();
        for (int i = 0; i < num_iters; ++i) {
            func();
        }
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = end - start;

        std::cout << std::left << std::setw(34) << name
                  << ": " << std::fixed << std::setprecision(6)
                  << (elapsed.count() / num_iters) << " ms" << std::endl;
    }
};

static cpy06::MemberKey join_member(const cpy06::SetupResult& keys, grpsig::Registry& gml) {
    cpy06::ManagerJoinSession mgr(keys.grpkey, keys.mgrkey, gml);
    cpy06::MemberJoinSession mem(keys.grpkey);
    auto challenge  = mgr.start();
    auto commitment = mem.respond(challenge.value());
    auto credential = mgr.issue(commitment.value());
    return mem.finish(credential.value()).value();
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "libsodium init failed" << std::endl;
        return 1;
    }
    ecgroup::init_pairing();
    grpsig::logging::set_log_level("warn");

    BenchmarkRunner primitive_runner(1000); // fast ops
    BenchmarkRunner protocol_runner(50);    // slower ops

    // =====================================================================
    // SECTION 1: Low-Level Cryptographic Primitives
    // =====================================================================
    std::cout << "\n--- Low-Level Cryptographic Primitives (Avg over "
              << primitive_runner.num_iters << " iters) ---" << std::endl;

    ecgroup::Scalar s1 = ecgroup::Scalar::get_random();
    ecgroup::G1Point p1 = ecgroup::G1Point::get_random();
    primitive_runner.run("G1 Scalar Multiplication", [&]() {
        auto r = ecgroup::G1Point::mul(p1, s1);
        (void)r;
    });

    ecgroup::G2Point p2 = ecgroup::G2Point::get_random();
    primitive_runner.run("G2 Scalar Multiplication", [&]() {
        auto r = ecgroup::G2Point::mul(p2, s1);
        (void)r;
    });

    ecgroup::PairingResult pr = ecgroup::pairing(p1, p2);
    primitive_runner.run("GT Exponentiation", [&]() {
        auto r = pr.pow(s1);
        (void)r;
    });

    protocol_runner.run("Pairing", [&]() {
        auto r = ecgroup::pairing(p1, p2);
        (void)r;
    });

    // =====================================================================
    // SECTION 2: CPY06
    // =====================================================================
    std::cout << "\n--- CPY06 (Avg over " << protocol_runner.num_iters << " iters) ---" << std::endl;

    protocol_runner.run("Setup", [&]() {
        auto r = cpy06::setup();
        (void)r;
    });

    cpy06::SetupResult keys = cpy06::setup();
    grpsig::Registry gml(std::make_shared<grpsig::MemoryStore>());
    grpsig::Registry crl(std::make_shared<grpsig::MemoryStore>());

    protocol_runner.run("Join (both sides)", [&]() {
        auto r = join_member(keys, gml);
        (void)r;
    });

    cpy06::MemberKey memkey = join_member(keys, gml);
    Bytes msg(64, 0x42);

    protocol_runner.run("Sign", [&]() {
        auto r = cpy06::sign(keys.grpkey, memkey, msg);
        (void)r;
    });

    cpy06::Signature sig = cpy06::sign(keys.grpkey, memkey, msg);
    protocol_runner.run("Verify", [&]() {
        if (!cpy06::verify(keys.grpkey, sig, msg)) {
            throw std::runtime_error("benchmark signature did not verify");
        }
    });

    {
        Bytes sig_bytes = sig.to_bytes();
        std::cout << "Signature size: " << sig_bytes.size() << " bytes\n";
        primitive_runner.run("Signature Deserialize", [&]() {
            auto r = cpy06::Signature::from_bytes(sig_bytes);
            (void)r;
        });
    }

    cpy06::GroupManagerPartial gm = cpy06::open_group_manager(keys.mgrkey, sig);
    cpy06::RevocationManagerPartial rm = cpy06::open_revocation_manager(keys.revkey, sig, gm);
    protocol_runner.run("Open (both partials + lookup)", [&]() {
        auto g = cpy06::open_group_manager(keys.mgrkey, sig);
        auto r = cpy06::open_revocation_manager(keys.revkey, sig, g);
        auto id = cpy06::open_combine(sig, g, r, gml);
        (void)id;
    });

    std::cout << "GML size: " << gml.size() << " members\n";
    std::string id = cpy06::open_combine(sig, gm, rm, gml).value();
    protocol_runner.run("Trace (empty CRL)", [&]() {
        auto r = cpy06::trace(sig, crl);
        (void)r;
    });

    if (!cpy06::reveal(id, gml, crl).ok()) {
        std::cerr << "reveal failed" << std::endl;
        return 1;
    }
    protocol_runner.run("Trace (revoked signer)", [&]() {
        auto r = cpy06::trace(sig, crl);
        (void)r;
    });

    protocol_runner.run("Claim", [&]() {
        auto r = cpy06::claim(memkey, sig);
        (void)r;
    });

    cpy06::EqualityProof proof = cpy06::claim(memkey, sig).value();
    protocol_runner.run("Claim Verify", [&]() {
        auto r = cpy06::claim_verify(sig, proof);
        (void)r;
    });

    return 0;
}
