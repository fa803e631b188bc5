#define BOOST_TEST_MODULE algorithm
#include <boost/test/included/unit_test.hpp>

#include <memory>
#include <string>

#include <algorithm.h>
#include <builtin_algorithms.h>
#include <error.h>
#include <util/bytes.h>
#include <util/crypto.h>

#include <namespaces.h>

BOOST_AUTO_TEST_SUITE(httpsig_algorithm)

using namespace std;
using namespace httpsig;

struct TestGlobalFixture {
    void setup() {
        util::crypto_init();
    }
};
BOOST_TEST_GLOBAL_FIXTURE(TestGlobalFixture);

// Computes a "MAC" by appending the secret to the data.
struct ConcatMac : public MacProvider {
    string name() const override { return "Concat"; }
    string sign(boost::string_view data, const Secret& secret) const override {
        return data.to_string() + secret;
    }
};

// Also registered as a MAC, but should be found first.
struct ConcatSigner : public AsymmetricSigner {
    string name() const override { return "concat"; }
    string sign(const PrivateKey&, boost::string_view data, sys::error_code&) const override {
        return data.to_string();
    }
    sys::error_code verify(const PublicKey&, boost::string_view data, boost::string_view sig) const override {
        if (data != sig) return HttpSigErrc::verification_failure;
        return {};
    }
};

BOOST_AUTO_TEST_CASE(test_builtin) {
    const auto& reg = AlgorithmRegistry::builtin();

    for (auto name : {"hmac-sha256", "hmac-sha512"}) {
        auto mac = reg.resolve_mac(name);
        BOOST_REQUIRE(mac);
        BOOST_CHECK_EQUAL(mac->name(), name);
        BOOST_CHECK(!reg.resolve_signer(name));
    }

    for (auto name : {"rsa-sha256", "rsa-sha512", "ed25519"}) {
        auto signer = reg.resolve_signer(name);
        BOOST_REQUIRE(signer);
        BOOST_CHECK_EQUAL(signer->name(), name);
        BOOST_CHECK(!reg.resolve_mac(name));
    }
}

BOOST_AUTO_TEST_CASE(test_resolve) {
    const auto& reg = AlgorithmRegistry::builtin();
    sys::error_code ec;

    auto binding = reg.resolve("HMAC-SHA256", ec);
    BOOST_REQUIRE(!ec);
    BOOST_REQUIRE(binding);
    BOOST_CHECK_EQUAL(binding_name(*binding), "hmac-sha256");
    BOOST_CHECK(boost::get<shared_ptr<const MacProvider>>(&*binding));

    binding = reg.resolve("Ed25519", ec);
    BOOST_REQUIRE(binding);
    BOOST_CHECK_EQUAL(binding_name(*binding), "ed25519");
    BOOST_CHECK(boost::get<shared_ptr<const AsymmetricSigner>>(&*binding));

    binding = reg.resolve("hs2019", ec);
    BOOST_CHECK(!binding);
    BOOST_CHECK(ec == HttpSigErrc::unknown_algorithm);
}

BOOST_AUTO_TEST_CASE(test_custom_registry) {
    AlgorithmRegistry reg;
    reg.add(make_shared<const ConcatMac>());

    sys::error_code ec;
    auto binding = reg.resolve("concat", ec);
    BOOST_REQUIRE(binding);
    BOOST_CHECK(boost::get<shared_ptr<const MacProvider>>(&*binding));
    BOOST_CHECK(!reg.resolve("hmac-sha256", ec));

    // Asymmetric signers take precedence.
    reg.add(make_shared<const ConcatSigner>());
    binding = reg.resolve("CONCAT", ec);
    BOOST_REQUIRE(binding);
    BOOST_CHECK(boost::get<shared_ptr<const AsymmetricSigner>>(&*binding));
    BOOST_CHECK(reg.resolve_mac("Concat"));
}

BOOST_AUTO_TEST_CASE(test_mac_default_verify) {
    ConcatMac mac;
    BOOST_CHECK(mac.verify("data", "datakey", "key"));
    BOOST_CHECK(!mac.verify("data", "datakez", "key"));
    BOOST_CHECK(!mac.verify("data", "datakey ", "key"));
}

BOOST_AUTO_TEST_CASE(test_hmac_provider) {
    HmacProvider mac(util::hash_algorithm::sha256);
    auto code = mac.sign("what do ya want for nothing?", "Jefe");
    BOOST_CHECK_EQUAL( util::bytes::to_hex(code)
                     , "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    BOOST_CHECK(mac.verify("what do ya want for nothing?", code, "Jefe"));
    BOOST_CHECK(!mac.verify("what do ya want for nothing?", code, "Jeff"));
}

BOOST_AUTO_TEST_CASE(test_key_type_mismatch) {
    Ed25519Signer ed;
    RsaSigner rsa(util::hash_algorithm::sha256);
    sys::error_code ec;

    auto sig = ed.sign(Secret("secret"), "data", ec);
    BOOST_CHECK(ec == HttpSigErrc::key_type_mismatch);
    BOOST_CHECK(sig.empty());

    ec = {};
    auto edsk = util::Ed25519PrivateKey::generate();
    sig = rsa.sign(edsk, "data", ec);
    BOOST_CHECK(ec == HttpSigErrc::key_type_mismatch);

    BOOST_CHECK(ed.verify(Secret("secret"), "data", "sig") == HttpSigErrc::key_type_mismatch);
    BOOST_CHECK(rsa.verify(edsk.public_key(), "data", "sig") == HttpSigErrc::key_type_mismatch);
}

BOOST_AUTO_TEST_CASE(test_ed25519_signer) {
    Ed25519Signer ed;
    auto sk = util::Ed25519PrivateKey::generate();
    sys::error_code ec;

    auto sig = ed.sign(sk, "data", ec);
    BOOST_REQUIRE(!ec);
    BOOST_CHECK_EQUAL(sig.size(), size_t(util::Ed25519PrivateKey::sig_size));
    BOOST_CHECK(!ed.verify(sk.public_key(), "data", sig));
    BOOST_CHECK(ed.verify(sk.public_key(), "datum", sig) == HttpSigErrc::verification_failure);
    // Wrong length.
    BOOST_CHECK(ed.verify(sk.public_key(), "data", sig.substr(1)) == HttpSigErrc::verification_failure);
}

BOOST_AUTO_TEST_SUITE_END()
