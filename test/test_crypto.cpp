#define BOOST_TEST_MODULE crypto
#include <boost/test/included/unit_test.hpp>

#include <string>

#include <util/base64.h>
#include <util/bytes.h>
#include <util/crypto.h>
#include <util/hash.h>
#include <util/str.h>

#include <namespaces.h>

BOOST_AUTO_TEST_SUITE(httpsig_crypto)

using namespace std;
using namespace httpsig;
using util::hash_algorithm;

struct TestGlobalFixture {
    void setup() {
        util::crypto_init();
    }
};
BOOST_TEST_GLOBAL_FIXTURE(TestGlobalFixture);

// Ed25519 key pair.
static const string b64sk = "MfWAV5YllPAPeMuLXwN2mUkV9YaSSJVUcj/2YOaFmwQ=";
static const string b64pk = "DlBwx8WbSsZP7eni20bf5VKUH3t1XAF/+hlDoLbZzuw=";

static util::Ed25519PrivateKey get_private_key() {
    auto ska = util::bytes::to_array<uint8_t, util::Ed25519PrivateKey::key_size>(*util::base64_decode(b64sk));
    return util::Ed25519PrivateKey(std::move(ska));
}

BOOST_AUTO_TEST_CASE(test_base64) {
    const string data("\x00\xff\x10hello", 8);
    BOOST_CHECK_EQUAL(util::base64_encode(data), "AP8QaGVsbG8=");
    BOOST_CHECK_EQUAL(util::base64_encode(string()), "");

    auto decoded = util::base64_decode("AP8QaGVsbG8=");
    BOOST_REQUIRE(decoded);
    BOOST_CHECK(*decoded == data);

    BOOST_CHECK_EQUAL(*util::base64_decode("aGk="), "hi");
    BOOST_CHECK_EQUAL(*util::base64_decode("aA=="), "h");
    BOOST_CHECK_EQUAL(*util::base64_decode(""), "");
}

BOOST_AUTO_TEST_CASE(test_base64_strict) {
    BOOST_CHECK(!util::base64_decode("aGk"));     // bad length
    BOOST_CHECK(!util::base64_decode("aGk=="));   // bad length
    BOOST_CHECK(!util::base64_decode("a==="));    // too much padding
    BOOST_CHECK(!util::base64_decode("aG=k"));    // padding inside
    BOOST_CHECK(!util::base64_decode("aG!k"));    // not in alphabet
    BOOST_CHECK(!util::base64_decode("aG-_"));    // URL-safe alphabet
    BOOST_CHECK(!util::base64_decode("aG k"));    // spaces
}

BOOST_AUTO_TEST_CASE(test_hmac) {
    // RFC 4231, test case 2.
    const string key = "Jefe";
    const string data = "what do ya want for nothing?";

    BOOST_CHECK_EQUAL( util::bytes::to_hex(util::hmac(hash_algorithm::sha256, key, data))
                     , "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    BOOST_CHECK_EQUAL( util::bytes::to_hex(util::hmac(hash_algorithm::sha512, key, data))
                     , "164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd6"
                       "10270cd7ea2505549758bf75c05a994a6d034f65f8f0e6fd"
                       "caeab1a34d4a6b4b636e070a38bce737");
}

BOOST_AUTO_TEST_CASE(test_digest) {
    BOOST_CHECK_EQUAL( util::base64_encode(util::digest(hash_algorithm::sha256, ""))
                     , "47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU=");
    BOOST_CHECK_EQUAL(util::digest(hash_algorithm::sha512, "abc").size(), 64u);
    BOOST_CHECK( util::bytes::to_string(util::SHA256::digest("foo", "bar"))
              == util::digest(hash_algorithm::sha256, "foobar"));
}

BOOST_AUTO_TEST_CASE(test_constant_time_equal) {
    BOOST_CHECK(util::constant_time_equal("", ""));
    BOOST_CHECK(util::constant_time_equal("abc", "abc"));
    BOOST_CHECK(!util::constant_time_equal("abc", "abd"));
    BOOST_CHECK(!util::constant_time_equal("abc", "abcd"));
    BOOST_CHECK(!util::constant_time_equal("abc", ""));
}

BOOST_AUTO_TEST_CASE(test_ed25519) {
    const auto sk = get_private_key();
    const auto pk = sk.public_key();
    BOOST_CHECK_EQUAL(util::base64_encode(pk.serialize()), b64pk);

    const string data = "date: Tue, 07 Jun 2014 20:51:35 GMT";
    auto sig = sk.sign(data);
    BOOST_CHECK(pk.verify(data, sig));
    BOOST_CHECK(!pk.verify(data + " ", sig));

    sig[0] ^= 0x01;
    BOOST_CHECK(!pk.verify(data, sig));

    auto other = util::Ed25519PrivateKey::generate();
    BOOST_CHECK(!other.public_key().verify(data, sk.sign(data)));
}

BOOST_AUTO_TEST_CASE(test_ed25519_hex) {
    const auto sk = get_private_key();
    auto hex = util::bytes::to_hex(sk.serialize());

    auto sk2 = util::Ed25519PrivateKey::from_hex(hex);
    BOOST_REQUIRE(sk2);
    BOOST_CHECK(sk2->serialize() == sk.serialize());
    BOOST_CHECK_EQUAL(util::str(*sk2), hex);

    BOOST_CHECK(!util::Ed25519PrivateKey::from_hex(hex.substr(2)));
    BOOST_CHECK(!util::Ed25519PublicKey::from_hex(string(64, 'x')));
}

BOOST_AUTO_TEST_CASE(test_rsa) {
    const auto sk = util::RsaPrivateKey::generate(1024);
    const auto pk = sk.public_key();
    BOOST_CHECK_EQUAL(pk.size(), 128u);

    const string data = "(request-target): post /foo";
    for (auto ha : {hash_algorithm::sha256, hash_algorithm::sha512}) {
        auto sig = sk.sign(ha, data);
        BOOST_CHECK_EQUAL(sig.size(), pk.size());
        BOOST_CHECK(pk.verify(ha, data, sig));
        BOOST_CHECK(!pk.verify(ha, data + "x", sig));
        BOOST_CHECK(!pk.verify(ha, data, sig.substr(1)));

        sig[sig.size() / 2] ^= 0x01;
        BOOST_CHECK(!pk.verify(ha, data, sig));
    }

    // Hash algorithms do not mix.
    auto sig = sk.sign(hash_algorithm::sha256, data);
    BOOST_CHECK(!pk.verify(hash_algorithm::sha512, data, sig));
}

BOOST_AUTO_TEST_CASE(test_rsa_serialize) {
    const auto sk = util::RsaPrivateKey::generate(1024);

    auto sk2 = util::RsaPrivateKey::parse(sk.serialize());
    BOOST_REQUIRE(sk2);
    auto pk2 = util::RsaPublicKey::parse(sk.public_key().serialize());
    BOOST_REQUIRE(pk2);

    const string data = "date: Tue, 07 Jun 2014 20:51:35 GMT";
    BOOST_CHECK(pk2->verify(hash_algorithm::sha256, data, sk2->sign(hash_algorithm::sha256, data)));

    // Copies are independent of the original.
    auto pk3 = *pk2;
    pk2 = boost::none;
    BOOST_CHECK(pk3.verify(hash_algorithm::sha256, data, sk.sign(hash_algorithm::sha256, data)));

    BOOST_CHECK(!util::RsaPrivateKey::parse("garbage"));
    BOOST_CHECK(!util::RsaPrivateKey::parse(sk.public_key().serialize()));
    BOOST_CHECK(!util::RsaPublicKey::parse(sk.serialize()));
}

BOOST_AUTO_TEST_SUITE_END()
