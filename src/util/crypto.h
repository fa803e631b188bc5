#pragma once

#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>
#include <array>
#include <string>

#include "hash.h"

/*
 * Forward declarations for opaque libgcrypt data structures.
 */
struct gcry_sexp;
typedef gcry_sexp* gcry_sexp_t;

namespace httpsig {
namespace util {

// Must be called once before any key is used.
void crypto_init();

// Compare two byte strings in time independent of their contents.
// Strings of different sizes are never equal.
bool constant_time_equal(boost::string_view, boost::string_view);

class Ed25519PublicKey {
    public:
    static const size_t key_size = 32;
    static const size_t sig_size = 64;
    using key_array_t = std::array<uint8_t, key_size>;
    using sig_array_t = std::array<uint8_t, sig_size>;

    Ed25519PublicKey(key_array_t key = {});
    ~Ed25519PublicKey();

    Ed25519PublicKey(const Ed25519PublicKey& other);
    Ed25519PublicKey(Ed25519PublicKey&& other);
    Ed25519PublicKey& operator=(const Ed25519PublicKey& other);
    Ed25519PublicKey& operator=(Ed25519PublicKey&& other);

    key_array_t serialize() const;

    bool verify(boost::string_view data, const sig_array_t& signature) const;

    static
    boost::optional<Ed25519PublicKey> from_hex(boost::string_view);

    private:
    ::gcry_sexp_t _public_key;
};

class Ed25519PrivateKey {
    public:
    static const size_t key_size = 32;
    static const size_t sig_size = Ed25519PublicKey::sig_size;
    using key_array_t = std::array<uint8_t, key_size>;
    using sig_array_t = Ed25519PublicKey::sig_array_t;

    Ed25519PrivateKey(key_array_t key = {});
    ~Ed25519PrivateKey();

    Ed25519PrivateKey(const Ed25519PrivateKey& other);
    Ed25519PrivateKey(Ed25519PrivateKey&& other);
    Ed25519PrivateKey& operator=(const Ed25519PrivateKey& other);
    Ed25519PrivateKey& operator=(Ed25519PrivateKey&& other);

    key_array_t serialize() const;
    Ed25519PublicKey public_key() const;

    static Ed25519PrivateKey generate();

    sig_array_t sign(boost::string_view data) const;

    static
    boost::optional<Ed25519PrivateKey> from_hex(boost::string_view);

    private:
    ::gcry_sexp_t _private_key;
};

// RSA keys are (de)serialized as canonical libgcrypt S-expressions,
// i.e. `(public-key (rsa (n ...) (e ...)))`
// and `(private-key (rsa (n ...) (e ...) (d ...) ...))`.
class RsaPublicKey {
    public:
    ~RsaPublicKey();

    RsaPublicKey(const RsaPublicKey& other);
    RsaPublicKey(RsaPublicKey&& other);
    RsaPublicKey& operator=(const RsaPublicKey& other);
    RsaPublicKey& operator=(RsaPublicKey&& other);

    std::string serialize() const;

    // Size of the modulus (and thus of signatures) in bytes.
    size_t size() const;

    // PKCS#1 v1.5 over the digest of `data`.
    bool verify(hash_algorithm, boost::string_view data, boost::string_view signature) const;

    static
    boost::optional<RsaPublicKey> parse(boost::string_view);

    private:
    friend class RsaPrivateKey;
    explicit RsaPublicKey(::gcry_sexp_t);  // takes ownership

    ::gcry_sexp_t _public_key;
};

class RsaPrivateKey {
    public:
    ~RsaPrivateKey();

    RsaPrivateKey(const RsaPrivateKey& other);
    RsaPrivateKey(RsaPrivateKey&& other);
    RsaPrivateKey& operator=(const RsaPrivateKey& other);
    RsaPrivateKey& operator=(RsaPrivateKey&& other);

    std::string serialize() const;
    RsaPublicKey public_key() const;

    static RsaPrivateKey generate(unsigned int bits = 2048);

    // PKCS#1 v1.5 over the digest of `data`,
    // left-padded with zeros to the size of the modulus.
    std::string sign(hash_algorithm, boost::string_view data) const;

    static
    boost::optional<RsaPrivateKey> parse(boost::string_view);

    private:
    explicit RsaPrivateKey(::gcry_sexp_t);  // takes ownership

    ::gcry_sexp_t _private_key;
};

std::ostream& operator<<(std::ostream&, const Ed25519PublicKey&);
std::ostream& operator<<(std::ostream&, const Ed25519PrivateKey&);

} // util namespace
} // httpsig namespace
