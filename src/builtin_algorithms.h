#pragma once

#include "algorithm.h"
#include "util/hash.h"

namespace httpsig {

// Algorithms implemented with libgcrypt.

static const std::string hmac_sha256_name = "hmac-sha256";
static const std::string hmac_sha512_name = "hmac-sha512";
static const std::string rsa_sha256_name = "rsa-sha256";
static const std::string rsa_sha512_name = "rsa-sha512";
static const std::string ed25519_name = "ed25519";

class HmacProvider : public MacProvider {
public:
    explicit HmacProvider(util::hash_algorithm ha) : _hash(ha) {}

    std::string name() const override;
    std::string sign(boost::string_view data, const Secret&) const override;

private:
    util::hash_algorithm _hash;
};

// PKCS#1 v1.5 signatures over the digest of the data.
class RsaSigner : public AsymmetricSigner {
public:
    explicit RsaSigner(util::hash_algorithm ha) : _hash(ha) {}

    std::string name() const override;

    std::string sign( const PrivateKey&
                    , boost::string_view data
                    , sys::error_code&) const override;

    sys::error_code verify( const PublicKey&
                          , boost::string_view data
                          , boost::string_view signature) const override;

private:
    util::hash_algorithm _hash;
};

// Pure EdDSA over the data itself.
class Ed25519Signer : public AsymmetricSigner {
public:
    std::string name() const override { return ed25519_name; }

    std::string sign( const PrivateKey&
                    , boost::string_view data
                    , sys::error_code&) const override;

    sys::error_code verify( const PublicKey&
                          , boost::string_view data
                          , boost::string_view signature) const override;
};

} // httpsig namespace
