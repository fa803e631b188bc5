#include "builtin_algorithms.h"

#include "error.h"
#include "util/bytes.h"
#include "util/variant.h"

namespace httpsig {

std::string HmacProvider::name() const
{
    switch (_hash) {
        case util::hash_algorithm::sha256: return hmac_sha256_name;
        case util::hash_algorithm::sha512: return hmac_sha512_name;
    }
    return {};
}

std::string HmacProvider::sign(boost::string_view data, const Secret& secret) const
{
    return util::hmac(_hash, secret, data);
}

std::string RsaSigner::name() const
{
    switch (_hash) {
        case util::hash_algorithm::sha256: return rsa_sha256_name;
        case util::hash_algorithm::sha512: return rsa_sha512_name;
    }
    return {};
}

std::string
RsaSigner::sign( const PrivateKey& key
               , boost::string_view data
               , sys::error_code& ec) const
{
    auto sk = boost::get<util::RsaPrivateKey>(&key);
    if (!sk) {
        ec = HttpSigErrc::key_type_mismatch;
        return {};
    }
    return sk->sign(_hash, data);
}

sys::error_code
RsaSigner::verify( const PublicKey& key
                 , boost::string_view data
                 , boost::string_view signature) const
{
    auto pk = boost::get<util::RsaPublicKey>(&key);
    if (!pk) return HttpSigErrc::key_type_mismatch;

    if (!pk->verify(_hash, data, signature))
        return HttpSigErrc::verification_failure;
    return {};
}

std::string
Ed25519Signer::sign( const PrivateKey& key
                   , boost::string_view data
                   , sys::error_code& ec) const
{
    auto sk = boost::get<util::Ed25519PrivateKey>(&key);
    if (!sk) {
        ec = HttpSigErrc::key_type_mismatch;
        return {};
    }
    return util::bytes::to_string(sk->sign(data));
}

sys::error_code
Ed25519Signer::verify( const PublicKey& key
                     , boost::string_view data
                     , boost::string_view signature) const
{
    auto pk = boost::get<util::Ed25519PublicKey>(&key);
    if (!pk) return HttpSigErrc::key_type_mismatch;

    if (signature.size() != util::Ed25519PublicKey::sig_size)
        return HttpSigErrc::verification_failure;

    auto sig = util::bytes::to_array<uint8_t, util::Ed25519PublicKey::sig_size>(signature);
    if (!pk->verify(data, sig))
        return HttpSigErrc::verification_failure;
    return {};
}

const AlgorithmRegistry& AlgorithmRegistry::builtin()
{
    static const AlgorithmRegistry registry = [] {
        using util::hash_algorithm;

        AlgorithmRegistry r;
        r.add(std::make_shared<const HmacProvider>(hash_algorithm::sha256));
        r.add(std::make_shared<const HmacProvider>(hash_algorithm::sha512));
        r.add(std::make_shared<const RsaSigner>(hash_algorithm::sha256));
        r.add(std::make_shared<const RsaSigner>(hash_algorithm::sha512));
        r.add(std::make_shared<const Ed25519Signer>());
        return r;
    }();
    return registry;
}

} // httpsig namespace
