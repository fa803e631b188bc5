#include "signer.h"

#include "error.h"
#include "logger.h"
#include "util/base64.h"
#include "util/variant.h"

namespace httpsig {

Signer::Signer(AlgorithmBinding binding, std::vector<std::string> headers, Scheme scheme)
    : _binding(std::move(binding))
    , _headers(std::move(headers))
    , _scheme(scheme)
{}

boost::optional<Signer>
Signer::make( const std::vector<std::string>& preferences
            , std::vector<std::string> headers
            , Scheme scheme
            , const AlgorithmRegistry& registry
            , sys::error_code& ec)
{
    for (const auto& alg : preferences) {
        sys::error_code ec_;
        auto binding = registry.resolve(alg, ec_);
        if (!binding) continue;
        return Signer(std::move(*binding), std::move(headers), scheme);
    }

    LOG_WARN("None of the HTTP signature algorithms is supported");
    ec = HttpSigErrc::unknown_algorithm;
    return boost::none;
}

void Signer::sign( http::fields& fields
                 , const RequestTarget& target
                 , boost::string_view key_id
                 , const PrivateKey& key
                 , sys::error_code& ec) const
{
    ec = {};

    if (!is_valid_param_value(key_id)) {
        LOG_WARN("Refusing to sign with an invalid keyId");
        ec = HttpSigErrc::malformed_parameter;
        return;
    }

    auto sig_string = signature_string(fields, _headers, target, ec);
    if (ec) return;

    auto signature = util::apply(_binding
        , [&] (const std::shared_ptr<const AsymmetricSigner>& signer) {
              return signer->sign(key, sig_string, ec);
          }
        , [&] (const std::shared_ptr<const MacProvider>& mac) {
              auto secret = boost::get<Secret>(&key);
              if (!secret) {
                  ec = HttpSigErrc::key_type_mismatch;
                  return std::string();
              }
              return mac->sign(sig_string, *secret);
          });
    if (ec) {
        LOG_WARN("Failed to create HTTP signature with ", algorithm(), ": ", ec);
        return;
    }

    auto value = serialize_signature_params( key_id, algorithm(), _headers
                                           , util::base64_encode(signature));
    fields.insert(scheme_header(_scheme), value);

    LOG_DEBUG("Added HTTP signature; keyId=", key_id, " algorithm=", algorithm());
}

void Signer::sign_request( http::request_header<>& rqh
                         , boost::string_view key_id
                         , const PrivateKey& key
                         , sys::error_code& ec) const
{
    sign(rqh, request_target(rqh), key_id, key, ec);
}

void Signer::sign_response( http::response_header<>& rsh
                          , boost::string_view key_id
                          , const PrivateKey& key
                          , sys::error_code& ec) const
{
    sign(rsh, request_target_not_permitted(), key_id, key, ec);
}

void sign_request( http::request_header<>& rqh
                 , boost::string_view key_id
                 , const PrivateKey& key
                 , boost::string_view algorithm
                 , const std::vector<std::string>& headers
                 , Scheme scheme
                 , const AlgorithmRegistry& registry
                 , sys::error_code& ec)
{
    auto signer = Signer::make({algorithm.to_string()}, headers, scheme, registry, ec);
    if (!signer) return;
    signer->sign_request(rqh, key_id, key, ec);
}

void sign_response( http::response_header<>& rsh
                  , boost::string_view key_id
                  , const PrivateKey& key
                  , boost::string_view algorithm
                  , const std::vector<std::string>& headers
                  , Scheme scheme
                  , const AlgorithmRegistry& registry
                  , sys::error_code& ec)
{
    auto signer = Signer::make({algorithm.to_string()}, headers, scheme, registry, ec);
    if (!signer) return;
    signer->sign_response(rsh, key_id, key, ec);
}

} // httpsig namespace
