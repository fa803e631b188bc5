#include "verifier.h"

#include "error.h"
#include "logger.h"
#include "util/base64.h"
#include "util/variant.h"

namespace httpsig {

Verifier::Verifier(const http::fields& fields, RequestTarget target, SignatureParams params)
    : _fields(&fields)
    , _target(std::move(target))
    , _params(std::move(params))
{}

boost::optional<Verifier>
Verifier::make(const http::fields& fields, RequestTarget target, sys::error_code& ec)
{
    ec = {};

    auto params = parse_signature_params(fields, ec);
    if (!params) return boost::none;

    return Verifier(fields, std::move(target), std::move(*params));
}

boost::optional<Verifier>
Verifier::make(const http::request_header<>& rqh, sys::error_code& ec)
{
    return make(rqh, request_target(rqh), ec);
}

boost::optional<Verifier>
Verifier::make(const http::response_header<>& rsh, sys::error_code& ec)
{
    return make(rsh, request_target_not_permitted(), ec);
}

void Verifier::verify( const PublicKey& pk
                     , boost::string_view algorithm
                     , const AlgorithmRegistry& registry
                     , sys::error_code& ec) const
{
    ec = {};

    auto binding = registry.resolve(algorithm, ec);
    if (!binding) return;

    auto sig_string = signature_string(*_fields, _params.headers, _target, ec);
    if (ec) return;

    auto signature = util::base64_decode(_params.signature);
    if (!signature) {
        LOG_WARN("Malformed HTTP signature: ", _params.signature);
        ec = HttpSigErrc::base64_decode_failure;
        return;
    }

    ec = util::apply(*binding
        , [&] (const std::shared_ptr<const AsymmetricSigner>& signer) {
              return signer->verify(pk, sig_string, *signature);
          }
        , [&] (const std::shared_ptr<const MacProvider>& mac) -> sys::error_code {
              auto secret = boost::get<Secret>(&pk);
              if (!secret) return HttpSigErrc::key_type_mismatch;
              if (!mac->verify(sig_string, *signature, *secret))
                  return HttpSigErrc::signature_mismatch;
              return {};
          });

    if (ec) {
        LOG_DEBUG("HTTP signature verification failed; keyId=", _params.key_id, ": ", ec);
        return;
    }

    LOG_DEBUG("HTTP signature verified; keyId=", _params.key_id);
}

} // httpsig namespace
