#pragma once

#include <string>

#include <boost/beast/http/message.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

#include "algorithm.h"
#include "canonicalize.h"
#include "keys.h"
#include "namespaces.h"
#include "signature_params.h"

namespace httpsig {

// Verifies the HTTP signature of a message head.
//
// The verifier refers to the given head, which must outlive it.
// Use `key_id()` to look up the key and algorithm, then call `verify`:
//
//     sys::error_code ec;
//     auto v = Verifier::make(rqh, ec);
//     if (!v) return ec;
//     auto key = lookup_key(v->key_id());
//     v->verify(key.public_key, key.algorithm, ec);
//
class Verifier {
public:
    // Fails if neither or both of `Signature` and `Authorization`
    // have signature parameters, or if these are malformed.
    static
    boost::optional<Verifier> make(const http::request_header<>&, sys::error_code&);

    // Verifying signatures which cover `(request-target)` will fail.
    static
    boost::optional<Verifier> make(const http::response_header<>&, sys::error_code&);

    const std::string& key_id() const { return _params.key_id; }
    const SignatureParams& params() const { return _params; }

    // The `algorithm` parameter in the signature is not considered,
    // the one given here is used instead.
    void verify( const PublicKey&
               , boost::string_view algorithm
               , const AlgorithmRegistry&
               , sys::error_code&) const;

    void verify( const PublicKey& pk
               , boost::string_view algorithm
               , sys::error_code& ec) const
    {
        verify(pk, algorithm, AlgorithmRegistry::builtin(), ec);
    }

private:
    Verifier(const http::fields&, RequestTarget, SignatureParams);

    static
    boost::optional<Verifier> make(const http::fields&, RequestTarget, sys::error_code&);

private:
    const http::fields* _fields;
    RequestTarget _target;
    SignatureParams _params;
};

} // httpsig namespace
