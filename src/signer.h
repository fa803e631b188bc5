#pragma once

#include <string>
#include <vector>

#include <boost/beast/http/message.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

#include "algorithm.h"
#include "canonicalize.h"
#include "keys.h"
#include "namespaces.h"
#include "signature_params.h"

namespace httpsig {

// Signs message heads with a fixed algorithm, list of headers and scheme.
//
// Signing appends a new signature header to the head, e.g.:
//
//     GET /foo HTTP/1.1
//     Date: Tue, 07 Jun 2014 20:51:35 GMT
//     Signature: keyId="Test",algorithm="hmac-sha256",
//       headers="(request-target) date",
//       signature="IyeADZmTZ27HI2ZWMgQbfjklSBsZE6eZyB8JCJAzAHk="
//
// Existing headers (including other signatures) are left untouched,
// and so is the whole head if signing fails.
// A `key_id` with `"`, `,` or control characters is rejected
// with `HttpSigErrc::malformed_parameter`.
class Signer {
public:
    // Use the first algorithm in `preferences` known to the registry,
    // or set `HttpSigErrc::unknown_algorithm` if there is none.
    // An empty list of `headers` signs just `date`.
    static
    boost::optional<Signer> make( const std::vector<std::string>& preferences
                                , std::vector<std::string> headers
                                , Scheme
                                , const AlgorithmRegistry&
                                , sys::error_code&);

    static
    boost::optional<Signer> make( const std::vector<std::string>& preferences
                                , std::vector<std::string> headers
                                , Scheme scheme
                                , sys::error_code& ec)
    {
        return make( preferences, std::move(headers), scheme
                   , AlgorithmRegistry::builtin(), ec);
    }

    // Canonical name of the chosen algorithm.
    std::string algorithm() const { return binding_name(_binding); }
    const std::vector<std::string>& headers() const { return _headers; }
    Scheme scheme() const { return _scheme; }

    void sign_request( http::request_header<>&
                     , boost::string_view key_id
                     , const PrivateKey&
                     , sys::error_code&) const;

    // Signing `(request-target)` in a response fails
    // with `HttpSigErrc::request_target_not_permitted`.
    void sign_response( http::response_header<>&
                      , boost::string_view key_id
                      , const PrivateKey&
                      , sys::error_code&) const;

private:
    Signer(AlgorithmBinding, std::vector<std::string> headers, Scheme);

    void sign( http::fields&
             , const RequestTarget&
             , boost::string_view key_id
             , const PrivateKey&
             , sys::error_code&) const;

private:
    AlgorithmBinding _binding;
    std::vector<std::string> _headers;
    Scheme _scheme;
};

void sign_request( http::request_header<>&
                 , boost::string_view key_id
                 , const PrivateKey&
                 , boost::string_view algorithm
                 , const std::vector<std::string>& headers
                 , Scheme
                 , const AlgorithmRegistry&
                 , sys::error_code&);

void sign_response( http::response_header<>&
                  , boost::string_view key_id
                  , const PrivateKey&
                  , boost::string_view algorithm
                  , const std::vector<std::string>& headers
                  , Scheme
                  , const AlgorithmRegistry&
                  , sys::error_code&);

// Use the `Signature` header and built-in algorithms.

inline
void sign_request( http::request_header<>& rqh
                 , boost::string_view key_id
                 , const PrivateKey& key
                 , boost::string_view algorithm
                 , const std::vector<std::string>& headers
                 , sys::error_code& ec)
{
    sign_request( rqh, key_id, key, algorithm, headers
                , Scheme::signature, AlgorithmRegistry::builtin(), ec);
}

inline
void sign_response( http::response_header<>& rsh
                  , boost::string_view key_id
                  , const PrivateKey& key
                  , boost::string_view algorithm
                  , const std::vector<std::string>& headers
                  , sys::error_code& ec)
{
    sign_response( rsh, key_id, key, algorithm, headers
                 , Scheme::signature, AlgorithmRegistry::builtin(), ec);
}

} // httpsig namespace
