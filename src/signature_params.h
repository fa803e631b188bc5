#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include <boost/beast/http/fields.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>
#include <boost/utility/string_view.hpp>

#include "namespaces.h"

namespace httpsig {

// The header which carries the signature parameters.
enum class Scheme {
    signature,      // `Signature: keyId=...`
    authorization,  // `Authorization: keyId=...`
};

// `Signature` or `Authorization`.
const std::string& scheme_header(Scheme);

std::ostream& operator<<(std::ostream&, Scheme);

// Parameters of an HTTP signature, e.g.:
//
//     keyId="Test",algorithm="hmac-sha256",headers="(request-target) date",
//       signature="IyeADZmTZ27HI2ZWMgQbfjklSBsZE6eZyB8JCJAzAHk="
//
// The `algorithm` parameter is deprecated:
// it is kept here but verification does not rely on it.
struct SignatureParams {
    std::string key_id;
    std::string algorithm;
    std::vector<std::string> headers;
    std::string signature;  // base64-encoded

    // Parse the value of a signature header.
    // Missing or empty `headers` are taken as `date`.
    // Sets `HttpSigErrc::malformed_parameter` for items not in `key=value` form
    // and `HttpSigErrc::missing_parameter` if `keyId` or `signature` is empty.
    static
    boost::optional<SignatureParams> parse(boost::string_view, sys::error_code&);

    std::string serialize() const;
};

std::string serialize_signature_params( boost::string_view key_id
                                      , boost::string_view algorithm
                                      , const std::vector<std::string>& headers
                                      , boost::string_view signature);

// Whether the value can be written as a quoted parameter and read back
// unchanged: no `"`, `,` or control characters.
bool is_valid_param_value(boost::string_view);

// Whether the header value looks like it has signature parameters.
bool has_signature_params(boost::string_view);

// Choose the header value holding the signature parameters.
// Exactly one of them should have any;
// otherwise set `HttpSigErrc::scheme_ambiguous` or `HttpSigErrc::scheme_missing`.
boost::optional<Scheme>
select_scheme( const boost::optional<boost::string_view>& signature_value
             , const boost::optional<boost::string_view>& authorization_value
             , sys::error_code&);

// Select the scheme in `fields` (considering only the first
// `Signature` and `Authorization` headers) and parse its parameters.
boost::optional<SignatureParams>
parse_signature_params(const http::fields&, sys::error_code&);

} // httpsig namespace
