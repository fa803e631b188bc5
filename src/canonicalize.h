#pragma once

#include <functional>
#include <string>
#include <vector>

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/system/error_code.hpp>

#include "namespaces.h"

namespace httpsig {

// Name of the pseudo-header covering the request line.
static const std::string request_target_hdr = "(request-target)";

// Yields the value of the `(request-target)` pseudo-header,
// or sets `ec` if it is not available for the signed message.
using RequestTarget = std::function<std::string(sys::error_code&)>;

// The lowercase method and the target of the request, e.g. `get /foo`.
// The returned function holds copies, not references to the head.
RequestTarget request_target(const http::request_header<>&);

// For responses: always fails with `HttpSigErrc::request_target_not_permitted`.
RequestTarget request_target_not_permitted();

// The list of headers to sign when none is given.
const std::vector<std::string>& default_headers();

// Build the signature string for the given headers (in that order), e.g.:
//
//     (request-target): get /foo
//     date: Tue, 07 Jun 2014 20:51:35 GMT
//
// Several occurrences of the same header are joined with `, `.
// An empty list of headers is treated as `date`.
// Sets `HttpSigErrc::missing_signed_header` if a listed header is not
// in `fields`; an empty header is fine.
std::string signature_string( const http::fields&
                            , const std::vector<std::string>& headers
                            , const RequestTarget&
                            , sys::error_code&);

} // httpsig namespace
