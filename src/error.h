#pragma once

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

// https://www.boost.org/doc/libs/1_71_0/libs/outcome/doc/html/motivation/plug_error_code2.html

namespace httpsig {

enum class HttpSigErrc {
    // Signature scheme selection.
    scheme_ambiguous = 1,
    scheme_missing,
    // Signature parameters.
    malformed_parameter,
    missing_parameter,
    // Algorithms and keys.
    unknown_algorithm,
    key_type_mismatch,
    // Signature string construction.
    missing_signed_header,
    request_target_not_permitted,
    // Verification.
    base64_decode_failure,
    signature_mismatch,
    verification_failure
};

const boost::system::error_category& httpsig_category();

boost::system::error_code make_error_code(HttpSigErrc);

} // httpsig namespace

namespace boost { namespace system {
    template<> struct is_error_code_enum<httpsig::HttpSigErrc>
    {
        BOOST_STATIC_CONSTANT(bool, value = true);
    };
}} // namespaces
