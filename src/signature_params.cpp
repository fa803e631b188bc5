#include "signature_params.h"

#include <ostream>
#include <tuple>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "canonicalize.h"
#include "error.h"
#include "logger.h"
#include "split_string.h"

namespace httpsig {

static const std::string signature_hdr = "Signature";
static const std::string authorization_hdr = "Authorization";

static const char* key_id_param = "keyId";
static const char* algorithm_param = "algorithm";
static const char* headers_param = "headers";
static const char* signature_param = "signature";

const std::string& scheme_header(Scheme s)
{
    switch (s) {
        case Scheme::signature: return signature_hdr;
        case Scheme::authorization: return authorization_hdr;
    }
    return signature_hdr;
}

std::ostream& operator<<(std::ostream& os, Scheme s)
{
    return os << scheme_header(s);
}

static
void trim_quotes(boost::string_view& v)
{
    while (!v.empty() && v.front() == '"') v.remove_prefix(1);
    while (!v.empty() && v.back() == '"') v.remove_suffix(1);
}

boost::optional<SignatureParams>
SignatureParams::parse(boost::string_view sig, sys::error_code& ec)
{
    SignatureParams sp;

    for (boost::string_view item : SplitString(sig, ',')) {
        beast::string_view key;
        boost::optional<beast::string_view> value;
        std::tie(key, value) = split_string_pair(item, '=');

        if (!value) {
            LOG_WARN("Malformed HTTP signature parameter: \"", item, "\"");
            ec = HttpSigErrc::malformed_parameter;
            return boost::none;
        }

        trim_quotes(*value);

        if (key == key_id_param) {sp.key_id = value->to_string(); continue;}
        if (key == algorithm_param) {sp.algorithm = value->to_string(); continue;}
        if (key == signature_param) {sp.signature = value->to_string(); continue;}
        if (key == headers_param) {
            sp.headers.clear();
            for (auto hn : SplitString(*value, ' '))
                if (!hn.empty()) sp.headers.push_back(hn.to_string());
            continue;
        }
        // Unknown parameters are ignored.
    }

    if (sp.key_id.empty() || sp.signature.empty()) {  // required
        LOG_WARN("HTTP signature contains empty key identifier or signature");
        ec = HttpSigErrc::missing_parameter;
        return boost::none;
    }

    if (sp.headers.empty()) sp.headers = default_headers();

    return {std::move(sp)};
}

std::string serialize_signature_params( boost::string_view key_id
                                      , boost::string_view algorithm
                                      , const std::vector<std::string>& headers_
                                      , boost::string_view signature)
{
    const auto& headers = headers_.empty() ? default_headers() : headers_;

    std::string hs;
    bool ins_sep = false;
    for (const auto& hn : headers) {
        if (ins_sep) hs += ' ';
        hs += boost::algorithm::to_lower_copy(hn);
        ins_sep = true;
    }

    return util::str( key_id_param, "=\"", key_id, "\","
                    , algorithm_param, "=\"", algorithm, "\","
                    , headers_param, "=\"", hs, "\","
                    , signature_param, "=\"", signature, "\"");
}

std::string SignatureParams::serialize() const
{
    return serialize_signature_params(key_id, algorithm, headers, signature);
}

bool is_valid_param_value(boost::string_view v)
{
    for (unsigned char c : v)
        if (c == '"' || c == ',' || c < 0x20 || c == 0x7f) return false;
    return true;
}

bool has_signature_params(boost::string_view v)
{
    return v.find(key_id_param) != boost::string_view::npos
        || v.find(headers_param) != boost::string_view::npos
        || v.find(signature_param) != boost::string_view::npos;
}

boost::optional<Scheme>
select_scheme( const boost::optional<boost::string_view>& sig_v
             , const boost::optional<boost::string_view>& auth_v
             , sys::error_code& ec)
{
    bool sig_has = sig_v && has_signature_params(*sig_v);
    bool auth_has = auth_v && has_signature_params(*auth_v);

    if (sig_has && auth_has) {
        ec = HttpSigErrc::scheme_ambiguous;
        return boost::none;
    }
    if (!sig_has && !auth_has) {
        ec = HttpSigErrc::scheme_missing;
        return boost::none;
    }
    return sig_has ? Scheme::signature : Scheme::authorization;
}

static
boost::optional<boost::string_view>
first_value(const http::fields& fields, boost::string_view name)
{
    auto it = fields.find(name);
    if (it == fields.end()) return boost::none;
    return it->value();
}

// Skip the `Signature` authentication scheme in `Authorization: Signature keyId=...`.
static
boost::string_view strip_auth_scheme(boost::string_view v)
{
    trim_whitespace(v);
    static const boost::string_view pfx = "signature ";
    if (v.size() > pfx.size() && boost::algorithm::istarts_with(v, pfx))
        v.remove_prefix(pfx.size());
    return v;
}

boost::optional<SignatureParams>
parse_signature_params(const http::fields& fields, sys::error_code& ec)
{
    auto sig_v = first_value(fields, signature_hdr);
    auto auth_v = first_value(fields, authorization_hdr);

    auto scheme = select_scheme(sig_v, auth_v, ec);
    if (!scheme) {
        LOG_DEBUG("Cannot find HTTP signature: ", ec);
        return boost::none;
    }

    auto value = (*scheme == Scheme::signature) ? *sig_v : strip_auth_scheme(*auth_v);
    return SignatureParams::parse(value, ec);
}

} // httpsig namespace
