#include "canonicalize.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/optional.hpp>

#include "error.h"
#include "logger.h"
#include "split_string.h"

namespace httpsig {

RequestTarget request_target(const http::request_header<>& rqh)
{
    auto method = rqh.method_string().to_string();
    boost::algorithm::to_lower(method);
    auto value = util::str(method, ' ', rqh.target());

    return [value = std::move(value)] (sys::error_code&) {
        return value;
    };
}

RequestTarget request_target_not_permitted()
{
    return [] (sys::error_code& ec) {
        ec = HttpSigErrc::request_target_not_permitted;
        return std::string();
    };
}

const std::vector<std::string>& default_headers()
{
    static const std::vector<std::string> hs{"date"};
    return hs;
}

// For `hn` being ``X-Foo``, turn:
//
//     X-Foo: foo
//     X-Bar: xxx
//     X-Foo: 
//     X-Foo: bar
//
// into optional ``foo, , bar``, and:
//
//     X-Bar: xxx
//
// into optional no value.
static
boost::optional<std::string>
flatten_header_values(const http::fields& inh, const boost::string_view& hn)
{
    http::fields::const_iterator begin, end;
    std::tie(begin, end) = inh.equal_range(hn);
    if (begin == end)  // missing header
        return {};

    std::string ret;
    bool ins_sep = false;
    for (auto hit = begin; hit != end; hit++) {
        auto hv = hit->value();
        trim_whitespace(hv);
        if (ins_sep) ret += ", ";
        ret.append(hv.data(), hv.size());
        ins_sep = true;
    }
    return {std::move(ret)};
}

std::string signature_string( const http::fields& fields
                            , const std::vector<std::string>& headers_
                            , const RequestTarget& target
                            , sys::error_code& ec)
{
    const auto& headers = headers_.empty() ? default_headers() : headers_;

    std::string sig_string;
    bool ins_sep = false;
    for (const auto& hn : headers) {
        auto name = hn;
        boost::algorithm::to_lower(name);

        std::string value;
        if (name == request_target_hdr) {
            value = target(ec);
            if (ec) {
                LOG_DEBUG("Cannot sign ", request_target_hdr, ": ", ec);
                return {};
            }
        } else {
            // Referring to an empty header is ok (a missing one is not).
            auto hv = flatten_header_values(fields, name);
            if (!hv) {
                LOG_DEBUG("Header to sign is missing: ", name);
                ec = HttpSigErrc::missing_signed_header;
                return {};
            }
            value = std::move(*hv);
        }

        if (ins_sep) sig_string += '\n';
        sig_string += name;
        sig_string += ": ";
        sig_string += value;
        ins_sep = true;
    }

    return sig_string;
}

} // httpsig namespace
