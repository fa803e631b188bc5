#include "error.h"

namespace httpsig {

namespace {

    class HttpSigErrorCategoryImpl : public boost::system::error_category
    {
    public:
        const char* name() const noexcept override final { return "httpsig"; }

        std::string message(int e_) const override {
            using Errc = HttpSigErrc;

            // Convert to enum to make compiler check we use all the codes in the
            // switch below.
            auto e = static_cast<Errc>(e_);

            switch (e) {
                case Errc::scheme_ambiguous: return "both Signature and Authorization have signature parameters";
                case Errc::scheme_missing: return "neither Signature nor Authorization have signature parameters";
                case Errc::malformed_parameter: return "malformed http signature parameter";
                case Errc::missing_parameter: return "missing required parameter in http signature";
                case Errc::unknown_algorithm: return "no cryptographic implementation available for algorithm";
                case Errc::key_type_mismatch: return "key of the wrong type for algorithm";
                case Errc::missing_signed_header: return "missing header";
                case Errc::request_target_not_permitted: return "(request-target) not permitted here";
                case Errc::base64_decode_failure: return "invalid base64 in http signature";
                case Errc::signature_mismatch: return "invalid http signature";
                case Errc::verification_failure: return "http signature verification failed";
            }

            return "unknown httpsig error";
        }
    };

} // anonymous namespace

const boost::system::error_category& httpsig_category()
{
    static const HttpSigErrorCategoryImpl cat;
    return cat;
}

boost::system::error_code make_error_code(HttpSigErrc e)
{
    return {static_cast<int>(e), httpsig_category()};
}

} // httpsig namespace
