#include "signer_config.h"

#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>

#include "logger.h"
#include "signer.h"

namespace httpsig {

template<class... Args>
inline
std::runtime_error error(Args&&... args) {
    return std::runtime_error(util::str(std::forward<Args>(args)...));
}

// Helper to avoid writing the name of the option twice.
template<typename T>
static boost::optional<T> as_optional(const boost::program_options::variables_map& vm, const char* name) {
    if (vm.count(name) == 0) {
        return boost::none;
    }
    return vm[name].as<T>();
}

static
boost::optional<Scheme> scheme_from_string(const std::string& s)
{
    auto ls = boost::algorithm::to_lower_copy(s);
    if (ls == "signature") return Scheme::signature;
    if (ls == "authorization") return Scheme::authorization;
    return boost::none;
}

boost::program_options::options_description
SignerConfig::options_description()
{
    using namespace std;
    namespace po = boost::program_options;

    SignerConfig defaults;

    po::options_description desc("HTTP signature options");
    desc.add_options()
       ("sig-algorithm"
        , po::value<vector<string>>()->multitoken()
          ->default_value(defaults._algorithms, boost::algorithm::join(defaults._algorithms, " "))
        , "Signature algorithms in order of preference "
          "(hmac-sha256, hmac-sha512, rsa-sha256, rsa-sha512, ed25519)")
       ("sig-headers"
        , po::value<vector<string>>()->multitoken()
          ->default_value(defaults._headers, boost::algorithm::join(defaults._headers, " "))
        , "Headers covered by the signature, in order; "
          "use \"(request-target)\" for the request line")
       ("sig-scheme"
        , po::value<string>()->default_value("signature")
        , "Header carrying the signature: \"signature\" or \"authorization\"")
       ("log-level"
        , po::value<string>()->default_value(util::str(default_log_level()))
        , "Set log level: silly, debug, verbose, info, warn, error")
       ;

    return desc;
}

SignerConfig::SignerConfig(const boost::program_options::variables_map& vm)
{
    using namespace std;

    if (auto opt = as_optional<vector<string>>(vm, "sig-algorithm")) {
        if (opt->empty())
            throw error("No signature algorithm given");
        _algorithms = *opt;
    }

    if (auto opt = as_optional<vector<string>>(vm, "sig-headers")) {
        _headers = *opt;
    }

    if (auto opt = as_optional<string>(vm, "sig-scheme")) {
        auto scheme = scheme_from_string(*opt);
        if (!scheme)
            throw error("Invalid signature scheme: ", *opt);
        _scheme = *scheme;
    }

    if (vm.count("log-level")) {
        auto level = boost::algorithm::to_upper_copy(vm["log-level"].as<string>());
        auto ll_o = log_level_from_string(level);
        if (!ll_o)
            throw error("Invalid log level: ", level);
        logger.set_threshold(*ll_o);
        LOG_INFO("Log level set to: ", level);
    }
}

Signer SignerConfig::make_signer(const AlgorithmRegistry& registry) const
{
    sys::error_code ec;
    auto signer = Signer::make(_algorithms, _headers, _scheme, registry, ec);
    if (!signer)
        throw error( "Unsupported signature algorithms: "
                   , boost::algorithm::join(_algorithms, " "), " (", ec, ")");

    LOG_DEBUG("Using HTTP signature algorithm: ", signer->algorithm());
    return std::move(*signer);
}

} // httpsig namespace
