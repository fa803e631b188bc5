#pragma once

#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <boost/optional.hpp>

#include "algorithm.h"
#include "namespaces.h"
#include "signature_params.h"

namespace httpsig {

class Signer;

// Options to configure a `Signer`,
// meant to be added to the options of the embedding program.
class SignerConfig {
public:
    SignerConfig() = default;

    // Throws `std::runtime_error` on invalid values.
    // Also sets the threshold of the global logger.
    explicit SignerConfig(const boost::program_options::variables_map&);

    static
    boost::program_options::options_description options_description();

    const std::vector<std::string>& algorithms() const { return _algorithms; }
    const std::vector<std::string>& headers() const { return _headers; }
    Scheme scheme() const { return _scheme; }

    // Throws `std::runtime_error` if none of the algorithms is in the registry.
    Signer make_signer(const AlgorithmRegistry& = AlgorithmRegistry::builtin()) const;

private:
    std::vector<std::string> _algorithms{"hmac-sha256"};
    std::vector<std::string> _headers{"(request-target)", "date"};
    Scheme _scheme = Scheme::signature;
};

} // httpsig namespace
