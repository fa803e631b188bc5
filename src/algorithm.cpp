#include "algorithm.h"

#include <boost/algorithm/string/case_conv.hpp>

#include "error.h"
#include "logger.h"
#include "util/crypto.h"
#include "util/variant.h"

namespace httpsig {

static
std::string lowercase(boost::string_view name)
{
    auto ret = name.to_string();
    boost::algorithm::to_lower(ret);
    return ret;
}

bool
MacProvider::verify( boost::string_view data
                   , boost::string_view candidate
                   , const Secret& secret) const
{
    return util::constant_time_equal(sign(data, secret), candidate);
}

std::string binding_name(const AlgorithmBinding& binding)
{
    return util::apply(binding
        , [] (const std::shared_ptr<const AsymmetricSigner>& s) { return s->name(); }
        , [] (const std::shared_ptr<const MacProvider>& m) { return m->name(); });
}

void AlgorithmRegistry::add(std::shared_ptr<const AsymmetricSigner> signer)
{
    auto name = lowercase(signer->name());
    _signers[std::move(name)] = std::move(signer);
}

void AlgorithmRegistry::add(std::shared_ptr<const MacProvider> mac)
{
    auto name = lowercase(mac->name());
    _macs[std::move(name)] = std::move(mac);
}

std::shared_ptr<const AsymmetricSigner>
AlgorithmRegistry::resolve_signer(boost::string_view name) const
{
    auto it = _signers.find(lowercase(name));
    if (it == _signers.end()) return nullptr;
    return it->second;
}

std::shared_ptr<const MacProvider>
AlgorithmRegistry::resolve_mac(boost::string_view name) const
{
    auto it = _macs.find(lowercase(name));
    if (it == _macs.end()) return nullptr;
    return it->second;
}

boost::optional<AlgorithmBinding>
AlgorithmRegistry::resolve(boost::string_view name, sys::error_code& ec) const
{
    if (auto signer = resolve_signer(name))
        return AlgorithmBinding(std::move(signer));

    if (auto mac = resolve_mac(name))
        return AlgorithmBinding(std::move(mac));

    LOG_DEBUG("No implementation for HTTP signature algorithm: ", name);
    ec = HttpSigErrc::unknown_algorithm;
    return boost::none;
}

} // httpsig namespace
