#pragma once

#include <map>
#include <memory>
#include <string>

#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>
#include <boost/utility/string_view.hpp>
#include <boost/variant.hpp>

#include "keys.h"
#include "namespaces.h"

namespace httpsig {

// A public key signature algorithm.
//
// Implementations check the shape of the keys they are given
// and report `HttpSigErrc::key_type_mismatch` for keys they do not handle.
class AsymmetricSigner {
public:
    virtual ~AsymmetricSigner() = default;

    // Canonical name, as written in the `algorithm` signature parameter.
    virtual std::string name() const = 0;

    // Return the raw signature of `data`, or an empty string and set `ec`.
    virtual std::string sign( const PrivateKey&
                            , boost::string_view data
                            , sys::error_code& ec) const = 0;

    // Return a default error code if `signature` is a valid signature of `data`.
    virtual sys::error_code verify( const PublicKey&
                                  , boost::string_view data
                                  , boost::string_view signature) const = 0;
};

// A keyed message authentication code.
class MacProvider {
public:
    virtual ~MacProvider() = default;

    virtual std::string name() const = 0;

    virtual std::string sign(boost::string_view data, const Secret&) const = 0;

    // By default compute the code of `data` again
    // and compare it with `candidate` in constant time.
    virtual bool verify( boost::string_view data
                       , boost::string_view candidate
                       , const Secret&) const;
};

using AlgorithmBinding = boost::variant< std::shared_ptr<const AsymmetricSigner>
                                       , std::shared_ptr<const MacProvider>>;

std::string binding_name(const AlgorithmBinding&);

// Maps algorithm names (case-insensitively) to their implementations.
class AlgorithmRegistry {
public:
    AlgorithmRegistry() = default;

    // Register under the canonical name of the algorithm,
    // replacing any previous algorithm of the same kind and name.
    void add(std::shared_ptr<const AsymmetricSigner>);
    void add(std::shared_ptr<const MacProvider>);

    std::shared_ptr<const AsymmetricSigner>
    resolve_signer(boost::string_view name) const;

    std::shared_ptr<const MacProvider>
    resolve_mac(boost::string_view name) const;

    // Asymmetric algorithms take precedence over MAC ones.
    // Sets `HttpSigErrc::unknown_algorithm` if the name is not registered.
    boost::optional<AlgorithmBinding>
    resolve(boost::string_view name, sys::error_code&) const;

    // The registry of algorithms implemented by this library
    // (see `builtin_algorithms.h`).
    static const AlgorithmRegistry& builtin();

private:
    std::map<std::string, std::shared_ptr<const AsymmetricSigner>> _signers;
    std::map<std::string, std::shared_ptr<const MacProvider>> _macs;
};

} // httpsig namespace
