#pragma once

#include <string>

#include <boost/variant.hpp>

#include "util/crypto.h"

namespace httpsig {

// Raw shared secret bytes for keyed MAC algorithms.
using Secret = std::string;

using PrivateKey = boost::variant< Secret
                                 , util::Ed25519PrivateKey
                                 , util::RsaPrivateKey>;

using PublicKey = boost::variant< Secret
                                , util::Ed25519PublicKey
                                , util::RsaPublicKey>;

} // httpsig namespace
