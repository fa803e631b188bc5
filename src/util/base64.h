#pragma once

#include <string>

#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>

namespace httpsig { namespace util {

namespace detail {
std::string base64_encode(const char*, size_t);
}

// Standard alphabet, with padding.
template<class In>
std::string base64_encode(const In& in) {
    return detail::base64_encode(reinterpret_cast<const char*>(in.data()), in.size());
}

// Padded standard base64 only.
// Return none if the length is not a multiple of four,
// if there are characters outside of the alphabet,
// or if padding appears anywhere but at the end.
boost::optional<std::string> base64_decode(const boost::string_view);

}} // namespaces
