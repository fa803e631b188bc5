#pragma once

#include <boost/variant.hpp>

namespace httpsig { namespace util {

namespace __variant_detail {
    template<class T, class... Ts> struct overloaded : T, overloaded<Ts...> {
        using T::operator();
        using overloaded<Ts...>::operator();

        overloaded(T t, Ts... ts)
            : T(std::move(t))
            , overloaded<Ts...>(std::move(ts)...)
        {}
    };

    template<class T> struct overloaded<T> : T {
        using T::operator();

        overloaded(T t)
            : T(std::move(t))
        {}
    };
}

/*
 * The function `apply` is meant to make work with boost::variant easier.
 *
 * Example:
 *
 *   using Key = variant<std::string, Ed25519PrivateKey>;
 *   Key key;
 *
 *   auto is_secret = apply(key
 *                         , [] (const std::string&)       { return true; }
 *                         , [] (const Ed25519PrivateKey&) { return false; });
 */

template<class Variant, class... Fs>
auto apply(Variant&& v, Fs&&... fs) {
    return boost::apply_visitor(
            __variant_detail::overloaded<Fs...>{std::forward<Fs>(fs)...},
            std::forward<Variant>(v));
}

}} // namespaces
