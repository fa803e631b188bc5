#pragma once

#include <array>
#include <cstring>
#include <memory>
#include <string>

#include <boost/utility/string_view.hpp>

namespace httpsig { namespace util {

enum class hash_algorithm {
    sha256,
    sha512,
};

// Name of the algorithm as used by libgcrypt S-expressions (e.g. `sha256`).
const char* hash_algorithm_name(hash_algorithm);

namespace hash_detail {

class HashImpl;
struct HashImplDeleter {
    void operator()(HashImpl*);
};

HashImpl* new_hash_impl(hash_algorithm);
void hash_impl_update(HashImpl&, const void*, size_t);
uint8_t* hash_impl_close(HashImpl&);

} // namespace hash_detail



/* Templated class to support running hashes.
 *
 * You may call `update` several times to feed the hash function with new
 * data.  When you are done, you may call the `close` function, which returns
 * the resulting digest as an array of bytes.
 */
template<hash_algorithm ALGORITHM, size_t DIGEST_LENGTH>
class Hash {
public:
    using digest_type = std::array<uint8_t, DIGEST_LENGTH>;

    Hash() {}

    inline void update(boost::string_view sv)
    {
        update(sv.data(), sv.size());
    }

    inline void update(const char* c)
    {
        update(boost::string_view(c));
    }

    inline void update(const std::string& data)
    {
        update(data.data(), data.size());
    }

    template<size_t N>
    inline void update(const std::array<uint8_t, N>& data)
    {
        update(data.data(), N);
    }

    inline digest_type close()
    {
        if (!impl) impl.reset(hash_detail::new_hash_impl(ALGORITHM));

        auto digest_buffer = hash_detail::hash_impl_close(*impl);

        digest_type result;
        std::memcpy(result.data(), digest_buffer, result.size());

        impl = nullptr;

        return result;
    }

    template<class... Args>
    static
    digest_type digest(Args&&... args)
    {
        Hash hash;
        return digest_impl(hash, std::forward<Args>(args)...);
    }

    static constexpr size_t size() {
        return DIGEST_LENGTH;
    }

private:
    template<class Hash>
    static
    digest_type digest_impl(Hash& hash)
    {
        return hash.close();
    }

    template<class Hash, class Arg, class... Rest>
    static
    digest_type digest_impl(Hash& hash, const Arg& arg, const Rest&... rest)
    {
        hash.update(arg);
        return digest_impl(hash, rest...);
    }

private:
    std::unique_ptr<hash_detail::HashImpl, hash_detail::HashImplDeleter> impl;

    inline void update(const void* buffer, size_t size)
    {
        if (!impl) impl.reset(hash_detail::new_hash_impl(ALGORITHM));
        hash_detail::hash_impl_update(*impl, buffer, size);
    }
};

using SHA256 = Hash<hash_algorithm::sha256, 32>;
using SHA512 = Hash<hash_algorithm::sha512, 64>;

// Digest of `data` with the given algorithm, as a byte string.
std::string digest(hash_algorithm, boost::string_view data);

// HMAC of `data` keyed with `key`, as a byte string
// as long as the digest of the algorithm.
// Throws `std::runtime_error` if libgcrypt rejects the key.
std::string hmac(hash_algorithm, boost::string_view key, boost::string_view data);

}} // namespaces
