#include "hash.h"
#include "bytes.h"

#include <stdexcept>

extern "C" {
#include "gcrypt.h"
}

namespace httpsig { namespace util {

namespace hash_detail {

class HashImpl {
public:
    HashImpl(int algo) : algorithm(algo)
    {
        if (::gcry_md_open(&digest, algorithm, 0))
            throw std::runtime_error("Failed to initialize hash");
    }

    ~HashImpl()
    {
        ::gcry_md_close(digest);
    }

    inline void update(const void* buffer, size_t size)
    {
        ::gcry_md_write(digest, buffer, size);
    }

    inline uint8_t* close()
    {
        return ::gcry_md_read(digest, algorithm);
    }

private:
    int algorithm;
    ::gcry_md_hd_t digest;
};

void
HashImplDeleter::operator()(HashImpl* hi)
{
    delete hi;
}

static constexpr int
hash_algo(hash_algorithm ha) {
    switch (ha) {
        case hash_algorithm::sha256:
            return ::gcry_md_algos::GCRY_MD_SHA256;
        case hash_algorithm::sha512:
            return ::gcry_md_algos::GCRY_MD_SHA512;
        default:
            return -1;
    }
}

static constexpr int
hmac_algo(hash_algorithm ha) {
    switch (ha) {
        case hash_algorithm::sha256:
            return ::gcry_mac_algos::GCRY_MAC_HMAC_SHA256;
        case hash_algorithm::sha512:
            return ::gcry_mac_algos::GCRY_MAC_HMAC_SHA512;
        default:
            return -1;
    }
}

HashImpl*
new_hash_impl(hash_algorithm ha)
{
    return new HashImpl(hash_algo(ha));
}

void
hash_impl_update(HashImpl& hi, const void* buffer, size_t size)
{
    hi.update(buffer, size);
}

uint8_t* hash_impl_close(HashImpl& hi)
{
    return hi.close();
}

} // namespace hash_detail

const char* hash_algorithm_name(hash_algorithm ha)
{
    switch (ha) {
        case hash_algorithm::sha256: return "sha256";
        case hash_algorithm::sha512: return "sha512";
    }
    return "";
}

std::string digest(hash_algorithm ha, boost::string_view data)
{
    switch (ha) {
        case hash_algorithm::sha256: return bytes::to_string(SHA256::digest(data));
        case hash_algorithm::sha512: return bytes::to_string(SHA512::digest(data));
    }
    throw std::runtime_error("Unsupported hash algorithm");
}

std::string hmac(hash_algorithm ha, boost::string_view key, boost::string_view data)
{
    int algo = hash_detail::hmac_algo(ha);

    ::gcry_mac_hd_t hd;
    if (::gcry_mac_open(&hd, algo, 0, nullptr))
        throw std::runtime_error("Failed to initialize HMAC");

    if (::gcry_mac_setkey(hd, key.data(), key.size())) {
        ::gcry_mac_close(hd);
        throw std::runtime_error("Failed to set HMAC key");
    }

    ::gcry_mac_write(hd, data.data(), data.size());

    size_t mac_size = ::gcry_mac_get_algo_maclen(algo);
    std::string mac(mac_size, '\0');
    if (::gcry_mac_read(hd, &mac[0], &mac_size)) {
        ::gcry_mac_close(hd);
        throw std::runtime_error("Failed to compute HMAC");
    }
    ::gcry_mac_close(hd);

    mac.resize(mac_size);
    return mac;
}

}} // namespaces
