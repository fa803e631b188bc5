#include "crypto.h"
#include "bytes.h"

#include <cassert>
#include <stdexcept>
#include <vector>

extern "C" {
#include "gcrypt.h"
}

#include <iostream>

namespace httpsig {
namespace util {

void crypto_init()
{
    if (!::gcry_check_version(GCRYPT_VERSION)) {
        throw std::runtime_error("Error: Incompatible gcrypt version");
    }
    ::gcry_control(GCRYCTL_DISABLE_SECMEM, 0);
    ::gcry_control(GCRYCTL_INITIALIZATION_FINISHED, 0);
}

bool constant_time_equal(boost::string_view a, boost::string_view b)
{
    if (a.size() != b.size()) return false;

    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i)
        diff |= static_cast<unsigned char>(a[i]) ^ static_cast<unsigned char>(b[i]);
    return diff == 0;
}

// Release the given S-expressions when going out of scope.
namespace {
struct SexpReleaser {
    std::vector<::gcry_sexp_t*> sexps;

    ~SexpReleaser() {
        for (auto s : sexps)
            if (*s) ::gcry_sexp_release(*s);
    }
};
} // anonymous namespace

static
::gcry_sexp_t sexp_copy(::gcry_sexp_t s)
{
    ::gcry_sexp_t ret = nullptr;
    if (::gcry_sexp_build(&ret, NULL, "%S", s)) {
        throw std::runtime_error("Failed to copy S-expression");
    }
    return ret;
}

static
std::string sexp_serialize(::gcry_sexp_t s)
{
    size_t size = ::gcry_sexp_sprint(s, GCRYSEXP_FMT_CANON, nullptr, 0);
    std::string out(size, '\0');
    size = ::gcry_sexp_sprint(s, GCRYSEXP_FMT_CANON, &out[0], out.size());
    if (size == 0) {
        throw std::runtime_error("Failed to serialize S-expression");
    }
    out.resize(size);
    return out;
}

// Return the sub-expression `(<token> ...)` of the S-expression in `data`,
// if it is an RSA key.
static
boost::optional<::gcry_sexp_t> sexp_parse_rsa_key(boost::string_view data, const char* token)
{
    ::gcry_sexp_t whole = nullptr;
    if (::gcry_sexp_new(&whole, data.data(), data.size(), 1)) return boost::none;

    ::gcry_sexp_t key = ::gcry_sexp_find_token(whole, token, 0);
    ::gcry_sexp_release(whole);
    if (!key) return boost::none;

    ::gcry_sexp_t rsa = ::gcry_sexp_find_token(key, "rsa", 0);
    if (!rsa) {
        ::gcry_sexp_release(key);
        return boost::none;
    }
    ::gcry_sexp_release(rsa);
    return key;
}

static
::gcry_sexp_t rsa_data_sexp(hash_algorithm ha, boost::string_view data)
{
    auto dg = digest(ha, data);

    ::gcry_sexp_t data_sexp = nullptr;
    if (::gcry_sexp_build( &data_sexp, NULL, "(data (flags pkcs1) (hash %s %b))"
                         , hash_algorithm_name(ha), int(dg.size()), dg.data())) {
        throw std::runtime_error("Failed to build RSA data S-expression");
    }
    return data_sexp;
}

Ed25519PublicKey::Ed25519PublicKey(Ed25519PublicKey::key_array_t key):
    _public_key(nullptr)
{
    if (::gcry_sexp_build(&_public_key, NULL, "(public-key (ecc (curve Ed25519) (flags eddsa) (q %b)))", int(key.size()), key.data())) {
        throw std::runtime_error("Failed to build Ed25519 public key");
    }
}

Ed25519PublicKey::~Ed25519PublicKey()
{
    if (_public_key) {
        ::gcry_sexp_release(_public_key);
        _public_key = nullptr;
    }
}

Ed25519PublicKey::Ed25519PublicKey(const Ed25519PublicKey& other):
    _public_key(nullptr)
{
    (*this) = other;
}

Ed25519PublicKey::Ed25519PublicKey(Ed25519PublicKey&& other):
    _public_key(nullptr)
{
    (*this) = std::move(other);
}

boost::optional<Ed25519PublicKey>
Ed25519PublicKey::from_hex(boost::string_view hex)
{
    if (hex.size() != key_size * 2) {
        return boost::none;
    }

    auto os = util::bytes::from_hex(hex);

    if (!os) return boost::none;

    return Ed25519PublicKey(util::bytes::to_array<uint8_t, key_size>(*os));
}

Ed25519PublicKey& Ed25519PublicKey::operator=(const Ed25519PublicKey& other)
{
    if (this != &other) {
        if (_public_key) {
            ::gcry_sexp_release(_public_key);
            _public_key = nullptr;
        }

        if (other._public_key) {
            _public_key = sexp_copy(other._public_key);
        }
    }
    return *this;
}

Ed25519PublicKey& Ed25519PublicKey::operator=(Ed25519PublicKey&& other)
{
    if (this != &other) {
        std::swap(_public_key, other._public_key);
    }
    return *this;
}

Ed25519PublicKey::key_array_t Ed25519PublicKey::serialize() const
{
    ::gcry_sexp_t q = ::gcry_sexp_find_token(_public_key, "q", 0);
    if (!q) {
        throw std::runtime_error("Malformed Ed25519 public key");
    }
    size_t q_size;
    const char* q_buffer = ::gcry_sexp_nth_data(q, 1, &q_size);
    if (!q_buffer) {
        ::gcry_sexp_release(q);
        throw std::runtime_error("Malformed Ed25519 public key");
    }
    key_array_t output;
    assert(q_size == output.size());
    memcpy(output.data(), q_buffer, output.size());
    ::gcry_sexp_release(q);
    return output;
}

bool Ed25519PublicKey::verify(boost::string_view data, const Ed25519PublicKey::sig_array_t& signature) const
{
    ::gcry_sexp_t signature_sexp = nullptr;
    ::gcry_sexp_t data_sexp = nullptr;
    SexpReleaser releaser{{&signature_sexp, &data_sexp}};

    if (::gcry_sexp_build(&signature_sexp, NULL, "(sig-val (eddsa (r %b)(s %b)))", int(key_size), signature.data(), int(key_size), signature.data() + key_size)) {
        throw std::runtime_error("Failed to build Ed25519 signature S-expression");
    }

    if (::gcry_sexp_build(&data_sexp, NULL, "(data (flags eddsa) (hash-algo sha512) (value %b))", int(data.size()), data.data())) {
        throw std::runtime_error("Failed to build Ed25519 data S-expression");
    }

    ::gcry_error_t error = gcry_pk_verify(signature_sexp, data_sexp, _public_key);

    return error == 0;
}



Ed25519PrivateKey::Ed25519PrivateKey(Ed25519PrivateKey::key_array_t key):
    _private_key(nullptr)
{
    if (::gcry_sexp_build(&_private_key, NULL, "(private-key (ecc (curve Ed25519) (flags eddsa) (d %b)))", int(key.size()), key.data())) {
        throw std::runtime_error("Failed to build Ed25519 private key");
    }
}

Ed25519PrivateKey::~Ed25519PrivateKey()
{
    if (_private_key) {
        ::gcry_sexp_release(_private_key);
        _private_key = nullptr;
    }
}

Ed25519PrivateKey::Ed25519PrivateKey(const Ed25519PrivateKey& other):
    _private_key(nullptr)
{
    (*this) = other;
}

Ed25519PrivateKey::Ed25519PrivateKey(Ed25519PrivateKey&& other):
    _private_key(nullptr)
{
    (*this) = std::move(other);
}

Ed25519PrivateKey& Ed25519PrivateKey::operator=(const Ed25519PrivateKey& other)
{
    if (this != &other) {
        if (_private_key) {
            ::gcry_sexp_release(_private_key);
            _private_key = nullptr;
        }

        if (other._private_key) {
            _private_key = sexp_copy(other._private_key);
        }
    }
    return *this;
}

Ed25519PrivateKey& Ed25519PrivateKey::operator=(Ed25519PrivateKey&& other)
{
    if (this != &other) {
        std::swap(_private_key, other._private_key);
    }
    return *this;
}

Ed25519PrivateKey::key_array_t Ed25519PrivateKey::serialize() const
{
    ::gcry_sexp_t d = ::gcry_sexp_find_token(_private_key, "d", 0);
    if (!d) {
        throw std::runtime_error("Malformed Ed25519 private key");
    }
    size_t d_size;
    const char* d_buffer = ::gcry_sexp_nth_data(d, 1, &d_size);
    if (!d_buffer) {
        ::gcry_sexp_release(d);
        throw std::runtime_error("Malformed Ed25519 private key");
    }
    key_array_t output;
    assert(d_size == output.size());
    memcpy(output.data(), d_buffer, output.size());
    ::gcry_sexp_release(d);
    return output;
}

boost::optional<Ed25519PrivateKey>
Ed25519PrivateKey::from_hex(boost::string_view hex)
{
    if (hex.size() != key_size * 2) {
        return boost::none;
    }

    auto os = util::bytes::from_hex(hex);

    if (!os) return boost::none;

    return Ed25519PrivateKey(util::bytes::to_array<uint8_t, key_size>(*os));
}

Ed25519PublicKey Ed25519PrivateKey::public_key() const
{
    /*
     * This logic is even less well documented than the rest of gcrypt.
     */
    ::gcry_ctx_t public_key_parameters;
    if (::gcry_mpi_ec_new(&public_key_parameters, _private_key, NULL)) {
        throw std::runtime_error("Failed to derive Ed25519 public key");
    }
    ::gcry_sexp_t public_key_sexp;
    if (::gcry_pubkey_get_sexp(&public_key_sexp, GCRY_PK_GET_PUBKEY, public_key_parameters)) {
        ::gcry_ctx_release(public_key_parameters);
        throw std::runtime_error("Failed to derive Ed25519 public key");
    }
    ::gcry_ctx_release(public_key_parameters);

    ::gcry_sexp_t q = ::gcry_sexp_find_token(public_key_sexp, "q", 0);
    ::gcry_sexp_release(public_key_sexp);
    if (!q) {
        throw std::runtime_error("Failed to derive Ed25519 public key");
    }
    size_t q_size;
    const char* q_buffer = ::gcry_sexp_nth_data(q, 1, &q_size);
    if (!q_buffer) {
        ::gcry_sexp_release(q);
        throw std::runtime_error("Failed to derive Ed25519 public key");
    }
    Ed25519PublicKey::key_array_t public_key;
    assert(q_size == public_key.size());
    memcpy(public_key.data(), q_buffer, public_key.size());
    ::gcry_sexp_release(q);

    return Ed25519PublicKey(public_key);
}

Ed25519PrivateKey Ed25519PrivateKey::generate()
{
    ::gcry_sexp_t generation_parameters;
    if (gcry_sexp_build(&generation_parameters, NULL, "(genkey (ecc (curve Ed25519) (flags eddsa)))")) {
        throw std::runtime_error("Failed to generate Ed25519 key");
    }

    ::gcry_sexp_t private_key_sexp;
    if (::gcry_pk_genkey(&private_key_sexp, generation_parameters)) {
        ::gcry_sexp_release(generation_parameters);
        throw std::runtime_error("Failed to generate Ed25519 key");
    }
    ::gcry_sexp_release(generation_parameters);

    ::gcry_sexp_t d = ::gcry_sexp_find_token(private_key_sexp, "d", 0);
    ::gcry_sexp_release(private_key_sexp);
    if (!d) {
        throw std::runtime_error("Failed to generate Ed25519 key");
    }
    size_t d_size;
    const char* d_buffer = ::gcry_sexp_nth_data(d, 1, &d_size);
    if (!d_buffer) {
        ::gcry_sexp_release(d);
        throw std::runtime_error("Failed to generate Ed25519 key");
    }
    key_array_t private_key;
    assert(d_size == private_key.size());
    memcpy(private_key.data(), d_buffer, private_key.size());
    ::gcry_sexp_release(d);

    return Ed25519PrivateKey(private_key);
}

Ed25519PrivateKey::sig_array_t Ed25519PrivateKey::sign(boost::string_view data) const
{
    ::gcry_sexp_t data_sexp = nullptr;
    ::gcry_sexp_t signature_sexp = nullptr;
    ::gcry_sexp_t r_sexp = nullptr;
    ::gcry_sexp_t s_sexp = nullptr;
    SexpReleaser releaser{{&data_sexp, &signature_sexp, &r_sexp, &s_sexp}};

    if (::gcry_sexp_build(&data_sexp, NULL, "(data (flags eddsa) (hash-algo sha512) (value %b))", int(data.size()), data.data())) {
        throw std::runtime_error("Failed to build Ed25519 data S-expression");
    }

    if (::gcry_pk_sign(&signature_sexp, data_sexp, _private_key)) {
        throw std::runtime_error("Ed25519 signing failed");
    }

    r_sexp = ::gcry_sexp_find_token(signature_sexp, "r", 0);
    s_sexp = ::gcry_sexp_find_token(signature_sexp, "s", 0);
    if (!r_sexp || !s_sexp) {
        throw std::runtime_error("Malformed Ed25519 signature");
    }

    size_t r_size, s_size;
    const char* r_buffer = ::gcry_sexp_nth_data(r_sexp, 1, &r_size);
    const char* s_buffer = ::gcry_sexp_nth_data(s_sexp, 1, &s_size);
    if (!r_buffer || !s_buffer || r_size != key_size || s_size != key_size) {
        throw std::runtime_error("Malformed Ed25519 signature");
    }

    sig_array_t output;
    memcpy(output.data(), r_buffer, key_size);
    memcpy(output.data() + key_size, s_buffer, key_size);
    return output;
}



RsaPublicKey::RsaPublicKey(::gcry_sexp_t key):
    _public_key(key)
{}

RsaPublicKey::~RsaPublicKey()
{
    if (_public_key) {
        ::gcry_sexp_release(_public_key);
        _public_key = nullptr;
    }
}

RsaPublicKey::RsaPublicKey(const RsaPublicKey& other):
    _public_key(nullptr)
{
    (*this) = other;
}

RsaPublicKey::RsaPublicKey(RsaPublicKey&& other):
    _public_key(nullptr)
{
    (*this) = std::move(other);
}

RsaPublicKey& RsaPublicKey::operator=(const RsaPublicKey& other)
{
    if (this != &other) {
        if (_public_key) {
            ::gcry_sexp_release(_public_key);
            _public_key = nullptr;
        }

        if (other._public_key) {
            _public_key = sexp_copy(other._public_key);
        }
    }
    return *this;
}

RsaPublicKey& RsaPublicKey::operator=(RsaPublicKey&& other)
{
    if (this != &other) {
        std::swap(_public_key, other._public_key);
    }
    return *this;
}

std::string RsaPublicKey::serialize() const
{
    return sexp_serialize(_public_key);
}

size_t RsaPublicKey::size() const
{
    return (::gcry_pk_get_nbits(_public_key) + 7) / 8;
}

bool RsaPublicKey::verify(hash_algorithm ha, boost::string_view data, boost::string_view signature) const
{
    // Signatures always have the length of the modulus.
    if (signature.size() != size()) return false;

    ::gcry_sexp_t signature_sexp = nullptr;
    ::gcry_sexp_t data_sexp = nullptr;
    SexpReleaser releaser{{&signature_sexp, &data_sexp}};

    if (::gcry_sexp_build(&signature_sexp, NULL, "(sig-val (rsa (s %b)))", int(signature.size()), signature.data())) {
        throw std::runtime_error("Failed to build RSA signature S-expression");
    }

    data_sexp = rsa_data_sexp(ha, data);

    return ::gcry_pk_verify(signature_sexp, data_sexp, _public_key) == 0;
}

boost::optional<RsaPublicKey> RsaPublicKey::parse(boost::string_view data)
{
    auto key = sexp_parse_rsa_key(data, "public-key");
    if (!key) return boost::none;
    return RsaPublicKey(*key);
}



RsaPrivateKey::RsaPrivateKey(::gcry_sexp_t key):
    _private_key(key)
{}

RsaPrivateKey::~RsaPrivateKey()
{
    if (_private_key) {
        ::gcry_sexp_release(_private_key);
        _private_key = nullptr;
    }
}

RsaPrivateKey::RsaPrivateKey(const RsaPrivateKey& other):
    _private_key(nullptr)
{
    (*this) = other;
}

RsaPrivateKey::RsaPrivateKey(RsaPrivateKey&& other):
    _private_key(nullptr)
{
    (*this) = std::move(other);
}

RsaPrivateKey& RsaPrivateKey::operator=(const RsaPrivateKey& other)
{
    if (this != &other) {
        if (_private_key) {
            ::gcry_sexp_release(_private_key);
            _private_key = nullptr;
        }

        if (other._private_key) {
            _private_key = sexp_copy(other._private_key);
        }
    }
    return *this;
}

RsaPrivateKey& RsaPrivateKey::operator=(RsaPrivateKey&& other)
{
    if (this != &other) {
        std::swap(_private_key, other._private_key);
    }
    return *this;
}

std::string RsaPrivateKey::serialize() const
{
    return sexp_serialize(_private_key);
}

RsaPublicKey RsaPrivateKey::public_key() const
{
    ::gcry_sexp_t n = nullptr;
    ::gcry_sexp_t e = nullptr;
    SexpReleaser releaser{{&n, &e}};

    n = ::gcry_sexp_find_token(_private_key, "n", 0);
    e = ::gcry_sexp_find_token(_private_key, "e", 0);
    if (!n || !e) {
        throw std::runtime_error("Malformed RSA private key");
    }

    ::gcry_mpi_t n_mpi = ::gcry_sexp_nth_mpi(n, 1, GCRYMPI_FMT_USG);
    ::gcry_mpi_t e_mpi = ::gcry_sexp_nth_mpi(e, 1, GCRYMPI_FMT_USG);

    ::gcry_sexp_t public_key = nullptr;
    auto err = ( !n_mpi || !e_mpi
               || ::gcry_sexp_build(&public_key, NULL, "(public-key (rsa (n %m) (e %m)))", n_mpi, e_mpi));
    ::gcry_mpi_release(n_mpi);
    ::gcry_mpi_release(e_mpi);
    if (err) {
        throw std::runtime_error("Failed to derive RSA public key");
    }

    return RsaPublicKey(public_key);
}

RsaPrivateKey RsaPrivateKey::generate(unsigned int bits)
{
    ::gcry_sexp_t generation_parameters;
    if (::gcry_sexp_build(&generation_parameters, NULL, "(genkey (rsa (nbits %d)))", int(bits))) {
        throw std::runtime_error("Failed to generate RSA key");
    }

    ::gcry_sexp_t key_sexp;
    if (::gcry_pk_genkey(&key_sexp, generation_parameters)) {
        ::gcry_sexp_release(generation_parameters);
        throw std::runtime_error("Failed to generate RSA key");
    }
    ::gcry_sexp_release(generation_parameters);

    ::gcry_sexp_t private_key = ::gcry_sexp_find_token(key_sexp, "private-key", 0);
    ::gcry_sexp_release(key_sexp);
    if (!private_key) {
        throw std::runtime_error("Failed to generate RSA key");
    }

    return RsaPrivateKey(private_key);
}

std::string RsaPrivateKey::sign(hash_algorithm ha, boost::string_view data) const
{
    ::gcry_sexp_t data_sexp = nullptr;
    ::gcry_sexp_t signature_sexp = nullptr;
    ::gcry_sexp_t s_sexp = nullptr;
    SexpReleaser releaser{{&data_sexp, &signature_sexp, &s_sexp}};

    data_sexp = rsa_data_sexp(ha, data);

    if (::gcry_pk_sign(&signature_sexp, data_sexp, _private_key)) {
        throw std::runtime_error("RSA signing failed");
    }

    s_sexp = ::gcry_sexp_find_token(signature_sexp, "s", 0);
    if (!s_sexp) {
        throw std::runtime_error("Malformed RSA signature");
    }

    size_t s_size;
    const char* s_buffer = ::gcry_sexp_nth_data(s_sexp, 1, &s_size);
    size_t key_size = (::gcry_pk_get_nbits(_private_key) + 7) / 8;
    if (!s_buffer || s_size > key_size) {
        throw std::runtime_error("Malformed RSA signature");
    }

    // Leading zero bytes are not kept by libgcrypt.
    std::string output(key_size - s_size, '\0');
    output.append(s_buffer, s_size);
    return output;
}

boost::optional<RsaPrivateKey> RsaPrivateKey::parse(boost::string_view data)
{
    auto key = sexp_parse_rsa_key(data, "private-key");
    if (!key) return boost::none;

    if (::gcry_pk_testkey(*key)) {
        ::gcry_sexp_release(*key);
        return boost::none;
    }
    return RsaPrivateKey(*key);
}

std::ostream& operator<<(std::ostream& os, const Ed25519PublicKey& k)
{
    return os << util::bytes::to_hex(k.serialize());
}

std::ostream& operator<<(std::ostream& os, const Ed25519PrivateKey& k)
{
    return os << util::bytes::to_hex(k.serialize());
}

} // util namespace
} // httpsig namespace
