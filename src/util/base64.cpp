#include "base64.h"

#include <algorithm>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>

using namespace std;

static
bool is_base64_char(char c)
{
    return ('A' <= c && c <= 'Z')
        || ('a' <= c && c <= 'z')
        || ('0' <= c && c <= '9')
        || c == '+' || c == '/';
}

// Based on <https://stackoverflow.com/a/28471421> by user "ltc"
// and <https://stackoverflow.com/a/10973348> by user "PiQuer".
string httpsig::util::detail::base64_encode(const char* data, size_t size) {
    using namespace boost::archive::iterators;
    using It = base64_from_binary<transform_width<const char*, 6, 8>>;
    It begin = data;
    It end   = data + size;
    string out(begin, end);  // encode to base64
    return out.append((3 - size % 3) % 3, '=');  // add padding
}

boost::optional<string> httpsig::util::base64_decode(const boost::string_view in) {
    using namespace boost::archive::iterators;

    if (in.size() % 4 != 0) return boost::none;

    auto body = in;
    size_t npad = 0;
    while (npad < 2 && body.ends_with('=')) {
        body.remove_suffix(1);
        ++npad;
    }
    // Also rejects padding in the middle.
    if (!all_of(body.begin(), body.end(), is_base64_char)) return boost::none;

    // Padding characters decode as zero bits, which are dropped below.
    using It = transform_width<binary_from_base64<const char*>, 8, 6>;
    It begin = in.data();
    It end   = in.data() + in.size();
    string out(begin, end);  // decode from base64
    return out.erase((npad > out.size()) ? 0 : out.size() - npad);  // remove padding
}
