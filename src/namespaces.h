#pragma once

namespace boost {
    namespace beast { namespace http {} }
    namespace system {};
}

namespace httpsig {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace sys   = boost::system;

} // httpsig namespace
