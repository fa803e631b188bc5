#define BOOST_TEST_MODULE canonicalize
#include <boost/test/included/unit_test.hpp>

#include <string>
#include <vector>

#include <boost/beast/http/message.hpp>

#include <canonicalize.h>
#include <error.h>

#include <namespaces.h>

BOOST_AUTO_TEST_SUITE(httpsig_canonicalize)

using namespace std;
using namespace httpsig;

static const string date = "Tue, 07 Jun 2014 20:51:35 GMT";

static http::request_header<> get_request() {
    http::request_header<> rqh;
    rqh.method(http::verb::get);
    rqh.target("/foo?param=value&pet=dog");
    rqh.version(11);
    rqh.set(http::field::host, "example.com");
    rqh.set(http::field::date, date);
    return rqh;
}

BOOST_AUTO_TEST_CASE(test_request_target) {
    auto rqh = get_request();
    sys::error_code ec;

    auto sig_string = signature_string(rqh, {"(request-target)", "host", "date"}, request_target(rqh), ec);
    BOOST_REQUIRE(!ec);
    BOOST_CHECK_EQUAL(sig_string,
        "(request-target): get /foo?param=value&pet=dog\n"
        "host: example.com\n"
        "date: Tue, 07 Jun 2014 20:51:35 GMT");

    // Same input, same output.
    BOOST_CHECK_EQUAL(sig_string, signature_string(rqh, {"(request-target)", "host", "date"}, request_target(rqh), ec));
}

BOOST_AUTO_TEST_CASE(test_case_insensitive) {
    auto rqh = get_request();
    rqh.method_string("PoSt");
    rqh.set("X-Foo", "bar");
    sys::error_code ec;

    auto sig_string = signature_string(rqh, {"(Request-Target)", "X-FOO", "Date"}, request_target(rqh), ec);
    BOOST_REQUIRE(!ec);
    BOOST_CHECK_EQUAL(sig_string,
        "(request-target): post /foo?param=value&pet=dog\n"
        "x-foo: bar\n"
        "date: Tue, 07 Jun 2014 20:51:35 GMT");
}

BOOST_AUTO_TEST_CASE(test_default_headers) {
    auto rqh = get_request();
    sys::error_code ec;

    BOOST_REQUIRE_EQUAL(default_headers().size(), 1u);
    BOOST_CHECK_EQUAL(default_headers()[0], "date");

    auto sig_string = signature_string(rqh, {}, request_target(rqh), ec);
    BOOST_REQUIRE(!ec);
    BOOST_CHECK_EQUAL(sig_string, "date: " + date);
}

BOOST_AUTO_TEST_CASE(test_multiple_values) {
    auto rqh = get_request();
    rqh.insert("X-Foo", "  first\t");
    rqh.insert("X-Bar", "xxx");
    rqh.insert("X-Foo", "");
    rqh.insert("x-foo", "third");
    sys::error_code ec;

    auto sig_string = signature_string(rqh, {"x-foo", "x-bar"}, request_target(rqh), ec);
    BOOST_REQUIRE(!ec);
    BOOST_CHECK_EQUAL(sig_string, "x-foo: first, , third\nx-bar: xxx");
}

BOOST_AUTO_TEST_CASE(test_empty_header) {
    auto rqh = get_request();
    rqh.set("X-Empty", "");
    sys::error_code ec;

    auto sig_string = signature_string(rqh, {"x-empty"}, request_target(rqh), ec);
    BOOST_REQUIRE(!ec);
    BOOST_CHECK_EQUAL(sig_string, "x-empty: ");
}

BOOST_AUTO_TEST_CASE(test_missing_header) {
    auto rqh = get_request();
    sys::error_code ec;

    auto sig_string = signature_string(rqh, {"date", "digest"}, request_target(rqh), ec);
    BOOST_CHECK(ec == HttpSigErrc::missing_signed_header);
    BOOST_CHECK(sig_string.empty());
}

BOOST_AUTO_TEST_CASE(test_response) {
    http::response_header<> rsh;
    rsh.result(http::status::ok);
    rsh.set(http::field::date, date);
    sys::error_code ec;

    auto sig_string = signature_string(rsh, {"date"}, request_target_not_permitted(), ec);
    BOOST_REQUIRE(!ec);
    BOOST_CHECK_EQUAL(sig_string, "date: " + date);

    signature_string(rsh, {"date", "(request-target)"}, request_target_not_permitted(), ec);
    BOOST_CHECK(ec == HttpSigErrc::request_target_not_permitted);
}

BOOST_AUTO_TEST_CASE(test_target_outlives_head) {
    RequestTarget target;
    {
        auto rqh = get_request();
        rqh.method(http::verb::delete_);
        target = request_target(rqh);
    }
    sys::error_code ec;
    BOOST_CHECK_EQUAL(target(ec), "delete /foo?param=value&pet=dog");
    BOOST_CHECK(!ec);
}

BOOST_AUTO_TEST_SUITE_END()
