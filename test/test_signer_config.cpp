#define BOOST_TEST_MODULE signer_config
#include <boost/test/included/unit_test.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <logger.h>
#include <signer.h>
#include <signer_config.h>

#include <namespaces.h>

BOOST_AUTO_TEST_SUITE(httpsig_signer_config)

using namespace std;
using namespace httpsig;
using strings = vector<string>;
namespace po = boost::program_options;

static SignerConfig parse_args(vector<const char*> args) {
    args.insert(args.begin(), "signer");

    auto desc = SignerConfig::options_description();
    po::variables_map vm;
    po::store(po::parse_command_line(int(args.size()), args.data(), desc), vm);
    po::notify(vm);
    return SignerConfig(vm);
}

struct LogLevelRestorer {
    log_level_t saved = logger.get_threshold();
    ~LogLevelRestorer() { logger.set_threshold(saved); }
};

BOOST_AUTO_TEST_CASE(test_defaults) {
    LogLevelRestorer llr;

    auto config = parse_args({});
    BOOST_CHECK(config.algorithms() == strings{"hmac-sha256"});
    BOOST_CHECK(config.headers() == (strings{"(request-target)", "date"}));
    BOOST_CHECK(config.scheme() == Scheme::signature);
    BOOST_CHECK_EQUAL(logger.get_threshold(), INFO);

    auto signer = config.make_signer();
    BOOST_CHECK_EQUAL(signer.algorithm(), "hmac-sha256");
    BOOST_CHECK(signer.headers() == config.headers());
}

BOOST_AUTO_TEST_CASE(test_options) {
    LogLevelRestorer llr;

    auto config = parse_args({ "--sig-algorithm", "hs2019", "ed25519"
                             , "--sig-headers", "host", "date", "digest"
                             , "--sig-scheme", "Authorization"
                             , "--log-level", "debug"});
    BOOST_CHECK(config.algorithms() == (strings{"hs2019", "ed25519"}));
    BOOST_CHECK(config.headers() == (strings{"host", "date", "digest"}));
    BOOST_CHECK(config.scheme() == Scheme::authorization);
    BOOST_CHECK_EQUAL(logger.get_threshold(), DEBUG);

    auto signer = config.make_signer();
    BOOST_CHECK_EQUAL(signer.algorithm(), "ed25519");
    BOOST_CHECK(signer.scheme() == Scheme::authorization);
}

BOOST_AUTO_TEST_CASE(test_invalid) {
    LogLevelRestorer llr;

    BOOST_CHECK_THROW(parse_args({"--sig-scheme", "cookie"}), std::runtime_error);
    BOOST_CHECK_THROW(parse_args({"--log-level", "loud"}), std::runtime_error);

    auto config = parse_args({"--sig-algorithm", "hs2019"});
    BOOST_CHECK_THROW(config.make_signer(), std::runtime_error);

    // An empty registry supports no algorithm.
    AlgorithmRegistry registry;
    BOOST_CHECK_THROW(parse_args({}).make_signer(registry), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
