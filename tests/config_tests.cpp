#define BOOST_TEST_MODULE config_tests
#include <boost/test/unit_test.hpp>

#include "fountain_config.hpp"
#include "fountain_errors.hpp"
#include "logging.hpp"
#include "self_test.hpp"
#include <sstream>
#include <string>

BOOST_AUTO_TEST_SUITE(config_suite)

BOOST_AUTO_TEST_CASE(defaults_are_valid) {
    FountainConfig config;
    BOOST_CHECK_NO_THROW(config.validate());
    BOOST_TEST(config.chunk_bits == DEFAULT_CHUNK_BITS);
    BOOST_TEST(config.seed_symbols == DEFAULT_SEED_SYMBOLS);
}

BOOST_AUTO_TEST_CASE(out_of_range_values_rejected) {
    FountainConfig config;
    config.chunk_bits = 9;
    BOOST_CHECK_THROW(config.validate(), InvalidConfiguration);

    config = FountainConfig();
    config.redundancy = 0.5;
    BOOST_CHECK_THROW(config.validate(), InvalidConfiguration);

    config = FountainConfig();
    config.seed_symbols = MAX_SEED_SYMBOLS + 1;
    BOOST_CHECK_THROW(config.validate(), InvalidConfiguration);

    config = FountainConfig();
    config.threads = 0;
    BOOST_CHECK_THROW(config.validate(), InvalidConfiguration);
}

BOOST_AUTO_TEST_CASE(droplet_count_scales_with_redundancy) {
    FountainConfig config;
    BOOST_TEST(config.droplet_count(4) == 12u);
    config.redundancy = 1.5;
    BOOST_TEST(config.droplet_count(5) == 8u);
    BOOST_TEST(config.droplet_count(0) == 0u);
}

BOOST_AUTO_TEST_CASE(log_levels) {
    BOOST_CHECK(parse_log_level("DEBUG") == LogLevel::Debug);
    BOOST_CHECK(parse_log_level("warning") == LogLevel::Warning);
    BOOST_CHECK(parse_log_level("Critical") == LogLevel::Critical);
    BOOST_CHECK_THROW(parse_log_level("verbose"), InvalidConfiguration);

    LogLevel saved = log_level();
    set_log_level(LogLevel::Error);
    BOOST_TEST(!log_enabled(LogLevel::Warning));
    BOOST_TEST(log_enabled(LogLevel::Critical));
    set_log_level(saved);
    BOOST_TEST(std::string(log_level_name(LogLevel::Info)) == "INFO");
}

BOOST_AUTO_TEST_CASE(self_test_passes) {
    for (int bits : {4, 8}) {
        std::ostringstream out;
        BOOST_TEST(run_self_test(bits, out));
        BOOST_TEST(out.str().find("[TEST] All tests passed!") != std::string::npos);
    }
}

BOOST_AUTO_TEST_SUITE_END()
