#define BOOST_TEST_MODULE seeded_selector_tests
#include <boost/test/unit_test.hpp>

#include "seeded_selector.hpp"
#include "fountain_errors.hpp"
#include <set>
#include <vector>

BOOST_AUTO_TEST_SUITE(seeded_selector_suite)

BOOST_AUTO_TEST_CASE(splitmix_reference_stream) {
    SplitMix64 rng(0);
    BOOST_TEST(rng.next() == 0xE220A8397B1DCDAFULL);
    BOOST_TEST(rng.next() == 0x6E789E6AA1B965F4ULL);
    BOOST_TEST(SplitMix64(1234567).next() == 0x599ED017FB08FC85ULL);
}

BOOST_AUTO_TEST_CASE(uniform_stays_in_bound) {
    SplitMix64 rng(99);
    for (uint64_t bound : {1ull, 2ull, 3ull, 7ull, 1000ull}) {
        for (int i = 0; i < 200; ++i) BOOST_TEST(rng.uniform(bound) < bound);
    }
    BOOST_CHECK_THROW(rng.uniform(0), InvalidConfiguration);
}

BOOST_AUTO_TEST_CASE(selection_is_pure) {
    for (uint32_t seed : {0u, 1u, 17u, 4000000000u}) {
        SourceSelection a = select_sources(seed, 37);
        SourceSelection b = select_sources(seed, 37);
        BOOST_TEST(a.degree == b.degree);
        BOOST_TEST(a.indices == b.indices);
    }
}

BOOST_AUTO_TEST_CASE(indices_distinct_sorted_and_sized) {
    DegreeTable table(25);
    for (uint32_t seed = 0; seed < 500; ++seed) {
        SourceSelection sel = select_sources(seed, table);
        BOOST_TEST(sel.indices.size() == sel.degree);
        BOOST_TEST(sel.degree >= 1u);
        BOOST_TEST(sel.degree <= 25u);
        std::set<uint32_t> unique(sel.indices.begin(), sel.indices.end());
        BOOST_TEST(unique.size() == sel.indices.size());
        BOOST_TEST(std::vector<uint32_t>(unique.begin(), unique.end()) == sel.indices);
        BOOST_TEST(sel.indices.back() < 25u);
    }
}

BOOST_AUTO_TEST_CASE(pinned_selections_for_four_chunks) {
    // Encoder and decoder builds must agree on these exactly
    const std::vector<std::vector<uint32_t>> expected = {
        {0, 1, 3}, {1, 2}, {2, 3}, {1}, {1, 3}, {1, 3}, {2, 3}, {0, 2}, {1, 2}, {1, 2}, {2},
    };
    DegreeTable table(4);
    for (uint32_t seed = 0; seed < expected.size(); ++seed) {
        SourceSelection sel = select_sources(seed, table);
        BOOST_TEST(sel.indices == expected[seed]);
    }
}

BOOST_AUTO_TEST_CASE(every_chunk_gets_picked) {
    DegreeTable table(10);
    std::vector<int> hits(10, 0);
    for (uint32_t seed = 0; seed < 300; ++seed) {
        for (uint32_t idx : select_sources(seed, table).indices) ++hits[idx];
    }
    for (int h : hits) BOOST_TEST(h > 0);
}

BOOST_AUTO_TEST_SUITE_END()
