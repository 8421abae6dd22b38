// -*- mode: c++ -*-
// Copyright 2020- Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE reading_order

#include <defs.hh>

#include <string>
#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <glyphtext/page_extractor.hh>
#include <glyphtext/reading_order.hh>

BOOST_TEST_DONT_PRINT_LOG_VALUE(std::vector< double >)

using namespace glyphtext;

static text_run_t
make_run(double x, double y, const char *s, double width = 0, double size = 10)
{
    return text_run_t{ x, y, size, "F1", s, width };
}

static std::string
text_of(const text_runs_t &runs, ordering_t ordering,
        const layout_params_t &params = { })
{
    return to_text(order_rows(runs, ordering, params));
}

//
// Two columns, x in [0, 5] and [50, 55], in content order row by row:
//
static text_runs_t two_columns()
{
    return {
        make_run( 0, 100, "L1", 5), make_run(50, 100, "R1", 5),
        make_run( 0,  80, "L2", 5), make_run(50,  80, "R2", 5),
        make_run( 0,  60, "L3", 5), make_run(50,  60, "R3", 5)
    };
}

//
// One column, with word gaps not aligned across rows:
//
static text_runs_t one_column()
{
    return {
        make_run( 0, 100, "The",   15), make_run(20, 100, "quick", 25),
        make_run( 0,  88, "brown", 25), make_run(28,  88, "fox",   15),
        make_run( 0,  76, "jumps", 25)
    };
}

BOOST_AUTO_TEST_SUITE(rows)

BOOST_AUTO_TEST_CASE(simple_rows) {
    const text_runs_t runs = {
        make_run(0, 10, "A"), make_run(5, 10, "B"), make_run(0, 0, "C")
    };

    const auto rows = make_rows(runs, row_tolerance(runs));

    BOOST_TEST_REQUIRE(rows.size() == 2U);

    BOOST_TEST(rows[0].y == 10);
    BOOST_TEST(rows[0].runs.size() == 2U);
    BOOST_TEST(rows[1].y == 0);
    BOOST_TEST(rows[1].runs.size() == 1U);

    BOOST_TEST(text_of(runs, ordering_t::simple) == "AB\nC");
    BOOST_TEST(text_of(runs, ordering_t::smart) == "AB\nC");
}

BOOST_AUTO_TEST_CASE(baseline_tolerance) {
    //
    // Baselines within half the font size share a row:
    //
    const text_runs_t runs = {
        make_run(30, 9.5, "c"), make_run(0, 10, "a"), make_run(15, 8, "b"),
        make_run(0, 4, "d")
    };

    BOOST_TEST(text_of(runs, ordering_t::simple) == "abc\nd");
}

BOOST_AUTO_TEST_CASE(stable_ties) {
    const text_runs_t ab = { make_run(0, 10, "a"), make_run(0, 10, "b") };
    const text_runs_t ba = { make_run(0, 10, "b"), make_run(0, 10, "a") };

    BOOST_TEST(text_of(ab, ordering_t::simple) == "ab");
    BOOST_TEST(text_of(ba, ordering_t::simple) == "ba");
    BOOST_TEST(text_of(ab, ordering_t::smart) == "ab");
    BOOST_TEST(text_of(ba, ordering_t::smart) == "ba");
}

BOOST_AUTO_TEST_CASE(empty) {
    const text_runs_t runs;

    BOOST_TEST(order_rows(runs, ordering_t::simple).empty());
    BOOST_TEST(order_rows(runs, ordering_t::smart).empty());
    BOOST_TEST(make_columns(runs).empty());
    BOOST_TEST(order(runs, ordering_t::smart).empty());
}

static const std::vector< std::tuple< std::vector< double >, double > >
tolerance_dataset = {
    { std::vector< double >{ }, 1.  },
    { { 10              }, 5.  },
    { { 10, 10, 12      }, 5.  },
    { { 10, 12, 12, 9   }, 6.  },
    { { 12, 10          }, 5.  },
    { {  1,  1          }, 1.  },
    { { 0               }, 1.  }
};

BOOST_DATA_TEST_CASE(
    row_tolerance_, data::make(tolerance_dataset), sizes, result) {

    text_runs_t runs;

    for (auto size : sizes) {
        runs.push_back(make_run(0, 0, "x", 0, size));
    }

    BOOST_TEST(row_tolerance(runs) == result);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(columns)

BOOST_AUTO_TEST_CASE(two_columns_) {
    const auto runs = two_columns();

    //
    // Simple ordering interleaves the columns:
    //
    BOOST_TEST(
        text_of(runs, ordering_t::simple) == "L1R1\nL2R2\nL3R3");

    BOOST_TEST(
        text_of(runs, ordering_t::smart) == "L1\nL2\nL3\nR1\nR2\nR3");

    const auto gaps = find_gaps(runs);

    BOOST_TEST_REQUIRE(gaps.size() == 1U);
    BOOST_TEST(gaps[0].xmin == 5.);
    BOOST_TEST(gaps[0].xmax == 50.);

    const auto columns = make_columns(runs);

    BOOST_TEST_REQUIRE(columns.size() == 2U);

    BOOST_TEST(columns[0].xmin == 0.);
    BOOST_TEST(columns[0].xmax == 5.);
    BOOST_TEST(columns[0].rows.size() == 3U);

    BOOST_TEST(columns[1].xmin == 50.);
    BOOST_TEST(columns[1].xmax == 55.);
    BOOST_TEST(columns[1].rows.size() == 3U);
}

BOOST_AUTO_TEST_CASE(three_columns) {
    const text_runs_t runs = {
        make_run(100, 50, "c1", 10), make_run(50, 50, "b1", 10),
        make_run(  0, 50, "a1", 10), make_run(0, 30, "a2", 10),
        make_run( 50, 30, "b2", 10), make_run(100, 30, "c2", 10)
    };

    BOOST_TEST(find_gaps(runs).size() == 2U);
    BOOST_TEST(
        text_of(runs, ordering_t::smart) == "a1\na2\nb1\nb2\nc1\nc2");
}

BOOST_AUTO_TEST_CASE(narrow_gap) {
    //
    // A gap narrower than the configured fraction of the width is no column
    // boundary:
    //
    layout_params_t params;
    params.column_gap_fraction = .9;

    const auto runs = two_columns();

    BOOST_TEST(find_gaps(runs, params).empty());
    BOOST_TEST(
        text_of(runs, ordering_t::smart, params) ==
        text_of(runs, ordering_t::simple, params));
}

BOOST_AUTO_TEST_CASE(single_column_fallback) {
    const auto runs = one_column();

    BOOST_TEST(find_gaps(runs).empty());
    BOOST_TEST(make_columns(runs).size() == 1U);

    BOOST_TEST(
        text_of(runs, ordering_t::smart) == text_of(runs, ordering_t::simple));
    BOOST_TEST(
        text_of(runs, ordering_t::smart) == "Thequick\nbrownfox\njumps");

    const auto lhs = order(runs, ordering_t::smart);
    const auto rhs = order(runs, ordering_t::simple);

    BOOST_TEST_REQUIRE(lhs.size() == rhs.size());

    for (size_t i = 0; i < lhs.size(); ++i) {
        BOOST_TEST(lhs[i].text == rhs[i].text);
        BOOST_TEST(lhs[i].x == rhs[i].x);
        BOOST_TEST(lhs[i].y == rhs[i].y);
    }
}

BOOST_AUTO_TEST_CASE(deterministic) {
    auto runs = two_columns();

    for (const auto &run : one_column()) {
        auto other = run;
        other.y -= 200;
        runs.push_back(other);
    }

    const auto first = text_of(runs, ordering_t::smart);

    for (int i = 0; i < 16; ++i) {
        BOOST_TEST(text_of(runs, ordering_t::smart) == first);
    }
}

//
// Ten rows per column, so that a single run crossing the gap stays below
// the coverage noise level:
//
static text_runs_t tall_columns()
{
    text_runs_t runs;

    for (int i = 0; i < 10; ++i) {
        const double y = 200 - 10 * i;

        runs.push_back(make_run( 0, y, "L", 5));
        runs.push_back(make_run(50, y, "R", 5));
    }

    return runs;
}

BOOST_AUTO_TEST_CASE(straddling_run_right) {
    auto runs = tall_columns();
    runs.push_back(make_run(20, 20, "S", 40));

    const auto columns = make_columns(runs);

    BOOST_TEST_REQUIRE(columns.size() == 2U);
    BOOST_TEST(columns[0].rows.size() == 10U);
    BOOST_TEST(columns[1].rows.size() == 11U);
    BOOST_TEST(columns[1].rows.back().runs.front().text == "S");
}

BOOST_AUTO_TEST_CASE(straddling_run_left) {
    auto runs = tall_columns();
    runs.push_back(make_run(8, 20, "S", 30));

    const auto columns = make_columns(runs);

    BOOST_TEST_REQUIRE(columns.size() == 2U);
    BOOST_TEST(columns[0].rows.size() == 11U);
    BOOST_TEST(columns[0].rows.back().runs.front().text == "S");
    BOOST_TEST(columns[1].rows.size() == 10U);
}

BOOST_AUTO_TEST_SUITE_END()
