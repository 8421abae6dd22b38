// -*- mode: c++ -*-
// Copyright 2020- Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE params

#include <defs.hh>

#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <utils/path.hh>
#include <utils/string.hh>

#include <glyphtext/batch_extractor.hh>
#include <glyphtext/caches.hh>
#include <glyphtext/error.hh>
#include <glyphtext/memory_source.hh>
#include <glyphtext/params.hh>

using namespace glyphtext;

BOOST_TEST_DONT_PRINT_LOG_VALUE(std::vector< std::string >)

namespace {

//
// Captures the diagnostics for the lifetime of the fixture:
//
struct fixture_t
{
    fixture_t() {
        set_error_callback([this](error_category_t category, int page,
                                  const std::string &msg) {
            log.emplace_back(category, page, msg);
        });
    }

    ~fixture_t() { set_error_callback({ }); }

    void parse(params_t &params, const std::string &text) {
        std::istringstream ss(text);
        params.parse_stream(ss, "test.rc");
    }

    std::vector< std::tuple< error_category_t, int, std::string > > log;
};

//
// A file in the temporary directory, removed on destruction:
//
struct temp_file_t
{
    explicit temp_file_t(const std::string &text) : path(make_temp_path()) {
        std::ofstream(path) << text;
    }

    ~temp_file_t() {
        std::error_code ec;
        fs::remove(path, ec);
    }

    fs::path path;
};

} // anonymous

BOOST_AUTO_TEST_SUITE(utils)

static const std::vector< std::tuple< std::string, std::vector< std::string > > >
tokenize_dataset = {
    { "",                         { } },
    { "   ",                      { } },
    { "workers 4",                { "workers", "4" } },
    { "  workers\t4  ",           { "workers", "4" } },
    { "rowSeparator \" | \"",     { "rowSeparator", " | " } },
    { "rowSeparator ''",          { "rowSeparator", "" } },
    { "include '~/my file.rc' x", { "include", "~/my file.rc", "x" } }
};

BOOST_DATA_TEST_CASE(
    tokenize_, data::make(tokenize_dataset), text, result) {
    BOOST_TEST(tokenize(text) == result, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(unescape_) {
    BOOST_TEST(unescape("a\\nb") == "a\nb");
    BOOST_TEST(unescape("\\t\\r\\\\") == "\t\r\\");
    BOOST_TEST(unescape("\\x") == "\\x");
    BOOST_TEST(unescape("end\\") == "end\\");
}

BOOST_AUTO_TEST_CASE(utf8_length_) {
    BOOST_TEST(utf8_length("") == 0U);
    BOOST_TEST(utf8_length("abc") == 3U);
    BOOST_TEST(utf8_length("\xc3\xa9t\xc3\xa9") == 3U);
    BOOST_TEST(utf8_length("\xe2\x82\xac") == 1U);
}

BOOST_AUTO_TEST_CASE(expand_path_) {
    BOOST_TEST(expand_path("~/x.rc") == home_path() / "x.rc");
    BOOST_TEST(expand_path("/etc/x.rc") == fs::path("/etc/x.rc"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(params, fixture_t)

BOOST_AUTO_TEST_CASE(defaults) {
    params_t params;

    BOOST_TEST(params.workers == 0);
    BOOST_TEST((params.ordering == ordering_t::smart));
    BOOST_TEST(params.cache_capacity == 0);
    BOOST_TEST(params.font_cache_capacity == 1000);
    BOOST_TEST(params.page_cache_capacity == 10);
    BOOST_TEST(params.buffer_pool_size == 32);
    BOOST_TEST(params.buffer_size == 2048);
    BOOST_TEST(params.row_separator == "\n");
    BOOST_TEST(params.page_separator == "\n");
    BOOST_TEST(params.min_row_tolerance == 1.);
    BOOST_TEST(params.column_gap_fraction == .05);
    BOOST_TEST(!params.insert_spaces);
    BOOST_TEST((params.error_policy == error_policy_t::strict));
    BOOST_TEST(!params.verbose);
}

BOOST_AUTO_TEST_CASE(keywords) {
    params_t params;

    parse(params,
          "# extraction settings\n"
          "workers 3\n"
          "ordering simple\n"
          "cacheCapacity 250\n"
          "fontCacheCapacity 50\n"
          "pageCacheCapacity 4\n"
          "bufferPoolSize 8\n"
          "bufferSize 512\n"
          "rowSeparator \"\\r\\n\"\n"
          "pageSeparator '\\f'\n"
          "\n"
          "minRowTolerance 2.5\n"
          "columnGapFraction 0.1\n"
          "insertSpaces yes\n"
          "errorPolicy partial\n"
          "verbose yes\n");

    BOOST_TEST(log.empty());

    BOOST_TEST(params.workers == 3);
    BOOST_TEST((params.ordering == ordering_t::simple));
    BOOST_TEST(params.cache_capacity == 250);
    BOOST_TEST(params.font_cache_capacity == 50);
    BOOST_TEST(params.page_cache_capacity == 4);
    BOOST_TEST(params.buffer_pool_size == 8);
    BOOST_TEST(params.buffer_size == 512);
    BOOST_TEST(params.row_separator == "\r\n");
    BOOST_TEST(params.page_separator == "\\f");
    BOOST_TEST(params.min_row_tolerance == 2.5);
    BOOST_TEST(params.column_gap_fraction == .1);
    BOOST_TEST(params.insert_spaces);
    BOOST_TEST((params.error_policy == error_policy_t::partial));
    BOOST_TEST(params.verbose);
}

static const std::vector< std::string > bad_lines = {
    "workers",
    "workers four",
    "workers -2",
    "workers 3 4",
    "workers 4294967297",
    "workers 99999999999999999999",
    "ordering columnar",
    "cacheCapacity 1e3",
    "minRowTolerance x",
    "columnGapFraction -0.5",
    "verbose maybe",
    "errorPolicy lenient",
    "rowSeparator",
    "include",
    "unknownKeyword 1"
};

BOOST_DATA_TEST_CASE(
    bad_line, data::make(bad_lines), line) {

    params_t params;
    parse(params, "workers 2\n" + line + "\n");

    //
    // Reported with the file and line, previous values kept:
    //
    BOOST_TEST_REQUIRE(log.size() == 1U);
    BOOST_TEST((std::get< 0 >(log[0]) == error_category_t::config));
    BOOST_TEST(std::get< 2 >(log[0]).find("(test.rc:2)") != std::string::npos);

    BOOST_TEST(params.workers == 2);
    BOOST_TEST((params.ordering == ordering_t::smart));
    BOOST_TEST(!params.verbose);
}

BOOST_AUTO_TEST_CASE(include) {
    temp_file_t inner("workers 6\nverbose yes\n");
    temp_file_t outer(
        "workers 2\ninclude \"" + inner.path.string() + "\"\nordering simple\n");

    params_t params;

    BOOST_TEST(params.parse_file(outer.path));
    BOOST_TEST(log.empty());

    BOOST_TEST(params.workers == 6);
    BOOST_TEST(params.verbose);
    BOOST_TEST((params.ordering == ordering_t::simple));
}

BOOST_AUTO_TEST_CASE(missing_include) {
    params_t params;
    parse(params, "include /nonexistent/glyphtext.rc\n");

    BOOST_TEST_REQUIRE(log.size() == 1U);
    BOOST_TEST(
        std::get< 2 >(log[0]).find("Couldn't find included config file") !=
        std::string::npos);
}

BOOST_AUTO_TEST_CASE(recursive_include) {
    temp_file_t self("workers 1\n");

    {
        std::ofstream(self.path)
            << "workers 1\ninclude \"" << self.path.string() << "\"\n";
    }

    params_t params;
    BOOST_TEST(params.parse_file(self.path));

    BOOST_TEST(params.workers == 1);
    BOOST_TEST_REQUIRE(log.size() == 1U);
    BOOST_TEST(
        std::get< 2 >(log[0]).find("nested too deeply") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(missing_file) {
    params_t params;
    BOOST_TEST(!params.parse_file("/nonexistent/glyphtext.rc"));
}

BOOST_AUTO_TEST_CASE(lookup) {
    temp_file_t explicit_file("workers 5\n");
    temp_file_t env_file("workers 7\n");

    ::setenv(GLYPHTEXT_RC_ENV, env_file.path.c_str(), 1);

    BOOST_TEST(
        find_config_file(explicit_file.path.string()).value() ==
        explicit_file.path);
    BOOST_TEST(find_config_file().value() == env_file.path);

    BOOST_TEST(load_params(explicit_file.path.string()).workers == 5);
    BOOST_TEST(load_params().workers == 7);

    //
    // A missing explicit file is reported and the lookup goes on:
    //
    BOOST_TEST(load_params("/nonexistent/glyphtext.rc").workers == 7);
    BOOST_TEST_REQUIRE(log.size() == 1U);
    BOOST_TEST((std::get< 0 >(log[0]) == error_category_t::io));

    ::unsetenv(GLYPHTEXT_RC_ENV);
}

BOOST_AUTO_TEST_CASE(options) {
    params_t params;
    parse(params,
          "workers 2\nordering simple\ncacheCapacity 9\nfontCacheCapacity 3\n"
          "rowSeparator ' '\ninsertSpaces yes\nminRowTolerance 4\n"
          "columnGapFraction 0.2\n");

    cancellation_token_t token;

    const auto opts = params.batch_options(token);

    BOOST_TEST(opts.workers == 2);
    BOOST_TEST((opts.ordering == ordering_t::simple));
    BOOST_TEST(opts.cache_capacity == 9);
    BOOST_TEST(opts.font_cache_capacity == 3);
    BOOST_TEST(opts.row_separator == " ");
    BOOST_TEST(opts.insert_spaces);
    BOOST_TEST(opts.layout.min_row_tolerance == 4.);
    BOOST_TEST(opts.layout.column_gap_fraction == .2);

    token.cancel();
    BOOST_TEST(opts.cancellation.cancelled());

    const auto eopts = params.extract_options();

    BOOST_TEST((eopts.ordering == ordering_t::simple));
    BOOST_TEST(eopts.row_separator == " ");
    BOOST_TEST(eopts.insert_spaces);
    BOOST_TEST(eopts.layout.min_row_tolerance == 4.);

    const auto pool = params.make_buffer_pool();
    BOOST_TEST(pool->acquire()->capacity() >= 2048U);
}

BOOST_AUTO_TEST_CASE(error_policy) {
    auto source = std::make_shared< memory_source_t >();

    source->add_font(ref_t{ 1, 0 }, font_t{ "Helvetica" });
    source->add_page(1, { { 0, 10, 10, ref_t{ 1, 0 }, "one" } });
    source->add_page(2, { { 0, 10, 10, ref_t{ 1, 0 }, "two" } });
    source->fail_page(2);

    batch_extractor_t extractor(std::make_shared< caching_source_t >(source));

    params_t params;

    BOOST_CHECK_THROW(params.extract(extractor, { 1, 2 }), extraction_error);

    params.error_policy = error_policy_t::partial;

    const auto results = params.extract(extractor, { 1, 2 });

    BOOST_TEST_REQUIRE(results.size() == 2U);
    BOOST_TEST(results[0].text == "one");
    BOOST_TEST(!results[1].ok());
}

BOOST_AUTO_TEST_CASE(streaming) {
    auto source = std::make_shared< memory_source_t >();

    source->add_font(ref_t{ 1, 0 }, font_t{ "Helvetica" });

    for (int i = 1; i <= 4; ++i) {
        source->add_page(i, { { 0, 10, 10, ref_t{ 1, 0 }, "x" } });
    }

    params_t params;
    parse(params,
          "pageCacheCapacity 2\nverbose yes\nbufferPoolSize 1\n"
          "bufferSize 4096\n");

    auto stream = params.make_streaming_extractor(source);

    BOOST_TEST(stream->pages().capacity() == 2);

    //
    // The stream builds its text in buffers of the configured pool:
    //
    const auto &buffers = stream->pages().extractor().buffers();
    BOOST_TEST_REQUIRE(buffers);
    BOOST_TEST(buffers->acquire()->capacity() >= 4096U);

    while (stream->state() != stream_state_t::done) {
        stream->next();
    }

    //
    // Pages 3 and 4 each evicted one resident page:
    //
    BOOST_TEST(log.size() == 2U);

    for (const auto &entry : log) {
        BOOST_TEST((std::get< 0 >(entry) == error_category_t::warning));
    }
}

BOOST_AUTO_TEST_CASE(callback) {
    error(error_category_t::internal, 12, "value {} out of range", 42);

    BOOST_TEST_REQUIRE(log.size() == 1U);
    BOOST_TEST((std::get< 0 >(log[0]) == error_category_t::internal));
    BOOST_TEST(std::get< 1 >(log[0]) == 12);
    BOOST_TEST(std::get< 2 >(log[0]) == "value 42 out of range");

    BOOST_TEST(bool(error_callback()));

    set_error_callback({ });
    error(error_category_t::internal, 12, "dropped");

    BOOST_TEST(log.size() == 1U);
    BOOST_TEST(!error_callback());

    BOOST_TEST(std::string(to_string(error_category_t::config)) == "Config Error");
}

BOOST_AUTO_TEST_SUITE_END()
