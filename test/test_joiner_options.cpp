/*

test_joiner_options.cpp
-----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE joiner_options_test

#include <boost/test/unit_test.hpp>

#include <vector>

#include <joinxx/joiner.hpp>
#include <joinxx/joiner_options.hpp>

using namespace joinxx;


BOOST_AUTO_TEST_CASE(defaults_are_empty)
{
    const joiner_options options = make_options({});
    BOOST_TEST(options.prefix.empty());
    BOOST_TEST(options.step.empty());
    BOOST_TEST(options.suffix.empty());
}

BOOST_AUTO_TEST_CASE(later_option_wins)
{
    const joiner_options options = make_options({with_step(","), with_prefix("a"), with_step(";")});
    BOOST_TEST(options.step == ";");
    BOOST_TEST(options.prefix == "a");
    BOOST_TEST(options.suffix.empty());
}

BOOST_AUTO_TEST_CASE(single_field_overrides_combined)
{
    const joiner_options options = make_options({with_joiner("[", ",", "]"), with_suffix(")")});
    BOOST_TEST(options.prefix == "[");
    BOOST_TEST(options.step == ",");
    BOOST_TEST(options.suffix == ")");
}

BOOST_AUTO_TEST_CASE(combined_overrides_single_fields)
{
    const joiner_options options = make_options({with_prefix("x"), with_step("y"), with_suffix("z"), with_joiner("", "|", "")});
    BOOST_TEST(options.prefix.empty());
    BOOST_TEST(options.step == "|");
    BOOST_TEST(options.suffix.empty());
}

BOOST_AUTO_TEST_CASE(runtime_option_list)
{
    std::vector<joiner_option> opts;
    opts.push_back(with_prefix("("));
    opts.push_back(joiner_option{});
    opts.push_back(with_suffix(")"));
    opts.push_back(with_step(" "));

    joiner j(opts);
    j.write_string("1");
    j.write_string("2");
    BOOST_TEST(j.str() == "(1 2)");
}

BOOST_AUTO_TEST_CASE(custom_option_function)
{
    joiner j{with_step(","), [](joiner_options& options) { options.prefix = options.step + "!"; }};
    j.write_string("a");
    BOOST_TEST(j.str() == ",!a");
}

BOOST_AUTO_TEST_CASE(options_record_directly)
{
    joiner_options options;
    options.prefix = "<<";
    options.step = "--";
    options.suffix = ">>";
    joiner j(options);
    j.write_string("a");
    j.write_string("b");
    BOOST_TEST(j.str() == "<<a--b>>");
    BOOST_TEST(j.size() == 8u);
}
