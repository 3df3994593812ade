/*

test_error_detail.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_detail_test

#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <limits>

#include <joinxx/detail/error_detail.hpp>


BOOST_AUTO_TEST_CASE(error_detail_key_values)
{
    joinxx::detail::error_detail detail;
    detail.add("op", "grow").add_int("requested", -3).add_size("size", 12);
    BOOST_TEST(detail.str() == "op=grow\nrequested=-3\nsize=12\n");
}

BOOST_AUTO_TEST_CASE(error_detail_extremes)
{
    joinxx::detail::error_detail detail;
    detail.add_int("min", std::numeric_limits<std::int64_t>::min());
    detail.add_size("max", std::numeric_limits<std::uint64_t>::max());
    BOOST_TEST(detail.str() == "min=-9223372036854775808\nmax=18446744073709551615\n");
}

BOOST_AUTO_TEST_CASE(error_detail_starts_empty)
{
    joinxx::detail::error_detail detail;
    BOOST_TEST(detail.str().empty());
}
