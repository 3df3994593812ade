/*

join_list.cpp
-------------

Joins command line arguments as a bracketed, comma separated list, then reuses
the joiner for a second list.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the MIT license, see the accompanying file LICENSE or
copy at https://opensource.org/licenses/MIT.

*/


#include <cstdlib>
#include <iostream>
#include <joinxx/joinxx.hpp>
#include "example_util.hpp"


using std::cout;
using std::endl;
using joinxx::joiner;
using joinxx::with_joiner;


int main(int argc, char* argv[])
{
    joinxx::log::logger::instance().set_level(joinxx::log::level::debug);

    joiner list{with_joiner("[", ", ", "]")};
    if (auto res = list.try_grow(64); !res)
    {
        print_error(res.error());
        return EXIT_FAILURE;
    }

    for (int i = 1; i < argc; ++i)
        list.write_string(argv[i]);
    cout << list.str() << " (" << list.size() << " chars)" << endl;
    // With arguments `a b c`, prints `[a, b, c] (9 chars)`.

    list.reset();
    list.write_rune(U'α');
    list.write_rune(U'β');
    list.write_rune(U'γ');
    cout << list.str() << endl;
    // Prints `[α, β, γ]`.

    // A negative count is rejected; grow() would throw instead.
    if (auto res = list.try_grow(-1); !res)
        print_error(res.error());

    return EXIT_SUCCESS;
}
