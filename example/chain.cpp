//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  example/chain.cpp
//

//
//  IAPPA CM Revision # : $Revision$
//  IAPPA CM Tag        : $Name:  $
//  Last user to change : $Author$
//  Date of change      : $Date$
//  File Path           : $Source$
//  Source of funding   : IAPPA
//
//  CAUTION:  CONTROLLED SOURCE.  DO NOT MODIFY ANYTHING ABOVE THIS LINE.
//

#include "coloop/coroutine/task.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>


using namespace Coloop::Coroutine;
using std::cerr;
using std::cout;
using std::endl;


/*
    Pass a value from right to left, adding one at each link.
*/
Task
chain(Write_channel<int> left, Read_channel<int> right)
{
    const int n = co_await right.read();
    co_await left.write(n + 1);
}


Task
drive(Write_channel<int> rightmost, Read_channel<int> leftmost, int* resultp)
{
    co_await rightmost.write(0);
    *resultp = co_await leftmost.read();
}


Task
print_seconds(Scheduler* schedp, int n)
{
    using namespace std::literals::chrono_literals;

    Timer timer{*schedp, 1s};

    for (int i = 0; i < n; ++i) {
        if (i > 0)
            timer.reset(1s);
        co_await timer.read();
        cout << ' ' << i + 1 << std::flush;
    }

    cout << '\n';
}


int
main(int argc, char* argv[])
{
    if (argc < 2 || argc > 3) {
        cerr << "usage: " << argv[0] << " count [seconds]\n";
        return EXIT_FAILURE;
    }

    Scheduler   scheduler;
    int         result  = 0;
    const int   n       = std::max(std::atoi(argv[1]), 0);
    const int   nsecs   = (argc == 3) ? std::max(std::atoi(argv[2]), 0) : 0;

    try {
        if (n > 0) {
            const Channel<int>  leftmost    = make_channel<int>();
            Channel<int>        right       = leftmost;

            for (int i = 0; i != n; ++i) {
                const Channel<int> left = right;

                right = make_channel<int>(50);
                scheduler.spawn(chain(left, right));
            }

            scheduler.spawn(drive(right, leftmost, &result));
        }

        if (nsecs > 0)
            scheduler.spawn(print_seconds(&scheduler, nsecs));

        scheduler.run();
    } catch (const std::exception& e) {
        cerr << argv[0] << ": " << e.what() << endl;
        return EXIT_FAILURE;
    }

    cout << "total = " << result << endl;
    return EXIT_SUCCESS;
}

//  $CUSTOM_FOOTER$
