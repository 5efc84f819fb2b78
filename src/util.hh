// sbsim scoreboard simulator
//
// utility
// - operators
// - logging
// - type conversions
//

#ifndef SBSIM_UTIL_H
#define SBSIM_UTIL_H

#include "types.hh"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <time.h>

#define outfile     std::cout
#define errorfile   std::cerr

#define HLINE       "------------------------------------------------------------------------------\
----------------------"
#define H2LINE      "==============================================================================\
======================"

// global vars
extern u8 loglevel;

// operators and streams
std::ostream& operator<<(std::ostream& os, const vector<u8>& bytevec);
std::ostream& operator<<(std::ostream& os, const uop& uop);

std::stringstream uop_readable(const uop& uop);

// pretty print hex with N bits
template<u32 N>
std::ostream& hex_u(std::ostream& os)
{   // don't forget to promote uchar to int or there won't be visible output
    return os << std::hex << std::setw(N / 4) << std::right << std::setfill('0');
}

// decimal with N digits
template<u32 N>
std::ostream& dec_u(std::ostream& os)
{   // don't forget to promote uchar to int or there won't be visible output
    return os << std::dec << std::setw(N) << std::left << std::setfill(' ');
}

template<u32 N>
std::ostream& dec_u_lf(std::ostream& os)
{   // don't forget to promote uchar to int or there won't be visible output
    return os << std::dec << std::setw(N) << std::setfill('0') << std::right;
}

// str with set width and no fill
template<u32 N>
std::ostream& str_w(std::ostream& os)
{
    return os << std::setw(N) << std::setfill(' ') << std::left;
}

namespace util
{
    // abort with error message
    template<class... T> inline
    void abort(T... str) { (errorfile << ... << str) << "\n"; exit(EXIT_FAILURE); }

#ifdef nolog
    template<class... T> inline
    void log(u8 lv, T... str) { (void)(lv); ((void)(str),...); }

    template<class... T> inline
    void log_always(T... str) { (outfile << ... << str) << "\n"; }
#else
    // log message depending on loglevel
    template<class... T> inline
    void log(u8 lv, T... str) { if(lv <= loglevel) (outfile << ... << str) << "\n"; }

    // always log message
    template<class... T> inline
    void log_always(T ... str) { log(0, str ...); }
#endif // nolog

    vector<u8> str2vec(string& str);
    int parseargs(int argc, char** argv, struct opts* opts);

    // power of two, zero excluded
    constexpr bool is_pow2(u64 x) { return x && !(x & (x - 1)); }

    // gnu.org/software/libc/manual/html_node/Calculating-Elapsed-Time.html
    u8 timediff(timespec* res, timespec* start, timespec* end);
} // util

#endif // SBSIM_UTIL_H
