// sbsim scoreboard simulator
//
// utility
// - operators
// - logging
// - type conversions
//

#include <algorithm>
#include <fstream>

#include <cxxopts.hpp>

#ifdef simtest
#include <gtest/gtest.h>
#endif // simtest

#include "util.hh"
#include "sim.hh"

namespace util
{

// "a8ef.." -> [0xa8, 0xef, ...]
// see https://stackoverflow.com/a/30606613/9958527
vector<u8> str2vec(std::string& str)
{
    // remove comments
    for(size_t a = str.find("#"), b = str.find("\n", a);
        a != std::string::npos && b != std::string::npos;)
    {
        str.erase(a, b-a+1);
        a = str.find("#");
        b = str.find("\n", a);
    }

    // comment in the last line
    if(size_t a = str.find("#"); a != std::string::npos) str.erase(a);

    // remove remaining whitespace and newlines
    str.erase(std::remove(str.begin(), str.end(), ' '),  str.end());
    str.erase(std::remove(str.begin(), str.end(), '\t'), str.end());
    str.erase(std::remove(str.begin(), str.end(), '\r'), str.end());
    str.erase(std::remove(str.begin(), str.end(), '\n'), str.end());

    if((str.length() % 2 != 0) ||
        str.find_first_not_of("0123456789abcdefABCDEF", 0) != std::string::npos)
            return std::vector<u8>();

    std::vector<u8> bytes;
    bytes.reserve(str.length()/2);

    for(u64 i = 0; i < str.length(); i += 2)
    {
        std::string substr = str.substr(i, 2);
        u8 byte = (u8) strtoul(substr.c_str(), NULL, 16);
        bytes.push_back(byte);
    }

    return bytes;
}

// parse args to struct
int parseargs(int argc, char** argv, struct opts* myopts)
{
    cxxopts::Options options("sbsim", "scoreboard core simulator");

    options.custom_help("[options ..];  ./sbsim -v -e 8 -i programs/sum.hex");

    options.add_options()
        // option,                  description,                            default val
        ("l,loglv",             "set loglevel from 0-7",    cxxopts::value<u8>()->default_value("0")            )
        ("v,verbose",           "\"-l 7\"",                 cxxopts::value<bool>()->default_value("false")      )
        ("m,mcode",             "machine code",             cxxopts::value<std::string>()                       )
        ("i,infile",            "path to input file",       cxxopts::value<std::string>()                       )
        ("e,entries",           "scoreboard entries",       cxxopts::value<u32>()->default_value(
                                                                std::to_string(SB_ENTRIES))                     )
        ("c,cycles",            "max cycles before halt",   cxxopts::value<u64>()->default_value(
                                                                std::to_string(MAX_CYCLES))                     )
        ("p,predictor",         "select branch predictor",  cxxopts::value<std::string>()->default_value("btb") )
        ("t,time",              "measure simulation time"                                                       )
        ("h,help",              "print help"                                                                    )
        ;

    #ifdef simtest
    options.add_options()
        ("test",                "start googletest"                                                              )
        ;
    options.allow_unrecognised_options();
    #endif // simtest

    cxxopts::ParseResult opts;
    try { opts = options.parse(argc, argv); }
    catch (const std::exception& e) { util::abort(e.what()); }

    #ifdef simtest
    // this *will* ignore all other flags
    if(opts.count("test"))
        { ::testing::InitGoogleTest(&argc, argv); exit(RUN_ALL_TESTS()); }
    #endif // simtest

    if(opts.count("help") || argc == 1)
        { std::cout << BANNER_STRING << options.help() << std::endl; exit(EXIT_SUCCESS); }

    // loglevels
    // 0: nothing   1: ..   2: ..   3: ..   4: ..   5: ..   6: ..   7: everything
    loglevel = opts["loglv"].as<u8>();
    if (loglevel > 7 || opts["verbose"].as<bool>()) loglevel = 7;

    myopts->time    = opts.count("time");
    myopts->entries = opts["entries"].as<u32>();
    myopts->cycles  = opts["cycles"].as<u64>();

    // machine code
    if(!(opts.count("mcode")) && !(opts.count("infile")))
        util::abort("mcode or infile are required to run. Use -h for help.");
    else if(!(opts.count("infile")))
    {
        std::string mstr = opts["mcode"].as<std::string>();
        myopts->code = util::str2vec(mstr);
        if(myopts->code.empty()) util::abort("Machine code is not valid.");
    }
    else // read from file
    {
        std::ifstream infile (opts["infile"].as<std::string>());
        if(!infile) util::abort("File could not be opened.");
        std::string mstr;
        infile.seekg(0, std::ios::end);
        mstr.resize(infile.tellg());
        infile.seekg(0, std::ios::beg);
        infile.read(mstr.data(), mstr.size());
        infile.close();
        myopts->code = util::str2vec(mstr);
        if(myopts->code.empty()) util::abort("Machine code is not valid.");
    }

    // predictor select, default to btb
    std::string pstr = opts["predictor"].as<std::string>();
    if(pstr == "btb")         myopts->predictor = bp_btb;
    else if(pstr == "simple") myopts->predictor = bp_simple;
    else util::abort("Unknown predictor ", pstr, ". Use simple or btb.");

    return 0;
}

// store start-end in res
u8 timediff(timespec* res, timespec* start, timespec* end)
{
    if(end->tv_nsec < start->tv_nsec)
    {
        u32 psec = (start->tv_nsec - end->tv_nsec) / 1000000000 + 1;
        start->tv_nsec -= 1000000000 * psec;
        start->tv_sec  += psec;
    }
    if(end->tv_nsec - start->tv_nsec > 1000000)
    {
        u32 psec = (end->tv_nsec - start->tv_nsec) / 1000000000;
        start->tv_nsec += 1000000000 * psec;
        start->tv_sec  -= psec;
    }
    res->tv_nsec = end->tv_nsec - start->tv_nsec;
    res->tv_sec  = end->tv_sec  - start->tv_sec;

    return (end->tv_sec < start->tv_sec);
}

} // util

// print bytes from bytevector
std::ostream& operator<<(std::ostream& os, const std::vector<u8>& bytevec)
{
    for(u8 b: bytevec) os << hex_u<8> << +b << " ";

    return os;
}
