// sbsim scoreboard simulator
//
// types and global structs
//

#ifndef SBSIM_TYPES_H
#define SBSIM_TYPES_H

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <deque>
#include <exception>
#include <string>
#include <sstream>
#include <vector>

typedef uint8_t     u8;
typedef uint16_t    u16;
typedef uint32_t    u32;
typedef uint64_t    u64;

typedef int8_t      i8;
typedef int16_t     i16;
typedef int32_t     i32;
typedef int64_t     i64;

typedef float       f32;
typedef double      f64;

typedef std::string string;

template<class T>
using vector =      std::vector<T>;

template<class T, class U>
using pair =        std::pair<T, U>;

struct opts
{
    // this maps the entire program
    vector<u8> code;
    u64 cycles;
    u32 entries;
    u8  predictor;
    u8  time;
} __attribute__((aligned(16))); // opts

struct uop
{
    u16 opcode;
    u16 control;
    u8  regs[4]; // abcd
    u64 imm;
} __attribute__((packed, aligned(16))); // uop

const uop zero_op = { 0, 0, { 0 }, 0 };

// uop plus fetch metadata, carried verbatim through the scoreboard
struct inst
{
    uop op;
    u64 rip;  // fetch address
    u64 next; // predicted next fetch address
}; // inst

const inst zero_inst = { zero_op, 0, 0 };

// hold values until release condition is met
// values are available at the output once their cycle is reached
template<typename T>
class LatchQueue
{
    public:
    LatchQueue(u32 max_size);

    bool    ready(u64 cycle);

    bool    empty();
    size_t  size();

    int     clear();
    void    push_back(u64 cycle, T elem);

    T       get_front(u64 cycle);
    T&      front(u64 cycle);
    void    pop_front();

    T&      at(u64 cycle, u64 index);

    struct LatchQElem
    {
        u64 cycle;
        T   elem;
    }; // LatchQElem

    private:
    u32                     max_size;
    std::deque<LatchQElem>  queue;
}; // LatchQueue

struct SimulatorException : public std::exception
{
    const char* what () const throw ()
    {   return "unspecified simulator exception."; }
}; // SimulatorException

struct LatchException : public SimulatorException {};

struct LatchEmptyException : public LatchException
{
    const char* what () const throw ()
    {   return "is empty."; }
}; // LatchEmptyException

struct LatchFullException : public LatchException
{
    const char* what () const throw ()
    {   return "is full."; }
}; // LatchFullException

struct LatchStallException : public LatchException
{
    const char* what () const throw ()
    {   return "content is not ready."; }
}; // LatchStallException

#include "types.tt"

#endif // SBSIM_TYPES_H
