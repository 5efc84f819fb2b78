// sbsim scoreboard simulator
//
// uop definitions
//

#ifndef SBSIM_UOPS_H
#define SBSIM_UOPS_H

#include "../types.hh"
#include "../util.hh"

#include "cconf.hh"

#include <unordered_map>

// uop metadata
struct uopinfo
{
    string      mnemonic;       // readable instruction name
    u8          fu_type;        // FU type this uop runs on
    u16         ctrl_mask;      // allowed control bits (check or)
    u32         latency;        // execution latency
    string      description;    // uop description
}; // uopinfo

// bitmask for uop.control
typedef enum
{
    use_ra    = 0x0001, // used source operands
    use_rb    = 0x0002, // ..
    use_imm   = 0x0008, // immediate replaces rb
} uop_ctrl;

typedef enum
{
    r_ra, r_rb, r_rc, r_rd,
} uop_regs;

typedef enum
{
    branch_none,
    branch_cond,
    branch_uncond,
} branch_type;

// fu identifier, fu_none doubles as "no in flight writer" in clobber maps
typedef enum
{
    fu_none,
    fu_ctrl,
    fu_alu,
    fu_brch,
    fu_mul,
    fu_div,
    fu_max,
} fu_type;

const std::string fu_type_str[fu_max] =
{
    ("none"), ("ctrl"), ("alu"), ("brnch"), ("mul"), ("div"),
};

// core exceptions
typedef enum
{
    ex_NONE     = 0x00, // no exception
    ex_UD       = 0x01, // undefined opcode
    ex_PF       = 0x03, // fetch outside of the program image
    ex_REG      = 0x04, // invalid register reference
    ex_BP       = 0x07, // breakpoint
    ex_HALT     = 0x08, // halt
    ex_DE       = 0x09, // divide error
    ex_UNSPEC   = 0x0a,
    ex_MAX,
} core_exceptions;

const std::string exception_str[ex_MAX] =
{
    ("none"), ("undefined opcode"), (""), ("page fault"), ("invalid register reference"),
    (""), (""), ("breakpoint"), ("halt"), ("divide error"), ("unspecified")
};

typedef enum
{
    // control
    uop_nop       = 0x0000, // no-op
    uop_int       = 0x0010, // interrupt, imm holds the exception
    uop_move      = 0x0040, // copy reg to reg
    uop_set       = 0x0048, // set reg to imm
    uop_branch    = 0x0060, // jump unconditional
    uop_branchz   = 0x0074, // jump if ra == 0
    uop_branchnz  = 0x0075, // jump if ra != 0
    uop_branchl   = 0x007c, // jump if ra < rb (signed)

    // alu
    uop_add       = 0x1010, // add
    uop_sub       = 0x1012, // sub
    uop_mul       = 0x1020, // mul
    uop_divq      = 0x1029, // division quotient
    uop_divr      = 0x102a, // division remainder
    uop_lsl       = 0x1030, // <<
    uop_rsl       = 0x1031, // >>
    uop_rsa       = 0x1033, // sar
    uop_not       = 0x1040, // ~
    uop_and       = 0x1041, // &
    uop_or        = 0x1042, // |
    uop_xor       = 0x1043, // ^
} uop_opcodes;

extern const std::unordered_map<u16, uopinfo> uopmap;

constexpr u8  getDest(const uop& op)     { return op.regs[r_rd]; }

constexpr u8  is_branch(const uop& op)
{
    return (op.opcode >= 0x60 && op.opcode < 0x70) ? branch_uncond :
        (op.opcode >= 0x70 && op.opcode < 0x80) ? branch_cond :
        branch_none;
}

// upper 16 bits = errorcode, lower 16 bits exception number
constexpr u32 setExcept(u16 e, u16 c) { return (((u32)c << 16) | e); }
constexpr u32 getExceptNum(u32 e)     { return e & 0xffff; }
constexpr u32 getExceptEC(u32 e)      { return e >> 16; }

// fu type of a uop, fu_none if the opcode is undefined
u8 getFUType(const uop& op);

// write back port of a fu type
u8 getWBPort(u8 futype);

#endif // SBSIM_UOPS_H
