// sbsim scoreboard simulator
//
// uop helpers
//

#include "uops.hh"

const std::unordered_map<u16, uopinfo> uopmap =
{
    // opcode           mnemonic    fu       control mask                    latency  description
    { uop_nop,      { "nop",      fu_alu,  0,                                1, "no operation"                   } },
    { uop_int,      { "int",      fu_ctrl, use_imm,                          1, "raise exception imm"            } },
    { uop_move,     { "move",     fu_alu,  use_ra,                           1, "rd = ra"                        } },
    { uop_set,      { "set",      fu_alu,  use_imm,                          1, "rd = imm"                       } },
    { uop_branch,   { "branch",   fu_brch, use_imm,                          1, "jump to imm, rd = link"         } },
    { uop_branchz,  { "branchz",  fu_brch, use_ra | use_imm,                 1, "jump to imm if ra == 0"         } },
    { uop_branchnz, { "branchnz", fu_brch, use_ra | use_imm,                 1, "jump to imm if ra != 0"         } },
    { uop_branchl,  { "branchl",  fu_brch, use_ra | use_rb | use_imm,        1, "jump to imm if ra < rb"         } },
    { uop_add,      { "add",      fu_alu,  use_ra | use_rb | use_imm,        1, "rd = ra + rb/imm"               } },
    { uop_sub,      { "sub",      fu_alu,  use_ra | use_rb | use_imm,        1, "rd = ra - rb/imm"               } },
    { uop_mul,      { "mul",      fu_mul,  use_ra | use_rb | use_imm,        3, "rd = ra * rb/imm"               } },
    { uop_divq,     { "divq",     fu_div,  use_ra | use_rb | use_imm,        8, "rd = ra / rb/imm"               } },
    { uop_divr,     { "divr",     fu_div,  use_ra | use_rb | use_imm,        8, "rd = ra % rb/imm"               } },
    { uop_lsl,      { "lsl",      fu_alu,  use_ra | use_rb | use_imm,        1, "rd = ra << rb/imm"              } },
    { uop_rsl,      { "rsl",      fu_alu,  use_ra | use_rb | use_imm,        1, "rd = ra >> rb/imm"              } },
    { uop_rsa,      { "rsa",      fu_alu,  use_ra | use_rb | use_imm,        1, "rd = ra >> rb/imm, arithmetic"  } },
    { uop_not,      { "not",      fu_alu,  use_ra,                           1, "rd = ~ra"                       } },
    { uop_and,      { "and",      fu_alu,  use_ra | use_rb | use_imm,        1, "rd = ra & rb/imm"               } },
    { uop_or,       { "or",       fu_alu,  use_ra | use_rb | use_imm,        1, "rd = ra | rb/imm"               } },
    { uop_xor,      { "xor",      fu_alu,  use_ra | use_rb | use_imm,        1, "rd = ra ^ rb/imm"               } },
};

u8 getFUType(const uop& op)
{
    auto it = uopmap.find(op.opcode);
    return (it == uopmap.end()) ? fu_none : it->second.fu_type;
}

u8 getWBPort(u8 futype)
{
    switch(futype)
    {
        default:
        case fu_ctrl:
        case fu_alu:
            return WB_PORT_ALU;
        case fu_brch:
            return WB_PORT_BRCH;
        case fu_mul:
            return WB_PORT_MUL;
        case fu_div:
            return WB_PORT_DIV;
    }
}

// print uops as hexstring
std::ostream& operator<<(std::ostream& os, const uop& uop)
{
    os << hex_u<16> << uop.opcode << " " << hex_u<16> << uop.control << " ";
    for(u8 i = 0; i < 4; i++) os << hex_u<8> << +uop.regs[i];
    os << " " << hex_u<64> << uop.imm;

    return os;
}

// mnemonic and operands
std::stringstream uop_readable(const uop& uop)
{
    std::stringstream ss;

    auto it = uopmap.find(uop.opcode);
    if(it == uopmap.end())
    {
        ss << "(undefined " << hex_u<16> << uop.opcode << ")";
        return ss;
    }

    const uopinfo& info = it->second;
    ss << str_w<9> << info.mnemonic << std::dec
       << "r" << +uop.regs[r_rd] << " <- ";

    if(uop.control & use_ra)  ss << "r" << +uop.regs[r_ra] << " ";
    if(uop.control & use_rb)  ss << "r" << +uop.regs[r_rb] << " ";
    if(uop.control & use_imm) ss << "imm " << hex_u<64> << uop.imm;

    ss << std::dec << "  [" << fu_type_str[info.fu_type] << "]";
    return ss;
}
