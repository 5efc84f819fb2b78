// sbsim scoreboard simulator
//
// scoreboard
// - in flight instructions from allocation to commit
// - register clobber and operand forwarding for issue
// - write back from functional units
//

#ifndef SBSIM_SCOREBOARD_H
#define SBSIM_SCOREBOARD_H

#include "cconf.hh"
#include "uops.hh"

#include "../types.hh"
#include "../util.hh"

namespace SB
{
    // one scoreboard slot
    struct Entry
    {
        inst  in;       // decoded instruction, carried verbatim
        u8    fu;       // fu_type producing the result
        u16   trans_id; // slot index at allocation
        u64   result;   // valid only with valid set
        u32   except;   // ex_NONE or setExcept(..), valid only with valid set
        u8    valid;    // write back landed
    }; // Entry

    const Entry zero_entry = { zero_inst, fu_none, 0, 0, ex_NONE, 0 };

    // one functional unit result per port and tick
    struct WBPort
    {
        u16   trans_id;
        u64   data;
        u32   except;
        u8    valid;    // port carries a result this tick
    }; // WBPort

    const WBPort zero_wb = { 0, 0, ex_NONE, 0 };

    struct Operand
    {
        u64   value;
        u8    valid;
    }; // Operand

    struct TickInputs
    {
        u8             flush;          // reset the whole scoreboard
        u8             flush_unissued; // discard allocated but not issued entries
        inst           decoded;        // from decode
        u8             decoded_valid;
        u8             issue_ack;      // issue stage took issue_instr
        u8             commit_ack;     // commit stage retired commit_instr
        u8             rs1;            // operand read registers
        u8             rs2;
        vector<WBPort> wb;             // one per write back port, port 0 has priority
    }; // TickInputs

    struct TickOutputs
    {
        u8             full;
        vector<u8>     rd_clobber;     // fu_type of the youngest in flight writer, per register
        Operand        rs1;
        Operand        rs2;
        Entry          commit_instr;   // head entry, commit only with valid set
        u8             decoded_ack;    // decoded was allocated
        Entry          issue_instr;
        u8             issue_valid;
    }; // TickOutputs

    // cursors count modulo 2 * capacity, the extra bit tells a full ring from an empty one
    struct State
    {
        vector<Entry> mem;
        u32           commit_ptr;
        u32           issue_ptr;
        u32           top_ptr;
    }; // State

    TickInputs make_inputs(u8 wb_ports);
} // SB

struct ScoreboardException : public SimulatorException
{
    const char* what() const throw()
    {   return "scoreboard contract violated."; }
}; // ScoreboardException

struct InvalidConfigException : public ScoreboardException
{
    const char* what() const throw()
    {   return "invalid scoreboard configuration (entries must be a power of two)."; }
}; // InvalidConfigException

struct CommitNotReadyException : public ScoreboardException
{
    const char* what() const throw()
    {   return "commit acknowledged for an entry without valid result."; }
}; // CommitNotReadyException

struct IssueNotValidException : public ScoreboardException
{
    const char* what() const throw()
    {   return "issue acknowledged without a valid issue offer."; }
}; // IssueNotValidException

struct WritebackConflictException : public ScoreboardException
{
    const char* what() const throw()
    {   return "multiple write back ports target the same transaction."; }
}; // WritebackConflictException

struct WritebackTargetException : public ScoreboardException
{
    const char* what() const throw()
    {   return "write back to a transaction that is not in flight."; }
}; // WritebackTargetException

struct InvalidArgumentException : public SimulatorException
{
    const char* what () const throw ()
    {   return "invalid function argument(s)."; }
}; // InvalidArgumentException

class Scoreboard
{
    public:
    Scoreboard(u32 entries, u16 nregs = NR_ARCH_REGS, u8 wb_ports = NR_WB_PORTS);

    // combinational outputs, no state change
    SB::TickOutputs evaluate(const SB::TickInputs& in) const;
    // outputs of this tick, then move to the next state
    SB::TickOutputs step(const SB::TickInputs& in);
    void            reset();

    u8              full() const;
    u8              empty() const;
    u32             occupancy() const;
    vector<u8>      rd_clobber() const;
    SB::Operand     read_operand(u8 reg, const vector<SB::WBPort>& wb) const;
    SB::Entry       commit_instr() const;
    u8              check_invariants() const;

    u32             capacity()   const { return entries; };
    u16             num_regs()   const { return nregs; };
    u8              num_ports()  const { return wb_ports; };
    u32             commit_idx() const { return slot(st.commit_ptr); };
    u32             issue_idx()  const { return slot(st.issue_ptr); };
    u32             top_idx()    const { return slot(st.top_ptr); };
    const SB::Entry& at(u32 idx) const { return st.mem.at(idx); };

    std::stringstream sb_readable(u32 n) const;

    private:
    u32  slot(u32 ptr)  const { return ptr & (entries - 1); };
    u32  wrap(u32 ptr)  const { return ptr & (2 * entries - 1); };
    u32  dist(u32 from, u32 to) const { return wrap(to - from); };
    u8   in_flight(u16 trans_id) const;
    u8   issue_bypass() const;
    u8   valid_state(const SB::State& s) const;
    void check_inputs(const SB::TickInputs& in, const SB::TickOutputs& out) const;

    const u32  entries;
    const u16  nregs;
    const u8   wb_ports;
    SB::State  st;
    u64        ticks;
}; // Scoreboard

std::ostream& operator<<(std::ostream& os, const SB::Entry& e);

#endif // SBSIM_SCOREBOARD_H
