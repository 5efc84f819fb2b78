// sbsim scoreboard simulator
//
// in-order issue core around the scoreboard
// - decode
// - allocate
// - issue/operand read
// - execute/write back
// - commit
//

#ifndef SBSIM_CORE_H
#define SBSIM_CORE_H

#include "cconf.hh"

#include "uops.hh"
#include "scoreboard.hh"
#include "../types.hh"
#include "../util.hh"
#include "../sim.hh"

#include "../frontend/frontend.hh"

// visible ARF, r0 reads as zero
struct ArchRegFile
{
    u64 gp[NR_ARCH_REGS];
}; // ArchRegFile

// result travelling through a fu until its write back cycle
struct FUResult
{
    SB::WBPort wb;
    inst       in;
    u64        next;    // resolved next fetch address
}; // FUResult

struct FUInfo
{
    const u8             type;      // fu_type
    const u8             port;      // write back port
    const u8             pipelined;
    u64                  free_at;   // first cycle a new uop can start
    LatchQueue<FUResult> pipe;      // results by write back cycle

    FUInfo(u8 type, u8 port, u8 pipelined) : type(type), port(port), pipelined(pipelined), free_at(0),
        pipe(SB_MAX_ENTRIES) {};
}; // FUInfo

class Core
{
    public:
    Core(LatchQueue<inst>* uqueue, Simulator::SimulatorState& state, Frontend& fe, u32 sb_entries);
    ~Core();
    u32 cycle();
    u8  flush();

    u32 decode();
    u32 writeback(SB::TickInputs& in);
    u32 present(SB::TickInputs& in);
    u32 commit(SB::TickInputs& in);
    u32 issue(SB::TickInputs& in);

    FUResult          run_uop(const SB::Entry& e, u64 a, u64 b);
    const Scoreboard& scoreboard() const { return *sb; };
    u8                drained();

    std::stringstream fu_readable();

    private:
    FUInfo* get_fu(u8 futype);
    u8      read_source(u8 reg, const SB::Operand& fwd, const vector<u8>& clobber, u64& value);
    void    redirect(u64 rip);

    LatchQueue<inst>*          uqueue;
    Simulator::SimulatorState& state;
    Frontend&                  fe;
    Scoreboard*                sb;
    LatchQueue<inst>*          id_sb;                 // decode / scoreboard
    vector<FUInfo>             fus;

    u8                         unresolved_branch = 0; // no issue past an unresolved branch
}; // Core

std::ostream& operator<<(std::ostream& os, const FUInfo& fui);

#endif // SBSIM_CORE_H
