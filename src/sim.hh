// sbsim scoreboard simulator
//
// Simulator definitions
//

#ifndef SBSIM_MAIN_H
#define SBSIM_MAIN_H

#include "util.hh"
#include "types.hh"
#include "conf.hh"

class Frontend;
class Core;
struct ArchRegFile;

typedef enum
{
    if_active   = 0x0001, // fetch

    id_active   = 0x0100, // uop decode
    sb_active   = 0x0200, // scoreboard, issue, execute, commit

    fe_active   = 0x0001, // entire frontend
    core_active = 0x0300, // entire core
} pipeline_status;

typedef enum
{
    bp_simple,
    bp_btb,
} predictors;

class Simulator
{
    public:
    Simulator(opts& myopts);
    ~Simulator();
    u16 cycle();

    struct SimulatorState
    {
        u64 cycle;                    // current cycle
        u16 active;                   // pipeline status
        u32 exception;                // exception status, ex_HALT after a regular halt

        // events
        u64 allocated;
        u64 issued;
        u64 commited;
        u64 forwarded;                // operands taken from the scoreboard
        u64 full_stalls;              // cycles decode waited on a full scoreboard
        u64 waw_stalls;               // cycles issue waited on an in flight writer of rd
        u64 mispredicts;
        u64 flushes;

        ArchRegFile*            arf;
        std::stringstream       arf_readable();
        std::stringstream       stats_readable();
    } state; // SimulatorState

    LatchQueue<inst>*   uqueue;
    Frontend*           frontend;
    Core*               core;
}; // Simulator

#endif // SBSIM_MAIN_H
