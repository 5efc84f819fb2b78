// sbsim scoreboard simulator
//
// core config
// - scoreboard
// - functional units
//

#ifndef SBSIM_CCONF_H
#define SBSIM_CCONF_H

// scoreboard
#define SB_ENTRIES      8                   // in flight instructions, power of two
#define SB_MAX_ENTRIES  0x8000              // transaction ids are 16 bit, lap bit included
#define NR_WB_PORTS     4                   // write back ports into the scoreboard
#define NR_ARCH_REGS    32                  // architectural registers, r0 is hardwired to zero

// pipeline
#define DECODE_LATENCY  1                   // cycles until a uop is presented to the scoreboard
#define ID_SB_SIZE      2                   // uops in the decode/scoreboard latch

// functional units, one per type
// write back port for each fu
#define WB_PORT_ALU     0                   // alu, control
#define WB_PORT_BRCH    1                   // branches
#define WB_PORT_MUL     2                   // multiplier
#define WB_PORT_DIV     3                   // divider

#define MUL_PIPELINED   1                   // multiplier accepts one uop each cycle
#define DIV_PIPELINED   0                   // divider blocks until the result is written back

// registers
#define REGCLS_0_SIZE   8                   // size of gp registers in bytes


// logging
#define LOG_CORE_ARF    4                   // log ARF after each cycle
#define LOG_CORE_BUF    3                   // buffers and queues
#define LOG_CORE_INIT   1                   // log parameters
#define LOG_CORE_PIPE1  2                   // pipeline detail level 1
#define LOG_CORE_PIPE2  4                   // pipeline detail level 2
#define LOG_CORE_PIPE3  5                   // detail level 3

#define LOG_SB_INIT     1                   // scoreboard parameters
#define LOG_SB_PIPE1    2                   // allocate/issue/commit
#define LOG_SB_PIPE2    5                   // write back and forwarding
#define LOG_SB_PIPE3    6                   // clobber and operand scans
#define LOG_SB_BUF      3                   // scoreboard contents

static_assert((SB_ENTRIES & (SB_ENTRIES - 1)) == 0 && SB_ENTRIES, "Scoreboard entries must be a power of two.");
static_assert(SB_ENTRIES <= SB_MAX_ENTRIES);
static_assert(NR_WB_PORTS > WB_PORT_DIV,  "Too few write back ports for the functional units.");
static_assert(NR_ARCH_REGS <= 256,        "Register ids are 8 bit.");

#endif // SBSIM_CCONF_H
