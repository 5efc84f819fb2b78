// sbsim scoreboard simulator
//
// frontends
//

#ifndef SBSIM_FRONTEND_H
#define SBSIM_FRONTEND_H

#include "../util.hh"
#include "../sim.hh"

#include "bp.hh"

class Frontend
{
    public:
    // frontend reads the program image, predicts, then places uops into the queue
    Frontend(const vector<u8>& code, LatchQueue<inst>* uqueue, Simulator::SimulatorState& state)
        : code(code), uqueue(uqueue), state(state) {};
    virtual ~Frontend() {};
    virtual u8                cycle()   = 0;
    virtual u8                flush()   = 0;
    virtual std::stringstream summary() = 0;

    void       set_fetchaddr(u64 rip)   { fetchaddr = rip; };
    u64        get_fetchaddr()          { return fetchaddr; };

    BranchPredictor*            bp;

    protected:
    u64                         fetchaddr;
    const vector<u8>&           code;
    LatchQueue<inst>*           uqueue;
    Simulator::SimulatorState&  state;
};

class RiscFrontend : public Frontend
{
    public:
    RiscFrontend(const vector<u8>& code, LatchQueue<inst>* uqueue,
            Simulator::SimulatorState& state, u8 predictor);
    ~RiscFrontend();
    u8                cycle();
    u8                flush();
    std::stringstream summary();

    // big endian image bytes to uop
    static uop        read_uop(const u8* bytes);
};

#endif // SBSIM_FRONTEND_H
