// sbsim scoreboard simulator
//
// branch prediction
// - not taken
// - btb
//

#include "bp.hh"

#include "../sim.hh"

BranchPredictor* make_predictor(u8 kind)
{
    if(kind == bp_simple) return new SimplePredictor();
    return new BTBPredictor();
}

u64 SimplePredictor::predict(u64 rip, u64 seq, u64 target)
{
    (void) rip;
    (void) target;
    return seq;
}

void SimplePredictor::update(u64 rip, u64 target, u8 taken)
{
    (void) rip;
    (void) target;
    (void) taken;
}

u64 BTBPredictor::predict(u64 rip, u64 seq, u64 target)
{
    auto it = btb.find(rip);
    if(it == btb.end())
        return (rip < target ? seq : target);

    return it->second.taken ? it->second.target : seq;
}

// the table stops growing at BTB_SIZE, known branches are still updated
void BTBPredictor::update(u64 rip, u64 target, u8 taken)
{
    auto it = btb.find(rip);

    if(it != btb.end())
    {
        it->second.taken = taken;
        if(taken) it->second.target = target;
    }
    else if(btb.size() < BTB_SIZE)
        btb.insert({ rip, { taken ? target : 0, taken } });

    util::log(LOG_BP_ALL, "BP__:   Updated branch at ", hex_u<64>, rip, " as ", (taken ? "taken" : "not taken"), ".");
}
