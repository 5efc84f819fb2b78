// sbsim scoreboard simulator
//
// branch direction prediction for conditional uops
// - static not taken
// - btb with last outcome per branch
//

#ifndef SBSIM_BP_H
#define SBSIM_BP_H

#include "../util.hh"
#include "fconf.hh"

#include <unordered_map>

// predict returns the next fetch address, update is called once the branch resolved at write back
class BranchPredictor
{
    public:
    virtual ~BranchPredictor() {};
    virtual u64         predict(u64 rip, u64 seq, u64 target) = 0;
    virtual void        update(u64 rip, u64 target, u8 taken) = 0;
    virtual const char* name() const = 0;
}; // BranchPredictor

// predictors enum from sim.hh
BranchPredictor* make_predictor(u8 kind);

class SimplePredictor : public BranchPredictor
{
    public:
    u64         predict(u64 rip, u64 seq, u64 target);
    void        update(u64 rip, u64 target, u8 taken);
    const char* name() const { return "not taken"; };
}; // SimplePredictor

class BTBPredictor : public BranchPredictor
{
    public:
    u64         predict(u64 rip, u64 seq, u64 target);
    void        update(u64 rip, u64 target, u8 taken);
    const char* name() const { return "BTB"; };

    size_t      size() const { return btb.size(); };

    private:
    struct BTBEntry
    {
        u64 target;     // last taken target
        u8  taken;      // last resolved direction
    }; // BTBEntry

    // unknown branches: backward taken, forward not taken
    std::unordered_map<u64, BTBEntry> btb;
}; // BTBPredictor

#endif // SBSIM_BP_H
