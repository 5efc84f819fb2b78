// sbsim scoreboard simulator
//
// frontends
//

#include "frontend.hh"
#include "fconf.hh"

#include "../core/uops.hh"

#include <endian.h>

RiscFrontend::RiscFrontend(const vector<u8>& code, LatchQueue<inst>* uqueue,
        Simulator::SimulatorState& state, u8 predictor) : Frontend(code, uqueue, state)
{
    bp        = make_predictor(predictor);
    fetchaddr = CODE_START;

    util::log(LOG_FE_INIT, "RISC frontend initialized, ", dec_u<0>, code.size() / UOP_BYTES, " uops, ",
        bp->name(), " prediction.\n");
}

RiscFrontend::~RiscFrontend()
{
    delete bp;
}

uop RiscFrontend::read_uop(const u8* bytes)
{
    uop cur_op = zero_op;
    u16 opcode, control;
    u64 imm;

    std::memcpy(&opcode,  bytes,     sizeof(opcode));
    std::memcpy(&control, bytes + 2, sizeof(control));
    std::memcpy(&imm,     bytes + 8, sizeof(imm));

    cur_op.opcode  = be16toh(opcode);
    cur_op.control = be16toh(control);
    cur_op.imm     = be64toh(imm);
    for(u8 i = 0; i < 4; i++) cur_op.regs[i] = bytes[4 + i];

    return cur_op;
}

// fetch only
u8 RiscFrontend::cycle()
{
    if( !(state.active & if_active) )
    {
        util::log(LOG_FE_FETCH, "IF__:   Frontend inactive.\n");
        return 1;
    }

    util::log(LOG_FE_FETCH, "IF__:   Fetching new instructions.");

    for(u64 slot = 0; slot < FETCH_WIDTH; slot++)
    {
        if(uqueue->size() >= UQUEUE_SIZE)
        {
            util::log(LOG_FE_FETCH, "IF__: * uQ is full. Not fetching any instructions.");
            break;
        }

        util::log(LOG_FE_FETCH, "IF__:   Fetchaddr: ", hex_u<64>, fetchaddr);

        u64 offs   = fetchaddr - CODE_START;
        uop cur_op = zero_op;

        if(SILENT_HALT && fetchaddr == CODE_START + code.size())
        {   // "instruction" after the last instruction
            util::log(LOG_FE_FETCH, "IF__:   End of code reached.");
            state.active &= ~fe_active;
            break;
        }
        else if(fetchaddr < CODE_START || offs + UOP_BYTES > code.size() || (offs % UOP_BYTES))
        {   // #PF, only raised if this uop ever commits
            util::log(LOG_FE_FETCH, "IF__:   Fetch outside of the image. Injecting #PF.");
            cur_op.opcode  = uop_int;
            cur_op.control = use_imm;
            cur_op.imm     = setExcept(ex_PF, 0);
            state.active  &= ~fe_active;
        }
        else
        {
            cur_op = read_uop(&code[offs]);
            util::log(LOG_FE_FETCH, "IF__:   Fetched instruction ", cur_op, ".");
        }

        u64 seq  = fetchaddr + UOP_BYTES;
        u64 next = seq;
        switch(is_branch(cur_op))
        {
            case branch_uncond:
                next = cur_op.imm;
                break;
            case branch_cond:
                next = bp->predict(fetchaddr, seq, cur_op.imm);
                break;
            default:
                break;
        }

        try
        {
            uqueue->push_back((state.cycle + FETCH_LATENCY), { cur_op, fetchaddr, next });
        }
        catch(const LatchFullException& fe) // this should _never_ occur since size is checked
        {
            util::log(LOG_FE_FETCH, "IF__: * uQ ", fe.what(), " Not fetching any instructions.");
            break;
        }

        fetchaddr = next;
        if(!(state.active & if_active)) break;
    }

    util::log(LOG_FE_FETCH, "");
    return 0;
}

// redirect after set_fetchaddr, the core clears the uQueue
u8 RiscFrontend::flush()
{
    state.active |= fe_active;
    return 0;
}
