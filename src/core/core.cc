// sbsim scoreboard simulator
//
// in-order issue core around the scoreboard
// - main functions
// - decode
// - issue/operand read
// - execute/write back
// - commit
//

#include "core.hh"
#include "cconf.hh"

#include "uops.hh"

Core::Core(LatchQueue<inst>* uqueue, Simulator::SimulatorState& state, Frontend& fe, u32 sb_entries)
    : uqueue(uqueue), state(state), fe(fe),
      fus({
          FUInfo(fu_alu,  getWBPort(fu_alu),  1),
          FUInfo(fu_brch, getWBPort(fu_brch), 1),
          FUInfo(fu_mul,  getWBPort(fu_mul),  MUL_PIPELINED),
          FUInfo(fu_div,  getWBPort(fu_div),  DIV_PIPELINED),
      })
{
    sb    = new Scoreboard(sb_entries, NR_ARCH_REGS, NR_WB_PORTS);
    id_sb = new LatchQueue<inst>(ID_SB_SIZE);

    util::log(LOG_CORE_INIT, "Core initialized with:");
    util::log(LOG_CORE_INIT, "        Scoreboard entries: ", dec_u<0>, sb_entries);
    util::log(LOG_CORE_INIT, "        Write back ports:   ", dec_u<0>, NR_WB_PORTS);
    util::log(LOG_CORE_INIT, "        Decode latency:     ", dec_u<0>, DECODE_LATENCY);
    util::log(LOG_CORE_INIT, "");
}

Core::~Core()
{
    delete sb;
    delete id_sb;
}

// one complete backend cycle
// all stages see the scoreboard state of the previous cycle, step() moves it on
u32 Core::cycle()
{
    if(!(state.active & core_active))
    {
        util::log(LOG_CORE_PIPE1, "\nCore inactive.");
        return 1;
    }

    util::log(LOG_STATE_PRE, "Scoreboard:\n", sb->sb_readable(sb->capacity()).str());

    SB::TickInputs in = SB::make_inputs(NR_WB_PORTS);

    decode();
    writeback(in);
    present(in);
    commit(in);
    issue(in);

    SB::TickOutputs out = sb->step(in);

    if(out.decoded_ack)
    {
        id_sb->pop_front();
        state.allocated++;
    }
    else if(in.decoded_valid && out.full)
        state.full_stalls++;

    if(in.flush) flush();

    util::log(LOG_STATE_POST, "Scoreboard after cycle:\n", sb->sb_readable(sb->capacity()).str());
    util::log(LOG_CORE_BUF, "Functional Units:\n", fu_readable().str());
    util::log(LOG_CORE_ARF, "ARF GP:\n", state.arf_readable().str());

    // nothing left to do
    if(!(state.active & fe_active) && drained())
    {
        util::log(LOG_CORE_PIPE1, "Core drained.");
        state.active &= ~core_active;
    }

    return 0;
}

u8 Core::drained()
{
    for(auto& fu : fus)
        if(!fu.pipe.empty()) return 0;

    return uqueue->empty() && id_sb->empty() && sb->empty();
}

// clear latches, fus and the frontend after a scoreboard flush
u8 Core::flush()
{
    uqueue->clear();
    id_sb->clear();

    for(auto& fu : fus)
    {
        fu.pipe.clear();
        fu.free_at = 0;
    }

    unresolved_branch = 0;
    state.flushes++;

    return 0;
}

// wrong path uops in the frontend and decode are dropped, the scoreboard drops its unissued ones
void Core::redirect(u64 rip)
{
    uqueue->clear();
    id_sb->clear();
    fe.set_fetchaddr(rip);
    fe.flush();
}

FUInfo* Core::get_fu(u8 futype)
{
    for(auto& fu : fus)
        if(fu.type == futype) return &fu;

    // control uops run on the alu
    return (futype == fu_ctrl || futype == fu_none) ? get_fu(fu_alu) : nullptr;
}

// check decoded uops and move them into the decode/scoreboard latch
// > check #UD and register bounds
u32 Core::decode()
{
    if(id_sb->size() >= ID_SB_SIZE)
    {
        util::log(LOG_CORE_PIPE1, "ID__: * ID/SB latch is full. Not decoding any instructions.");
        return 1;
    }

    inst cur;
    try
    {
        cur = uqueue->get_front(state.cycle);
    }
    catch(const LatchStallException& ls)
    {   // instructions not available yet
        util::log(LOG_CORE_PIPE1, "ID__: * uQueue ", ls.what(), " Not decoding.");
        return 1;
    }
    catch(const LatchEmptyException& le)
    {
        util::log(LOG_CORE_PIPE2, "ID__: * uQueue ", le.what(), " Not decoding.");
        return 1;
    }

    uop& cur_op = cur.op;
    auto info   = uopmap.find(cur_op.opcode);

    if(info == uopmap.end())
    {   // invalid opcode, replace instruction with int #UD to guarantee precise exception
        util::log(LOG_CORE_PIPE1, "ID__: * Undefined opcode ", hex_u<16>, cur_op.opcode, ". Injecting #UD.");
        cur_op.opcode  = uop_int;
        cur_op.control = use_imm;
        for(u8 i = 0; i < 4; i++) cur_op.regs[i] = 0;
        cur_op.imm     = setExcept(ex_UD, 0);
    }
    else
    {
        // invalid control bits set
        if((cur_op.control | info->second.ctrl_mask) != info->second.ctrl_mask)
        {
            util::log(LOG_CORE_PIPE2, "ID__: * Invalid control bits detected, bits merged with mask.");
            cur_op.control &= info->second.ctrl_mask;
        }

        // clear unused operands, this is needed since 0 is not always neutral element (e.g. uop_and)
        for(u8 i = 0; i < 2; i++)
        {
            if(!(cur_op.control & (use_ra << i))) cur_op.regs[i] = 0;
            if(cur_op.regs[i] == 0) cur_op.control &= ~(use_ra << i);
        }
        cur_op.regs[r_rc] = 0;

        // no result
        if(cur_op.opcode == uop_nop || cur_op.opcode == uop_int) cur_op.regs[r_rd] = 0;

        if(!(cur_op.control & use_imm)) cur_op.imm = 0;

        for(u8 i = 0; i < 4; i++)
            if(cur_op.regs[i] >= NR_ARCH_REGS)
            {
                util::log(LOG_CORE_PIPE1, "ID__: * Invalid register reference r", +cur_op.regs[i],
                    ". Injecting #REF.");
                cur_op.opcode  = uop_int;
                cur_op.control = use_imm;
                for(u8 j = 0; j < 4; j++) cur_op.regs[j] = 0;
                cur_op.imm     = setExcept(ex_REG, 0);
                break;
            }
    }

    util::log(LOG_CORE_PIPE1, "ID__:   Decoded instruction ", cur_op, " at ", hex_u<64>, cur.rip, " to: ");
    util::log(LOG_CORE_PIPE1, "          ", uop_readable(cur_op).str());

    // no need to catch exceptions here since size is already checked
    id_sb->push_back((state.cycle + DECODE_LATENCY), cur);
    return 0;
}

// results due this cycle go onto their write back ports, branches resolve
u32 Core::writeback(SB::TickInputs& in)
{
    for(auto& fu : fus)
    {
        if(!fu.pipe.ready(state.cycle)) continue;

        FUResult res = fu.pipe.get_front(state.cycle);
        in.wb[fu.port] = res.wb;

        util::log(LOG_CORE_PIPE2, "WB.", dec_u<0>, +fu.port, ":   Transaction ", res.wb.trans_id, " done, result ",
            hex_u<64>, res.wb.data, ".");

        if(is_branch(res.in.op) == branch_none) continue;

        // resolve
        unresolved_branch = 0;
        u8 taken = (res.next != res.in.rip + UOP_BYTES);
        fe.bp->update(res.in.rip, res.next, taken);

        if(res.next != res.in.next)
        {
            util::log(LOG_CORE_PIPE1, "WB__:   Branch at ", hex_u<64>, res.in.rip, " mispredicted, refetching from ",
                hex_u<64>, res.next, ".");
            in.flush_unissued = 1;
            redirect(res.next);
            state.mispredicts++;
        }
    }

    return 0;
}

// decoded uop at the head of the latch is offered for allocation
u32 Core::present(SB::TickInputs& in)
{
    if(!id_sb->ready(state.cycle)) return 1;

    in.decoded       = id_sb->front(state.cycle);
    in.decoded_valid = 1;
    return 0;
}

// commit the scoreboard head if its result is there
u32 Core::commit(SB::TickInputs& in)
{
    SB::Entry head = sb->commit_instr();

    if(!head.valid)
    {
        if(!sb->empty())
            util::log(LOG_CORE_PIPE2, "CO__: * Transaction ", dec_u<0>, head.trans_id, " not ready.");
        return 1;
    }

    // exception at head, nothing younger has written the ARF yet
    if(head.except != ex_NONE)
    {
        u32 e = getExceptNum(head.except);
        util::log(LOG_CORE_PIPE1, "CO__:   Exception ", exception_str[e < ex_MAX ? e : ex_UNSPEC], " at ", hex_u<64>,
            head.in.rip, ".");

        if(e == ex_HALT) state.commited++;
        state.exception = head.except;
        state.active   &= ~(fe_active | core_active);
        in.flush        = 1;
        return 0;
    }

    u8 rd = getDest(head.in.op);
    if(rd) state.arf->gp[rd] = head.result;

    util::log(LOG_CORE_PIPE1, "CO__:   Committed ", uop_readable(head.in.op).str(), " = ", hex_u<64>, head.result);

    in.commit_ack = 1;
    state.commited++;
    return 0;
}

// clobbered sources have to come from the scoreboard, others from the ARF
u8 Core::read_source(u8 reg, const SB::Operand& fwd, const vector<u8>& clobber, u64& value)
{
    if(!reg)
        value = 0;
    else if(clobber.at(reg) == fu_none)
        value = state.arf->gp[reg];
    else if(fwd.valid)
    {
        value = fwd.value;
        state.forwarded++;
        util::log(LOG_CORE_PIPE3, "IS__:     r", dec_u<0>, +reg, " taken from the scoreboard.");
    }
    else return 0;

    return 1;
}

// issue the scoreboard offer in order, one uop each cycle
u32 Core::issue(SB::TickInputs& in)
{
    if(in.flush) return 1;

    if(unresolved_branch)
    {
        util::log(LOG_CORE_PIPE1, "IS__: * Unresolved branch in flight. Not issuing.");
        return 1;
    }

    SB::TickOutputs offer = sb->evaluate(in);
    if(!offer.issue_valid) return 1;

    const SB::Entry& ie = offer.issue_instr;
    const uop&       op = ie.in.op;

    FUInfo* fu = get_fu(ie.fu);
    if(!fu) throw SimulatorException();

    if(fu->free_at > state.cycle)
    {
        util::log(LOG_CORE_PIPE1, "IS__: * No ", fu_type_str[fu->type], " FU available.");
        return 1;
    }

    in.rs1 = (op.control & use_ra) ? op.regs[r_ra] : 0;
    in.rs2 = (op.control & use_rb) ? op.regs[r_rb] : 0;
    SB::TickOutputs ops = sb->evaluate(in);

    // one writer per register in flight, a late result of an older writer could pass a younger one on its port
    u8 rd = getDest(op);
    if(rd && ops.rd_clobber.at(rd) != fu_none)
    {
        util::log(LOG_CORE_PIPE1, "IS__: * r", dec_u<0>, +rd, " already written by ", fu_type_str[ops.rd_clobber.at(rd)],
            " in flight. Not issuing.");
        state.waw_stalls++;
        return 1;
    }

    u64 a = 0, b = 0;
    if(!read_source(in.rs1, ops.rs1, ops.rd_clobber, a) || !read_source(in.rs2, ops.rs2, ops.rd_clobber, b))
    {
        util::log(LOG_CORE_PIPE1, "IS__: * Source operands of transaction ", dec_u<0>, ie.trans_id, " not ready.");
        return 1;
    }
    if(!(op.control & use_rb)) b = (op.control & use_imm) ? op.imm : 0;

    u32 latency = uopmap.count(op.opcode) ? uopmap.at(op.opcode).latency : 1;
    FUResult res = run_uop(ie, a, b);
    fu->pipe.push_back(state.cycle + latency, res);
    fu->free_at = fu->pipelined ? state.cycle + 1 : state.cycle + latency;

    if(is_branch(op)) unresolved_branch = 1;

    util::log(LOG_CORE_PIPE1, "IS__:   Issued ", uop_readable(op).str(), " as transaction ", dec_u<0>, ie.trans_id,
        " to ", fu_type_str[fu->type], ".");

    in.issue_ack = 1;
    state.issued++;
    return 0;
}

// compute the result at issue, it becomes visible at the write back cycle
FUResult Core::run_uop(const SB::Entry& e, u64 a, u64 b)
{
    const uop& op  = e.in.op;
    u64        seq = e.in.rip + UOP_BYTES;
    u64        imm = op.imm;
    FUResult   res = { { e.trans_id, 0, ex_NONE, 1 }, e.in, seq };
    u64&       r   = res.wb.data;

    switch(op.opcode)
    {
        case uop_nop:      break;
        case uop_int:      res.wb.except = imm ? (u32) imm : setExcept(ex_UNSPEC, 0); break;
        case uop_move:     r = a; break;
        case uop_set:      r = b; break;
        case uop_branch:   r = seq; res.next = imm; break;
        case uop_branchz:  r = seq; res.next = (a == 0) ? imm : seq; break;
        case uop_branchnz: r = seq; res.next = (a != 0) ? imm : seq; break;
        case uop_branchl:  r = seq; res.next = ((i64) a < (i64) b) ? imm : seq; break;
        case uop_add:      r = a + b; break;
        case uop_sub:      r = a - b; break;
        case uop_mul:      r = a * b; break;
        case uop_divq:
        case uop_divr:
            if(!b) res.wb.except = setExcept(ex_DE, 0);
            else   r = (op.opcode == uop_divq) ? a / b : a % b;
            break;
        case uop_lsl:      r = a << (b & 63); break;
        case uop_rsl:      r = a >> (b & 63); break;
        case uop_rsa:      r = (u64) ((i64) a >> (b & 63)); break;
        case uop_not:      r = ~a; break;
        case uop_and:      r = a & b; break;
        case uop_or:       r = a | b; break;
        case uop_xor:      r = a ^ b; break;
        default:           res.wb.except = setExcept(ex_UD, 0); break;
    }

    return res;
}

std::stringstream Core::fu_readable()
{
    std::stringstream ss;
    for(const auto& fu : fus) ss << fu << "\n";
    return ss;
}

std::ostream& operator<<(std::ostream& os, const FUInfo& fui)
{
    os << str_w<6> << fu_type_str[fui.type] << "port " << +fui.port << " "
       << (fui.pipelined ? "pipelined  " : "blocking   ") << "free at " << std::dec << fui.free_at;
    return os;
}
