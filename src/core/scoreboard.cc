// sbsim scoreboard simulator
//
// scoreboard
// - full/empty and cursor arithmetic
// - clobber, operand read and forwarding
// - allocate, write back, issue, commit
//

#include "scoreboard.hh"

SB::TickInputs SB::make_inputs(u8 wb_ports)
{
    TickInputs in = { 0, 0, zero_inst, 0, 0, 0, 0, 0, vector<WBPort>(wb_ports, zero_wb) };
    return in;
}

Scoreboard::Scoreboard(u32 entries, u16 nregs, u8 wb_ports)
    : entries(entries), nregs(nregs), wb_ports(wb_ports), ticks(0)
{
    if(!util::is_pow2(entries) || entries > SB_MAX_ENTRIES) throw InvalidConfigException();
    if(!nregs || nregs > 256 || !wb_ports)                  throw InvalidConfigException();

    reset();

    util::log(LOG_SB_INIT, "Scoreboard initialized with:");
    util::log(LOG_SB_INIT, "        Entries:         ", dec_u<0>, entries);
    util::log(LOG_SB_INIT, "        Registers:       ", dec_u<0>, nregs);
    util::log(LOG_SB_INIT, "        Write back ports: ", dec_u<0>, +wb_ports);
    util::log(LOG_SB_INIT, "");
}

void Scoreboard::reset()
{
    st.mem.assign(entries, SB::zero_entry);
    st.commit_ptr = 0;
    st.issue_ptr  = 0;
    st.top_ptr    = 0;
}

u32 Scoreboard::occupancy() const
{
    return dist(st.commit_ptr, st.top_ptr);
}

// commit == top by slot index is either full or empty, the lap bit decides
u8 Scoreboard::full() const
{
    return occupancy() == entries;
}

u8 Scoreboard::empty() const
{
    return occupancy() == 0;
}

// issued and not yet committed
u8 Scoreboard::in_flight(u16 trans_id) const
{
    if(trans_id >= entries) return 0;

    u32 offs = (trans_id - slot(st.commit_ptr)) & (entries - 1);
    return offs < dist(st.commit_ptr, st.issue_ptr);
}

// nothing allocated waits for issue, decode can be handed through
u8 Scoreboard::issue_bypass() const
{
    return (st.issue_ptr == st.top_ptr) && !full();
}

// scan [commit, issue) oldest first, younger writers overwrite older ones
vector<u8> Scoreboard::rd_clobber() const
{
    vector<u8> clobber(nregs, fu_none);

    for(u32 p = st.commit_ptr; p != st.issue_ptr; p = wrap(p + 1))
    {
        const SB::Entry& e = st.mem[slot(p)];
        u8 rd = getDest(e.in.op);
        if(rd < nregs) clobber[rd] = e.fu;
    }

    clobber[0] = fu_none; // r0 is never written
    return clobber;
}

// youngest in flight producer of reg, overridden by the first matching write back port
SB::Operand Scoreboard::read_operand(u8 reg, const vector<SB::WBPort>& wb) const
{
    SB::Operand op = { 0, 0 };

    for(u32 p = st.commit_ptr; p != st.issue_ptr; p = wrap(p + 1))
    {
        const SB::Entry& e = st.mem[slot(p)];
        if(getDest(e.in.op) == reg)
            op = { e.result, e.valid };
    }

    // same cycle results, ports in priority order
    // exceptional results are never forwarded
    for(const auto& port : wb)
    {
        if(!port.valid || port.except != ex_NONE || !in_flight(port.trans_id)) continue;
        if(getDest(st.mem[port.trans_id].in.op) != reg) continue;

        util::log(LOG_SB_PIPE3, "SB__:     Forwarding r", dec_u<0>, +reg, " from transaction ", port.trans_id, ".");
        op = { port.data, 1 };
        break;
    }

    if(!reg) op.valid = 0;
    return op;
}

// head entry, a stale entry of an earlier lap is never ready
SB::Entry Scoreboard::commit_instr() const
{
    SB::Entry e = st.mem[slot(st.commit_ptr)];
    if(empty()) e.valid = 0;
    return e;
}

// commit <= issue <= top in program order, at most entries in flight
u8 Scoreboard::valid_state(const SB::State& s) const
{
    u32 occ = dist(s.commit_ptr, s.top_ptr);
    return (occ <= entries) && (dist(s.commit_ptr, s.issue_ptr) <= occ) && (s.mem.size() == entries) &&
           (s.commit_ptr < 2 * entries) && (s.issue_ptr < 2 * entries) && (s.top_ptr < 2 * entries);
}

u8 Scoreboard::check_invariants() const
{
    return valid_state(st);
}

SB::TickOutputs Scoreboard::evaluate(const SB::TickInputs& in) const
{
    SB::TickOutputs out;

    out.full         = full();
    out.rd_clobber   = rd_clobber();
    out.rs1          = read_operand(in.rs1, in.wb);
    out.rs2          = read_operand(in.rs2, in.wb);
    out.commit_instr = commit_instr();
    out.decoded_ack  = in.decoded_valid && !out.full && !in.flush_unissued && !in.flush;

    if(issue_bypass())
    {
        out.issue_instr = { in.decoded, getFUType(in.decoded.op), (u16) slot(st.top_ptr), 0, ex_NONE, 0 };
        out.issue_valid = in.decoded_valid;
    }
    else
    {
        out.issue_instr = st.mem[slot(st.issue_ptr)];
        out.issue_valid = dist(st.commit_ptr, st.issue_ptr) < occupancy();
    }

    if(in.flush_unissued || in.flush) out.issue_valid = 0;

    return out;
}

// contract checks, nothing may change before these pass
void Scoreboard::check_inputs(const SB::TickInputs& in, const SB::TickOutputs& out) const
{
    if(in.wb.size() != wb_ports) throw InvalidArgumentException();

    // everything else of a flushed tick is dropped
    if(in.flush) return;

    if(in.issue_ack && !out.issue_valid)
        throw IssueNotValidException();

    if(in.commit_ack && !out.commit_instr.valid)
        throw CommitNotReadyException();

    for(u8 i = 0; i < wb_ports; i++)
    {
        if(!in.wb[i].valid) continue;

        for(u8 j = i + 1; j < wb_ports; j++)
            if(in.wb[j].valid && in.wb[j].trans_id == in.wb[i].trans_id)
                throw WritebackConflictException();

        if(!in_flight(in.wb[i].trans_id))
            throw WritebackTargetException();
    }
}

SB::TickOutputs Scoreboard::step(const SB::TickInputs& in)
{
    SB::TickOutputs out = evaluate(in);
    check_inputs(in, out);

    ticks++;

    if(in.flush)
    {
        util::log(LOG_SB_PIPE1, "SB__:   Flushed, ", dec_u<0>, occupancy(), " entries dropped.");
        reset();
        return out;
    }

    // next state only reads st
    SB::State next = st;

    for(u8 i = 0; i < wb_ports; i++)
    {
        const SB::WBPort& port = in.wb[i];
        if(!port.valid) continue;

        SB::Entry& e = next.mem[port.trans_id];
        e.valid  = 1;
        e.result = port.data;
        e.except = port.except;

        util::log(LOG_SB_PIPE2, "SB.", dec_u<0>, +i, ":   Write back to transaction ", port.trans_id, ": ",
            hex_u<64>, port.data, (port.except != ex_NONE ? " with exception." : "."));
    }

    if(in.issue_ack)
    {
        util::log(LOG_SB_PIPE1, "SB__:   Issued transaction ", dec_u<0>, out.issue_instr.trans_id, ".");
        next.issue_ptr = wrap(st.issue_ptr + 1);
    }

    if(in.commit_ack)
    {
        util::log(LOG_SB_PIPE1, "SB__:   Committed transaction ", dec_u<0>, out.commit_instr.trans_id, ".");
        next.commit_ptr = wrap(st.commit_ptr + 1);
    }

    if(out.decoded_ack)
    {
        u32 idx = slot(st.top_ptr);
        next.mem[idx] = { in.decoded, getFUType(in.decoded.op), (u16) idx, 0, ex_NONE, 0 };
        next.top_ptr  = wrap(st.top_ptr + 1);

        util::log(LOG_SB_PIPE1, "SB__:   Allocated ", in.decoded.op, " as transaction ", dec_u<0>, idx, ".");
    }
    else if(in.decoded_valid && out.full)
        util::log(LOG_SB_PIPE1, "SB__: * Scoreboard is full. Not allocating.");

    // issue_ack is rejected above, issue_ptr did not move
    if(in.flush_unissued)
    {
        util::log(LOG_SB_PIPE1, "SB__:   Flushed ", dec_u<0>, dist(st.issue_ptr, st.top_ptr), " unissued entries.");
        next.top_ptr = st.issue_ptr;
    }

    if(!valid_state(next)) throw ScoreboardException();

    st = std::move(next);

    util::log(LOG_SB_BUF, "Scoreboard after tick ", dec_u<0>, ticks, ":\n", sb_readable(entries).str());
    return out;
}

std::stringstream Scoreboard::sb_readable(u32 n) const
{
    std::stringstream ss;

    for(u32 i = 0, p = st.commit_ptr; i < n && p != st.top_ptr; i++, p = wrap(p + 1))
        ss << dec_u_lf<4> << slot(p) << (p == st.issue_ptr ? " I " : "   ") << "| " << st.mem[slot(p)] << "\n";

    if(empty()) ss << "(empty)\n";

    return ss;
}

std::ostream& operator<<(std::ostream& os, const SB::Entry& e)
{
    os << "tid " << dec_u_lf<4> << e.trans_id << " " << str_w<6> << fu_type_str[e.fu < fu_max ? e.fu : fu_none]
       << "rd " << dec_u<3> << +getDest(e.in.op) << (e.valid ? "V " : "  ") << hex_u<64> << e.result << " "
       << str_w<12> << (e.except ? exception_str[getExceptNum(e.except) < ex_MAX ? getExceptNum(e.except) : ex_UNSPEC] : "")
       << " " << e.in.op;

    return os;
}
