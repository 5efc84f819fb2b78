// sbsim scoreboard simulator
//
// main functions and startup
// - read arguments
// - prepare simulator
// - start pipeline
// - get results
//

#include "sim.hh"
#include "types.hh"
#include "util.hh"

#include "frontend/frontend.hh"
#include "core/core.hh"

u8 loglevel;

Simulator::Simulator(opts& myopts)
{
    if(myopts.code.size() % UOP_BYTES)
        util::abort("Machine code length is not a multiple of ", UOP_BYTES, " bytes.");

    state =
    {
        0,                         // cycle
        (fe_active | core_active), // active
        ex_NONE,                   // exception
        0, 0, 0, 0, 0, 0, 0, 0,    // events
        nullptr                    // arf
    };

    uqueue    = new LatchQueue<inst>(UQUEUE_SIZE + FETCH_WIDTH);
    state.arf = new ArchRegFile();
    for(u16 i = 0; i < NR_ARCH_REGS; i++) state.arf->gp[i] = 0;

    frontend  = new RiscFrontend(myopts.code, uqueue, state, myopts.predictor);
    core      = new Core(uqueue, state, *frontend, myopts.entries);

    frontend->set_fetchaddr(CODE_START);
}

Simulator::~Simulator()
{
    delete core;
    delete frontend;
    delete state.arf;
    delete uqueue;
}

u16 Simulator::cycle()
{
    frontend->cycle();
    core->cycle();

    return state.active;
}

std::stringstream Simulator::SimulatorState::arf_readable()
{
    std::stringstream ss;

    for(u16 i = 0; i < NR_ARCH_REGS; i++)
        ss << "r" << dec_u<3> << i << " " << hex_u<REGCLS_0_SIZE*8>
           << arf->gp[i] << (i % 4 == 3 ? "\n" : " ");

    return ss;
}

std::stringstream Simulator::SimulatorState::stats_readable()
{
    std::stringstream ss;

    ss << "Allocated uops: " << dec_u<0> << allocated   << "\n";
    ss << "Issued uops:    " << dec_u<0> << issued      << "\n";
    ss << "Committed uops: " << dec_u<0> << commited    << ". IPC: "
       << (cycle ? (f32)commited / (f32)cycle : 0.0f)   << "\n";
    ss << "Forwarded:      " << dec_u<0> << forwarded   << "\n";
    ss << "Full stalls:    " << dec_u<0> << full_stalls << "\n";
    ss << "WAW stalls:     " << dec_u<0> << waw_stalls  << "\n";
    ss << "Mispredicts:    " << dec_u<0> << mispredicts << "\n";
    ss << "Flushes:        " << dec_u<0> << flushes;

    return ss;
}

// architectural state after the run
std::stringstream RiscFrontend::summary()
{
    std::stringstream ss; ss << "\n";

    ss << "ARF GP:\n" << state.arf_readable().str();
    ss << "fetch address " << hex_u<64> << fetchaddr;

    ss << "\n";
    return ss;
}

int main(int argc, char** argv)
{
    opts myopts;
    if(util::parseargs(argc, argv, &myopts)) util::abort("Parsing args failed.");

    // log args
    util::log(LOG_SIM_INIT, BANNER_STRING);
    util::log(LOG_SIM_INIT, "Simulator started with args:" );
    util::log(LOG_SIM_INIT, "        loglevel:   ", +loglevel);
    util::log(LOG_SIM_INIT, "        entries:    ", myopts.entries);
    util::log(LOG_SIM_INIT, "        predictor:  ", ((myopts.predictor == bp_simple) ? "not taken" : "BTB"));
    util::log(LOG_SIM_INIT, "        max cycles: ", myopts.cycles, "\n");

    Simulator* sim = nullptr;
    try
    {
        sim = new Simulator(myopts);
    }
    catch(const InvalidConfigException& ic)
    {
        util::abort("Invalid configuration: ", ic.what());
    }

    timespec start, end;
    if(myopts.time) clock_gettime(CLOCK_MONOTONIC_RAW, &start);
    try
    {
        for(;sim->state.cycle < myopts.cycles;)
        {
            sim->state.cycle++;
            util::log(1, H2LINE, "\nEntering cycle ", dec_u<0>, sim->state.cycle, ".");
            util::log(1, "Fetch address ", hex_u<64>, sim->frontend->get_fetchaddr());
            if(!sim->cycle()) break;
        }
    }
    catch(const SimulatorException& se)
    {   // the pipeline broke a scoreboard contract, nothing to recover
        util::abort("Simulator error in cycle ", sim->state.cycle, ": ", se.what());
    }
    if(myopts.time) clock_gettime(CLOCK_MONOTONIC_RAW, &end);

    util::log_always(H2LINE);
    util::log_always("Simulator exited after ", dec_u<0>, sim->state.cycle, " cycles.");

    util::log_always("\n", HLINE, sim->frontend->summary().str(), HLINE, "\n");
    util::log_always(sim->state.stats_readable().str());

    u32 e = getExceptNum(sim->state.exception);
    if(e == ex_HALT)
        util::log_always("Halted.");
    else if(e) util::log_always("Core exception: ", e, " ", exception_str[e < ex_MAX ? e : ex_UNSPEC], ", EC ",
        hex_u<16>, getExceptEC(sim->state.exception), ".");

    if(myopts.time)
    {
        timespec res;
        util::timediff(&res, &start, &end);
        util::log_always("time ", res.tv_sec, ".", dec_u_lf<6>, res.tv_nsec/1000, "s");
    }

    util::log_always(H2LINE);

    delete sim;
    return EXIT_SUCCESS;
}
