// sbsim scoreboard simulator
//
// end to end pipeline tests
//

#include <gtest/gtest.h>

#include "../sim.hh"
#include "../core/core.hh"
#include "../frontend/frontend.hh"

namespace
{

// big endian image, see RiscFrontend::read_uop
void emit(vector<u8>& code, u16 opcode, u16 control, u8 ra, u8 rb, u8 rd, u64 imm)
{
    code.push_back(opcode >> 8);
    code.push_back(opcode & 0xff);
    code.push_back(control >> 8);
    code.push_back(control & 0xff);
    code.push_back(ra);
    code.push_back(rb);
    code.push_back(0);
    code.push_back(rd);
    for(i8 s = 56; s >= 0; s -= 8) code.push_back((u8) (imm >> s));
}

void set(vector<u8>& c, u8 rd, u64 imm)       { emit(c, uop_set, use_imm, 0, 0, rd, imm); }
void alu(vector<u8>& c, u16 op, u8 rd, u8 ra, u8 rb) { emit(c, op, use_ra | use_rb, ra, rb, rd, 0); }
void alui(vector<u8>& c, u16 op, u8 rd, u8 ra, u64 imm) { emit(c, op, use_ra | use_imm, ra, 0, rd, imm); }
void halt(vector<u8>& c)                       { emit(c, uop_int, use_imm, 0, 0, 0, ex_HALT); }

class PipelineTest : public ::testing::Test
{
    protected:
    void run(u32 entries = SB_ENTRIES, u8 predictor = bp_simple)
    {
        myopts = { code, 5000, entries, predictor, 0 };
        sim    = new Simulator(myopts);

        while(sim->state.cycle < myopts.cycles)
        {
            sim->state.cycle++;
            if(!sim->cycle()) break;
        }
    }

    void TearDown() override { delete sim; }

    u64 reg(u8 r) { return sim->state.arf->gp[r]; }
    u32 exception() { return getExceptNum(sim->state.exception); }

    vector<u8> code;
    opts       myopts;
    Simulator* sim = nullptr;
};

} // namespace

TEST_F(PipelineTest, ForwardsDependentOperands)
{
    set(code, 1, 5);
    set(code, 2, 7);
    alu(code, uop_add, 3, 1, 2);
    alu(code, uop_mul, 4, 3, 3);
    alu(code, uop_sub, 5, 4, 1);
    halt(code);
    run();

    EXPECT_EQ(exception(), (u32) ex_HALT);
    EXPECT_EQ(reg(3), 12u);
    EXPECT_EQ(reg(4), 144u);
    EXPECT_EQ(reg(5), 139u);
    EXPECT_GT(sim->state.forwarded, 0u);
    EXPECT_EQ(sim->state.commited, 6u);
    EXPECT_EQ(sim->state.active, 0);
}

TEST_F(PipelineTest, LateOlderWriterDoesNotOverrideYounger)
{
    set(code, 1, 2);
    alu(code, uop_mul, 3, 1, 1);                           // 3 cycles
    alui(code, uop_add, 3, 1, 1);                          // 1 cycle, same rd
    set(code, 5, 9);
    alui(code, uop_add, 4, 3, 0);
    halt(code);
    run();

    EXPECT_EQ(exception(), (u32) ex_HALT);
    EXPECT_EQ(reg(3), 3u);
    EXPECT_EQ(reg(4), 3u);
    EXPECT_EQ(reg(5), 9u);
    EXPECT_GT(sim->state.waw_stalls, 0u);
}

TEST_F(PipelineTest, EndOfImageDrains)
{
    set(code, 1, 1);
    alui(code, uop_lsl, 2, 1, 4);
    run();

    EXPECT_EQ(exception(), (u32) ex_NONE);
    EXPECT_EQ(reg(2), 16u);
    EXPECT_LT(sim->state.cycle, myopts.cycles);
    EXPECT_TRUE(sim->core->scoreboard().empty());
}

TEST_F(PipelineTest, RegisterZeroStaysZero)
{
    set(code, 0, 5);
    alui(code, uop_add, 1, 0, 1);
    halt(code);
    run();

    EXPECT_EQ(reg(0), 0u);
    EXPECT_EQ(reg(1), 1u);
}

TEST_F(PipelineTest, MispredictRollsBackWrongPath)
{
    set(code, 1, 1);                                       // 0x00
    emit(code, uop_branchnz, use_ra | use_imm, 1, 0, 0, 0x40); // 0x10
    set(code, 2, 0xbad);                                   // 0x20
    set(code, 3, 0xbad);                                   // 0x30
    set(code, 4, 42);                                      // 0x40
    halt(code);                                            // 0x50
    run(SB_ENTRIES, bp_simple);

    EXPECT_EQ(exception(), (u32) ex_HALT);
    EXPECT_EQ(reg(2), 0u);
    EXPECT_EQ(reg(3), 0u);
    EXPECT_EQ(reg(4), 42u);
    EXPECT_EQ(sim->state.mispredicts, 1u);
}

TEST_F(PipelineTest, CountingLoop)
{
    set(code, 1, 5);                                       // 0x00
    alui(code, uop_sub, 1, 1, 1);                          // 0x10
    alui(code, uop_add, 2, 2, 3);                          // 0x20
    emit(code, uop_branchnz, use_ra | use_imm, 1, 0, 0, 0x10); // 0x30
    halt(code);                                            // 0x40
    run(SB_ENTRIES, bp_simple);

    EXPECT_EQ(exception(), (u32) ex_HALT);
    EXPECT_EQ(reg(1), 0u);
    EXPECT_EQ(reg(2), 15u);
    EXPECT_EQ(sim->state.mispredicts, 4u);
}

TEST_F(PipelineTest, BTBPredictsLoop)
{
    set(code, 1, 5);
    alui(code, uop_sub, 1, 1, 1);
    emit(code, uop_branchnz, use_ra | use_imm, 1, 0, 0, 0x10);
    halt(code);
    run(SB_ENTRIES, bp_btb);

    EXPECT_EQ(reg(1), 0u);
    EXPECT_EQ(sim->state.mispredicts, 1u); // only the loop exit
}

TEST_F(PipelineTest, LinkRegister)
{
    emit(code, uop_branch, use_imm, 0, 0, 7, 0x20);        // 0x00
    set(code, 1, 0xbad);                                   // 0x10
    halt(code);                                            // 0x20
    run();

    EXPECT_EQ(reg(7), 0x10u);
    EXPECT_EQ(reg(1), 0u);
    EXPECT_EQ(sim->state.mispredicts, 0u);
}

TEST_F(PipelineTest, DivideErrorIsPrecise)
{
    set(code, 1, 10);
    alui(code, uop_divq, 2, 1, 3);
    alui(code, uop_divr, 3, 1, 0);
    set(code, 4, 1);
    halt(code);
    run();

    EXPECT_EQ(exception(), (u32) ex_DE);
    EXPECT_EQ(reg(2), 3u);
    EXPECT_EQ(reg(3), 0u);
    EXPECT_EQ(reg(4), 0u);
    EXPECT_EQ(sim->state.flushes, 1u);
}

TEST_F(PipelineTest, UndefinedOpcode)
{
    set(code, 1, 1);
    emit(code, 0x0fff, 0, 0, 0, 2, 0);
    set(code, 3, 1);
    run();

    EXPECT_EQ(exception(), (u32) ex_UD);
    EXPECT_EQ(reg(1), 1u);
    EXPECT_EQ(reg(3), 0u);
}

TEST_F(PipelineTest, InvalidRegister)
{
    set(code, NR_ARCH_REGS, 1);
    run();

    EXPECT_EQ(exception(), (u32) ex_REG);
}

TEST_F(PipelineTest, FetchOutsideImage)
{
    emit(code, uop_branch, use_imm, 0, 0, 0, 0x1000);
    halt(code);
    run();

    EXPECT_EQ(exception(), (u32) ex_PF);
    EXPECT_EQ(sim->state.commited, 1u);
}

TEST_F(PipelineTest, SmallScoreboardStalls)
{
    set(code, 1, 3);
    for(u8 i = 2; i < 8; i++) alui(code, uop_mul, i, 1, i);
    halt(code);
    run(2);

    EXPECT_EQ(exception(), (u32) ex_HALT);
    for(u8 i = 2; i < 8; i++) EXPECT_EQ(reg(i), 3u * i);
    EXPECT_GT(sim->state.full_stalls, 0u);
}

TEST_F(PipelineTest, SingleEntryScoreboard)
{
    set(code, 1, 2);
    alu(code, uop_mul, 2, 1, 1);
    alu(code, uop_xor, 3, 2, 1);
    halt(code);
    run(1);

    EXPECT_EQ(exception(), (u32) ex_HALT);
    EXPECT_EQ(reg(3), 6u);
}
