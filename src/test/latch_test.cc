// sbsim scoreboard simulator
//
// latch, uop format and predictor tests
//

#include <gtest/gtest.h>

#include "../types.hh"
#include "../util.hh"
#include "../core/uops.hh"
#include "../frontend/bp.hh"
#include "../frontend/frontend.hh"

TEST(LatchQueue, ReleasesAtCycle)
{
    LatchQueue<u64> lq(2);
    lq.push_back(5, 42);

    EXPECT_FALSE(lq.ready(4));
    EXPECT_THROW(lq.front(4), LatchStallException);
    EXPECT_TRUE(lq.ready(5));
    EXPECT_EQ(lq.get_front(5), 42u);
    EXPECT_TRUE(lq.empty());
}

TEST(LatchQueue, BoundedSize)
{
    LatchQueue<u64> lq(2);
    lq.push_back(1, 1);
    lq.push_back(1, 2);

    EXPECT_THROW(lq.push_back(1, 3), LatchFullException);
    EXPECT_EQ(lq.size(), 2u);

    lq.clear();
    EXPECT_TRUE(lq.empty());
    EXPECT_THROW(lq.front(1), LatchEmptyException);
    EXPECT_THROW(lq.pop_front(), LatchEmptyException);
}

TEST(LatchQueue, InOrderRelease)
{
    LatchQueue<u64> lq(4);
    lq.push_back(3, 1);
    lq.push_back(1, 2);

    // the younger element does not pass the older one
    EXPECT_FALSE(lq.ready(2));
    EXPECT_EQ(lq.at(UINT64_MAX, 1), 2u);
    EXPECT_THROW(lq.at(UINT64_MAX, 2), std::out_of_range);
}

TEST(UopFormat, BigEndianImage)
{
    const u8 bytes[UOP_BYTES] =
    {
        0x10, 0x10, 0x00, 0x0b, 0x01, 0x02, 0x00, 0x03,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x12, 0x34,
    };

    uop op = RiscFrontend::read_uop(bytes);
    EXPECT_EQ(op.opcode, uop_add);
    EXPECT_EQ(op.control, use_ra | use_rb | use_imm);
    EXPECT_EQ(op.regs[r_ra], 1);
    EXPECT_EQ(op.regs[r_rb], 2);
    EXPECT_EQ(getDest(op), 3);
    EXPECT_EQ(op.imm, 0x1234u);
}

TEST(UopFormat, Classification)
{
    uop op = zero_op;

    op.opcode = uop_branch;
    EXPECT_EQ(is_branch(op), branch_uncond);
    op.opcode = uop_branchl;
    EXPECT_EQ(is_branch(op), branch_cond);
    op.opcode = uop_add;
    EXPECT_EQ(is_branch(op), branch_none);

    EXPECT_EQ(getFUType(op), fu_alu);
    op.opcode = uop_divr;
    EXPECT_EQ(getFUType(op), fu_div);
    EXPECT_EQ(getWBPort(fu_div), WB_PORT_DIV);
    op.opcode = 0x0fff;
    EXPECT_EQ(getFUType(op), fu_none);
    EXPECT_EQ(getWBPort(fu_ctrl), WB_PORT_ALU);

    u32 e = setExcept(ex_DE, 0x12);
    EXPECT_EQ(getExceptNum(e), (u32) ex_DE);
    EXPECT_EQ(getExceptEC(e), 0x12u);
}

TEST(BranchPredictor, SimpleNeverTaken)
{
    SimplePredictor bp;
    bp.update(0x20, 0x80, 1);
    EXPECT_EQ(bp.predict(0x20, 0x30, 0x80), 0x30u);
}

TEST(BranchPredictor, BTBLearnsDirection)
{
    BTBPredictor bp;
    EXPECT_EQ(bp.predict(0x20, 0x30, 0x80), 0x30u);

    bp.update(0x20, 0x80, 1);
    EXPECT_EQ(bp.predict(0x20, 0x30, 0x80), 0x80u);

    bp.update(0x20, 0x30, 0);
    EXPECT_EQ(bp.predict(0x20, 0x30, 0x80), 0x30u);

    // taken again, the old target is kept
    bp.update(0x20, 0x80, 1);
    EXPECT_EQ(bp.predict(0x20, 0x30, 0x80), 0x80u);
}

TEST(BranchPredictor, BTBRemembersNotTakenBackwardBranch)
{
    BTBPredictor bp;
    EXPECT_EQ(bp.predict(0x40, 0x50, 0x10), 0x10u);

    bp.update(0x40, 0x50, 0);
    EXPECT_EQ(bp.predict(0x40, 0x50, 0x10), 0x50u);
}

TEST(BranchPredictor, BTBBounded)
{
    BTBPredictor bp;
    for(u64 i = 0; i < 2 * BTB_SIZE; i++) bp.update(i * UOP_BYTES, 0x1000, 1);
    EXPECT_EQ(bp.size(), (size_t) BTB_SIZE);

    // outside the table the static rule applies
    EXPECT_EQ(bp.predict(BTB_SIZE * UOP_BYTES, BTB_SIZE * UOP_BYTES + UOP_BYTES, 0), 0u);
}

TEST(BranchPredictor, Factory)
{
    BranchPredictor* bp = make_predictor(bp_simple);
    EXPECT_STREQ(bp->name(), "not taken");
    delete bp;

    bp = make_predictor(bp_btb);
    EXPECT_STREQ(bp->name(), "BTB");
    delete bp;
}
