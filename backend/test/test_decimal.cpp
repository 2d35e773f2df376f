#include "util/decimal.hpp"

#include <gtest/gtest.h>
#include <string>

TEST(Decimal, ParsesPlainDecimalText)
{
    auto d = Decimal::parse("43250.50");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->str(), "43250.5");
    EXPECT_TRUE(d->positive());

    auto whole = Decimal::parse("100");
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(whole->str(), "100");
}

TEST(Decimal, RejectsNonPlainForms)
{
    for (const char *bad : {"", "-1", "+1", "1e5", " 1", "1 ", ".5", "1.", "1,5", "abc", "0x10", "1.2.3"}) {
        EXPECT_FALSE(Decimal::parse(bad).has_value()) << "input: '" << bad << "'";
    }
}

TEST(Decimal, ZeroIsNotPositive)
{
    auto z = Decimal::parse("0.000");
    ASSERT_TRUE(z.has_value());
    EXPECT_TRUE(z->is_zero());
    EXPECT_FALSE(z->positive());
    EXPECT_EQ(z->str(), "0");
}

TEST(Decimal, ArithmeticIsExact)
{
    auto a = *Decimal::parse("0.1");
    auto b = *Decimal::parse("0.2");
    EXPECT_EQ((a + b).str(), "0.3");
    EXPECT_EQ((b - a).str(), "0.1");
    EXPECT_EQ((a * b).str(), "0.02");

    Decimal sum;
    for (const char *p : {"100", "101", "102"}) sum += *Decimal::parse(p);
    EXPECT_EQ((sum / Decimal(3)).str(), "101");
}

TEST(Decimal, RendersAtRequestedScale)
{
    auto third = Decimal(1) / Decimal(3);
    EXPECT_EQ(third.str(4), "0.3333");
    EXPECT_EQ(third.str(), "0.333333333333");
}

TEST(Decimal, SquareRoot)
{
    EXPECT_EQ(Decimal(16).sqrt().str(), "4");
    EXPECT_TRUE(Decimal(0).sqrt().is_zero());

    const double root = std::stod((Decimal(2) / Decimal(3)).sqrt().str());
    EXPECT_NEAR(root, 0.816496580927726, 1e-11);
}

TEST(Decimal, Comparisons)
{
    auto lo = *Decimal::parse("99.99");
    auto hi = *Decimal::parse("100");
    EXPECT_LT(lo, hi);
    EXPECT_GT(hi, lo);
    EXPECT_EQ(*Decimal::parse("100.00"), hi);
    EXPECT_NE(lo, hi);
}
