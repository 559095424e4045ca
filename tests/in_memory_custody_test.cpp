// =============================================================================
// in_memory_custody_test.cpp
// =============================================================================
// Unit tests for savings::InMemoryCustody: wallet and reserve bookkeeping,
// all-or-nothing transfers, per-asset isolation.
// =============================================================================

#include "savings/custody/in_memory_custody.hpp"
#include "savings/math/fixed_point.hpp"

#include <gtest/gtest.h>

using savings::Uint;
using savings::fromWhole;

class InMemoryCustodyTest : public ::testing::Test {
 protected:
  void SetUp() override { custody.credit("MTK", "alice", fromWhole(10)); }

  savings::InMemoryCustody custody;
};

TEST_F(InMemoryCustodyTest, CreditFundsWallet) {
  EXPECT_EQ(custody.balanceOf("MTK", "alice"), fromWhole(10));
  EXPECT_EQ(custody.balanceOf("MTK", "bob"), Uint(0));
  EXPECT_EQ(custody.balanceOf("USDX", "alice"), Uint(0));
  EXPECT_EQ(custody.reserveOf("MTK"), Uint(0));
}

TEST_F(InMemoryCustodyTest, TransferInMovesWalletToReserve) {
  ASSERT_TRUE(custody.transferIn("MTK", "alice", fromWhole(4)));

  EXPECT_EQ(custody.balanceOf("MTK", "alice"), fromWhole(6));
  EXPECT_EQ(custody.reserveOf("MTK"), fromWhole(4));
}

TEST_F(InMemoryCustodyTest, TransferOutMovesReserveToWallet) {
  ASSERT_TRUE(custody.transferIn("MTK", "alice", fromWhole(4)));
  ASSERT_TRUE(custody.transferOut("MTK", "bob", fromWhole(3)));

  EXPECT_EQ(custody.balanceOf("MTK", "bob"), fromWhole(3));
  EXPECT_EQ(custody.reserveOf("MTK"), fromWhole(1));
}

// -----------------------------------------------------------------------------
// Refused transfers move nothing.
// -----------------------------------------------------------------------------
TEST_F(InMemoryCustodyTest, InsufficientFundsAreRefused) {
  EXPECT_FALSE(custody.transferIn("MTK", "alice", fromWhole(10) + 1));
  EXPECT_FALSE(custody.transferIn("MTK", "bob", Uint(1)));
  EXPECT_FALSE(custody.transferOut("MTK", "alice", Uint(1)));

  EXPECT_EQ(custody.balanceOf("MTK", "alice"), fromWhole(10));
  EXPECT_EQ(custody.reserveOf("MTK"), Uint(0));
}

TEST_F(InMemoryCustodyTest, ReservesArePerAsset) {
  custody.fundReserve("USDX", fromWhole(50));

  EXPECT_FALSE(custody.transferOut("MTK", "alice", Uint(1)));
  EXPECT_TRUE(custody.transferOut("USDX", "alice", fromWhole(50)));
  EXPECT_EQ(custody.balanceOf("USDX", "alice"), fromWhole(50));
  EXPECT_EQ(custody.balanceOf("MTK", "alice"), fromWhole(10));
}

TEST_F(InMemoryCustodyTest, FullWithdrawalOfWallet) {
  ASSERT_TRUE(custody.transferIn("MTK", "alice", fromWhole(10)));
  EXPECT_EQ(custody.balanceOf("MTK", "alice"), Uint(0));
  EXPECT_EQ(custody.reserveOf("MTK"), fromWhole(10));
}
