// =============================================================================
// access_policy_test.cpp
// =============================================================================
// Unit tests for savings::AccessPolicy.
// =============================================================================

#include "savings/auth/access_policy.hpp"

#include <gtest/gtest.h>

#include <string>

using savings::Operation;

class AccessPolicyTest : public ::testing::Test {
 protected:
  savings::AccessPolicy policy{"owner"};
};

// -----------------------------------------------------------------------------
// 1. The owner administers markets but cannot move share supply.
// -----------------------------------------------------------------------------
TEST_F(AccessPolicyTest, OwnerHoldsAdministrativeRightsOnly) {
  EXPECT_TRUE(policy.isAuthorized("owner", Operation::InitializeMarket));
  EXPECT_TRUE(policy.isAuthorized("owner", Operation::SetInterestRate));
  EXPECT_FALSE(policy.isAuthorized("owner", Operation::MintShares));
  EXPECT_FALSE(policy.isAuthorized("owner", Operation::BurnShares));
  EXPECT_EQ(policy.owner(), "owner");
}

TEST_F(AccessPolicyTest, StrangersHoldNothing) {
  for (Operation op : {Operation::InitializeMarket, Operation::SetInterestRate,
                       Operation::MintShares, Operation::BurnShares}) {
    EXPECT_FALSE(policy.isAuthorized("mallory", op))
        << savings::operationToString(op);
  }
}

// -----------------------------------------------------------------------------
// 2. Grants are per account and per operation.
// -----------------------------------------------------------------------------
TEST_F(AccessPolicyTest, GrantAndRevoke) {
  policy.grant("pool", Operation::MintShares);

  EXPECT_TRUE(policy.isAuthorized("pool", Operation::MintShares));
  EXPECT_FALSE(policy.isAuthorized("pool", Operation::BurnShares));
  EXPECT_FALSE(policy.isAuthorized("other", Operation::MintShares));

  policy.revoke("pool", Operation::MintShares);
  EXPECT_FALSE(policy.isAuthorized("pool", Operation::MintShares));

  // Revoking something never granted is harmless.
  EXPECT_NO_FATAL_FAILURE(policy.revoke("nobody", Operation::BurnShares));
}

TEST_F(AccessPolicyTest, GrantsExtendTheOwner) {
  policy.grant("owner", Operation::MintShares);
  EXPECT_TRUE(policy.isAuthorized("owner", Operation::MintShares));
  EXPECT_TRUE(policy.isAuthorized("owner", Operation::InitializeMarket));
}

TEST(OperationTest, NamesAreStable) {
  EXPECT_STREQ(savings::operationToString(Operation::InitializeMarket),
               "InitializeMarket");
  EXPECT_STREQ(savings::operationToString(Operation::SetInterestRate),
               "SetInterestRate");
  EXPECT_STREQ(savings::operationToString(Operation::MintShares),
               "MintShares");
  EXPECT_STREQ(savings::operationToString(Operation::BurnShares),
               "BurnShares");
}
