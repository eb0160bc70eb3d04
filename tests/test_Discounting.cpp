/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "MacawInclude.h"
#include "TestHelpers.h"

TEST(Discounting, CapitalRecoveryFactorMatchesAnnuityFormula)
{
  EXPECT_NEAR(CapitalRecoveryFactor(20,0.05),0.0802425872,1e-9);
  EXPECT_NEAR(CapitalRecoveryFactor(1 ,0.10),1.1,1e-12);
}

TEST(Discounting, CapitalRecoveryFactorWithoutDiscountingIsStraightLine)
{
  EXPECT_DOUBLE_EQ(CapitalRecoveryFactor(10,0.0),0.1);
  EXPECT_DOUBLE_EQ(CapitalRecoveryFactor(4 ,0.0),0.25);
}

TEST(Discounting, CapitalRecoveryFactorRejectsZeroLifetime)
{
  EXPECT_THROW(CapitalRecoveryFactor(0,0.05),CMacawError);
}

TEST(Discounting, DiscountFactorRelativeToBaseYear)
{
  EXPECT_DOUBLE_EQ(DiscountFactor(2025,2025,0.05),1.0);
  EXPECT_NEAR     (DiscountFactor(2030,2025,0.05),0.7835261665,1e-9);
  EXPECT_NEAR     (DiscountFactor(2024,2025,0.05),1.05,1e-12);
  EXPECT_DOUBLE_EQ(DiscountFactor(2050,2025,0.0 ),1.0);
}

TEST(Discounting, BaseYearDefaultsToFirstModelYear)
{
  optStruct Options;
  InitializeTestOptions(Options);
  vector<int> years;
  GetModelYears(Options,years);
  ASSERT_EQ(years.size(),6u);
  EXPECT_EQ(GetBaseYear(Options,years),2025);

  Options.base_year=2020;
  EXPECT_EQ(GetBaseYear(Options,years),2020);
}

TEST(Discounting, ExplicitModelYearsAreSortedAndUnique)
{
  optStruct Options;
  InitializeTestOptions(Options);
  Options.model_years.push_back(2040);
  Options.model_years.push_back(2030);
  Options.model_years.push_back(2040);
  Options.model_years.push_back(2035);
  vector<int> years;
  GetModelYears(Options,years);
  ASSERT_EQ(years.size(),3u);
  EXPECT_EQ(years[0],2030);
  EXPECT_EQ(years[1],2035);
  EXPECT_EQ(years[2],2040);
}
