/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "PathwayModel.h"
#include "TestHelpers.h"

class ModelDataCheckTest : public ::testing::Test
{
protected:
  optStruct      Options;
  CPathwayModel *pModel;

  void SetUp()
  {
    InitializeTestOptions(Options);
    pModel=CreateSteelModel(1.0);
  }
  void TearDown()
  {
    delete pModel;
  }
  void AddLink(const link_type type, const string a, const string b)
  {
    string ids[]={a,b};
    pModel->AddLink(new CTechLink(type,ids,2));
  }
};

TEST_F(ModelDataCheckTest, ValidModelPasses)
{
  EXPECT_NO_THROW(CheckOptions(Options));
  EXPECT_NO_THROW(CheckModelData(pModel,Options));
}

TEST_F(ModelDataCheckTest, InvalidOptionsAreRejected)
{
  optStruct Bad=Options;
  Bad.start_year=2031;
  EXPECT_THROW(CheckOptions(Bad),CDataValidationError);

  Bad=Options;
  Bad.discount_rate=-0.01;
  EXPECT_THROW(CheckOptions(Bad),CDataValidationError);

  Bad=Options;
  Bad.solver_order.clear();
  EXPECT_THROW(CheckOptions(Bad),CDataValidationError);

  Bad=Options;
  Bad.sweep_discount_rates.push_back(0.03);
  Bad.sweep_discount_rates.push_back(-0.02);
  EXPECT_THROW(CheckOptions(Bad),CDataValidationError);

  Bad=Options;
  Bad.consistency_tol=0.0;
  EXPECT_THROW(CheckOptions(Bad),CDataValidationError);
}

TEST_F(ModelDataCheckTest, UnknownBandIsRejected)
{
  pModel->AddTechnology(CreateTechnology("CCS","CEMENT",20,0.4,900.0,20.0,10.0));
  EXPECT_THROW(CheckModelData(pModel,Options),CDataValidationError);
}

TEST_F(ModelDataCheckTest, DuplicateTechnologyIsRejected)
{
  pModel->AddTechnology(CreateTechnology("H2DRI","STEEL",20,0.4,900.0,20.0,10.0));
  EXPECT_THROW(CheckModelData(pModel,Options),CDataValidationError);
}

TEST_F(ModelDataCheckTest, NonPositiveActivityIsRejected)
{
  pModel->AddBand(new CBaselineBand("CEMENT",0.0,0.8));
  EXPECT_THROW(CheckModelData(pModel,Options),CDataValidationError);
}

TEST_F(ModelDataCheckTest, AdoptionCapOutsideUnitIntervalIsRejected)
{
  pModel->GetTechnologyToModify(0)->AddAdoptionCap(2030,1.2);
  EXPECT_THROW(CheckModelData(pModel,Options),CDataValidationError);
}

TEST_F(ModelDataCheckTest, MissingCostTableIsRejected)
{
  CTechnology *pTech=new CTechnology("EAF");
  pTech->SetBandID("STEEL");
  pTech->SetLifetime(20);
  pTech->AddAbatementFactor(2025,0.3);
  pModel->AddTechnology(pTech);
  EXPECT_THROW(CheckModelData(pModel,Options),CDataValidationError);
}

TEST_F(ModelDataCheckTest, MissingAbatementFactorIsRejected)
{
  CTechnology *pTech=new CTechnology("EAF");
  pTech->SetBandID("STEEL");
  pTech->SetLifetime(20);
  pTech->GetCostRecord()->AddYear(2025,300.0,5.0,2.0);
  pModel->AddTechnology(pTech);
  EXPECT_THROW(CheckModelData(pModel,Options),CDataValidationError);
}

TEST_F(ModelDataCheckTest, NegativeTargetIsRejected)
{
  pModel->AddTarget(2028,-1.0);
  EXPECT_THROW(CheckModelData(pModel,Options),CDataValidationError);
}

TEST_F(ModelDataCheckTest, LinkToUnknownTechnologyIsRejected)
{
  AddLink(LINK_MUTUALLY_EXCLUSIVE,"H2DRI","EAF");
  EXPECT_THROW(CheckModelData(pModel,Options),CDataValidationError);
}

TEST_F(ModelDataCheckTest, SelfCouplingIsRejected)
{
  AddLink(LINK_COUPLING,"H2DRI","H2DRI");
  EXPECT_THROW(CheckModelData(pModel,Options),CDataValidationError);
}

TEST_F(ModelDataCheckTest, SuspiciousDataOnlyWarns)
{
  //abatement factor above band intensity, commercial only after the horizon
  CTechnology *pTech=CreateTechnology("EAF","STEEL",20,0.9,300.0,5.0,2.0);
  pTech->SetCommercialYear(2040);
  pModel->AddTechnology(pTech);
  Options.allow_shortfall=true;
  Options.slack_penalty  =1.0;
  EXPECT_NO_THROW(CheckModelData(pModel,Options));
}

TEST_F(ModelDataCheckTest, TargetsWithinPotentialAreFeasible)
{
  EXPECT_EQ(CheckTargetFeasibility(pModel,Options),0);
}

TEST_F(ModelDataCheckTest, TargetsBeyondPotentialOnlyAdvise)
{
  //cap 0.2 of 100 units at 0.5 t/unit abates at most 10 t against 12 t (2029) and 15 t (2030)
  delete pModel;
  pModel=CreateSteelModel(0.2);
  EXPECT_EQ(CheckTargetFeasibility(pModel,Options),2);
  EXPECT_NO_THROW(CheckModelData(pModel,Options));

  //a second technology in the same band raises the potential, but never above band activity
  pModel->AddTechnology(CreateTechnology("EAF","STEEL",20,0.3,300.0,5.0,2.0));
  EXPECT_EQ(CheckTargetFeasibility(pModel,Options),0);
}

TEST_F(ModelDataCheckTest, TechnologyNotYetCommercialAddsNoPotential)
{
  pModel->GetTechnologyToModify(0)->SetCommercialYear(2029);
  //no potential before 2029 while 3, 6 and 9 t are required in 2026-2028
  EXPECT_EQ(CheckTargetFeasibility(pModel,Options),3);
}
