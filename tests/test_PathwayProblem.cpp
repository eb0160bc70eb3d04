/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "PathwayProblem.h"
#include "TestHelpers.h"

class PathwayProblemTest : public ::testing::Test
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
  const CTechnology *Steel() const {return pModel->GetTechnology(0);}
};

TEST_F(PathwayProblemTest, ResolvesRequiredAbatementFromBaselineAndTargets)
{
  pModel->Initialize(Options);
  CPathwayProblem P(pModel,Options);

  ASSERT_EQ(P.GetNumYears(),6);
  EXPECT_DOUBLE_EQ(P.GetBaselineEmissions(),50.0);
  EXPECT_NEAR(P.GetRequiredAbatement(0), 0.0,1e-12);
  EXPECT_NEAR(P.GetRequiredAbatement(2), 6.0,1e-12);
  EXPECT_NEAR(P.GetRequiredAbatement(5),15.0,1e-12);
  EXPECT_NEAR(P.GetTarget(5),35.0,1e-12);
  EXPECT_EQ(P.GetBaseYear(),2025);
  EXPECT_EQ(P.GetYearIndex(2028),3);
  EXPECT_EQ(P.GetYearIndex(2040),DOESNT_EXIST);
}

TEST_F(PathwayProblemTest, TargetAboveBaselineRequiresNothing)
{
  pModel->SetBaselineEmissions(30.0);
  pModel->Initialize(Options);
  CPathwayProblem P(pModel,Options);
  for (int k=0;k<P.GetNumYears();k++){
    EXPECT_DOUBLE_EQ(P.GetRequiredAbatement(k),0.0);
  }
}

TEST_F(PathwayProblemTest, AssemblesOneRowOfEachKindPerYear)
{
  pModel->Initialize(Options);
  CPathwayProblem P(pModel,Options);
  P.Build();
  const CLinearProgram &LP=P.GetLP();

  //install, capacity, production, abatement for one technology over six years
  EXPECT_EQ(LP.GetNumColumns(),24);
  //vintage, production limit, band, abatement, target
  EXPECT_EQ(LP.GetNumRows(),30);

  const char *kinds[]={"VINTAGE_H2DRI_","PRODLIM_H2DRI_","BAND_STEEL_","ABATE_H2DRI_","TARGET_"};
  for (int j=0;j<5;j++){
    for (int y=2025;y<=2030;y++){
      EXPECT_NE(LP.GetRowIndex(string(kinds[j])+to_string(y)),DOESNT_EXIST) << kinds[j] << y;
    }
  }
  int r=LP.GetRowIndex("TARGET_2030");
  EXPECT_EQ(LP.GetRow(r).type,ROW_GE);
  EXPECT_NEAR(LP.GetRow(r).rhs,15.0,1e-12);

  r=LP.GetRowIndex("BAND_STEEL_2027");
  EXPECT_EQ(LP.GetRow(r).type,ROW_LE);
  EXPECT_DOUBLE_EQ(LP.GetRow(r).rhs,100.0);

  r=LP.GetRowIndex("ABATE_H2DRI_2026");
  EXPECT_EQ(LP.GetRow(r).type,ROW_EQ);
  EXPECT_DOUBLE_EQ(LP.GetRow(r).aVals[1],-0.5);
}

TEST_F(PathwayProblemTest, VintageRowsFollowLifetimeWindow)
{
  pModel->GetTechnologyToModify(0)->SetLifetime(2);
  pModel->Initialize(Options);

  CPathwayProblem Excl(pModel,Options);
  Excl.Build();
  int r=Excl.GetLP().GetRowIndex("VINTAGE_H2DRI_2030");
  EXPECT_EQ(Excl.GetLP().GetRow(r).nEntries,3); //capacity + installations of 2029, 2030
  EXPECT_EQ(Excl.GetLP().GetRow(r).type,ROW_EQ);

  Options.vintage_policy=VINTAGE_INCLUSIVE;
  CPathwayProblem Incl(pModel,Options);
  Incl.Build();
  r=Incl.GetLP().GetRowIndex("VINTAGE_H2DRI_2030");
  EXPECT_EQ(Incl.GetLP().GetRow(r).nEntries,4); //capacity + installations of 2028-2030
}

TEST_F(PathwayProblemTest, GateRampAndCapAreColumnBounds)
{
  pModel->GetTechnologyToModify(0)->SetCommercialYear(2027);
  pModel->GetTechnologyToModify(0)->SetRampRate(0.1);
  pModel->GetTechnologyToModify(0)->AddAdoptionCap(2025,0.2);
  pModel->GetTechnologyToModify(0)->AddAdoptionCap(2030,0.7);
  pModel->Initialize(Options);
  CPathwayProblem P(pModel,Options);
  P.Build();
  const CLinearProgram &LP=P.GetLP();

  for (int k=0;k<P.GetNumYears();k++)
  {
    const lp_column &inst=LP.GetColumn(P.GetDVColumnInd(DV_INSTALL,0,k));
    EXPECT_DOUBLE_EQ(inst.lower,0.0);
    if (P.GetYear(k)<2027){EXPECT_DOUBLE_EQ(inst.upper,0.0)  << "gate " << P.GetYear(k);}
    else                  {EXPECT_DOUBLE_EQ(inst.upper,10.0) << "ramp " << P.GetYear(k);}
  }
  EXPECT_EQ(LP.GetColumn(P.GetDVColumnInd(DV_INSTALL,0,0)).name,"NEW_H2DRI_2025");
  EXPECT_NEAR(LP.GetColumn(P.GetDVColumnInd(DV_CAPACITY,0,0)).upper,20.0,1e-9);
  EXPECT_NEAR(LP.GetColumn(P.GetDVColumnInd(DV_CAPACITY,0,5)).upper,70.0,1e-9);
  EXPECT_NEAR(LP.GetColumn(P.GetDVColumnInd(DV_CAPACITY,0,3)).upper,50.0,1e-9);
  EXPECT_FALSE(P.IsInstallAllowed(0,1));
  EXPECT_TRUE (P.IsInstallAllowed(0,2));
}

TEST_F(PathwayProblemTest, DefaultRampRateAppliesWhenTechnologyOmitsOne)
{
  Options.default_ramp_rate=0.35;
  pModel->Initialize(Options);
  CPathwayProblem P(pModel,Options);
  EXPECT_NEAR(P.GetRampLimit(0),35.0,1e-12);
}

TEST_F(PathwayProblemTest, ShortfallColumnsOnlyWithSlack)
{
  pModel->Initialize(Options);
  CPathwayProblem NoSlack(pModel,Options);
  EXPECT_FALSE(NoSlack.HasShortfall());
  EXPECT_EQ(NoSlack.GetNumDecisionVars(),24);
  EXPECT_THROW(NoSlack.GetDVColumnInd(DV_SHORTFALL,0,0),CMacawError);

  Options.allow_shortfall=true;
  Options.slack_penalty  =1000.0;
  CPathwayProblem Slack(pModel,Options);
  Slack.Build();
  EXPECT_EQ(Slack.GetNumDecisionVars(),30);
  const lp_row &row=Slack.GetLP().GetRow(Slack.GetLP().GetRowIndex("TARGET_2030"));
  EXPECT_EQ(row.nEntries,2);
  EXPECT_EQ(row.aCols[1],Slack.GetDVColumnInd(DV_SHORTFALL,0,5));

  const lp_column &sf=Slack.GetLP().GetColumn(Slack.GetDVColumnInd(DV_SHORTFALL,0,5));
  EXPECT_EQ(sf.name,"SHORT_2030");
  EXPECT_NEAR(sf.obj,1000.0*DiscountFactor(2030,2025,Options.discount_rate),1e-9);
}

TEST_F(PathwayProblemTest, ObjectiveChargesAnnuityOverInServiceYears)
{
  pModel->GetTechnologyToModify(0)->SetLifetime(3);
  Options.discount_rate=0.07;
  pModel->Initialize(Options);
  CPathwayProblem P(pModel,Options);
  P.Build();
  const CLinearProgram &LP=P.GetLP();

  double crf=CapitalRecoveryFactor(3,0.07);
  double df[6];
  for (int k=0;k<6;k++){df[k]=DiscountFactor(2025+k,2025,0.07);}

  //installed 2025: in service 2025-2027
  EXPECT_NEAR(LP.GetColumn(P.GetDVColumnInd(DV_INSTALL,0,0)).obj,crf*500.0*(df[0]+df[1]+df[2]),1e-9);
  //installed 2029: in service 2029-2030 within horizon
  EXPECT_NEAR(LP.GetColumn(P.GetDVColumnInd(DV_INSTALL,0,4)).obj,crf*500.0*(df[4]+df[5]),1e-9);
  //operating cost of production is discounted per year
  for (int k=0;k<6;k++){
    EXPECT_NEAR(LP.GetColumn(P.GetDVColumnInd(DV_PRODUCTION,0,k)).obj,df[k]*15.0,1e-9);
    EXPECT_DOUBLE_EQ(LP.GetColumn(P.GetDVColumnInd(DV_CAPACITY ,0,k)).obj,0.0);
    EXPECT_DOUBLE_EQ(LP.GetColumn(P.GetDVColumnInd(DV_ABATEMENT,0,k)).obj,0.0);
  }
}

TEST_F(PathwayProblemTest, NoInstallationCostBeforeCommercialYear)
{
  pModel->GetTechnologyToModify(0)->SetCommercialYear(2028);
  pModel->Initialize(Options);
  CPathwayProblem P(pModel,Options);
  P.Build();
  EXPECT_DOUBLE_EQ(P.GetLP().GetColumn(P.GetDVColumnInd(DV_INSTALL,0,0)).obj,0.0);
  EXPECT_GT       (P.GetLP().GetColumn(P.GetDVColumnInd(DV_INSTALL,0,3)).obj,0.0);
}

TEST_F(PathwayProblemTest, LevelizedCostOfAbatement)
{
  pModel->Initialize(Options);
  CPathwayProblem P(pModel,Options);
  double expected=(CapitalRecoveryFactor(25,0.05)*500.0+15.0)/0.5;
  EXPECT_NEAR(P.GetLCOA(0,0),expected,1e-9);
  EXPECT_NEAR(Steel()->GetLevelizedCostOfAbatement(2025,Options),expected,1e-9);
}

TEST_F(PathwayProblemTest, LinearExtrapolationBelowZeroCapIsRejected)
{
  //0.8 in 2025 falling to 0.2 in 2028 extends to -0.2 by 2030
  pModel->GetTechnologyToModify(0)->AddAdoptionCap(2025,0.8);
  pModel->GetTechnologyToModify(0)->AddAdoptionCap(2028,0.2);
  Options.extrapolation=EXTRAP_LINEAR;
  pModel->Initialize(Options);
  EXPECT_THROW({CPathwayProblem P(pModel,Options);},CDataValidationError);

  Options.extrapolation=EXTRAP_FLAT;
  CPathwayProblem Flat(pModel,Options);
  EXPECT_NEAR(Flat.GetAdoptionCap(0,5),0.2,1e-12);
}

TEST_F(PathwayProblemTest, LinearExtrapolationBelowZeroCostIsRejected)
{
  //capex 500 in 2025 falling to 200 in 2027 extends to -250 by 2030
  pModel->GetTechnologyToModify(0)->GetCostRecord()->AddYear(2027,200.0,10.0,5.0);
  Options.extrapolation=EXTRAP_LINEAR;
  pModel->Initialize(Options);
  EXPECT_THROW({CPathwayProblem P(pModel,Options);},CDataValidationError);
}

TEST_F(PathwayProblemTest, MissingTargetsRaiseDataGap)
{
  CPathwayModel *pBare=new CPathwayModel();
  pBare->AddBand(new CBaselineBand("STEEL",100.0,0.5));
  pBare->AddTechnology(CreateTechnology("H2DRI","STEEL",25,0.5,500.0,10.0,5.0));
  pBare->Initialize(Options);
  EXPECT_THROW({CPathwayProblem P(pBare,Options);},CDataGapError);
  delete pBare;
}

TEST_F(PathwayProblemTest, UninitializedModelIsRejected)
{
  EXPECT_THROW({CPathwayProblem P(pModel,Options);},CMacawError);
}

TEST(PathwayProblemLinks, ExclusiveAndCouplingRowsUseShares)
{
  optStruct Options;
  InitializeTestOptions(Options);
  CPathwayModel *pModel=new CPathwayModel();
  pModel->AddBand(new CBaselineBand("STEEL",100.0,0.5));
  pModel->AddBand(new CBaselineBand("POWER",200.0,0.1));
  pModel->AddTechnology(CreateTechnology("H2DRI","STEEL",25,0.5,500.0,10.0,5.0));
  pModel->AddTechnology(CreateTechnology("EAF"  ,"STEEL",25,0.4,300.0,10.0,5.0));
  pModel->AddTechnology(CreateTechnology("ELEC" ,"POWER",30,0.0,100.0, 1.0,1.0));
  pModel->AddTarget(2025,50.0);
  string excl[]={"H2DRI","EAF"};
  string cpl []={"H2DRI","ELEC"};
  pModel->AddLink(new CTechLink(LINK_MUTUALLY_EXCLUSIVE,excl,2));
  pModel->AddLink(new CTechLink(LINK_COUPLING,cpl,2));
  pModel->Initialize(Options);

  CPathwayProblem P(pModel,Options);
  P.Build();
  const CLinearProgram &LP=P.GetLP();
  ASSERT_EQ(P.GetNumGroups(),1);
  ASSERT_EQ(P.GetNumCouplings(),1);

  for (int y=2025;y<=2030;y++)
  {
    int r=LP.GetRowIndex("EXCL_1_"+to_string(y));
    ASSERT_NE(r,DOESNT_EXIST);
    EXPECT_EQ(LP.GetRow(r).type,ROW_LE);
    EXPECT_DOUBLE_EQ(LP.GetRow(r).rhs,1.0);
    EXPECT_DOUBLE_EQ(LP.GetRow(r).aVals[0],0.01);

    r=LP.GetRowIndex("COUPLE_H2DRI_ELEC_"+to_string(y));
    ASSERT_NE(r,DOESNT_EXIST);
    EXPECT_EQ(LP.GetRow(r).type,ROW_GE);
    EXPECT_EQ(LP.GetRow(r).aCols[0],P.GetDVColumnInd(DV_CAPACITY,2,P.GetYearIndex(y)));
    EXPECT_DOUBLE_EQ(LP.GetRow(r).aVals[0], 1.0/200.0);
    EXPECT_DOUBLE_EQ(LP.GetRow(r).aVals[1],-1.0/100.0);
  }
  //POWER band has one technology, STEEL band two
  int r=LP.GetRowIndex("BAND_STEEL_2030");
  EXPECT_EQ(LP.GetRow(r).nEntries,2);
  delete pModel;
}
