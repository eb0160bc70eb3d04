/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  End-to-end pathway runs through the default (lp_solve) backend.
  Built only where Macaw is built with lp_solve.
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "PathwayResults.h"
#include "PathwayProblem.h"
#include "TestHelpers.h"

const double SOLVE_TOL=1e-6;

class LPSolveScenarioTest : public ::testing::Test
{
protected:
  optStruct       Options;
  CSolverAdapter *pAdapter;
  CPathwayModel  *pModel;

  void SetUp()
  {
    InitializeTestOptions(Options);
    pAdapter=CSolverAdapter::CreateDefault();
    pModel  =NULL;
  }
  void TearDown()
  {
    delete pModel;
    delete pAdapter;
  }
  CPathwayResults *Solve()
  {
    pModel->Initialize(Options);
    CPathwayResults *pResults=pModel->Run(Options,*pAdapter,NULL);
    EXPECT_NE(pResults->GetStatus(),STATUS_SOLVER_UNAVAILABLE)<<"lp_solve backend was not compiled in";
    return pResults;
  }
};

TEST_F(LPSolveScenarioTest, UncappedTechnologyMeetsTargetExactly)
{
  pModel=CreateSteelModel(1.0);
  CPathwayResults *pR=Solve();

  ASSERT_TRUE(pR->IsOptimal());
  EXPECT_EQ(pR->GetBackend(),"LPSOLVE");
  EXPECT_NEAR(pR->GetTotalShortfall(),0.0,SOLVE_TOL);
  EXPECT_NEAR(pR->GetProduction(0,5),30.0,SOLVE_TOL);
  EXPECT_NEAR(pR->GetAbatement (0,5),15.0,SOLVE_TOL);
  EXPECT_NEAR(pR->GetEmissions (5),35.0,SOLVE_TOL);
  EXPECT_NEAR(pR->GetEmissions (0),50.0,SOLVE_TOL);
  for (int k=0;k<pR->GetNumYears();k++){
    EXPECT_LE(pR->GetEmissions(k),pR->GetTarget(k)+SOLVE_TOL);
    EXPECT_LE(pR->GetShare(0,k),1.0+SOLVE_TOL);
  }
  EXPECT_GT(pR->GetObjective(),0.0);
  EXPECT_LT(pR->GetMaxRowViolation(),SOLVE_TOL);
  delete pR;
}

TEST_F(LPSolveScenarioTest, BindingAdoptionCapWithoutSlackIsInfeasible)
{
  pModel=CreateSteelModel(0.2);
  Options.allow_shortfall=false;
  CPathwayResults *pR=Solve();

  EXPECT_EQ(pR->GetStatus(),STATUS_INFEASIBLE);
  EXPECT_FALSE(pR->IsOptimal());
  delete pR;
}

TEST_F(LPSolveScenarioTest, BindingAdoptionCapWithSlackReportsShortfall)
{
  pModel=CreateSteelModel(0.2);
  Options.allow_shortfall=true;
  Options.slack_penalty  =1e6;
  CPathwayResults *pR=Solve();

  //at most 20 units of production (10 t abated) against 12 and 15 t required
  ASSERT_TRUE(pR->IsOptimal());
  EXPECT_NEAR(pR->GetShortfall(3),0.0,SOLVE_TOL);
  EXPECT_NEAR(pR->GetShortfall(4),2.0,SOLVE_TOL);
  EXPECT_NEAR(pR->GetShortfall(5),5.0,SOLVE_TOL);
  EXPECT_NEAR(pR->GetCapacity(0,5),20.0,SOLVE_TOL);
  EXPECT_NEAR(pR->GetTotalShortfall(),7.0,SOLVE_TOL);
  delete pR;
}

TEST_F(LPSolveScenarioTest, ExclusiveGroupFavoursCheaperTechnology)
{
  pModel=CreateSteelModel(1.0);
  pModel->AddTechnology(CreateTechnology("EAF","STEEL",25,0.5,2000.0,40.0,20.0));
  string ids[]={"H2DRI","EAF"};
  pModel->AddLink(new CTechLink(LINK_MUTUALLY_EXCLUSIVE,ids,2));

  CPathwayResults *pR=Solve();

  ASSERT_TRUE(pR->IsOptimal());
  int iEAF=pR->GetTechIndex("EAF");
  int iH2 =pR->GetTechIndex("H2DRI");
  for (int k=0;k<pR->GetNumYears();k++)
  {
    EXPECT_NEAR(pR->GetProduction(iEAF,k),0.0,SOLVE_TOL);
    EXPECT_LE(pR->GetShare(iEAF,k)+pR->GetShare(iH2,k),1.0+SOLVE_TOL);
  }
  EXPECT_NEAR(pR->GetProduction(iH2,5),30.0,SOLVE_TOL);
  delete pR;
}

TEST_F(LPSolveScenarioTest, CoupledSecondaryKeepsPaceWithPrimary)
{
  pModel=CreateSteelModel(1.0);
  pModel->AddBand(new CBaselineBand("POWER",200.0,0.4));
  pModel->AddTechnology(CreateTechnology("ELEC","POWER",30,0.0,300.0,5.0,1.0));
  pModel->SetBaselineEmissions(50.0);
  string ids[]={"H2DRI","ELEC"};
  pModel->AddLink(new CTechLink(LINK_COUPLING,ids,2));

  CPathwayResults *pR=Solve();

  ASSERT_TRUE(pR->IsOptimal());
  int iH2  =pR->GetTechIndex("H2DRI");
  int iELEC=pR->GetTechIndex("ELEC");
  for (int k=0;k<pR->GetNumYears();k++){
    EXPECT_GE(pR->GetShare(iELEC,k),pR->GetShare(iH2,k)-SOLVE_TOL);
  }
  EXPECT_NEAR(pR->GetShare(iELEC,5),0.3,SOLVE_TOL);
  delete pR;
}

TEST_F(LPSolveScenarioTest, RepeatedRunsAgree)
{
  pModel=CreateSteelModel(1.0);
  CPathwayResults *pFirst=Solve();
  CPathwayResults *pSecond=pModel->Run(Options,*pAdapter,NULL);

  ASSERT_TRUE(pFirst->IsOptimal());
  ASSERT_TRUE(pSecond->IsOptimal());
  EXPECT_NEAR(pFirst->GetObjective(),pSecond->GetObjective(),SOLVE_TOL*fabs(pFirst->GetObjective()));
  delete pFirst;
  delete pSecond;
}

TEST_F(LPSolveScenarioTest, RaisedCancelFlagAbortsSolve)
{
  pModel=CreateSteelModel(1.0);
  pModel->Initialize(Options);
  CPathwayProblem P(pModel,Options);
  P.Build();

  CLPSolveBackend LPSolve;
  atomic<bool> cancel(true);
  solve_outcome out=LPSolve.Solve(P.GetLP(),Options,&cancel);
  EXPECT_EQ(out.status,STATUS_CANCELLED);
  EXPECT_EQ(out.x.n_elem,0u);

  cancel.store(false);
  out=LPSolve.Solve(P.GetLP(),Options,&cancel);
  EXPECT_EQ(out.status,STATUS_OPTIMAL);
}
