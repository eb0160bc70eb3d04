/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "SolverAdapter.h"
#include "TestHelpers.h"

class SolverAdapterTest : public ::testing::Test
{
protected:
  optStruct       Options;
  CLinearProgram *pLP;
  CSolverAdapter  Adapter;
  CFakeBackend   *pDown;
  CFakeBackend   *pInfeasible;
  CFakeBackend   *pOptimal;

  void SetUp()
  {
    InitializeTestOptions(Options);
    pLP=new CLinearProgram("adapter",3);
    pLP->Finalize();

    pDown      =new CFakeBackend("DOWN"      ,STATUS_SOLVER_UNAVAILABLE);
    pInfeasible=new CFakeBackend("INFEASIBLE",STATUS_INFEASIBLE);
    pOptimal   =new CFakeBackend("OPTIMAL"   ,STATUS_OPTIMAL);
    Adapter.AddBackend(pDown);
    Adapter.AddBackend(pInfeasible);
    Adapter.AddBackend(pOptimal);
  }
  void TearDown()
  {
    delete pLP;
  }
  void SetOrder(const string a, const string b, const string c)
  {
    Options.solver_order.clear();
    Options.solver_order.push_back(a);
    if (b!=""){Options.solver_order.push_back(b);}
    if (c!=""){Options.solver_order.push_back(c);}
  }
};

TEST_F(SolverAdapterTest, FallsThroughOnlyOnUnavailable)
{
  SetOrder("DOWN","INFEASIBLE","OPTIMAL");
  solve_outcome out=Adapter.Solve(*pLP,Options,NULL);

  EXPECT_EQ(out.status,STATUS_INFEASIBLE);
  EXPECT_EQ(out.backend,"INFEASIBLE");
  EXPECT_EQ(pDown->GetNumCalls(),1);
  EXPECT_EQ(pInfeasible->GetNumCalls(),1);
  EXPECT_EQ(pOptimal->GetNumCalls(),0);
}

TEST_F(SolverAdapterTest, PreferenceOrderIsRespected)
{
  SetOrder("optimal","INFEASIBLE","");
  solve_outcome out=Adapter.Solve(*pLP,Options,NULL);

  EXPECT_EQ(out.status,STATUS_OPTIMAL);
  EXPECT_EQ(out.backend,"OPTIMAL");
  EXPECT_EQ(out.x.n_elem,3u);
  EXPECT_EQ(pInfeasible->GetNumCalls(),0);
}

TEST_F(SolverAdapterTest, TimeoutIsDefinitiveAndStopsFallThrough)
{
  CFakeBackend *pSlow=new CFakeBackend("SLOW",STATUS_TIMED_OUT);
  Adapter.AddBackend(pSlow);
  SetOrder("DOWN","SLOW","OPTIMAL");
  solve_outcome out=Adapter.Solve(*pLP,Options,NULL);

  EXPECT_EQ(out.status,STATUS_TIMED_OUT);
  EXPECT_EQ(out.backend,"SLOW");
  EXPECT_EQ(pSlow->GetNumCalls(),1);
  EXPECT_EQ(pOptimal->GetNumCalls(),0);
}

TEST_F(SolverAdapterTest, UnregisteredBackendIsSkipped)
{
  SetOrder("GUROBI","OPTIMAL","");
  solve_outcome out=Adapter.Solve(*pLP,Options,NULL);
  EXPECT_EQ(out.status,STATUS_OPTIMAL);
  EXPECT_EQ(out.backend,"OPTIMAL");
}

TEST_F(SolverAdapterTest, NoUsableBackendIsUnavailable)
{
  SetOrder("DOWN","GUROBI","");
  solve_outcome out=Adapter.Solve(*pLP,Options,NULL);
  EXPECT_EQ(out.status,STATUS_SOLVER_UNAVAILABLE);
  EXPECT_EQ(out.backend,"");
  EXPECT_NE(out.message.find("DOWN"),string::npos);
}

TEST_F(SolverAdapterTest, CancellationBeforeSolveSkipsBackends)
{
  SetOrder("OPTIMAL","","");
  atomic<bool> cancel(true);
  solve_outcome out=Adapter.Solve(*pLP,Options,&cancel);
  EXPECT_EQ(out.status,STATUS_CANCELLED);
  EXPECT_EQ(pOptimal->GetNumCalls(),0);
}

TEST_F(SolverAdapterTest, BackendLookupIgnoresCase)
{
  EXPECT_EQ(Adapter.GetNumBackends(),3);
  EXPECT_EQ(Adapter.GetBackend("Infeasible"),pInfeasible);
  EXPECT_TRUE(Adapter.GetBackend("CPLEX")==NULL);
}

TEST_F(SolverAdapterTest, UnfinalizedProgramIsRejected)
{
  CLinearProgram Open("open",1);
  SetOrder("OPTIMAL","","");
  EXPECT_THROW(Adapter.Solve(Open,Options,NULL),CMacawError);
}

TEST(SolverAdapterDefault, RegistersLPSolveBackend)
{
  CSolverAdapter *pAdapter=CSolverAdapter::CreateDefault();
  ASSERT_TRUE(pAdapter->GetBackend("LPSOLVE")!=NULL);
  EXPECT_EQ(pAdapter->GetBackend("lpsolve")->GetName(),"LPSOLVE");
  delete pAdapter;
}
