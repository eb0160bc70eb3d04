/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "SensitivitySweep.h"
#include "TestHelpers.h"

namespace
{
  //optimal all-zero solution, except unbounded above a threshold discount rate
  class CRateSensitiveBackend : public CSolverBackendABC
  {
  private:
    double _threshold;
  public:
    CRateSensitiveBackend(const double threshold){_threshold=threshold;}

    string GetName() const {return "RATE";}
    solve_outcome Solve(const CLinearProgram &LP, const optStruct &Options, const atomic<bool> *) const
    {
      solve_outcome out;
      out.backend  ="RATE";
      out.message  ="";
      out.objective=0.0;
      if (Options.discount_rate>_threshold){out.status=STATUS_UNBOUNDED;}
      else {
        out.status=STATUS_OPTIMAL;
        out.x     =arma::zeros<arma::vec>(LP.GetNumColumns());
      }
      return out;
    }
  };

  //optimal all-zero solution, except a library-level exception above a threshold discount rate
  class CThrowingBackend : public CSolverBackendABC
  {
  private:
    double _threshold;
  public:
    CThrowingBackend(const double threshold){_threshold=threshold;}

    string GetName() const {return "THROWS";}
    solve_outcome Solve(const CLinearProgram &LP, const optStruct &Options, const atomic<bool> *) const
    {
      if (Options.discount_rate>_threshold){throw runtime_error("solver library failure");}
      solve_outcome out;
      out.backend  ="THROWS";
      out.message  ="";
      out.objective=0.0;
      out.status   =STATUS_OPTIMAL;
      out.x        =arma::zeros<arma::vec>(LP.GetNumColumns());
      return out;
    }
  };
}

class SensitivitySweepTest : public ::testing::Test
{
protected:
  optStruct      Options;
  CPathwayModel *pModel;
  vector<double> rates;

  void SetUp()
  {
    InitializeTestOptions(Options);
    Options.run_name       ="";
    Options.output_dir     ="macaw_test_sweep/";
    Options.main_output_dir=Options.output_dir;
    Options.solver_order.clear();
    Options.solver_order.push_back("RATE");
    PrepareOutputdirectory(Options);

    pModel=CreateSteelModel(1.0);
    pModel->Initialize(Options);

    rates.push_back(0.02);
    rates.push_back(0.04);
    rates.push_back(0.06);
    rates.push_back(0.10);
  }
  void TearDown()
  {
    delete pModel;
    optStruct Reset=Options;
    Reset.output_dir="";
    Reset.main_output_dir="";
    PrepareOutputdirectory(Reset);
  }
};

TEST_F(SensitivitySweepTest, MemberOptionsDifferOnlyInRateAndDirectory)
{
  Options.sweep_threads=3;
  Options.noisy=true;
  CSensitivitySweep Sweep(rates,Options);

  EXPECT_EQ(Sweep.GetNumMembers(),4);
  EXPECT_EQ(Sweep.GetNumThreads(),3);

  optStruct Member;
  Sweep.GetMemberOptions(2,Options,Member);
  EXPECT_DOUBLE_EQ(Member.discount_rate,0.06);
  EXPECT_EQ(Member.output_dir,"macaw_test_sweep/sweep3/");
  EXPECT_EQ(Member.main_output_dir,Options.main_output_dir);
  EXPECT_TRUE(Member.sweep_discount_rates.empty());
  EXPECT_FALSE(Member.noisy);
  EXPECT_EQ(Member.end_year,Options.end_year);
}

TEST_F(SensitivitySweepTest, ThreadCountNeverExceedsMembers)
{
  Options.sweep_threads=16;
  CSensitivitySweep Sweep(rates,Options);
  EXPECT_EQ(Sweep.GetNumThreads(),4);

  Options.sweep_threads=0;
  CSensitivitySweep Auto(rates,Options);
  EXPECT_GE(Auto.GetNumThreads(),1);
  EXPECT_LE(Auto.GetNumThreads(),4);
}

TEST_F(SensitivitySweepTest, AllMembersRunAndWriteOutput)
{
  CSolverAdapter Adapter;
  Adapter.AddBackend(new CRateSensitiveBackend(1.0));
  Options.sweep_threads=3;

  CSensitivitySweep Sweep(rates,Options);
  Sweep.Run(pModel,Adapter,Options);

  for (int e=0;e<Sweep.GetNumMembers();e++)
  {
    EXPECT_FALSE(Sweep.HasFailed(e));
    EXPECT_EQ(Sweep.GetStatus(e),STATUS_OPTIMAL);
    EXPECT_EQ(Sweep.GetBackend(e),"RATE");
    EXPECT_GT(CountLines(Sweep.GetOutputDirectory(e)+"SolveStatus.txt"),0);
  }
  EXPECT_EQ(CountLines("macaw_test_sweep/SweepSummary.csv"),5);
}

TEST_F(SensitivitySweepTest, FailingMemberDoesNotStopOthers)
{
  CSolverAdapter Adapter;
  Adapter.AddBackend(new CRateSensitiveBackend(0.08));
  Options.sweep_threads=2;

  CSensitivitySweep Sweep(rates,Options);
  EXPECT_THROW(Sweep.Run(pModel,Adapter,Options),CModelIntegrityError);

  EXPECT_FALSE(Sweep.HasFailed(0));
  EXPECT_FALSE(Sweep.HasFailed(1));
  EXPECT_FALSE(Sweep.HasFailed(2));
  EXPECT_TRUE (Sweep.HasFailed(3));
  EXPECT_EQ(Sweep.GetStatus(2),STATUS_OPTIMAL);
  EXPECT_NE(Sweep.GetErrorMessage(3),"");
  EXPECT_EQ(CountLines("macaw_test_sweep/SweepSummary.csv"),5);
}

TEST_F(SensitivitySweepTest, NonMacawExceptionIsRecordedAsRuntimeError)
{
  CSolverAdapter Adapter;
  Adapter.AddBackend(new CThrowingBackend(0.05));
  Options.solver_order[0]="THROWS";
  Options.sweep_threads=2;

  CSensitivitySweep Sweep(rates,Options);
  try {
    Sweep.Run(pModel,Adapter,Options);
    FAIL();
  }
  catch (CMacawError &E) {
    EXPECT_EQ(E.GetCode(),RUNTIME_ERR);
  }

  EXPECT_FALSE(Sweep.HasFailed(0));
  EXPECT_FALSE(Sweep.HasFailed(1));
  EXPECT_TRUE (Sweep.HasFailed(2));
  EXPECT_TRUE (Sweep.HasFailed(3));
  EXPECT_NE(Sweep.GetErrorMessage(2).find("solver library failure"),string::npos);
  EXPECT_EQ(Sweep.GetStatus(1),STATUS_OPTIMAL);
  EXPECT_EQ(CountLines("macaw_test_sweep/SweepSummary.csv"),5);
}

TEST_F(SensitivitySweepTest, EmptyRateListIsRejected)
{
  vector<double> none;
  EXPECT_THROW({CSensitivitySweep Sweep(none,Options);},CDataValidationError);
}
