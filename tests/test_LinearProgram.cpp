/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "LinearProgram.h"

namespace
{
  // x0 + x1 <= 10, x0 - x1 == 2, 2*x1 >= 3
  void BuildSmallProgram(CLinearProgram &LP)
  {
    int    c1[]={0,1};
    double v1[]={1.0,1.0};
    double v2[]={1.0,-1.0};
    int    c3[]={1};
    double v3[]={2.0};
    LP.SetColumn(0,"X",0.0,ALMOST_INF,1.0);
    LP.SetColumn(1,"Y",0.0,8.0,2.0);
    LP.AddRow("SUM" ,2,c1,v1,ROW_LE,10.0);
    LP.AddRow("DIFF",2,c1,v2,ROW_EQ,2.0);
    LP.AddRow("MINY",1,c3,v3,ROW_GE,3.0);
    LP.Finalize();
  }
}

TEST(LinearProgram, RowsAndMatrixAgree)
{
  CLinearProgram LP("small",2);
  BuildSmallProgram(LP);

  EXPECT_EQ(LP.GetNumRows(),3);
  EXPECT_EQ(LP.GetNumNonZeros(),5);
  EXPECT_EQ(LP.GetRowIndex("DIFF"),1);
  EXPECT_EQ(LP.GetRowIndex("NOPE"),DOESNT_EXIST);

  const arma::sp_mat &A=LP.GetMatrix();
  EXPECT_EQ(A.n_rows,3u);
  EXPECT_EQ(A.n_cols,2u);
  EXPECT_DOUBLE_EQ((double)(A(1,1)),-1.0);
  EXPECT_DOUBLE_EQ((double)(A(2,0)), 0.0);
  EXPECT_DOUBLE_EQ((double)(A(2,1)), 2.0);
}

TEST(LinearProgram, FeasiblePointHasNoViolation)
{
  CLinearProgram LP("small",2);
  BuildSmallProgram(LP);

  arma::vec x(2);
  x(0)=4.0; x(1)=2.0;
  int worst;
  EXPECT_NEAR(LP.GetMaxRowViolation(x,worst),0.0,1e-12);
  EXPECT_DOUBLE_EQ(LP.GetObjectiveValue(x),8.0);

  arma::vec act=LP.GetRowActivities(x);
  EXPECT_DOUBLE_EQ(act(0),6.0);
  EXPECT_DOUBLE_EQ(act(1),2.0);
  EXPECT_DOUBLE_EQ(act(2),4.0);
}

TEST(LinearProgram, ViolationReportsWorstRow)
{
  CLinearProgram LP("small",2);
  BuildSmallProgram(LP);

  arma::vec x(2);
  x(0)=9.0; x(1)=0.5;   //SUM ok (9.5), DIFF off by 6.5, MINY short by 2
  int worst;
  EXPECT_NEAR(LP.GetMaxRowViolation(x,worst),6.5,1e-12);
  EXPECT_EQ(LP.GetRow(worst).name,"DIFF");
  EXPECT_NEAR(LP.GetRowViolation(2,1.0),2.0,1e-12);
}

TEST(LinearProgram, ObjectiveAccumulatesAndBoundsApply)
{
  CLinearProgram LP("small",2);
  LP.AddToObjective(0,1.5);
  LP.AddToObjective(0,2.5);
  EXPECT_DOUBLE_EQ(LP.GetColumn(0).obj,4.0);
  EXPECT_EQ(LP.GetColumn(1).name,"C2");
  EXPECT_DOUBLE_EQ(LP.GetColumn(1).upper,ALMOST_INF);

  LP.SetBounds(1,1.0,3.0);
  EXPECT_DOUBLE_EQ(LP.GetColumn(1).lower,1.0);
  LP.SetUpperBound(1,0.5); //never below lower bound
  EXPECT_DOUBLE_EQ(LP.GetColumn(1).upper,1.0);
  EXPECT_THROW(LP.SetBounds(1,3.0,1.0),CMacawError);
}

TEST(LinearProgram, FinalizedProgramRejectsNewRows)
{
  CLinearProgram LP("small",2);
  BuildSmallProgram(LP);
  int    c[]={0};
  double v[]={1.0};
  EXPECT_TRUE(LP.IsFinalized());
  EXPECT_THROW(LP.AddRow("LATE",1,c,v,ROW_LE,1.0),CMacawError);
}

TEST(LinearProgram, BadColumnIndexIsRejected)
{
  CLinearProgram LP("small",2);
  int    c[]={2};
  double v[]={1.0};
  EXPECT_THROW(LP.AddRow("BAD",1,c,v,ROW_LE,1.0),CMacawError);
  EXPECT_THROW(LP.GetColumn(-1),CMacawError);
}
