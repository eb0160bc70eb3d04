/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  LPSolveBackend.cpp: lp_solve 5.5 linear programming backend
  ----------------------------------------------------------------*/
#include "SolverAdapter.h"
#include <chrono>

#ifdef _LPSOLVE_
#include <float.h>
#include <limits.h>
#include <setjmp.h>
#include <stdarg.h>
namespace lp_lib  {
#include <lpsolve/lp_lib.h>
}

//////////////////////////////////////////////////////////////////
/// \brief state shared with lp_solve abort callback
//
struct lp_abort_handle
{
  const atomic<bool>                 *pCancel;     ///< cooperative cancellation flag (may be NULL)
  bool                                has_deadline;///< true if wall-clock limit applies
  chrono::steady_clock::time_point    deadline;    ///< wall-clock limit
  bool                                cancelled;   ///< set if abort was due to cancellation
  bool                                timed_out;   ///< set if abort was due to deadline
};

//////////////////////////////////////////////////////////////////
/// \brief lp_solve abort callback, polled periodically during solve
/// \return TRUE to abort solve
//
static int __WINAPI LPAbortCheck(lp_lib::lprec *, void *userhandle)
{
  lp_abort_handle *pH=(lp_abort_handle*)(userhandle);
  if ((pH->pCancel!=NULL) && (pH->pCancel->load())){pH->cancelled=true; return TRUE;}
  if ((pH->has_deadline) && (chrono::steady_clock::now()>pH->deadline)){pH->timed_out=true; return TRUE;}
  return FALSE;
}
#endif

//////////////////////////////////////////////////////////////////
CLPSolveBackend::CLPSolveBackend(){}
CLPSolveBackend::~CLPSolveBackend(){}
string CLPSolveBackend::GetName() const {return "LPSOLVE";}

//////////////////////////////////////////////////////////////////
/// \brief solves linear program with lp_solve
/// \details statuses are normalized as
///   OPTIMAL, PRESOLVED      -> STATUS_OPTIMAL
///   INFEASIBLE              -> STATUS_INFEASIBLE
///   UNBOUNDED               -> STATUS_UNBOUNDED
///   TIMEOUT, SUBOPTIMAL     -> STATUS_TIMED_OUT
///   USERABORT               -> STATUS_CANCELLED or STATUS_TIMED_OUT (whichever triggered the abort)
///   NOMEMORY, NUMFAILURE... -> runtime error
///
/// \param &LP [in] finalized linear program
/// \param &Options [in] run options
/// \param *pCancel [in] cooperative cancellation flag (may be NULL)
//
solve_outcome CLPSolveBackend::Solve(const CLinearProgram &LP, const optStruct &Options,
                                     const atomic<bool> *pCancel) const
{
  solve_outcome out;
  out.status   =STATUS_SOLVER_UNAVAILABLE;
  out.objective=0.0;
  out.backend  =GetName();
  out.message  ="";

#ifndef _LPSOLVE_
  out.message="Macaw was compiled without lp_solve support";
  return out;
#else
  int     c,r,retval;
  int     nCols=LP.GetNumColumns();
  int     nRows=LP.GetNumRows();

  lp_lib::lprec *pLinProg=lp_lib::make_lp(0,nCols);
  if (pLinProg==NULL){
    out.message="unable to create lp_solve problem";
    return out;
  }
  string name=LP.GetName();
  lp_lib::set_lp_name(pLinProg,&name[0]);

  double infinity=lp_lib::get_infinite(pLinProg);

  // columns: names, bounds
  // ----------------------------------------------------------------
  for (c=0;c<nCols;c++)
  {
    const lp_column &col=LP.GetColumn(c);
    string colname=col.name;
    lp_lib::set_col_name(pLinProg,c+1,&colname[0]);
    double upper=(col.upper>=ALMOST_INF) ? infinity : col.upper;
    if (col.lower==upper){
      retval=lp_lib::set_bounds(pLinProg,c+1,col.lower,upper);
    }
    else{
      retval=lp_lib::set_lowbo(pLinProg,c+1,col.lower);
      retval=retval && lp_lib::set_upbo(pLinProg,c+1,upper);
    }
    if (!retval){
      lp_lib::delete_lp(pLinProg);
      ExitGracefully(("CLPSolveBackend::Solve: unable to set bounds of column "+col.name).c_str(),RUNTIME_ERR);
    }
  }

  lp_lib::set_add_rowmode(pLinProg,TRUE); //readies lp_lib to add rows and objective function

  // objective function
  // ----------------------------------------------------------------
  int  *col_ind=new int [nCols+1];
  REAL *row_val=new REAL[nCols+1]; //REAL is a macro (double) in lp_types.h
  int n=0;
  for (c=0;c<nCols;c++){
    if (LP.GetColumn(c).obj!=0.0){col_ind[n]=c+1; row_val[n]=LP.GetColumn(c).obj; n++;}
  }
  retval=lp_lib::set_obj_fnex(pLinProg,n,row_val,col_ind);
  if (!retval){
    delete [] col_ind; delete [] row_val;
    lp_lib::delete_lp(pLinProg);
    ExitGracefully("CLPSolveBackend::Solve: unable to set objective function",RUNTIME_ERR);
  }

  // constraints
  // ----------------------------------------------------------------
  for (r=0;r<nRows;r++)
  {
    const lp_row &row=LP.GetRow(r);
    int ctype=ROWTYPE_EQ;
    if      (row.type==ROW_LE){ctype=ROWTYPE_LE;}
    else if (row.type==ROW_GE){ctype=ROWTYPE_GE;}
    for (int j=0;j<row.nEntries;j++){col_ind[j]=row.aCols[j]+1; row_val[j]=row.aVals[j];}

    retval=lp_lib::add_constraintex(pLinProg,row.nEntries,row_val,col_ind,ctype,row.rhs);
    if (!retval){
      delete [] col_ind; delete [] row_val;
      lp_lib::delete_lp(pLinProg);
      ExitGracefully(("CLPSolveBackend::Solve: unable to add constraint "+row.name).c_str(),RUNTIME_ERR);
    }
    string rowname=row.name;
    lp_lib::set_row_name(pLinProg,r+1,&rowname[0]);
  }
  delete [] col_ind;
  delete [] row_val;

  lp_lib::set_add_rowmode(pLinProg,FALSE);    //must be turned off once constraints and obj function are added
  lp_lib::set_minim      (pLinProg);
  if (Options.silent){lp_lib::set_verbose(pLinProg,NEUTRAL);  }
  else               {lp_lib::set_verbose(pLinProg,IMPORTANT);}

  lp_abort_handle handle;
  handle.pCancel     =pCancel;
  handle.has_deadline=(Options.solver_timeout>0.0);
  handle.cancelled   =false;
  handle.timed_out   =false;
  if (handle.has_deadline){
    handle.deadline=chrono::steady_clock::now()+chrono::milliseconds((long long)(Options.solver_timeout*1000.0));
    lp_lib::set_timeout(pLinProg,(long)(ceil(Options.solver_timeout)));
  }
  lp_lib::put_abortfunc(pLinProg,LPAbortCheck,&handle);

  // Solve the LP problem!
  // ----------------------------------------------------------------
  retval=lp_lib::solve(pLinProg);

  if ((retval==OPTIMAL) || (retval==PRESOLVED))
  {
    REAL *soln=new REAL[nCols];
    lp_lib::get_variables(pLinProg,soln);
    out.x.set_size(nCols);
    for (c=0;c<nCols;c++){out.x(c)=soln[c];}
    delete [] soln;
    out.objective=lp_lib::get_objective(pLinProg);
    out.status   =STATUS_OPTIMAL;
  }
  else if (retval==INFEASIBLE)                  {out.status=STATUS_INFEASIBLE;}
  else if (retval==UNBOUNDED)                   {out.status=STATUS_UNBOUNDED; }
  else if ((retval==TIMEOUT) || (retval==SUBOPTIMAL)){out.status=STATUS_TIMED_OUT;}
  else if (retval==USERABORT)
  {
    if (handle.cancelled){out.status=STATUS_CANCELLED;}
    else                 {out.status=STATUS_TIMED_OUT;}
  }
  else
  {
    lp_lib::delete_lp(pLinProg);
    string warn="CLPSolveBackend::Solve: lp_solve failed with error code "+to_string(retval);
    ExitGracefully(warn.c_str(),RUNTIME_ERR);
  }
  out.message="lp_solve return code "+to_string(retval);

  lp_lib::delete_lp(pLinProg);
  return out;
#endif
}
