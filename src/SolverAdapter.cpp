/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include "SolverAdapter.h"

//////////////////////////////////////////////////////////////////
/// \brief Constructor of empty adapter
//
CSolverAdapter::CSolverAdapter()
{
  _pBackends=NULL;
  _nBackends=0;
}
//////////////////////////////////////////////////////////////////
CSolverAdapter::~CSolverAdapter()
{
  for (int j=0;j<_nBackends;j++){delete _pBackends[j];}
  delete [] _pBackends; _pBackends=NULL;
}
//////////////////////////////////////////////////////////////////
/// \brief registers backend; adapter takes ownership
//
void CSolverAdapter::AddBackend(CSolverBackendABC *pBackend)
{
  if (!DynArrayAppend((void**&)(_pBackends),(void*)(pBackend),_nBackends)){
    ExitGracefully("CSolverAdapter::AddBackend: adding NULL backend",RUNTIME_ERR);
  }
}
//////////////////////////////////////////////////////////////////
int CSolverAdapter::GetNumBackends() const {return _nBackends;}
//////////////////////////////////////////////////////////////////
/// \brief returns registered backend with (case-insensitive) name, or NULL
//
const CSolverBackendABC *CSolverAdapter::GetBackend(const string name) const
{
  string uname=StringToUppercase(name);
  for (int j=0;j<_nBackends;j++){
    if (StringToUppercase(_pBackends[j]->GetName())==uname){return _pBackends[j];}
  }
  return NULL;
}

//////////////////////////////////////////////////////////////////
/// \brief submits linear program to backends in order of preference
/// \details a cancellation requested before any backend starts returns STATUS_CANCELLED
///   without invoking a backend
///
/// \param &LP [in] finalized linear program
/// \param &Options [in] run options (solver_order, solver_timeout)
/// \param *pCancel [in] cooperative cancellation flag (may be NULL)
/// \return first definitive outcome, or STATUS_SOLVER_UNAVAILABLE if no backend could be invoked
//
solve_outcome CSolverAdapter::Solve(const CLinearProgram &LP, const optStruct &Options,
                                    const atomic<bool> *pCancel) const
{
  solve_outcome out;
  out.status   =STATUS_SOLVER_UNAVAILABLE;
  out.objective=0.0;
  out.backend  ="";
  out.message  ="no solver backend could be invoked";

  ExitGracefullyIf(!LP.IsFinalized(),"CSolverAdapter::Solve: linear program not finalized",RUNTIME_ERR);

  string tried="";
  for (int j=0;j<(int)(Options.solver_order.size());j++)
  {
    if ((pCancel!=NULL) && (pCancel->load())){
      out.status =STATUS_CANCELLED;
      out.message="cancelled before solve";
      return out;
    }
    const CSolverBackendABC *pBackend=GetBackend(Options.solver_order[j]);
    if (pBackend==NULL){
      WriteWarning("CSolverAdapter::Solve: solver backend "+Options.solver_order[j]+" is not available in this build",Options.noisy);
      tried+=Options.solver_order[j]+"(unregistered) ";
      continue;
    }

    solve_outcome attempt=pBackend->Solve(LP,Options,pCancel);
    attempt.backend=pBackend->GetName();
    if (attempt.status!=STATUS_SOLVER_UNAVAILABLE){return attempt;}

    if (Options.noisy){cout<<"  solver backend "<<pBackend->GetName()<<" unavailable: "<<attempt.message<<endl;}
    tried+=pBackend->GetName()+"("+attempt.message+") ";
  }
  if ((pCancel!=NULL) && (pCancel->load())){
    out.status =STATUS_CANCELLED;
    out.message="cancelled before solve";
    return out;
  }
  if (tried!=""){out.message="no solver backend could be invoked: "+tried;}
  return out;
}

//////////////////////////////////////////////////////////////////
/// \brief creates adapter with all backends compiled into this build
//
CSolverAdapter *CSolverAdapter::CreateDefault()
{
  CSolverAdapter *pAdapter=new CSolverAdapter();
  pAdapter->AddBackend(new CLPSolveBackend());
  return pAdapter;
}
