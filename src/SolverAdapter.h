/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  SolverAdapter.h
  ----------------------------------------------------------------*/
#ifndef SOLVER_ADAPTER_H
#define SOLVER_ADAPTER_H

#include "MacawInclude.h"
#include "LinearProgram.h"

//////////////////////////////////////////////////////////////////
/// \brief normalized result of a single solve attempt
//
struct solve_outcome
{
  solve_status status;     ///< terminal status
  arma::vec    x;          ///< solution vector (only meaningful if status==STATUS_OPTIMAL)
  double       objective;  ///< objective value (only meaningful if status==STATUS_OPTIMAL)
  string       backend;    ///< name of backend that produced outcome ("" if none)
  string       message;    ///< backend diagnostic message
};

///////////////////////////////////////////////////////////////////
/// \brief Abstract linear programming backend
/// \details Solve() must not throw for solve-time conditions; these are
///   reported through solve_outcome::status. Backends hold no per-solve
///   state, so one backend may serve concurrent runs.
//
class CSolverBackendABC
{
public:/*-------------------------------------------------------*/
  virtual ~CSolverBackendABC(){}

  virtual string        GetName() const=0;
  virtual solve_outcome Solve  (const CLinearProgram &LP, const optStruct &Options,
                                const atomic<bool> *pCancel) const=0;
};

///////////////////////////////////////////////////////////////////
/// \brief lp_solve 5.5 backend
/// \details reports STATUS_SOLVER_UNAVAILABLE if Macaw was built without lp_solve
//
class CLPSolveBackend : public CSolverBackendABC
{
public:/*-------------------------------------------------------*/
  CLPSolveBackend();
  ~CLPSolveBackend();

  string        GetName() const;
  solve_outcome Solve  (const CLinearProgram &LP, const optStruct &Options,
                        const atomic<bool> *pCancel) const;
};

///////////////////////////////////////////////////////////////////
/// \brief Submits a linear program to the preferred available backend
/// \details backends are tried in the order of Options.solver_order; the adapter moves
///   to the next backend only if the current one reports STATUS_SOLVER_UNAVAILABLE
///   (or is not registered). Any other outcome is final. No retries are performed.
//
class CSolverAdapter
{
private:/*------------------------------------------------------*/
  CSolverBackendABC **_pBackends;   ///< array of pointers to registered backends [size: _nBackends] (owned)
  int                 _nBackends;   ///< number of registered backends

  CSolverAdapter(const CSolverAdapter &a); //suppresses default copy constructor

public:/*-------------------------------------------------------*/
  CSolverAdapter();
  ~CSolverAdapter();

  void                     AddBackend   (CSolverBackendABC *pBackend);
  int                      GetNumBackends() const;
  const CSolverBackendABC *GetBackend   (const string name) const;

  solve_outcome            Solve        (const CLinearProgram &LP, const optStruct &Options,
                                         const atomic<bool> *pCancel) const;

  static CSolverAdapter   *CreateDefault();
};

#endif
