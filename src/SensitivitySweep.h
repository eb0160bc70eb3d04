/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  SensitivitySweep.h
  ----------------------------------------------------------------*/
#ifndef SENSITIVITY_SWEEP_H
#define SENSITIVITY_SWEEP_H

#include "MacawInclude.h"
#include "PathwayModel.h"
#include "SolverAdapter.h"

////////////////////////////////////////////////////////////////////
/// \brief Set of independent pathway runs over a list of discount rates
/// \details Each member runs with its own copy of the run options and writes to its
///   own output subdirectory. Members are executed on a pool of worker threads; the
///   model and the solver adapter are shared read-only. A member that raises an error
///   does not stop the others; the first such error is re-raised once all members
///   have finished and the sweep summary has been written.
//
class CSensitivitySweep
{
private:/*------------------------------------------------------*/
  int           _nMembers;       ///< number of sweep members
  double       *_aRates;         ///< discount rate of each member [size: _nMembers]
  string       *_aOutputDirs;    ///< output directory of each member [size: _nMembers]

  solve_status *_aStatus;        ///< terminal status of each member [size: _nMembers]
  string       *_aBackends;      ///< solver backend of each member [size: _nMembers]
  double       *_aObjective;     ///< objective value of each member (optimal members only) [size: _nMembers]
  double       *_aShortfall;     ///< total shortfall of each member [size: _nMembers]
  bool         *_aFailed;        ///< true if member raised an error [size: _nMembers]
  exitcode     *_aErrorCodes;    ///< error code of failed member [size: _nMembers]
  string       *_aErrors;        ///< error message of failed member [size: _nMembers]

  int           _nThreads;       ///< number of worker threads (0: hardware concurrency)
  atomic<bool>  _cancel;         ///< cooperative cancellation flag shared with all members

  void RunMember  (const int e, const CPathwayModel *pModel, const CSolverAdapter *pAdapter, const optStruct *pOptions);
  void WorkerLoop (atomic<int> *pNext, const CPathwayModel *pModel, const CSolverAdapter *pAdapter, const optStruct *pOptions);

  CSensitivitySweep(const CSensitivitySweep &S); //suppresses default copy constructor

public:/*-------------------------------------------------------*/
  CSensitivitySweep(const vector<double> &rates, const optStruct &Options);
  ~CSensitivitySweep();

  //Accessors
  int           GetNumMembers      () const;
  int           GetNumThreads      () const;
  double        GetDiscountRate    (const int e) const;
  string        GetOutputDirectory (const int e) const;
  solve_status  GetStatus          (const int e) const;
  string        GetBackend         (const int e) const;
  double        GetObjective       (const int e) const;
  double        GetTotalShortfall  (const int e) const;
  bool          HasFailed          (const int e) const;
  string        GetErrorMessage    (const int e) const;
  bool          IsCancelled        () const;

  void          GetMemberOptions   (const int e, const optStruct &Options, optStruct &MemberOptions) const;

  //Manipulators
  void          Cancel             ();
  void          Run                (const CPathwayModel *pModel, const CSolverAdapter &Adapter, const optStruct &Options);
  void          WriteSummary       (const optStruct &Options) const;
};

#endif
