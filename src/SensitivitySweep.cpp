/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  SensitivitySweep.cpp
  ----------------------------------------------------------------*/
#include "SensitivitySweep.h"
#include "PathwayResults.h"
#include <thread>

//////////////////////////////////////////////////////////////////
/// \brief Sweep constructor
/// \param &rates [in] discount rate of each member
/// \param &Options [in] run options (sweep_threads, main_output_dir)
//
CSensitivitySweep::CSensitivitySweep(const vector<double> &rates, const optStruct &Options)
{
  _nMembers=(int)(rates.size());
  ExitGracefullyIf(_nMembers==0,"CSensitivitySweep: no discount rates given",BAD_DATA);

  _aRates     =new double      [_nMembers];
  _aOutputDirs=new string      [_nMembers];
  _aStatus    =new solve_status[_nMembers];
  _aBackends  =new string      [_nMembers];
  _aObjective =new double      [_nMembers];
  _aShortfall =new double      [_nMembers];
  _aFailed    =new bool        [_nMembers];
  _aErrorCodes=new exitcode    [_nMembers];
  _aErrors    =new string      [_nMembers];
  for (int e=0;e<_nMembers;e++)
  {
    _aRates     [e]=rates[e];
    _aOutputDirs[e]=Options.main_output_dir+"sweep"+to_string(e+1)+"/";
    _aStatus    [e]=STATUS_BUILT;
    _aBackends  [e]="";
    _aObjective [e]=0.0;
    _aShortfall [e]=0.0;
    _aFailed    [e]=false;
    _aErrorCodes[e]=RUNTIME_ERR;
    _aErrors    [e]="";
  }
  _nThreads=Options.sweep_threads;
  _cancel.store(false);
}
//////////////////////////////////////////////////////////////////
CSensitivitySweep::~CSensitivitySweep()
{
  delete [] _aRates;     delete [] _aOutputDirs; delete [] _aStatus;
  delete [] _aBackends;  delete [] _aObjective;  delete [] _aShortfall;
  delete [] _aFailed;    delete [] _aErrorCodes; delete [] _aErrors;
}

//////////////////////////////////////////////////////////////////
int          CSensitivitySweep::GetNumMembers     () const {return _nMembers;}
double       CSensitivitySweep::GetDiscountRate   (const int e) const {return _aRates[e];}
string       CSensitivitySweep::GetOutputDirectory(const int e) const {return _aOutputDirs[e];}
solve_status CSensitivitySweep::GetStatus         (const int e) const {return _aStatus[e];}
string       CSensitivitySweep::GetBackend        (const int e) const {return _aBackends[e];}
double       CSensitivitySweep::GetObjective      (const int e) const {return _aObjective[e];}
double       CSensitivitySweep::GetTotalShortfall (const int e) const {return _aShortfall[e];}
bool         CSensitivitySweep::HasFailed         (const int e) const {return _aFailed[e];}
string       CSensitivitySweep::GetErrorMessage   (const int e) const {return _aErrors[e];}
bool         CSensitivitySweep::IsCancelled       () const {return _cancel.load();}
void         CSensitivitySweep::Cancel            () {_cancel.store(true);}

//////////////////////////////////////////////////////////////////
/// \brief returns number of worker threads to be used
/// \details hardware concurrency if unspecified, never more than the number of members
//
int CSensitivitySweep::GetNumThreads() const
{
  int threads=_nThreads;
  if (threads<=0){
    threads=(int)(thread::hardware_concurrency());
    if (threads<=0){threads=1;}
  }
  return min(threads,_nMembers);
}

//////////////////////////////////////////////////////////////////
/// \brief creates independent run options for member e
/// \details only discount rate and output directory differ from the base options
//
void CSensitivitySweep::GetMemberOptions(const int e, const optStruct &Options, optStruct &MemberOptions) const
{
  MemberOptions=Options;
  MemberOptions.discount_rate=_aRates[e];
  MemberOptions.output_dir   =_aOutputDirs[e];
  MemberOptions.sweep_discount_rates.clear();
  if (GetNumThreads()>1){MemberOptions.noisy=false;} //avoids interleaved screen output
}

//////////////////////////////////////////////////////////////////
/// \brief runs single sweep member and records its outcome
/// \details errors raised by the member are recorded, not propagated, so that
///   remaining members complete
//
void CSensitivitySweep::RunMember(const int e, const CPathwayModel *pModel, const CSolverAdapter *pAdapter, const optStruct *pOptions)
{
  optStruct MemberOptions;
  GetMemberOptions(e,*pOptions,MemberOptions);

  try
  {
    CPathwayResults *pResults=pModel->Run(MemberOptions,*pAdapter,&_cancel);
    _aStatus   [e]=pResults->GetStatus();
    _aBackends [e]=pResults->GetBackend();
    _aObjective[e]=pResults->GetObjective();
    _aShortfall[e]=pResults->GetTotalShortfall();
    try {
      pResults->WriteOutput(MemberOptions);
    }
    catch (exception &) {
      delete pResults;
      throw;
    }
    delete pResults;
  }
  catch (CMacawError &E)
  {
    _aFailed    [e]=true;
    _aErrorCodes[e]=E.GetCode();
    _aErrors    [e]=E.what();
  }
  catch (exception &E) //e.g., bad_alloc or a backend library error; must not escape the worker thread
  {
    _aFailed    [e]=true;
    _aErrorCodes[e]=RUNTIME_ERR;
    _aErrors    [e]=E.what();
  }
  if ((!MemberOptions.silent) && (!_aFailed[e])){
    cout<<"  sweep member "<<e+1<<" (discount rate "<<_aRates[e]<<"): "<<GetStatusName(_aStatus[e])<<endl;
  }
}

//////////////////////////////////////////////////////////////////
/// \brief worker thread body; claims members until none are left
//
void CSensitivitySweep::WorkerLoop(atomic<int> *pNext, const CPathwayModel *pModel, const CSolverAdapter *pAdapter, const optStruct *pOptions)
{
  for (;;)
  {
    int e=pNext->fetch_add(1);
    if (e>=_nMembers){break;}
    RunMember(e,pModel,pAdapter,pOptions);
  }
}

//////////////////////////////////////////////////////////////////
/// \brief runs all sweep members
/// \details output subdirectories are created before the workers start.
///   After all members finish, the sweep summary is written and the first member
///   error (if any) is raised
///
/// \param *pModel [in] initialized model (shared read-only)
/// \param &Adapter [in] solver adapter (shared read-only)
/// \param &Options [in] base run options
//
void CSensitivitySweep::Run(const CPathwayModel *pModel, const CSolverAdapter &Adapter, const optStruct &Options)
{
  int e;
  ExitGracefullyIf(!pModel->IsInitialized(),"CSensitivitySweep::Run: model not initialized",RUNTIME_ERR);

  for (e=0;e<_nMembers;e++)
  {
    optStruct MemberOptions;
    GetMemberOptions(e,Options,MemberOptions);
    PrepareOutputdirectory(MemberOptions);
  }

  int nThreads=GetNumThreads();
  if (!Options.silent){
    cout<<"======================================================"<<endl;
    cout<<"Sensitivity sweep: "<<_nMembers<<" members on "<<nThreads<<" thread(s)"<<endl;
  }

  atomic<int> next(0);
  if (nThreads<=1)
  {
    WorkerLoop(&next,pModel,&Adapter,&Options);
  }
  else
  {
    vector<thread> pool;
    pool.reserve(nThreads);
    for (int t=0;t<nThreads;t++){
      pool.push_back(thread(&CSensitivitySweep::WorkerLoop,this,&next,pModel,&Adapter,&Options));
    }
    for (int t=0;t<nThreads;t++){pool[t].join();}
  }

  WriteSummary(Options);

  for (e=0;e<_nMembers;e++)
  {
    if (_aFailed[e]){
      string warn="CSensitivitySweep::Run: sweep member "+to_string(e+1)+" (discount rate "+to_string(_aRates[e])+") failed: "+_aErrors[e];
      ExitGracefully(warn.c_str(),_aErrorCodes[e]);
    }
  }
}

//////////////////////////////////////////////////////////////////
/// \brief writes SweepSummary.csv to main output directory
//
void CSensitivitySweep::WriteSummary(const optStruct &Options) const
{
  optStruct SummaryOptions=Options;
  SummaryOptions.output_dir=Options.main_output_dir;
  string tmpFilename=FilenamePrepare("SweepSummary.csv",SummaryOptions);

  ofstream SWEEP;
  SWEEP.open(tmpFilename.c_str());
  if (SWEEP.fail()){
    ExitGracefully(("CSensitivitySweep::WriteSummary: Unable to open output file "+tmpFilename+" for writing.").c_str(),FILE_OPEN_ERR);
  }
  SWEEP<<"member,discount rate,status,backend,objective,total shortfall,output directory,error"<<endl;
  SWEEP.precision(12);
  for (int e=0;e<_nMembers;e++)
  {
    string err=_aErrors[e];
    replace(err.begin(),err.end(),',',';');
    replace(err.begin(),err.end(),'\n',' ');
    SWEEP<<e+1<<","<<_aRates[e]<<",";
    SWEEP<<(_aFailed[e] ? "Error" : GetStatusName(_aStatus[e]))<<","<<_aBackends[e]<<",";
    SWEEP<<_aObjective[e]<<","<<_aShortfall[e]<<","<<_aOutputDirs[e]<<","<<err<<endl;
  }
  SWEEP.close();
}
