/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  PathwayModel.cpp
  ----------------------------------------------------------------*/
#include "PathwayModel.h"
#include "PathwayProblem.h"
#include "PathwayResults.h"
#include "SolverAdapter.h"

//////////////////////////////////////////////////////////////////
/// \brief Constructor of empty pathway model
//
CPathwayModel::CPathwayModel()
{
  _pBands  =NULL; _nBands=0;
  _pTechs  =NULL; _nTechs=0;
  _pLinks  =NULL; _nLinks=0;
  _pTargets=new CYearSeries("EMISSION_TARGETS");
  _baseline_override=NOT_SPECIFIED;
  _initialized=false;
}
//////////////////////////////////////////////////////////////////
CPathwayModel::~CPathwayModel()
{
  int j;
  for (j=0;j<_nBands;j++){delete _pBands[j];} delete [] _pBands; _pBands=NULL;
  for (j=0;j<_nTechs;j++){delete _pTechs[j];} delete [] _pTechs; _pTechs=NULL;
  for (j=0;j<_nLinks;j++){delete _pLinks[j];} delete [] _pLinks; _pLinks=NULL;
  delete _pTargets; _pTargets=NULL;
}

//////////////////////////////////////////////////////////////////
int                  CPathwayModel::GetNumBands       () const {return _nBands;}
int                  CPathwayModel::GetNumTechnologies() const {return _nTechs;}
int                  CPathwayModel::GetNumLinks       () const {return _nLinks;}
const CBaselineBand *CPathwayModel::GetBand     (const int b) const {return _pBands[b];}
const CTechnology   *CPathwayModel::GetTechnology(const int i) const {return _pTechs[i];}
const CTechLink     *CPathwayModel::GetLink     (const int l) const {return _pLinks[l];}
const CYearSeries   *CPathwayModel::GetTargets        () const {return _pTargets;}
bool                 CPathwayModel::HasBaselineOverride() const {return (_baseline_override!=NOT_SPECIFIED);}
bool                 CPathwayModel::IsInitialized     () const {return _initialized;}
CTechnology         *CPathwayModel::GetTechnologyToModify(const int i){return _pTechs[i];}

//////////////////////////////////////////////////////////////////
/// \brief returns index of band with identifier id, or DOESNT_EXIST
//
int CPathwayModel::GetBandIndex(const string id) const
{
  for (int b=0;b<_nBands;b++){if (_pBands[b]->GetID()==id){return b;}}
  return DOESNT_EXIST;
}
//////////////////////////////////////////////////////////////////
/// \brief returns index of technology with identifier id, or DOESNT_EXIST
//
int CPathwayModel::GetTechIndex(const string id) const
{
  for (int i=0;i<_nTechs;i++){if (_pTechs[i]->GetID()==id){return i;}}
  return DOESNT_EXIST;
}
//////////////////////////////////////////////////////////////////
/// \brief returns baseline emissions [t/yr]
/// \details given value if :BaselineEmissions was specified, otherwise sum of activity x intensity over bands
//
double CPathwayModel::GetBaselineEmissions() const
{
  if (HasBaselineOverride()){return _baseline_override;}
  double sum=0.0;
  for (int b=0;b<_nBands;b++){sum+=_pBands[b]->GetEmissions();}
  return sum;
}

//////////////////////////////////////////////////////////////////
void CPathwayModel::AddBand(CBaselineBand *pBand)
{
  ExitGracefullyIf(_initialized,"CPathwayModel::AddBand: model already initialized",RUNTIME_ERR);
  if (!DynArrayAppend((void**&)(_pBands),(void*)(pBand),_nBands)){
    ExitGracefully("CPathwayModel::AddBand: adding NULL band",BAD_DATA);}
}
//////////////////////////////////////////////////////////////////
void CPathwayModel::AddTechnology(CTechnology *pTech)
{
  ExitGracefullyIf(_initialized,"CPathwayModel::AddTechnology: model already initialized",RUNTIME_ERR);
  if (!DynArrayAppend((void**&)(_pTechs),(void*)(pTech),_nTechs)){
    ExitGracefully("CPathwayModel::AddTechnology: adding NULL technology",BAD_DATA);}
}
//////////////////////////////////////////////////////////////////
void CPathwayModel::AddLink(CTechLink *pLink)
{
  ExitGracefullyIf(_initialized,"CPathwayModel::AddLink: model already initialized",RUNTIME_ERR);
  if (!DynArrayAppend((void**&)(_pLinks),(void*)(pLink),_nLinks)){
    ExitGracefully("CPathwayModel::AddLink: adding NULL link",BAD_DATA);}
}
//////////////////////////////////////////////////////////////////
/// \brief adds absolute emission ceiling [t/yr] for year
//
void CPathwayModel::AddTarget(const int year, const double ceiling)
{
  _pTargets->AddPoint(year,ceiling);
}
//////////////////////////////////////////////////////////////////
void CPathwayModel::SetBaselineEmissions(const double emissions)
{
  _baseline_override=emissions;
}

//////////////////////////////////////////////////////////////////
/// \brief resolves cross-references between entities
/// \details assigns band indices to technologies and technology indices to links, then
///   merges overlapping mutual exclusivity declarations into disjoint groups.
///   Should be called once, after CheckModelData()
///
/// \param &Options [in] run options
//
void CPathwayModel::Initialize(const optStruct &Options)
{
  int i,l,j;
  string warn;
  if (_initialized){return;}

  for (i=0;i<_nTechs;i++)
  {
    int b=GetBandIndex(_pTechs[i]->GetBandID());
    if (b==DOESNT_EXIST){
      warn="CPathwayModel::Initialize: technology "+_pTechs[i]->GetID()+" substitutes unknown baseline band "+_pTechs[i]->GetBandID();
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
    _pTechs[i]->SetBandIndex(b);
  }

  for (l=0;l<_nLinks;l++)
  {
    for (j=0;j<_pLinks[l]->GetNumTechs();j++)
    {
      int ii=GetTechIndex(_pLinks[l]->GetTechID(j));
      if (ii==DOESNT_EXIST){
        warn="CPathwayModel::Initialize: "+_pLinks[l]->GetTypeName()+" references unknown technology "+_pLinks[l]->GetTechID(j);
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
      _pLinks[l]->SetTechIndex(j,ii);
    }
  }

  string *aTechIDs=new string[max(_nTechs,1)];
  for (i=0;i<_nTechs;i++){aTechIDs[i]=_pTechs[i]->GetID();}
  CTechLink::MergeExclusiveGroups(_pLinks,_nLinks,_nTechs,aTechIDs);
  delete [] aTechIDs;

  if (Options.noisy){cout<<"  ...model initialized: "<<_nLinks<<" technology links after merging"<<endl;}
  _initialized=true;
}

//////////////////////////////////////////////////////////////////
/// \brief Writes model summary information to screen
/// \param &Options [in] run options
//
void CPathwayModel::SummarizeToScreen(const optStruct &Options) const
{
  if (Options.silent){return;}

  vector<int> years;
  GetModelYears(Options,years);
  int nExcl=0,nCouple=0;
  for (int l=0;l<_nLinks;l++){
    if (_pLinks[l]->GetType()==LINK_MUTUALLY_EXCLUSIVE){nExcl++;}
    else                                               {nCouple++;}
  }

  cout <<"==MODEL SUMMARY======================================="<<endl;
  cout <<"         Model Run: "<<Options.run_name<<endl;
  cout <<"      mci filename: "<<Options.mci_filename<<endl;
  cout <<"  Output Directory: "<<Options.main_output_dir<<endl;
  if (years.size()>0){
  cout <<"       Model years: "<<years[0]<<"-"<<years[years.size()-1]<<" ("<<years.size()<<" years)"<<endl;
  }
  cout <<"     Discount rate: "<<Options.discount_rate<<endl;
  cout <<"    Baseline bands: "<<_nBands<<endl;
  for (int b=0;b<_nBands;b++){
    cout <<"                  - "<<_pBands[b]->GetID()<<" (activity="<<_pBands[b]->GetActivity()<<", intensity="<<_pBands[b]->GetIntensity()<<")"<<endl;
  }
  cout <<"Baseline emissions: "<<GetBaselineEmissions()<<(HasBaselineOverride() ? " (specified)" : "")<<endl;
  cout <<"      Technologies: "<<_nTechs<<endl;
  for (int i=0;i<_nTechs;i++){
    cout <<"                  - "<<_pTechs[i]->GetID()<<" -> "<<_pTechs[i]->GetBandID()<<" (lifetime="<<_pTechs[i]->GetLifetime()<<")"<<endl;
  }
  cout <<"   Excl. groups   : "<<nExcl<<endl;
  cout <<"   Couplings      : "<<nCouple<<endl;
  cout <<"   Shortfall slack: "<<(Options.allow_shortfall ? "ENABLED" : "DISABLED")<<endl;
  cout <<"======================================================"<<endl;
}

//////////////////////////////////////////////////////////////////
/// \brief builds and solves the pathway problem for a single configuration
/// \details The model itself is not modified; all resolved data live in the
///   problem, which is created and destroyed here.
///   An unbounded problem is a model integrity error, as is any violation found by
///   the post-solve consistency check. All other terminal statuses are returned.
///
/// \param &Options [in] run options
/// \param &Adapter [in] solver adapter
/// \param *pCancel [in] cooperative cancellation flag (may be NULL)
/// \return results of run (caller takes ownership)
//
CPathwayResults *CPathwayModel::Run(const optStruct &Options, const CSolverAdapter &Adapter,
                                    const atomic<bool> *pCancel) const
{
  CPathwayProblem *pProblem=NULL;
  CPathwayResults *pResults=NULL;
  try
  {
    pProblem=new CPathwayProblem(this,Options);
    pProblem->Build();

    if (Options.debug_level>=2){
      pProblem->GetLP().WriteMatrix(FilenamePrepare("LPMatrix.csv",Options));
    }

    pProblem->SetStatus(STATUS_SOLVING);
    if (Options.noisy){cout<<"  solving pathway problem..."<<endl;}
    solve_outcome out=Adapter.Solve(pProblem->GetLP(),Options,pCancel);
    pProblem->SetStatus(out.status);

    if (out.status==STATUS_UNBOUNDED){
      ExitGracefully("CPathwayModel::Run: pathway problem is unbounded. Costs, caps or ramp limits are missing a bound.",MODEL_INTEGRITY);
    }

    pResults=new CPathwayResults(*pProblem,out);
    pResults->CheckConsistency(*pProblem,Options.consistency_tol);
  }
  catch (exception &)
  {
    delete pResults;
    delete pProblem;
    throw;
  }
  delete pProblem;
  return pResults;
}
