/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  PathwayProblem.cpp: construction, parameter resolution and accessors
  of CPathwayProblem. Constraint assembly is in ConstraintAssembly.cpp,
  objective construction in Objective.cpp
  ----------------------------------------------------------------*/
#include "PathwayProblem.h"

//////////////////////////////////////////////////////////////////
/// \brief Constructor; resolves all model parameters onto model years
/// \param *pModel [in] initialized, validated model
/// \param &Options [in] run options (copied)
//
CPathwayProblem::CPathwayProblem(const CPathwayModel *pModel, const optStruct &Options)
{
  ExitGracefullyIf(pModel==NULL,"CPathwayProblem: NULL model",RUNTIME_ERR);
  ExitGracefullyIf(!pModel->IsInitialized(),"CPathwayProblem: model must be initialized before a problem is built",RUNTIME_ERR);

  _Options   =Options;
  _status    =STATUS_BUILT;
  _nYears    =0;     _aYears   =NULL;
  _nTechs    =0;     _nBands   =0;
  _aTechIDs  =NULL;  _aBandIDs =NULL;  _aBandOf=NULL;
  _aLifetime =NULL;  _aCommYear=NULL;  _aRamp  =NULL;  _aCRF=NULL;
  _aActivity =NULL;  _aIntensity=NULL;
  _aCap      =NULL;  _aFactor  =NULL;  _aCapex =NULL;  _aOpCost=NULL;
  _aTarget   =NULL;  _aRequired=NULL;  _aDF    =NULL;
  _nGroups   =0;     _aGroups  =NULL;  _aGroupSize=NULL;
  _nCouplings=0;     _aPrimary =NULL;  _aSecondary=NULL;
  _baseline  =0.0;
  _pVintage  =NULL;
  _pLP       =NULL;

  try
  {
    ResolveParameters(pModel);
    _pVintage=new CVintageMap(_aYears,_nYears,_aLifetime,_nTechs,_Options.vintage_policy);
  }
  catch (exception &)
  {
    DeleteArrays(); //destructor is not called for a partially constructed problem
    throw;
  }
}
//////////////////////////////////////////////////////////////////
CPathwayProblem::~CPathwayProblem()
{
  DeleteArrays();
}
//////////////////////////////////////////////////////////////////
/// \brief frees all resolved parameter arrays
/// \details safe on partially resolved data: per-technology rows are NULL until allocated
//
void CPathwayProblem::DeleteArrays()
{
  int i,g;
  for (i=0;i<_nTechs;i++){
    if (_aCap   !=NULL){delete [] _aCap   [i];}
    if (_aFactor!=NULL){delete [] _aFactor[i];}
    if (_aCapex !=NULL){delete [] _aCapex [i];}
    if (_aOpCost!=NULL){delete [] _aOpCost[i];}
  }
  delete [] _aCap;    delete [] _aFactor;   delete [] _aCapex;  delete [] _aOpCost;
  _aCap=NULL; _aFactor=NULL; _aCapex=NULL; _aOpCost=NULL;
  if (_aGroups!=NULL){
    for (g=0;g<_nGroups;g++){delete [] _aGroups[g];}
  }
  delete [] _aGroups; delete [] _aGroupSize;
  delete [] _aPrimary; delete [] _aSecondary;
  delete [] _aYears;  delete [] _aTechIDs;  delete [] _aBandIDs; delete [] _aBandOf;
  delete [] _aLifetime; delete [] _aCommYear; delete [] _aRamp; delete [] _aCRF;
  delete [] _aActivity; delete [] _aIntensity;
  delete [] _aTarget; delete [] _aRequired; delete [] _aDF;
  _aGroups=NULL; _aGroupSize=NULL; _aPrimary=NULL; _aSecondary=NULL;
  _aYears=NULL; _aTechIDs=NULL; _aBandIDs=NULL; _aBandOf=NULL;
  _aLifetime=NULL; _aCommYear=NULL; _aRamp=NULL; _aCRF=NULL;
  _aActivity=NULL; _aIntensity=NULL;
  _aTarget=NULL; _aRequired=NULL; _aDF=NULL;
  _nTechs=0; _nGroups=0;
  delete _pVintage; _pVintage=NULL;
  delete _pLP;      _pLP=NULL;
}

//////////////////////////////////////////////////////////////////
/// \brief resolves sparse model data onto dense model year arrays
/// \details required abatement(t)=max(0,baseline-target(t)); a target series with no
///   known points raises a DataGapError
//
void CPathwayProblem::ResolveParameters(const CPathwayModel *pModel)
{
  int i,k,b,l;
  const extrap_policy policy=_Options.extrapolation;

  vector<int> years;
  GetModelYears(_Options,years);
  ExitGracefullyIf(years.empty(),"CPathwayProblem: no model years specified (use :StartYear/:EndYear or :ModelYears)",BAD_DATA);

  _nYears=(int)(years.size());
  _aYears=new int[_nYears];
  for (k=0;k<_nYears;k++){_aYears[k]=years[k];}
  _base_year=GetBaseYear(_Options,years);

  _aDF=new double[_nYears];
  for (k=0;k<_nYears;k++){_aDF[k]=DiscountFactor(_aYears[k],_base_year,_Options.discount_rate);}

  //baseline bands
  _nBands    =pModel->GetNumBands();
  _aBandIDs  =new string[_nBands];
  _aActivity =new double[_nBands];
  _aIntensity=new double[_nBands];
  for (b=0;b<_nBands;b++){
    _aBandIDs  [b]=pModel->GetBand(b)->GetID();
    _aActivity [b]=pModel->GetBand(b)->GetActivity();
    _aIntensity[b]=pModel->GetBand(b)->GetIntensity();
  }

  //technologies
  _nTechs   =pModel->GetNumTechnologies();
  _aTechIDs =new string[_nTechs];
  _aBandOf  =new int   [_nTechs];
  _aLifetime=new int   [_nTechs];
  _aCommYear=new int   [_nTechs];
  _aRamp    =new double[_nTechs];
  _aCRF     =new double[_nTechs];
  _aCap     =new double *[_nTechs];
  _aFactor  =new double *[_nTechs];
  _aCapex   =new double *[_nTechs];
  _aOpCost  =new double *[_nTechs];
  for (i=0;i<_nTechs;i++){_aCap[i]=NULL; _aFactor[i]=NULL; _aCapex[i]=NULL; _aOpCost[i]=NULL;}
  for (i=0;i<_nTechs;i++)
  {
    const CTechnology *pTech=pModel->GetTechnology(i);
    _aTechIDs [i]=pTech->GetID();
    _aBandOf  [i]=pTech->GetBandIndex();
    _aLifetime[i]=pTech->GetLifetime();
    _aCommYear[i]=pTech->GetCommercialYear();
    _aRamp    [i]=pTech->GetRampRate(_Options)*_aActivity[_aBandOf[i]];
    _aCRF     [i]=CapitalRecoveryFactor(_aLifetime[i],_Options.discount_rate);

    _aCap   [i]=new double[_nYears];
    _aFactor[i]=new double[_nYears];
    _aCapex [i]=new double[_nYears];
    _aOpCost[i]=new double[_nYears];
    pTech->GetAbatementFactorSeries()->Resolve(_aYears,_nYears,_aFactor[i],policy);

    const CCostRecord *pCosts=pTech->GetCosts();
    ExitGracefullyIf((pCosts==NULL) || (pCosts->IsEmpty()),("CPathwayProblem: no cost data for technology "+_aTechIDs[i]).c_str(),BAD_DATA);
    for (k=0;k<_nYears;k++)
    {
      _aCap   [i][k]=pTech->GetAdoptionCap(_aYears[k],policy);
      _aCapex [i][k]=pCosts->GetCapitalCost  (_aYears[k],policy);
      _aOpCost[i][k]=pCosts->GetOperatingCost(_aYears[k],policy);
    }
    CheckResolvedValues(i);
  }

  //targets
  _baseline=pModel->GetBaselineEmissions();
  _aTarget  =new double[_nYears];
  _aRequired=new double[_nYears];
  pModel->GetTargets()->Resolve(_aYears,_nYears,_aTarget,policy);
  for (k=0;k<_nYears;k++){
    _aRequired[k]=max(0.0,_baseline-_aTarget[k]);
  }

  //links (exclusive groups have already been merged by CPathwayModel::Initialize)
  for (l=0;l<pModel->GetNumLinks();l++){
    if (pModel->GetLink(l)->GetType()==LINK_MUTUALLY_EXCLUSIVE){_nGroups++;}
    else                                                       {_nCouplings++;}
  }
  _aGroups   =new int *[max(_nGroups,1)];
  _aGroupSize=new int  [max(_nGroups,1)];
  _aPrimary  =new int  [max(_nCouplings,1)];
  _aSecondary=new int  [max(_nCouplings,1)];
  int g=0,c=0;
  for (l=0;l<pModel->GetNumLinks();l++)
  {
    const CTechLink *pLink=pModel->GetLink(l);
    if (pLink->GetType()==LINK_MUTUALLY_EXCLUSIVE)
    {
      _aGroupSize[g]=pLink->GetNumTechs();
      _aGroups   [g]=new int[_aGroupSize[g]];
      for (int j=0;j<_aGroupSize[g];j++){_aGroups[g][j]=pLink->GetTechIndex(j);}
      g++;
    }
    else
    {
      _aPrimary  [c]=pLink->GetPrimary();
      _aSecondary[c]=pLink->GetSecondary();
      c++;
    }
  }
}

//////////////////////////////////////////////////////////////////
/// \brief checks resolved series of technology i after extrapolation
/// \details linear extrapolation of valid points may leave the valid range, e.g.,
///   a declining cost series extended past its last point; such values never reach the LP
//
void CPathwayProblem::CheckResolvedValues(const int i) const
{
  string where;
  for (int k=0;k<_nYears;k++)
  {
    where=" of technology "+_aTechIDs[i]+" in year "+to_string(_aYears[k])+" (check :Extrapolation)";
    ExitGracefullyIf((_aCap[i][k]<0.0) || (_aCap[i][k]>1.0),
                     ("CPathwayProblem: resolved adoption cap outside [0,1]"+where).c_str(),BAD_DATA);
    ExitGracefullyIf(_aFactor[i][k]<0.0,
                     ("CPathwayProblem: resolved abatement factor is negative"+where).c_str(),BAD_DATA);
    ExitGracefullyIf(_aCapex[i][k]<0.0,
                     ("CPathwayProblem: resolved capital cost is negative"+where).c_str(),BAD_DATA);
    ExitGracefullyIf(_aOpCost[i][k]<0.0,
                     ("CPathwayProblem: resolved operating cost is negative"+where).c_str(),BAD_DATA);
  }
}

//////////////////////////////////////////////////////////////////
/// \brief assembles constraint set and objective into linear program
/// \details enters run state Built
//
void CPathwayProblem::Build()
{
  ExitGracefullyIf(_pLP!=NULL,"CPathwayProblem::Build: problem already built",RUNTIME_ERR);
  _pLP=new CLinearProgram("MacawPathway",GetNumDecisionVars());

  AssembleConstraints();
  BuildObjective();
  _pLP->Finalize();

  _status=STATUS_BUILT;
  if (_Options.noisy){
    cout<<"  Assembled pathway LP: "<<_pLP->GetNumColumns()<<" variables, "<<_pLP->GetNumRows()<<" constraints, ";
    cout<<_pLP->GetNumNonZeros()<<" non-zeros"<<endl;
  }
}

//////////////////////////////////////////////////////////////////
/// \brief total number of decision variables
/// \details install, capacity, production and abatement for each technology and year,
///   plus one shortfall variable per year if slack is enabled
//
int CPathwayProblem::GetNumDecisionVars() const
{
  int n=4*_nTechs*_nYears;
  if (HasShortfall()){n+=_nYears;}
  return n;
}
//////////////////////////////////////////////////////////////////
/// \brief returns (0-based) LP column index of decision variable
///
/// \param typ [in] decision variable type
/// \param i [in] technology index (ignored for DV_SHORTFALL)
/// \param k [in] model year index
//
int CPathwayProblem::GetDVColumnInd(const dv_type typ, const int i, const int k) const
{
  if (typ==DV_SHORTFALL)
  {
    ExitGracefullyIf(!HasShortfall(),"CPathwayProblem::GetDVColumnInd: shortfall variables require :AllowShortfall",RUNTIME_ERR);
    return 4*_nTechs*_nYears+k;
  }
  return ((int)(typ))*_nTechs*_nYears+i*_nYears+k;
}
//////////////////////////////////////////////////////////////////
/// \brief returns LP column name of decision variable, e.g., CAP_H2DRI_2030
//
string CPathwayProblem::GetColumnName(const dv_type typ, const int i, const int k) const
{
  string yr=to_string(_aYears[k]);
  switch(typ)
  {
  case(DV_INSTALL):    {return "NEW_" +_aTechIDs[i]+"_"+yr;}
  case(DV_CAPACITY):   {return "CAP_" +_aTechIDs[i]+"_"+yr;}
  case(DV_PRODUCTION): {return "PROD_"+_aTechIDs[i]+"_"+yr;}
  case(DV_ABATEMENT):  {return "ABAT_"+_aTechIDs[i]+"_"+yr;}
  case(DV_SHORTFALL):  {return "SHORT_"+yr;}
  }
  return "";
}

//////////////////////////////////////////////////////////////////
const optStruct      &CPathwayProblem::GetOptions   () const {return _Options;}
solve_status          CPathwayProblem::GetStatus    () const {return _status;}
void                  CPathwayProblem::SetStatus    (const solve_status stat){_status=stat;}
const CVintageMap    &CPathwayProblem::GetVintageMap() const {return *_pVintage;}
//////////////////////////////////////////////////////////////////
const CLinearProgram &CPathwayProblem::GetLP() const
{
  ExitGracefullyIf(_pLP==NULL,"CPathwayProblem::GetLP: problem not built",RUNTIME_ERR);
  return *_pLP;
}
//////////////////////////////////////////////////////////////////
int    CPathwayProblem::GetNumYears         () const {return _nYears;}
int    CPathwayProblem::GetYear             (const int k) const {return _aYears[k];}
int    CPathwayProblem::GetBaseYear         () const {return _base_year;}
int    CPathwayProblem::GetNumTechs         () const {return _nTechs;}
int    CPathwayProblem::GetNumBands         () const {return _nBands;}
string CPathwayProblem::GetTechID           (const int i) const {return _aTechIDs[i];}
string CPathwayProblem::GetBandID           (const int b) const {return _aBandIDs[b];}
int    CPathwayProblem::GetBandOf           (const int i) const {return _aBandOf[i];}
int    CPathwayProblem::GetLifetime         (const int i) const {return _aLifetime[i];}
double CPathwayProblem::GetActivity         (const int b) const {return _aActivity[b];}
double CPathwayProblem::GetIntensity        (const int b) const {return _aIntensity[b];}
double CPathwayProblem::GetRampLimit        (const int i) const {return _aRamp[i];}
double CPathwayProblem::GetAdoptionCap      (const int i, const int k) const {return _aCap[i][k];}
double CPathwayProblem::GetAbatementFactor  (const int i, const int k) const {return _aFactor[i][k];}
double CPathwayProblem::GetCapitalCost      (const int i, const int k) const {return _aCapex[i][k];}
double CPathwayProblem::GetOperatingCost    (const int i, const int k) const {return _aOpCost[i][k];}
double CPathwayProblem::GetCRF              (const int i) const {return _aCRF[i];}
double CPathwayProblem::GetDiscountFactor   (const int k) const {return _aDF[k];}
double CPathwayProblem::GetBaselineEmissions() const {return _baseline;}
double CPathwayProblem::GetTarget           (const int k) const {return _aTarget[k];}
double CPathwayProblem::GetRequiredAbatement(const int k) const {return _aRequired[k];}
bool   CPathwayProblem::HasShortfall        () const {return _Options.allow_shortfall;}
int    CPathwayProblem::GetNumGroups        () const {return _nGroups;}
int    CPathwayProblem::GetGroupSize        (const int g) const {return _aGroupSize[g];}
int    CPathwayProblem::GetGroupMember      (const int g, const int j) const {return _aGroups[g][j];}
int    CPathwayProblem::GetNumCouplings     () const {return _nCouplings;}
int    CPathwayProblem::GetCouplingPrimary  (const int c) const {return _aPrimary[c];}
int    CPathwayProblem::GetCouplingSecondary(const int c) const {return _aSecondary[c];}
//////////////////////////////////////////////////////////////////
/// \brief returns model year index of calendar year, or DOESNT_EXIST
//
int CPathwayProblem::GetYearIndex(const int year) const
{
  for (int k=0;k<_nYears;k++){if (_aYears[k]==year){return k;}}
  return DOESNT_EXIST;
}
//////////////////////////////////////////////////////////////////
/// \brief true if technology i may install new capacity in model year k
//
bool CPathwayProblem::IsInstallAllowed(const int i, const int k) const
{
  if (_aCommYear[i]==DOESNT_EXIST){return true;}
  return (_aYears[k]>=_aCommYear[i]);
}
//////////////////////////////////////////////////////////////////
/// \brief levelized cost of abatement [cost/t] of technology i in model year k
/// \details (CRF*capex+operating cost)/abatement factor; ALMOST_INF if factor is zero
//
double CPathwayProblem::GetLCOA(const int i, const int k) const
{
  if (_aFactor[i][k]<=REAL_SMALL){return ALMOST_INF;}
  return (_aCRF[i]*_aCapex[i][k]+_aOpCost[i][k])/_aFactor[i][k];
}
