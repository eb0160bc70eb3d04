/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  PathwayResults.cpp: result extraction and post-solve consistency check
  ----------------------------------------------------------------*/
#include "PathwayResults.h"

//////////////////////////////////////////////////////////////////
/// \brief allocates 2D array initialized to zero
//
static double **New2DArray(const int n1, const int n2)
{
  double **a=new double *[max(n1,1)];
  for (int i=0;i<n1;i++){
    a[i]=new double[n2];
    for (int k=0;k<n2;k++){a[i][k]=0.0;}
  }
  return a;
}
//////////////////////////////////////////////////////////////////
static void Delete2DArray(double **&a, const int n1)
{
  for (int i=0;i<n1;i++){delete [] a[i];}
  delete [] a; a=NULL;
}

//////////////////////////////////////////////////////////////////
/// \brief Constructor; maps solved decision values onto the technology/year grid
/// \details if the outcome is not optimal, only status, targets and required abatement are stored
///
/// \param &P [in] problem that was solved
/// \param &out [in] solver outcome
//
CPathwayResults::CPathwayResults(const CPathwayProblem &P, const solve_outcome &out)
{
  int i,k,b;
  _status       =out.status;
  _backend      =out.backend;
  _message      =out.message;
  _objective    =0.0;
  _discount_rate=P.GetOptions().discount_rate;
  _max_row_violation=0.0;
  _worst_row    ="";

  _nYears=P.GetNumYears();
  _nTechs=P.GetNumTechs();
  _nBands=P.GetNumBands();

  _aYears   =new int   [_nYears];
  _aTechIDs =new string[max(_nTechs,1)];
  _aBandIDs =new string[max(_nBands,1)];
  _aBandOf  =new int   [max(_nTechs,1)];
  _aActivity=new double[max(_nBands,1)];
  for (k=0;k<_nYears;k++){_aYears[k]=P.GetYear(k);}
  for (i=0;i<_nTechs;i++){_aTechIDs[i]=P.GetTechID(i); _aBandOf[i]=P.GetBandOf(i);}
  for (b=0;b<_nBands;b++){_aBandIDs[b]=P.GetBandID(b); _aActivity[b]=P.GetActivity(b);}

  _aInstalled =New2DArray(_nTechs,_nYears);
  _aCapacity  =New2DArray(_nTechs,_nYears);
  _aShare     =New2DArray(_nTechs,_nYears);
  _aProduction=New2DArray(_nTechs,_nYears);
  _aAbatement =New2DArray(_nTechs,_nYears);
  _aAnnualCost=New2DArray(_nTechs,_nYears);
  _aDiscCost  =New2DArray(_nTechs,_nYears);
  _aLCOA      =New2DArray(_nTechs,_nYears);
  _aResidual  =New2DArray(_nBands,_nYears);

  _baseline  =P.GetBaselineEmissions();
  _aTarget   =new double[_nYears];
  _aRequired =new double[_nYears];
  _aAchieved =new double[_nYears];
  _aShortfall=new double[_nYears];
  _aEmissions=new double[_nYears];
  _aYearCost =new double[_nYears];
  for (k=0;k<_nYears;k++)
  {
    _aTarget   [k]=P.GetTarget(k);
    _aRequired [k]=P.GetRequiredAbatement(k);
    _aAchieved [k]=0.0;
    _aShortfall[k]=0.0;
    _aEmissions[k]=_baseline;
    _aYearCost [k]=0.0;
    for (i=0;i<_nTechs;i++){_aLCOA[i][k]=P.GetLCOA(i,k);}
    for (b=0;b<_nBands;b++){_aResidual[b][k]=_aActivity[b];}
  }

  if (_status==STATUS_OPTIMAL)
  {
    ExitGracefullyIf((int)(out.x.n_elem)!=P.GetNumDecisionVars(),
                     "CPathwayResults: solution vector does not match problem size",MODEL_INTEGRITY);
    _objective=out.objective;
    Extract(P,out.x);
  }
}
//////////////////////////////////////////////////////////////////
CPathwayResults::~CPathwayResults()
{
  Delete2DArray(_aInstalled ,_nTechs);
  Delete2DArray(_aCapacity  ,_nTechs);
  Delete2DArray(_aShare     ,_nTechs);
  Delete2DArray(_aProduction,_nTechs);
  Delete2DArray(_aAbatement ,_nTechs);
  Delete2DArray(_aAnnualCost,_nTechs);
  Delete2DArray(_aDiscCost  ,_nTechs);
  Delete2DArray(_aLCOA      ,_nTechs);
  Delete2DArray(_aResidual  ,_nBands);
  delete [] _aYears;    delete [] _aTechIDs;  delete [] _aBandIDs;
  delete [] _aBandOf;   delete [] _aActivity;
  delete [] _aTarget;   delete [] _aRequired; delete [] _aAchieved;
  delete [] _aShortfall;delete [] _aEmissions;delete [] _aYearCost;
}

//////////////////////////////////////////////////////////////////
/// \brief extracts pathway from solution vector
/// \details annualized cost(i,t) = CRF_i * sum_{tau in W(i,t)} capex(i,tau)*NEW(i,tau) + opcost(i,t)*PROD(i,t);
///   discounted cost is annualized cost times DF(t)
//
void CPathwayResults::Extract(const CPathwayProblem &P, const arma::vec &x)
{
  int i,k,b,j;
  const CVintageMap &VM=P.GetVintageMap();

  for (i=0;i<_nTechs;i++)
  {
    double activity=_aActivity[_aBandOf[i]];
    for (k=0;k<_nYears;k++)
    {
      _aInstalled [i][k]=x(P.GetDVColumnInd(DV_INSTALL   ,i,k));
      _aCapacity  [i][k]=x(P.GetDVColumnInd(DV_CAPACITY  ,i,k));
      _aProduction[i][k]=x(P.GetDVColumnInd(DV_PRODUCTION,i,k));
      _aAbatement [i][k]=x(P.GetDVColumnInd(DV_ABATEMENT ,i,k));
      _aShare     [i][k]=_aCapacity[i][k]/activity;
    }
    for (k=0;k<_nYears;k++)
    {
      double capital=0.0;
      for (j=0;j<VM.GetNumInService(i,k);j++){
        int kk=VM.GetInServiceIndex(i,k,j);
        if (P.IsInstallAllowed(i,kk)){capital+=P.GetCapitalCost(i,kk)*_aInstalled[i][kk];}
      }
      _aAnnualCost[i][k]=P.GetCRF(i)*capital+P.GetOperatingCost(i,k)*_aProduction[i][k];
      _aDiscCost  [i][k]=P.GetDiscountFactor(k)*_aAnnualCost[i][k];
    }
  }

  for (k=0;k<_nYears;k++)
  {
    _aAchieved[k]=0.0;
    _aYearCost[k]=0.0;
    for (i=0;i<_nTechs;i++){
      _aAchieved[k]+=_aAbatement[i][k];
      _aYearCost[k]+=_aDiscCost [i][k];
    }
    for (b=0;b<_nBands;b++){
      _aResidual[b][k]=_aActivity[b];
    }
    for (i=0;i<_nTechs;i++){
      _aResidual[_aBandOf[i]][k]-=_aProduction[i][k];
    }
    if (P.HasShortfall()){
      _aShortfall[k]=x(P.GetDVColumnInd(DV_SHORTFALL,0,k));
      _aYearCost [k]+=P.GetDiscountFactor(k)*P.GetOptions().slack_penalty*_aShortfall[k];
    }
    _aEmissions[k]=_baseline-_aAchieved[k];
  }

  int worst;
  _max_row_violation=P.GetLP().GetMaxRowViolation(x,worst);
  if (worst!=DOESNT_EXIST){_worst_row=P.GetLP().GetRow(worst).name;}
}

//////////////////////////////////////////////////////////////////
/// \brief post-solve consistency check
/// \details re-evaluates the vintaging relation, production limit and band mass balance
///   ceiling from extracted values. A violation beyond tol (relative to the magnitude of
///   the terms, with a floor of one unit) is a model integrity error.
///
/// \param &P [in] problem that was solved
/// \param tol [in] relative tolerance
//
void CPathwayResults::CheckConsistency(const CPathwayProblem &P, const double tol) const
{
  if (_status!=STATUS_OPTIMAL){return;}

  int i,k,b;
  const CVintageMap &VM=P.GetVintageMap();
  string warn;

  for (i=0;i<_nTechs;i++)
  {
    for (k=0;k<_nYears;k++)
    {
      double inservice=VM.GetInServiceCapacity(i,k,_aInstalled[i]);
      double scale=max(1.0,max(fabs(inservice),fabs(_aCapacity[i][k])));
      if (fabs(_aCapacity[i][k]-inservice)>tol*scale)
      {
        warn="CPathwayResults::CheckConsistency: vintaging violated for technology "+_aTechIDs[i]+" in "+to_string(_aYears[k])+
             " (capacity "+to_string(_aCapacity[i][k])+", installations in service "+to_string(inservice)+")";
        ExitGracefully(warn.c_str(),MODEL_INTEGRITY);
      }
      scale=max(1.0,fabs(_aCapacity[i][k]));
      if (_aProduction[i][k]-_aCapacity[i][k]>tol*scale)
      {
        warn="CPathwayResults::CheckConsistency: production exceeds in-service capacity for technology "+_aTechIDs[i]+" in "+to_string(_aYears[k]);
        ExitGracefully(warn.c_str(),MODEL_INTEGRITY);
      }
    }
  }
  for (b=0;b<_nBands;b++)
  {
    for (k=0;k<_nYears;k++)
    {
      double scale=max(1.0,_aActivity[b]);
      if (-_aResidual[b][k]>tol*scale)
      {
        warn="CPathwayResults::CheckConsistency: band "+_aBandIDs[b]+" activity exceeded in "+to_string(_aYears[k])+
             " (residual baseline production "+to_string(_aResidual[b][k])+")";
        ExitGracefully(warn.c_str(),MODEL_INTEGRITY);
      }
    }
  }
}

//////////////////////////////////////////////////////////////////
solve_status CPathwayResults::GetStatus      () const {return _status;}
string       CPathwayResults::GetBackend     () const {return _backend;}
string       CPathwayResults::GetMessage     () const {return _message;}
double       CPathwayResults::GetObjective   () const {return _objective;}
double       CPathwayResults::GetDiscountRate() const {return _discount_rate;}
bool         CPathwayResults::IsOptimal      () const {return (_status==STATUS_OPTIMAL);}
int          CPathwayResults::GetNumYears    () const {return _nYears;}
int          CPathwayResults::GetNumTechs    () const {return _nTechs;}
int          CPathwayResults::GetNumBands    () const {return _nBands;}
int          CPathwayResults::GetYear        (const int k) const {return _aYears[k];}
string       CPathwayResults::GetTechID      (const int i) const {return _aTechIDs[i];}
string       CPathwayResults::GetBandID      (const int b) const {return _aBandIDs[b];}
//////////////////////////////////////////////////////////////////
int CPathwayResults::GetTechIndex(const string id) const
{
  for (int i=0;i<_nTechs;i++){if (_aTechIDs[i]==id){return i;}}
  return DOESNT_EXIST;
}
//////////////////////////////////////////////////////////////////
double CPathwayResults::GetInstalled       (const int i, const int k) const {return _aInstalled [i][k];}
double CPathwayResults::GetCapacity        (const int i, const int k) const {return _aCapacity  [i][k];}
double CPathwayResults::GetShare           (const int i, const int k) const {return _aShare     [i][k];}
double CPathwayResults::GetProduction      (const int i, const int k) const {return _aProduction[i][k];}
double CPathwayResults::GetAbatement       (const int i, const int k) const {return _aAbatement [i][k];}
double CPathwayResults::GetAnnualizedCost  (const int i, const int k) const {return _aAnnualCost[i][k];}
double CPathwayResults::GetDiscountedCost  (const int i, const int k) const {return _aDiscCost  [i][k];}
double CPathwayResults::GetLCOA            (const int i, const int k) const {return _aLCOA      [i][k];}
double CPathwayResults::GetResidualActivity(const int b, const int k) const {return _aResidual  [b][k];}
double CPathwayResults::GetBaselineEmissions() const {return _baseline;}
double CPathwayResults::GetTarget          (const int k) const {return _aTarget   [k];}
double CPathwayResults::GetRequired        (const int k) const {return _aRequired [k];}
double CPathwayResults::GetAchieved        (const int k) const {return _aAchieved [k];}
double CPathwayResults::GetShortfall       (const int k) const {return _aShortfall[k];}
double CPathwayResults::GetEmissions       (const int k) const {return _aEmissions[k];}
double CPathwayResults::GetMaxRowViolation () const {return _max_row_violation;}
//////////////////////////////////////////////////////////////////
double CPathwayResults::GetTotalShortfall() const
{
  double sum=0.0;
  for (int k=0;k<_nYears;k++){sum+=_aShortfall[k];}
  return sum;
}
