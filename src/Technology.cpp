/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  Technology.cpp: CBaselineBand, CCostRecord and CTechnology
  ----------------------------------------------------------------*/
#include "Technology.h"

/*****************************************************************
   CBaselineBand
*****************************************************************/
CBaselineBand::CBaselineBand(const string id, const double activity, const double intensity)
{
  _id       =id;
  _activity =activity;
  _intensity=intensity;
}
CBaselineBand::~CBaselineBand(){}

string CBaselineBand::GetID       () const {return _id;}
double CBaselineBand::GetActivity () const {return _activity;}
double CBaselineBand::GetIntensity() const {return _intensity;}
//////////////////////////////////////////////////////////////////
/// \brief returns annual baseline emissions of band [t/yr]
//
double CBaselineBand::GetEmissions() const {return _activity*_intensity;}

/*****************************************************************
   CCostRecord
*****************************************************************/
CCostRecord::CCostRecord(const string tech_id)
{
  _pCapex      =new CYearSeries(tech_id+" capital cost");
  _pFixedOM    =new CYearSeries(tech_id+" fixed O&M cost");
  _pVariableOM =new CYearSeries(tech_id+" variable O&M cost");
  _pFuelPremium=new CYearSeries(tech_id+" fuel cost premium");
}
CCostRecord::~CCostRecord()
{
  delete _pCapex;
  delete _pFixedOM;
  delete _pVariableOM;
  delete _pFuelPremium;
}
//////////////////////////////////////////////////////////////////
/// \brief adds a row of the cost table
///
/// \param year [in] calendar year
/// \param capex [in] capital cost per unit new capacity
/// \param fixed_om [in] fixed operating cost per unit production
/// \param variable_om [in] variable operating cost per unit production
/// \param fuel [in] fuel cost premium per unit production
//
void CCostRecord::AddYear(const int year, const double capex, const double fixed_om,
                          const double variable_om, const double fuel)
{
  _pCapex      ->AddPoint(year,capex);
  _pFixedOM    ->AddPoint(year,fixed_om);
  _pVariableOM ->AddPoint(year,variable_om);
  _pFuelPremium->AddPoint(year,fuel);
}
//////////////////////////////////////////////////////////////////
/// \brief adds a row of the cost table without fuel premium
//
void CCostRecord::AddYear(const int year, const double capex, const double fixed_om,
                          const double variable_om)
{
  _pCapex      ->AddPoint(year,capex);
  _pFixedOM    ->AddPoint(year,fixed_om);
  _pVariableOM ->AddPoint(year,variable_om);
}
//////////////////////////////////////////////////////////////////
bool CCostRecord::IsEmpty    () const {return (_pCapex->GetNumPoints()==0);}
int  CCostRecord::GetNumYears() const {return _pCapex->GetNumPoints();}
//////////////////////////////////////////////////////////////////
/// \brief returns smallest cost of any component in any year of the table
//
double CCostRecord::GetMinimumValue() const
{
  double v=_pCapex->GetMinValue();
  lowerswap(v,_pFixedOM   ->GetMinValue());
  lowerswap(v,_pVariableOM->GetMinValue());
  if (_pFuelPremium->GetNumPoints()>0){lowerswap(v,_pFuelPremium->GetMinValue());}
  return v;
}

//////////////////////////////////////////////////////////////////
/// \brief returns capital cost per unit of new capacity installed in year
//
double CCostRecord::GetCapitalCost(const int year, const extrap_policy policy) const
{
  return _pCapex->GetValue(year,policy);
}
//////////////////////////////////////////////////////////////////
/// \brief returns total operating cost per unit production in year
/// \details fixed + variable O&M + fuel premium; fuel premium is zero if never given
//
double CCostRecord::GetOperatingCost(const int year, const extrap_policy policy) const
{
  double cost=_pFixedOM->GetValue(year,policy)+_pVariableOM->GetValue(year,policy);
  if (_pFuelPremium->GetNumPoints()>0){cost+=_pFuelPremium->GetValue(year,policy);}
  return cost;
}

/*****************************************************************
   CTechnology
*****************************************************************/
CTechnology::CTechnology(const string id)
{
  _id              =id;
  _band_id         ="";
  _band_index      =DOESNT_EXIST;
  _lifetime        =DOESNT_EXIST;
  _commercial_year =DOESNT_EXIST;
  _ramp_rate       =NOT_SPECIFIED;
  _pAdoptionCap    =new CYearSeries(id+" adoption cap");
  _pAbatementFactor=new CYearSeries(id+" abatement factor");
  _pCosts          =NULL;
}
CTechnology::~CTechnology()
{
  delete _pAdoptionCap;     _pAdoptionCap=NULL;
  delete _pAbatementFactor; _pAbatementFactor=NULL;
  delete _pCosts;           _pCosts=NULL;
}
//////////////////////////////////////////////////////////////////
string CTechnology::GetID            () const {return _id;}
string CTechnology::GetBandID        () const {return _band_id;}
int    CTechnology::GetBandIndex     () const {return _band_index;}
int    CTechnology::GetLifetime      () const {return _lifetime;}
int    CTechnology::GetCommercialYear() const {return _commercial_year;}
bool   CTechnology::HasRampRate      () const {return (_ramp_rate!=NOT_SPECIFIED);}
const CYearSeries *CTechnology::GetAdoptionCapSeries    () const {return _pAdoptionCap;}
const CYearSeries *CTechnology::GetAbatementFactorSeries() const {return _pAbatementFactor;}
const CCostRecord *CTechnology::GetCosts                () const {return _pCosts;}

//////////////////////////////////////////////////////////////////
/// \brief returns ramp limit [share of band activity per year]
/// \details configuration default is used if technology omits one
//
double CTechnology::GetRampRate(const optStruct &Options) const
{
  if (_ramp_rate==NOT_SPECIFIED){return Options.default_ramp_rate;}
  return _ramp_rate;
}
//////////////////////////////////////////////////////////////////
/// \brief returns adoption cap [share of band activity] in year
/// \details full adoption (1.0) if no cap series was given
//
double CTechnology::GetAdoptionCap(const int year, const extrap_policy policy) const
{
  if (_pAdoptionCap->GetNumPoints()==0){return DEFAULT_ADOPTION_CAP;}
  return _pAdoptionCap->GetValue(year,policy);
}
//////////////////////////////////////////////////////////////////
/// \brief returns abatement per unit production in year
//
double CTechnology::GetAbatementFactor(const int year, const extrap_policy policy) const
{
  return _pAbatementFactor->GetValue(year,policy);
}
//////////////////////////////////////////////////////////////////
/// \brief true if new installations are permitted in year
//
bool CTechnology::IsAvailable(const int year) const
{
  if (_commercial_year==DOESNT_EXIST){return true;}
  return (year>=_commercial_year);
}

//////////////////////////////////////////////////////////////////
/// \brief returns levelized cost of abatement [cost/t] in year
/// \details (CRF*capex + operating cost)/abatement factor, with capacity fully utilized.
/// ALMOST_INF if the technology abates nothing
//
double CTechnology::GetLevelizedCostOfAbatement(const int year, const optStruct &Options) const
{
  if ((_pCosts==NULL) || (_pCosts->IsEmpty()) || (_lifetime<1)){return ALMOST_INF;}
  double factor=GetAbatementFactor(year,Options.extrapolation);
  if (factor<=REAL_SMALL){return ALMOST_INF;}

  double crf=CapitalRecoveryFactor(_lifetime,Options.discount_rate);
  return (crf*_pCosts->GetCapitalCost(year,Options.extrapolation)+_pCosts->GetOperatingCost(year,Options.extrapolation))/factor;
}

//////////////////////////////////////////////////////////////////
void CTechnology::SetBandID        (const string band_id){_band_id=band_id;}
void CTechnology::SetBandIndex     (const int b)         {_band_index=b;}
void CTechnology::SetLifetime      (const int L)         {_lifetime=L;}
void CTechnology::SetCommercialYear(const int year)      {_commercial_year=year;}
void CTechnology::SetRampRate      (const double ramp)   {_ramp_rate=ramp;}
void CTechnology::AddAdoptionCap   (const int year, const double cap)   {_pAdoptionCap->AddPoint(year,cap);}
void CTechnology::AddAbatementFactor(const int year, const double factor){_pAbatementFactor->AddPoint(year,factor);}
//////////////////////////////////////////////////////////////////
/// \brief returns cost record, creating it if this is the first cost entry
//
CCostRecord *CTechnology::GetCostRecord()
{
  if (_pCosts==NULL){_pCosts=new CCostRecord(_id);}
  return _pCosts;
}
