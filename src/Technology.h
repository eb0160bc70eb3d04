/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  Technology.h
  ----------------------------------------------------------------*/
#ifndef TECHNOLOGY_H
#define TECHNOLOGY_H

#include "MacawInclude.h"
#include "YearSeries.h"

///////////////////////////////////////////////////////////////////
/// \brief Fixed process segment (baseline band) into which technologies substitute
/// \details activity is a hard ceiling shared by all technologies targeting the band
//
class CBaselineBand
{
private:/*------------------------------------------------------*/
  string _id;         ///< unique band identifier
  double _activity;   ///< [units/yr] fixed annual activity
  double _intensity;  ///< [t/unit] fixed emission intensity

public:/*-------------------------------------------------------*/
  CBaselineBand(const string id, const double activity, const double intensity);
  ~CBaselineBand();

  string GetID        () const;
  double GetActivity  () const;
  double GetIntensity () const;
  double GetEmissions () const;
};

///////////////////////////////////////////////////////////////////
/// \brief Per-year cost data of a single technology
/// \details each series is sparse by year and resolved by CYearSeries
//
class CCostRecord
{
private:/*------------------------------------------------------*/
  CYearSeries *_pCapex;         ///< [cost/unit capacity] capital cost of new capacity
  CYearSeries *_pFixedOM;       ///< [cost/unit] fixed operating cost per unit production
  CYearSeries *_pVariableOM;    ///< [cost/unit] variable operating cost per unit production
  CYearSeries *_pFuelPremium;   ///< [cost/unit] optional fuel cost premium per unit production

public:/*-------------------------------------------------------*/
  CCostRecord(const string tech_id);
  ~CCostRecord();

  void   AddYear          (const int year, const double capex, const double fixed_om,
                           const double variable_om, const double fuel);
  void   AddYear          (const int year, const double capex, const double fixed_om,
                           const double variable_om);
  bool   IsEmpty          () const;
  int    GetNumYears      () const;
  double GetMinimumValue  () const;

  double GetCapitalCost   (const int year, const extrap_policy policy) const;
  double GetOperatingCost (const int year, const extrap_policy policy) const;
};

///////////////////////////////////////////////////////////////////
/// \brief Abatement technology
/// \details immutable once loaded for a run
//
class CTechnology
{
private:/*------------------------------------------------------*/
  string       _id;               ///< unique technology identifier
  string       _band_id;          ///< identifier of baseline band substituted
  int          _band_index;       ///< index of baseline band in model (set by CPathwayModel::Initialize)
  int          _lifetime;         ///< [yr] operating lifetime (DOESNT_EXIST if not given)
  int          _commercial_year;  ///< first year in which installation is permitted (DOESNT_EXIST: no restriction)
  double       _ramp_rate;        ///< [share/yr] maximum new capacity per year as share of band activity (NOT_SPECIFIED: configuration default)

  CYearSeries *_pAdoptionCap;     ///< [-] maximum in-service share of band activity
  CYearSeries *_pAbatementFactor; ///< [t/unit] emission reduction per unit production
  CCostRecord *_pCosts;           ///< cost data (NULL until :CostTable is read)

public:/*-------------------------------------------------------*/
  CTechnology(const string id);
  ~CTechnology();

  //Accessors
  string       GetID               () const;
  string       GetBandID           () const;
  int          GetBandIndex        () const;
  int          GetLifetime         () const;
  int          GetCommercialYear   () const;
  bool         HasRampRate         () const;
  double       GetRampRate         (const optStruct &Options) const;
  double       GetAdoptionCap      (const int year, const extrap_policy policy) const;
  double       GetAbatementFactor  (const int year, const extrap_policy policy) const;
  const CYearSeries *GetAdoptionCapSeries     () const;
  const CYearSeries *GetAbatementFactorSeries () const;
  const CCostRecord *GetCosts        () const;
  bool         IsAvailable         (const int year) const;

  double       GetLevelizedCostOfAbatement(const int year, const optStruct &Options) const;

  //Manipulators
  void         SetBandID           (const string band_id);
  void         SetBandIndex        (const int b);
  void         SetLifetime         (const int L);
  void         SetCommercialYear   (const int year);
  void         SetRampRate         (const double ramp);
  void         AddAdoptionCap      (const int year, const double cap);
  void         AddAbatementFactor  (const int year, const double factor);
  CCostRecord *GetCostRecord       ();
};

#endif
