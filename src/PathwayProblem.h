/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  PathwayProblem.h
  ----------------------------------------------------------------*/
#ifndef PATHWAY_PROBLEM_H
#define PATHWAY_PROBLEM_H

#include "MacawInclude.h"
#include "PathwayModel.h"
#include "VintageMap.h"
#include "LinearProgram.h"

///////////////////////////////////////////////////////////////////
/// \brief decision variable types
//
enum dv_type
{
  DV_INSTALL,    ///< new capacity installed in year
  DV_CAPACITY,   ///< in-service capacity in year
  DV_PRODUCTION, ///< production (substituted band activity) in year
  DV_ABATEMENT,  ///< emission abatement in year
  DV_SHORTFALL   ///< unmet required abatement in year (only with slack enabled)
};

///////////////////////////////////////////////////////////////////
/// \brief Time-indexed linear program of a single pathway run
/// \details On construction, all sparse input data of the model are resolved onto
///   the model years (the run's own copy of its parameters). Build() then assembles
///   the constraint set (ConstraintAssembly.cpp) and the discounted objective
///   (Objective.cpp). Run options are copied, so that concurrent runs never share
///   mutable state.
//
class CPathwayProblem
{
private:/*------------------------------------------------------*/
  optStruct       _Options;        ///< run options (own copy)
  solve_status    _status;         ///< run state

  int             _nYears;         ///< number of model years
  int            *_aYears;         ///< model years [size: _nYears]
  int             _base_year;      ///< discounting anchor year
  int             _nTechs;         ///< number of technologies
  int             _nBands;         ///< number of baseline bands

  string         *_aTechIDs;       ///< technology identifiers [size: _nTechs]
  string         *_aBandIDs;       ///< band identifiers [size: _nBands]
  int            *_aBandOf;        ///< band index of each technology [size: _nTechs]
  int            *_aLifetime;      ///< [yr] technology lifetime [size: _nTechs]
  int            *_aCommYear;      ///< commercialization year (DOESNT_EXIST: none) [size: _nTechs]
  double         *_aRamp;          ///< [units/yr] absolute ramp limit [size: _nTechs]
  double         *_aCRF;           ///< [1/yr] capital recovery factor [size: _nTechs]
  double         *_aActivity;      ///< [units/yr] band activity [size: _nBands]
  double         *_aIntensity;     ///< [t/unit] band emission intensity [size: _nBands]

  double        **_aCap;           ///< [-] adoption cap [_nTechs x _nYears]
  double        **_aFactor;        ///< [t/unit] abatement factor [_nTechs x _nYears]
  double        **_aCapex;         ///< [cost/unit] capital cost [_nTechs x _nYears]
  double        **_aOpCost;        ///< [cost/unit] operating cost per unit production [_nTechs x _nYears]

  double          _baseline;       ///< [t/yr] baseline emissions
  double         *_aTarget;        ///< [t/yr] emission ceiling [size: _nYears]
  double         *_aRequired;      ///< [t/yr] required abatement [size: _nYears]
  double         *_aDF;            ///< [-] discount factor [size: _nYears]

  int             _nGroups;        ///< number of mutual exclusivity groups
  int           **_aGroups;        ///< technology indices of each group [_nGroups x _aGroupSize[g]]
  int            *_aGroupSize;     ///< size of each group [size: _nGroups]
  int             _nCouplings;     ///< number of coupling pairs
  int            *_aPrimary;       ///< primary technology of each coupling [size: _nCouplings]
  int            *_aSecondary;     ///< secondary technology of each coupling [size: _nCouplings]

  CVintageMap    *_pVintage;       ///< vintaging index map
  CLinearProgram *_pLP;            ///< assembled linear program (NULL until Build())

  void   ResolveParameters   (const CPathwayModel *pModel);
  void   CheckResolvedValues (const int i) const;
  void   DeleteArrays        ();
  void   AssembleConstraints ();
  void   BuildObjective      ();
  string GetColumnName       (const dv_type typ, const int i, const int k) const;

  CPathwayProblem(const CPathwayProblem &P); //suppresses default copy constructor

public:/*-------------------------------------------------------*/
  CPathwayProblem(const CPathwayModel *pModel, const optStruct &Options);
  ~CPathwayProblem();

  void                  Build               ();

  //Accessors
  const optStruct      &GetOptions          () const;
  solve_status          GetStatus           () const;
  void                  SetStatus           (const solve_status stat);
  const CLinearProgram &GetLP               () const;
  const CVintageMap    &GetVintageMap       () const;

  int    GetNumYears         () const;
  int    GetYear             (const int k) const;
  int    GetYearIndex        (const int year) const;
  int    GetBaseYear         () const;
  int    GetNumTechs         () const;
  int    GetNumBands         () const;
  string GetTechID           (const int i) const;
  string GetBandID           (const int b) const;
  int    GetBandOf           (const int i) const;
  int    GetLifetime         (const int i) const;
  double GetActivity         (const int b) const;
  double GetIntensity        (const int b) const;
  double GetRampLimit        (const int i) const;
  double GetAdoptionCap      (const int i, const int k) const;
  double GetAbatementFactor  (const int i, const int k) const;
  double GetCapitalCost      (const int i, const int k) const;
  double GetOperatingCost    (const int i, const int k) const;
  double GetCRF              (const int i) const;
  double GetDiscountFactor   (const int k) const;
  double GetBaselineEmissions() const;
  double GetTarget           (const int k) const;
  double GetRequiredAbatement(const int k) const;
  double GetLCOA             (const int i, const int k) const;
  bool   IsInstallAllowed    (const int i, const int k) const;
  bool   HasShortfall        () const;

  int    GetNumGroups        () const;
  int    GetGroupSize        (const int g) const;
  int    GetGroupMember      (const int g, const int j) const;
  int    GetNumCouplings     () const;
  int    GetCouplingPrimary  (const int c) const;
  int    GetCouplingSecondary(const int c) const;

  int    GetNumDecisionVars  () const;
  int    GetDVColumnInd      (const dv_type typ, const int i, const int k) const;
};

#endif
