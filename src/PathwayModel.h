/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  PathwayModel.h
  ----------------------------------------------------------------*/
#ifndef PATHWAY_MODEL_H
#define PATHWAY_MODEL_H

#include "MacawInclude.h"
#include "YearSeries.h"
#include "Technology.h"
#include "TechLinks.h"

class CPathwayResults;
class CSolverAdapter;

///////////////////////////////////////////////////////////////////
/// \brief Container of all validated input entities of a pathway run
/// \details entities are added while parsing, checked by CheckModelData(), then
///   resolved against each other by Initialize(). After initialization the model
///   is read-only; Run() is const and may be called concurrently from sweep workers,
///   each with its own run options.
//
class CPathwayModel
{
private:/*------------------------------------------------------*/
  CBaselineBand **_pBands;              ///< array of pointers to baseline bands [size: _nBands]
  int             _nBands;              ///< number of baseline bands
  CTechnology   **_pTechs;              ///< array of pointers to technologies [size: _nTechs]
  int             _nTechs;              ///< number of technologies
  CTechLink     **_pLinks;              ///< array of pointers to technology links [size: _nLinks]
  int             _nLinks;              ///< number of links
  CYearSeries    *_pTargets;            ///< [t/yr] absolute emission ceiling by year
  double          _baseline_override;   ///< [t/yr] baseline emissions given directly (NOT_SPECIFIED: computed from bands)
  bool            _initialized;         ///< true once Initialize() has resolved all references

public:/*-------------------------------------------------------*/
  CPathwayModel();
  ~CPathwayModel();

  //Accessors
  int                  GetNumBands          () const;
  int                  GetNumTechnologies   () const;
  int                  GetNumLinks          () const;
  const CBaselineBand *GetBand              (const int b) const;
  const CTechnology   *GetTechnology        (const int i) const;
  const CTechLink     *GetLink              (const int l) const;
  const CYearSeries   *GetTargets           () const;
  int                  GetBandIndex         (const string id) const;
  int                  GetTechIndex         (const string id) const;
  double               GetBaselineEmissions () const;
  bool                 HasBaselineOverride  () const;
  bool                 IsInitialized        () const;

  //Manipulators (used while parsing)
  void                 AddBand              (CBaselineBand *pBand);
  void                 AddTechnology        (CTechnology *pTech);
  void                 AddLink              (CTechLink *pLink);
  void                 AddTarget            (const int year, const double ceiling);
  void                 SetBaselineEmissions (const double emissions);
  CTechnology         *GetTechnologyToModify(const int i);

  void                 Initialize           (const optStruct &Options);
  void                 SummarizeToScreen    (const optStruct &Options) const;

  CPathwayResults     *Run                  (const optStruct &Options, const CSolverAdapter &Adapter,
                                             const atomic<bool> *pCancel) const;
};

//Defined in ModelDataCheck.cpp
void CheckOptions  (const optStruct &Options);
void CheckModelData(const CPathwayModel *pModel, const optStruct &Options);
int  CheckTargetFeasibility(const CPathwayModel *pModel, const optStruct &Options);

//Defined in ParseInput.cpp
bool ParseInputFiles(CPathwayModel *&pModel, optStruct &Options);

#endif
