/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  PathwayResults.h
  ----------------------------------------------------------------*/
#ifndef PATHWAY_RESULTS_H
#define PATHWAY_RESULTS_H

#include "MacawInclude.h"
#include "PathwayProblem.h"
#include "SolverAdapter.h"

///////////////////////////////////////////////////////////////////
/// \brief Solved deployment pathway on the technology/year grid
/// \details holds the terminal status of a run and, if optimal, per-technology
///   annual installation, in-service capacity, share, production, abatement and
///   cost contribution, plus annual target, shortfall and emissions totals.
///   Independent of the problem it was extracted from.
//
class CPathwayResults
{
private:/*------------------------------------------------------*/
  solve_status _status;        ///< terminal run status
  string       _backend;       ///< solver backend that produced result
  string       _message;       ///< backend diagnostic message
  double       _objective;     ///< objective function value (discounted net present cost)
  double       _discount_rate; ///< discount rate of run

  int          _nYears;        ///< number of model years
  int          _nTechs;        ///< number of technologies
  int          _nBands;        ///< number of baseline bands
  int         *_aYears;        ///< model years [size: _nYears]
  string      *_aTechIDs;      ///< technology identifiers [size: _nTechs]
  string      *_aBandIDs;      ///< band identifiers [size: _nBands]
  int         *_aBandOf;       ///< band index of technology [size: _nTechs]
  double      *_aActivity;     ///< band activity [size: _nBands]

  double     **_aInstalled;    ///< new capacity [_nTechs x _nYears]
  double     **_aCapacity;     ///< in-service capacity [_nTechs x _nYears]
  double     **_aShare;        ///< in-service share of band activity [_nTechs x _nYears]
  double     **_aProduction;   ///< production [_nTechs x _nYears]
  double     **_aAbatement;    ///< abatement [_nTechs x _nYears]
  double     **_aAnnualCost;   ///< annualized capital + operating cost [_nTechs x _nYears]
  double     **_aDiscCost;     ///< discounted cost contribution [_nTechs x _nYears]
  double     **_aLCOA;         ///< levelized cost of abatement [_nTechs x _nYears]
  double     **_aResidual;     ///< residual (unsubstituted) band production [_nBands x _nYears]

  double       _baseline;      ///< baseline emissions
  double      *_aTarget;       ///< emission ceiling [size: _nYears]
  double      *_aRequired;     ///< required abatement [size: _nYears]
  double      *_aAchieved;     ///< achieved abatement [size: _nYears]
  double      *_aShortfall;    ///< shortfall [size: _nYears]
  double      *_aEmissions;    ///< resulting emissions [size: _nYears]
  double      *_aYearCost;     ///< total discounted cost [size: _nYears]

  double       _max_row_violation; ///< largest LP row violation of solution
  string       _worst_row;         ///< name of most violated LP row

  void         Extract         (const CPathwayProblem &P, const arma::vec &x);

  CPathwayResults(const CPathwayResults &R); //suppresses default copy constructor

public:/*-------------------------------------------------------*/
  CPathwayResults(const CPathwayProblem &P, const solve_outcome &out);
  ~CPathwayResults();

  void         CheckConsistency(const CPathwayProblem &P, const double tol) const;

  //Accessors
  solve_status GetStatus          () const;
  string       GetBackend         () const;
  string       GetMessage         () const;
  double       GetObjective       () const;
  double       GetDiscountRate    () const;
  bool         IsOptimal          () const;
  int          GetNumYears        () const;
  int          GetNumTechs        () const;
  int          GetNumBands        () const;
  int          GetYear            (const int k) const;
  string       GetTechID          (const int i) const;
  string       GetBandID          (const int b) const;
  int          GetTechIndex       (const string id) const;

  double       GetInstalled       (const int i, const int k) const;
  double       GetCapacity        (const int i, const int k) const;
  double       GetShare           (const int i, const int k) const;
  double       GetProduction      (const int i, const int k) const;
  double       GetAbatement       (const int i, const int k) const;
  double       GetAnnualizedCost  (const int i, const int k) const;
  double       GetDiscountedCost  (const int i, const int k) const;
  double       GetLCOA            (const int i, const int k) const;
  double       GetResidualActivity(const int b, const int k) const;

  double       GetBaselineEmissions() const;
  double       GetTarget          (const int k) const;
  double       GetRequired        (const int k) const;
  double       GetAchieved        (const int k) const;
  double       GetShortfall       (const int k) const;
  double       GetEmissions       (const int k) const;
  double       GetTotalShortfall  () const;
  double       GetMaxRowViolation () const;

  //Output (PathwayOutput.cpp)
  void         WriteOutput        (const optStruct &Options) const;
  void         WriteCSVOutput     (const optStruct &Options) const;
  void         WriteSolveStatus   (const optStruct &Options) const;
  void         WriteMACCCurve     (const optStruct &Options) const;
  void         WriteNetCDFOutput  (const optStruct &Options) const;
  void         SummarizeToScreen  (const optStruct &Options) const;
};

#endif
