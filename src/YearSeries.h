/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  YearSeries.h
  ----------------------------------------------------------------*/
#ifndef YEARSERIES_H
#define YEARSERIES_H

#include "MacawInclude.h"

///////////////////////////////////////////////////////////////////
/// \brief Sparse annual time series (year -> value)
/// \details Known points are held sorted by year. Values in between two
///   known years are linearly interpolated; values outside of the known range
///   follow the named extrapolation policy (EXTRAP_FLAT holds the nearest
///   known value, EXTRAP_LINEAR extends the nearest segment).
/// \remark GetValue() keeps no search state, so a single series may be
///   queried from several sweep workers at once
//
class CYearSeries
{
private:/*------------------------------------------------------*/
  string  _name;      ///< series name, used in error messages
  int    *_aYears;    ///< array of known years [size: _nPoints], ascending
  double *_aValues;   ///< array of known values [size: _nPoints]
  int     _nPoints;   ///< number of known points

  CYearSeries(const CYearSeries &ys); //suppresses default copy constructor

public:/*-------------------------------------------------------*/
  CYearSeries(const string name);
  ~CYearSeries();

  void   AddPoint     (const int year, const double value);

  string GetName      () const;
  int    GetNumPoints () const;
  int    GetYear      (const int n) const;
  double GetPoint     (const int n) const;
  double GetMinValue  () const;
  double GetMaxValue  () const;

  double GetValue     (const int year, const extrap_policy policy) const;
  void   Resolve      (const int *aYears, const int nYears, double *aOut, const extrap_policy policy) const;
};

#endif
