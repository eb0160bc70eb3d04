/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  VintageMap.h
  ----------------------------------------------------------------*/
#ifndef VINTAGEMAP_H
#define VINTAGEMAP_H

#include "MacawInclude.h"

///////////////////////////////////////////////////////////////////
/// \brief Precomputed vintaging index map
/// \details for each (technology i, model year index k), stores the model year
///   indices whose installations are still in service in year k. Since model
///   years are ascending, these always form a contiguous block [first,k] of
///   year indices, so only the first in-service index is stored.
///
///   window policy VINTAGE_EXCLUSIVE: installed in tau is in service in t if 0 <= t-tau <  L
///   window policy VINTAGE_INCLUSIVE: installed in tau is in service in t if 0 <= t-tau <= L
//
class CVintageMap
{
private:/*------------------------------------------------------*/
  int            _nTechs;     ///< number of technologies
  int            _nYears;     ///< number of model years
  int           *_aYears;     ///< array of model years [size: _nYears]
  int           *_aLifetimes; ///< array of technology lifetimes [size: _nTechs]
  int          **_aFirst;     ///< first in-service installation year index [size: _nTechs x _nYears]
  vintage_window _policy;     ///< lifetime boundary policy

  CVintageMap(const CVintageMap &v); //suppresses default copy constructor

public:/*-------------------------------------------------------*/
  CVintageMap(const int *aYears, const int nYears, const int *aLifetimes, const int nTechs, const vintage_window policy);
  ~CVintageMap();

  int            GetNumTechs        () const;
  int            GetNumYears        () const;
  vintage_window GetPolicy          () const;

  int    GetFirstInService   (const int i, const int k) const;
  int    GetNumInService     (const int i, const int k) const;
  int    GetInServiceIndex   (const int i, const int k, const int j) const;
  bool   IsInService         (const int i, const int k_installed, const int k) const;

  double GetInServiceCapacity(const int i, const int k, const double *aInstall) const;
};

#endif
