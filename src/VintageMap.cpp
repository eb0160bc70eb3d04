/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include "VintageMap.h"

//////////////////////////////////////////////////////////////////
/// \brief Constructor; builds index map
///
/// \param *aYears [in] ascending model years [size: nYears]
/// \param nYears [in] number of model years
/// \param *aLifetimes [in] technology lifetimes [size: nTechs], each >=1
/// \param nTechs [in] number of technologies
/// \param policy [in] lifetime boundary policy
//
CVintageMap::CVintageMap(const int *aYears, const int nYears, const int *aLifetimes, const int nTechs, const vintage_window policy)
{
  int i,k;
  ExitGracefullyIf(nYears<1,"CVintageMap: no model years",BAD_DATA);

  _nTechs    =nTechs;
  _nYears    =nYears;
  _policy    =policy;
  _aYears    =new int[_nYears];
  _aLifetimes=new int[_nTechs];
  for (k=0;k<_nYears;k++){
    _aYears[k]=aYears[k];
    if (k>0){ExitGracefullyIf(_aYears[k]<=_aYears[k-1],"CVintageMap: model years must be ascending and unique",RUNTIME_ERR);}
  }
  for (i=0;i<_nTechs;i++){
    ExitGracefullyIf(aLifetimes[i]<1,"CVintageMap: technology lifetime must be at least one year",BAD_DATA);
    _aLifetimes[i]=aLifetimes[i];
  }

  _aFirst=new int *[_nTechs];
  for (i=0;i<_nTechs;i++)
  {
    _aFirst[i]=new int[_nYears];
    int first=0;
    for (k=0;k<_nYears;k++)
    {
      //first only moves forward as k increases
      while (!IsInService(i,first,k)){first++;}
      _aFirst[i][k]=first;
    }
  }
}
//////////////////////////////////////////////////////////////////
CVintageMap::~CVintageMap()
{
  for (int i=0;i<_nTechs;i++){delete [] _aFirst[i];}
  delete [] _aFirst;     _aFirst=NULL;
  delete [] _aYears;     _aYears=NULL;
  delete [] _aLifetimes; _aLifetimes=NULL;
}
//////////////////////////////////////////////////////////////////
int            CVintageMap::GetNumTechs() const {return _nTechs;}
int            CVintageMap::GetNumYears() const {return _nYears;}
vintage_window CVintageMap::GetPolicy  () const {return _policy;}

//////////////////////////////////////////////////////////////////
/// \brief true if installation made in model year k_installed by technology i is in service in model year k
//
bool CVintageMap::IsInService(const int i, const int k_installed, const int k) const
{
  int age=_aYears[k]-_aYears[k_installed];
  if (age<0){return false;}
  if (_policy==VINTAGE_INCLUSIVE){return (age<=_aLifetimes[i]);}
  return (age<_aLifetimes[i]);
}
//////////////////////////////////////////////////////////////////
/// \brief index of earliest model year whose installations are in service in year k
//
int CVintageMap::GetFirstInService(const int i, const int k) const
{
  return _aFirst[i][k];
}
//////////////////////////////////////////////////////////////////
/// \brief number of model years whose installations are in service in year k
//
int CVintageMap::GetNumInService(const int i, const int k) const
{
  return k-_aFirst[i][k]+1;
}
//////////////////////////////////////////////////////////////////
/// \brief j-th model year index whose installations are in service in year k
//
int CVintageMap::GetInServiceIndex(const int i, const int k, const int j) const
{
  return _aFirst[i][k]+j;
}

//////////////////////////////////////////////////////////////////
/// \brief in-service capacity of technology i in model year k
///
/// \param i [in] technology index
/// \param k [in] model year index
/// \param *aInstall [in] installations of technology i by model year index [size: _nYears]
/// \return sum of installations within lifetime window
//
double CVintageMap::GetInServiceCapacity(const int i, const int k, const double *aInstall) const
{
  double sum=0.0;
  for (int kk=_aFirst[i][k];kk<=k;kk++){sum+=aInstall[kk];}
  return sum;
}
