/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include "YearSeries.h"

//////////////////////////////////////////////////////////////////
/// \brief Constructor of empty year series
/// \param name [in] series name
//
CYearSeries::CYearSeries(const string name)
{
  _name   =name;
  _aYears =NULL;
  _aValues=NULL;
  _nPoints=0;
}
//////////////////////////////////////////////////////////////////
/// \brief Destructor
//
CYearSeries::~CYearSeries()
{
  delete [] _aYears;  _aYears =NULL;
  delete [] _aValues; _aValues=NULL;
}

//////////////////////////////////////////////////////////////////
/// \brief Adds known point to series, preserving ascending year order
/// \details a point for an already known year replaces the existing value
///
/// \param year [in] calendar year
/// \param value [in] value in year
//
void CYearSeries::AddPoint(const int year, const double value)
{
  int i;
  for (i=0;i<_nPoints;i++){
    if (_aYears[i]==year){_aValues[i]=value; return;}
  }

  int    *tmpY=new int   [_nPoints+1];
  double *tmpV=new double[_nPoints+1];
  int n=0;
  bool inserted=false;
  for (i=0;i<_nPoints;i++)
  {
    if ((!inserted) && (year<_aYears[i])){
      tmpY[n]=year; tmpV[n]=value; n++; inserted=true;
    }
    tmpY[n]=_aYears[i]; tmpV[n]=_aValues[i]; n++;
  }
  if (!inserted){tmpY[n]=year; tmpV[n]=value;}

  delete [] _aYears;
  delete [] _aValues;
  _aYears =tmpY;
  _aValues=tmpV;
  _nPoints++;
}

//////////////////////////////////////////////////////////////////
string CYearSeries::GetName     () const {return _name;}
int    CYearSeries::GetNumPoints() const {return _nPoints;}
//////////////////////////////////////////////////////////////////
int CYearSeries::GetYear(const int n) const
{
  ExitGracefullyIf((n<0) || (n>=_nPoints),"CYearSeries::GetYear: bad index",RUNTIME_ERR);
  return _aYears[n];
}
//////////////////////////////////////////////////////////////////
double CYearSeries::GetPoint(const int n) const
{
  ExitGracefullyIf((n<0) || (n>=_nPoints),"CYearSeries::GetPoint: bad index",RUNTIME_ERR);
  return _aValues[n];
}
//////////////////////////////////////////////////////////////////
/// \brief returns minimum of known values (0 if series empty)
//
double CYearSeries::GetMinValue() const
{
  if (_nPoints==0){return 0.0;}
  double v=_aValues[0];
  for (int i=1;i<_nPoints;i++){lowerswap(v,_aValues[i]);}
  return v;
}
//////////////////////////////////////////////////////////////////
/// \brief returns maximum of known values (0 if series empty)
//
double CYearSeries::GetMaxValue() const
{
  if (_nPoints==0){return 0.0;}
  double v=_aValues[0];
  for (int i=1;i<_nPoints;i++){upperswap(v,_aValues[i]);}
  return v;
}

//////////////////////////////////////////////////////////////////
/// \brief returns value of series in year
/// \details linear interpolation between known years; outside of known range,
///   policy EXTRAP_FLAT returns nearest known value and EXTRAP_LINEAR extends
///   the slope of the first or last segment (flat if only one point is known)
///
/// \param year [in] calendar year
/// \param policy [in] extrapolation policy
/// \return value in year
//
double CYearSeries::GetValue(const int year, const extrap_policy policy) const
{
  if (_nPoints==0){
    string warn="CYearSeries::GetValue: no known values in series "+_name+" from which to resolve year "+to_string(year);
    ExitGracefully(warn.c_str(),DATA_GAP);
  }
  if (_nPoints==1){return _aValues[0];}

  int i;
  if (year<=_aYears[0])
  {
    if ((policy==EXTRAP_FLAT) || (year==_aYears[0])){return _aValues[0];}
    i=0;
  }
  else if (year>=_aYears[_nPoints-1])
  {
    if ((policy==EXTRAP_FLAT) || (year==_aYears[_nPoints-1])){return _aValues[_nPoints-1];}
    i=_nPoints-2;
  }
  else
  {
    //binary search for interval [_aYears[i],_aYears[i+1]) containing year
    int lo=0,hi=_nPoints-1;
    while (hi-lo>1){
      int mid=(lo+hi)/2;
      if (_aYears[mid]<=year){lo=mid;}
      else                   {hi=mid;}
    }
    i=lo;
    if (_aYears[i]==year){return _aValues[i];}
  }
  double w=(double)(year-_aYears[i])/(double)(_aYears[i+1]-_aYears[i]);
  return _aValues[i]+w*(_aValues[i+1]-_aValues[i]);
}

//////////////////////////////////////////////////////////////////
/// \brief resolves dense values of series for each model year
///
/// \param *aYears [in] array of model years [size: nYears]
/// \param nYears [in] number of model years
/// \param *aOut [out] array of resolved values [size: nYears]
/// \param policy [in] extrapolation policy
//
void CYearSeries::Resolve(const int *aYears, const int nYears, double *aOut, const extrap_policy policy) const
{
  if (_nPoints==0){
    string warn="CYearSeries::Resolve: series "+_name+" has no known years";
    ExitGracefully(warn.c_str(),DATA_GAP);
  }
  for (int k=0;k<nYears;k++){
    aOut[k]=GetValue(aYears[k],policy);
  }
}
