/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  ConstraintAssembly.cpp: structural constraints of pathway LP
  ----------------------------------------------------------------*/
#include "PathwayProblem.h"

//////////////////////////////////////////////////////////////////
/// \brief assembles decision variable bounds and all structural constraint rows
/// \details
///  column bounds:
///   - start-year gate: NEW(i,t) fixed to [0,0] for t < commercial year
///   - ramp limit:      NEW(i,t) <= ramp(i) * activity(band(i))
///   - adoption cap:    CAP(i,t) <= cap(i,t) * activity(band(i))
///  rows:
///   - VINTAGE: CAP(i,t) - sum_{tau in W(i,t)} NEW(i,tau) == 0
///   - PRODLIM: PROD(i,t) - CAP(i,t) <= 0
///   - BAND:    sum_{i in b} PROD(i,t) <= activity(b)
///   - ABATE:   ABAT(i,t) - factor(i,t) * PROD(i,t) == 0
///   - TARGET:  sum_i ABAT(i,t) {+ SHORT(t)} >= required(t)
///   - EXCL:    sum_{i in G} CAP(i,t)/activity(band(i)) <= 1
///   - COUPLE:  CAP(s,t)/activity(band(s)) - CAP(p,t)/activity(band(p)) >= 0
///  every row is written for every model year
//
void CPathwayProblem::AssembleConstraints()
{
  int i,k,b,j,g,c;
  int     nMax=max(max(_nTechs,_nYears),2)+1;
  int    *col_ind=new int   [nMax];
  double *row_val=new double[nMax];

  // columns: names and bounds
  // ----------------------------------------------------------------
  for (i=0;i<_nTechs;i++)
  {
    double activity=_aActivity[_aBandOf[i]];
    for (k=0;k<_nYears;k++)
    {
      int col=GetDVColumnInd(DV_INSTALL,i,k);
      if (IsInstallAllowed(i,k)){_pLP->SetColumn(col,GetColumnName(DV_INSTALL,i,k),0.0,_aRamp[i],0.0);}
      else                      {_pLP->SetColumn(col,GetColumnName(DV_INSTALL,i,k),0.0,0.0     ,0.0);}

      _pLP->SetColumn(GetDVColumnInd(DV_CAPACITY  ,i,k),GetColumnName(DV_CAPACITY  ,i,k),0.0,_aCap[i][k]*activity,0.0);
      _pLP->SetColumn(GetDVColumnInd(DV_PRODUCTION,i,k),GetColumnName(DV_PRODUCTION,i,k),0.0,ALMOST_INF,0.0);
      _pLP->SetColumn(GetDVColumnInd(DV_ABATEMENT ,i,k),GetColumnName(DV_ABATEMENT ,i,k),0.0,ALMOST_INF,0.0);
    }
  }
  if (HasShortfall()){
    for (k=0;k<_nYears;k++){
      _pLP->SetColumn(GetDVColumnInd(DV_SHORTFALL,0,k),GetColumnName(DV_SHORTFALL,0,k),0.0,ALMOST_INF,0.0);
    }
  }

  // Vintaging: in-service capacity is exactly the sum of installations within the lifetime window
  // ----------------------------------------------------------------
  for (i=0;i<_nTechs;i++)
  {
    for (k=0;k<_nYears;k++)
    {
      int n=0;
      col_ind[n]=GetDVColumnInd(DV_CAPACITY,i,k); row_val[n]=1.0; n++;
      for (j=0;j<_pVintage->GetNumInService(i,k);j++){
        col_ind[n]=GetDVColumnInd(DV_INSTALL,i,_pVintage->GetInServiceIndex(i,k,j));
        row_val[n]=-1.0;
        n++;
      }
      _pLP->AddRow("VINTAGE_"+_aTechIDs[i]+"_"+to_string(_aYears[k]),n,col_ind,row_val,ROW_EQ,0.0);
    }
  }

  // Production limited by in-service capacity
  // ----------------------------------------------------------------
  for (i=0;i<_nTechs;i++)
  {
    for (k=0;k<_nYears;k++)
    {
      col_ind[0]=GetDVColumnInd(DV_PRODUCTION,i,k); row_val[0]=+1.0;
      col_ind[1]=GetDVColumnInd(DV_CAPACITY  ,i,k); row_val[1]=-1.0;
      _pLP->AddRow("PRODLIM_"+_aTechIDs[i]+"_"+to_string(_aYears[k]),2,col_ind,row_val,ROW_LE,0.0);
    }
  }

  // Band mass balance: ceiling on total substituted production, never an equality
  // ----------------------------------------------------------------
  for (b=0;b<_nBands;b++)
  {
    for (k=0;k<_nYears;k++)
    {
      int n=0;
      for (i=0;i<_nTechs;i++){
        if (_aBandOf[i]==b){col_ind[n]=GetDVColumnInd(DV_PRODUCTION,i,k); row_val[n]=1.0; n++;}
      }
      if (n==0){break;}//no technologies substitute into band
      _pLP->AddRow("BAND_"+_aBandIDs[b]+"_"+to_string(_aYears[k]),n,col_ind,row_val,ROW_LE,_aActivity[b]);
    }
  }

  // Abatement: direct linear product of production and (parametric) abatement factor
  // ----------------------------------------------------------------
  for (i=0;i<_nTechs;i++)
  {
    for (k=0;k<_nYears;k++)
    {
      col_ind[0]=GetDVColumnInd(DV_ABATEMENT ,i,k); row_val[0]=1.0;
      col_ind[1]=GetDVColumnInd(DV_PRODUCTION,i,k); row_val[1]=-_aFactor[i][k];
      _pLP->AddRow("ABATE_"+_aTechIDs[i]+"_"+to_string(_aYears[k]),2,col_ind,row_val,ROW_EQ,0.0);
    }
  }

  // Target achievement, with shortfall slack only if enabled
  // ----------------------------------------------------------------
  for (k=0;k<_nYears;k++)
  {
    int n=0;
    for (i=0;i<_nTechs;i++){
      col_ind[n]=GetDVColumnInd(DV_ABATEMENT,i,k); row_val[n]=1.0; n++;
    }
    if (HasShortfall()){
      col_ind[n]=GetDVColumnInd(DV_SHORTFALL,0,k); row_val[n]=1.0; n++;
    }
    _pLP->AddRow("TARGET_"+to_string(_aYears[k]),n,col_ind,row_val,ROW_GE,_aRequired[k]);
  }

  // Mutual exclusivity: combined share of group <= 1
  // ----------------------------------------------------------------
  for (g=0;g<_nGroups;g++)
  {
    for (k=0;k<_nYears;k++)
    {
      for (j=0;j<_aGroupSize[g];j++)
      {
        i=_aGroups[g][j];
        col_ind[j]=GetDVColumnInd(DV_CAPACITY,i,k);
        row_val[j]=1.0/_aActivity[_aBandOf[i]];
      }
      _pLP->AddRow("EXCL_"+to_string(g+1)+"_"+to_string(_aYears[k]),_aGroupSize[g],col_ind,row_val,ROW_LE,1.0);
    }
  }

  // Coupling: share(secondary) >= share(primary) in every year
  // ----------------------------------------------------------------
  for (c=0;c<_nCouplings;c++)
  {
    int p=_aPrimary[c];
    int s=_aSecondary[c];
    for (k=0;k<_nYears;k++)
    {
      col_ind[0]=GetDVColumnInd(DV_CAPACITY,s,k); row_val[0]=+1.0/_aActivity[_aBandOf[s]];
      col_ind[1]=GetDVColumnInd(DV_CAPACITY,p,k); row_val[1]=-1.0/_aActivity[_aBandOf[p]];
      _pLP->AddRow("COUPLE_"+_aTechIDs[p]+"_"+_aTechIDs[s]+"_"+to_string(_aYears[k]),2,col_ind,row_val,ROW_GE,0.0);
    }
  }

  delete [] col_ind;
  delete [] row_val;
}
