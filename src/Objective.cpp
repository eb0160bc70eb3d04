/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  Objective.cpp: discounted net present cost of pathway LP
  ----------------------------------------------------------------*/
#include "PathwayProblem.h"

//////////////////////////////////////////////////////////////////
/// \brief builds objective function coefficients
/// \details minimizes
///   sum_t DF(t) * [ sum_i ( annualized capital cost(i,t) + opcost(i,t)*PROD(i,t) ) + penalty*SHORT(t) ]
///   where DF(t)=(1+r)^-(t-base year) and
///   annualized capital cost(i,t) = CRF(L_i,r) * sum_{tau in W(i,t)} capex(i,tau)*NEW(i,tau).
///   Collecting terms by column, NEW(i,tau) carries CRF*capex(i,tau) times the sum of
///   discount factors of every model year in which that installation is in service.
///   The annuity is charged only for in-service years inside the horizon.
//
void CPathwayProblem::BuildObjective()
{
  int i,k,kk;
  for (i=0;i<_nTechs;i++)
  {
    for (k=0;k<_nYears;k++)
    {
      // capital recovery of installation made in year k
      // --------------------------------------------------------------
      if (IsInstallAllowed(i,k))
      {
        double sumDF=0.0;
        for (kk=k;kk<_nYears;kk++){
          if (!_pVintage->IsInService(i,k,kk)){break;}
          sumDF+=_aDF[kk];
        }
        _pLP->AddToObjective(GetDVColumnInd(DV_INSTALL,i,k),sumDF*_aCRF[i]*_aCapex[i][k]);
      }

      // operating cost of production
      // --------------------------------------------------------------
      _pLP->AddToObjective(GetDVColumnInd(DV_PRODUCTION,i,k),_aDF[k]*_aOpCost[i][k]);
    }
  }

  // shortfall penalty
  // --------------------------------------------------------------
  if (HasShortfall())
  {
    for (k=0;k<_nYears;k++){
      _pLP->AddToObjective(GetDVColumnInd(DV_SHORTFALL,0,k),_aDF[k]*_Options.slack_penalty);
    }
  }
}
