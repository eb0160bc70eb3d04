/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  ModelDataCheck.cpp: validation of run options and model data
  ----------------------------------------------------------------*/
#include "PathwayModel.h"

//////////////////////////////////////////////////////////////////
/// \brief checks run options for consistency
/// \details any violation is a data validation error (BAD_DATA)
///
/// \param &Options [in] run options
//
void CheckOptions(const optStruct &Options)
{
  vector<int> years;
  GetModelYears(Options,years);

  ExitGracefullyIf(years.empty(),
    "CheckOptions: no model years specified. Use :StartYear and :EndYear, or :ModelYears",BAD_DATA);
  ExitGracefullyIf((Options.model_years.empty()) && (Options.start_year>Options.end_year),
    "CheckOptions: :StartYear must not be later than :EndYear",BAD_DATA);
  ExitGracefullyIf(Options.discount_rate<0.0,
    "CheckOptions: :DiscountRate must be non-negative",BAD_DATA);
  ExitGracefullyIf(Options.slack_penalty<0.0,
    "CheckOptions: :SlackPenalty must be non-negative",BAD_DATA);
  ExitGracefullyIf(Options.solver_timeout<0.0,
    "CheckOptions: :SolverTimeout must be non-negative",BAD_DATA);
  ExitGracefullyIf(Options.consistency_tol<=0.0,
    "CheckOptions: :ConsistencyTolerance must be positive",BAD_DATA);
  ExitGracefullyIf(Options.default_ramp_rate<0.0,
    "CheckOptions: :DefaultRampRate must be non-negative",BAD_DATA);
  ExitGracefullyIf(Options.solver_order.empty(),
    "CheckOptions: :SolverOrder must name at least one solver backend",BAD_DATA);
  ExitGracefullyIf(Options.sweep_threads<0,
    "CheckOptions: :SweepThreads must be non-negative",BAD_DATA);
  for (size_t j=0;j<Options.sweep_discount_rates.size();j++){
    ExitGracefullyIf(Options.sweep_discount_rates[j]<0.0,
      "CheckOptions: :SensitivityDiscountRates must all be non-negative",BAD_DATA);
  }
  if ((Options.base_year!=DOESNT_EXIST) && ((Options.base_year<years[0]) || (Options.base_year>years[years.size()-1]))){
    WriteAdvisory("CheckOptions: :BaseYear lies outside the model horizon; discount factors may exceed one",Options.noisy);
  }
}

//////////////////////////////////////////////////////////////////
/// \brief checks model data for completeness and consistency
/// \details errors (BAD_DATA) terminate the run with the offending identifier in
///   the message. Suspicious but admissible data produce warnings.
///   Called before CPathwayModel::Initialize(), so references are checked by identifier.
///
/// \param *pModel [in] parsed model
/// \param &Options [in] run options
//
void CheckModelData(const CPathwayModel *pModel, const optStruct &Options)
{
  int b,i,l,j;
  string warn;

  ExitGracefullyIf(pModel==NULL,"CheckModelData: NULL model",RUNTIME_ERR);

  vector<int> years;
  GetModelYears(Options,years);
  int last_year=(years.empty()) ? 0 : years[years.size()-1];

  // baseline bands
  //----------------------------------------------------------------
  ExitGracefullyIf(pModel->GetNumBands()==0,"CheckModelData: no baseline bands (:BaselineBand) specified",BAD_DATA);
  for (b=0;b<pModel->GetNumBands();b++)
  {
    const CBaselineBand *pBand=pModel->GetBand(b);
    if (pModel->GetBandIndex(pBand->GetID())!=b){
      warn="CheckModelData: duplicate baseline band identifier "+pBand->GetID();
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
    if (pBand->GetActivity()<=0.0){
      warn="CheckModelData: baseline band "+pBand->GetID()+" must have positive activity";
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
    if (pBand->GetIntensity()<0.0){
      warn="CheckModelData: baseline band "+pBand->GetID()+" has negative emission intensity";
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
  }
  ExitGracefullyIf(pModel->GetBaselineEmissions()<0.0,"CheckModelData: baseline emissions must be non-negative",BAD_DATA);

  // emission targets
  //----------------------------------------------------------------
  const CYearSeries *pTargets=pModel->GetTargets();
  if ((pTargets->GetNumPoints()>0) && (pTargets->GetMinValue()<0.0)){
    ExitGracefully("CheckModelData: emission targets must be non-negative",BAD_DATA);
  }

  // technologies
  //----------------------------------------------------------------
  for (i=0;i<pModel->GetNumTechnologies();i++)
  {
    const CTechnology *pTech=pModel->GetTechnology(i);
    string id=pTech->GetID();

    if (pModel->GetTechIndex(id)!=i){
      warn="CheckModelData: duplicate technology identifier "+id;
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
    b=pModel->GetBandIndex(pTech->GetBandID());
    if (b==DOESNT_EXIST){
      warn="CheckModelData: technology "+id+" substitutes unknown baseline band \""+pTech->GetBandID()+"\"";
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
    if (pTech->GetLifetime()<1){
      warn="CheckModelData: technology "+id+" requires a :Lifetime of at least one year";
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
    const CYearSeries *pCap=pTech->GetAdoptionCapSeries();
    if ((pCap->GetNumPoints()>0) && ((pCap->GetMinValue()<0.0) || (pCap->GetMaxValue()>1.0))){
      warn="CheckModelData: adoption cap of technology "+id+" must lie between 0 and 1";
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
    const CYearSeries *pFactor=pTech->GetAbatementFactorSeries();
    if (pFactor->GetNumPoints()==0){
      warn="CheckModelData: technology "+id+" has no :AbatementFactor";
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
    if (pFactor->GetMinValue()<0.0){
      warn="CheckModelData: abatement factor of technology "+id+" must be non-negative";
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
    if ((pTech->GetCosts()==NULL) || (pTech->GetCosts()->IsEmpty())){
      warn="CheckModelData: no :CostTable provided for technology "+id;
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
    if (pTech->GetCosts()->GetMinimumValue()<0.0){
      warn="CheckModelData: cost table of technology "+id+" contains negative costs";
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
    if (pTech->HasRampRate() && (pTech->GetRampRate(Options)<0.0)){
      warn="CheckModelData: ramp rate of technology "+id+" must be non-negative";
      ExitGracefully(warn.c_str(),BAD_DATA);
    }

    //warnings
    if (pFactor->GetMaxValue()>pModel->GetBand(b)->GetIntensity()){
      warn="CheckModelData: abatement factor of technology "+id+" exceeds the emission intensity of band "+pTech->GetBandID();
      WriteWarning(warn,Options.noisy);
    }
    if (pTech->GetRampRate(Options)>1.0){
      warn="CheckModelData: ramp rate of technology "+id+" exceeds full band activity per year";
      WriteWarning(warn,Options.noisy);
    }
    if ((!years.empty()) && (pTech->GetCommercialYear()!=DOESNT_EXIST) && (pTech->GetCommercialYear()>last_year)){
      warn="CheckModelData: technology "+id+" only becomes commercial after the model horizon and will never be installed";
      WriteWarning(warn,Options.noisy);
    }
  }

  // technology links
  //----------------------------------------------------------------
  for (l=0;l<pModel->GetNumLinks();l++)
  {
    const CTechLink *pLink=pModel->GetLink(l);
    for (j=0;j<pLink->GetNumTechs();j++){
      if (pModel->GetTechIndex(pLink->GetTechID(j))==DOESNT_EXIST){
        warn="CheckModelData: "+pLink->GetTypeName()+" references unknown technology "+pLink->GetTechID(j);
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
    }
    if (pLink->GetType()==LINK_COUPLING)
    {
      if (pLink->GetNumTechs()!=2){
        ExitGracefully("CheckModelData: :Coupling requires exactly one primary and one secondary technology",BAD_DATA);
      }
      if (pLink->GetTechID(0)==pLink->GetTechID(1)){
        warn="CheckModelData: technology "+pLink->GetTechID(0)+" cannot be coupled to itself";
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
    }
    else if (pLink->GetNumTechs()<2){
      WriteWarning("CheckModelData: :MutuallyExclusive with a single technology has no effect",Options.noisy);
    }
  }

  // feasibility screen
  //----------------------------------------------------------------
  CheckTargetFeasibility(pModel,Options);

  // slack penalty advisory
  //----------------------------------------------------------------
  if ((Options.allow_shortfall) && (!years.empty()))
  {
    double maxLCOA=0.0;
    for (i=0;i<pModel->GetNumTechnologies();i++){
      for (size_t k=0;k<years.size();k++){
        double lcoa=pModel->GetTechnology(i)->GetLevelizedCostOfAbatement(years[k],Options);
        if (lcoa<ALMOST_INF){upperswap(maxLCOA,lcoa);}
      }
    }
    if (Options.slack_penalty<=maxLCOA){
      warn="CheckModelData: :SlackPenalty ("+to_string(Options.slack_penalty)+") does not exceed the largest levelized cost of abatement ("+
           to_string(maxLCOA)+"); the optimizer may prefer shortfall to abatement";
      WriteAdvisory(warn,Options.noisy);
    }
  }
}

//////////////////////////////////////////////////////////////////
/// \brief screens emission targets against the maximum technical abatement potential
/// \details potential(t) sums, over bands, the smaller of
///   activity(b)*max factor(i,t) and sum_i cap(i,t)*activity(b)*factor(i,t),
///   counting only technologies commercial by year t. Ramp limits and exclusivity
///   are ignored, so this is an upper bound: a year whose required abatement exceeds it
///   cannot be met without shortfall. Years that fail are listed in one advisory.
///   Must be called after band references have been checked.
///
/// \param *pModel [in] parsed model
/// \param &Options [in] run options
/// \return number of model years whose required abatement exceeds the potential
//
int CheckTargetFeasibility(const CPathwayModel *pModel, const optStruct &Options)
{
  const extrap_policy policy=Options.extrapolation;
  const CYearSeries *pTargets=pModel->GetTargets();
  if ((pTargets==NULL) || (pTargets->GetNumPoints()==0)){return 0;}

  vector<int> years;
  GetModelYears(Options,years);

  int    nBands  =pModel->GetNumBands();
  double baseline=pModel->GetBaselineEmissions();
  double *aBest  =new double[nBands];
  double *aSum   =new double[nBands];

  int    nShort=0;
  double worst =0.0;
  string list  ="";
  for (size_t k=0;k<years.size();k++)
  {
    int b;
    for (b=0;b<nBands;b++){aBest[b]=0.0; aSum[b]=0.0;}
    for (int i=0;i<pModel->GetNumTechnologies();i++)
    {
      const CTechnology *pTech=pModel->GetTechnology(i);
      if ((pTech->GetCommercialYear()!=DOESNT_EXIST) && (pTech->GetCommercialYear()>years[k])){continue;}
      b=pModel->GetBandIndex(pTech->GetBandID());
      if (b==DOESNT_EXIST){continue;}
      double factor=max(pTech->GetAbatementFactor(years[k],policy),0.0);
      double cap   =min(max(pTech->GetAdoptionCap(years[k],policy),0.0),1.0);
      upperswap(aBest[b],factor);
      aSum[b]+=cap*factor;
    }
    double potential=0.0;
    for (b=0;b<nBands;b++){
      potential+=pModel->GetBand(b)->GetActivity()*min(aBest[b],aSum[b]);
    }
    double required=max(0.0,baseline-pTargets->GetValue(years[k],policy));
    if (required>potential+REAL_SMALL)
    {
      nShort++;
      list+=" "+to_string(years[k]);
      upperswap(worst,required-potential);
    }
  }
  delete [] aBest;
  delete [] aSum;

  if (nShort>0){
    string warn="CheckTargetFeasibility: required abatement exceeds the maximum technical abatement potential in "+
                to_string(nShort)+" model year(s):"+list+" (largest gap "+to_string(worst)+" t/yr). "+
                (Options.allow_shortfall ? "Expect shortfall in these years." : "Expect an infeasible run; consider :AllowShortfall.");
    WriteAdvisory(warn,Options.noisy);
  }
  return nShort;
}
