/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include "TestHelpers.h"

//////////////////////////////////////////////////////////////////
CFakeBackend::CFakeBackend(const string name, const solve_status stat)
{
  _name  =name;
  _status=stat;
  _nCalls.store(0);
}
string CFakeBackend::GetName    () const {return _name;}
int    CFakeBackend::GetNumCalls() const {return _nCalls.load();}
//////////////////////////////////////////////////////////////////
solve_outcome CFakeBackend::Solve(const CLinearProgram &LP, const optStruct &, const atomic<bool> *) const
{
  _nCalls++;
  solve_outcome out;
  out.status   =_status;
  out.objective=0.0;
  out.backend  =_name;
  out.message  ="fake backend "+_name;
  if (_status==STATUS_OPTIMAL){out.x=arma::zeros<arma::vec>(LP.GetNumColumns());}
  return out;
}

//////////////////////////////////////////////////////////////////
void InitializeTestOptions(optStruct &Options)
{
  InitializeOptions(Options);
  Options.silent    =true;
  Options.noisy     =false;
  Options.start_year=2025;
  Options.end_year  =2030;
}

//////////////////////////////////////////////////////////////////
CTechnology *CreateTechnology(const string id, const string band, const int lifetime,
                              const double factor, const double capex,
                              const double fixed_om, const double variable_om)
{
  CTechnology *pTech=new CTechnology(id);
  pTech->SetBandID(band);
  pTech->SetLifetime(lifetime);
  pTech->AddAbatementFactor(2025,factor);
  pTech->GetCostRecord()->AddYear(2025,capex,fixed_om,variable_om);
  return pTech;
}

//////////////////////////////////////////////////////////////////
CPathwayModel *CreateSteelModel(const double adoption_cap)
{
  CPathwayModel *pModel=new CPathwayModel();
  pModel->AddBand(new CBaselineBand("STEEL",100.0,0.5));

  CTechnology *pTech=CreateTechnology("H2DRI","STEEL",25,0.5,500.0,10.0,5.0);
  if (adoption_cap<1.0){pTech->AddAdoptionCap(2025,adoption_cap);}
  pModel->AddTechnology(pTech);

  pModel->AddTarget(2025,50.0);
  pModel->AddTarget(2030,35.0);
  return pModel;
}

//////////////////////////////////////////////////////////////////
void WriteTextFile(const string filename, const string contents)
{
  ofstream OUT(filename.c_str());
  OUT<<contents;
  OUT.close();
}

//////////////////////////////////////////////////////////////////
int CountLines(const string filename)
{
  ifstream IN(filename.c_str());
  if (IN.fail()){return 0;}
  int n=0;
  string line;
  while (getline(IN,line)){n++;}
  return n;
}
