/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include <time.h>
#include "MacawInclude.h"
#include "MacawMain.h"
#include "PathwayModel.h"
#include "PathwayResults.h"
#include "SolverAdapter.h"
#include "SensitivitySweep.h"
#include "ParseLib.h"

static string MacawBuildDate(__DATE__);

//////////////////////////////////////////////////////////////////
//
/// \brief Primary Macaw driver routine
//
/// \param argc [in] number of arguments to executable
/// \param argv[] [in] executable arguments; Macaw [base_filename] [-p mcp_file] [-o output_dir] [-r run_name] [-s] [-n]
/// \return 0 if run finished with an optimal pathway, 2 if run terminated with another
///   solve status, otherwise the exitcode of the error that ended the run
//
int main(int argc, char* argv[])
{
  clock_t          t0, t1;          //computational time markers
  optStruct        Options;
  CPathwayModel   *pModel=NULL;
  CSolverAdapter  *pAdapter=NULL;
  int              retcode=0;

  InitializeOptions(Options);
#ifdef _LPSOLVE_
  Options.version+=" w/ lp_solve";
#endif
#ifdef _MCNETCDF_
  Options.version+=" w/ netCDF";
#endif

  try
  {
    ProcessExecutableArguments(argc,argv,Options);
    PrepareOutputdirectory(Options);

    if (!Options.silent){
      int year = s_to_i(MacawBuildDate.substr(MacawBuildDate.length()-4,4).c_str());
      cout <<"============================================================"<<endl;
      cout <<"                        MACAW                               "<<endl;
      cout <<"    least-cost technology deployment pathway optimizer      "<<endl;
      cout <<"    Copyright 2024-"<<year<<", the Macaw Development Team "  <<endl;
      cout <<"                    Version "<<Options.version               <<endl;
      cout <<"                BuildDate "<<MacawBuildDate                  <<endl;
      cout <<"============================================================"<<endl;
    }

    ofstream WARNINGS;
    WARNINGS.open((Options.main_output_dir+"Macaw_errors.txt").c_str());
    if (WARNINGS.fail()){
      ExitGracefully("Main::Unable to open Macaw_errors.txt. Bad output directory specified?",MACAW_OPEN_ERR);
    }
    WARNINGS.close();

    t0=clock();

    //Read input files, create model, set run options
    if (!ParseInputFiles(pModel, Options)){
      ExitGracefully("Main::Unable to read input file(s)",BAD_DATA);}

    CheckForErrorWarnings(true, Options);

    if (!Options.silent){
      cout <<"======================================================"<<endl;
      cout <<"Checking Model Data..."<<endl;
    }
    CheckOptions  (Options);
    CheckModelData(pModel,Options);

    if (!Options.silent){
      cout <<"Initializing Model..."<<endl;
    }
    pModel->Initialize       (Options);
    pModel->SummarizeToScreen(Options);

    CheckForErrorWarnings(false, Options);

    pAdapter=CSolverAdapter::CreateDefault();

    t1=clock();

    if (Options.sweep_discount_rates.size()>0)
    {
      //Sensitivity sweep over discount rates----------------------------
      CSensitivitySweep Sweep(Options.sweep_discount_rates,Options);
      Sweep.Run(pModel,*pAdapter,Options);
      for (int e=0;e<Sweep.GetNumMembers();e++){
        if (Sweep.GetStatus(e)!=STATUS_OPTIMAL){retcode=2;}
      }
    }
    else
    {
      //Single run-------------------------------------------------------
      if (!Options.silent){
        cout <<endl<<"======================================================"<<endl;
        cout <<"Optimization Start..."<<endl;
      }
      CPathwayResults *pResults=pModel->Run(Options,*pAdapter,NULL);
      pResults->WriteOutput      (Options);
      pResults->SummarizeToScreen(Options);
      if (!pResults->IsOptimal()){retcode=2;}
      delete pResults;
    }

    if (!Options.silent)
    {
      cout <<"======================================================"<<endl;
      cout <<"...Macaw Run Complete: "<<Options.run_name<<endl;
      cout <<"    Parsing & initialization: "<< float(t1     -t0)/CLOCKS_PER_SEC << " seconds elapsed . "<<endl;
      cout <<"                Optimization: "<< float(clock()-t1)/CLOCKS_PER_SEC << " seconds elapsed . "<<endl;
      if (Options.output_dir!="") {
        cout <<"  Output written to "        << Options.output_dir                                       <<endl;
      }
      cout <<"======================================================"<<endl;
    }

    delete pAdapter; pAdapter=NULL;
    delete pModel;   pModel=NULL;

    ExitGracefully("Successful Simulation",SIMULATION_DONE);
  }
  catch (CMacawError &E)
  {
    delete pAdapter;
    delete pModel;
    return (int)(E.GetCode());
  }
  return retcode;
}

//////////////////////////////////////////////////////////////////
/// \param argc [in] number of arguments to executable
/// \param argv[] [in] executable arguments; Macaw [filebase] [-p mcp_file] [-o output_dir] [-r run_name] [-s] [-n]
/// \details initializes input files and output directory;
///   filebase has no extension, the parameter file requires the .mcp extension
/// \param Options [in/out] run options
//
void ProcessExecutableArguments(int argc, char* argv[], optStruct &Options)
{
  int i=1;
  string word,argument;
  bool version_announce=false;
  int mode=0;
  argument="";
  //initialization:
  Options.run_name       ="";
  Options.mci_filename   ="";
  Options.mcp_filename   ="";
  Options.output_dir     ="";
  Options.main_output_dir="";
  Options.silent=false;
  Options.noisy =false;

  //Parse argument list
  while (i<=argc)
  {
    if (i!=argc){
      word=string(argv[i]);
    }
    if ((word=="-p") || (word=="-o") || (word=="-r") || (word=="-s") || (word=="-n") || (word=="-v") || (i==argc))
    {
      if      (mode==0){
        Options.mci_filename=argument+".mci";
        Options.mcp_filename=argument+".mcp";
        argument="";
        mode=10;
      }
      else if (mode==1){Options.mcp_filename=argument; argument="";}
      else if (mode==5){Options.output_dir  =argument; argument="";}
      else if (mode==6){Options.run_name    =argument; argument="";}

      if      (word=="-p"){mode=1; }
      else if (word=="-o"){mode=5; }
      else if (word=="-r"){mode=6; }
      else if (word=="-s"){Options.silent=true; mode=10;}
      else if (word=="-n"){Options.noisy =true; mode=10;}
      else if (word=="-v"){version_announce=true; mode=10;}
    }
    else{
      if (argument==""){argument+=word;}
      else             {argument+=" "+word;}
    }
    i++;
  }
  if (argc==1){//no arguments
    Options.mci_filename="";
    Options.mcp_filename="";
  }

  // make sure that output dir has trailing '/' if not empty
  if ((Options.output_dir!="") && (Options.output_dir[Options.output_dir.length()-1]!='/')){ Options.output_dir=Options.output_dir+"/"; }
  Options.main_output_dir=Options.output_dir;

  if (version_announce) {
    cout<<Options.version<<endl;
    ExitGracefully("Version check",SIMULATION_DONE);
  }
}

/////////////////////////////////////////////////////////////////
/// \brief Checks if errors have been written to Macaw_errors.txt, if so, exits gracefully
/// \note called after parsing and again after model initialization
//
void CheckForErrorWarnings(bool quiet, const optStruct &Options)
{
  int      Len;
  char    *s[MAXINPUTITEMS];
  bool     errors_found(false);
  bool     warnings_found(false);

  ifstream WARNINGS;
  WARNINGS.open((Options.main_output_dir+"Macaw_errors.txt").c_str());
  if (WARNINGS.fail()){WARNINGS.close();return;}

  CParser *p=new CParser(WARNINGS,Options.main_output_dir+"Macaw_errors.txt",0);

  while (!(p->Tokenize(s,Len)))
  {
    if (Len>0){
      if (!strcmp(s[0],"ERROR"  )){ errors_found  =true; }
      if (!strcmp(s[0],"WARNING")){ warnings_found=true; }
    }
  }
  WARNINGS.close();
  delete p;

  if ((warnings_found) && (!quiet) && (!Options.silent)){
    cout<<"*******************************************************"<<endl<<endl;
    cout<<"WARNING: Warnings have been issued while parsing data. "<<endl;
    cout<<"         See Macaw_errors.txt for details              "<<endl<<endl;
    cout<<"*******************************************************"<<endl<<endl;
  }

  if (errors_found){
    ExitGracefully("Errors found in input data. See Macaw_errors.txt for details",BAD_DATA);
  }
}
