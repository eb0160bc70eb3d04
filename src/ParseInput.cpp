/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  ParseInput.cpp: primary input routine and run info (.mci) file
  ----------------------------------------------------------------*/
#include "MacawInclude.h"
#include "PathwayModel.h"
#include "ParseLib.h"

bool ParseRunInfoFile  (optStruct &Options);
bool ParseParameterFile(CPathwayModel *&pModel, const optStruct &Options); //Defined in ParseParameterFile.cpp

//////////////////////////////////////////////////////////////////
/// \brief This method is the primary Macaw input routine that parses input files, called by main
///
/// \details Files used include:\n
///   - \b [modelname].mci: run info file that determines model years, discounting, solver and output settings
///   - \b [modelname].mcp: parameter file with baseline bands, technologies, costs, targets and links
///
/// \param *&pModel [out] the new pathway model
/// \param &Options [in/out] run options; command-line settings are already present
/// \return true if parsing succeeded
//
bool ParseInputFiles(CPathwayModel *&pModel, optStruct &Options)
{
  // Run info file (.mci)
  //--------------------------------------------------------------------------------
  if (!ParseRunInfoFile(Options)){
    if (Options.mci_filename==""){
      ExitGracefully("A run info (.mci) file name must be supplied as an argument to the Macaw executable.",BAD_DATA);return false;
    }
    ExitGracefully("Cannot find or read .mci file",BAD_DATA);return false;
  }

  // Parameter file (.mcp)
  //--------------------------------------------------------------------------------
  pModel=new CPathwayModel();
  if (!ParseParameterFile(pModel,Options)){
    ExitGracefully("Cannot find or read .mcp file",BAD_DATA);return false;
  }

  if (!Options.silent){
    cout <<"...model input successfully parsed"<<endl;
    cout <<endl;
  }
  return true;
}

///////////////////////////////////////////////////////////////////
/// \brief Reads the run info (.mci) file into the options structure
/// \details run name and output directory given on the command line take precedence
///   over :RunName and :OutputDirectory
///
/// \param &Options [in/out] run options
/// \return false if file could not be opened
//
bool ParseRunInfoFile(optStruct &Options)
{
  int       i;
  ifstream  INPUT;
  ifstream  INPUT2;           //For Secondary input
  CParser  *pMainParser=NULL; //for storage of main parser while reading secondary files
  bool      runname_overridden(false);
  bool      rundir_overridden (false);

  int       code;             //Parsing vars
  bool      ended(false);
  int       Len,line(0);
  char     *s[MAXINPUTITEMS];

  if (Options.noisy){
    cout <<"======================================================"<<endl;
    cout <<"Parsing Input File " << Options.mci_filename <<"..."<<endl;
    cout <<"======================================================"<<endl;
  }

  INPUT.open(Options.mci_filename.c_str());
  if (INPUT.fail()){cout << "Cannot find file "<<Options.mci_filename <<endl; return false;}

  CParser *p=new CParser(INPUT,Options.mci_filename,line);

  if (Options.run_name  !=""){runname_overridden=true;}
  if (Options.output_dir!=""){rundir_overridden =true;}

  //===============================================================================================
  // Sift through file, processing each command
  //===============================================================================================
  bool end_of_file=p->Tokenize(s,Len);
  while (!end_of_file)
  {
    if (ended){break;}
    if (Options.noisy){ cout << "reading line " << p->GetLineNumber() << ": ";}

    /*assign code for switch statement
      ------------------------------------------------------------------
      <0           : ignored/special
      1   thru 50  : horizon, discounting and formulation options
      50  thru 100 : solver options
      100 thru 150 : I/O
      ------------------------------------------------------------------
    */
    code=0;
    //---------------------SPECIAL -----------------------------
    if       (IsComment(s[0],Len))                        {code=-2; }//comment or blank
    else if  (!strcmp(s[0],":End"                       )){code=-3; }//premature end of file
    else if  (!strcmp(s[0],":RedirectToFile"            )){code=-4; }//redirect to secondary file
    //--------------------MODEL OPTIONS ------------------------
    else if  (!strcmp(s[0],":StartYear"                 )){code=1;  }
    else if  (!strcmp(s[0],":EndYear"                   )){code=2;  }
    else if  (!strcmp(s[0],":ModelYears"                )){code=3;  }
    else if  (!strcmp(s[0],":BaseYear"                  )){code=4;  }
    else if  (!strcmp(s[0],":DiscountRate"              )){code=5;  }
    else if  (!strcmp(s[0],":AllowShortfall"            )){code=6;  }
    else if  (!strcmp(s[0],":DisallowShortfall"         )){code=7;  }
    else if  (!strcmp(s[0],":SlackPenalty"              )){code=8;  }
    else if  (!strcmp(s[0],":DefaultRampRate"           )){code=9;  }
    else if  (!strcmp(s[0],":VintageWindow"             )){code=10; }
    else if  (!strcmp(s[0],":Extrapolation"             )){code=11; }
    //--------------------SOLVER OPTIONS -----------------------
    else if  (!strcmp(s[0],":SolverOrder"               )){code=50; }
    else if  (!strcmp(s[0],":SolverTimeout"             )){code=51; }
    else if  (!strcmp(s[0],":ConsistencyTolerance"      )){code=52; }
    else if  (!strcmp(s[0],":SensitivityDiscountRates"  )){code=53; }
    else if  (!strcmp(s[0],":SweepThreads"              )){code=54; }
    //---I/O------------------------------------------------------
    else if  (!strcmp(s[0],":DebugLevel"                )){code=100;}
    else if  (!strcmp(s[0],":WriteNetcdfFormat"         )){code=101;}
    else if  (!strcmp(s[0],":WriteNetCDFFormat"         )){code=101;}
    else if  (!strcmp(s[0],":NoisyMode"                 )){code=102;}
    else if  (!strcmp(s[0],":SilentMode"                )){code=103;}
    else if  (!strcmp(s[0],":QuietMode"                 )){code=104;}
    else if  (!strcmp(s[0],":RunName"                   )){code=105;}
    else if  (!strcmp(s[0],":OutputDirectory"           )){code=106;}
    else if  (!strcmp(s[0],":SuppressWarnings"          )){code=107;}

    switch(code)
    {
    case(-2):  //----------------------------------------------
    {/*Comment # or blank line*/
      if (Options.noisy) {cout <<"*"<<endl;} break;
    }
    case(-3):  //----------------------------------------------
    {/*:End*/
      if (Options.noisy) {cout <<"EOF"<<endl;} ended=true; break;
    }
    case(-4):  //----------------------------------------------
    {/*:RedirectToFile*/
      string filename="";
      for (i=1;i<Len;i++){ filename+=s[i]; if (i<Len-1){ filename+=' '; } }
      if (Options.noisy) { cout <<"Redirect to file: "<<filename<<endl; }

      filename=CorrectForRelativePath(filename,Options.mci_filename);

      INPUT2.open(filename.c_str());
      if (INPUT2.fail()) {
        string warn=":RedirectToFile: Cannot find file "+filename;
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
      else {
        if (pMainParser != NULL) {
          ExitGracefully("ParseRunInfoFile::nested :RedirectToFile commands (in already redirected files) are not allowed.",BAD_DATA);
        }
        pMainParser=p;    //save pointer to primary parser
        p=new CParser(INPUT2,filename,line);//open new parser
      }
      break;
    }
    case(1):  //--------------------------------------------
    {/*:StartYear [year]*/
      if (Options.noisy) {cout <<"Start year"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      Options.start_year=s_to_i(s[1]);
      break;
    }
    case(2):  //--------------------------------------------
    {/*:EndYear [year]*/
      if (Options.noisy) {cout <<"End year"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      Options.end_year=s_to_i(s[1]);
      break;
    }
    case(3):  //--------------------------------------------
    {/*:ModelYears [year1] [year2] ... [yearN]*/
      if (Options.noisy) {cout <<"Model years"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      Options.model_years.clear();
      for (i=1;i<Len;i++){Options.model_years.push_back(s_to_i(s[i]));}
      break;
    }
    case(4):  //--------------------------------------------
    {/*:BaseYear [year]*/
      if (Options.noisy) {cout <<"Base year"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      Options.base_year=s_to_i(s[1]);
      break;
    }
    case(5):  //--------------------------------------------
    {/*:DiscountRate [rate]*/
      if (Options.noisy) {cout <<"Discount rate"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      Options.discount_rate=s_to_d(s[1]);
      break;
    }
    case(6):  //--------------------------------------------
    {/*:AllowShortfall*/
      if (Options.noisy) {cout <<"Shortfall slack enabled"<<endl;}
      Options.allow_shortfall=true;
      break;
    }
    case(7):  //--------------------------------------------
    {/*:DisallowShortfall*/
      if (Options.noisy) {cout <<"Shortfall slack disabled"<<endl;}
      Options.allow_shortfall=false;
      break;
    }
    case(8):  //--------------------------------------------
    {/*:SlackPenalty [cost per unit shortfall]*/
      if (Options.noisy) {cout <<"Slack penalty"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      Options.slack_penalty=s_to_d(s[1]);
      break;
    }
    case(9):  //--------------------------------------------
    {/*:DefaultRampRate [share per year]*/
      if (Options.noisy) {cout <<"Default ramp rate"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      Options.default_ramp_rate=s_to_d(s[1]);
      break;
    }
    case(10):  //--------------------------------------------
    {/*:VintageWindow [EXCLUSIVE/INCLUSIVE]*/
      if (Options.noisy) {cout <<"Vintage window"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      if      (!strcmp(s[1],"EXCLUSIVE")){Options.vintage_policy=VINTAGE_EXCLUSIVE;}
      else if (!strcmp(s[1],"INCLUSIVE")){Options.vintage_policy=VINTAGE_INCLUSIVE;}
      else {
        string warn="ParseRunInfoFile: unrecognized :VintageWindow option "+string(s[1]);
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
      break;
    }
    case(11):  //--------------------------------------------
    {/*:Extrapolation [FLAT/LINEAR]*/
      if (Options.noisy) {cout <<"Extrapolation"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      if      (!strcmp(s[1],"FLAT"  )){Options.extrapolation=EXTRAP_FLAT;}
      else if (!strcmp(s[1],"LINEAR")){Options.extrapolation=EXTRAP_LINEAR;}
      else {
        string warn="ParseRunInfoFile: unrecognized :Extrapolation option "+string(s[1]);
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
      break;
    }
    case(50):  //--------------------------------------------
    {/*:SolverOrder [backend1] {backend2} ... */
      if (Options.noisy) {cout <<"Solver order"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      Options.solver_order.clear();
      for (i=1;i<Len;i++){Options.solver_order.push_back(StringToUppercase(s[i]));}
      break;
    }
    case(51):  //--------------------------------------------
    {/*:SolverTimeout [seconds]*/
      if (Options.noisy) {cout <<"Solver timeout"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      Options.solver_timeout=s_to_d(s[1]);
      break;
    }
    case(52):  //--------------------------------------------
    {/*:ConsistencyTolerance [relative tolerance]*/
      if (Options.noisy) {cout <<"Consistency tolerance"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      Options.consistency_tol=s_to_d(s[1]);
      break;
    }
    case(53):  //--------------------------------------------
    {/*:SensitivityDiscountRates [r1] [r2] ... [rN]*/
      if (Options.noisy) {cout <<"Sensitivity discount rates"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      Options.sweep_discount_rates.clear();
      for (i=1;i<Len;i++){Options.sweep_discount_rates.push_back(s_to_d(s[i]));}
      break;
    }
    case(54):  //--------------------------------------------
    {/*:SweepThreads [number of workers]*/
      if (Options.noisy) {cout <<"Sweep threads"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      Options.sweep_threads=s_to_i(s[1]);
      break;
    }
    case(100):  //--------------------------------------------
    {/*:DebugLevel [level]*/
      if (Options.noisy) {cout <<"Debug level"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      Options.debug_level=s_to_i(s[1]);
      break;
    }
    case(101):  //--------------------------------------------
    {/*:WriteNetCDFFormat*/
      if (Options.noisy) {cout <<"NetCDF output"<<endl;}
      Options.write_netcdf=true;
      break;
    }
    case(102):  //--------------------------------------------
    {/*:NoisyMode */
      cout <<"Noisy Mode!!!!"<<endl;
      Options.noisy=true; Options.silent=false;
      break;
    }
    case(103):  //--------------------------------------------
    {/*:SilentMode */
      Options.noisy=false; Options.silent=true;
      break;
    }
    case(104):  //--------------------------------------------
    {/*:QuietMode */ //(default reporting mode)
      if (Options.noisy) { cout<<endl; }
      Options.noisy=false; Options.silent=false;
      break;
    }
    case(105):  //--------------------------------------------
    {/*:RunName [run name]*/
      if (Len<2){p->ImproperFormat(s); break;}
      if (!runname_overridden) {
        if (Options.noisy) { cout <<"Using Run Name: "<<s[1]<<endl; }
        Options.run_name=s[1];
      }
      else {
        WriteWarning("ParseRunInfoFile: when run name is specified from command line, it cannot be overridden in the .mci file. :RunName command ignored.",Options.noisy);
      }
      break;
    }
    case(106):  //--------------------------------------------
    {/*:OutputDirectory [dir]*/
      if (Len<2){p->ImproperFormat(s); break;}
      if (Options.noisy) {cout <<"Output directory: "<<s[1]<<"/"<<endl;}
      if (!rundir_overridden)
      {
        Options.output_dir="";
        for (i=1;i<Len-1;i++){
          Options.output_dir+=string(s[i])+" ";   //if spaces in folder name
        }
        Options.output_dir+=string(s[Len-1])+"/";  // append slash to make sure it's a folder
        Options.main_output_dir=Options.output_dir;
        PrepareOutputdirectory(Options);

        ofstream WARNINGS((Options.main_output_dir+"Macaw_errors.txt").c_str());
        WARNINGS.close();
      }
      else {
        WriteWarning("ParseRunInfoFile: :OutputDirectory command was ignored because directory was specified from command line.",Options.noisy);
      }
      break;
    }
    case(107):  //--------------------------------------------
    {/*:SuppressWarnings */
      if (Options.noisy) {cout <<"Suppressing Warnings"<<endl;}
      Options.suppress_warnings=true;
      g_suppress_warnings=true;
      break;
    }
    default://----------------------------------------------
    {
      if (s[0][0]==':')
      {
        string warn ="IGNORING unrecognized command: " + string(s[0])+ " in .mci file";
        WriteWarning(warn,Options.noisy);
      }
      else
      {
        string errString = "Unrecognized command in .mci file:\n   " + string(s[0]);
        ExitGracefully(errString.c_str(),BAD_DATA_WARN);
      }
      break;
    }
    }//switch

    end_of_file=p->Tokenize(s,Len);

    //return after file redirect, if in secondary file
    if ((end_of_file) && (pMainParser!=NULL))
    {
      INPUT2.clear();
      INPUT2.close();
      delete p;
      p=pMainParser;
      pMainParser=NULL;
      end_of_file=p->Tokenize(s,Len);
    }
  } //end while (!end_of_file)

  INPUT.close();
  if (pMainParser!=NULL){delete pMainParser; INPUT2.close();} //:End found in redirected file
  delete p; p=NULL;

  return true;
}
