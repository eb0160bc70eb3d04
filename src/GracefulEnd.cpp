/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include "MacawInclude.h"

// Global variables - declared as extern in MacawInclude.h--------
string g_output_directory ="";
bool   g_suppress_warnings=false;

bool WriteErrorToLog(const string statement, const bool done);//defined in CommonFunctions.cpp

/////////////////////////////////////////////////////////////////
/// \brief Finalizes program gracefully, explaining reason for finalizing
/// \remark Called from within ExitGracefully()
///
/// \param statement [in] String to print to user upon exit
/// \param code [in] Code to determine why the system is exiting
//
void FinalizeGracefully(const char *statement, exitcode code)
{
  string typeline;
  switch (code){
    case(SIMULATION_DONE): {typeline="============================================================";break;}
    case(RUNTIME_ERR):     {typeline="Error Type: Runtime Error";       break;}
    case(BAD_DATA):        {typeline="Error Type: Bad input data";      break;}
    case(BAD_DATA_WARN):   {typeline="Error Type: Bad input data";      break;}
    case(DATA_GAP):        {typeline="Error Type: Data gap";            break;}
    case(MODEL_INTEGRITY): {typeline="Error Type: Model integrity";     break;}
    case(OUT_OF_MEMORY):   {typeline="Error Type: Out of memory";       break;}
    case(FILE_OPEN_ERR):   {typeline="Error Type: File opening error";  break;}
    case(STUB):            {typeline="Error Type: Stub function called";break;}
    default:               {typeline="Error Type: Unknown";             break;}
  }

  if (code != MACAW_OPEN_ERR) {
    if (!WriteErrorToLog(statement,(code==SIMULATION_DONE))) {
      //reported only; the original error (not the logging failure) is raised by the caller
      cerr<<"WARNING  : unable to open errors file ("<<g_output_directory<<"Macaw_errors.txt)"<<endl;
    }
    if (code!=SIMULATION_DONE) {cerr<<"ERROR    : "<< statement << endl;}
  }
  if (code==BAD_DATA_WARN){return;}//just write these errors to a file

  if (code!=SIMULATION_DONE){
    cout <<endl<<endl;
    cout <<"============== Exiting Gracefully =========================="<<endl;
    cout <<"Exiting Gracefully: "<<statement                             <<endl;
    cout << typeline                                                     <<endl;
    cout <<"============================================================"<<endl;
  }
}

/////////////////////////////////////////////////////////////////
/// \brief Exits gracefully from run, explaining reason for exit
/// \details the statement is logged, then converted into a typed exception so that the
/// caller (the command line driver, a sweep worker, or a test) decides what to do with the run.
/// BAD_DATA_WARN and SIMULATION_DONE only log
///
/// \param statement [in] String to print to user upon exit
/// \param code [in] Code to determine why the system is exiting
//
void ExitGracefully(const char *statement, exitcode code)
{
  FinalizeGracefully(statement, code);
  switch (code)
  {
  case(SIMULATION_DONE):
  case(BAD_DATA_WARN):   {return;}
  case(BAD_DATA):        {throw CDataValidationError(statement);}
  case(DATA_GAP):        {throw CDataGapError(statement);}
  case(MODEL_INTEGRITY): {throw CModelIntegrityError(statement);}
  default:               {throw CMacawError(statement,code);}
  }
}
