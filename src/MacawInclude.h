/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  MacawInclude.h
  ----------------------------------------------------------------*/
#ifndef MACAW_INCLUDE_H
#define MACAW_INCLUDE_H

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <math.h>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <algorithm>
#include <stdexcept>
#include <atomic>
#include <mutex>

#ifdef _MCNETCDF_
#include <netcdf.h>
#endif

using namespace std;

#define __MACAW_VERSION__ "1.2"

//*****************************************************************
// Global Constants
//*****************************************************************
const int    DOESNT_EXIST            =-1;           ///< return value for nonexistent index
const double REAL_SMALL              =1e-12;        ///< small number for floating point comparisons
const double ALMOST_INF              =1e99;         ///< effectively infinite bound
const double NOT_SPECIFIED           =-1.2345;      ///< tag for parameters absent from input
const int    MAXINPUTITEMS           =500;          ///< maximum delimited input items per line
const int    MAXCHARINLINE           =6000;         ///< maximum characters in line of input file

const double DEFAULT_DISCOUNT_RATE   =0.05;         ///< [-] default annual discount rate
const double DEFAULT_SLACK_PENALTY   =1e15;         ///< [cost/t] default penalty per unit emission shortfall
const double DEFAULT_RAMP_RATE       =0.2;          ///< [share/yr] default maximum new capacity per year, as share of band activity
const double DEFAULT_ADOPTION_CAP    =1.0;          ///< [-] adoption cap when none is specified
const double DEFAULT_CONSISTENCY_TOL =1e-6;         ///< [-] relative tolerance of post-solve consistency checks
const double SHARE_TOLERANCE         =1e-7;         ///< [-] tolerance on group share sums

//*****************************************************************
// Exit Strategies
//*****************************************************************
///////////////////////////////////////////////////////////////////
/// \brief Types of exit strategies
//
enum exitcode
{
  SIMULATION_DONE,  ///< Program finished without errors
  RUNTIME_ERR,      ///< Runtime error
  BAD_DATA,         ///< Input data is malformed or missing
  BAD_DATA_WARN,    ///< Input data is suspect (logged only)
  DATA_GAP,         ///< Time series has no known points from which to resolve a value
  MODEL_INTEGRITY,  ///< Assembled model is unbounded or solution violates model structure
  OUT_OF_MEMORY,    ///< Out of memory
  FILE_OPEN_ERR,    ///< Unable to open file
  STUB,             ///< Function not yet implemented
  MACAW_OPEN_ERR    ///< Unable to open error log
};

///////////////////////////////////////////////////////////////////
/// \brief base class of errors raised by ExitGracefully()
//
class CMacawError : public runtime_error
{
private:
  exitcode _code;
public:
  CMacawError(const string &statement, const exitcode code)
    : runtime_error(statement), _code(code) {}
  exitcode GetCode() const {return _code;}
};
/// \brief malformed or missing input data, detected before model construction
class CDataValidationError : public CMacawError
{
public:
  explicit CDataValidationError(const string &statement) : CMacawError(statement,BAD_DATA) {}
};
/// \brief time series with no known points
class CDataGapError : public CMacawError
{
public:
  explicit CDataGapError(const string &statement) : CMacawError(statement,DATA_GAP) {}
};
/// \brief unbounded problem or post-solve consistency violation
class CModelIntegrityError : public CMacawError
{
public:
  explicit CModelIntegrityError(const string &statement) : CMacawError(statement,MODEL_INTEGRITY) {}
};

void ExitGracefully(const char *statement, exitcode code);//defined in GracefulEnd.cpp

///////////////////////////////////////////////////////////////////
/// \brief Exits gracefully if condition is true
/// \param condition [in] Boolean indicating if program should exit
/// \param statement [in] error message printed upon exit
/// \param code [in] exit code
//
inline void ExitGracefullyIf(bool condition, const char *statement, exitcode code)
{
  if (condition){ExitGracefully(statement,code);}
}

//*****************************************************************
// Enumerated Types
//*****************************************************************
///////////////////////////////////////////////////////////////////
/// \brief treatment of time series values outside of the range of known years
//
enum extrap_policy
{
  EXTRAP_FLAT,      ///< hold nearest known value constant
  EXTRAP_LINEAR     ///< extend slope of nearest known segment
};

///////////////////////////////////////////////////////////////////
/// \brief treatment of the lifetime boundary when tracking vintages
//
enum vintage_window
{
  VINTAGE_EXCLUSIVE, ///< installed in year tau is in service in year t if 0<=t-tau< L
  VINTAGE_INCLUSIVE  ///< installed in year tau is in service in year t if 0<=t-tau<=L
};

///////////////////////////////////////////////////////////////////
/// \brief state of a single pathway run
//
enum solve_status
{
  STATUS_BUILT,               ///< problem assembled, not yet submitted
  STATUS_SOLVING,             ///< submitted to backend
  STATUS_OPTIMAL,             ///< optimal solution found
  STATUS_INFEASIBLE,          ///< targets cannot be met under caps/ramps without shortfall
  STATUS_UNBOUNDED,           ///< problem is unbounded (a modelling defect)
  STATUS_TIMED_OUT,           ///< wall-clock limit reached without solution
  STATUS_CANCELLED,           ///< cooperative cancellation requested
  STATUS_SOLVER_UNAVAILABLE   ///< no backend could be invoked
};

//*****************************************************************
// Model options
//*****************************************************************
///////////////////////////////////////////////////////////////////
/// \brief Stores run-wide configuration
/// \details filled once from the .mci file and the command line, then passed by const reference.
/// Sensitivity sweep members each hold an independent copy
//
struct optStruct
{
  string         version;               ///< Macaw version string
  string         mci_filename;          ///< fully qualified filename of run info (.mci) file
  string         mcp_filename;          ///< fully qualified filename of parameter (.mcp) file
  string         output_dir;            ///< output directory, ending in '/' (or empty)
  string         main_output_dir;       ///< primary output directory (== output_dir unless sweeping)
  string         run_name;              ///< prefix of output files

  bool           silent;                ///< minimal screen output
  bool           noisy;                 ///< extensive screen output
  bool           suppress_warnings;     ///< no warnings written to Macaw_errors.txt
  int            debug_level;           ///< 2: write LP matrix
  bool           write_netcdf;          ///< also write pathway as netCDF

  int            start_year;            ///< first year of horizon (inclusive)
  int            end_year;              ///< last year of horizon (inclusive)
  vector<int>    model_years;           ///< explicit year list (overrides start/end year if non-empty)
  int            base_year;             ///< discounting anchor year (DOESNT_EXIST: first model year)
  double         discount_rate;         ///< [-] annual discount rate

  bool           allow_shortfall;       ///< true if target shortfall slack is enabled
  double         slack_penalty;         ///< [cost/t] objective penalty per unit shortfall
  double         default_ramp_rate;     ///< [share/yr] ramp limit when a technology omits one
  extrap_policy  extrapolation;         ///< time series extrapolation policy
  vintage_window vintage_policy;        ///< lifetime boundary policy

  vector<string> solver_order;          ///< ordered backend preference list
  double         solver_timeout;        ///< [s] wall-clock solver limit (0: none)
  double         consistency_tol;       ///< [-] post-solve check tolerance

  vector<double> sweep_discount_rates;  ///< discount rates of sensitivity sweep (empty: single run)
  int            sweep_threads;         ///< number of sweep workers (0: hardware concurrency)
};

//*****************************************************************
// Global variables - declared in MacawMain.cpp / GracefulEnd.cpp
//*****************************************************************
extern string g_output_directory;   ///< directory of Macaw_errors.txt
extern bool   g_suppress_warnings;  ///< true if warnings are not written

//*****************************************************************
// Inline conversion and comparison functions
//*****************************************************************
inline int    s_to_i (const char *s1) {return (int)atof(s1);}
inline double s_to_d (const char *s1) {return atof(s1);}
inline bool   s_to_b (const char *s1) {return ((int)atof(s1)!=0);}

inline void   upperswap(double &u,const double v){if (v>u){u=v;}}
inline void   lowerswap(double &u,const double v){if (v<u){u=v;}}

//*****************************************************************
// Common functions (CommonFunctions.cpp)
//*****************************************************************
bool   DynArrayAppend          (void **& pArr, void *xptr,int &size);
bool   IsComment               (const char *s, const int Len);
string StringToUppercase       (const string &s);
void   WriteWarning            (const string warn, bool noisy);
void   WriteAdvisory           (const string warn, bool noisy);
string GetStatusName           (const solve_status stat);
string GetDirectoryName        (const string &fname);
string CorrectForRelativePath  (const string filename,const string relfile);
void   InitializeOptions       (optStruct &Options);
void   GetModelYears           (const optStruct &Options, vector<int> &years);
int    GetBaseYear             (const optStruct &Options, const vector<int> &years);

double CapitalRecoveryFactor   (const int lifetime, const double r);
double DiscountFactor          (const int year, const int base_year, const double r);

//*****************************************************************
// Output preparation (PathwayOutput.cpp)
//*****************************************************************
string FilenamePrepare         (string filebase, const optStruct &Options);
void   PrepareOutputdirectory  (const optStruct &Options);
void   HandleNetCDFErrors      (int error_code);

#endif
