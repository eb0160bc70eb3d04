//////////////////////////////////////////////////////////////////
///  Macaw Pathway Optimizer Source Code
///  Copyright (c) 2024-2026 the Macaw Development Team
//////////////////////////////////////////////////////////////////

#include "MacawInclude.h"

static mutex g_log_mutex; //serializes writes to Macaw_errors.txt across sweep workers

//////////////////////////////////////////////////////////////////
/// \brief Returns a string describing the run status
///
/// \param stat [in] run status
/// \return String equivalent of the solve_status identifier
//
string GetStatusName(const solve_status stat)
{
  string name;
  switch(stat)
  {
  case(STATUS_BUILT):              {name="Built";             break;}
  case(STATUS_SOLVING):            {name="Solving";           break;}
  case(STATUS_OPTIMAL):            {name="Optimal";           break;}
  case(STATUS_INFEASIBLE):         {name="Infeasible";        break;}
  case(STATUS_UNBOUNDED):          {name="Unbounded";         break;}
  case(STATUS_TIMED_OUT):          {name="TimedOut";          break;}
  case(STATUS_CANCELLED):          {name="Cancelled";         break;}
  case(STATUS_SOLVER_UNAVAILABLE): {name="SolverUnavailable"; break;}
  default:                         {name="Unknown";           break;}
  }
  return name;
}

//////////////////////////////////////////////////////////////////
/// \brief Dynamically appends pointer to array
/// \details Array may be NULL (with size 0) on first call
///
/// \param **&pArr [in & out] array of pointers
/// \param *xptr [in] pointer to be appended
/// \param &size [in & out] Integer size of array
/// \return Boolean indicating success of method
//
bool DynArrayAppend(void **& pArr, void *xptr,int &size)
{
  void **tmp=NULL;
  if (xptr==NULL){return false;}
  if ((pArr==NULL) && (size>0)) {return false;}
  size=size+1;
  tmp=new void *[size+1];
  for (int i=0; i<(size-1); i++){
    tmp[i]=pArr[i];
  }
  tmp[size-1]=xptr;
  if (size>1){delete [] pArr; pArr=NULL;}
  pArr=tmp;
  return true;
}

//////////////////////////////////////////////////////////////////
/// \brief returns true if line is empty, begins with '#' or '*'
/// \param &s [in] first string token in file line
/// \param Len length of line
/// \return true if line is empty or a comment
//
bool IsComment(const char *s, const int Len)
{
  if ((Len==0) || (s[0]=='#') || (s[0]=='*')){return true;}
  return false;
}

//////////////////////////////////////////////////////////////////
/// \brief converts string to uppercase
//
string StringToUppercase(const string &s)
{
  string ret(s.size(), char());
  for(int i = 0; i < (int)(s.size()); ++i){
    ret[i] = (s[i] <= 'z' && s[i] >= 'a') ? s[i]-('a'-'A') : s[i];
  }
  return ret;
}

/////////////////////////////////////////////////////////////////
/// \brief writes warning to screen and to Macaw_errors.txt file
/// \param warn [in] warning message printed
//
void WriteWarning(const string warn, bool noisy)
{
  if (!g_suppress_warnings){
    lock_guard<mutex> lock(g_log_mutex);
    ofstream WARNINGS;
    WARNINGS.open((g_output_directory+"Macaw_errors.txt").c_str(),ios::app);
    if (noisy){cout<<"WARNING!: "<<warn<<endl;}
    WARNINGS<<"WARNING  : "<<warn<<endl;
    WARNINGS.close();
  }
}
/////////////////////////////////////////////////////////////////
/// \brief writes advisory to screen and to Macaw_errors.txt file
/// \param warn [in] warning message printed
//
void WriteAdvisory(const string warn, bool noisy)
{
  if (!g_suppress_warnings){
    lock_guard<mutex> lock(g_log_mutex);
    ofstream WARNINGS;
    WARNINGS.open((g_output_directory+"Macaw_errors.txt").c_str(),ios::app);
    if (noisy){cout<<"ADVISORY: "<<warn<<endl;}
    WARNINGS<<"ADVISORY : "<<warn<<endl;
    WARNINGS.close();
  }
}
/////////////////////////////////////////////////////////////////
/// \brief appends error statement to Macaw_errors.txt file
/// \details used by FinalizeGracefully(); returns false if log cannot be opened
//
bool WriteErrorToLog(const string statement, const bool done)
{
  lock_guard<mutex> lock(g_log_mutex);
  ofstream WARNINGS;
  WARNINGS.open((g_output_directory+"Macaw_errors.txt").c_str(),ios::app);
  if (WARNINGS.fail()){return false;}
  if (!done){WARNINGS<<"ERROR    : "<<statement<<endl;}
  else      {WARNINGS<<"RUN COMPLETE :)"<<endl;}
  WARNINGS.close();
  return true;
}

//////////////////////////////////////////////////////////////////
/// \brief returns directory path given filename
///
/// \param fname [in] filename, e.g., /temp/thisfile.txt returns /temp
//
string GetDirectoryName(const string &fname)
{
  size_t pos = fname.find_last_of("\\/");
  if (std::string::npos == pos){ return ""; }
  else                         { return fname.substr(0, pos);}
}

//////////////////////////////////////////////////////////////////
/// \brief returns path of filename relative to reference file
/// \details if filename = something.txt and relfile= ../dir/myfile.mci, returns ../dir/something.txt.
/// absolute filenames are returned unchanged
///
/// \param filename [in] filename
/// \param relfile [in] filename of reference file
//
string CorrectForRelativePath(const string filename,const string relfile)
{
  string filedir = GetDirectoryName(relfile);
  if (filedir==""){return filename;}

  if (StringToUppercase(filename).find(StringToUppercase(filedir)) == string::npos)
  {
    string firstchar  = filename.substr(0, 1);   // if '/' --> absolute path on UNIX systems
    string secondchar = (filename.size()>1) ? filename.substr(1, 1) : ""; // if ':' --> absolute path on WINDOWS system

    if ( (firstchar.compare("/") != 0) && (secondchar.compare(":") != 0) ){
      return filedir + "/" + filename;
    }
  }
  return filename;
}

//////////////////////////////////////////////////////////////////
/// \brief sets all run options to default values
/// \param &Options [out] run options
//
void InitializeOptions(optStruct &Options)
{
  Options.version          =__MACAW_VERSION__;
  Options.mci_filename     ="";
  Options.mcp_filename     ="";
  Options.output_dir       ="";
  Options.main_output_dir  ="";
  Options.run_name         ="";

  Options.silent           =false;
  Options.noisy            =false;
  Options.suppress_warnings=false;
  Options.debug_level      =0;
  Options.write_netcdf     =false;

  Options.start_year       =DOESNT_EXIST;
  Options.end_year         =DOESNT_EXIST;
  Options.model_years.clear();
  Options.base_year        =DOESNT_EXIST;
  Options.discount_rate    =DEFAULT_DISCOUNT_RATE;

  Options.allow_shortfall  =false;
  Options.slack_penalty    =DEFAULT_SLACK_PENALTY;
  Options.default_ramp_rate=DEFAULT_RAMP_RATE;
  Options.extrapolation    =EXTRAP_FLAT;
  Options.vintage_policy   =VINTAGE_EXCLUSIVE;

  Options.solver_order.clear();
  Options.solver_order.push_back("LPSOLVE");
  Options.solver_timeout   =0.0;
  Options.consistency_tol  =DEFAULT_CONSISTENCY_TOL;

  Options.sweep_discount_rates.clear();
  Options.sweep_threads    =0;
}

//////////////////////////////////////////////////////////////////
/// \brief builds ordered list of model years from run options
/// \details explicit :ModelYears list takes precedence over :StartYear/:EndYear
///
/// \param &Options [in] run options
/// \param &years [out] ascending list of unique model years
//
void GetModelYears(const optStruct &Options, vector<int> &years)
{
  years.clear();
  if (!Options.model_years.empty())
  {
    years=Options.model_years;
    sort(years.begin(),years.end());
    years.erase(unique(years.begin(),years.end()),years.end());
  }
  else if ((Options.start_year!=DOESNT_EXIST) && (Options.end_year!=DOESNT_EXIST))
  {
    for (int y=Options.start_year;y<=Options.end_year;y++){years.push_back(y);}
  }
}

//////////////////////////////////////////////////////////////////
/// \brief returns discounting anchor year
/// \return Options.base_year, or first model year if unspecified
//
int GetBaseYear(const optStruct &Options, const vector<int> &years)
{
  if (Options.base_year!=DOESNT_EXIST){return Options.base_year;}
  if (years.empty())                  {return DOESNT_EXIST;}
  return years[0];
}

//////////////////////////////////////////////////////////////////
/// \brief Capital recovery factor
/// \details converts one-time capital outlay into an equal annual payment over the asset life,
/// CRF = r/(1-(1+r)^-L); 1/L when r==0
///
/// \param lifetime [in] asset lifetime [yr]
/// \param r [in] annual discount rate [-]
/// \return capital recovery factor [1/yr]
//
double CapitalRecoveryFactor(const int lifetime, const double r)
{
  ExitGracefullyIf(lifetime<1,"CapitalRecoveryFactor: lifetime must be at least one year",RUNTIME_ERR);
  if (fabs(r)<REAL_SMALL){return 1.0/(double)(lifetime);}
  return r/(1.0-pow(1.0+r,-(double)(lifetime)));
}

//////////////////////////////////////////////////////////////////
/// \brief Discount factor of year relative to base year, (1+r)^-(year-base_year)
//
double DiscountFactor(const int year, const int base_year, const double r)
{
  return pow(1.0+r,-(double)(year-base_year));
}
