/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  PathwayOutput.cpp: CSV, netCDF and screen output of pathway results
  ----------------------------------------------------------------*/
#include "PathwayResults.h"
#if defined(_WIN32)
#include <direct.h>
#else
#include <sys/stat.h>
#endif

const double NETCDF_BLANK_VALUE=-9999.0; ///< fill value of netCDF output

//////////////////////////////////////////////////////////////////
/// \brief adds output directory and run name prefix to file name
///
/// \param filebase [in] base filename, with extension, no directory information
/// \param &Options [in] global options structure
//
string FilenamePrepare(string filebase, const optStruct &Options)
{
  string fn;
  if (Options.run_name==""){fn=Options.output_dir+filebase;}
  else                     {fn=Options.output_dir+Options.run_name+"_"+filebase;}
  return fn;
}

//////////////////////////////////////////////////////////////////
/// \brief creates output directory (if it doesn't exist) and redirects error log
//
void PrepareOutputdirectory(const optStruct &Options)
{
  if (Options.output_dir!="")
  {
#if defined(_WIN32)
    _mkdir(Options.output_dir.c_str());
#else
    mkdir(Options.output_dir.c_str(),0777);
#endif
  }
  g_output_directory=Options.main_output_dir;
}

//////////////////////////////////////////////////////////////////
/// \brief converts netCDF error code into Macaw error
//
void HandleNetCDFErrors(int error_code)
{
#ifdef _MCNETCDF_
  if (error_code==0){return;}
  string warn="NetCDF error ["+string(nc_strerror(error_code))+"] occured.";
  ExitGracefully(warn.c_str(),FILE_OPEN_ERR);
#endif
}

//////////////////////////////////////////////////////////////////
/// \brief writes all output files of a completed run
//
void CPathwayResults::WriteOutput(const optStruct &Options) const
{
  WriteSolveStatus(Options);
  if (IsOptimal())
  {
    WriteCSVOutput(Options);
    WriteMACCCurve(Options);
    if (Options.write_netcdf){WriteNetCDFOutput(Options);}
  }
}

//////////////////////////////////////////////////////////////////
/// \brief writes SolveStatus.txt
//
void CPathwayResults::WriteSolveStatus(const optStruct &Options) const
{
  string tmpFilename=FilenamePrepare("SolveStatus.txt",Options);
  ofstream STATUS;
  STATUS.open(tmpFilename.c_str());
  if (STATUS.fail()){
    ExitGracefully(("CPathwayResults::WriteSolveStatus: Unable to open output file "+tmpFilename+" for writing.").c_str(),FILE_OPEN_ERR);
  }
  STATUS<<":Status        "<<GetStatusName(_status)<<endl;
  STATUS<<":Backend       "<<((_backend=="") ? "NONE" : _backend)<<endl;
  STATUS<<":DiscountRate  "<<_discount_rate<<endl;
  if (IsOptimal()){
    STATUS.precision(12);
    STATUS<<":Objective     "<<_objective<<endl;
    STATUS<<":TotalShortfall "<<GetTotalShortfall()<<endl;
    STATUS<<":MaxRowViolation "<<_max_row_violation;
    if (_worst_row!=""){STATUS<<" "<<_worst_row;}
    STATUS<<endl;
  }
  if (_message!=""){STATUS<<":Message       "<<_message<<endl;}
  STATUS.close();
}

//////////////////////////////////////////////////////////////////
/// \brief writes PathwayResults.csv, AnnualSummary.csv and BandUtilization.csv
//
void CPathwayResults::WriteCSVOutput(const optStruct &Options) const
{
  int i,k,b;
  string tmpFilename;

  //PathwayResults.csv
  //--------------------------------------------------------------
  tmpFilename=FilenamePrepare("PathwayResults.csv",Options);
  ofstream PATHWAY;
  PATHWAY.open(tmpFilename.c_str());
  if (PATHWAY.fail()){
    ExitGracefully(("CPathwayResults::WriteCSVOutput: Unable to open output file "+tmpFilename+" for writing.").c_str(),FILE_OPEN_ERR);
  }
  PATHWAY<<"year,technology,band,installed,in-service,share,production,abatement,annualized cost,discounted cost,LCOA"<<endl;
  PATHWAY.precision(10);
  for (k=0;k<_nYears;k++){
    for (i=0;i<_nTechs;i++){
      PATHWAY<<_aYears[k]<<","<<_aTechIDs[i]<<","<<_aBandIDs[_aBandOf[i]];
      PATHWAY<<","<<_aInstalled [i][k]<<","<<_aCapacity [i][k]<<","<<_aShare    [i][k];
      PATHWAY<<","<<_aProduction[i][k]<<","<<_aAbatement[i][k];
      PATHWAY<<","<<_aAnnualCost[i][k]<<","<<_aDiscCost [i][k]<<","<<_aLCOA     [i][k]<<endl;
    }
  }
  PATHWAY.close();

  //AnnualSummary.csv
  //--------------------------------------------------------------
  tmpFilename=FilenamePrepare("AnnualSummary.csv",Options);
  ofstream SUMMARY;
  SUMMARY.open(tmpFilename.c_str());
  if (SUMMARY.fail()){
    ExitGracefully(("CPathwayResults::WriteCSVOutput: Unable to open output file "+tmpFilename+" for writing.").c_str(),FILE_OPEN_ERR);
  }
  SUMMARY<<"year,baseline,target,required,achieved,shortfall,emissions,discounted cost"<<endl;
  SUMMARY.precision(10);
  for (k=0;k<_nYears;k++){
    SUMMARY<<_aYears[k]<<","<<_baseline<<","<<_aTarget[k]<<","<<_aRequired[k];
    SUMMARY<<","<<_aAchieved[k]<<","<<_aShortfall[k]<<","<<_aEmissions[k]<<","<<_aYearCost[k]<<endl;
  }
  SUMMARY.close();

  //BandUtilization.csv
  //--------------------------------------------------------------
  tmpFilename=FilenamePrepare("BandUtilization.csv",Options);
  ofstream BANDS;
  BANDS.open(tmpFilename.c_str());
  if (BANDS.fail()){
    ExitGracefully(("CPathwayResults::WriteCSVOutput: Unable to open output file "+tmpFilename+" for writing.").c_str(),FILE_OPEN_ERR);
  }
  BANDS<<"year,band,activity,technology production,residual"<<endl;
  BANDS.precision(10);
  for (k=0;k<_nYears;k++){
    for (b=0;b<_nBands;b++){
      BANDS<<_aYears[k]<<","<<_aBandIDs[b]<<","<<_aActivity[b];
      BANDS<<","<<_aActivity[b]-_aResidual[b][k]<<","<<_aResidual[b][k]<<endl;
    }
  }
  BANDS.close();
}

//////////////////////////////////////////////////////////////////
/// \brief writes MACCCurve.csv, the marginal abatement cost curve of each model year
/// \details deployed technologies (production above MACC_MIN_PRODUCTION) are ranked by
///   levelized cost of abatement, cheapest first, with running totals of abatement and production
//
void CPathwayResults::WriteMACCCurve(const optStruct &Options) const
{
  const double MACC_MIN_PRODUCTION=1e-3;

  string tmpFilename=FilenamePrepare("MACCCurve.csv",Options);
  ofstream MACC;
  MACC.open(tmpFilename.c_str());
  if (MACC.fail()){
    ExitGracefully(("CPathwayResults::WriteMACCCurve: Unable to open output file "+tmpFilename+" for writing.").c_str(),FILE_OPEN_ERR);
  }
  MACC<<"year,rank,technology,LCOA,abatement,cumulative abatement,production,cumulative production"<<endl;
  MACC.precision(10);

  vector<pair<double,int> > deployed;
  for (int k=0;k<_nYears;k++)
  {
    deployed.clear();
    for (int i=0;i<_nTechs;i++){
      if (_aProduction[i][k]>MACC_MIN_PRODUCTION){deployed.push_back(make_pair(_aLCOA[i][k],i));}
    }
    sort(deployed.begin(),deployed.end());

    double cum_abate=0.0,cum_prod=0.0;
    for (size_t r=0;r<deployed.size();r++)
    {
      int i=deployed[r].second;
      cum_abate+=_aAbatement [i][k];
      cum_prod +=_aProduction[i][k];
      MACC<<_aYears[k]<<","<<r+1<<","<<_aTechIDs[i]<<","<<_aLCOA[i][k];
      MACC<<","<<_aAbatement[i][k]<<","<<cum_abate<<","<<_aProduction[i][k]<<","<<cum_prod<<endl;
    }
  }
  MACC.close();
}

#ifdef _MCNETCDF_
//////////////////////////////////////////////////////////////////
/// \brief defines a [year x technology] variable with attributes
/// \return netCDF variable id
//
static int NetCDFAddPathwayVar(const int ncid,const int year_dimid,const int tech_dimid,
                               string shortname,string longname,string units)
{
  int    varid(0),retval;
  int    dimids2[2];
  static double fill_val[]={NETCDF_BLANK_VALUE};

  dimids2[0]=year_dimid;
  dimids2[1]=tech_dimid;
  retval = nc_def_var(ncid,shortname.c_str(),NC_DOUBLE,2,dimids2,&varid);                       HandleNetCDFErrors(retval);
  retval = nc_put_att_text  (ncid,varid,"units",     units.length(),   units.c_str());          HandleNetCDFErrors(retval);
  retval = nc_put_att_text  (ncid,varid,"long_name", longname.length(),longname.c_str());       HandleNetCDFErrors(retval);
  retval = nc_put_att_double(ncid,varid,"_FillValue",NC_DOUBLE,1,      fill_val);               HandleNetCDFErrors(retval);
  return varid;
}
#endif

//////////////////////////////////////////////////////////////////
/// \brief writes Pathway.nc
/// \details technology identifiers are stored as a comma-delimited global attribute
//
void CPathwayResults::WriteNetCDFOutput(const optStruct &Options) const
{
#ifdef _MCNETCDF_
  int    ncid,retval,i,k;
  int    year_dimid,tech_dimid,ndims1=1;
  int    varid_year,varid_short,varid_emit,varid_ach;
  int    varid_inst,varid_cap,varid_share,varid_prod,varid_abat,varid_cost;
  string tmp;

  string tmpFilename=FilenamePrepare("Pathway.nc",Options);
  retval = nc_create(tmpFilename.c_str(),NC_CLOBBER|NC_NETCDF4,&ncid);  HandleNetCDFErrors(retval);

  // global attributes
  tmp="Macaw deployment pathway";
  retval = nc_put_att_text(ncid,NC_GLOBAL,"title",  tmp.length(),tmp.c_str());                   HandleNetCDFErrors(retval);
  tmp="Macaw version "+Options.version;
  retval = nc_put_att_text(ncid,NC_GLOBAL,"history",tmp.length(),tmp.c_str());                   HandleNetCDFErrors(retval);
  tmp=GetStatusName(_status);
  retval = nc_put_att_text(ncid,NC_GLOBAL,"solve_status",tmp.length(),tmp.c_str());              HandleNetCDFErrors(retval);
  retval = nc_put_att_double(ncid,NC_GLOBAL,"objective",NC_DOUBLE,1,&_objective);                HandleNetCDFErrors(retval);
  retval = nc_put_att_double(ncid,NC_GLOBAL,"discount_rate",NC_DOUBLE,1,&_discount_rate);        HandleNetCDFErrors(retval);
  tmp="";
  for (i=0;i<_nTechs;i++){tmp+=_aTechIDs[i]; if (i<_nTechs-1){tmp+=",";}}
  retval = nc_put_att_text(ncid,NC_GLOBAL,"technologies",tmp.length(),tmp.c_str());              HandleNetCDFErrors(retval);

  // dimensions
  retval = nc_def_dim(ncid,"year",      _nYears,&year_dimid);                                    HandleNetCDFErrors(retval);
  retval = nc_def_dim(ncid,"technology",_nTechs,&tech_dimid);                                    HandleNetCDFErrors(retval);

  // 1D variables
  retval = nc_def_var(ncid,"year",NC_INT,ndims1,&year_dimid,&varid_year);                        HandleNetCDFErrors(retval);
  tmp="year";
  retval = nc_put_att_text(ncid,varid_year,"units",tmp.length(),tmp.c_str());                    HandleNetCDFErrors(retval);
  retval = nc_def_var(ncid,"achieved", NC_DOUBLE,ndims1,&year_dimid,&varid_ach);                 HandleNetCDFErrors(retval);
  retval = nc_def_var(ncid,"shortfall",NC_DOUBLE,ndims1,&year_dimid,&varid_short);               HandleNetCDFErrors(retval);
  retval = nc_def_var(ncid,"emissions",NC_DOUBLE,ndims1,&year_dimid,&varid_emit);                HandleNetCDFErrors(retval);

  // 2D variables
  varid_inst =NetCDFAddPathwayVar(ncid,year_dimid,tech_dimid,"installed", "New capacity installed",           "units yr**-1");
  varid_cap  =NetCDFAddPathwayVar(ncid,year_dimid,tech_dimid,"capacity",  "In-service capacity",              "units yr**-1");
  varid_share=NetCDFAddPathwayVar(ncid,year_dimid,tech_dimid,"share",     "In-service share of band activity","1");
  varid_prod =NetCDFAddPathwayVar(ncid,year_dimid,tech_dimid,"production","Production",                       "units yr**-1");
  varid_abat =NetCDFAddPathwayVar(ncid,year_dimid,tech_dimid,"abatement", "Emission abatement",               "t yr**-1");
  varid_cost =NetCDFAddPathwayVar(ncid,year_dimid,tech_dimid,"discounted_cost","Discounted cost contribution","cost");

  retval = nc_enddef(ncid);  HandleNetCDFErrors(retval);

  size_t start1[1]={0}, count1[1]={(size_t)(_nYears)};
  retval = nc_put_vara_int   (ncid,varid_year, start1,count1,_aYears);     HandleNetCDFErrors(retval);
  retval = nc_put_vara_double(ncid,varid_ach,  start1,count1,_aAchieved);  HandleNetCDFErrors(retval);
  retval = nc_put_vara_double(ncid,varid_short,start1,count1,_aShortfall); HandleNetCDFErrors(retval);
  retval = nc_put_vara_double(ncid,varid_emit, start1,count1,_aEmissions); HandleNetCDFErrors(retval);

  double **aOut[6]={_aInstalled,_aCapacity,_aShare,_aProduction,_aAbatement,_aDiscCost};
  int      aVar[6]={varid_inst, varid_cap, varid_share,varid_prod,varid_abat,varid_cost};
  double  *row=new double[max(_nTechs,1)];
  size_t   start2[2],count2[2];
  for (int v=0;v<6;v++)
  {
    for (k=0;k<_nYears;k++)
    {
      for (i=0;i<_nTechs;i++){row[i]=aOut[v][i][k];}
      start2[0]=k; start2[1]=0;
      count2[0]=1; count2[1]=_nTechs;
      retval = nc_put_vara_double(ncid,aVar[v],start2,count2,row); HandleNetCDFErrors(retval);
    }
  }
  delete [] row;

  retval = nc_close(ncid); HandleNetCDFErrors(retval);
#else
  WriteWarning("CPathwayResults::WriteNetCDFOutput: Macaw was compiled without netCDF support; Pathway.nc not written",Options.noisy);
#endif
}

//////////////////////////////////////////////////////////////////
/// \brief writes short summary of run to screen
//
void CPathwayResults::SummarizeToScreen(const optStruct &Options) const
{
  if (Options.silent){return;}
  cout<<"==MACAW RUN SUMMARY=========================="<<endl;
  cout<<"            Status : "<<GetStatusName(_status)<<endl;
  cout<<"           Backend : "<<((_backend=="") ? "NONE" : _backend)<<endl;
  cout<<"     Discount rate : "<<_discount_rate<<endl;
  if (!IsOptimal()){
    if (_message!=""){cout<<"           Message : "<<_message<<endl;}
    cout<<"============================================="<<endl;
    return;
  }
  cout<<"    Net present cost : "<<_objective<<endl;
  cout<<"     Total shortfall : "<<GetTotalShortfall()<<endl;
  cout<<"   Max row violation : "<<_max_row_violation<<endl;
  if (Options.noisy)
  {
    cout<<"  year    target      achieved     emissions"<<endl;
    for (int k=0;k<_nYears;k++){
      cout<<"  "<<_aYears[k]<<"  "<<_aTarget[k]<<"  "<<_aAchieved[k]<<"  "<<_aEmissions[k]<<endl;
    }
  }
  cout<<"============================================="<<endl;
}
