/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include "LinearProgram.h"

//////////////////////////////////////////////////////////////////
/// \brief Constructor
/// \param name [in] problem name
/// \param nCols [in] number of decision variables; all default to [0,inf) with zero cost
//
CLinearProgram::CLinearProgram(const string name, const int nCols)
{
  ExitGracefullyIf(nCols<1,"CLinearProgram: no decision variables",RUNTIME_ERR);
  _name =name;
  _nCols=nCols;
  _aCols=new lp_column[_nCols];
  for (int c=0;c<_nCols;c++){
    _aCols[c].name ="C"+to_string(c+1);
    _aCols[c].lower=0.0;
    _aCols[c].upper=ALMOST_INF;
    _aCols[c].obj  =0.0;
  }
  _pRows    =NULL;
  _nRows    =0;
  _finalized=false;
}
//////////////////////////////////////////////////////////////////
CLinearProgram::~CLinearProgram()
{
  for (int r=0;r<_nRows;r++){
    delete [] _pRows[r]->aCols;
    delete [] _pRows[r]->aVals;
    delete _pRows[r];
  }
  delete [] _pRows; _pRows=NULL;
  delete [] _aCols; _aCols=NULL;
}
//////////////////////////////////////////////////////////////////
string CLinearProgram::GetName      () const {return _name;}
int    CLinearProgram::GetNumColumns() const {return _nCols;}
int    CLinearProgram::GetNumRows   () const {return _nRows;}
bool   CLinearProgram::IsFinalized  () const {return _finalized;}
//////////////////////////////////////////////////////////////////
int CLinearProgram::GetNumNonZeros() const
{
  int nnz=0;
  for (int r=0;r<_nRows;r++){nnz+=_pRows[r]->nEntries;}
  return nnz;
}
//////////////////////////////////////////////////////////////////
const lp_column &CLinearProgram::GetColumn(const int c) const
{
  ExitGracefullyIf((c<0) || (c>=_nCols),"CLinearProgram::GetColumn: bad column index",RUNTIME_ERR);
  return _aCols[c];
}
//////////////////////////////////////////////////////////////////
const lp_row &CLinearProgram::GetRow(const int r) const
{
  ExitGracefullyIf((r<0) || (r>=_nRows),"CLinearProgram::GetRow: bad row index",RUNTIME_ERR);
  return *(_pRows[r]);
}
//////////////////////////////////////////////////////////////////
/// \brief returns index of row with given name, or DOESNT_EXIST
//
int CLinearProgram::GetRowIndex(const string &name) const
{
  for (int r=0;r<_nRows;r++){
    if (_pRows[r]->name==name){return r;}
  }
  return DOESNT_EXIST;
}
//////////////////////////////////////////////////////////////////
const arma::sp_mat &CLinearProgram::GetMatrix() const
{
  ExitGracefullyIf(!_finalized,"CLinearProgram::GetMatrix: problem not finalized",RUNTIME_ERR);
  return _A;
}

//////////////////////////////////////////////////////////////////
/// \brief sets name, bounds and objective coefficient of column c
//
void CLinearProgram::SetColumn(const int c, const string name, const double lower, const double upper, const double obj)
{
  ExitGracefullyIf((c<0) || (c>=_nCols),"CLinearProgram::SetColumn: bad column index",RUNTIME_ERR);
  _aCols[c].name =name;
  _aCols[c].lower=lower;
  _aCols[c].upper=upper;
  _aCols[c].obj  =obj;
}
//////////////////////////////////////////////////////////////////
void CLinearProgram::SetBounds(const int c, const double lower, const double upper)
{
  ExitGracefullyIf((c<0) || (c>=_nCols),"CLinearProgram::SetBounds: bad column index",RUNTIME_ERR);
  ExitGracefullyIf(upper<lower,"CLinearProgram::SetBounds: upper bound below lower bound",RUNTIME_ERR);
  _aCols[c].lower=lower;
  _aCols[c].upper=upper;
}
//////////////////////////////////////////////////////////////////
void CLinearProgram::SetUpperBound(const int c, const double upper)
{
  ExitGracefullyIf((c<0) || (c>=_nCols),"CLinearProgram::SetUpperBound: bad column index",RUNTIME_ERR);
  _aCols[c].upper=max(upper,_aCols[c].lower);
}
//////////////////////////////////////////////////////////////////
void CLinearProgram::AddToObjective(const int c, const double coeff)
{
  ExitGracefullyIf((c<0) || (c>=_nCols),"CLinearProgram::AddToObjective: bad column index",RUNTIME_ERR);
  _aCols[c].obj+=coeff;
}

//////////////////////////////////////////////////////////////////
/// \brief appends named constraint row
///
/// \param name [in] row name
/// \param n [in] number of non-zero coefficients
/// \param *aCols [in] column indices (0-based) [size: n]
/// \param *aVals [in] coefficients [size: n]
/// \param type [in] comparison type
/// \param rhs [in] right hand side
/// \return index of new row
//
int CLinearProgram::AddRow(const string name, const int n, const int *aCols, const double *aVals,
                           const row_type type, const double rhs)
{
  ExitGracefullyIf(_finalized,"CLinearProgram::AddRow: cannot add rows to finalized problem",RUNTIME_ERR);
  lp_row *pRow=new lp_row;
  pRow->name    =name;
  pRow->type    =type;
  pRow->rhs     =rhs;
  pRow->nEntries=n;
  pRow->aCols   =new int   [max(n,1)];
  pRow->aVals   =new double[max(n,1)];
  for (int j=0;j<n;j++)
  {
    ExitGracefullyIf((aCols[j]<0) || (aCols[j]>=_nCols),("CLinearProgram::AddRow: bad column index in row "+name).c_str(),RUNTIME_ERR);
    pRow->aCols[j]=aCols[j];
    pRow->aVals[j]=aVals[j];
  }
  if (!DynArrayAppend((void**&)(_pRows),(void*)(pRow),_nRows)){
    ExitGracefully("CLinearProgram::AddRow: adding NULL row",RUNTIME_ERR);
  }
  return _nRows-1;
}

//////////////////////////////////////////////////////////////////
/// \brief builds sparse constraint matrix from rows; no rows may be added afterward
/// \details repeated (row,column) entries are summed
//
void CLinearProgram::Finalize()
{
  int nnz=GetNumNonZeros();
  if (nnz==0){
    _A=arma::sp_mat(_nRows,_nCols);
  }
  else
  {
    arma::umat locations(2,nnz);
    arma::vec  values(nnz);
    int n=0;
    for (int r=0;r<_nRows;r++){
      for (int j=0;j<_pRows[r]->nEntries;j++){
        locations(0,n)=(arma::uword)(r);
        locations(1,n)=(arma::uword)(_pRows[r]->aCols[j]);
        values(n)     =_pRows[r]->aVals[j];
        n++;
      }
    }
    _A=arma::sp_mat(true,locations,values,_nRows,_nCols);
  }
  _finalized=true;
}

//////////////////////////////////////////////////////////////////
/// \brief returns objective function value c'x
//
double CLinearProgram::GetObjectiveValue(const arma::vec &x) const
{
  ExitGracefullyIf((int)(x.n_elem)!=_nCols,"CLinearProgram::GetObjectiveValue: solution vector wrong size",RUNTIME_ERR);
  double sum=0.0;
  for (int c=0;c<_nCols;c++){sum+=_aCols[c].obj*x(c);}
  return sum;
}
//////////////////////////////////////////////////////////////////
/// \brief returns row activities Ax
//
arma::vec CLinearProgram::GetRowActivities(const arma::vec &x) const
{
  ExitGracefullyIf((int)(x.n_elem)!=_nCols,"CLinearProgram::GetRowActivities: solution vector wrong size",RUNTIME_ERR);
  return GetMatrix()*x;
}
//////////////////////////////////////////////////////////////////
/// \brief returns amount by which row r is violated given its activity (0 if satisfied)
//
double CLinearProgram::GetRowViolation(const int r, const double activity) const
{
  const lp_row &row=GetRow(r);
  double resid=activity-row.rhs;
  if      (row.type==ROW_LE){return max(resid,0.0);}
  else if (row.type==ROW_GE){return max(-resid,0.0);}
  return fabs(resid);
}
//////////////////////////////////////////////////////////////////
/// \brief returns largest absolute constraint violation of solution x
/// \param &worst_row [out] index of most violated row (DOESNT_EXIST if no rows)
//
double CLinearProgram::GetMaxRowViolation(const arma::vec &x, int &worst_row) const
{
  arma::vec act=GetRowActivities(x);
  double maxviol=0.0;
  worst_row=DOESNT_EXIST;
  for (int r=0;r<_nRows;r++)
  {
    double viol=GetRowViolation(r,act(r));
    if ((worst_row==DOESNT_EXIST) || (viol>maxviol)){maxviol=viol; worst_row=r;}
  }
  return maxviol;
}

//////////////////////////////////////////////////////////////////
/// \brief writes lp matrix to file in .csv format
/// \details used in debugging; first row is the objective function
/// \param filename [in] full path of .csv file
//
void CLinearProgram::WriteMatrix(const string filename) const
{
  ofstream LPMAT;
  LPMAT.open(filename.c_str());
  if (LPMAT.fail()){
    ExitGracefully(("CLinearProgram::WriteMatrix: Unable to open output file "+filename+" for writing.").c_str(),FILE_OPEN_ERR);
  }
  int c,r,j;
  double *val=new double[_nCols];

  LPMAT<<"rowname,";
  for (c=0;c<_nCols;c++){LPMAT<<_aCols[c].name<<",";}
  LPMAT<<"compare,RHS"<<endl;

  LPMAT<<"Objective,";
  for (c=0;c<_nCols;c++){LPMAT<<_aCols[c].obj<<",";}
  LPMAT<<"min,"<<endl;

  string comp;
  for (r=0;r<_nRows;r++)
  {
    for (c=0;c<_nCols;c++){val[c]=0.0;}
    for (j=0;j<_pRows[r]->nEntries;j++){val[_pRows[r]->aCols[j]]+=_pRows[r]->aVals[j];}

    LPMAT<<_pRows[r]->name<<",";
    for (c=0;c<_nCols;c++){LPMAT<<val[c]<<",";}
    if      (_pRows[r]->type==ROW_LE){comp="<=";}
    else if (_pRows[r]->type==ROW_GE){comp=">=";}
    else                             {comp="==";}
    LPMAT<<comp<<","<<_pRows[r]->rhs<<endl;
  }
  LPMAT<<"lower,";
  for (c=0;c<_nCols;c++){LPMAT<<_aCols[c].lower<<",";}
  LPMAT<<","<<endl;
  LPMAT<<"upper,";
  for (c=0;c<_nCols;c++){LPMAT<<_aCols[c].upper<<",";}
  LPMAT<<","<<endl;

  LPMAT.close();
  delete [] val;
}
