/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  LinearProgram.h
  ----------------------------------------------------------------*/
#ifndef LINEAR_PROGRAM_H
#define LINEAR_PROGRAM_H

#include "MacawInclude.h"
#include <armadillo>

///////////////////////////////////////////////////////////////////
/// \brief constraint row comparison types
//
enum row_type
{
  ROW_LE,   ///< sum(a_j x_j) <= rhs
  ROW_GE,   ///< sum(a_j x_j) >= rhs
  ROW_EQ    ///< sum(a_j x_j) == rhs
};

//////////////////////////////////////////////////////////////////
/// \brief decision variable (column) of linear program
//
struct lp_column
{
  string name;     ///< column name (e.g., "CAP_H2DRI_2030")
  double lower;    ///< lower bound
  double upper;    ///< upper bound (ALMOST_INF if unbounded)
  double obj;      ///< objective function coefficient
};

//////////////////////////////////////////////////////////////////
/// \brief named constraint row of linear program
//
struct lp_row
{
  string   name;       ///< row name (e.g., "VINTAGE_H2DRI_2030")
  row_type type;       ///< comparison type
  double   rhs;        ///< right hand side
  int      nEntries;   ///< number of non-zero coefficients
  int     *aCols;      ///< column indices (0-based) [size: nEntries]
  double  *aVals;      ///< coefficients [size: nEntries]
};

///////////////////////////////////////////////////////////////////
/// \brief Direct representation of a minimization linear program
/// \details columns (variable list with bounds and objective coefficients),
///   named constraint rows stored row-wise for submission to a backend, and the
///   equivalent sparse constraint matrix used for residual evaluation
//
class CLinearProgram
{
private:/*------------------------------------------------------*/
  string        _name;       ///< problem name
  lp_column    *_aCols;      ///< array of columns [size: _nCols]
  int           _nCols;      ///< number of columns
  lp_row      **_pRows;      ///< array of pointers to rows [size: _nRows]
  int           _nRows;      ///< number of rows
  arma::sp_mat  _A;          ///< sparse constraint matrix [_nRows x _nCols] (valid once finalized)
  bool          _finalized;  ///< true once Finalize() has been called

  CLinearProgram(const CLinearProgram &lp); //suppresses default copy constructor

public:/*-------------------------------------------------------*/
  CLinearProgram(const string name, const int nCols);
  ~CLinearProgram();

  //Accessors
  string              GetName          () const;
  int                 GetNumColumns    () const;
  int                 GetNumRows       () const;
  int                 GetNumNonZeros   () const;
  const lp_column    &GetColumn        (const int c) const;
  const lp_row       &GetRow           (const int r) const;
  int                 GetRowIndex      (const string &name) const;
  bool                IsFinalized      () const;
  const arma::sp_mat &GetMatrix        () const;

  double              GetObjectiveValue (const arma::vec &x) const;
  arma::vec           GetRowActivities  (const arma::vec &x) const;
  double              GetRowViolation   (const int r, const double activity) const;
  double              GetMaxRowViolation(const arma::vec &x, int &worst_row) const;

  //Manipulators
  void                SetColumn        (const int c, const string name, const double lower, const double upper, const double obj);
  void                SetBounds        (const int c, const double lower, const double upper);
  void                SetUpperBound    (const int c, const double upper);
  void                AddToObjective   (const int c, const double coeff);
  int                 AddRow           (const string name, const int n, const int *aCols, const double *aVals,
                                        const row_type type, const double rhs);
  void                Finalize         ();

  void                WriteMatrix      (const string filename) const;
};

#endif
