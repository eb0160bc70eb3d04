/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  ParseLib.h
  ----------------------------------------------------------------*/
#ifndef PARSELIB_H
#define PARSELIB_H

#include "MacawInclude.h"

/*****************************************************************
 Class CParser
------------------------------------------------------------------
 Reads keyword-driven input files line by line, tokenizing each
 line into space-, tab- or comma-delimited words
******************************************************************/
class CParser
{
private:/*-------------------------------------------------------*/
  ifstream *_INPUT;                         ///< input file stream
  string    _filename;                      ///< name of file being parsed
  int       _lineno;                        ///< current line number
  char      _wholeline[MAXCHARINLINE];      ///< buffer of most recently tokenized line

public:/*-------------------------------------------------------*/
  CParser(ifstream &FILE, string filename, const int i);

  int       GetLineNumber () const;
  string    GetFilename   () const;

  bool      Tokenize      (char **out, int &numwords);
  void      ImproperFormat(char **s);
};

#endif
