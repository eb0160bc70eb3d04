/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/

#include "ParseLib.h"

/*----------------------------------------------------------------
  Constructor
  -----------------------------------------------------------------------*/
CParser::CParser(ifstream &FILE, string filename, const int i)
{
  _filename=filename;
  _INPUT =&FILE;
  _lineno=i;
  _wholeline[0]=0;
}
/*----------------------------------------------------------------
  Basic Member Functions
  -----------------------------------------------------------------------*/
int    CParser::GetLineNumber () const         {return _lineno;}
//-----------------------------------------------------------------------
string CParser::GetFilename   () const         {return _filename;}
/*----------------------------------------------------------------
  Tokenize
  ----------------------------------------------------------------
  tokenizes a sentence delimited by spaces, tabs, commas & return characters
  content after a '#' is ignored

  parameters:
  out is the array of strings in the line (pointing into the parser's line buffer)
  numwords is the number of strings in the line
  returns true if file has ended
  -------------------------------------------------------------------------*/
bool CParser::Tokenize(char **out, int &numwords)
{
  const char *delimiters=" \t,\r\n";
  char *p;
  int   ct(0);

  numwords=0;
  _wholeline[0]=0;
  if (_INPUT->eof()){return true;}
  _INPUT->getline(_wholeline,MAXCHARINLINE);
  if (_INPUT->fail()){
    return true; //handles blank line at end of file
  }
  _lineno++;

  if (_wholeline[0] == 0) {return false;}

  p=strtok(_wholeline, delimiters);
  while (p){
    if (p[0]=='#'){break;} //ignore all content after '#'
    if (ct>=MAXINPUTITEMS){
      string warn="Tokenize:: exceeded maximum number of items in single line in file "+_filename;
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
    out[ct]=p;
    ct++;
    p=strtok(NULL, delimiters);
  }
  numwords=ct;
  return false;
}
/*----------------------------------------------------------------*/
void   CParser::ImproperFormat(char **s)
{
  string warn="line "+to_string(_lineno)+" in file "+_filename+" is wrong length ("+string(s[0])+")";
  WriteWarning(warn,true);
}
