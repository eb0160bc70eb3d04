/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  ParseParameterFile.cpp: parameter (.mcp) file
  ----------------------------------------------------------------*/
#include "MacawInclude.h"
#include "PathwayModel.h"
#include "ParseLib.h"

//////////////////////////////////////////////////////////////////
/// \brief reads [year] [value] pairs following the command on a tokenized line
/// \return false if line does not hold complete pairs
//
static bool ParseYearValuePairs(char **s, const int Len, vector<int> &years, vector<double> &values)
{
  years.clear(); values.clear();
  if ((Len<3) || ((Len-1)%2!=0)){return false;}
  for (int i=1;i<Len;i+=2){
    years .push_back(s_to_i(s[i]));
    values.push_back(s_to_d(s[i+1]));
  }
  return true;
}

///////////////////////////////////////////////////////////////////
/// \brief Parses parameter (.mcp) file
/// \details model entities are added to pModel in the order encountered; cross-references
///   (bands of technologies, technologies of links) are resolved later by
///   CPathwayModel::Initialize(), so blocks may appear in any order, except that a
///   :CostTable must follow the :Technology block it refers to.
///
/// \param *&pModel [in/out] model to be populated
/// \param &Options [in] run options
/// \return false if file could not be opened
//
bool ParseParameterFile(CPathwayModel *&pModel, const optStruct &Options)
{
  int          i;
  CTechnology *pTech=NULL;    //technology of open :Technology block
  ifstream     INPUT;
  ifstream     INPUT2;           //For Secondary input
  CParser     *pMainParser=NULL; //for storage of main parser while reading secondary files
  vector<int>    years;
  vector<double> values;
  string       warn;

  int          code;            //Parsing vars
  bool         ended(false);
  int          Len,line(0);
  char        *s[MAXINPUTITEMS];

  if (Options.noisy){
    cout <<"======================================================"<<endl;
    cout <<"Parsing Parameter File " << Options.mcp_filename <<"..."<<endl;
    cout <<"======================================================"<<endl;
  }

  INPUT.open(Options.mcp_filename.c_str());
  if (INPUT.fail()){cout << "Cannot find file "<<Options.mcp_filename <<endl; return false;}

  CParser *p=new CParser(INPUT,Options.mcp_filename,line);

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
      1   thru 10  : baseline
      10  thru 30  : technologies
      30  thru 50  : costs and targets
      50  thru 60  : technology links
      ------------------------------------------------------------------
    */
    code=0;
    //---------------------SPECIAL -----------------------------
    if       (IsComment(s[0],Len))                        {code=-2; }//comment or blank
    else if  (!strcmp(s[0],":End"                       )){code=-3; }//premature end of file
    else if  (!strcmp(s[0],":RedirectToFile"            )){code=-4; }//redirect to secondary file
    //--------------------BASELINE -----------------------------
    else if  (!strcmp(s[0],":BaselineBand"              )){code=1;  }
    else if  (!strcmp(s[0],":BaselineEmissions"         )){code=2;  }
    //--------------------TECHNOLOGIES -------------------------
    else if  (!strcmp(s[0],":Technology"                )){code=10; }
    else if  (!strcmp(s[0],":EndTechnology"             )){code=11; }
    else if  (!strcmp(s[0],":Band"                      )){code=12; }
    else if  (!strcmp(s[0],":Lifetime"                  )){code=13; }
    else if  (!strcmp(s[0],":CommercialYear"            )){code=14; }
    else if  (!strcmp(s[0],":RampRate"                  )){code=15; }
    else if  (!strcmp(s[0],":AdoptionCap"               )){code=16; }
    else if  (!strcmp(s[0],":AbatementFactor"           )){code=17; }
    //--------------------COSTS AND TARGETS --------------------
    else if  (!strcmp(s[0],":CostTable"                 )){code=30; }
    else if  (!strcmp(s[0],":EmissionTargets"           )){code=31; }
    //--------------------LINKS --------------------------------
    else if  (!strcmp(s[0],":MutuallyExclusive"         )){code=50; }
    else if  (!strcmp(s[0],":Coupling"                  )){code=51; }

    if ((code>=12) && (code<=17) && (pTech==NULL)){
      warn="ParseParameterFile: "+string(s[0])+" found outside of a :Technology ... :EndTechnology block";
      ExitGracefully(warn.c_str(),BAD_DATA);
    }

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

      filename=CorrectForRelativePath(filename,Options.mcp_filename);

      INPUT2.open(filename.c_str());
      if (INPUT2.fail()) {
        warn=":RedirectToFile: Cannot find file "+filename;
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
      else {
        if (pMainParser != NULL) {
          ExitGracefully("ParseParameterFile::nested :RedirectToFile commands (in already redirected files) are not allowed.",BAD_DATA);
        }
        pMainParser=p;    //save pointer to primary parser
        p=new CParser(INPUT2,filename,line);//open new parser
      }
      break;
    }
    case(1):  //----------------------------------------------
    {/*:BaselineBand [id] [activity] [intensity]*/
      if (Options.noisy) {cout <<"Baseline band"<<endl;}
      if (Len<4){
        p->ImproperFormat(s);
        ExitGracefully("ParseParameterFile: :BaselineBand requires an identifier, activity and emission intensity",BAD_DATA);
        break;
      }
      pModel->AddBand(new CBaselineBand(s[1],s_to_d(s[2]),s_to_d(s[3])));
      break;
    }
    case(2):  //----------------------------------------------
    {/*:BaselineEmissions [value]*/
      if (Options.noisy) {cout <<"Baseline emissions"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      pModel->SetBaselineEmissions(s_to_d(s[1]));
      break;
    }
    case(10):  //----------------------------------------------
    {/*:Technology [id]*/
      if (Options.noisy) {cout <<"Technology"<<endl;}
      if (pTech!=NULL){
        warn="ParseParameterFile: :Technology "+pTech->GetID()+" is missing its :EndTechnology command";
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
      if (Len<2){
        p->ImproperFormat(s);
        ExitGracefully("ParseParameterFile: :Technology requires an identifier",BAD_DATA);
        break;
      }
      pTech=new CTechnology(s[1]);
      pModel->AddTechnology(pTech);
      break;
    }
    case(11):  //----------------------------------------------
    {/*:EndTechnology*/
      if (Options.noisy) {cout <<"End technology"<<endl;}
      ExitGracefullyIf(pTech==NULL,"ParseParameterFile: :EndTechnology encountered before :Technology",BAD_DATA);
      pTech=NULL;
      break;
    }
    case(12):  //----------------------------------------------
    {/*:Band [band id]*/
      if (Options.noisy) {cout <<"  band"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      pTech->SetBandID(s[1]);
      break;
    }
    case(13):  //----------------------------------------------
    {/*:Lifetime [years]*/
      if (Options.noisy) {cout <<"  lifetime"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      pTech->SetLifetime(s_to_i(s[1]));
      break;
    }
    case(14):  //----------------------------------------------
    {/*:CommercialYear [year]*/
      if (Options.noisy) {cout <<"  commercial year"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      pTech->SetCommercialYear(s_to_i(s[1]));
      break;
    }
    case(15):  //----------------------------------------------
    {/*:RampRate [share per year]*/
      if (Options.noisy) {cout <<"  ramp rate"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      pTech->SetRampRate(s_to_d(s[1]));
      break;
    }
    case(16):  //----------------------------------------------
    {/*:AdoptionCap [y1] [v1] [y2] [v2] ... */
      if (Options.noisy) {cout <<"  adoption cap"<<endl;}
      if (!ParseYearValuePairs(s,Len,years,values)){
        p->ImproperFormat(s);
        warn="ParseParameterFile: :AdoptionCap of technology "+pTech->GetID()+" must be a list of [year] [value] pairs";
        ExitGracefully(warn.c_str(),BAD_DATA);
        break;
      }
      for (i=0;i<(int)(years.size());i++){pTech->AddAdoptionCap(years[i],values[i]);}
      break;
    }
    case(17):  //----------------------------------------------
    {/*:AbatementFactor [y1] [v1] [y2] [v2] ... */
      if (Options.noisy) {cout <<"  abatement factor"<<endl;}
      if (!ParseYearValuePairs(s,Len,years,values)){
        p->ImproperFormat(s);
        warn="ParseParameterFile: :AbatementFactor of technology "+pTech->GetID()+" must be a list of [year] [value] pairs";
        ExitGracefully(warn.c_str(),BAD_DATA);
        break;
      }
      for (i=0;i<(int)(years.size());i++){pTech->AddAbatementFactor(years[i],values[i]);}
      break;
    }
    case(30):  //----------------------------------------------
    {/*:CostTable [tech id]
         [year] [capex] [fixed O&M] [variable O&M] {fuel premium}
         ...
       :EndCostTable
     */
      if (Options.noisy) {cout <<"Cost table"<<endl;}
      if (Len<2){
        p->ImproperFormat(s);
        ExitGracefully("ParseParameterFile: :CostTable requires a technology identifier",BAD_DATA);
        break;
      }
      int ii=pModel->GetTechIndex(s[1]);
      if (ii==DOESNT_EXIST){
        warn="ParseParameterFile: :CostTable refers to unknown technology "+string(s[1])+". Cost tables must follow the technology definition";
        ExitGracefully(warn.c_str(),BAD_DATA);
        break;
      }
      CCostRecord *pCosts=pModel->GetTechnologyToModify(ii)->GetCostRecord();

      bool eof=false;
      while ( (Len==0) || (strcmp(s[0],":EndCostTable")) )
      {
        eof=p->Tokenize(s,Len);
        if (eof) { break; }
        if      (IsComment(s[0], Len)){}//comment line
        else if (!strcmp(s[0],":EndCostTable")){}//done
        else if (s[0][0] == ':') {
          warn="ParseParameterFile: Command found between :CostTable...:EndCostTable commands at line "+to_string(p->GetLineNumber())+" of .mcp file";
          ExitGracefully(warn.c_str(),BAD_DATA);
        }
        else if (Len==5){pCosts->AddYear(s_to_i(s[0]),s_to_d(s[1]),s_to_d(s[2]),s_to_d(s[3]),s_to_d(s[4]));}
        else if (Len==4){pCosts->AddYear(s_to_i(s[0]),s_to_d(s[1]),s_to_d(s[2]),s_to_d(s[3]));}
        else {
          p->ImproperFormat(s);
          warn="ParseParameterFile: cost table rows must contain [year] [capex] [fixed O&M] [variable O&M] {fuel premium} (line "+to_string(p->GetLineNumber())+")";
          ExitGracefully(warn.c_str(),BAD_DATA);
        }
      }
      ExitGracefullyIf(eof,"ParseParameterFile: :CostTable is missing its :EndCostTable command",BAD_DATA);
      break;
    }
    case(31):  //----------------------------------------------
    {/*:EmissionTargets
         [year] [emission ceiling]
         ...
       :EndEmissionTargets
     */
      if (Options.noisy) {cout <<"Emission targets"<<endl;}
      bool eof=false;
      while ( (Len==0) || (strcmp(s[0],":EndEmissionTargets")) )
      {
        eof=p->Tokenize(s,Len);
        if (eof) { break; }
        if      (IsComment(s[0], Len)){}//comment line
        else if (!strcmp(s[0],":EndEmissionTargets")){}//done
        else if (s[0][0] == ':') {
          warn="ParseParameterFile: Command found between :EmissionTargets...:EndEmissionTargets commands at line "+to_string(p->GetLineNumber())+" of .mcp file";
          ExitGracefully(warn.c_str(),BAD_DATA);
        }
        else if (Len>=2){pModel->AddTarget(s_to_i(s[0]),s_to_d(s[1]));}
        else {
          p->ImproperFormat(s);
          ExitGracefully("ParseParameterFile: emission target rows must contain [year] [emission ceiling]",BAD_DATA);
        }
      }
      ExitGracefullyIf(eof,"ParseParameterFile: :EmissionTargets is missing its :EndEmissionTargets command",BAD_DATA);
      break;
    }
    case(50):  //----------------------------------------------
    {/*:MutuallyExclusive [tech1] [tech2] ... [techN]*/
      if (Options.noisy) {cout <<"Mutually exclusive technologies"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      string *aIDs=new string[Len-1];
      for (i=1;i<Len;i++){aIDs[i-1]=s[i];}
      pModel->AddLink(new CTechLink(LINK_MUTUALLY_EXCLUSIVE,aIDs,Len-1));
      delete [] aIDs;
      break;
    }
    case(51):  //----------------------------------------------
    {/*:Coupling [primary] [secondary]*/
      if (Options.noisy) {cout <<"Coupling"<<endl;}
      if (Len<2){p->ImproperFormat(s); break;}
      if (Len!=3){p->ImproperFormat(s);}
      string *aIDs=new string[Len-1];
      for (i=1;i<Len;i++){aIDs[i-1]=s[i];}
      pModel->AddLink(new CTechLink(LINK_COUPLING,aIDs,Len-1));
      delete [] aIDs;
      break;
    }
    default://----------------------------------------------
    {
      if (s[0][0]==':')
      {
        warn ="IGNORING unrecognized command: " + string(s[0])+ " in .mcp file";
        WriteWarning(warn,Options.noisy);
      }
      else
      {
        warn = "Unrecognized command in .mcp file:\n   " + string(s[0]);
        ExitGracefully(warn.c_str(),BAD_DATA_WARN);
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

  if (pTech!=NULL){
    warn="ParseParameterFile: :Technology "+pTech->GetID()+" is missing its :EndTechnology command";
    ExitGracefully(warn.c_str(),BAD_DATA);
  }
  return true;
}
