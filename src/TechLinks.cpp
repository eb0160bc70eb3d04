/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include "TechLinks.h"

//////////////////////////////////////////////////////////////////
/// \brief Constructor
/// \param type [in] link type
/// \param *aIDs [in] array of technology identifiers [size: nIDs]
/// \param nIDs [in] number of technologies
//
CTechLink::CTechLink(const link_type type, const string *aIDs, const int nIDs)
{
  ExitGracefullyIf(nIDs<1,"CTechLink: link must reference at least one technology",BAD_DATA);
  _type     =type;
  _nTechs   =nIDs;
  _aTechIDs =new string[_nTechs];
  _aTechInds=new int   [_nTechs];
  for (int j=0;j<_nTechs;j++){
    _aTechIDs [j]=aIDs[j];
    _aTechInds[j]=DOESNT_EXIST;
  }
}
//////////////////////////////////////////////////////////////////
CTechLink::~CTechLink()
{
  delete [] _aTechIDs;  _aTechIDs=NULL;
  delete [] _aTechInds; _aTechInds=NULL;
}
//////////////////////////////////////////////////////////////////
link_type CTechLink::GetType    () const {return _type;}
int       CTechLink::GetNumTechs() const {return _nTechs;}
//////////////////////////////////////////////////////////////////
string CTechLink::GetTypeName() const
{
  if (_type==LINK_COUPLING){return "Coupling";}
  return "MutuallyExclusive";
}
//////////////////////////////////////////////////////////////////
string CTechLink::GetTechID(const int j) const
{
  ExitGracefullyIf((j<0) || (j>=_nTechs),"CTechLink::GetTechID: bad index",RUNTIME_ERR);
  return _aTechIDs[j];
}
//////////////////////////////////////////////////////////////////
int CTechLink::GetTechIndex(const int j) const
{
  ExitGracefullyIf((j<0) || (j>=_nTechs),"CTechLink::GetTechIndex: bad index",RUNTIME_ERR);
  return _aTechInds[j];
}
//////////////////////////////////////////////////////////////////
/// \brief index of primary technology of coupling
//
int CTechLink::GetPrimary() const {return _aTechInds[0];}
//////////////////////////////////////////////////////////////////
/// \brief index of secondary (dependent-upon) technology of coupling
//
int CTechLink::GetSecondary() const
{
  ExitGracefullyIf(_nTechs<2,"CTechLink::GetSecondary: coupling requires two technologies",RUNTIME_ERR);
  return _aTechInds[1];
}
//////////////////////////////////////////////////////////////////
bool CTechLink::Contains(const int i) const
{
  for (int j=0;j<_nTechs;j++){if (_aTechInds[j]==i){return true;}}
  return false;
}
//////////////////////////////////////////////////////////////////
void CTechLink::SetTechIndex(const int j, const int i)
{
  ExitGracefullyIf((j<0) || (j>=_nTechs),"CTechLink::SetTechIndex: bad index",RUNTIME_ERR);
  _aTechInds[j]=i;
}

//////////////////////////////////////////////////////////////////
/// \brief returns root of technology i in disjoint set forest, compressing path
//
static int FindRoot(int *parent, int i)
{
  while (parent[i]!=i){
    parent[i]=parent[parent[i]];
    i=parent[i];
  }
  return i;
}

//////////////////////////////////////////////////////////////////
/// \brief merges overlapping mutual exclusivity groups
/// \details any two exclusive links that share a technology are joined into a single
///   group (transitively), so that each technology belongs to at most one group.
///   Coupling links are kept unchanged; merged groups follow them in order of their
///   lowest technology index. Links must already be resolved to technology indices.
///
/// \param **&pLinks [in/out] array of links, replaced by merged array
/// \param &nLinks [in/out] number of links
/// \param nTechs [in] number of technologies in model
/// \param *aTechIDs [in] technology identifiers by index [size: nTechs]
//
void CTechLink::MergeExclusiveGroups(CTechLink **&pLinks, int &nLinks, const int nTechs, const string *aTechIDs)
{
  int i,j,k;
  int  *parent =new int [nTechs];
  bool *inGroup=new bool[nTechs];
  for (i=0;i<nTechs;i++){parent[i]=i; inGroup[i]=false;}

  for (k=0;k<nLinks;k++)
  {
    if (pLinks[k]->GetType()!=LINK_MUTUALLY_EXCLUSIVE){continue;}
    int first=pLinks[k]->GetTechIndex(0);
    ExitGracefullyIf((first<0) || (first>=nTechs),"CTechLink::MergeExclusiveGroups: unresolved technology link",RUNTIME_ERR);
    for (j=0;j<pLinks[k]->GetNumTechs();j++)
    {
      int ii=pLinks[k]->GetTechIndex(j);
      ExitGracefullyIf((ii<0) || (ii>=nTechs),"CTechLink::MergeExclusiveGroups: unresolved technology link",RUNTIME_ERR);
      inGroup[ii]=true;
      int r1=FindRoot(parent,first);
      int r2=FindRoot(parent,ii);
      if (r1!=r2){
        if (r1<r2){parent[r2]=r1;}
        else      {parent[r1]=r2;}
      }
    }
  }

  CTechLink **pNew=NULL;
  int         nNew=0;
  for (k=0;k<nLinks;k++)
  {
    if (pLinks[k]->GetType()==LINK_COUPLING){
      DynArrayAppend((void**&)(pNew),(void*)(pLinks[k]),nNew);
    }
    else {
      delete pLinks[k];
    }
    pLinks[k]=NULL;
  }

  string *aIDs=new string[nTechs];
  int    *aInds=new int  [nTechs];
  for (i=0;i<nTechs;i++)
  {
    if ((!inGroup[i]) || (FindRoot(parent,i)!=i)){continue;}
    int n=0;
    for (j=i;j<nTechs;j++){
      if ((inGroup[j]) && (FindRoot(parent,j)==i)){aIDs[n]=aTechIDs[j]; aInds[n]=j; n++;}
    }
    if (n<2){continue;}//a lone technology cannot conflict with anything
    CTechLink *pGroup=new CTechLink(LINK_MUTUALLY_EXCLUSIVE,aIDs,n);
    for (j=0;j<n;j++){pGroup->SetTechIndex(j,aInds[j]);}
    DynArrayAppend((void**&)(pNew),(void*)(pGroup),nNew);
  }
  delete [] aIDs;
  delete [] aInds;
  delete [] parent;
  delete [] inGroup;

  delete [] pLinks;
  pLinks=pNew;
  nLinks=nNew;
}
