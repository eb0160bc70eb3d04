/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------
  TechLinks.h
  ----------------------------------------------------------------*/
#ifndef TECHLINKS_H
#define TECHLINKS_H

#include "MacawInclude.h"

///////////////////////////////////////////////////////////////////
/// \brief types of relationship between technologies
//
enum link_type
{
  LINK_MUTUALLY_EXCLUSIVE, ///< combined in-service share of group may not exceed 1
  LINK_COUPLING            ///< share of secondary (2nd tech) must be >= share of primary (1st tech)
};

///////////////////////////////////////////////////////////////////
/// \brief competitive or dependency relationship between technologies
/// \details technologies are referenced by ID when read and by index once
///   the link has been resolved against the model's technology list
//
class CTechLink
{
private:/*------------------------------------------------------*/
  link_type _type;        ///< type of link
  string   *_aTechIDs;    ///< array of technology identifiers [size: _nTechs]
  int      *_aTechInds;   ///< array of technology indices [size: _nTechs] (DOESNT_EXIST until resolved)
  int       _nTechs;      ///< number of linked technologies (2 for coupling)

  CTechLink(const CTechLink &l); //suppresses default copy constructor

public:/*-------------------------------------------------------*/
  CTechLink(const link_type type, const string *aIDs, const int nIDs);
  ~CTechLink();

  link_type GetType        () const;
  string    GetTypeName    () const;
  int       GetNumTechs    () const;
  string    GetTechID      (const int j) const;
  int       GetTechIndex   (const int j) const;
  int       GetPrimary     () const;
  int       GetSecondary   () const;
  bool      Contains       (const int i) const;

  void      SetTechIndex   (const int j, const int i);

  static void MergeExclusiveGroups(CTechLink **&pLinks, int &nLinks, const int nTechs, const string *aTechIDs);
};

#endif
