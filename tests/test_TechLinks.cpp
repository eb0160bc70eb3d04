/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "TechLinks.h"

namespace
{
  const string TECH_IDS[6]={"A","B","C","D","E","F"};

  CTechLink *CreateResolvedLink(const link_type type, const int *aInds, const int n)
  {
    string *aIDs=new string[n];
    for (int j=0;j<n;j++){aIDs[j]=TECH_IDS[aInds[j]];}
    CTechLink *pLink=new CTechLink(type,aIDs,n);
    for (int j=0;j<n;j++){pLink->SetTechIndex(j,aInds[j]);}
    delete [] aIDs;
    return pLink;
  }
}

TEST(TechLinks, OverlappingExclusiveGroupsAreMerged)
{
  int ab[]={0,1};
  int bc[]={1,2};
  int de[]={3,4};
  int ad[]={0,3};
  int nLinks=4;
  CTechLink **pLinks=new CTechLink *[nLinks];
  pLinks[0]=CreateResolvedLink(LINK_MUTUALLY_EXCLUSIVE,ab,2);
  pLinks[1]=CreateResolvedLink(LINK_COUPLING          ,ad,2);
  pLinks[2]=CreateResolvedLink(LINK_MUTUALLY_EXCLUSIVE,de,2);
  pLinks[3]=CreateResolvedLink(LINK_MUTUALLY_EXCLUSIVE,bc,2);

  CTechLink::MergeExclusiveGroups(pLinks,nLinks,6,TECH_IDS);

  ASSERT_EQ(nLinks,3);
  EXPECT_EQ(pLinks[0]->GetType(),LINK_COUPLING);
  EXPECT_EQ(pLinks[0]->GetPrimary(),0);
  EXPECT_EQ(pLinks[0]->GetSecondary(),3);

  EXPECT_EQ(pLinks[1]->GetType(),LINK_MUTUALLY_EXCLUSIVE);
  ASSERT_EQ(pLinks[1]->GetNumTechs(),3);
  EXPECT_TRUE(pLinks[1]->Contains(0));
  EXPECT_TRUE(pLinks[1]->Contains(1));
  EXPECT_TRUE(pLinks[1]->Contains(2));
  EXPECT_EQ(pLinks[1]->GetTechID(2),"C");

  EXPECT_EQ(pLinks[2]->GetType(),LINK_MUTUALLY_EXCLUSIVE);
  ASSERT_EQ(pLinks[2]->GetNumTechs(),2);
  EXPECT_TRUE(pLinks[2]->Contains(3));
  EXPECT_TRUE(pLinks[2]->Contains(4));
  EXPECT_FALSE(pLinks[2]->Contains(5));

  for (int l=0;l<nLinks;l++){delete pLinks[l];}
  delete [] pLinks;
}

TEST(TechLinks, SingleTechnologyGroupIsDropped)
{
  int f[]={5};
  int nLinks=1;
  CTechLink **pLinks=new CTechLink *[nLinks];
  pLinks[0]=CreateResolvedLink(LINK_MUTUALLY_EXCLUSIVE,f,1);

  CTechLink::MergeExclusiveGroups(pLinks,nLinks,6,TECH_IDS);

  EXPECT_EQ(nLinks,0);
  delete [] pLinks;
}

TEST(TechLinks, UnresolvedLinkIsRuntimeError)
{
  string ids[]={"A","B"};
  int nLinks=1;
  CTechLink **pLinks=new CTechLink *[nLinks];
  pLinks[0]=new CTechLink(LINK_MUTUALLY_EXCLUSIVE,ids,2);

  EXPECT_THROW(CTechLink::MergeExclusiveGroups(pLinks,nLinks,6,TECH_IDS),CMacawError);

  delete pLinks[0];
  delete [] pLinks;
}
