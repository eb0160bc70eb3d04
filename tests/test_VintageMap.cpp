/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include <random>
#include "VintageMap.h"

namespace
{
  //brute-force in-service capacity, straight from the lifetime window definition
  double BruteForceCapacity(const vector<int> &years, const vector<double> &install,
                            const int L, const int k, const vintage_window policy)
  {
    double sum=0.0;
    for (size_t kk=0;kk<years.size();kk++)
    {
      int age=years[k]-years[kk];
      if (age<0){continue;}
      if ((policy==VINTAGE_EXCLUSIVE) && (age< L)){sum+=install[kk];}
      if ((policy==VINTAGE_INCLUSIVE) && (age<=L)){sum+=install[kk];}
    }
    return sum;
  }

  void CheckRandomInstallations(const vector<int> &years, const vintage_window policy, const unsigned seed)
  {
    mt19937 gen(seed);
    uniform_int_distribution<int>     life(1,12);
    uniform_real_distribution<double> amount(0.0,50.0);
    bernoulli_distribution            installs(0.6);

    const int nTechs=8;
    int nYears=(int)(years.size());
    vector<int> L(nTechs);
    for (int i=0;i<nTechs;i++){L[i]=life(gen);}

    CVintageMap VM(&years[0],nYears,&L[0],nTechs,policy);

    for (int trial=0;trial<25;trial++)
    {
      for (int i=0;i<nTechs;i++)
      {
        vector<double> install(nYears,0.0);
        for (int k=0;k<nYears;k++){if (installs(gen)){install[k]=amount(gen);}}

        for (int k=0;k<nYears;k++){
          EXPECT_NEAR(VM.GetInServiceCapacity(i,k,&install[0]),
                      BruteForceCapacity(years,install,L[i],k,policy),1e-9)
            << "tech " << i << " (L=" << L[i] << "), year " << years[k];
        }
      }
    }
  }
}

TEST(VintageMap, InServiceCapacityMatchesWindowForRandomInstallations)
{
  vector<int> years;
  for (int y=2025;y<=2060;y++){years.push_back(y);}
  CheckRandomInstallations(years,VINTAGE_EXCLUSIVE,20240601u);
  CheckRandomInstallations(years,VINTAGE_INCLUSIVE,20240602u);
}

TEST(VintageMap, InServiceCapacityMatchesWindowForIrregularYears)
{
  int y[]={2025,2026,2030,2035,2036,2040,2050,2051,2060};
  vector<int> years(y,y+9);
  CheckRandomInstallations(years,VINTAGE_EXCLUSIVE,7u);
  CheckRandomInstallations(years,VINTAGE_INCLUSIVE,11u);
}

TEST(VintageMap, LifetimeBoundaryDependsOnPolicy)
{
  int years[]={2025,2026,2027,2028};
  int L[]={2};
  CVintageMap Excl(years,4,L,1,VINTAGE_EXCLUSIVE);
  CVintageMap Incl(years,4,L,1,VINTAGE_INCLUSIVE);

  //installed 2025, lifetime 2: in service 2025-2026 (exclusive) or 2025-2027 (inclusive)
  EXPECT_TRUE (Excl.IsInService(0,0,1));
  EXPECT_FALSE(Excl.IsInService(0,0,2));
  EXPECT_TRUE (Incl.IsInService(0,0,2));
  EXPECT_FALSE(Incl.IsInService(0,0,3));

  EXPECT_EQ(Excl.GetNumInService(0,3),2);
  EXPECT_EQ(Excl.GetFirstInService(0,3),2);
  EXPECT_EQ(Incl.GetNumInService(0,3),3);
  EXPECT_EQ(Incl.GetFirstInService(0,3),1);
}

TEST(VintageMap, InstallationIsNeverInServiceBeforeItIsMade)
{
  int years[]={2025,2026,2027};
  int L[]={30};
  CVintageMap VM(years,3,L,1,VINTAGE_EXCLUSIVE);
  EXPECT_FALSE(VM.IsInService(0,2,0));
  EXPECT_EQ(VM.GetNumInService(0,0),1);
  EXPECT_EQ(VM.GetInServiceIndex(0,2,0),0);
}

TEST(VintageMap, ZeroLifetimeIsRejected)
{
  int years[]={2025,2026};
  int L[]={0};
  EXPECT_THROW({CVintageMap VM(years,2,L,1,VINTAGE_EXCLUSIVE);},CDataValidationError);
}
