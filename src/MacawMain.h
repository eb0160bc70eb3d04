/*----------------------------------------------------------------
  Macaw Pathway Optimizer Source Code
  Copyright (c) 2024-2026 the Macaw Development Team
  ----------------------------------------------------------------*/
#ifndef MACAW_MAIN
#define MACAW_MAIN

#include "MacawInclude.h"
#include "PathwayModel.h"

//Local functions defined below main() in MacawMain.cpp
void ProcessExecutableArguments(int argc, char* argv[], optStruct &Options);
void CheckForErrorWarnings     (bool quiet, const optStruct &Options);

#endif
