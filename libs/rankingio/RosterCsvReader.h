// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ROSTER_CSV_READER_H
#define __ROSTER_CSV_READER_H 1

#include <string>
#include "CompetitorRoster.h"
#include "ResultsFileException.h"

namespace plrank
{
  //
  // Reads competitor metadata:
  //
  //   Competitor,Label,Active
  //
  // Active accepts 1/0, true/false, yes/no (case-insensitive).
  //
  class RosterCsvReader
  {
  public:
    explicit RosterCsvReader(const std::string& fileName);

    ~RosterCsvReader()
    {}

    CompetitorRoster<std::string> readFile() const;

  private:
    std::string mFileName;
  };

  bool parseActiveFlag(const std::string& value);
}

#endif
