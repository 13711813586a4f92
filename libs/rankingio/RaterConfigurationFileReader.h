// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __RATER_CONFIGURATION_FILE_READER_H
#define __RATER_CONFIGURATION_FILE_READER_H 1

#include <memory>
#include <string>
#include "FitConfiguration.h"
#include "ResultsFileException.h"

namespace plrank
{
  //
  // Two-column configuration file, one setting per row:
  //
  //   Parameter,Value
  //   Tolerance,1e-9
  //   CheckPrecondition,true
  //   Normalize,true
  //   Formulation,vectorized
  //   MaxIterations,5000
  //   Parallel,false
  //   Verbose,false
  //
  // Parameter names are case-insensitive; settings that are not listed keep their
  // FitConfiguration defaults.
  //
  class RaterConfigurationFileReader
  {
  public:
    explicit RaterConfigurationFileReader(const std::string& configurationFileName);

    ~RaterConfigurationFileReader()
    {}

    std::shared_ptr<FitConfiguration> readConfigurationFile() const;

  private:
    void applySetting(FitConfiguration& configuration,
		      const std::string& parameter,
		      const std::string& value) const;

    std::string mConfigurationFileName;
  };
}

#endif
