// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __RESULTS_FILE_EXCEPTION_H
#define __RESULTS_FILE_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace plrank
{
  class ResultsFileException : public std::runtime_error
  {
  public:
    ResultsFileException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~ResultsFileException()
    {}
  };

  class RaterConfigurationException : public std::runtime_error
  {
  public:
    RaterConfigurationException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~RaterConfigurationException()
    {}
  };
}

#endif
