// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __RANKING_EXCEPTION_H
#define __RANKING_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace plrank
{
  // Thrown when a finish order cannot be turned into a strict ranking
  // (tied finish positions, a competitor listed twice).
  class RankingException : public std::domain_error
  {
  public:
    RankingException(const std::string msg)
      : std::domain_error(msg)
    {}

    ~RankingException()
    {}
  };

  class FitConfigurationException : public std::runtime_error
  {
  public:
    FitConfigurationException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~FitConfigurationException()
    {}
  };
}

#endif
