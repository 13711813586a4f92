// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __FIT_CONFIGURATION_H
#define __FIT_CONFIGURATION_H 1

#include <optional>
#include <string>
#include <boost/algorithm/string.hpp>
#include "RankingException.h"

namespace plrank
{
  namespace FitDefaults
  {
    constexpr double kTolerance = 1e-9;          ///< L2 norm of successive iterates
    constexpr double kAgreementTolerance = 1e-6; ///< reference vs vectorized strengths
  }

  /**
   * @brief The two interchangeable restatements of Hunter's MM update.
   *
   * REFERENCE walks every ranking position by position. VECTORIZED lays the
   * rankings out as padded position-by-contest matrices and obtains the same
   * denominators from reversed cumulative sums.
   */
  enum class MMFormulation
    {
      REFERENCE,
      VECTORIZED
    };

  inline std::string formulationToString(MMFormulation formulation)
  {
    switch (formulation)
      {
      case MMFormulation::REFERENCE:
	return "reference";
      case MMFormulation::VECTORIZED:
	return "vectorized";
      }

    return "unknown";
  }

  inline MMFormulation formulationFromString(const std::string& name)
  {
    std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));

    if (key == "reference")
      return MMFormulation::REFERENCE;
    if (key == "vectorized")
      return MMFormulation::VECTORIZED;

    throw FitConfigurationException("Unknown MM formulation '" + name + "' (expected reference or vectorized)");
  }

  /**
   * @class FitConfiguration
   * @brief Knobs of a single Plackett-Luce fit.
   *
   * Defaults reproduce the classic behaviour: tolerance 1e-9, precondition check
   * on, normalization on, reference formulation, serial execution and no
   * iteration cap (the loop runs until the tolerance is met).
   */
  class FitConfiguration
  {
  public:
    FitConfiguration()
      : mTolerance(FitDefaults::kTolerance),
	mCheckPrecondition(true),
	mNormalize(true),
	mFormulation(MMFormulation::REFERENCE),
	mMaxIterations(),
	mParallel(false),
	mVerbose(false)
    {}

    double getTolerance() const
    {
      return mTolerance;
    }

    FitConfiguration& setTolerance(double tolerance)
    {
      if (!(tolerance > 0.0))
	throw FitConfigurationException("FitConfiguration: tolerance must be positive");

      mTolerance = tolerance;
      return *this;
    }

    bool checkPrecondition() const
    {
      return mCheckPrecondition;
    }

    FitConfiguration& setCheckPrecondition(bool check)
    {
      mCheckPrecondition = check;
      return *this;
    }

    bool normalize() const
    {
      return mNormalize;
    }

    FitConfiguration& setNormalize(bool normalize)
    {
      mNormalize = normalize;
      return *this;
    }

    MMFormulation getFormulation() const
    {
      return mFormulation;
    }

    FitConfiguration& setFormulation(MMFormulation formulation)
    {
      mFormulation = formulation;
      return *this;
    }

    // Empty means no cap.
    const std::optional<unsigned int>& getMaxIterations() const
    {
      return mMaxIterations;
    }

    FitConfiguration& setMaxIterations(unsigned int maxIterations)
    {
      if (maxIterations == 0)
	throw FitConfigurationException("FitConfiguration: iteration cap must be at least 1");

      mMaxIterations = maxIterations;
      return *this;
    }

    FitConfiguration& clearMaxIterations()
    {
      mMaxIterations.reset();
      return *this;
    }

    bool isParallel() const
    {
      return mParallel;
    }

    FitConfiguration& setParallel(bool parallel)
    {
      mParallel = parallel;
      return *this;
    }

    bool isVerbose() const
    {
      return mVerbose;
    }

    FitConfiguration& setVerbose(bool verbose)
    {
      mVerbose = verbose;
      return *this;
    }

  private:
    double mTolerance;
    bool mCheckPrecondition;
    bool mNormalize;
    MMFormulation mFormulation;
    std::optional<unsigned int> mMaxIterations;
    bool mParallel;
    bool mVerbose;
  };
}

#endif
