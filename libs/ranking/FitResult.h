// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __FIT_RESULT_H
#define __FIT_RESULT_H 1

#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace plrank
{
  enum class FitStatus
    {
      CONVERGED,         ///< successive iterates within tolerance
      ILL_POSED,         ///< competitor pool not strongly connected; nothing was fitted
      DID_NOT_CONVERGE   ///< iteration cap reached first; strengths hold the last iterate
    };

  inline std::string fitStatusToString(FitStatus status)
  {
    switch (status)
      {
      case FitStatus::CONVERGED:
	return "Converged";
      case FitStatus::ILL_POSED:
	return "IllPosed";
      case FitStatus::DID_NOT_CONVERGE:
	return "DidNotConverge";
      }

    return "Unknown";
  }

  /**
   * @class FitResult
   * @brief Outcome of a Plackett-Luce fit.
   *
   * An ill-posed fit is an ordinary, expected outcome: callers branch on
   * getStatus() (or isIllPosed()) instead of catching an exception. An ill-posed
   * result carries no strengths.
   */
  template <class Competitor, class Hash = std::hash<Competitor>>
  class FitResult
  {
  public:
    using StrengthMap = std::unordered_map<Competitor, double, Hash>;

    FitResult(FitStatus status,
	      StrengthMap strengths,
	      unsigned int iterations,
	      double finalDifference,
	      std::optional<std::size_t> componentCount,
	      unsigned int differenceIncreases)
      : mStatus(status),
	mStrengths(std::move(strengths)),
	mIterations(iterations),
	mFinalDifference(finalDifference),
	mComponentCount(componentCount),
	mDifferenceIncreases(differenceIncreases)
    {}

    static FitResult illPosed(std::size_t componentCount)
    {
      return FitResult(FitStatus::ILL_POSED, StrengthMap(), 0,
		       std::numeric_limits<double>::infinity(),
		       componentCount, 0);
    }

    FitStatus getStatus() const
    {
      return mStatus;
    }

    bool isConverged() const
    {
      return mStatus == FitStatus::CONVERGED;
    }

    bool isIllPosed() const
    {
      return mStatus == FitStatus::ILL_POSED;
    }

    const StrengthMap& getStrengths() const
    {
      return mStrengths;
    }

    bool hasStrength(const Competitor& competitor) const
    {
      return mStrengths.find(competitor) != mStrengths.end();
    }

    double getStrength(const Competitor& competitor) const
    {
      auto it = mStrengths.find(competitor);
      if (it == mStrengths.end())
	throw std::out_of_range("FitResult::getStrength - no strength for competitor");

      return it->second;
    }

    unsigned int getIterations() const
    {
      return mIterations;
    }

    // L2 norm of the last step; infinity when no step was taken on an ill-posed fit
    double getFinalDifference() const
    {
      return mFinalDifference;
    }

    // Empty when the precondition check was skipped.
    const std::optional<std::size_t>& getComponentCount() const
    {
      return mComponentCount;
    }

    unsigned int getDifferenceIncreases() const
    {
      return mDifferenceIncreases;
    }

  private:
    FitStatus mStatus;
    StrengthMap mStrengths;
    unsigned int mIterations;
    double mFinalDifference;
    std::optional<std::size_t> mComponentCount;
    unsigned int mDifferenceIncreases;
  };
}

#endif
