// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __PLACKETT_LUCE_FITTER_H
#define __PLACKETT_LUCE_FITTER_H 1

#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>
#include "FitConfiguration.h"
#include "FitObserver.h"
#include "FitResult.h"
#include "MMUpdateStrategy.h"
#include "ParallelExecutors.h"
#include "Ranking.h"
#include "RankingSet.h"
#include "StronglyConnectedComponents.h"

namespace plrank
{
  /**
   * @class PlackettLuceFitter
   * @brief Maximum likelihood strengths of the Plackett-Luce model via Hunter's MM algorithm.
   *
   * Source: Hunter, D. R. "MM algorithms for generalized Bradley-Terry models",
   * Ann. Statist. 32 (2004), no. 1, 384-406, sections 5 and 6.
   *
   * The MLE exists and the iteration converges only if the competitor pool cannot be
   * split into two groups where nobody from one group ever finished ahead of anybody
   * from the other. With the precondition check enabled the fitter verifies this by
   * running the strongly-connected-components analysis on the precedence graph and
   * returns an ILL_POSED result, without iterating, when the graph has more than
   * one component. With the check disabled and the condition violated the iteration
   * may never reach the tolerance; set an iteration cap to bound it.
   *
   * The fitter holds configuration only; every call builds its own state, so a
   * single fitter may be shared.
   *
   * @tparam Competitor Opaque competitor identity (equality comparable, hashable).
   */
  template <class Competitor, class Hash = std::hash<Competitor>>
  class PlackettLuceFitter
  {
  public:
    using RankingType = Ranking<Competitor, Hash>;
    using RankingSetType = RankingSet<Competitor, Hash>;
    using ResultType = FitResult<Competitor, Hash>;
    using StrengthMap = typename ResultType::StrengthMap;

    explicit PlackettLuceFitter(const FitConfiguration& configuration = FitConfiguration(),
				std::shared_ptr<diagnostics::IFitObserver> observer = nullptr)
      : mConfiguration(configuration),
	mObserver(observer)
    {
      if (!mObserver)
	{
	  if (mConfiguration.isVerbose())
	    mObserver = std::make_shared<diagnostics::StreamFitObserver>(std::cout);
	  else
	    mObserver = std::make_shared<diagnostics::NullFitObserver>();
	}
    }

    const FitConfiguration& getConfiguration() const
    {
      return mConfiguration;
    }

    /**
     * @brief Fits strengths to @p rankings starting from the uniform vector 1 / |pool|.
     */
    ResultType fit(const std::vector<RankingType>& rankings) const
    {
      RankingSetType rankingSet(rankings);
      if (rankingSet.empty())
	return emptyResult();

      StrengthVector initial(1.0 / static_cast<double>(rankingSet.getNumCompetitors()),
			     rankingSet.getNumCompetitors());
      return runFit(rankingSet, initial);
    }

    /**
     * @brief Convenience overload for results given as competitor -> finish position maps.
     * @throws RankingException if a contest has tied finish positions.
     */
    template <class FinishMap>
    ResultType fitFinishPositions(const std::vector<FinishMap>& contests) const
    {
      return fit(toRankings(contests));
    }

    /**
     * @brief Fits strengths starting from a caller-supplied vector (warm start).
     * @param initial Positive strength for every competitor of the pool.
     * @throws std::invalid_argument if a competitor is missing or has a non-positive strength.
     */
    ResultType iterateFrom(const std::vector<RankingType>& rankings, const StrengthMap& initial) const
    {
      RankingSetType rankingSet(rankings);
      if (rankingSet.empty())
	return emptyResult();

      return runFit(rankingSet, toVector(rankingSet, initial));
    }

    /**
     * @brief A single MM update of @p gamma (normalized if the configuration says so).
     *
     * No precondition check is made.
     */
    StrengthMap step(const std::vector<RankingType>& rankings, const StrengthMap& gamma) const
    {
      RankingSetType rankingSet(rankings);
      if (rankingSet.empty())
	return StrengthMap();

      auto executor = makeExecutor();
      auto update = createMMUpdateStrategy(mConfiguration.getFormulation(),
					   rankingSet.getNumCompetitors(),
					   rankingSet.getIndexedRankings(),
					   rankingSet.getWinCounts(),
					   *executor);

      StrengthVector next = update->computeNext(toVector(rankingSet, gamma));
      if (mConfiguration.normalize())
	normalizeStrengths(next);

      return toStrengthMap(rankingSet, next);
    }

    /**
     * @brief Number of strongly connected components of the precedence graph.
     *
     * Competitors that occur in no precedence edge (they only ever appear in
     * single-entry contests) count as components of their own.
     */
    static std::size_t countComponents(const RankingSetType& rankingSet)
    {
      using Graph = graph::StronglyConnectedComponents<std::size_t>;

      auto roots = Graph::analyze(rankingSet.getPrecedenceEdges());
      return Graph::countComponents(roots) + (rankingSet.getNumCompetitors() - roots.size());
    }

  private:
    ResultType runFit(const RankingSetType& rankingSet, StrengthVector gamma) const
    {
      std::optional<std::size_t> componentCount;
      if (mConfiguration.checkPrecondition())
	{
	  componentCount = countComponents(rankingSet);
	  mObserver->onPreconditionChecked(*componentCount);

	  if (*componentCount != 1)
	    {
	      mObserver->onFitFinished(FitStatus::ILL_POSED, 0);
	      return ResultType::illPosed(*componentCount);
	    }
	}

      // nothing to compare against: the only competitor carries all the strength
      if (rankingSet.getNumCompetitors() == 1)
	{
	  StrengthVector single(1.0, 1);
	  mObserver->onFitFinished(FitStatus::CONVERGED, 0);
	  return ResultType(FitStatus::CONVERGED, toStrengthMap(rankingSet, single), 0, 0.0,
			    componentCount, 0);
	}

      auto executor = makeExecutor();
      auto update = createMMUpdateStrategy(mConfiguration.getFormulation(),
					   rankingSet.getNumCompetitors(),
					   rankingSet.getIndexedRankings(),
					   rankingSet.getWinCounts(),
					   *executor);

      const double tolerance = mConfiguration.getTolerance();
      const auto& maxIterations = mConfiguration.getMaxIterations();

      double difference = std::numeric_limits<double>::infinity();
      unsigned int iterations = 0;
      unsigned int differenceIncreases = 0;
      FitStatus status = FitStatus::CONVERGED;
      auto start = std::chrono::steady_clock::now();

      while (difference > tolerance)
	{
	  if (maxIterations && iterations >= *maxIterations)
	    {
	      status = FitStatus::DID_NOT_CONVERGE;
	      break;
	    }

	  StrengthVector next = update->computeNext(gamma);
	  if (mConfiguration.normalize())
	    normalizeStrengths(next);

	  const double previousDifference = difference;
	  difference = euclideanDistance(next, gamma);
	  gamma = std::move(next);
	  ++iterations;

	  auto now = std::chrono::steady_clock::now();
	  diagnostics::IterationRecord record(iterations,
					      std::chrono::duration<double>(now - start).count(),
					      difference, previousDifference);
	  mObserver->onIteration(record);
	  if (record.differenceIncreased())
	    ++differenceIncreases;
	  start = now;

	  if (!std::isfinite(difference))
	    {
	      status = FitStatus::DID_NOT_CONVERGE;
	      break;
	    }
	}

      mObserver->onFitFinished(status, iterations);
      return ResultType(status, toStrengthMap(rankingSet, gamma), iterations, difference,
			componentCount, differenceIncreases);
    }

    std::unique_ptr<concurrency::IParallelExecutor> makeExecutor() const
    {
      if (mConfiguration.isParallel())
	return std::make_unique<concurrency::ThreadPoolExecutor<>>();

      return std::make_unique<concurrency::SingleThreadExecutor>();
    }

    static ResultType emptyResult()
    {
      return ResultType(FitStatus::CONVERGED, StrengthMap(), 0, 0.0, std::nullopt, 0);
    }

    // Rescaling never changes the likelihood; it only pins down the scale.
    static void normalizeStrengths(StrengthVector& gamma)
    {
      const double total = gamma.sum();
      if (total > 0.0)
	gamma /= total;
    }

    static double euclideanDistance(const StrengthVector& a, const StrengthVector& b)
    {
      StrengthVector delta = a - b;
      return std::sqrt((delta * delta).sum());
    }

    static StrengthVector toVector(const RankingSetType& rankingSet, const StrengthMap& strengths)
    {
      const auto& competitors = rankingSet.getCompetitors();
      StrengthVector gamma(0.0, competitors.size());

      for (std::size_t i = 0; i < competitors.size(); ++i)
	{
	  auto it = strengths.find(competitors[i]);
	  if (it == strengths.end())
	    throw std::invalid_argument("PlackettLuceFitter: initial strengths omit a competitor of the pool");
	  if (!(it->second > 0.0))
	    throw std::invalid_argument("PlackettLuceFitter: initial strengths must be positive");

	  gamma[i] = it->second;
	}

      return gamma;
    }

    static StrengthMap toStrengthMap(const RankingSetType& rankingSet, const StrengthVector& gamma)
    {
      const auto& competitors = rankingSet.getCompetitors();
      StrengthMap strengths;
      strengths.reserve(competitors.size());

      for (std::size_t i = 0; i < competitors.size(); ++i)
	strengths.emplace(competitors[i], gamma[i]);

      return strengths;
    }

    template <class FinishMap>
    static std::vector<RankingType> toRankings(const std::vector<FinishMap>& contests)
    {
      std::vector<RankingType> rankings;
      rankings.reserve(contests.size());
      for (const auto& contest : contests)
	rankings.push_back(RankingType::fromFinishPositions(contest));

      return rankings;
    }

    FitConfiguration mConfiguration;
    std::shared_ptr<diagnostics::IFitObserver> mObserver;
  };

  /**
   * @brief Plackett-Luce MLE with the classic parameter set.
   *
   * Returns an ILL_POSED result when @p checkPrecondition is set and the
   * competitor pool is not strongly connected.
   */
  template <class Competitor, class Hash = std::hash<Competitor>>
  FitResult<Competitor, Hash>
  fitPlackettLuce(const std::vector<Ranking<Competitor, Hash>>& rankings,
		  double tolerance = FitDefaults::kTolerance,
		  bool checkPrecondition = true,
		  bool normalize = true)
  {
    FitConfiguration configuration;
    configuration.setTolerance(tolerance)
      .setCheckPrecondition(checkPrecondition)
      .setNormalize(normalize);

    return PlackettLuceFitter<Competitor, Hash>(configuration).fit(rankings);
  }
}

#endif
