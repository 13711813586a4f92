// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __MM_UPDATE_STRATEGY_H
#define __MM_UPDATE_STRATEGY_H 1

#include <algorithm>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <valarray>
#include <vector>
#include "FitConfiguration.h"
#include "IParallelExecutor.h"
#include "ParallelFor.h"

namespace plrank
{
  using StrengthVector = std::valarray<double>;
  using IndexedRanking = std::vector<std::size_t>;

  /**
   * @class MMUpdateStrategy
   * @brief One step of Hunter's (2004) MM recurrence for the Plackett-Luce model.
   *
   * For competitor i the next strength is
   *
   *     gamma'[i] = w[i] / sum_j sum_{s <= min(p_ij, n_j - 1)} 1 / (sum_{k >= s} gamma[r_j(k)])
   *
   * where w[i] counts the contests in which i did not finish last, p_ij is i's
   * 1-based finish position in contest j, n_j the number of finishers and r_j(k)
   * the competitor finishing k-th. Stage s is the choice of the s-th finisher among
   * everyone still in contention; a competitor is in contention at every stage up to
   * and including its own. The final stage has a single remaining competitor and
   * contributes no term.
   *
   * With two competitors per contest this reduces to the Bradley-Terry update
   * gamma'[i] = w[i] / sum_j 1 / (gamma[i] + gamma[opponent_j]).
   *
   * computeNext() reads only the frozen input vector and returns a new one, so all
   * competitors are updated simultaneously. A stage whose remaining strength sums to
   * zero contributes no term, and a competitor with an empty denominator (it only
   * appears in single-entry contests) gets strength zero.
   */
  class MMUpdateStrategy
  {
  public:
    virtual ~MMUpdateStrategy() = default;

    /**
     * @brief Unnormalized next iterate computed from @p gamma.
     * @param gamma Current strengths, indexed like the RankingSet that built this strategy.
     */
    virtual StrengthVector computeNext(const StrengthVector& gamma) const = 0;

    virtual MMFormulation getFormulation() const = 0;

    std::size_t getNumCompetitors() const
    {
      return mWins.size();
    }

  protected:
    explicit MMUpdateStrategy(const std::vector<unsigned int>& winCounts)
      : mWins(winCounts.size())
    {
      for (std::size_t i = 0; i < winCounts.size(); ++i)
	mWins[i] = static_cast<double>(winCounts[i]);
    }

    StrengthVector divideWins(const StrengthVector& denominators) const
    {
      StrengthVector next(0.0, mWins.size());
      for (std::size_t i = 0; i < mWins.size(); ++i)
	{
	  if (denominators[i] > 0.0)
	    next[i] = mWins[i] / denominators[i];
	}

      return next;
    }

    void checkSize(const StrengthVector& gamma) const
    {
      if (gamma.size() != mWins.size())
	throw std::invalid_argument("MMUpdateStrategy: strength vector does not match the competitor pool");
    }

  private:
    StrengthVector mWins;
  };

  /**
   * @class ReferenceMMUpdate
   * @brief Straightforward per-ranking, per-position evaluation of the MM step.
   *
   * For each ranking the reversed partial sums of gamma are turned into running
   * sums of their reciprocals (one value per stage). These per-ranking vectors are
   * independent of each other and are computed through the supplied executor; the
   * scatter into per-competitor denominators is sequential.
   */
  class ReferenceMMUpdate : public MMUpdateStrategy
  {
  public:
    ReferenceMMUpdate(const std::vector<IndexedRanking>& rankings,
		      const std::vector<unsigned int>& winCounts,
		      concurrency::IParallelExecutor& executor)
      : MMUpdateStrategy(winCounts),
	mRankings(rankings),
	mExecutor(executor)
    {}

    StrengthVector computeNext(const StrengthVector& gamma) const override
    {
      checkSize(gamma);

      std::vector<std::vector<double>> stageSums(mRankings.size());
      concurrency::parallel_for(mRankings.size(), mExecutor,
				[this, &gamma, &stageSums](std::size_t r) {
				  stageSums[r] = cumulativeStageTerms(mRankings[r], gamma);
				},
				kMinRankingsPerTask);

      StrengthVector denominators(0.0, getNumCompetitors());
      for (std::size_t r = 0; r < mRankings.size(); ++r)
	{
	  const IndexedRanking& ranking = mRankings[r];
	  const std::vector<double>& terms = stageSums[r];
	  if (terms.empty())
	    continue;

	  for (std::size_t pos = 0; pos < ranking.size(); ++pos)
	    denominators[ranking[pos]] += terms[std::min(pos, terms.size() - 1)];
	}

      return divideWins(denominators);
    }

    MMFormulation getFormulation() const override
    {
      return MMFormulation::REFERENCE;
    }

  private:
    // Running sum over stages 0..s of 1 / (strength still in contention at stage s).
    // A ranking of n finishers has n - 1 stages.
    static std::vector<double> cumulativeStageTerms(const IndexedRanking& ranking,
						    const StrengthVector& gamma)
    {
      const std::size_t n = ranking.size();
      if (n < 2)
	return std::vector<double>();

      std::vector<double> remaining(n);
      double tail = 0.0;
      for (std::size_t k = n; k-- > 0;)
	{
	  tail += gamma[ranking[k]];
	  remaining[k] = tail;
	}

      std::vector<double> terms(n - 1);
      double running = 0.0;
      for (std::size_t s = 0; s + 1 < n; ++s)
	{
	  if (remaining[s] > 0.0)
	    running += 1.0 / remaining[s];
	  terms[s] = running;
	}

      return terms;
    }

    static constexpr std::size_t kMinRankingsPerTask = 256;

    const std::vector<IndexedRanking>& mRankings;
    concurrency::IParallelExecutor& mExecutor;
  };

  /**
   * @class VectorizedMMUpdate
   * @brief The same MM step evaluated over padded matrices, after Hunter's plackmm.
   *
   * Layout (P = longest ranking, N = number of rankings, M = number of competitors):
   *  - finisher matrix, P x N, contest-major: slot j*P + p holds competitor+1 of the
   *    p-th finisher of contest j, or 0 for padding;
   *  - entry matrix, M x N, competitor-major: slot i*N + j holds 1 + the finisher
   *    slot of competitor i in contest j, or 0 when i did not take part.
   *
   * One step gathers gamma into the finisher matrix, takes the reversed cumulative
   * sum down every column, zeroes each contest's final stage, inverts the non-zero
   * cells, takes the forward cumulative sum, and finally sums each competitor's row
   * of the gathered entry matrix. Row operations act on all contests at once through
   * std::slice views.
   */
  class VectorizedMMUpdate : public MMUpdateStrategy
  {
  public:
    VectorizedMMUpdate(std::size_t numCompetitors,
		       const std::vector<IndexedRanking>& rankings,
		       const std::vector<unsigned int>& winCounts)
      : MMUpdateStrategy(winCounts),
	mNumPositions(0),
	mNumContests(rankings.size())
    {
      if (winCounts.size() != numCompetitors)
	throw std::invalid_argument("VectorizedMMUpdate: win counts do not match the competitor pool");

      for (const auto& ranking : rankings)
	mNumPositions = std::max(mNumPositions, ranking.size());

      const std::size_t P = mNumPositions;
      const std::size_t N = mNumContests;

      mFinisherSlots.resize(P * N, 0);
      mEntrySlots.resize(numCompetitors * N, 0);

      std::vector<std::size_t> lastOccupied;
      for (std::size_t j = 0; j < N; ++j)
	{
	  const IndexedRanking& ranking = rankings[j];
	  for (std::size_t p = 0; p < ranking.size(); ++p)
	    {
	      const std::size_t slot = j * P + p;
	      mFinisherSlots[slot] = ranking[p] + 1;
	      mEntrySlots[ranking[p] * N + j] = slot + 1;
	    }

	  if (!ranking.empty())
	    lastOccupied.push_back(j * P + ranking.size() - 1);
	}

      mLastOccupiedSlots.resize(lastOccupied.size());
      std::copy(lastOccupied.begin(), lastOccupied.end(), std::begin(mLastOccupiedSlots));
    }

    StrengthVector computeNext(const StrengthVector& gamma) const override
    {
      checkSize(gamma);

      const std::size_t M = getNumCompetitors();
      const std::size_t P = mNumPositions;
      const std::size_t N = mNumContests;

      if (P == 0 || N == 0)
	return StrengthVector(0.0, M);

      StrengthVector padded(0.0, M + 1);
      padded[std::slice(1, M, 1)] = gamma;

      std::valarray<double> g(padded[mFinisherSlots]);

      // strength still in contention at each stage
      for (std::size_t p = P - 1; p > 0; --p)
	g[std::slice(p - 1, N, P)] += std::valarray<double>(g[std::slice(p, N, P)]);

      g[mLastOccupiedSlots] = 0.0;

      std::valarray<bool> live = g > 0.0;
      std::valarray<double> reciprocals = 1.0 / std::valarray<double>(g[live]);
      g[live] = reciprocals;

      for (std::size_t p = 1; p < P; ++p)
	g[std::slice(p, N, P)] += std::valarray<double>(g[std::slice(p - 1, N, P)]);

      std::valarray<double> gShifted(0.0, P * N + 1);
      gShifted[std::slice(1, P * N, 1)] = g;
      std::valarray<double> entries(gShifted[mEntrySlots]);

      StrengthVector denominators(0.0, M);
      for (std::size_t i = 0; i < M; ++i)
	denominators[i] = std::valarray<double>(entries[std::slice(i * N, N, 1)]).sum();

      return divideWins(denominators);
    }

    MMFormulation getFormulation() const override
    {
      return MMFormulation::VECTORIZED;
    }

  private:
    std::size_t mNumPositions;
    std::size_t mNumContests;
    std::valarray<std::size_t> mFinisherSlots;
    std::valarray<std::size_t> mEntrySlots;
    std::valarray<std::size_t> mLastOccupiedSlots;
  };

  inline std::unique_ptr<MMUpdateStrategy>
  createMMUpdateStrategy(MMFormulation formulation,
			 std::size_t numCompetitors,
			 const std::vector<IndexedRanking>& rankings,
			 const std::vector<unsigned int>& winCounts,
			 concurrency::IParallelExecutor& executor)
  {
    switch (formulation)
      {
      case MMFormulation::REFERENCE:
	return std::make_unique<ReferenceMMUpdate>(rankings, winCounts, executor);
      case MMFormulation::VECTORIZED:
	return std::make_unique<VectorizedMMUpdate>(numCompetitors, rankings, winCounts);
      }

    throw FitConfigurationException("createMMUpdateStrategy: unsupported formulation");
  }
}

#endif
