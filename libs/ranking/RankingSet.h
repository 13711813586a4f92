// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __RANKING_SET_H
#define __RANKING_SET_H 1

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include <boost/functional/hash.hpp>
#include "Ranking.h"

namespace plrank
{
  /**
   * @class RankingSet
   * @brief Integer-indexed view of a corpus of rankings, shared by every fit formulation.
   *
   * Competitors are numbered 0..M-1 in the order they are first seen while walking
   * the rankings front to back, so everything derived from a RankingSet (pool order,
   * edge order, SCC root labels) is reproducible for identical input.
   *
   * Besides the indexed rankings, the set carries the iteration-invariant parts
   * of the MM update: the win counts (number of contests in which a competitor
   * did not finish last) and the precedence edges of the beat relation.
   */
  template <class Competitor, class Hash = std::hash<Competitor>>
  class RankingSet
  {
  public:
    using RankingType = Ranking<Competitor, Hash>;
    using IndexedRanking = std::vector<std::size_t>;
    using IndexEdge = std::pair<std::size_t, std::size_t>;

    explicit RankingSet(const std::vector<RankingType>& rankings)
      : mMaxRankingLength(0)
    {
      mIndexedRankings.reserve(rankings.size());
      for (const auto& ranking : rankings)
	{
	  IndexedRanking indexed;
	  indexed.reserve(ranking.size());
	  for (const auto& competitor : ranking)
	    indexed.push_back(addCompetitor(competitor));

	  mMaxRankingLength = std::max(mMaxRankingLength, indexed.size());
	  mIndexedRankings.push_back(std::move(indexed));
	}

      mWins.assign(mCompetitors.size(), 0);
      for (const auto& indexed : mIndexedRankings)
	{
	  // everyone except the last finisher "won" a stage of this contest
	  for (std::size_t pos = 0; pos + 1 < indexed.size(); ++pos)
	    ++mWins[indexed[pos]];
	}
    }

    std::size_t getNumCompetitors() const
    {
      return mCompetitors.size();
    }

    std::size_t getNumRankings() const
    {
      return mIndexedRankings.size();
    }

    std::size_t getMaxRankingLength() const
    {
      return mMaxRankingLength;
    }

    bool empty() const
    {
      return mCompetitors.empty();
    }

    const std::vector<Competitor>& getCompetitors() const
    {
      return mCompetitors;
    }

    bool contains(const Competitor& competitor) const
    {
      return mCompetitorIndex.find(competitor) != mCompetitorIndex.end();
    }

    std::size_t indexOf(const Competitor& competitor) const
    {
      auto it = mCompetitorIndex.find(competitor);
      if (it == mCompetitorIndex.end())
	throw std::out_of_range("RankingSet::indexOf - competitor is not part of the pool");

      return it->second;
    }

    const std::vector<IndexedRanking>& getIndexedRankings() const
    {
      return mIndexedRankings;
    }

    const std::vector<unsigned int>& getWinCounts() const
    {
      return mWins;
    }

    /**
     * @brief Edges of the precedence (beat) graph, one per distinct ordered pair.
     *
     * For every ranking and every pair of positions i < j, the edge
     * ranking[i] -> ranking[j] is produced; all C(n,2) pairs are included, not just
     * adjacent finishers. Repeated edges from different contests appear once.
     */
    std::vector<IndexEdge> getPrecedenceEdges() const
    {
      std::vector<IndexEdge> edges;
      std::unordered_set<IndexEdge, boost::hash<IndexEdge>> seen;

      for (const auto& indexed : mIndexedRankings)
	{
	  for (std::size_t i = 0; i < indexed.size(); ++i)
	    for (std::size_t j = i + 1; j < indexed.size(); ++j)
	      {
		IndexEdge edge(indexed[i], indexed[j]);
		if (seen.insert(edge).second)
		  edges.push_back(edge);
	      }
	}

      return edges;
    }

    /**
     * @brief Same edges as getPrecedenceEdges(), expressed with competitor identities.
     */
    std::vector<std::pair<Competitor, Competitor>> getCompetitorPrecedenceEdges() const
    {
      std::vector<std::pair<Competitor, Competitor>> edges;
      for (const auto& edge : getPrecedenceEdges())
	edges.emplace_back(mCompetitors[edge.first], mCompetitors[edge.second]);

      return edges;
    }

  private:
    std::size_t addCompetitor(const Competitor& competitor)
    {
      auto it = mCompetitorIndex.find(competitor);
      if (it != mCompetitorIndex.end())
	return it->second;

      std::size_t index = mCompetitors.size();
      mCompetitorIndex.emplace(competitor, index);
      mCompetitors.push_back(competitor);
      return index;
    }

    std::vector<Competitor> mCompetitors;
    std::unordered_map<Competitor, std::size_t, Hash> mCompetitorIndex;
    std::vector<IndexedRanking> mIndexedRankings;
    std::vector<unsigned int> mWins;
    std::size_t mMaxRankingLength;
  };
}

#endif
