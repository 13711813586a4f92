// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __RANKING_H
#define __RANKING_H 1

#include <algorithm>
#include <functional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
#include "RankingException.h"

namespace plrank
{
  /**
   * @class Ranking
   * @brief Strict finish order of one contest, first place first.
   *
   * A Ranking never contains the same competitor twice and has no ties. Rankings
   * of length one are legal; they carry no ordering information and contribute
   * nothing to a fit.
   *
   * @tparam Competitor Opaque competitor identity (equality comparable, hashable).
   */
  template <class Competitor, class Hash = std::hash<Competitor>>
  class Ranking
  {
  public:
    using const_iterator = typename std::vector<Competitor>::const_iterator;

    explicit Ranking(std::vector<Competitor> finishOrder)
      : mFinishOrder(std::move(finishOrder))
    {
      std::unordered_set<Competitor, Hash> seen;
      for (const auto& competitor : mFinishOrder)
	{
	  if (!seen.insert(competitor).second)
	    throw RankingException("Ranking: competitor appears more than once in a single contest");
	}
    }

    /**
     * @brief Builds a ranking from a competitor -> finish position mapping.
     *
     * Entries are sorted on finish position (1 = first place). Only the relative
     * order matters, so gaps in the numbering are accepted.
     *
     * @param finishPositions Any range of (competitor, position) pairs, e.g. a std::map.
     * @throws RankingException if two competitors share a finish position.
     */
    template <class FinishMap>
    static Ranking fromFinishPositions(const FinishMap& finishPositions)
    {
      using Entry = std::pair<Competitor, long>;
      std::vector<Entry> entries;
      for (const auto& finish : finishPositions)
	entries.emplace_back(finish.first, static_cast<long>(finish.second));

      std::stable_sort(entries.begin(), entries.end(),
		       [](const Entry& a, const Entry& b) { return a.second < b.second; });

      for (std::size_t i = 1; i < entries.size(); ++i)
	{
	  if (entries[i].second == entries[i - 1].second)
	    throw RankingException("Ranking: tied finish position " + std::to_string(entries[i].second));
	}

      std::vector<Competitor> order;
      order.reserve(entries.size());
      for (const auto& entry : entries)
	order.push_back(entry.first);

      return Ranking(std::move(order));
    }

    std::size_t size() const
    {
      return mFinishOrder.size();
    }

    bool empty() const
    {
      return mFinishOrder.empty();
    }

    const_iterator begin() const
    {
      return mFinishOrder.begin();
    }

    const_iterator end() const
    {
      return mFinishOrder.end();
    }

    // position is 0-based
    const Competitor& getCompetitorAt(std::size_t position) const
    {
      return mFinishOrder.at(position);
    }

    const Competitor& getWinner() const
    {
      return mFinishOrder.at(0);
    }

    const Competitor& getLastPlace() const
    {
      if (mFinishOrder.empty())
	throw RankingException("Ranking: empty ranking has no last place");

      return mFinishOrder.back();
    }

    const std::vector<Competitor>& getFinishOrder() const
    {
      return mFinishOrder;
    }

  private:
    std::vector<Competitor> mFinishOrder;
  };
}

#endif
