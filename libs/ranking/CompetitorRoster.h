// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __COMPETITOR_ROSTER_H
#define __COMPETITOR_ROSTER_H 1

#include <string>
#include <unordered_map>
#include <utility>

namespace plrank
{
  // Presentation-only metadata; never read by the fitting algorithm.
  class CompetitorInfo
  {
  public:
    CompetitorInfo(std::string label, bool active)
      : mLabel(std::move(label)),
	mActive(active)
    {}

    CompetitorInfo()
      : mLabel(),
	mActive(true)
    {}

    const std::string& getLabel() const
    {
      return mLabel;
    }

    bool isActive() const
    {
      return mActive;
    }

  private:
    std::string mLabel;
    bool mActive;
  };

  /**
   * @class CompetitorRoster
   * @brief Display label and active flag per competitor.
   *
   * Competitors missing from the roster are reported as active with an empty label.
   */
  template <class Competitor, class Hash = std::hash<Competitor>>
  class CompetitorRoster
  {
  public:
    CompetitorRoster() = default;

    void addCompetitor(const Competitor& competitor, const CompetitorInfo& info)
    {
      mRoster[competitor] = info;
    }

    bool contains(const Competitor& competitor) const
    {
      return mRoster.find(competitor) != mRoster.end();
    }

    CompetitorInfo getInfo(const Competitor& competitor) const
    {
      auto it = mRoster.find(competitor);
      if (it == mRoster.end())
	return CompetitorInfo();

      return it->second;
    }

    bool isActive(const Competitor& competitor) const
    {
      return getInfo(competitor).isActive();
    }

    std::size_t size() const
    {
      return mRoster.size();
    }

    bool empty() const
    {
      return mRoster.empty();
    }

  private:
    std::unordered_map<Competitor, CompetitorInfo, Hash> mRoster;
  };
}

#endif
