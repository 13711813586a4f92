// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __STRENGTH_REPORT_H
#define __STRENGTH_REPORT_H 1

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>
#include "CompetitorRoster.h"
#include "FitResult.h"

namespace plrank
{
  template <class Competitor>
  struct StrengthReportEntry
  {
    Competitor competitor;
    double strength;
    bool active;
    std::string label;
  };

  /**
   * @class StrengthReport
   * @brief Ranked presentation of fitted strengths.
   *
   * Entries are sorted by descending strength (ties by ascending competitor) and
   * re-normalized to sum to one over the entries that are kept. Excluding inactive
   * competitors only removes rows from the report; the strengths themselves were
   * fitted on the full history.
   *
   * @tparam Competitor Must additionally be less-than comparable and streamable.
   */
  template <class Competitor, class Hash = std::hash<Competitor>>
  class StrengthReport
  {
  public:
    using EntryType = StrengthReportEntry<Competitor>;
    using const_iterator = typename std::vector<EntryType>::const_iterator;

    StrengthReport(const FitResult<Competitor, Hash>& result,
		   const CompetitorRoster<Competitor, Hash>& roster,
		   bool excludeInactive)
      : mHasRoster(!roster.empty())
    {
      for (const auto& strength : result.getStrengths())
	{
	  CompetitorInfo info = roster.getInfo(strength.first);
	  if (excludeInactive && !info.isActive())
	    continue;

	  mEntries.push_back(EntryType{strength.first, strength.second, info.isActive(), info.getLabel()});
	}

      double normalizingConstant = 0.0;
      for (const auto& entry : mEntries)
	normalizingConstant += entry.strength;

      if (normalizingConstant > 0.0)
	{
	  for (auto& entry : mEntries)
	    entry.strength /= normalizingConstant;
	}

      std::sort(mEntries.begin(), mEntries.end(),
		[](const EntryType& a, const EntryType& b) {
		  if (a.strength != b.strength)
		    return a.strength > b.strength;
		  return a.competitor < b.competitor;
		});
    }

    StrengthReport(const FitResult<Competitor, Hash>& result)
      : StrengthReport(result, CompetitorRoster<Competitor, Hash>(), false)
    {}

    const_iterator begin() const
    {
      return mEntries.begin();
    }

    const_iterator end() const
    {
      return mEntries.end();
    }

    std::size_t size() const
    {
      return mEntries.size();
    }

    const EntryType& getEntry(std::size_t rank) const
    {
      return mEntries.at(rank);
    }

    void write(std::ostream& os) const
    {
      const auto flags = os.flags();
      const auto precision = os.precision();

      for (const auto& entry : mEntries)
	{
	  std::ostringstream name;
	  name << entry.competitor;

	  os << std::left << std::setw(25) << name.str()
	     << std::right << std::fixed << std::setprecision(3) << std::setw(5) << entry.strength;

	  if (mHasRoster)
	    os << "   " << (entry.active ? 1 : 0) << "  " << std::left << entry.label;

	  os << std::endl;
	}

      os.flags(flags);
      os.precision(precision);
    }

  private:
    std::vector<EntryType> mEntries;
    bool mHasRoster;
  };
}

#endif
