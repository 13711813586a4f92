// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __CONTEST_RESULTS_CSV_READER_H
#define __CONTEST_RESULTS_CSV_READER_H 1

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "Ranking.h"
#include "ResultsFileException.h"

namespace plrank
{
  using StringRanking = Ranking<std::string>;

  //
  // Base class for readers that turn a results file into one Ranking per contest.
  // Finish positions are 1 = first place; ties are rejected.
  //
  class ContestResultsReader
  {
  public:
    explicit ContestResultsReader(const std::string& fileName);

    virtual ~ContestResultsReader()
    {}

    const std::string& getFileName() const
    {
      return mFileName;
    }

    const std::vector<StringRanking>& getRankings() const
    {
      return mRankings;
    }

    std::size_t getNumContests() const
    {
      return mRankings.size();
    }

    virtual void readFile() = 0;

  protected:
    using FinishList = std::vector<std::pair<std::string, long>>;

    void addContest(const std::string& contestId, const FinishList& finishes);
    bool firstLineContains(const std::string& keyword) const;
    long parseFinish(const std::string& value, const std::string& contestId) const;

  private:
    std::string mFileName;
    std::vector<StringRanking> mRankings;
  };

  //
  // Long format, one row per finisher:
  //
  //   Contest,Competitor,Finish
  //
  // Rows of one contest need not be adjacent; contests are kept in the order their
  // identifier is first seen. The header row is optional.
  //
  class ContestFinishCsvReader : public ContestResultsReader
  {
  public:
    explicit ContestFinishCsvReader(const std::string& fileName)
      : ContestResultsReader(fileName)
    {}

    void readFile() override;
  };

  //
  // Field-size format of the tournament database export:
  //
  //   Contest,Competitor,Finish,FieldSize
  //
  // Consecutive blocks of FieldSize rows make up one contest. Every row of a block
  // must carry the same contest identifier and field size, and the file may not end
  // inside a block.
  //
  class FieldSizeCsvReader : public ContestResultsReader
  {
  public:
    explicit FieldSizeCsvReader(const std::string& fileName)
      : ContestResultsReader(fileName)
    {}

    void readFile() override;
  };

  // format is "contest" or "fieldsize" (case-insensitive)
  std::shared_ptr<ContestResultsReader> createResultsReader(const std::string& format,
							     const std::string& fileName);
}

#endif
