// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <fstream>
#include <unordered_map>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"
#include "ContestResultsCsvReader.h"

namespace plrank
{
  using ResultsCsv3 = io::CSVReader<3, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '\"'>>;
  using ResultsCsv4 = io::CSVReader<4, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '\"'>>;

  ContestResultsReader::ContestResultsReader(const std::string& fileName)
    : mFileName(fileName),
      mRankings()
  {
    boost::filesystem::path resultsPath(mFileName);
    if (!boost::filesystem::exists(resultsPath))
      throw ResultsFileException("Results file " + resultsPath.string() + " does not exist");
  }

  void ContestResultsReader::addContest(const std::string& contestId, const FinishList& finishes)
  {
    try
      {
	mRankings.push_back(StringRanking::fromFinishPositions(finishes));
      }
    catch (const RankingException& e)
      {
	throw ResultsFileException("Contest " + contestId + " in " + mFileName + ": " + e.what());
      }
  }

  bool ContestResultsReader::firstLineContains(const std::string& keyword) const
  {
    std::ifstream resultsFile(mFileName);
    if (!resultsFile.is_open())
      throw ResultsFileException("Cannot open results file: " + mFileName);

    std::string firstLine;
    if (!std::getline(resultsFile, firstLine))
      return false;

    return boost::algorithm::icontains(firstLine, keyword);
  }

  long ContestResultsReader::parseFinish(const std::string& value, const std::string& contestId) const
  {
    try
      {
	return boost::lexical_cast<long>(value);
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw ResultsFileException("Contest " + contestId + " in " + mFileName +
				   ": finish position '" + value + "' is not an integer");
      }
  }

  void ContestFinishCsvReader::readFile()
  {
    const bool hasHeader = firstLineContains("Competitor");

    std::vector<std::string> contestOrder;
    std::unordered_map<std::string, FinishList> contests;

    try
      {
	ResultsCsv3 csvFile(getFileName());
	if (hasHeader)
	  csvFile.read_header(io::ignore_extra_column, "Contest", "Competitor", "Finish");
	else
	  csvFile.set_header("Contest", "Competitor", "Finish");

	std::string contestId, competitor, finish;
	while (csvFile.read_row(contestId, competitor, finish))
	  {
	    auto it = contests.find(contestId);
	    if (it == contests.end())
	      {
		contestOrder.push_back(contestId);
		it = contests.emplace(contestId, FinishList()).first;
	      }

	    it->second.emplace_back(competitor, parseFinish(finish, contestId));
	  }
      }
    catch (const io::error::base& e)
      {
	throw ResultsFileException("Error reading results file " + getFileName() + ": " + e.what());
      }

    for (const auto& contestId : contestOrder)
      addContest(contestId, contests[contestId]);
  }

  void FieldSizeCsvReader::readFile()
  {
    const bool hasHeader = firstLineContains("Competitor");

    try
      {
	ResultsCsv4 csvFile(getFileName());
	if (hasHeader)
	  csvFile.read_header(io::ignore_extra_column, "Contest", "Competitor", "Finish", "FieldSize");
	else
	  csvFile.set_header("Contest", "Competitor", "Finish", "FieldSize");

	std::string contestId, competitor, finish, fieldSizeStr;
	std::string blockContestId;
	std::size_t blockFieldSize = 0;
	FinishList block;

	while (csvFile.read_row(contestId, competitor, finish, fieldSizeStr))
	  {
	    std::size_t fieldSize = 0;
	    try
	      {
		fieldSize = boost::lexical_cast<std::size_t>(fieldSizeStr);
	      }
	    catch (const boost::bad_lexical_cast&)
	      {
		throw ResultsFileException("Contest " + contestId + " in " + getFileName() +
					   ": field size '" + fieldSizeStr + "' is not a non-negative integer");
	      }

	    if (fieldSize == 0)
	      throw ResultsFileException("Contest " + contestId + " in " + getFileName() + ": field size must be positive");

	    if (block.empty())
	      {
		blockContestId = contestId;
		blockFieldSize = fieldSize;
	      }
	    else if (contestId != blockContestId || fieldSize != blockFieldSize)
	      {
		throw ResultsFileException("Contest " + blockContestId + " in " + getFileName() + ": expected " +
					   std::to_string(blockFieldSize) + " finishers but found only " +
					   std::to_string(block.size()));
	      }

	    block.emplace_back(competitor, parseFinish(finish, contestId));
	    if (block.size() == blockFieldSize)
	      {
		addContest(blockContestId, block);
		block.clear();
	      }
	  }

	if (!block.empty())
	  throw ResultsFileException("Results file " + getFileName() + " ends inside contest " + blockContestId);
      }
    catch (const io::error::base& e)
      {
	throw ResultsFileException("Error reading results file " + getFileName() + ": " + e.what());
      }
  }

  std::shared_ptr<ContestResultsReader> createResultsReader(const std::string& format,
							     const std::string& fileName)
  {
    std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(format));

    if (key == "contest")
      return std::make_shared<ContestFinishCsvReader>(fileName);
    if (key == "fieldsize")
      return std::make_shared<FieldSizeCsvReader>(fileName);

    throw ResultsFileException("Unknown results file format: " + format + " (expected contest or fieldsize)");
  }
}
