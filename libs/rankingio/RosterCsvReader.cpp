// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include "csv.h"
#include "RosterCsvReader.h"

namespace plrank
{
  RosterCsvReader::RosterCsvReader(const std::string& fileName)
    : mFileName(fileName)
  {
    boost::filesystem::path rosterPath(mFileName);
    if (!boost::filesystem::exists(rosterPath))
      throw ResultsFileException("Roster file " + rosterPath.string() + " does not exist");
  }

  CompetitorRoster<std::string> RosterCsvReader::readFile() const
  {
    CompetitorRoster<std::string> roster;

    try
      {
	io::CSVReader<3, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '\"'>> csvFile(mFileName);
	csvFile.read_header(io::ignore_extra_column, "Competitor", "Label", "Active");

	std::string competitor, label, active;
	while (csvFile.read_row(competitor, label, active))
	  roster.addCompetitor(competitor, CompetitorInfo(label, parseActiveFlag(active)));
      }
    catch (const io::error::base& e)
      {
	throw ResultsFileException("Error reading roster file " + mFileName + ": " + e.what());
      }

    return roster;
  }

  bool parseActiveFlag(const std::string& value)
  {
    std::string flag = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));

    if (flag == "1" || flag == "true" || flag == "yes")
      return true;
    if (flag == "0" || flag == "false" || flag == "no")
      return false;

    throw ResultsFileException("Invalid active flag '" + value + "' (expected 1/0, true/false or yes/no)");
  }
}
