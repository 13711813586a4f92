// RosterAndConfigurationReaderTest.cpp
//
// Unit tests for the auxiliary input files:
//  - RosterCsvReader: labels and active flags, flag spellings
//  - RaterConfigurationFileReader: every parameter, case-insensitive names,
//    defaults for omitted parameters, rejection of unknown names and bad values

#include <catch2/catch_test_macros.hpp>
#include <string>
#include "RaterConfigurationFileReader.h"
#include "RosterCsvReader.h"
#include "ResultsFileTestUtils.h"

using namespace plrank;

TEST_CASE("RosterCsvReader reads labels and active flags", "[RosterCsvReader]")
{
  SECTION("Valid roster")
  {
    TemporaryCsvFile file("Competitor,Label,Active\n"
			  "ann,\"Smith, Ann\",1\n"
			  "ben,Ben Jones,no\n"
			  "cat,,TRUE\n");
    RosterCsvReader reader(file.getFileName());
    auto roster = reader.readFile();

    REQUIRE(roster.size() == 3);
    REQUIRE(roster.getInfo("ann").getLabel() == "Smith, Ann");
    REQUIRE(roster.isActive("ann"));
    REQUIRE_FALSE(roster.isActive("ben"));
    REQUIRE(roster.isActive("cat"));
    REQUIRE(roster.getInfo("cat").getLabel().empty());
  }

  SECTION("Invalid active flag")
  {
    TemporaryCsvFile file("Competitor,Label,Active\n"
			  "ann,Ann,maybe\n");
    RosterCsvReader reader(file.getFileName());

    REQUIRE_THROWS_AS(reader.readFile(), ResultsFileException);
  }

  SECTION("Missing columns")
  {
    TemporaryCsvFile file("Competitor,Label\n"
			  "ann,Ann\n");
    RosterCsvReader reader(file.getFileName());

    REQUIRE_THROWS_AS(reader.readFile(), ResultsFileException);
  }

  SECTION("Flag spellings")
  {
    REQUIRE(parseActiveFlag("yes"));
    REQUIRE(parseActiveFlag(" 1 "));
    REQUIRE_FALSE(parseActiveFlag("False"));
    REQUIRE_FALSE(parseActiveFlag("0"));
    REQUIRE_THROWS_AS(parseActiveFlag(""), ResultsFileException);
  }

  SECTION("Missing file")
  {
    REQUIRE_THROWS_AS(RosterCsvReader("/nonexistent/plrank/roster.csv"), ResultsFileException);
  }
}

TEST_CASE("RaterConfigurationFileReader parses fit settings", "[RaterConfigurationFileReader]")
{
  SECTION("Every parameter")
  {
    TemporaryCsvFile file("Parameter,Value\n"
			  "Tolerance,1e-7\n"
			  "CheckPrecondition,false\n"
			  "Normalize,no\n"
			  "Formulation,Vectorized\n"
			  "MaxIterations,250\n"
			  "Parallel,true\n"
			  "Verbose,1\n");
    RaterConfigurationFileReader reader(file.getFileName());
    auto configuration = reader.readConfigurationFile();

    REQUIRE(configuration->getTolerance() == 1e-7);
    REQUIRE_FALSE(configuration->checkPrecondition());
    REQUIRE_FALSE(configuration->normalize());
    REQUIRE(configuration->getFormulation() == MMFormulation::VECTORIZED);
    REQUIRE(*configuration->getMaxIterations() == 250);
    REQUIRE(configuration->isParallel());
    REQUIRE(configuration->isVerbose());
  }

  SECTION("Omitted parameters keep their defaults and names are case-insensitive")
  {
    TemporaryCsvFile file("Parameter,Value\n"
			  "maxiterations,none\n"
			  "TOLERANCE,1e-10\n");
    RaterConfigurationFileReader reader(file.getFileName());
    auto configuration = reader.readConfigurationFile();

    REQUIRE(configuration->getTolerance() == 1e-10);
    REQUIRE(configuration->checkPrecondition());
    REQUIRE(configuration->normalize());
    REQUIRE(configuration->getFormulation() == MMFormulation::REFERENCE);
    REQUIRE_FALSE(configuration->getMaxIterations().has_value());
  }

  SECTION("Unknown parameter")
  {
    TemporaryCsvFile file("Parameter,Value\n"
			  "Damping,0.5\n");
    RaterConfigurationFileReader reader(file.getFileName());

    REQUIRE_THROWS_AS(reader.readConfigurationFile(), RaterConfigurationException);
  }

  SECTION("Bad values")
  {
    TemporaryCsvFile badNumber("Parameter,Value\nTolerance,small\n");
    TemporaryCsvFile negative("Parameter,Value\nTolerance,-1\n");
    TemporaryCsvFile badSwitch("Parameter,Value\nNormalize,sometimes\n");
    TemporaryCsvFile badFormulation("Parameter,Value\nFormulation,matrix\n");
    TemporaryCsvFile zeroCap("Parameter,Value\nMaxIterations,0\n");

    for (const TemporaryCsvFile* file : {&badNumber, &negative, &badSwitch, &badFormulation, &zeroCap})
      {
	RaterConfigurationFileReader reader(file->getFileName());
	REQUIRE_THROWS_AS(reader.readConfigurationFile(), RaterConfigurationException);
      }
  }

  SECTION("Missing file")
  {
    RaterConfigurationFileReader reader("/nonexistent/plrank/rater.csv");
    REQUIRE_THROWS_AS(reader.readConfigurationFile(), RaterConfigurationException);
  }
}
