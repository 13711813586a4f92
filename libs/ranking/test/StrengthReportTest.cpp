// StrengthReportTest.cpp
//
// Unit tests for plrank::CompetitorRoster and plrank::StrengthReport:
//  - roster lookups (unknown competitors are active with no label)
//  - report ordering, re-normalization over the kept entries
//  - excluding inactive competitors leaves the fitted strengths untouched
//  - fixed-width output with and without roster columns

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>
#include <vector>
#include "CompetitorRoster.h"
#include "PlackettLuceFitter.h"
#include "StrengthReport.h"

using Catch::Approx;
using namespace plrank;

using StringResult = FitResult<std::string>;

namespace
{
  StringResult makeResult(const StringResult::StrengthMap& strengths)
  {
    return StringResult(FitStatus::CONVERGED, strengths, 12, 1e-10, std::size_t(1), 0);
  }
}

TEST_CASE("CompetitorRoster lookups", "[CompetitorRoster]")
{
  CompetitorRoster<std::string> roster;
  REQUIRE(roster.empty());

  roster.addCompetitor("alice", CompetitorInfo("Alice A.", true));
  roster.addCompetitor("bob", CompetitorInfo("Bob B.", false));

  REQUIRE(roster.size() == 2);
  REQUIRE(roster.contains("alice"));
  REQUIRE(roster.getInfo("alice").getLabel() == "Alice A.");
  REQUIRE_FALSE(roster.isActive("bob"));

  SECTION("Unknown competitors default to active with an empty label")
  {
    REQUIRE_FALSE(roster.contains("carol"));
    REQUIRE(roster.isActive("carol"));
    REQUIRE(roster.getInfo("carol").getLabel().empty());
  }

  SECTION("Later entries replace earlier ones")
  {
    roster.addCompetitor("bob", CompetitorInfo("Robert", true));

    REQUIRE(roster.size() == 2);
    REQUIRE(roster.isActive("bob"));
    REQUIRE(roster.getInfo("bob").getLabel() == "Robert");
  }
}

TEST_CASE("StrengthReport ordering and normalization", "[StrengthReport]")
{
  SECTION("Entries sorted by descending strength")
  {
    StrengthReport<std::string> report(makeResult({{"x", 0.2}, {"y", 0.5}, {"z", 0.3}}));

    REQUIRE(report.size() == 3);
    REQUIRE(report.getEntry(0).competitor == "y");
    REQUIRE(report.getEntry(1).competitor == "z");
    REQUIRE(report.getEntry(2).competitor == "x");
    REQUIRE(report.getEntry(0).active);
  }

  SECTION("Ties are broken by competitor")
  {
    StrengthReport<std::string> report(makeResult({{"b", 0.25}, {"a", 0.25}, {"c", 0.5}}));

    REQUIRE(report.getEntry(1).competitor == "a");
    REQUIRE(report.getEntry(2).competitor == "b");
  }

  SECTION("Unnormalized strengths are rescaled to sum to one")
  {
    StrengthReport<std::string> report(makeResult({{"x", 3.0}, {"y", 1.0}}));

    REQUIRE(report.getEntry(0).strength == Approx(0.75));
    REQUIRE(report.getEntry(1).strength == Approx(0.25));
  }

  SECTION("Ill-posed results give an empty report")
  {
    StrengthReport<std::string> report(StringResult::illPosed(3));
    REQUIRE(report.size() == 0);
  }
}

TEST_CASE("StrengthReport inactive filtering", "[StrengthReport][Roster]")
{
  std::vector<Ranking<std::string>> rankings{Ranking<std::string>({"A", "B", "C", "D"}),
					     Ranking<std::string>({"B", "C", "A", "D"}),
					     Ranking<std::string>({"C", "A", "B", "D"}),
					     Ranking<std::string>({"D", "A"})};
  auto result = PlackettLuceFitter<std::string>().fit(rankings);
  REQUIRE(result.isConverged());

  CompetitorRoster<std::string> roster;
  roster.addCompetitor("A", CompetitorInfo("Ann", true));
  roster.addCompetitor("B", CompetitorInfo("Ben", false));

  SECTION("All competitors kept")
  {
    StrengthReport<std::string> report(result, roster, false);

    REQUIRE(report.size() == 4);
    double total = 0.0;
    for (const auto& entry : report)
      {
	REQUIRE(entry.strength == Approx(result.getStrength(entry.competitor)).margin(1e-12));
	total += entry.strength;
      }
    REQUIRE(total == Approx(1.0));
  }

  SECTION("Inactive competitors dropped and the rest re-normalized")
  {
    StrengthReport<std::string> report(result, roster, true);

    REQUIRE(report.size() == 3);

    const double keptTotal = result.getStrength("A") + result.getStrength("C") + result.getStrength("D");
    double total = 0.0;
    for (const auto& entry : report)
      {
	REQUIRE(entry.competitor != "B");
	REQUIRE(entry.active);
	REQUIRE(entry.strength == Approx(result.getStrength(entry.competitor) / keptTotal));
	total += entry.strength;
      }
    REQUIRE(total == Approx(1.0));
  }

  SECTION("Filtering never changes the fitted strengths")
  {
    auto refit = PlackettLuceFitter<std::string>().fit(rankings);
    StrengthReport<std::string> report(result, roster, true);

    for (const auto& entry : refit.getStrengths())
      REQUIRE(result.getStrength(entry.first) == entry.second);
  }
}

TEST_CASE("StrengthReport output", "[StrengthReport][Output]")
{
  SECTION("Without a roster")
  {
    StrengthReport<std::string> report(makeResult({{"alpha", 0.6}, {"beta", 0.4}}));
    std::ostringstream out;
    report.write(out);

    const std::string expected =
      "alpha" + std::string(20, ' ') + "0.600\n" +
      "beta" + std::string(21, ' ') + "0.400\n";
    REQUIRE(out.str() == expected);
  }

  SECTION("With roster columns")
  {
    CompetitorRoster<std::string> roster;
    roster.addCompetitor("alpha", CompetitorInfo("First", true));
    roster.addCompetitor("beta", CompetitorInfo("Second", false));

    StrengthReport<std::string> report(makeResult({{"alpha", 0.6}, {"beta", 0.4}}), roster, false);
    std::ostringstream out;
    report.write(out);

    const std::string expected =
      "alpha" + std::string(20, ' ') + "0.600   1  First\n" +
      "beta" + std::string(21, ' ') + "0.400   0  Second\n";
    REQUIRE(out.str() == expected);
  }

  SECTION("Stream formatting is restored")
  {
    StrengthReport<std::string> report(makeResult({{"alpha", 1.0}}));
    std::ostringstream out;
    report.write(out);
    out << 0.123456789;

    REQUIRE(out.str().substr(out.str().size() - 8) == "0.123457");
  }
}
