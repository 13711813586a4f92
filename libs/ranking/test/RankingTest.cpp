// RankingTest.cpp
//
// Unit tests for plrank::Ranking:
//  - construction from a finish order, duplicate rejection
//  - construction from competitor -> finish position maps (gaps allowed, ties rejected)
//  - positional accessors

#include <catch2/catch_test_macros.hpp>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>
#include "Ranking.h"
#include "RankingException.h"

using namespace plrank;

using StringRanking = Ranking<std::string>;

TEST_CASE("Ranking construction from a finish order", "[Ranking]")
{
  SECTION("Accessors follow the finish order")
  {
    StringRanking ranking({"alice", "bob", "carol"});

    REQUIRE(ranking.size() == 3);
    REQUIRE_FALSE(ranking.empty());
    REQUIRE(ranking.getWinner() == "alice");
    REQUIRE(ranking.getCompetitorAt(1) == "bob");
    REQUIRE(ranking.getLastPlace() == "carol");
    REQUIRE(ranking.getFinishOrder() == std::vector<std::string>{"alice", "bob", "carol"});
  }

  SECTION("Iteration visits finishers first to last")
  {
    StringRanking ranking({"x", "y"});
    std::vector<std::string> visited(ranking.begin(), ranking.end());

    REQUIRE(visited == std::vector<std::string>{"x", "y"});
  }

  SECTION("Single finisher is allowed")
  {
    StringRanking ranking({"solo"});

    REQUIRE(ranking.size() == 1);
    REQUIRE(ranking.getWinner() == ranking.getLastPlace());
  }

  SECTION("Competitor listed twice is rejected")
  {
    REQUIRE_THROWS_AS(StringRanking({"alice", "bob", "alice"}), RankingException);
  }

  SECTION("Empty ranking has no last place")
  {
    StringRanking ranking(std::vector<std::string>{});

    REQUIRE(ranking.empty());
    REQUIRE_THROWS_AS(ranking.getLastPlace(), RankingException);
  }
}

TEST_CASE("Ranking construction from finish positions", "[Ranking][FinishPositions]")
{
  SECTION("Entries are ordered by finish position")
  {
    std::unordered_map<std::string, int> finishes{{"carol", 3}, {"alice", 1}, {"bob", 2}};
    auto ranking = StringRanking::fromFinishPositions(finishes);

    REQUIRE(ranking.getFinishOrder() == std::vector<std::string>{"alice", "bob", "carol"});
  }

  SECTION("Gaps in the numbering only matter through relative order")
  {
    std::map<std::string, long> finishes{{"a", 10}, {"b", 2}, {"c", 7}};
    auto ranking = StringRanking::fromFinishPositions(finishes);

    REQUIRE(ranking.getFinishOrder() == std::vector<std::string>{"b", "c", "a"});
  }

  SECTION("Tied finish positions are rejected")
  {
    std::map<std::string, int> finishes{{"a", 1}, {"b", 2}, {"c", 2}};

    REQUIRE_THROWS_AS(StringRanking::fromFinishPositions(finishes), RankingException);
  }

  SECTION("Integer competitors")
  {
    std::map<int, int> finishes{{42, 2}, {7, 1}};
    auto ranking = Ranking<int>::fromFinishPositions(finishes);

    REQUIRE(ranking.getWinner() == 7);
    REQUIRE(ranking.getLastPlace() == 42);
  }
}
