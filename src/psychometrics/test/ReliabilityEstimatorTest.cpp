#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>

#include "reliability/ReliabilityEstimator.h"
#include "reliability/ReliabilityRecommendations.h"
#include "simulation/PopulationSimulator.h"
#include "TestFixtures.h"

using Catch::Approx;
using namespace psychometrics;
using namespace psychometrics::test;
using namespace psychometrics::reliability;

namespace
{
  // Guttman-ordered answer patterns over items 1-4, administered in id order
  const std::vector<std::vector<bool>> kPatterns = {
    {true, true, true, true},
    {true, true, true, false},
    {true, true, false, false},
    {true, false, false, false},
    {false, false, false, false},
    {true, true, true, true},
    {true, true, false, false},
    {true, false, false, false}};

  config::ReliabilitySettings smallSampleSettings()
  {
    config::ReliabilitySettings settings;
    settings.minSessions = 5;
    settings.minRetestPairs = 5;
    settings.minItemAppearanceAbsolute = 1;
    return settings;
  }

  SessionResponses makeSession(SessionId id, const std::vector<bool>& answers)
  {
    SessionResponses s;
    s.sessionId = id;
    std::size_t sequence = 0;
    for (std::size_t i = 0; i < answers.size(); ++i)
    {
      ResponseRecord r;
      r.sessionId = id;
      r.itemId = static_cast<ItemId>(i + 1);
      r.isCorrect = answers[i];
      r.sequence = ++sequence;
      s.responses.push_back(r);
    }
    return s;
  }

  std::vector<SessionResponses> guttmanSessions(bool reverseLastItem = false)
  {
    std::vector<SessionResponses> sessions;
    SessionId id = 0;
    for (auto pattern : kPatterns)
    {
      if (reverseLastItem)
        pattern[3] = !pattern[3];
      sessions.push_back(makeSession(++id, pattern));
    }
    return sessions;
  }

  void seedGuttman(repository::InMemoryResponseRepository& responses, SessionId firstId,
                   std::size_t count)
  {
    for (std::size_t i = 0; i < count; ++i)
    {
      const auto& pattern = kPatterns[i % kPatterns.size()];
      std::vector<std::pair<ItemId, bool>> answers;
      for (std::size_t j = 0; j < pattern.size(); ++j)
        answers.emplace_back(static_cast<ItemId>(j + 1), pattern[j]);
      const SessionId id = firstId + static_cast<SessionId>(i);
      addCompletedSession(responses, id, id, answers, baseTime());
    }
  }

  RetestPair makePair(UserId user, double firstScore, double secondScore, int days)
  {
    RetestPair p;
    p.first = CompletedSessionScore{user, user * 10, firstScore, baseTime()};
    p.second = CompletedSessionScore{user, user * 10 + 1, secondScore,
                                     baseTime() + boost::posix_time::hours(24 * days)};
    p.intervalDays = days;
    return p;
  }
}

TEST_CASE("Reliability interpretation bands", "[ReliabilityEstimator]")
{
  SECTION("Alpha bands have inclusive lower bounds")
  {
    REQUIRE(interpretAlpha(0.90) == ReliabilityTier::Excellent);
    REQUIRE(interpretAlpha(0.80) == ReliabilityTier::Good);
    REQUIRE(interpretAlpha(0.78) == ReliabilityTier::Acceptable);
    REQUIRE(interpretAlpha(0.70) == ReliabilityTier::Acceptable);
    REQUIRE(interpretAlpha(0.60) == ReliabilityTier::Questionable);
    REQUIRE(interpretAlpha(0.50) == ReliabilityTier::Poor);
    REQUIRE(interpretAlpha(0.49) == ReliabilityTier::Unacceptable);
    REQUIRE(alphaMeetsMinimum(0.78));
    REQUIRE(alphaMeetsMinimum(0.70));
    REQUIRE_FALSE(alphaMeetsMinimum(0.6999));
  }

  SECTION("Test-retest bands have strict lower bounds")
  {
    REQUIRE(interpretTestRetest(0.91) == ReliabilityTier::Excellent);
    REQUIRE(interpretTestRetest(0.90) == ReliabilityTier::Good);
    REQUIRE(interpretTestRetest(0.65) == ReliabilityTier::Acceptable);
    REQUIRE(interpretTestRetest(0.50) == ReliabilityTier::Poor);
    REQUIRE(testRetestMeetsMinimum(0.65));
    REQUIRE_FALSE(testRetestMeetsMinimum(0.50));
  }

  SECTION("Split-half uses the alpha bands on the corrected value")
  {
    REQUIRE(interpretSplitHalf(0.83) == ReliabilityTier::Good);
    REQUIRE(splitHalfMeetsMinimum(0.70));
    REQUIRE(toString(ReliabilityTier::Questionable) == "questionable");
  }
}

TEST_CASE("Cronbach's alpha from completed sessions", "[ReliabilityEstimator]")
{
  const auto settings = smallSampleSettings();

  SECTION("Guttman data")
  {
    const AlphaResult R = ReliabilityEstimator::calculateAlpha(guttmanSessions(), settings);
    REQUIRE_FALSE(R.insufficientData);
    REQUIRE(R.numSessions == 8);
    REQUIRE(R.numItems == 4);
    REQUIRE(*R.alpha == Approx(0.7843));
    REQUIRE(*R.interpretation == ReliabilityTier::Acceptable);
    REQUIRE(R.meetsThreshold);

    REQUIRE(R.itemTotalCorrelations.size() == 4);
    REQUIRE(R.itemTotalCorrelations[0].itemId == 1);
    REQUIRE(R.itemTotalCorrelations[0].correlation == Approx(0.3941));
    REQUIRE(R.itemTotalCorrelations[2].correlation == Approx(0.7333));
    REQUIRE(R.problematicItems.empty());
  }

  SECTION("A reversed item drags alpha down and is reported first")
  {
    const AlphaResult R = ReliabilityEstimator::calculateAlpha(guttmanSessions(true), settings);
    REQUIRE(*R.alpha == Approx(-0.0567));
    REQUIRE(*R.interpretation == ReliabilityTier::Unacceptable);
    REQUIRE_FALSE(R.meetsThreshold);

    REQUIRE(R.problematicItems.size() == 2);
    REQUIRE(R.problematicItems[0].itemId == 4);
    REQUIRE(R.problematicItems[0].correlation == Approx(-0.6167));
    REQUIRE(R.problematicItems[1].itemId == 3);
    REQUIRE(R.problematicItems[1].correlation == Approx(0.0976));
  }

  SECTION("Identical rows give zero, not NaN")
  {
    std::vector<SessionResponses> sessions;
    for (SessionId id = 1; id <= 6; ++id)
      sessions.push_back(makeSession(id, {true, true, false, false}));

    const AlphaResult R = ReliabilityEstimator::calculateAlpha(sessions, settings);
    REQUIRE_FALSE(R.insufficientData);
    REQUIRE(R.alpha.has_value());
    REQUIRE(*R.alpha == 0.0);
    REQUIRE_FALSE(R.meetsThreshold);
    REQUIRE(R.message.find("Zero variance") != std::string::npos);
  }

  SECTION("Too few sessions")
  {
    std::vector<SessionResponses> sessions = guttmanSessions();
    sessions.resize(3);
    const AlphaResult R = ReliabilityEstimator::calculateAlpha(sessions, settings);
    REQUIRE(R.insufficientData);
    REQUIRE_FALSE(R.alpha.has_value());
    REQUIRE_FALSE(R.interpretation.has_value());
    REQUIRE(R.message.find("3 completed sessions") != std::string::npos);
  }

  SECTION("Items seen by too few sessions are left out")
  {
    config::ReliabilitySettings strict = settings;
    strict.minItemAppearanceAbsolute = 9;
    const AlphaResult R = ReliabilityEstimator::calculateAlpha(guttmanSessions(), strict);
    REQUIRE(R.insufficientData);
    REQUIRE(R.numItems == 0);
  }
}

TEST_CASE("Split-half reliability", "[ReliabilityEstimator]")
{
  const auto settings = smallSampleSettings();

  SECTION("Odd and even positions, Spearman-Brown corrected")
  {
    const SplitHalfResult R = ReliabilityEstimator::calculateSplitHalf(guttmanSessions(), settings);
    REQUIRE_FALSE(R.insufficientData);
    REQUIRE(R.numSessions == 8);
    REQUIRE(*R.halfCorrelation == Approx(0.7868));
    REQUIRE(*R.spearmanBrown == Approx(0.8807));
    REQUIRE(*R.interpretation == ReliabilityTier::Good);
    REQUIRE(R.meetsThreshold);
  }

  SECTION("Fewer than four items")
  {
    std::vector<SessionResponses> sessions;
    for (SessionId id = 1; id <= 6; ++id)
      sessions.push_back(makeSession(id, {id % 2 == 0, true, id % 3 == 0}));

    const SplitHalfResult R = ReliabilityEstimator::calculateSplitHalf(sessions, settings);
    REQUIRE(R.insufficientData);
    REQUIRE(R.numItems == 3);
    REQUIRE_FALSE(R.spearmanBrown.has_value());
  }

  SECTION("Flat halves cannot be correlated")
  {
    std::vector<SessionResponses> sessions;
    for (SessionId id = 1; id <= 6; ++id)
      sessions.push_back(makeSession(id, {true, true, true, true}));

    const SplitHalfResult R = ReliabilityEstimator::calculateSplitHalf(sessions, settings);
    REQUIRE_FALSE(R.insufficientData);
    REQUIRE_FALSE(R.spearmanBrown.has_value());
    REQUIRE_FALSE(R.meetsThreshold);
  }
}

TEST_CASE("Test-retest reliability", "[ReliabilityEstimator]")
{
  const auto settings = smallSampleSettings();

  SECTION("Stable scores with a practice gain")
  {
    const std::vector<RetestPair> pairs = {
      makePair(1, 100, 108, 14), makePair(2, 95, 101, 21), makePair(3, 110, 117, 14),
      makePair(4, 120, 126, 21), makePair(5, 88, 97, 14), makePair(6, 102, 107, 21)};

    const TestRetestResult R = ReliabilityEstimator::calculateTestRetest(pairs, settings);
    REQUIRE_FALSE(R.insufficientData);
    REQUIRE(R.numPairs == 6);
    REQUIRE(*R.correlation == Approx(0.9927));
    REQUIRE(*R.interpretation == ReliabilityTier::Excellent);
    REQUIRE(R.meetsThreshold);
    REQUIRE(*R.meanIntervalDays == Approx(17.5));
    REQUIRE(*R.meanScoreChange == Approx(6.83));
    REQUIRE(*R.scoreChangeSD == Approx(1.47));
    REQUIRE(R.practiceEffectDetected);
  }

  SECTION("Too few pairs")
  {
    const std::vector<RetestPair> pairs = {makePair(1, 100, 104, 10), makePair(2, 90, 91, 10)};
    const TestRetestResult R = ReliabilityEstimator::calculateTestRetest(pairs, settings);
    REQUIRE(R.insufficientData);
    REQUIRE(R.numPairs == 2);
    REQUIRE_FALSE(R.correlation.has_value());
  }

  SECTION("No spread in first scores")
  {
    std::vector<RetestPair> pairs;
    for (UserId u = 1; u <= 5; ++u)
      pairs.push_back(makePair(u, 100, 100 + u, 10));
    const TestRetestResult R = ReliabilityEstimator::calculateTestRetest(pairs, settings);
    REQUIRE_FALSE(R.insufficientData);
    REQUIRE_FALSE(R.correlation.has_value());
  }
}

TEST_CASE("Reliability recommendations and overall status", "[ReliabilityEstimator]")
{
  const auto settings = smallSampleSettings();

  SECTION("Nothing measurable yet")
  {
    const auto alpha = ReliabilityEstimator::calculateAlpha({}, settings);
    const auto split = ReliabilityEstimator::calculateSplitHalf({}, settings);
    const auto retest = ReliabilityEstimator::calculateTestRetest({}, settings);

    REQUIRE(determineOverallStatus(alpha, retest, split) == OverallReliabilityStatus::InsufficientData);

    const auto recs = generateRecommendations(alpha, retest, split);
    REQUIRE(recs.size() == 3);
    REQUIRE(recs[0].priority == RecommendationPriority::High);
    REQUIRE(recs[1].priority == RecommendationPriority::High);
    REQUIRE(recs[2].priority == RecommendationPriority::Medium);
    for (const auto& r : recs)
      REQUIRE(r.category == RecommendationCategory::DataCollection);
  }

  SECTION("Reversed item and practice effect")
  {
    const auto alpha = ReliabilityEstimator::calculateAlpha(guttmanSessions(true), settings);
    const auto split = ReliabilityEstimator::calculateSplitHalf(guttmanSessions(), settings);
    const std::vector<RetestPair> pairs = {
      makePair(1, 100, 108, 14), makePair(2, 95, 101, 21), makePair(3, 110, 117, 14),
      makePair(4, 120, 126, 21), makePair(5, 88, 97, 14), makePair(6, 102, 107, 21)};
    const auto retest = ReliabilityEstimator::calculateTestRetest(pairs, settings);

    REQUIRE(determineOverallStatus(alpha, retest, split) == OverallReliabilityStatus::NeedsAttention);

    const auto recs = generateRecommendations(alpha, retest, split);
    REQUIRE_FALSE(recs.empty());
    REQUIRE(recs.front().category == RecommendationCategory::ThresholdWarning);
    REQUIRE(recs.front().priority == RecommendationPriority::High);

    bool sawItemReview = false, sawPracticeEffect = false, sawSmallSample = false;
    for (const auto& r : recs)
    {
      sawItemReview |= r.category == RecommendationCategory::ItemReview;
      sawPracticeEffect |= r.message.find("practice effect") != std::string::npos;
      sawSmallSample |= r.priority == RecommendationPriority::Low &&
                        r.message.find("6 pairs") != std::string::npos;
    }
    REQUIRE(sawItemReview);
    REQUIRE(sawPracticeEffect);
    REQUIRE(sawSmallSample);

    // Sorted by priority
    for (std::size_t i = 1; i < recs.size(); ++i)
      REQUIRE(static_cast<int>(recs[i - 1].priority) <= static_cast<int>(recs[i].priority));
  }

  SECTION("Everything in the excellent band")
  {
    AlphaResult alpha;
    alpha.alpha = 0.93;
    alpha.interpretation = interpretAlpha(0.93);
    alpha.meetsThreshold = true;
    TestRetestResult retest;
    retest.insufficientData = true;
    SplitHalfResult split;
    split.spearmanBrown = 0.91;
    split.interpretation = interpretSplitHalf(0.91);
    split.meetsThreshold = true;

    REQUIRE(determineOverallStatus(alpha, retest, split) == OverallReliabilityStatus::Excellent);

    split.spearmanBrown = 0.75;
    split.interpretation = interpretSplitHalf(0.75);
    REQUIRE(determineOverallStatus(alpha, retest, split) == OverallReliabilityStatus::Acceptable);
  }
}

TEST_CASE("ReliabilityEstimator caches its snapshot", "[ReliabilityEstimator]")
{
  repository::InMemoryResponseRepository responses;
  seedGuttman(responses, 1, 8);

  simulation::ManualClock clock(baseTime());
  std::ostringstream log;
  config::ReliabilitySettings settings = smallSampleSettings();
  settings.cacheTtlSeconds = 300;
  ReliabilityEstimator estimator(responses, settings, log, clock.asClock());

  const auto first = estimator.currentReliability();
  REQUIRE(*first->alpha.alpha == Approx(0.7843));
  REQUIRE(first->alpha.numSessions == 8);
  REQUIRE(first->testRetest.insufficientData);
  REQUIRE(*first->internalConsistency() == Approx(0.7843));
  REQUIRE(log.str().find("[Reliability] Cronbach's alpha = 0.7843") != std::string::npos);

  seedGuttman(responses, 100, 8);

  SECTION("Within the TTL readers share the cached value")
  {
    clock.advance(boost::posix_time::seconds(299));
    REQUIRE(estimator.currentReliability() == first);
  }

  SECTION("After the TTL the snapshot is recomputed")
  {
    clock.advance(boost::posix_time::seconds(300));
    const auto second = estimator.currentReliability();
    REQUIRE(second != first);
    REQUIRE(second->alpha.numSessions == 16);
    REQUIRE(second->computedAt == baseTime() + boost::posix_time::seconds(300));
  }

  SECTION("Invalidation forces a recomputation")
  {
    estimator.invalidateCache();
    REQUIRE(estimator.currentReliability()->alpha.numSessions == 16);
  }
}

TEST_CASE("Repository-backed retest pairs", "[ReliabilityEstimator]")
{
  repository::InMemoryResponseRepository responses;
  std::ostringstream log;
  config::ReliabilitySettings settings = smallSampleSettings();
  settings.retestMinDays = 7;
  settings.retestMaxDays = 30;
  ReliabilityEstimator estimator(responses, settings, log);

  const std::vector<std::pair<double, double>> scores = {
    {100, 108}, {95, 101}, {110, 117}, {120, 126}, {88, 97}, {102, 107}};
  for (std::size_t i = 0; i < scores.size(); ++i)
  {
    const auto user = static_cast<UserId>(i + 1);
    addCompletedSession(responses, user * 10, user, {{1, true}}, baseTime(), scores[i].first);
    addCompletedSession(responses, user * 10 + 1, user, {{1, true}},
                        baseTime() + boost::posix_time::hours(24 * 14), scores[i].second);
  }
  // Retaken after two days: outside the window
  addCompletedSession(responses, 900, 90, {{1, true}}, baseTime(), 100.0);
  addCompletedSession(responses, 901, 90, {{1, true}}, baseTime() + boost::posix_time::hours(48), 140.0);

  const TestRetestResult R = estimator.estimateTestRetest();
  REQUIRE(R.numPairs == 6);
  REQUIRE(*R.correlation == Approx(0.9927));
  REQUIRE(*R.meanIntervalDays == Approx(14.0));

  REQUIRE(estimator.estimateTestRetest(7).insufficientData);
  REQUIRE(log.str().find("Test-retest skipped") != std::string::npos);
}

TEST_CASE("Snapshot falls back to split-half for internal consistency", "[ReliabilityEstimator]")
{
  ReliabilitySnapshot snapshot;
  REQUIRE_FALSE(snapshot.internalConsistency().has_value());

  snapshot.splitHalf.spearmanBrown = 0.81;
  REQUIRE(*snapshot.internalConsistency() == Approx(0.81));

  snapshot.alpha.alpha = 0.77;
  REQUIRE(*snapshot.internalConsistency() == Approx(0.77));
}
