#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <memory>
#include <set>
#include <sstream>
#include <thread>

#include "adaptive/AdaptiveEngine.h"
#include "adaptive/ScoreConversion.h"
#include "simulation/PopulationSimulator.h"
#include "TestFixtures.h"

using Catch::Approx;
using namespace psychometrics;
using namespace psychometrics::test;
using psychometrics::adaptive::AdaptiveEngine;
using psychometrics::adaptive::AdvanceResult;
using psychometrics::adaptive::EngineState;

namespace
{
  config::AdaptiveSettings stopping(double seThreshold, std::size_t maxItems)
  {
    config::AdaptiveSettings settings;
    settings.seThreshold = seThreshold;
    settings.maxItems = maxItems;
    return settings;
  }

  config::ReliabilitySettings smallSampleReliability()
  {
    config::ReliabilitySettings settings;
    settings.minSessions = 5;
    settings.minItemAppearanceAbsolute = 1;
    return settings;
  }

  // Steep calibrated items spread around the mean; item 3 sits at b = 0
  std::vector<Item> steepPool(std::size_t count)
  {
    const double difficulties[] = {-1.0, -0.5, 0.0, 0.5, 1.0, 1.5};
    std::vector<Item> pool;
    for (std::size_t i = 0; i < count && i < 6; ++i)
    {
      Item item = makeItem(static_cast<ItemId>(i + 1), DifficultyTier::Medium,
                           kAllItemTypes[i % kAllItemTypes.size()], 0.40, 200);
      item.irt = IrtParameters{2.5, difficulties[i], 0.0};
      pool.push_back(item);
    }
    return pool;
  }

  struct EngineHarness
  {
    EngineHarness(const config::AdaptiveSettings& settings,
                  const std::vector<Item>& pool,
                  const config::ReliabilitySettings& reliabilitySettings = config::ReliabilitySettings())
      : responseWriter(responses),
        sessions(sessionStore),
        selector(model, log),
        estimator(model),
        clock(baseTime()),
        reliabilityEstimator(responses, reliabilitySettings, log, clock.asClock()),
        engine(items, responseWriter, sessions, selector, estimator, reliabilityEstimator, precision,
               settings, log, clock.asClock())
    {
      for (const auto& item : pool)
        items.addItem(item);
    }

    TestSession stored(SessionId id) const
    {
      return *sessionStore.findSession(id);
    }

    repository::InMemoryItemRepository items;
    repository::InMemoryResponseRepository responses;
    FailingResponseRepository responseWriter;
    repository::InMemorySessionRepository sessionStore;
    FailingSessionRepository sessions;
    adaptive::TwoPLInformationModel model;
    std::ostringstream log;
    adaptive::ItemSelector selector;
    adaptive::EapAbilityEstimator estimator;
    simulation::ManualClock clock;
    reliability::ReliabilityEstimator reliabilityEstimator;
    reliability::PrecisionCalculator precision;
    AdaptiveEngine engine;
  };
}

TEST_CASE("Starting an adaptive session", "[AdaptiveEngine]")
{
  SECTION("First item is the most informative at the prior mean")
  {
    EngineHarness h(stopping(0.3, 15), steepPool(6));
    const auto start = h.engine.startAdaptive(42);

    REQUIRE(start.firstItem.has_value());
    REQUIRE(start.firstItem->id == 3);
    REQUIRE(start.theta == 0.0);
    REQUIRE(start.standardError == 1.0);
    REQUIRE_FALSE(start.outcome.has_value());
    REQUIRE(start.session.userId == 42);
    REQUIRE(start.session.status == SessionStatus::InProgress);
    REQUIRE(*h.stored(start.session.id).currentItemId == 3);
    REQUIRE(h.engine.state(start.session.id) == EngineState::AwaitingResponse);
  }

  SECTION("An empty eligible pool ends the session immediately")
  {
    std::vector<Item> pool = steepPool(2);
    for (auto& item : pool)
      item.qualityFlag = QualityFlag::Deactivated;
    EngineHarness h(stopping(0.3, 15), pool);

    const auto start = h.engine.startAdaptive(7);
    REQUIRE_FALSE(start.firstItem.has_value());
    REQUIRE(start.outcome.has_value());
    REQUIRE(start.outcome->stoppingReason == StoppingReason::PoolExhausted);
    REQUIRE(start.session.status == SessionStatus::Completed);
    REQUIRE(h.engine.state(start.session.id) == EngineState::Completed);
    REQUIRE(h.log.str().find("empty eligible pool") != std::string::npos);

    // No items, no score: nothing reaches the reliability inputs
    h.clock.advance(boost::posix_time::hours(24 * 10));
    REQUIRE(h.engine.startAdaptive(7).session.status == SessionStatus::Completed);
    REQUIRE(h.responses.completedSessionIds().empty());
    REQUIRE(h.responses.sessionsWithMultipleCompletions(0, 365).empty());
  }
}

TEST_CASE("Stopping rules", "[AdaptiveEngine]")
{
  SECTION("Precision reached before the item cap")
  {
    EngineHarness h(stopping(0.8, 5), steepPool(6));
    const auto start = h.engine.startAdaptive(1);

    const AdvanceResult r = h.engine.submitAndAdvance(start.session.id, start.firstItem->id, true);
    REQUIRE(r.testComplete);
    REQUIRE(*r.stoppingReason == StoppingReason::SeThreshold);
    REQUIRE(r.itemsAdministered == 1);
    REQUIRE(r.standardError < 0.8);
    REQUIRE(r.theta > 0.0);
    REQUIRE_FALSE(r.nextItem.has_value());
    REQUIRE(h.engine.state(start.session.id) == EngineState::Completed);
  }

  SECTION("Item cap reached before precision")
  {
    EngineHarness h(stopping(0.05, 3), steepPool(6));
    const auto start = h.engine.startAdaptive(1);

    ItemId current = start.firstItem->id;
    AdvanceResult r;
    for (std::size_t n = 1; n <= 3; ++n)
    {
      r = h.engine.submitAndAdvance(start.session.id, current, n % 2 == 1);
      REQUIRE(r.itemsAdministered == n);
      if (n < 3)
      {
        REQUIRE_FALSE(r.testComplete);
        REQUIRE(r.nextItem.has_value());
        REQUIRE(h.engine.state(start.session.id) == EngineState::AwaitingResponse);
        current = r.nextItem->id;
      }
    }
    REQUIRE(r.testComplete);
    REQUIRE(*r.stoppingReason == StoppingReason::MaxItems);
    REQUIRE(r.outcome->correctCount == 2);
    REQUIRE(h.responses.allResponsesForSession(start.session.id).size() == 3);
  }

  SECTION("Both conditions on the same response report the cap")
  {
    EngineHarness h(stopping(0.8, 1), steepPool(6));
    const auto start = h.engine.startAdaptive(1);
    const AdvanceResult r = h.engine.submitAndAdvance(start.session.id, start.firstItem->id, true);
    REQUIRE(*r.stoppingReason == StoppingReason::MaxItems);
  }

  SECTION("Running out of items")
  {
    EngineHarness h(stopping(0.01, 10), steepPool(2));
    const auto start = h.engine.startAdaptive(1);
    const AdvanceResult first = h.engine.submitAndAdvance(start.session.id, start.firstItem->id, false);
    REQUIRE_FALSE(first.testComplete);

    const AdvanceResult last = h.engine.submitAndAdvance(start.session.id, first.nextItem->id, true);
    REQUIRE(last.testComplete);
    REQUIRE(*last.stoppingReason == StoppingReason::PoolExhausted);
    REQUIRE(last.itemsAdministered == 2);
  }
}

TEST_CASE("Session outcome and confidence interval", "[AdaptiveEngine]")
{
  SECTION("Without reliability data the score is reported without an interval")
  {
    EngineHarness h(stopping(0.8, 5), steepPool(6));
    const auto start = h.engine.startAdaptive(9);
    const AdvanceResult r = h.engine.submitAndAdvance(start.session.id, start.firstItem->id, true);

    REQUIRE(r.outcome.has_value());
    REQUIRE_FALSE(r.outcome->score.confidenceInterval.has_value());
    REQUIRE(r.outcome->score.score == adaptive::thetaToScore(r.theta));
    REQUIRE(r.outcome->score.score > 100);
    REQUIRE(r.outcome->domainAccuracy.size() == 1);

    const TestSession session = h.stored(start.session.id);
    REQUIRE(session.status == SessionStatus::Completed);
    REQUIRE(*session.score == r.outcome->score.score);
    REQUIRE_FALSE(session.confidenceInterval.has_value());
    REQUIRE(*session.completedAt == baseTime());

    const auto completed = h.responses.completedSessionIds();
    REQUIRE(completed.size() == 1);
    REQUIRE(completed[0] == start.session.id);
    REQUIRE(h.log.str().find("(no confidence interval)") != std::string::npos);
  }

  SECTION("Usable reliability attaches an interval around the score")
  {
    EngineHarness h(stopping(0.8, 5), steepPool(6), smallSampleReliability());

    // Eight earlier sessions on a separate form, alpha about 0.78
    const std::vector<std::vector<bool>> patterns = {
      {true, true, true, true}, {true, true, true, false}, {true, true, false, false},
      {true, false, false, false}, {false, false, false, false}, {true, true, true, true},
      {true, true, false, false}, {true, false, false, false}};
    SessionId id = 1000;
    for (const auto& pattern : patterns)
    {
      std::vector<std::pair<ItemId, bool>> answers;
      for (std::size_t j = 0; j < pattern.size(); ++j)
        answers.emplace_back(static_cast<ItemId>(101 + j), pattern[j]);
      ++id;
      addCompletedSession(h.responses, id, id, answers, baseTime());
    }

    const auto start = h.engine.startAdaptive(9);
    const AdvanceResult r = h.engine.submitAndAdvance(start.session.id, start.firstItem->id, true);

    REQUIRE(r.outcome->score.confidenceInterval.has_value());
    const ConfidenceInterval& ci = *r.outcome->score.confidenceInterval;
    REQUIRE(ci.lower <= r.outcome->score.score);
    REQUIRE(r.outcome->score.score <= ci.upper);
    REQUIRE(ci.confidenceLevel == Approx(0.95));
    REQUIRE(ci.sem == Approx(15.0 * std::sqrt(1.0 - 0.7843)).margin(0.01));
    REQUIRE(h.stored(start.session.id).confidenceInterval.has_value());
  }
}

TEST_CASE("Retries and storage failures", "[AdaptiveEngine]")
{
  EngineHarness h(stopping(0.01, 5), steepPool(6));
  const auto start = h.engine.startAdaptive(3);
  const SessionId sid = start.session.id;
  const ItemId first = start.firstItem->id;

  SECTION("Resubmitting a recorded answer changes nothing")
  {
    const AdvanceResult once = h.engine.submitAndAdvance(sid, first, true);
    const AdvanceResult twice = h.engine.submitAndAdvance(sid, first, true);

    REQUIRE(twice.itemsAdministered == 1);
    REQUIRE(twice.theta == Approx(once.theta));
    REQUIRE(twice.nextItem->id == once.nextItem->id);
    REQUIRE_FALSE(twice.testComplete);
    REQUIRE(h.responses.allResponsesForSession(sid).size() == 1);
  }

  SECTION("A failed session write leaves ability and count untouched")
  {
    h.sessions.failNextUpdates = 1;
    REQUIRE_THROWS_AS(h.engine.submitAndAdvance(sid, first, true), RepositoryFailureException);

    const TestSession unchanged = h.stored(sid);
    REQUIRE(unchanged.itemsAdministered == 0);
    REQUIRE(unchanged.theta == 0.0);
    REQUIRE(unchanged.standardError == 1.0);
    REQUIRE(*unchanged.currentItemId == first);
    REQUIRE(unchanged.answers.empty());
    REQUIRE(h.engine.state(sid) == EngineState::AwaitingResponse);
    REQUIRE(h.responses.allResponsesForSession(sid).empty());

    // The retry commits exactly one response
    const AdvanceResult retry = h.engine.submitAndAdvance(sid, first, true);
    REQUIRE(retry.itemsAdministered == 1);
    REQUIRE(retry.theta > 0.0);
    REQUIRE(h.stored(sid).itemsAdministered == 1);
    REQUIRE(h.responses.allResponsesForSession(sid).size() == 1);
  }

  SECTION("An answer that never committed can be given differently")
  {
    h.sessions.failNextUpdates = 1;
    REQUIRE_THROWS_AS(h.engine.submitAndAdvance(sid, first, true), RepositoryFailureException);

    const AdvanceResult retry = h.engine.submitAndAdvance(sid, first, false);
    REQUIRE(retry.theta < 0.0);
    REQUIRE_FALSE(h.stored(sid).answers.at(0).correct);
    const auto stored = h.responses.allResponsesForSession(sid);
    REQUIRE(stored.size() == 1);
    REQUIRE_FALSE(stored[0].isCorrect);
  }

  SECTION("A committed answer cannot be changed")
  {
    const AdvanceResult once = h.engine.submitAndAdvance(sid, first, true);
    REQUIRE_THROWS_AS(h.engine.submitAndAdvance(sid, first, false), ConflictingStateException);

    const TestSession session = h.stored(sid);
    REQUIRE(session.itemsAdministered == 1);
    REQUIRE(session.theta == Approx(once.theta));
    REQUIRE(session.answers.at(0).correct);
    REQUIRE(h.responses.allResponsesForSession(sid).at(0).isCorrect);
  }

  SECTION("Response rows lost after the commit are written by the retry")
  {
    h.responseWriter.failAppend = true;
    REQUIRE_THROWS_AS(h.engine.submitAndAdvance(sid, first, true), RepositoryFailureException);
    REQUIRE(h.stored(sid).itemsAdministered == 1);
    REQUIRE(h.responses.allResponsesForSession(sid).empty());

    h.responseWriter.failAppend = false;
    const AdvanceResult retry = h.engine.submitAndAdvance(sid, first, true);
    REQUIRE(retry.itemsAdministered == 1);
    const auto stored = h.responses.allResponsesForSession(sid);
    REQUIRE(stored.size() == 1);
    REQUIRE(stored[0].sequence == 1);
    REQUIRE(*stored[0].abilityEstimateAtTime == 0.0);
    REQUIRE(h.log.str().find("republished 1 response(s) on retry") != std::string::npos);
  }

  SECTION("Only the awaited item is accepted")
  {
    const ItemId other = first == 1 ? 2 : 1;
    REQUIRE_THROWS_AS(h.engine.submitAndAdvance(sid, other, true), ConflictingStateException);
    REQUIRE(h.stored(sid).itemsAdministered == 0);
  }

  SECTION("Unknown session")
  {
    REQUIRE_THROWS_AS(h.engine.submitAndAdvance(999, first, true), NotFoundException);
    REQUIRE_THROWS_AS(h.engine.state(999), NotFoundException);
    REQUIRE_THROWS_AS(h.engine.abandon(999), NotFoundException);
  }
}

TEST_CASE("Abandoning a session", "[AdaptiveEngine]")
{
  EngineHarness h(stopping(0.01, 2), steepPool(6));
  const auto start = h.engine.startAdaptive(5);
  const SessionId sid = start.session.id;

  SECTION("Abandon is one-way and repeatable")
  {
    h.engine.submitAndAdvance(sid, start.firstItem->id, true);

    const TestSession abandoned = h.engine.abandon(sid);
    REQUIRE(abandoned.status == SessionStatus::Abandoned);
    REQUIRE(abandoned.itemsAdministered == 1);
    REQUIRE_FALSE(abandoned.currentItemId.has_value());
    REQUIRE(h.engine.state(sid) == EngineState::Abandoned);

    REQUIRE(h.engine.abandon(sid).status == SessionStatus::Abandoned);

    const ItemId any = start.firstItem->id == 1 ? 2 : 1;
    REQUIRE_THROWS_AS(h.engine.submitAndAdvance(sid, any, true), ConflictingStateException);
    REQUIRE(h.log.str().find("abandoned after 1 items") != std::string::npos);
  }

  SECTION("A completed session cannot be abandoned")
  {
    AdvanceResult r = h.engine.submitAndAdvance(sid, start.firstItem->id, true);
    r = h.engine.submitAndAdvance(sid, r.nextItem->id, false);
    REQUIRE(r.testComplete);
    REQUIRE_THROWS_AS(h.engine.abandon(sid), ConflictingStateException);
    REQUIRE(h.stored(sid).status == SessionStatus::Completed);
  }
}

TEST_CASE("A failed completing write records no completion", "[AdaptiveEngine]")
{
  EngineHarness h(stopping(0.01, 1), steepPool(6));
  const auto start = h.engine.startAdaptive(11);
  const SessionId sid = start.session.id;
  const ItemId first = start.firstItem->id;

  h.sessions.failNextUpdates = 1;
  REQUIRE_THROWS_AS(h.engine.submitAndAdvance(sid, first, true), RepositoryFailureException);
  REQUIRE(h.stored(sid).status == SessionStatus::InProgress);
  REQUIRE(h.responses.completedSessionIds().empty());
  REQUIRE(h.responses.allResponsesForSession(sid).empty());

  SECTION("Abandoning afterwards leaves the session out of the completed set")
  {
    REQUIRE(h.engine.abandon(sid).status == SessionStatus::Abandoned);
    REQUIRE(h.responses.completedSessionIds().empty());
    REQUIRE(h.responses.allResponsesForSession(sid).empty());
    REQUIRE_THROWS_AS(h.engine.submitAndAdvance(sid, first, true), ConflictingStateException);
  }

  SECTION("The retry completes with the answer it carries")
  {
    const AdvanceResult retry = h.engine.submitAndAdvance(sid, first, false);
    REQUIRE(retry.testComplete);
    REQUIRE(retry.outcome->correctCount == 0);
    REQUIRE(h.responses.completedSessionIds() == std::vector<SessionId>{sid});
    REQUIRE_FALSE(h.responses.allResponsesForSession(sid).at(0).isCorrect);
  }
}

TEST_CASE("Session locks are released", "[AdaptiveEngine]")
{
  EngineHarness h(stopping(0.01, 2), steepPool(6));
  const auto start = h.engine.startAdaptive(4);
  const SessionId sid = start.session.id;

  const AdvanceResult r = h.engine.submitAndAdvance(sid, start.firstItem->id, true);
  REQUIRE(h.engine.activeSessionLocks() == 0);

  SECTION("After completion and a late retry")
  {
    h.engine.submitAndAdvance(sid, r.nextItem->id, true);
    REQUIRE(h.engine.activeSessionLocks() == 0);
    REQUIRE(h.engine.submitAndAdvance(sid, r.nextItem->id, true).testComplete);
    REQUIRE(h.engine.activeSessionLocks() == 0);
  }

  SECTION("After a rejected call")
  {
    REQUIRE_THROWS_AS(h.engine.submitAndAdvance(sid, 999, true), ConflictingStateException);
    REQUIRE_THROWS_AS(h.engine.submitAndAdvance(12345, 1, true), NotFoundException);
    h.sessions.failNextUpdates = 1;
    REQUIRE_THROWS_AS(h.engine.submitAndAdvance(sid, r.nextItem->id, true), RepositoryFailureException);
    REQUIRE(h.engine.activeSessionLocks() == 0);
  }

  SECTION("After an abandon")
  {
    h.engine.abandon(sid);
    h.engine.abandon(sid);
    REQUIRE(h.engine.activeSessionLocks() == 0);
  }
}

TEST_CASE("Concurrent calls on one session", "[AdaptiveEngine]")
{
  EngineHarness h(stopping(0.01, 5), steepPool(6));
  const auto start = h.engine.startAdaptive(21);
  const SessionId sid = start.session.id;
  const ItemId first = start.firstItem->id;

  std::promise<void> go;
  std::shared_future<void> started = go.get_future().share();

  SECTION("The same answer twice commits once")
  {
    auto submit = [&h, sid, first, started]() {
      started.wait();
      return h.engine.submitAndAdvance(sid, first, true);
    };
    auto a = std::async(std::launch::async, submit);
    auto b = std::async(std::launch::async, submit);
    go.set_value();

    const AdvanceResult ra = a.get();
    const AdvanceResult rb = b.get();
    REQUIRE(ra.itemsAdministered == 1);
    REQUIRE(rb.itemsAdministered == 1);
    REQUIRE(ra.theta == Approx(rb.theta));
    REQUIRE(h.stored(sid).itemsAdministered == 1);
    REQUIRE(h.responses.allResponsesForSession(sid).size() == 1);
  }

  SECTION("Different answers: one commits, the other conflicts")
  {
    auto submit = [&h, sid, first, started](bool correct) {
      started.wait();
      try
      {
        h.engine.submitAndAdvance(sid, first, correct);
        return 1;
      }
      catch (const ConflictingStateException&)
      {
        return 0;
      }
    };
    auto a = std::async(std::launch::async, submit, true);
    auto b = std::async(std::launch::async, submit, false);
    go.set_value();

    const int committedTrue = a.get();
    const int committedFalse = b.get();
    REQUIRE(committedTrue + committedFalse == 1);

    const TestSession session = h.stored(sid);
    REQUIRE(session.itemsAdministered == 1);
    REQUIRE(session.answers.at(0).correct == (committedTrue == 1));
    REQUIRE(h.responses.allResponsesForSession(sid).size() == 1);
  }

  SECTION("Abandon waits for the update in flight")
  {
    std::promise<void> writing;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    h.sessions.beforeNextUpdate = [&]() {
      writing.set_value();
      released.wait();
    };

    auto submit = std::async(std::launch::async, [&]() {
      return h.engine.submitAndAdvance(sid, first, true);
    });
    writing.get_future().wait();
    REQUIRE(h.engine.state(sid) == EngineState::Updating);

    auto abandon = std::async(std::launch::async, [&]() { return h.engine.abandon(sid); });
    REQUIRE(abandon.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);
    release.set_value();

    REQUIRE(submit.get().itemsAdministered == 1);
    const TestSession abandoned = abandon.get();
    REQUIRE(abandoned.status == SessionStatus::Abandoned);
    REQUIRE(abandoned.itemsAdministered == 1);
    REQUIRE(abandoned.answers.size() == 1);
    REQUIRE(h.stored(sid).status == SessionStatus::Abandoned);
    REQUIRE(h.responses.allResponsesForSession(sid).size() == 1);
    REQUIRE(h.engine.activeSessionLocks() == 0);
  }
}

TEST_CASE("Sessions advance in parallel", "[AdaptiveEngine]")
{
  EngineHarness h(stopping(0.01, 4), steepPool(6));

  // A warm reliability cache leaves the engine as the only writer to the log
  h.reliabilityEstimator.currentReliability();

  std::vector<std::future<SessionId>> runs;
  for (UserId user = 1; user <= 8; ++user)
  {
    runs.push_back(std::async(std::launch::async, [&h, user]() {
      const auto start = h.engine.startAdaptive(user);
      std::optional<Item> next = start.firstItem;
      while (next)
      {
        const AdvanceResult r = h.engine.submitAndAdvance(start.session.id, next->id, user % 2 == 0);
        next = r.nextItem;
      }
      return start.session.id;
    }));
  }

  std::set<SessionId> ids;
  for (auto& run : runs)
    ids.insert(run.get());

  REQUIRE(ids.size() == 8);
  REQUIRE(h.responses.completedSessionIds().size() == 8);
  for (SessionId id : ids)
  {
    REQUIRE(h.stored(id).itemsAdministered == 4);
    REQUIRE(h.responses.allResponsesForSession(id).size() == 4);
  }
  REQUIRE(h.engine.activeSessionLocks() == 0);
}

TEST_CASE("Content balancing during a session", "[AdaptiveEngine]")
{
  // A second spatial item sits right next to the first
  std::vector<Item> pool = steepPool(6);
  Item twin = makeItem(7, DifficultyTier::Medium, ItemType::Spatial, 0.40, 200);
  twin.irt = IrtParameters{2.5, 0.05, 0.0};
  pool.push_back(twin);

  EngineHarness h(stopping(0.01, 6), pool);
  const auto start = h.engine.startAdaptive(2);

  std::vector<ItemId> administered{start.firstItem->id};
  AdvanceResult r = h.engine.submitAndAdvance(start.session.id, start.firstItem->id, true);
  while (r.nextItem)
  {
    administered.push_back(r.nextItem->id);
    r = h.engine.submitAndAdvance(start.session.id, r.nextItem->id, administered.size() % 2 == 0);
  }

  REQUIRE(*r.stoppingReason == StoppingReason::MaxItems);
  REQUIRE(administered.size() == 6);

  std::set<ItemType> types;
  for (ItemId id : administered)
    types.insert(h.items.findItem(id)->type);
  REQUIRE(types.size() == kAllItemTypes.size());
  REQUIRE(std::find(administered.begin(), administered.end(), ItemId(7)) == administered.end());
  REQUIRE(h.log.str().find("Content balancing") != std::string::npos);
}
