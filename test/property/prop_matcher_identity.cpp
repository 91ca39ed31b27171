/**
 * @file  prop_matcher_identity.cpp
 * @brief Property: ∀ observations o: find_best(o, [.., o, ..]) accepts o
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_matcher_identity
 *
 * Scoring basis:
 *   An identical copy earns the top time bucket (50, or 40 when the start
 *   time is imprecise), the top duration bucket (30) and the category bonus
 *   (25), plus 15 when a distance is present. The minimum is 95 ≥ 50, so
 *   an observation always matches itself, and with a normalisation score of
 *   105 its confidence is at least 0.9.
 *
 *   The matcher is also side-effect free and deterministic, and among equal
 *   scores the earliest pool entry wins.
 */

#include <rapidcheck.h>

#include <vector>

#include "loadcal/matcher.hpp"

using namespace loadcal;
using namespace loadcal::matcher;
using namespace std::chrono;

namespace {

WorkoutObservation random_observation() {
    WorkoutObservation o;
    o.source_id  = "gen";
    o.start_time = Timestamp{seconds{*rc::gen::inRange<std::int64_t>(1'600'000'000, 1'800'000'000)}};
    o.duration_s = static_cast<double>(*rc::gen::inRange(60, 6 * 3600));
    if (*rc::gen::arbitrary<bool>()) {
        o.distance_m = static_cast<double>(*rc::gen::inRange(100, 200'000));
    }
    o.category = *rc::gen::element(ActivityCategory::Run, ActivityCategory::Bike,
                                   ActivityCategory::Swim, ActivityCategory::Strength,
                                   ActivityCategory::Other);
    return o;
}

} // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: self-match is always accepted with high confidence ───────
    ok &= rc::check(
        "matcher_identity: an observation matches an identical copy of itself",
        []() {
            const auto obs = random_observation();
            const auto offset = minutes{*rc::gen::inRange(-12 * 60, 14 * 60 + 1)};
            const WorkoutMatcher m{MatcherConfig{.utc_offset = offset}};
            const Timestamp now = obs.start_time + hours{*rc::gen::inRange(-48, 49)};

            const auto r = m.score(obs, obs, now);
            RC_ASSERT(r.has_value());
            RC_ASSERT(r->score >= 95.0);
            RC_ASSERT(r->confidence >= 0.9);

            const std::vector<WorkoutObservation> pool{obs};
            const auto best = m.find_best(obs, pool, now);
            RC_ASSERT(best.has_value());
            RC_ASSERT(best->candidate_index == 0u);
        });

    // ── Property 2: duplicates resolve to the first occurrence ───────────────
    ok &= rc::check(
        "matcher_identity: among identical candidates the first wins",
        []() {
            const auto obs = random_observation();
            const auto filler = *rc::gen::inRange<std::size_t>(0, 5);
            std::vector<WorkoutObservation> pool;
            for (std::size_t i = 0; i < filler; ++i) {
                auto other = obs;
                other.start_time += hours{24 * 5};
                pool.push_back(other);
            }
            pool.push_back(obs);
            pool.push_back(obs);

            const WorkoutMatcher m;
            const auto best = m.find_best(obs, pool, obs.start_time + hours{24 * 30});
            RC_ASSERT(best.has_value());
            RC_ASSERT(best->candidate_index == filler);
        });

    // ── Property 3: find_all is sorted and consistent with find_best ─────────
    ok &= rc::check(
        "matcher_identity: find_all is score-descending and led by find_best",
        []() {
            const auto obs = random_observation();
            std::vector<WorkoutObservation> pool;
            const auto n = *rc::gen::inRange(1, 8);
            for (int i = 0; i < n; ++i) {
                auto c = obs;
                c.start_time += seconds{*rc::gen::inRange(-7200, 7201)};
                c.duration_s *= static_cast<double>(*rc::gen::inRange(80, 121)) / 100.0;
                pool.push_back(c);
            }
            const WorkoutMatcher m;
            const Timestamp now = obs.start_time + hours{24 * 30};
            const auto all  = m.find_all(obs, pool, now);
            const auto best = m.find_best(obs, pool, now);

            for (std::size_t i = 1; i < all.size(); ++i) {
                RC_ASSERT(all[i - 1].score >= all[i].score);
            }
            RC_ASSERT(all.empty() == !best.has_value());
            if (best) {
                RC_ASSERT(all.front().candidate_index == best->candidate_index);
                RC_ASSERT(all.front().score == best->score);
            }
        });

    return ok ? 0 : 1;
}
