#pragma once

#include <cstddef>

/// @file include/loadcal/constants.hpp
/// @brief Physiological model constants and engine defaults for loadcal.

namespace loadcal::constants {

// ─── Load Model ───────────────────────────────────────────────────────────────

/// Chronic training load (fitness) time constant, days.
static constexpr double CTL_TIME_CONSTANT = 42.0;

/// Acute training load (fatigue) time constant, days.
static constexpr double ATL_TIME_CONSTANT = 7.0;

/// Default horizon for the days-to-target-form simulation.
static constexpr int DEFAULT_TAPER_HORIZON_DAYS = 30;

/// Days of history used by the training monotony and strain statistics.
static constexpr std::size_t MONOTONY_WINDOW_DAYS = 7;

// ─── Stress Score ─────────────────────────────────────────────────────────────

static constexpr double SECONDS_PER_HOUR = 3600.0;

/// TSS accrued by one hour at intensity factor 1.0.
static constexpr double STRESS_PER_THRESHOLD_HOUR = 100.0;

/// Estimated-intensity mapping IF = base + perceived × slope.
static constexpr double ESTIMATE_BASE_IF  = 0.5;
static constexpr double ESTIMATE_IF_SLOPE = 0.6;

// ─── Intensity Smoothing ──────────────────────────────────────────────────────

/// Rolling window for Normalized Power, seconds.
static constexpr std::size_t NP_ROLLING_WINDOW_SECONDS = 30;

/// Metabolic cost of running on the flat, J/(kg·m) (Minetti 2002).
static constexpr double FLAT_RUNNING_COST = 3.6;

/// Bounds on the grade adjustment factor.
static constexpr double GRADE_FACTOR_MIN = 0.7;
static constexpr double GRADE_FACTOR_MAX = 2.0;

// ─── Matcher ──────────────────────────────────────────────────────────────────

static constexpr double MATCH_MIN_SCORE = 50.0;

/// Score of a perfect match without distance (50 + 30 + 25).
static constexpr double MATCH_NORMALISATION_SCORE = 105.0;

static constexpr double MATCH_HIGH_CONFIDENCE = 0.7;

/// Observations started this close to "now" are treated as imprecise.
static constexpr double IMPRECISE_TIME_WINDOW_SECONDS = 300.0;

static constexpr int MATCH_SEARCH_WINDOW_DAYS = 2;

/// Candidate listing for manual review: wider window, and normalised against
/// the maximum score with distance (50 + 30 + 25 + 15).
static constexpr int    MATCH_LISTING_SEARCH_WINDOW_DAYS  = 3;
static constexpr double MATCH_LISTING_NORMALISATION_SCORE = 120.0;

// ─── Calibration ──────────────────────────────────────────────────────────────

/// Half-life of a calibration point's time weight, days.
static constexpr double TIME_WEIGHT_HALF_LIFE_DAYS = 30.0;

/// Points below this source confidence never contribute to learning.
static constexpr double MIN_LEARNING_CONFIDENCE = 0.5;

/// Confidence penalty applied to single-metric derived points.
static constexpr double DERIVED_CONFIDENCE_PENALTY = 0.9;

/// Minimum agreement between CTL- and ATL-derived estimates.
static constexpr double CROSS_VALIDATION_MIN_AGREEMENT = 0.8;

/// Sample count at which the sample-size confidence term saturates.
static constexpr double CONFIDENCE_SAMPLE_SATURATION = 10.0;

/// Ratio standard deviation at which the consistency term reaches zero.
static constexpr double CONFIDENCE_STDDEV_SCALE = 0.3;

static constexpr double CONFIDENCE_WEIGHT_SAMPLES     = 0.4;
static constexpr double CONFIDENCE_WEIGHT_CONSISTENCY = 0.4;
static constexpr double CONFIDENCE_WEIGHT_RECENCY     = 0.2;

static constexpr std::size_t DEFAULT_MIN_SCALING_SAMPLES = 3;
static constexpr double DEFAULT_MIN_SCALING_CONFIDENCE   = 0.5;
static constexpr double DEFAULT_MIN_SCALING_FACTOR       = 0.8;
static constexpr double DEFAULT_MAX_SCALING_FACTOR       = 1.5;

/// Confidence at which calibration is considered complete.
static constexpr double CALIBRATION_COMPLETE_CONFIDENCE = 0.95;

/// Window for "recent" calibration statistics, days.
static constexpr int RECENT_CALIBRATION_DAYS = 30;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

static constexpr double FLOAT_EPSILON = 1e-12;

} // namespace loadcal::constants
