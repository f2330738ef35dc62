#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"
#include "persistence/records.hpp"

namespace pbot {

// Win rate / Brier / ROI triple over a group of resolutions
struct GroupStats {
    int count{0};
    double win_rate{0.0};
    double avg_brier{0.0};
    double roi{0.0};
};

struct CalibrationBucket {
    std::string range;             // e.g. "60-70%"
    int low_pct{0};
    int high_pct{0};
    int count{0};
    double mean_prediction{0.0};
    double observed_frequency{0.0};
    double overconfidence{0.0};    // mean_prediction - observed_frequency
};

struct ConfidenceBreakdown {
    GroupStats low;
    GroupStats medium;
    GroupStats high;

    const GroupStats& get(Confidence c) const;
};

/**
 * Derived view over the resolution log. CANCEL resolutions are excluded
 * from every figure.
 */
struct CalibrationReport {
    int total_resolved{0};
    double win_rate{0.0};
    double total_pnl{0.0};
    double total_wagered{0.0};
    double roi{0.0};
    double avg_brier{0.0};
    std::vector<CalibrationBucket> buckets;  // Populated buckets only, ascending
    ConfidenceBreakdown by_confidence;
    GroupStats recent_trend;                 // Last RECENT_WINDOW resolutions
};

constexpr int RECENT_WINDOW = 20;

// Probability of the side actually bet: estimate for YES, 1 - estimate for NO
double side_probability(const ResolutionRecord& r);

CalibrationReport compute_calibration(const std::vector<ResolutionRecord>& resolutions);

// Multi-line human readable report for the stats command
std::string format_report(const CalibrationReport& report);

} // namespace pbot
