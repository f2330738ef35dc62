#include "calibration/calibration.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace pbot {

namespace {
    constexpr int BUCKET_WIDTH_PCT = 10;

    GroupStats group_stats(const std::vector<const ResolutionRecord*>& group) {
        GroupStats s;
        s.count = static_cast<int>(group.size());
        if (s.count == 0) return s;

        int wins = 0;
        double brier = 0.0;
        double wagered = 0.0;
        double pnl = 0.0;
        for (const auto* r : group) {
            if (r->won) ++wins;
            brier += r->brier_score;
            wagered += r->amount;
            pnl += r->pnl;
        }

        s.win_rate = static_cast<double>(wins) / s.count;
        s.avg_brier = brier / s.count;
        s.roi = wagered > 0 ? pnl / wagered : 0.0;
        return s;
    }

    std::string signed_pct(double v) {
        return fmt::format("{}{:.1f}%", v >= 0 ? "+" : "", v * 100);
    }
}

const GroupStats& ConfidenceBreakdown::get(Confidence c) const {
    switch (c) {
        case Confidence::LOW: return low;
        case Confidence::MEDIUM: return medium;
        case Confidence::HIGH: return high;
        case Confidence::UNKNOWN: break;
    }
    static const GroupStats empty;
    return empty;
}

double side_probability(const ResolutionRecord& r) {
    return r.direction == Direction::YES ? r.estimate : 1.0 - r.estimate;
}

CalibrationReport compute_calibration(const std::vector<ResolutionRecord>& resolutions) {
    std::vector<const ResolutionRecord*> valid;
    valid.reserve(resolutions.size());
    for (const auto& r : resolutions) {
        if (r.outcome != ResolutionOutcome::CANCEL) {
            valid.push_back(&r);
        }
    }

    CalibrationReport report;
    GroupStats all = group_stats(valid);
    report.total_resolved = all.count;
    report.win_rate = all.win_rate;
    report.avg_brier = all.avg_brier;
    report.roi = all.roi;
    for (const auto* r : valid) {
        report.total_pnl += r->pnl;
        report.total_wagered += r->amount;
    }

    // Half-open buckets [low, high) in percent of the side bet
    for (int low = 0; low < 100; low += BUCKET_WIDTH_PCT) {
        int high = low + BUCKET_WIDTH_PCT;

        int count = 0;
        int wins = 0;
        double sum_pred = 0.0;
        for (const auto* r : valid) {
            double p_pct = side_probability(*r) * 100.0;
            if (p_pct >= low && p_pct < high) {
                ++count;
                sum_pred += side_probability(*r);
                if (r->won) ++wins;
            }
        }
        if (count == 0) continue;

        CalibrationBucket b;
        b.range = fmt::format("{}-{}%", low, high);
        b.low_pct = low;
        b.high_pct = high;
        b.count = count;
        b.mean_prediction = sum_pred / count;
        b.observed_frequency = static_cast<double>(wins) / count;
        b.overconfidence = b.mean_prediction - b.observed_frequency;
        report.buckets.push_back(b);
    }

    std::vector<const ResolutionRecord*> low, medium, high;
    for (const auto* r : valid) {
        switch (r->confidence) {
            case Confidence::LOW: low.push_back(r); break;
            case Confidence::MEDIUM: medium.push_back(r); break;
            case Confidence::HIGH: high.push_back(r); break;
            case Confidence::UNKNOWN: break;
        }
    }
    report.by_confidence.low = group_stats(low);
    report.by_confidence.medium = group_stats(medium);
    report.by_confidence.high = group_stats(high);

    size_t start = valid.size() > static_cast<size_t>(RECENT_WINDOW) ? valid.size() - RECENT_WINDOW : 0;
    std::vector<const ResolutionRecord*> recent(valid.begin() + static_cast<std::ptrdiff_t>(start), valid.end());
    report.recent_trend = group_stats(recent);

    return report;
}

std::string format_report(const CalibrationReport& report) {
    std::string out;
    out += fmt::format("Resolved: {}\n", report.total_resolved);
    if (report.total_resolved == 0) {
        out += "No resolved bets yet.\n";
        return out;
    }

    out += fmt::format("Win rate: {:.1f}%\n", report.win_rate * 100);
    out += fmt::format("Total P&L: {:.2f} on {:.2f} wagered (ROI {})\n",
                       report.total_pnl, report.total_wagered, signed_pct(report.roi));
    out += fmt::format("Mean Brier: {:.4f}\n", report.avg_brier);

    out += "\nCalibration buckets (probability of side bet):\n";
    for (const auto& b : report.buckets) {
        out += fmt::format("  {:>8}  n={:<4} predicted={:.1f}%  observed={:.1f}%  gap={:+.1f}pts\n",
                           b.range, b.count, b.mean_prediction * 100,
                           b.observed_frequency * 100, b.overconfidence * 100);
    }

    out += "\nBy confidence:\n";
    for (Confidence c : {Confidence::HIGH, Confidence::MEDIUM, Confidence::LOW}) {
        const auto& s = report.by_confidence.get(c);
        out += fmt::format("  {:<7} n={:<4} win={:.1f}%  brier={:.4f}  roi={}\n",
                           confidence_to_string(c), s.count, s.win_rate * 100,
                           s.avg_brier, signed_pct(s.roi));
    }

    const auto& t = report.recent_trend;
    out += fmt::format("\nRecent (last {}): n={} win={:.1f}%  brier={:.4f}  roi={}\n",
                       RECENT_WINDOW, t.count, t.win_rate * 100, t.avg_brier, signed_pct(t.roi));
    return out;
}

} // namespace pbot
