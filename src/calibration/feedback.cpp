#include "calibration/feedback.hpp"
#include <fmt/format.h>
#include <cmath>
#include <vector>

namespace pbot {

namespace {
    std::string pct(double v) {
        return fmt::format("{:.1f}%", v * 100);
    }

    std::string join_lines(const std::vector<std::string>& lines) {
        std::string out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) out += '\n';
            out += lines[i];
        }
        return out;
    }
}

std::optional<std::string> format_feedback(const CalibrationReport& report) {
    if (report.total_resolved < FEEDBACK_MIN_RESOLUTIONS) {
        return std::nullopt;
    }

    std::vector<std::string> lines;

    lines.push_back(fmt::format("## Your Past Performance ({} resolved forecasts)", report.total_resolved));
    lines.push_back(fmt::format("- Win rate: {} | Brier: {:.2f} | ROI: {}{}",
                                pct(report.win_rate), report.avg_brier,
                                report.roi >= 0 ? "+" : "", pct(report.roi)));

    bool header_written = false;
    for (const auto& b : report.buckets) {
        if (b.count < FEEDBACK_MIN_BUCKET_COUNT) continue;
        if (std::abs(b.overconfidence) < FEEDBACK_CALIBRATION_TOLERANCE) continue;

        if (!header_written) {
            lines.push_back("");
            lines.push_back("### Calibration Issues");
            header_written = true;
        }
        bool over = b.overconfidence > 0;
        lines.push_back(fmt::format("- {} bucket: actual frequency {}. You are ~{:.0f}pts {}. {}.",
                                    b.range, pct(b.observed_frequency),
                                    std::abs(b.overconfidence * 100),
                                    over ? "OVERCONFIDENT" : "UNDERCONFIDENT",
                                    over ? "Adjust down" : "Adjust up"));
    }

    for (const auto& b : report.buckets) {
        if (b.count >= FEEDBACK_MIN_BUCKET_COUNT &&
            std::abs(b.overconfidence) < FEEDBACK_CALIBRATION_TOLERANCE) {
            lines.push_back(fmt::format("- {} bucket: Well calibrated.", b.range));
        }
    }

    const auto& conf = report.by_confidence;
    if (conf.low.count > 0 || conf.medium.count > 0 || conf.high.count > 0) {
        lines.push_back("");
        lines.push_back("### Confidence Labels");
        for (Confidence level : {Confidence::HIGH, Confidence::MEDIUM, Confidence::LOW}) {
            const auto& c = conf.get(level);
            if (c.count < FEEDBACK_MIN_BUCKET_COUNT) continue;

            const char* quality = c.win_rate >= 0.65 ? "Good signal — trust these."
                                : c.win_rate < 0.5   ? "Consider abstaining."
                                                     : "Moderate signal.";
            lines.push_back(fmt::format("- \"{}\" → {} win, {:.2f} Brier. {}",
                                        confidence_to_string(level), pct(c.win_rate),
                                        c.avg_brier, quality));
        }
    }

    if (report.total_resolved >= RECENT_WINDOW) {
        const auto& t = report.recent_trend;
        const char* trending = t.win_rate < report.win_rate - FEEDBACK_CALIBRATION_TOLERANCE
                                   ? "(declining). Be more selective."
                             : t.win_rate > report.win_rate + FEEDBACK_CALIBRATION_TOLERANCE
                                   ? "(improving). Keep it up."
                                   : "(stable).";
        lines.push_back("");
        lines.push_back(fmt::format("### Recent Trend (last {}): Win rate {} {}",
                                    RECENT_WINDOW, pct(t.win_rate), trending));
    }

    return join_lines(lines);
}

} // namespace pbot
