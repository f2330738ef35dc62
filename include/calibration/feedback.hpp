#pragma once

#include <optional>
#include <string>
#include "calibration/calibration.hpp"

namespace pbot {

constexpr int FEEDBACK_MIN_RESOLUTIONS = 10;
constexpr int FEEDBACK_MIN_BUCKET_COUNT = 3;
constexpr double FEEDBACK_CALIBRATION_TOLERANCE = 0.05;

/**
 * Render the calibration report as text appended to the estimator's
 * system prompt. Returns nullopt below FEEDBACK_MIN_RESOLUTIONS.
 */
std::optional<std::string> format_feedback(const CalibrationReport& report);

} // namespace pbot
