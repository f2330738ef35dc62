#pragma once

#include <string>

namespace pbot {

// Question mentions a stock, index, commodity, earnings or macro figure
bool is_finance_market(const std::string& question);

// Question is about a league or fight card we have structured data for
bool is_sports_market(const std::string& question);

// Question matches a pattern that usually resolves within hours or days
// (sports match-ups, daily closes, explicit near-term deadlines, earnings)
bool matches_fast_resolution_pattern(const std::string& question);

} // namespace pbot
