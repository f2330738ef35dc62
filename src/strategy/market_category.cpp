#include "strategy/market_category.hpp"
#include <regex>
#include <vector>
#include <algorithm>

namespace pbot {

namespace {
    constexpr auto FLAGS = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

    const std::vector<std::regex>& finance_patterns() {
        static const std::vector<std::regex> patterns = {
            std::regex(R"(\bnvda\b|nvidia)", FLAGS),
            std::regex(R"(\baapl\b|apple.*stock)", FLAGS),
            std::regex(R"(\btsla\b|tesla.*stock)", FLAGS),
            std::regex(R"(\bmeta\b.*stock|meta platforms)", FLAGS),
            std::regex(R"(\bgoogl?\b|alphabet.*stock)", FLAGS),
            std::regex(R"(\bmsft\b|microsoft.*stock)", FLAGS),
            std::regex(R"(\bamzn\b|amazon.*stock)", FLAGS),
            std::regex(R"(s&p.?500|sp500|\^gspc)", FLAGS),
            std::regex(R"(nasdaq|qqq)", FLAGS),
            std::regex(R"(dow jones|djia)", FLAGS),
            std::regex(R"(\bgold\b.*(?:price|above|below|\$))", FLAGS),
            std::regex(R"(\bearning|revenue|eps\b)", FLAGS),
            std::regex(R"(\bstock\b.*(?:close|higher|lower|above|below))", FLAGS),
            std::regex(R"(\b(?:interest rate|fed\b|federal reserve|inflation|gdp|recession|tariff)\b)", FLAGS),
        };
        return patterns;
    }

    const std::vector<std::regex>& sports_patterns() {
        static const std::vector<std::regex> patterns = {
            std::regex(R"(\bnba\b)", FLAGS),
            std::regex(R"(\bnfl\b)", FLAGS),
            std::regex(R"(\bmlb\b)", FLAGS),
            std::regex(R"(\bnhl\b)", FLAGS),
            std::regex(R"(\bpremier league\b|\bepl\b)", FLAGS),
            std::regex(R"(\bchampions league\b|\bucl\b)", FLAGS),
            std::regex(R"(\bufc\b|\bmma\b)", FLAGS),
        };
        return patterns;
    }

    const std::vector<std::regex>& fast_resolution_patterns() {
        static const std::vector<std::regex> patterns = {
            std::regex(R"(\bNBA\b.*beat)", FLAGS),
            std::regex(R"(\bNHL\b.*beat)", FLAGS),
            std::regex(R"(\bNFL\b.*beat|win)", FLAGS),
            std::regex(R"(\bMLB\b.*beat)", FLAGS),
            std::regex(R"(\bUFC\b)", FLAGS),
            std::regex(R"(\bstock.*close|close.*stock|stock.*price.*(?:on|by)\b)", FLAGS),
            std::regex(R"(\bcoin\s?flip)", FLAGS),
            std::regex(R"(\bdaily\b)", FLAGS),
            std::regex(R"(\bby (?:end of |eod )?\w+ \d{1,2}(?:st|nd|rd|th)?\b)", FLAGS),  // "by Feb 28th"
            std::regex(R"(\bbefore (?:end of )?\w+ \d{1,2})", FLAGS),                   // "before March 1"
            std::regex(R"(\bearning|revenue|eps\b.*(?:Q[1-4]|quarter))", FLAGS),
            std::regex(R"(\bgold\b.*(?:above|below|end of))", FLAGS),
        };
        return patterns;
    }

    bool any_match(const std::vector<std::regex>& patterns, const std::string& text) {
        return std::any_of(patterns.begin(), patterns.end(),
                           [&](const std::regex& r) { return std::regex_search(text, r); });
    }
}

bool is_finance_market(const std::string& question) {
    return any_match(finance_patterns(), question);
}

bool is_sports_market(const std::string& question) {
    return any_match(sports_patterns(), question);
}

bool matches_fast_resolution_pattern(const std::string& question) {
    return any_match(fast_resolution_patterns(), question);
}

} // namespace pbot
