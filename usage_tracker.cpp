#include "usage_tracker.h"
#include "pricing_table.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace gptcli {

double calculateExpense(std::uint64_t prompt_tokens, std::uint64_t completion_tokens,
                        double prompt_rate, double completion_rate) {
    double expense = (static_cast<double>(prompt_tokens) / 1000.0) * prompt_rate +
                     (static_cast<double>(completion_tokens) / 1000.0) * completion_rate;
    return std::round(expense * 1e6) / 1e6;
}

void UsageTracker::record(const UsageCounters& delta) {
    m_totals.prompt_tokens += delta.prompt_tokens;
    m_totals.completion_tokens += delta.completion_tokens;
}

double UsageTracker::cost(const std::string& model_id, const PricingTable& pricing) const {
    const PricingEntry& rates = pricing.lookup(model_id);
    return calculateExpense(m_totals.prompt_tokens, m_totals.completion_tokens,
                            rates.prompt_rate, rates.completion_rate);
}

std::string UsageTracker::formattedCost(const std::string& model_id, const PricingTable& pricing) const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << cost(model_id, pricing);
    return oss.str();
}

} // namespace gptcli
