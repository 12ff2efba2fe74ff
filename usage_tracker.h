#pragma once

#include <cstdint>
#include <string>

namespace gptcli {

class PricingTable;

struct UsageCounters {
    std::uint64_t prompt_tokens = 0;
    std::uint64_t completion_tokens = 0;
};

/*
 * Accumulates token usage for the session and prices it.
 * Cost is computed against the rates of the model passed in, for all
 * accumulated tokens, even if earlier exchanges used a different model.
 */
class UsageTracker {
public:
    UsageTracker() = default;

    /// Adds the usage reported for one successful exchange.
    void record(const UsageCounters& delta);

    const UsageCounters& totals() const { return m_totals; }
    std::uint64_t totalTokens() const { return m_totals.prompt_tokens + m_totals.completion_tokens; }

    /// Cost in USD rounded to 6 decimals. Throws UnknownModelPricingError.
    double cost(const std::string& model_id, const PricingTable& pricing) const;

    /// cost() formatted with exactly 6 decimals, e.g. "0.002500".
    std::string formattedCost(const std::string& model_id, const PricingTable& pricing) const;

private:
    UsageCounters m_totals;
};

double calculateExpense(std::uint64_t prompt_tokens, std::uint64_t completion_tokens,
                        double prompt_rate, double completion_rate);

} // namespace gptcli
