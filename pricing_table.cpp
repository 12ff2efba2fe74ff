#include "pricing_table.h"
#include <utility>

namespace gptcli {

PricingTable::PricingTable(std::map<std::string, PricingEntry> entries)
    : m_entries(std::move(entries)) {}

// Rates are USD per 1000 tokens, prompt first
PricingTable PricingTable::withDefaults() {
    return PricingTable({
        {"gpt-3.5-turbo",          {0.0015, 0.002}},
        {"gpt-3.5-turbo-0613",     {0.0015, 0.002}},
        {"gpt-3.5-turbo-16k",      {0.003, 0.004}},
        {"gpt-3.5-turbo-16k-0613", {0.003, 0.004}},
        {"gpt-4",                  {0.03, 0.06}},
        {"gpt-4-0613",             {0.03, 0.06}},
        {"gpt-4-32k",              {0.06, 0.12}},
        {"gpt-4-32k-0613",         {0.06, 0.12}},
    });
}

void PricingTable::set(const std::string& model_id, PricingEntry entry) {
    m_entries[model_id] = entry; // Overrides a default entry of the same name
}

const PricingEntry& PricingTable::lookup(const std::string& model_id) const {
    auto it = m_entries.find(model_id);
    if (it == m_entries.end()) {
        // Callers decide whether a missing price is worth reporting
        throw UnknownModelPricingError(model_id);
    }
    return it->second;
}

bool PricingTable::contains(const std::string& model_id) const {
    return m_entries.count(model_id) > 0;
}

} // namespace gptcli
