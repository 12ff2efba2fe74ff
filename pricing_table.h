#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace gptcli {

/// Cost in USD per 1000 tokens.
struct PricingEntry {
    double prompt_rate = 0.0;
    double completion_rate = 0.0;
};

class UnknownModelPricingError : public std::runtime_error {
public:
    explicit UnknownModelPricingError(const std::string& model_id)
        : std::runtime_error("No pricing information for model '" + model_id + "'"),
          m_model_id(model_id) {}

    const std::string& modelId() const { return m_model_id; }

private:
    std::string m_model_id;
};

/*
 * Maps a model identifier to its per-1000-token rates.
 * Lookups of unknown models throw; there is no default rate.
 */
class PricingTable {
public:
    PricingTable() = default;
    explicit PricingTable(std::map<std::string, PricingEntry> entries);

    /// Table preloaded with the published chat-completion rates.
    static PricingTable withDefaults();

    /// Adds an entry, replacing any existing one for the same model.
    void set(const std::string& model_id, PricingEntry entry);

    /// Throws UnknownModelPricingError if the model is not in the table.
    const PricingEntry& lookup(const std::string& model_id) const;

    bool contains(const std::string& model_id) const;
    size_t size() const { return m_entries.size(); }

private:
    std::map<std::string, PricingEntry> m_entries;
};

} // namespace gptcli
