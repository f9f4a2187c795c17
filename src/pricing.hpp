#pragma once

/**
 * Per-model pricing data.
 *
 * Rates are USD per million tokens, matching the way the provider publishes
 * them. Lookup accepts the short key ("sonnet-4.5"), the provider model id
 * ("claude-sonnet-4-5-20250929") or the display name ("Claude Sonnet 4.5").
 */

#include <string>
#include <vector>

namespace talk {

/**
 * Input/output rates for one model.
 */
struct ModelRate {
    double input_per_mtok = 0.0;
    double output_per_mtok = 0.0;
};

/**
 * A selectable model and its pricing.
 */
struct ModelSpec {
    std::string key;            // Short key stored in sessions.
    std::string provider_id;    // Model id sent to the API.
    std::string display_name;   // Human-readable name.
    ModelRate rate;
};

/**
 * Static table of known models.
 */
class PricingTable {
public:
    // Creates a table with the built-in models.
    PricingTable();

    // Creates a table with exactly the given models.
    explicit PricingTable(std::vector<ModelSpec> models);

    // Returns the rates for a model. Throws UnknownModelError.
    ModelRate rate_for(const std::string& model) const;

    // Returns the full entry for a model. Throws UnknownModelError.
    const ModelSpec& find(const std::string& model) const;

    // Returns true if the model resolves to an entry.
    bool contains(const std::string& model) const;

    // Adds an entry, replacing any entry with the same key.
    void upsert(const ModelSpec& spec);

    // All entries in table order.
    const std::vector<ModelSpec>& models() const { return models_; }

    // First entry of the table. Throws std::logic_error when empty.
    const ModelSpec& default_model() const;

    // Built-in models.
    static std::vector<ModelSpec> builtin_models();

private:
    std::vector<ModelSpec> models_;

    const ModelSpec* lookup(const std::string& model) const;
};

} // namespace talk
