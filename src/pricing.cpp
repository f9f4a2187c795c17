#include "pricing.hpp"
#include "errors.hpp"
#include <algorithm>

namespace talk {

std::vector<ModelSpec> PricingTable::builtin_models() {
    return {
        {"sonnet-4.5", "claude-sonnet-4-5-20250929", "Claude Sonnet 4.5", {3.0, 15.0}},
        {"opus-4", "claude-opus-4-20250514", "Claude Opus 4", {15.0, 75.0}},
        {"sonnet-4", "claude-sonnet-4-20250514", "Claude Sonnet 4", {3.0, 15.0}},
    };
}

PricingTable::PricingTable() : models_(builtin_models()) {}

PricingTable::PricingTable(std::vector<ModelSpec> models) : models_(std::move(models)) {}

const ModelSpec* PricingTable::lookup(const std::string& model) const {
    auto it = std::find_if(models_.begin(), models_.end(), [&model](const ModelSpec& m) {
        return m.key == model || m.provider_id == model || m.display_name == model;
    });
    return it != models_.end() ? &(*it) : nullptr;
}

ModelRate PricingTable::rate_for(const std::string& model) const {
    return find(model).rate;
}

const ModelSpec& PricingTable::find(const std::string& model) const {
    const ModelSpec* spec = lookup(model);
    if (!spec) {
        throw UnknownModelError(model);
    }
    return *spec;
}

bool PricingTable::contains(const std::string& model) const {
    return lookup(model) != nullptr;
}

void PricingTable::upsert(const ModelSpec& spec) {
    auto it = std::find_if(models_.begin(), models_.end(),
        [&spec](const ModelSpec& m) { return m.key == spec.key; });

    if (it != models_.end()) {
        *it = spec;
    } else {
        models_.push_back(spec);
    }
}

const ModelSpec& PricingTable::default_model() const {
    if (models_.empty()) {
        throw std::logic_error("Pricing table is empty");
    }
    return models_.front();
}

} // namespace talk
