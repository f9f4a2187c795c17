#pragma once

/**
 * Spend tracking for conversation turns.
 *
 * Costs are kept as unrounded doubles; format_cost is the only place that
 * rounds, so repeated turns never accumulate rounding error.
 */

#include "pricing.hpp"
#include "types.hpp"
#include <string>

namespace talk {

class CostAccountant {
public:
    explicit CostAccountant(const PricingTable& pricing) : pricing_(pricing) {}

    // Cost of one exchange. Throws UnknownModelError.
    double compute(const std::string& model, const TokenUsage& usage) const;

    // Adds an increment to session.total_cost and returns the new total.
    // Throws std::invalid_argument for negative increments.
    double accumulate(Session& session, double incremental_cost) const;

private:
    const PricingTable& pricing_;
};

// Formats a USD amount for display, e.g. "$0.0072".
std::string format_cost(double usd, int decimals = 4);

} // namespace talk
