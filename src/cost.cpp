#include "cost.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace talk {

double CostAccountant::compute(const std::string& model, const TokenUsage& usage) const {
    ModelRate rate = pricing_.rate_for(model);
    return static_cast<double>(usage.input_tokens) * rate.input_per_mtok / 1e6 +
           static_cast<double>(usage.output_tokens) * rate.output_per_mtok / 1e6;
}

double CostAccountant::accumulate(Session& session, double incremental_cost) const {
    if (incremental_cost < 0.0) {
        throw std::invalid_argument("Cost increment must not be negative");
    }
    session.total_cost += incremental_cost;
    return session.total_cost;
}

std::string format_cost(double usd, int decimals) {
    std::ostringstream oss;
    oss << '$' << std::fixed << std::setprecision(decimals) << usd;
    return oss.str();
}

} // namespace talk
