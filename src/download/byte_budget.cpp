#include "verifetch/download/byte_budget.hpp"

namespace verifetch {
namespace download {

BudgetVerdict ByteBudgetGuard::evaluate(std::optional<uint64_t> size,
                                        std::optional<uint64_t> min_size,
                                        std::optional<uint64_t> max_size) {
    if (!size) {
        return BudgetVerdict::WITHIN;
    }
    if (min_size && *size < *min_size) {
        return BudgetVerdict::BELOW_MINIMUM;
    }
    if (max_size && *size > *max_size) {
        return BudgetVerdict::ABOVE_MAXIMUM;
    }
    return BudgetVerdict::WITHIN;
}

}}
