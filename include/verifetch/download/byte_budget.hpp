#pragma once

#include <optional>
#include <cstdint>

namespace verifetch {
namespace download {

enum class BudgetVerdict {
    WITHIN,
    BELOW_MINIMUM,
    ABOVE_MAXIMUM
};

class ByteBudgetGuard {
public:
    // An unknown size always passes; bounds are inclusive.
    static BudgetVerdict evaluate(std::optional<uint64_t> size,
                                  std::optional<uint64_t> min_size,
                                  std::optional<uint64_t> max_size);

    static bool check(std::optional<uint64_t> size,
                      std::optional<uint64_t> min_size,
                      std::optional<uint64_t> max_size) {
        return evaluate(size, min_size, max_size) == BudgetVerdict::WITHIN;
    }
};

}}
