#pragma once

#include "types.hpp"

namespace xarb {

// Pull source of point-in-time quotes. Implementations may block and may throw
// ExchangeException; callers bound each call with a timeout.
class PriceFeed {
public:
    virtual ~PriceFeed() = default;

    virtual Quote get_quote(Market market) = 0;
};

} // namespace xarb
