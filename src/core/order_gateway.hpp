#pragma once

#include <string>
#include "types.hpp"

namespace xarb {

struct OrderRequest {
    std::string client_order_id;
    Market market;
    std::string symbol;
    OrderSide side;
    double amount;
    double limit_price;
};

struct OrderFill {
    double filled_amount = 0.0;
    double filled_price = 0.0;
};

// Order placement capability. submit_order blocks until the venue reports the
// fill outcome; a rejection is an ExchangeException. A zero filled_amount means
// nothing executed.
class OrderGateway {
public:
    virtual ~OrderGateway() = default;

    virtual OrderFill submit_order(const OrderRequest& request) = 0;
};

} // namespace xarb
