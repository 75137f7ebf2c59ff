#pragma once
// ============================================================================
// PULSE TRADE BOT - Exchange Client Interface
// ============================================================================
// The order-side surface the execution adapter depends on. Implementations
// throw OrderExecutionError when the exchange rejects a call and
// TransportError when it cannot be reached.
// ============================================================================

#include "pulse/core/types.hpp"

#include <optional>
#include <string>

namespace pulse::exchange {

/// Signed contract position (> 0 long, < 0 short, 0 flat)
struct Position {
    Symbol symbol;
    double quantity = 0.0;
    double leverage = 0.0;

    [[nodiscard]] bool is_long() const noexcept { return quantity > 0.0; }
    [[nodiscard]] bool is_short() const noexcept { return quantity < 0.0; }
    [[nodiscard]] bool is_flat() const noexcept { return quantity == 0.0; }
};

struct OrderRequest {
    Symbol symbol;
    Side side = Side::Buy;
    double size = 0.0;
    int leverage = 1;
    std::string client_order_id;
};

struct OrderResult {
    std::string order_id;
    std::string client_order_id;
    Symbol symbol;
    Side side = Side::Buy;
    double size = 0.0;
    bool close_order = false;
    Timestamp submitted_at;
};

class IExchangeClient {
public:
    virtual ~IExchangeClient() = default;

    /// Current position, std::nullopt if the exchange reports none
    [[nodiscard]] virtual std::optional<Position> get_position(const Symbol& symbol) = 0;

    virtual void set_leverage(const Symbol& symbol, int leverage) = 0;

    /// Market order that flattens the position. Throws OrderExecutionError
    /// with no_position() == true when there is nothing to close.
    virtual OrderResult close_position(const Symbol& symbol, const std::string& client_order_id) = 0;

    /// Market order opening (or adding to) a position
    virtual OrderResult place_order(const OrderRequest& request) = 0;
};

}  // namespace pulse::exchange
