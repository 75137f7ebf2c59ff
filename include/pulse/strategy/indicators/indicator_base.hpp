#pragma once
// ============================================================================
// PULSE TRADE BOT - Indicator Base Class
// ============================================================================
// CRTP pattern for zero-overhead polymorphism
// All indicators share common interface without virtual call overhead
// ============================================================================

#include <concepts>
#include <cstddef>
#include <span>

namespace pulse::strategy {

// ============================================================================
// Indicator Concept
// ============================================================================

template <typename T>
concept Indicator = requires(T indicator, double value) {
    { indicator.update(value) } -> std::same_as<void>;
    { indicator.value() } -> std::convertible_to<double>;
    { indicator.is_ready() } -> std::convertible_to<bool>;
    { indicator.reset() } -> std::same_as<void>;
};

// ============================================================================
// CRTP Base Class
// ============================================================================

template <typename Derived>
class IndicatorBase {
public:
    /// Update indicator with new price data
    void update(double value) {
        static_cast<Derived*>(this)->update_impl(value);
    }

    /// Feed a whole series, oldest first
    void update(std::span<const double> values) {
        for (const double v : values) {
            static_cast<Derived*>(this)->update_impl(v);
        }
    }

    /// Get current indicator value
    [[nodiscard]] double value() const {
        return static_cast<const Derived*>(this)->value_impl();
    }

    /// Check if indicator has enough data
    [[nodiscard]] bool is_ready() const {
        return static_cast<const Derived*>(this)->is_ready_impl();
    }

    /// Reset indicator state
    void reset() {
        static_cast<Derived*>(this)->reset_impl();
    }

    /// Minimum number of samples before is_ready()
    [[nodiscard]] size_t period() const {
        return static_cast<const Derived*>(this)->period_impl();
    }

protected:
    IndicatorBase() = default;
    ~IndicatorBase() = default;
};

}  // namespace pulse::strategy
