#pragma once

namespace hq {

// Histogram values are nanoseconds; display unit is milliseconds.
inline constexpr double kValueScale = 1.0e6;

// The only place where values are scaled between raw and display units.
// In raw mode both directions are the identity.
class UnitConverter {
public:
    explicit UnitConverter(bool raw = false) : raw_(raw) {}

    bool raw() const { return raw_; }
    double scale() const { return raw_ ? 1.0 : kValueScale; }

    double to_display(double raw_value) const { return raw_value / scale(); }
    double to_raw(double display_value) const { return display_value * scale(); }

    const char* unit_name() const { return raw_ ? "RU" : "ms"; }

private:
    bool raw_;
};

} // namespace hq
