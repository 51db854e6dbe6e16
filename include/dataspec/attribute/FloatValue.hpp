#pragma once
#include <string_view>

namespace DS {

inline constexpr std::string_view kPositiveInfinityMarker = "++inf++";
inline constexpr std::string_view kNegativeInfinityMarker = "--inf--";

struct FloatValue {
    enum class Kind {
        Finite,
        PositiveInfinity,
        NegativeInfinity
    };

    static constexpr auto finite(double v) -> FloatValue {
        return FloatValue{Kind::Finite, v};
    }

    static constexpr auto positiveInfinity() -> FloatValue {
        return FloatValue{Kind::PositiveInfinity, 0.0};
    }

    static constexpr auto negativeInfinity() -> FloatValue {
        return FloatValue{Kind::NegativeInfinity, 0.0};
    }

    [[nodiscard]] constexpr auto isFinite() const -> bool {
        return kind == Kind::Finite;
    }

    auto operator==(FloatValue const& other) const -> bool {
        if (kind != other.kind)
            return false;
        return kind != Kind::Finite || value == other.value;
    }

    Kind   kind  = Kind::Finite;
    double value = 0.0;
};

} // namespace DS
