#pragma once
// ===================================================================
// 출력용 가격 반올림
//
// 가격 크기에 따라 소수점 자릿수를 다르게 적용한다. 내부 계산은 항상
// 반올림 전 값을 사용하고, JSON 출력 직전에만 적용.
// ===================================================================

#include <cmath>

namespace liqhunter {
namespace common {

// | 가격 구간       | 소수점 |
// |-----------------|--------|
// | 10 이상         | 2      |
// | 1 ~ 10          | 4      |
// | 0.001 ~ 1       | 6      |
// | 0.001 미만      | 7      |

inline int priceDecimals(double price) {
    const double p = std::abs(price);
    if (p >= 10.0) return 2;
    if (p >= 1.0) return 4;
    if (p >= 0.001) return 6;
    return 7;
}

inline double roundPrice(double price) {
    if (!std::isfinite(price)) return price;
    const double scale = std::pow(10.0, priceDecimals(price));
    return std::round(price * scale) / scale;
}

} // namespace common
} // namespace liqhunter
