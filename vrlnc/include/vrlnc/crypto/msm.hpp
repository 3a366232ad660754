#pragma once

#include <cstdint>
#include <algorithm>
#include <array>
#include <vector>

#include "ristretto255.hpp"

namespace vrlnc {

// sum of scalars[i] * points[i] over the first n pairs, bucket method for n > 2
inline ExtPoint multi_scalar_mul(const Scalar* scalars, const ExtPoint* points, size_t n) {
    if (n == 0) return ext_identity();

    if (n <= 2) {
        ExtPoint acc = ext_identity();
        for (size_t i = 0; i < n; i++)
            acc = ext_add(acc, ext_scalarmul(points[i], scalars[i]));
        return acc;
    }

    std::vector<std::array<uint8_t, 32>> sbytes(n);
    for (size_t i = 0; i < n; i++)
        sc_tobytes(sbytes[i].data(), scalars[i]);

    size_t w = 1;
    for (size_t tmp = n; tmp >>= 1;) w++;
    if (w > 16) w = 16;

    const size_t num_buckets = (1ULL << w) - 1;
    const size_t num_windows = (256 + w - 1) / w;

    ExtPoint result = ext_identity();
    std::vector<ExtPoint> buckets(num_buckets);

    for (size_t win = num_windows; win > 0; win--) {
        for (size_t d = 0; d < w; d++)
            result = ext_double(result);

        std::fill(buckets.begin(), buckets.end(), ext_identity());
        size_t bit_start = (win - 1) * w;

        for (size_t i = 0; i < n; i++) {
            uint32_t idx = 0;
            for (size_t b = 0; b < w; b++) {
                size_t bit = bit_start + b;
                if (bit >= 256) break;
                if ((sbytes[i][bit >> 3] >> (bit & 7)) & 1)
                    idx |= (1U << b);
            }
            if (idx == 0) continue;
            buckets[idx - 1] = ext_add(buckets[idx - 1], points[i]);
        }

        ExtPoint running = ext_identity();
        ExtPoint window_sum = ext_identity();
        for (size_t k = num_buckets; k > 0; k--) {
            running = ext_add(running, buckets[k - 1]);
            window_sum = ext_add(window_sum, running);
        }
        result = ext_add(result, window_sum);
    }

    return result;
}

inline ExtPoint multi_scalar_mul(const std::vector<Scalar>& scalars, const std::vector<ExtPoint>& points) {
    size_t n = scalars.size() < points.size() ? scalars.size() : points.size();
    return multi_scalar_mul(scalars.data(), points.data(), n);
}

}
