#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "../core/types.hpp"
#include "../crypto/commitment.hpp"
#include "../crypto/scalar.hpp"

namespace vrlnc {

struct EchelonRow {
    size_t pivot;
    std::vector<Scalar> coeffs;
    Chunk payload;
};

namespace detail {

// x -= f * y
inline void sc_axpy_sub(std::vector<Scalar>& x, const Scalar& f, const std::vector<Scalar>& y) {
    Scalar nf = sc_neg(f);
    for (size_t i = 0; i < x.size(); i++)
        x[i] = sc_muladd(x[i], nf, y[i]);
}

inline void sc_scale(std::vector<Scalar>& x, const Scalar& f) {
    for (auto& v : x) v = sc_mul(v, f);
}

}

// Reduced row echelon form over Z/l. Every stored row has a 1 in its pivot
// column and every other row has 0 there.
class Echelon {
    size_t cols_ = 0;
    std::vector<EchelonRow> rows_;
    std::vector<int> row_of_col_;

public:
    void init(size_t cols) {
        cols_ = cols;
        rows_.clear();
        row_of_col_.assign(cols, -1);
    }

    size_t cols() const { return cols_; }
    size_t rank() const { return rows_.size(); }
    bool is_full() const { return cols_ > 0 && rows_.size() == cols_; }
    const std::vector<EchelonRow>& rows() const { return rows_; }

    // a row that reduces to zero leaves the system unchanged
    Status insert(std::vector<Scalar> coeffs, Chunk payload) {
        if (coeffs.size() != cols_) return Status::SizeMismatch;

        for (const auto& row : rows_) {
            Scalar f = coeffs[row.pivot];
            if (sc_is_zero(f)) continue;
            detail::sc_axpy_sub(coeffs, f, row.coeffs);
            detail::sc_axpy_sub(payload, f, row.payload);
        }

        size_t pivot = cols_;
        for (size_t k = 0; k < cols_; k++) {
            if (!sc_is_zero(coeffs[k])) {
                pivot = k;
                break;
            }
        }
        if (pivot == cols_) return Status::LinearlyDependentChunk;

        Scalar inv = sc_inv(coeffs[pivot]);
        detail::sc_scale(coeffs, inv);
        detail::sc_scale(payload, inv);

        for (auto& row : rows_) {
            Scalar f = row.coeffs[pivot];
            if (sc_is_zero(f)) continue;
            detail::sc_axpy_sub(row.coeffs, f, coeffs);
            detail::sc_axpy_sub(row.payload, f, payload);
        }

        row_of_col_[pivot] = (int)rows_.size();
        rows_.push_back(EchelonRow{pivot, std::move(coeffs), std::move(payload)});
        return Status::Ok;
    }

    // payload of the row pivoting on col, nullptr when that column has no pivot yet
    const Chunk* payload_for(size_t col) const {
        if (col >= cols_ || row_of_col_[col] < 0) return nullptr;
        return &rows_[(size_t)row_of_col_[col]].payload;
    }
};

}
