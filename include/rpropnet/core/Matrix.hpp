#ifndef RPROPNET_CORE_MATRIX_HPP
#define RPROPNET_CORE_MATRIX_HPP

#include <vector>
#include <algorithm>
#include <stdexcept>
#include <random>
#include <cstddef>

// Check for OpenMP support
#if defined(_OPENMP)
#include <omp.h>
#define RPROPNET_SIMD_LOOP _Pragma("omp simd")
#else
#define RPROPNET_SIMD_LOOP
#endif

namespace rpropnet {

/**
 * @brief Dense row-major 2D grid.
 *
 * Every per-weight quantity of a layer (weights, learning rates, signs,
 * gradient accumulators) is one of these, so shape checks reduce to
 * comparing (rows, cols).
 */
template <typename T>
class Matrix {
public:
    Matrix() = default;

    Matrix(size_t rows, size_t cols, T value = T(0))
        : rows_(rows), cols_(cols), data_(rows * cols, value) {}

    // Build from nested rows; every row must have the same length.
    static Matrix from_rows(const std::vector<std::vector<T>>& rows) {
        size_t cols = rows.empty() ? 0 : rows.front().size();
        Matrix result(rows.size(), cols);
        for (size_t i = 0; i < rows.size(); ++i) {
            if (rows[i].size() != cols) {
                throw std::invalid_argument("Matrix rows must all have the same length.");
            }
            std::copy(rows[i].begin(), rows[i].end(), result.row(i));
        }
        return result;
    }

    std::vector<std::vector<T>> to_rows() const {
        std::vector<std::vector<T>> result(rows_);
        for (size_t i = 0; i < rows_; ++i) {
            result[i].assign(row(i), row(i) + cols_);
        }
        return result;
    }

    // Accessors
    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    size_t size() const { return data_.size(); }
    T* data() { return data_.data(); }
    const T* data() const { return data_.data(); }

    T* row(size_t r) { return data_.data() + r * cols_; }
    const T* row(size_t r) const { return data_.data() + r * cols_; }

    T& operator()(size_t r, size_t c) { return data_[r * cols_ + c]; }
    const T& operator()(size_t r, size_t c) const { return data_[r * cols_ + c]; }

    template <typename U>
    bool same_shape(const Matrix<U>& other) const {
        return rows_ == other.rows() && cols_ == other.cols();
    }

    void fill(T value) {
        std::fill(data_.begin(), data_.end(), value);
    }

    template <typename Gen>
    void random_uniform(T low, T high, Gen& gen) {
        std::uniform_real_distribution<T> d(low, high);
        for (auto& v : data_) v = d(gen);
    }

    // Element-wise accumulation, shapes must match exactly.
    Matrix& operator+=(const Matrix& other) {
        if (!same_shape(other)) {
            throw std::invalid_argument("Shapes must match for accumulation.");
        }
        size_t n = data_.size();
        T* dst = data_.data();
        const T* src = other.data_.data();
        RPROPNET_SIMD_LOOP
        for (size_t i = 0; i < n; ++i) {
            dst[i] += src[i];
        }
        return *this;
    }

    bool operator==(const Matrix& other) const {
        return rows_ == other.rows_ && cols_ == other.cols_ && data_ == other.data_;
    }

    bool operator!=(const Matrix& other) const { return !(*this == other); }

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<T> data_;
};

} // namespace rpropnet

#endif // RPROPNET_CORE_MATRIX_HPP
