/**
 * @file ring_buffer.hpp
 * @brief Fixed-capacity FIFO of doubles with window statistics
 *
 * Backing storage is allocated once in init(); push() never allocates.
 * When full, push() overwrites the oldest element.
 */

#pragma once

#include "esp_err.h"
#include <cstddef>

namespace pdi {

class RingBuffer {
public:
    RingBuffer();
    ~RingBuffer();

    // Prevent copying
    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    /**
     * @brief Allocate storage for capacity elements
     * @return ESP_ERR_INVALID_ARG for zero capacity, ESP_ERR_NO_MEM on allocation failure
     */
    esp_err_t init(size_t capacity);

    void push(double value);
    void clear();

    size_t size() const { return count_; }
    size_t capacity() const { return capacity_; }
    bool isFull() const { return capacity_ > 0 && count_ == capacity_; }
    bool empty() const { return count_ == 0; }

    /**
     * @brief Element by age, 0 is the oldest retained value
     *
     * Caller guarantees index < size().
     */
    double at(size_t index) const;

    double newest() const;

    /**
     * @brief Sum of count elements starting at age index first
     */
    double sum(size_t first, size_t count) const;

    double mean() const;
    double variancePopulation() const;

    /**
     * @brief Sample standard deviation (Bessel corrected), 0 if size() < 2
     */
    double stdDevSample() const;

    /**
     * @brief Copy the window oldest-first into out (size() floats)
     */
    void copyTo(float* out) const;

private:
    double* data_;
    size_t capacity_;
    size_t head_;       // Next write position
    size_t count_;
};

}  // namespace pdi
