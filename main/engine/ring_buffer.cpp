/**
 * @file ring_buffer.cpp
 * @brief RingBuffer implementation
 */

#include "ring_buffer.hpp"

#include <cmath>
#include <cstdlib>

namespace pdi {

RingBuffer::RingBuffer()
    : data_(nullptr)
    , capacity_(0)
    , head_(0)
    , count_(0)
{
}

RingBuffer::~RingBuffer() {
    if (data_) free(data_);
}

esp_err_t RingBuffer::init(size_t capacity) {
    if (capacity == 0) {
        return ESP_ERR_INVALID_ARG;
    }

    if (data_) {
        free(data_);
        data_ = nullptr;
    }

    data_ = static_cast<double*>(malloc(capacity * sizeof(double)));
    if (!data_) {
        capacity_ = 0;
        return ESP_ERR_NO_MEM;
    }

    capacity_ = capacity;
    clear();
    return ESP_OK;
}

void RingBuffer::push(double value) {
    if (!data_) return;

    data_[head_] = value;
    head_ = (head_ + 1) % capacity_;
    if (count_ < capacity_) {
        count_++;
    }
}

void RingBuffer::clear() {
    head_ = 0;
    count_ = 0;
}

double RingBuffer::at(size_t index) const {
    // Oldest element sits count_ slots behind the write head
    size_t start = (head_ + capacity_ - count_) % capacity_;
    return data_[(start + index) % capacity_];
}

double RingBuffer::newest() const {
    if (count_ == 0) return 0.0;
    return at(count_ - 1);
}

double RingBuffer::sum(size_t first, size_t count) const {
    double total = 0.0;
    for (size_t i = first; i < first + count && i < count_; i++) {
        total += at(i);
    }
    return total;
}

double RingBuffer::mean() const {
    if (count_ == 0) return 0.0;
    return sum(0, count_) / static_cast<double>(count_);
}

double RingBuffer::variancePopulation() const {
    if (count_ == 0) return 0.0;

    double m = mean();
    double acc = 0.0;
    for (size_t i = 0; i < count_; i++) {
        double d = at(i) - m;
        acc += d * d;
    }
    return acc / static_cast<double>(count_);
}

double RingBuffer::stdDevSample() const {
    if (count_ < 2) return 0.0;

    double m = mean();
    double acc = 0.0;
    for (size_t i = 0; i < count_; i++) {
        double d = at(i) - m;
        acc += d * d;
    }
    return sqrt(acc / static_cast<double>(count_ - 1));
}

void RingBuffer::copyTo(float* out) const {
    for (size_t i = 0; i < count_; i++) {
        out[i] = static_cast<float>(at(i));
    }
}

}  // namespace pdi
