/**
 * @file RingBuffer.hpp
 * @brief Fixed-capacity sample history used by the temporal stages
 *
 * @copyright 2025 ProctorEye Project
 * @license MIT License
 */

#ifndef PROCTOREYE_GAZE_RING_BUFFER_HPP
#define PROCTOREYE_GAZE_RING_BUFFER_HPP

#include <cstddef>
#include <deque>
#include <stdexcept>
#include <vector>

namespace proctoreye {
namespace gaze {

/**
 * @brief Fixed-capacity FIFO of samples
 *
 * When full, push() evicts the oldest sample. The buffer never holds more
 * than capacity() samples no matter how long the stream runs.
 *
 * Thread-safety: Not thread-safe. Owned by a single component.
 */
template<typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity)
        : max_capacity_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer capacity must be positive");
        }
    }

    void push(const T& sample) {
        if (buffer_.size() >= max_capacity_) {
            buffer_.pop_front();  // Remove oldest
        }
        buffer_.push_back(sample);
    }

    std::size_t size() const { return buffer_.size(); }

    std::size_t capacity() const { return max_capacity_; }

    bool is_full() const { return buffer_.size() >= max_capacity_; }

    bool is_empty() const { return buffer_.empty(); }

    void clear() { buffer_.clear(); }

    /**
     * @brief Sample at index (0 = oldest)
     */
    const T& at(std::size_t index) const {
        if (index >= buffer_.size()) {
            throw std::out_of_range("RingBuffer index out of range");
        }
        return buffer_[index];
    }

    const T& newest() const {
        if (buffer_.empty()) {
            throw std::out_of_range("RingBuffer is empty");
        }
        return buffer_.back();
    }

    /**
     * @brief Most recent samples in chronological order (oldest first)
     *
     * @param count Number of samples (0 or more than size() = all)
     */
    std::vector<T> last(std::size_t count = 0) const {
        std::size_t num = (count == 0 || count > buffer_.size()) ? buffer_.size() : count;
        return std::vector<T>(buffer_.end() - static_cast<std::ptrdiff_t>(num), buffer_.end());
    }

    typename std::deque<T>::const_iterator begin() const { return buffer_.begin(); }
    typename std::deque<T>::const_iterator end() const { return buffer_.end(); }

private:
    std::deque<T> buffer_;
    std::size_t max_capacity_;
};

} // namespace gaze
} // namespace proctoreye

#endif // PROCTOREYE_GAZE_RING_BUFFER_HPP
