#pragma once
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace TP {

// FIFO buffer over a vector: pop_front advances an index and the consumed
// prefix is compacted once it dominates the storage.
template <typename T>
class PopFrontVector {
public:
    void push_back(T&& value) {
        vec.push_back(std::move(value));
    }

    T& front() {
        if (isEmpty()) {
            throw std::out_of_range("PopFrontVector is empty");
        }
        return vec[frontIndex];
    }

    void pop_front() {
        if (isEmpty()) {
            throw std::out_of_range("PopFrontVector is empty");
        }
        frontIndex++;
        performGarbageCollectionIfNeeded();
    }

    // Moves the front element out and pops it.
    T take_front() {
        T value = std::move(front());
        pop_front();
        return value;
    }

    bool isEmpty() const {
        return frontIndex >= vec.size();
    }

    size_t size() const {
        return vec.size() - frontIndex;
    }

private:
    std::vector<T> vec;
    size_t         frontIndex = 0;

    void performGarbageCollectionIfNeeded() {
        if (frontIndex > vec.size() * 0.3) {
            auto first = vec.begin() + static_cast<std::ptrdiff_t>(frontIndex);
            vec        = std::vector<T>(std::make_move_iterator(first), std::make_move_iterator(vec.end()));
            frontIndex = 0;
        }
    }
};

} // namespace TP
