#pragma once

#include <cstddef>
#include <iterator>
#include <vector>

// Fixed-capacity ring buffer. Storage is allocated once; pushing past
// capacity overwrites the oldest entry. Index 0 is the oldest entry.
template <typename T>
class RollingWindow {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        const_iterator(const RollingWindow* window, size_t pos) : window_(window), pos_(pos) {}

        reference operator*() const { return (*window_)[pos_]; }
        pointer operator->() const { return &(*window_)[pos_]; }
        const_iterator& operator++() { ++pos_; return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++pos_; return tmp; }
        bool operator==(const const_iterator& other) const { return pos_ == other.pos_; }
        bool operator!=(const const_iterator& other) const { return pos_ != other.pos_; }

    private:
        const RollingWindow* window_;
        size_t pos_;
    };

    explicit RollingWindow(size_t capacity) : items_(capacity) {}

    void push(const T& value) {
        if (items_.empty()) return;

        if (size_ < items_.size()) {
            items_[(head_ + size_) % items_.size()] = value;
            ++size_;
        } else {
            items_[head_] = value;
            head_ = (head_ + 1) % items_.size();
        }
    }

    const T& operator[](size_t i) const { return items_[(head_ + i) % items_.size()]; }
    const T& front() const { return (*this)[0]; }
    const T& back() const { return (*this)[size_ - 1]; }

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, size_); }

    size_t size() const { return size_; }
    size_t capacity() const { return items_.size(); }
    bool empty() const { return size_ == 0; }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

private:
    std::vector<T> items_;
    size_t head_ = 0;
    size_t size_ = 0;
};
