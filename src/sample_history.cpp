#include "sample_history.hpp"
#include <cassert>

sample_history::sample_history(size_t capacity)
: capacity_(capacity == 0 ? 1 : capacity) {
    slots_.resize(capacity_);
}

bool sample_history::push(const sensor_sample_t& sample) {
    bool evicted = false;
    if(count_ == capacity_) {
        // full: the slot at head is the oldest, overwrite it and advance head
        slots_[headIdx_] = sample;
        headIdx_++;
        if(headIdx_ >= capacity_) {
            headIdx_ = 0;
        }
        evicted = true;
    } else {
        size_t tailIdx = headIdx_ + count_;
        if(tailIdx >= capacity_) {
            tailIdx -= capacity_;
        }
        slots_[tailIdx] = sample;
        count_++;
    }
    next_seq_++;
    assert(count_ <= capacity_);
    return evicted;
}

void sample_history::clear() {
    headIdx_ = 0;
    count_ = 0;
    next_seq_ = 0;
}

const sensor_sample_t& sample_history::at(size_t idx) const {
    assert(idx < count_);
    size_t phys = headIdx_ + idx;
    if(phys >= capacity_) {
        phys -= capacity_;
    }
    return slots_[phys];
}

size_t sample_history::copy_recent(size_t n, std::vector<sensor_sample_t>* dest) const {
    if(dest == nullptr) {
        return 0;
    }
    const size_t take = n < count_ ? n : count_;
    dest->clear();
    dest->reserve(take);
    for(size_t i = count_ - take; i < count_; i++) {
        dest->push_back(at(i));
    }
    return take;
}
