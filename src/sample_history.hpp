/*
* BOUNDED SAMPLE HISTORY FOR THE SWING ENGINE
- fixed capacity, allocated once; pushing into a full history overwrites the oldest sample
- every sample gets a logical sequence id (0, 1, 2, ...) that is never reused, so a cursor
  held as a sequence id stays valid across evictions without re-indexing
- index 0 in at()/copy_recent() is the oldest sample still held
- not thread-safe: one writer (the engine) only
*/
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "types.hpp"

class sample_history {
public:
    explicit sample_history(size_t capacity);

    // returns true if the push evicted the oldest sample
    bool push(const sensor_sample_t& sample);
    void clear();

    size_t size() const { return count_; }
    size_t capacity() const { return capacity_; }
    bool empty() const { return count_ == 0; }

    // sequence id the next push will get (== number of samples ever pushed)
    uint64_t next_seq() const { return next_seq_; }
    // sequence id of at(0); equals next_seq() when empty
    uint64_t oldest_seq() const { return next_seq_ - count_; }
    bool holds_seq(uint64_t seq) const { return seq >= oldest_seq() && seq < next_seq_; }

    const sensor_sample_t& at(size_t idx) const;

    // copies the newest n samples (oldest first) into *dest; returns how many were copied
    size_t copy_recent(size_t n, std::vector<sensor_sample_t>* dest) const;

private:
    size_t const capacity_;
    size_t headIdx_ = 0; // physical slot of the oldest sample
    size_t count_ = 0;
    uint64_t next_seq_ = 0;
    std::vector<sensor_sample_t> slots_;
};
