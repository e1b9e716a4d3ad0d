/*
* FIXED SIZE BLOCKING RING BUFFER (SAMPLE HAND-OFF BETWEEN PRODUCER AND ENGINE THREADS)
methods:
* push      -> blocks while full; false once closed
* pop       -> blocks while empty; false once closed and nothing left to pop
* try_pop   -> non-blocking pop
* close     -> wakes any waiting thread; pending items can still be popped
notes:
- single producer/single consumer only (no mutual exclusion between two producers)
- this is the serialisation point in front of swing_engine: the consumer thread is the engine's only writer
- semaphores do the full/empty signalling; count_ also tells a close() wake-up apart from an item
*/
#pragma once
#include <semaphore>
#include <cstddef> // std::size_t
#include <vector>
#include <utility>
#include <atomic>

// semaphore ceiling; capacity is clamped one below it to leave room for the close() token
static constexpr std::ptrdiff_t SEM_BUFFER_CAPACITY = 4096;

template<typename T>
class ringBuffer_C {
public:
    explicit ringBuffer_C(size_t capacity);

    bool push(const T& data);
    bool pop(T* dest);
    bool try_pop(T* dest);
    void close();
    bool is_closed() const { return isClosed_.load(std::memory_order_acquire); }
    size_t get_count() const { return count_.load(std::memory_order_acquire); }
    size_t capacity() const { return capacity_; }

private:
    void take_head(T* dest);

    size_t const capacity_;
    // a semaphore's count gives current number of 'slots' that can be taken
    std::counting_semaphore<SEM_BUFFER_CAPACITY> sem_slots_available_;
    std::counting_semaphore<SEM_BUFFER_CAPACITY> sem_items_available_;
    size_t tailIdx_ = 0; // producer only
    size_t headIdx_ = 0; // consumer only
    std::atomic<size_t> count_ = 0;
    std::atomic<bool> isClosed_ = false;
    std::vector<T> ringBufferArr_;
};

template<typename T>
ringBuffer_C<T>::ringBuffer_C(size_t capacity)
: capacity_(capacity == 0 ? 1 : (capacity >= size_t(SEM_BUFFER_CAPACITY) ? size_t(SEM_BUFFER_CAPACITY) - 1 : capacity)),
  sem_slots_available_(static_cast<std::ptrdiff_t>(capacity_)),
  sem_items_available_(0) {
    ringBufferArr_.resize(capacity_);
}

template<typename T>
bool ringBuffer_C<T>::push(const T& data) {
    if(isClosed_.load(std::memory_order_acquire)) {
        return false;
    }
    sem_slots_available_.acquire(); // BLOCKING. producer waits here while full

    // woken by close() rather than by a pop: hand the slot back
    if(isClosed_.load(std::memory_order_acquire)) {
        sem_slots_available_.release();
        return false;
    }

    ringBufferArr_[tailIdx_] = data;
    tailIdx_++;
    if(tailIdx_ >= capacity_) {
        tailIdx_ = 0;
    }
    count_.fetch_add(1, std::memory_order_release);
    sem_items_available_.release(); // "we've pushed something that can be popped"
    return true;
}

template<typename T>
void ringBuffer_C<T>::take_head(T* dest) {
    *dest = std::move(ringBufferArr_[headIdx_]);
    headIdx_++;
    if(headIdx_ >= capacity_) {
        headIdx_ = 0;
    }
    count_.fetch_sub(1, std::memory_order_release);
    sem_slots_available_.release();
}

template<typename T>
bool ringBuffer_C<T>::pop(T* dest) {
    sem_items_available_.acquire(); // BLOCKING. consumer waits for an item or close()
    if(count_.load(std::memory_order_acquire) == 0) {
        // token left behind by close(); put it back so later pops return too
        sem_items_available_.release();
        return false;
    }
    take_head(dest);
    return true;
}

template<typename T>
bool ringBuffer_C<T>::try_pop(T* dest) {
    if(!sem_items_available_.try_acquire()) {
        return false;
    }
    if(count_.load(std::memory_order_acquire) == 0) {
        // token left behind by close(); put it back for the next waiter
        sem_items_available_.release();
        return false;
    }
    take_head(dest);
    return true;
}

template<typename T>
void ringBuffer_C<T>::close() {
    if(isClosed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    // free whoever is parked on an acquire
    sem_slots_available_.release();
    sem_items_available_.release();
}
