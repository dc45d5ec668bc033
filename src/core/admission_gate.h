#pragma once
#include <mutex>
#include <condition_variable>
#include <cstddef>

/// Counting admission gate bounding how many units of work are in flight.
class AdmissionGate {
public:
    // limit must be >= 1
    explicit AdmissionGate(size_t limit);

    // Block until fewer than limit() are in flight, then take a slot.
    // Returns false (without taking a slot) once the gate is closed.
    bool acquire();

    // Give a slot back and wake the waiters.
    void release();

    // Refuse further admissions and wake every waiter. In-flight work keeps
    // its slot until release().
    void close();

    bool isClosed() const;
    size_t inFlight() const;
    size_t limit() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t limit_;
    size_t in_flight_ = 0;
    bool closed_ = false;
};
