#include "admission_gate.h"

#include <stdexcept>

AdmissionGate::AdmissionGate(size_t limit)
    : limit_(limit)
{
    if (limit_ == 0) {
        throw std::invalid_argument("AdmissionGate limit must be >= 1");
    }
}

bool AdmissionGate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || in_flight_ < limit_; });
    if (closed_) {
        return false;
    }
    ++in_flight_;
    return true;
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ == 0) {
            throw std::logic_error("AdmissionGate::release() without acquire()");
        }
        --in_flight_;
    }
    cv_.notify_all();
}

void AdmissionGate::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool AdmissionGate::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t AdmissionGate::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

size_t AdmissionGate::limit() const {
    return limit_;
}
