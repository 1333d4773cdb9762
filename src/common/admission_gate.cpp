#include "common/admission_gate.hpp"

AdmissionGate::AdmissionGate(size_t slots)
    : capacity_(slots == 0 ? 1 : slots)
    , available_(capacity_) {
}

bool AdmissionGate::acquire(const CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (token.isCancelled()) {
            return false;
        }
        if (available_ > 0) {
            --available_;
            return true;
        }
        condition_.wait_for(lock, kCancelPollInterval);
    }
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (available_ < capacity_) {
            ++available_;
        }
    }
    condition_.notify_one();
}

size_t AdmissionGate::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}
