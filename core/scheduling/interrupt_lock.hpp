#pragma once

#include <cstdint>

// Scoped critical section.  Nestable from the same context.
class InterruptLock {
public:
    InterruptLock();
    InterruptLock(const InterruptLock&) = delete;
    ~InterruptLock();

private:
    uint8_t m_nested;
};
