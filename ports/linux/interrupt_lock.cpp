#include "interrupt_lock.hpp"
#include <mutex>

// No interrupts on Linux: every context that touches shared state takes the
// same recursive mutex
static std::recursive_mutex g_mtx;

InterruptLock::InterruptLock() : m_nested(0)
{
    g_mtx.lock();
}

InterruptLock::~InterruptLock()
{
    g_mtx.unlock();
}
