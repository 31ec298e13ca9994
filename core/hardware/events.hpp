#pragma once

#include <map>

// Listener fan-out used by providers and broadcasters.  A listener receives
// every event type it overrides a react() method for.
template <typename T>
class EventEmitter {
public:
    virtual ~EventEmitter() {}

    void subscribe(T& m) {
        m_listeners[&m] = true;
    }
    void unsubscribe(T& m) {
        m_listeners.erase(&m);
    }
    bool is_subscribed(T& m) {
        auto it = m_listeners.find(&m);
        return it != m_listeners.end() && it->second;
    }
    unsigned int num_listeners() {
        return m_listeners.size();
    }

protected:
    std::map<T*, bool> listeners() {
        return m_listeners;
    }

    template<typename E> void notify(E const& e) {
        // Listeners may unsubscribe from within react() so iterate over a copy
        auto listeners = m_listeners;
        for (auto m : listeners) {
            if (m.second)
                m.first->react(e);
        }
    }

private:
    std::map<T*, bool> m_listeners;
};
