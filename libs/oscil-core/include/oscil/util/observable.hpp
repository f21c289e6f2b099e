#pragma once

/**
@file
@brief Values that notify observers when modified.
*/

#include <oscil/core/types.hpp>

#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace util {

/// @brief Keeps an observer registered for as long as the handle lives.
///
/// Destroying or resetting the handle unregisters the observer. The handle may safely outlive the observed value.
class ObserverHandle {
public:
    ObserverHandle() = default;

    explicit ObserverHandle(std::function<void()> unregister)
        : m_unregister(std::move(unregister)) {}

    ObserverHandle(const ObserverHandle &) = delete;
    ObserverHandle &operator=(const ObserverHandle &) = delete;

    ObserverHandle(ObserverHandle &&other) noexcept
        : m_unregister(std::exchange(other.m_unregister, nullptr)) {}

    ObserverHandle &operator=(ObserverHandle &&other) noexcept {
        if (this != &other) {
            Reset();
            m_unregister = std::exchange(other.m_unregister, nullptr);
        }
        return *this;
    }

    ~ObserverHandle() {
        Reset();
    }

    /// @brief Unregisters the observer now.
    void Reset() {
        if (m_unregister) {
            auto unregister = std::exchange(m_unregister, nullptr);
            unregister();
        }
    }

    bool IsActive() const {
        return static_cast<bool>(m_unregister);
    }

private:
    std::function<void()> m_unregister;
};

/// @brief Holds a value and notifies registered observers whenever it is assigned.
///
/// Observers are invoked on the thread that performs the assignment. Observers must not register or unregister
/// observers on the same value from within a notification.
/// @tparam T the type of the value
template <typename T>
class Observable {
public:
    using Observer = std::function<void(const T &)>;

    Observable()
        : m_observers(std::make_shared<Observers>()) {}
    Observable(T value)
        : m_value(std::move(value))
        , m_observers(std::make_shared<Observers>()) {}

    Observable(const Observable &) = delete;
    Observable &operator=(const Observable &) = delete;

    Observable &operator=(T value) {
        Set(std::move(value));
        return *this;
    }

    /// @brief Replaces the value and notifies all observers.
    /// @param[in] value the new value
    void Set(T value) {
        m_value = std::move(value);
        Notify();
    }

    const T &Get() const {
        return m_value;
    }

    operator const T &() const {
        return m_value;
    }

    /// @brief Registers an observer.
    /// The observer is immediately invoked with the current value.
    /// @param[in] observer the function to invoke on changes
    /// @return a handle that keeps the observer registered until it is destroyed
    [[nodiscard]] ObserverHandle Observe(Observer &&observer) {
        observer(m_value);
        const uint64 id = m_observers->nextID++;
        m_observers->entries.push_back({id, std::move(observer)});

        std::weak_ptr<Observers> weakObservers = m_observers;
        return ObserverHandle{[weakObservers, id] {
            if (auto observers = weakObservers.lock()) {
                std::erase_if(observers->entries, [id](const Entry &entry) { return entry.id == id; });
            }
        }};
    }

    /// @brief Notifies all observers of the current value without modifying it.
    void Notify() const {
        for (auto &entry : m_observers->entries) {
            entry.observer(m_value);
        }
    }

    /// @brief The number of registered observers.
    size_t GetObserverCount() const {
        return m_observers->entries.size();
    }

private:
    struct Entry {
        uint64 id;
        Observer observer;
    };

    struct Observers {
        std::vector<Entry> entries;
        uint64 nextID = 0;
    };

    T m_value{};
    std::shared_ptr<Observers> m_observers;
};

} // namespace util
