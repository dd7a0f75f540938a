#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> observer used for modifier and damage notifications.
///
/// Combat state is owned by one evaluation thread per world, so unlike a
/// general-purpose event bus this signal does no locking. Slots may connect
/// or disconnect from inside a slot; emit() iterates over a snapshot.

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace elemcore::foundation {

/// Single-threaded signal dispatching to registered callbacks in
/// connection order.
///
/// Example:
/// @code
///   Signal<const Modifier&> onExpired;
///   auto id = onExpired.connect([](const Modifier& m) { ... });
///   onExpired.emit(modifier);
///   onExpired.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;

    // Non-copyable.
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) noexcept = default;
    Signal& operator=(Signal&&) noexcept = default;

    /// Register a callback. Returns an id for later disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_++;
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    /// Remove a callback. Unknown ids are ignored.
    void disconnect(SlotId id) {
        std::erase_if(slots_, [id](const auto& entry) { return entry.first == id; });
    }

    void disconnectAll() { slots_.clear(); }

    /// Invoke every slot connected at the time of the call.
    void emit(Args... args) const {
        auto snapshot = slots_;
        for (const auto& [id, slot] : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const noexcept { return slots_.size(); }

private:
    std::vector<std::pair<SlotId, Slot>> slots_;
    SlotId nextId_ = 1;
};

} // namespace elemcore::foundation
