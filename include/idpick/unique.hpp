#ifndef IDPICK_UNIQUE_HPP_INCLUDED
#define IDPICK_UNIQUE_HPP_INCLUDED
#include <optional>
#include <utility>
namespace idpick {
    // Sole owner of an opaque handle value (a GL name, say); Deleter runs once when the owner dies
    template<typename T, typename Deleter>
    struct unique {
        std::optional<T> storage;
        unique(unique&& other) noexcept : storage(std::exchange(other.storage, std::nullopt)) {
        }
        explicit unique(T hnd) : storage(hnd) {
        }
        unique(const unique&) = delete;
        unique& operator=(const unique&) = delete;
        unique& operator=(unique&& other) noexcept {
            if (this != &other) {
                reset();
                storage = std::exchange(other.storage, std::nullopt);
            }
            return *this;
        }
        const T& operator*() const {
            return *storage;
        }
        explicit operator bool() const {
            return storage.has_value();
        }
        // Gives up ownership without deleting
        void release() {
            storage.reset();
        }
        void reset() {
            if (storage) {
                Deleter {}(*storage);
                storage.reset();
            }
        }
        ~unique() {
            reset();
        }
    };
}
#endif
