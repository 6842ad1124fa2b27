#pragma once

#include <functional>

namespace rdzv::guard_utils {
    /// RAII guard for a phase of a protocol;
    /// Wraps two functions: one for entering the phase, and one for exiting it.
    /// The constructor calls the enter function, and the destructor calls the exit function.
    /// If the enter function throws, the exit function is not invoked.
    class phase_guard {
        std::function<void()> enter;
        std::function<void()> exit;

    public:
        phase_guard(const std::function<void()> &enter, const std::function<void()> &exit) : enter(enter), exit(exit) {
            this->enter();
        }

        phase_guard(const phase_guard &) = delete;

        phase_guard &operator=(const phase_guard &) = delete;

        ~phase_guard() {
            exit();
        }
    };
}; // namespace guard_utils
