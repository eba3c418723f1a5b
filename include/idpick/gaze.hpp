#ifndef IDPICK_GAZE_HPP_INCLUDED
#define IDPICK_GAZE_HPP_INCLUDED

#include <chrono>
#include <functional>

namespace idpick {
    // Single callback a dwell detector fires once a sustained gaze completes
    class gaze_interface {
        std::function<void()> on_complete;
    public:
        explicit gaze_interface(std::function<void()> on_complete);
        void complete() const;
    };

    struct gaze_control {
        virtual ~gaze_control() = default;
        virtual void start(const gaze_interface& target) = 0;
        virtual void stop() = 0;
    };

    class gaze_dwell : public gaze_control {
        std::chrono::milliseconds delay;
        std::chrono::duration<double> elapsed {0.0};
        const gaze_interface* target = nullptr;
    public:
        explicit gaze_dwell(std::chrono::milliseconds delay);
        void start(const gaze_interface& target) override;
        void stop() override;
        // Advances the countdown; completes the interface at most once per start
        void update(std::chrono::duration<double> dt);
        bool active() const;
        float progress() const;
    };
}

#endif
