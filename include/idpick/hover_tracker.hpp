#ifndef IDPICK_HOVER_TRACKER_HPP_INCLUDED
#define IDPICK_HOVER_TRACKER_HPP_INCLUDED

#include <idpick/gaze.hpp>
#include <idpick/pickable.hpp>

namespace idpick {
    // Tracks the single hovered object and fires out/over on transitions.
    // over() fires on every check that lands on an interactive object, not only on entry;
    // callers wanting enter/leave semantics must edge-detect on top.
    class hover_tracker {
        const gaze_interface& gaze_target;
        pickable_object* hovered = nullptr;
    public:
        explicit hover_tracker(const gaze_interface& gaze_target);

        // object is the freshly resolved object (or null). gaze is non-null in VR mode only.
        void check(pickable_object* object, gaze_control* gaze);
        // Gaze click: clicks the cached hover target without resolving again
        void click() const;
        pickable_object* current() const;
        void reset();
    };
}

#endif
