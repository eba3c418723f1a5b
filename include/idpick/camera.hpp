#ifndef IDPICK_CAMERA_HPP_INCLUDED
#define IDPICK_CAMERA_HPP_INCLUDED

#include <glm/glm.hpp>
#include <array>
#include <complex>
#include <optional>

namespace idpick {
    struct camera_pose {
        glm::mat4 view;
        glm::mat4 projection;
    };

    struct camera {
        glm::vec3 focus;
        double altitude;
        std::complex<double> radius;
        float zoom_factor;
        float aspect_ratio;
        bool use_ortho = false;
        // Per-eye poses while a stereo (VR) device drives the camera, left eye first
        std::optional<std::array<camera_pose, 2>> stereo;

        glm::vec3 eye() const;
        glm::vec3 forward() const;
        glm::mat4 view() const;
        glm::mat4 projection() const;
        camera_pose pose() const;
        // The single pose used for passes that must not be split per eye
        camera_pose mono_pose() const;
        void enter_stereo(float eye_separation);
        void leave_stereo();
    };
}

#endif // IDPICK_CAMERA_HPP_INCLUDED
