#include <idpick/camera.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/constants.hpp>

glm::vec3 idpick::camera::eye() const {
    return focus + glm::vec3{radius.real(), radius.imag(), altitude} * zoom_factor;
}

glm::vec3 idpick::camera::forward() const {
    return focus - eye();
}

glm::mat4 idpick::camera::view() const {
    return glm::lookAt (
        eye(),
        focus,
        glm::vec3{0.0f, 0.0f, 1.0f}
    );
}

glm::mat4 idpick::camera::projection() const {
    if (use_ortho) {
        return glm::ortho(-zoom_factor * aspect_ratio, zoom_factor * aspect_ratio, -zoom_factor, zoom_factor, 0.1f, 1000.0f);
    } else {
        return glm::perspective(glm::half_pi<float>(), aspect_ratio, 0.1f, 1000.0f);
    }
}

idpick::camera_pose idpick::camera::pose() const {
    return camera_pose{view(), projection()};
}

idpick::camera_pose idpick::camera::mono_pose() const {
    if (stereo) {
        return (*stereo)[0];
    }
    return pose();
}

void idpick::camera::enter_stereo(const float eye_separation) {
    const glm::vec3 right = glm::normalize(glm::cross(forward(), glm::vec3{0.0f, 0.0f, 1.0f}));
    const glm::vec3 offset = right * (eye_separation * 0.5f);
    const glm::mat4 proj = glm::perspective(glm::half_pi<float>(), aspect_ratio * 0.5f, 0.1f, 1000.0f);
    const glm::vec3 up {0.0f, 0.0f, 1.0f};
    stereo = std::array<camera_pose, 2> {
        camera_pose{glm::lookAt(eye() - offset, focus - offset, up), proj},
        camera_pose{glm::lookAt(eye() + offset, focus + offset, up), proj}
    };
}

void idpick::camera::leave_stereo() {
    stereo.reset();
}
