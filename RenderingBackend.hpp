#ifndef RENDERING_BACKEND_H_
#define RENDERING_BACKEND_H_

#include <memory>
#include <string>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace AVATAR {

    // A named skeleton joint. Only the local rotation is driven here.
    class JointHandle {
    public:
        virtual ~JointHandle() = default;

        virtual const std::string& GetName() const = 0;
        virtual glm::quat GetRotation() const = 0;
        virtual void SetRotation(const glm::quat& rotation) = 0;
    };

    struct BoundingInfo {
        glm::vec3 center = glm::vec3(0.0f);
        glm::vec3 size = glm::vec3(0.0f);
    };

    // A loaded, rigged character: joints plus blendable expression channels.
    class CharacterRig {
    public:
        virtual ~CharacterRig() = default;

        // nullptr when the skeleton has no joint by that name.
        virtual JointHandle* FindJoint(const std::string& name) = 0;

        virtual bool HasExpression(const std::string& name) const = 0;
        virtual float GetExpression(const std::string& name) const = 0;
        virtual void SetExpression(const std::string& name, float weight) = 0;

        virtual void SetLookAtTarget(const glm::vec3& target) = 0;
        virtual BoundingInfo GetBounds() const = 0;
    };

    class RenderingBackend {
    public:
        virtual ~RenderingBackend() = default;

        // nullptr when the asset cannot be loaded.
        virtual std::unique_ptr<CharacterRig> LoadCharacter(const std::string& source) = 0;

        // Secondary clip player (looping idle clip shipped with the asset).
        virtual void AdvanceClips(CharacterRig& rig, double delta_time) = 0;
        virtual void Update(CharacterRig& rig, double delta_time) = 0;
        virtual void RenderFrame(CharacterRig& rig) = 0;
    };

}  // namespace AVATAR

#endif
