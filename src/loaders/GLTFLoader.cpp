#include "GLTFLoader.h"
#include "AnimationBlend.h"

#include <fastgltf/core.hpp>
#include <fastgltf/types.hpp>
#include <fastgltf/tools.hpp>
#include <fastgltf/glm_element_traits.hpp>
#include <SDL3/SDL_log.h>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <unordered_map>

namespace {

glm::vec3 interpolate(const glm::vec3& a, const glm::vec3& b, float t) {
    return a + (b - a) * t;
}

glm::quat interpolate(const glm::quat& a, const glm::quat& b, float t) {
    return glm::slerp(a, b, t);
}

glm::vec3 normalizeKey(const glm::vec3& v) {
    return v;
}

glm::quat normalizeKey(const glm::quat& q) {
    return glm::normalize(q);
}

// Hermite basis over one key interval; tangents are scaled by its length
template<typename T>
T hermite(const T& v0, const T& out0, const T& v1, const T& in1, float interval, float t) {
    const float t2 = t * t;
    const float t3 = t2 * t;
    return v0 * (2.0f * t3 - 3.0f * t2 + 1.0f) +
           out0 * ((t3 - 2.0f * t2 + t) * interval) +
           v1 * (-2.0f * t3 + 3.0f * t2) +
           in1 * ((t3 - t2) * interval);
}

} // anonymous namespace

template<typename T>
bool KeyframeTrack<T>::assign(KeyInterpolation mode, std::vector<float> keyTimes, const std::vector<T>& output) {
    interpolation = mode;
    times = std::move(keyTimes);
    values.clear();
    inTangents.clear();
    outTangents.clear();

    if (mode != KeyInterpolation::CubicSpline) {
        values = output;
        return true;
    }
    if (output.size() != times.size() * 3) {
        times.clear();
        return false;
    }
    values.reserve(times.size());
    inTangents.reserve(times.size());
    outTangents.reserve(times.size());
    for (size_t i = 0; i < times.size(); ++i) {
        inTangents.push_back(output[i * 3]);
        values.push_back(output[i * 3 + 1]);
        outTangents.push_back(output[i * 3 + 2]);
    }
    return true;
}

template<typename T>
std::optional<T> KeyframeTrack<T>::sample(float time) const {
    const size_t count = std::min(times.size(), values.size());
    if (count == 0) {
        return std::nullopt;
    }

    std::optional<size_t> before;
    std::optional<size_t> after;
    for (size_t i = 0; i < count; ++i) {
        if (times[i] <= time) {
            before = i;
        }
        if (times[i] >= time) {
            after = i;
            break;
        }
    }

    if (before && after) {
        if (*before == *after || times[*after] <= times[*before]) {
            return values[*before];
        }
        const float interval = times[*after] - times[*before];
        const float t = (time - times[*before]) / interval;
        switch (interpolation) {
            case KeyInterpolation::Step:
                return values[*before];
            case KeyInterpolation::CubicSpline:
                return normalizeKey(hermite(values[*before], outTangents[*before],
                                            values[*after], inTangents[*after], interval, t));
            case KeyInterpolation::Linear:
                break;
        }
        return interpolate(values[*before], values[*after], t);
    }
    if (before) return values[*before];
    if (after) return values[*after];
    return std::nullopt;
}

template struct KeyframeTrack<glm::vec3>;
template struct KeyframeTrack<glm::quat>;

namespace GLTFLoader {

namespace {

using BufferBytes = fastgltf::span<const std::byte>;

// Resolve the bytes of every buffer. External URIs are rejected.
std::optional<std::vector<BufferBytes>> collectBuffers(const fastgltf::Asset& asset, const std::string& path) {
    std::vector<BufferBytes> buffers;
    buffers.reserve(asset.buffers.size());

    for (const auto& buffer : asset.buffers) {
        bool supported = true;
        BufferBytes bytes;
        std::visit(fastgltf::visitor{
            [&](const fastgltf::sources::Array& array) {
                bytes = BufferBytes(array.bytes.data(), array.bytes.size());
            },
            [&](const fastgltf::sources::Vector& vector) {
                bytes = BufferBytes(vector.bytes.data(), vector.bytes.size());
            },
            [&](const fastgltf::sources::ByteView& view) {
                bytes = BufferBytes(view.bytes.data(), view.bytes.size());
            },
            [&](const fastgltf::sources::URI& uri) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                    "GLTFLoader: External buffer not supported: %s (in %s)",
                    std::string(uri.uri.string()).c_str(), path.c_str());
                supported = false;
            },
            [&](const auto&) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                    "GLTFLoader: Unsupported buffer source in %s", path.c_str());
                supported = false;
            }
        }, buffer.data);

        if (!supported) {
            return std::nullopt;
        }
        buffers.push_back(bytes);
    }
    return buffers;
}

// Reads raw float4x4 elements with the view's stride. Bytes outside the buffer read as zero.
std::vector<glm::mat4> readInverseBindMatrices(const fastgltf::Asset& asset,
                                               const fastgltf::Skin& skin,
                                               const std::vector<BufferBytes>& buffers) {
    std::vector<glm::mat4> matrices;
    if (!skin.inverseBindMatrices.has_value()) {
        return matrices;
    }

    const auto& accessor = asset.accessors[skin.inverseBindMatrices.value()];
    if (!accessor.bufferViewIndex.has_value()) {
        return matrices;
    }
    const auto& view = asset.bufferViews[accessor.bufferViewIndex.value()];
    if (view.bufferIndex >= buffers.size()) {
        return matrices;
    }
    const BufferBytes& buffer = buffers[view.bufferIndex];

    constexpr size_t elementSize = sizeof(float) * 16;
    const size_t stride = view.byteStride.has_value() ? view.byteStride.value() : elementSize;
    const size_t start = view.byteOffset + accessor.byteOffset;

    matrices.reserve(accessor.count);
    for (size_t i = 0; i < accessor.count; ++i) {
        float values[16];
        const size_t base = start + i * stride;
        for (size_t j = 0; j < 16; ++j) {
            const size_t byteIndex = base + j * sizeof(float);
            if (byteIndex + sizeof(float) > buffer.size()) {
                values[j] = 0.0f;
            } else {
                std::memcpy(&values[j], buffer.data() + byteIndex, sizeof(float));
            }
        }
        // glTF matrices are column-major, as is glm
        matrices.push_back(glm::make_mat4(values));
    }
    return matrices;
}

BonePose nodeRestPose(const fastgltf::Node& node) {
    BonePose pose;
    std::visit(fastgltf::visitor{
        [&](const fastgltf::TRS& trs) {
            pose.translation = glm::vec3(trs.translation[0], trs.translation[1], trs.translation[2]);
            pose.rotation = glm::quat(trs.rotation[3], trs.rotation[0], trs.rotation[1], trs.rotation[2]);
            pose.scale = glm::vec3(trs.scale[0], trs.scale[1], trs.scale[2]);
        },
        [&](const fastgltf::math::fmat4x4& matrix) {
            glm::mat4 m;
            for (int c = 0; c < 4; ++c) {
                for (int r = 0; r < 4; ++r) {
                    m[c][r] = matrix[c][r];
                }
            }
            pose = BonePose::fromMatrix(m);
        }
    }, node.transform);
    return pose;
}

glm::mat4 nodeLocalMatrix(const fastgltf::Node& node) {
    glm::mat4 result(1.0f);
    std::visit(fastgltf::visitor{
        [&](const fastgltf::TRS& trs) {
            glm::mat4 T = glm::translate(glm::mat4(1.0f),
                glm::vec3(trs.translation[0], trs.translation[1], trs.translation[2]));
            glm::quat R(trs.rotation[3], trs.rotation[0], trs.rotation[1], trs.rotation[2]);
            glm::mat4 S = glm::scale(glm::mat4(1.0f),
                glm::vec3(trs.scale[0], trs.scale[1], trs.scale[2]));
            result = T * glm::mat4_cast(R) * S;
        },
        [&](const fastgltf::math::fmat4x4& matrix) {
            for (int c = 0; c < 4; ++c) {
                for (int r = 0; r < 4; ++r) {
                    result[c][r] = matrix[c][r];
                }
            }
        }
    }, node.transform);
    return result;
}

Skeleton buildSkeleton(const fastgltf::Asset& asset, const fastgltf::Skin& skin,
                       const std::vector<BufferBytes>& buffers) {
    std::unordered_map<size_t, JointId> nodeToJoint;
    for (size_t i = 0; i < skin.joints.size(); ++i) {
        nodeToJoint.emplace(skin.joints[i], static_cast<JointId>(i));
    }

    // Parents come from the node hierarchy, restricted to nodes that are joints of this skin
    std::unordered_map<JointId, JointId> parentOf;
    for (size_t i = 0; i < skin.joints.size(); ++i) {
        const auto& node = asset.nodes[skin.joints[i]];
        for (size_t child : node.children) {
            auto it = nodeToJoint.find(child);
            if (it != nodeToJoint.end()) {
                parentOf[it->second] = static_cast<JointId>(i);
            }
        }
    }

    const auto inverseBinds = readInverseBindMatrices(asset, skin, buffers);

    std::vector<Bone> bones;
    std::unordered_map<JointId, JointRestTransform> restTransforms;
    bones.reserve(skin.joints.size());

    for (size_t i = 0; i < skin.joints.size(); ++i) {
        const auto& node = asset.nodes[skin.joints[i]];
        const JointId jointId = static_cast<JointId>(i);

        BonePose pose = nodeRestPose(node);
        glm::mat4 local = nodeLocalMatrix(node);

        JointRestTransform rest;
        rest.translation = pose.translation;
        rest.rotation = pose.rotation;
        rest.scale = pose.scale;
        rest.localMatrix = local;
        rest.localInverse = glm::inverse(local);
        rest.inverseBind = i < inverseBinds.size() ? inverseBinds[i] : glm::mat4(1.0f);
        restTransforms.emplace(jointId, rest);

        std::optional<JointId> parent;
        auto parentIt = parentOf.find(jointId);
        if (parentIt != parentOf.end()) {
            parent = parentIt->second;
        }
        bones.push_back(Bone{jointId, parent, local});
    }

    SDL_Log("GLTFLoader: Extracted skeleton with %zu joints", bones.size());
    return Skeleton::fromBonesWithRest(std::move(bones), std::move(nodeToJoint), std::move(restTransforms));
}

const fastgltf::Skin* findSkinInNode(const fastgltf::Asset& asset, size_t nodeIndex, size_t depth) {
    if (nodeIndex >= asset.nodes.size() || depth > asset.nodes.size()) {
        return nullptr;
    }
    const auto& node = asset.nodes[nodeIndex];
    if (node.skinIndex.has_value() && node.skinIndex.value() < asset.skins.size()) {
        return &asset.skins[node.skinIndex.value()];
    }
    for (size_t child : node.children) {
        if (const auto* skin = findSkinInNode(asset, child, depth + 1)) {
            return skin;
        }
    }
    return nullptr;
}

const fastgltf::Skin* findFirstSkin(const fastgltf::Asset& asset) {
    for (const auto& scene : asset.scenes) {
        for (size_t nodeIndex : scene.nodeIndices) {
            if (const auto* skin = findSkinInNode(asset, nodeIndex, 0)) {
                return skin;
            }
        }
    }
    return nullptr;
}

KeyInterpolation toKeyInterpolation(fastgltf::AnimationInterpolation mode) {
    switch (mode) {
        case fastgltf::AnimationInterpolation::Step: return KeyInterpolation::Step;
        case fastgltf::AnimationInterpolation::CubicSpline: return KeyInterpolation::CubicSpline;
        default: return KeyInterpolation::Linear;
    }
}

std::vector<GLBAnimation> extractAnimations(const fastgltf::Asset& asset) {
    std::vector<GLBAnimation> result;

    for (const auto& animation : asset.animations) {
        GLBAnimation anim;
        anim.name = animation.name.empty() ? std::string("Unnamed Animation") : std::string(animation.name);

        std::unordered_map<size_t, size_t> nodeSlot;
        for (const auto& channel : animation.channels) {
            if (!channel.nodeIndex.has_value()) {
                continue;
            }
            if (channel.path == fastgltf::AnimationPath::Weights) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "GLTFLoader: Skipping morph target weights in '%s'", anim.name.c_str());
                continue;
            }

            size_t nodeIndex = channel.nodeIndex.value();
            auto [slotIt, inserted] = nodeSlot.emplace(nodeIndex, anim.nodes.size());
            if (inserted) {
                anim.nodes.push_back(NodeAnimation{nodeIndex, {}, {}, {}});
            }
            NodeAnimation& target = anim.nodes[slotIt->second];

            const auto& sampler = animation.samplers[channel.samplerIndex];
            const auto& inputAccessor = asset.accessors[sampler.inputAccessor];
            const auto& outputAccessor = asset.accessors[sampler.outputAccessor];

            std::vector<float> times(inputAccessor.count);
            fastgltf::copyFromAccessor<float>(asset, inputAccessor, times.data());
            if (!times.empty() && times.back() > anim.duration) {
                anim.duration = times.back();
            }

            const KeyInterpolation mode = toKeyInterpolation(sampler.interpolation);
            bool assigned = true;
            switch (channel.path) {
                case fastgltf::AnimationPath::Translation: {
                    std::vector<glm::vec3> output(outputAccessor.count);
                    fastgltf::copyFromAccessor<glm::vec3>(asset, outputAccessor, output.data());
                    assigned = target.translation.assign(mode, std::move(times), output);
                    break;
                }
                case fastgltf::AnimationPath::Rotation: {
                    // glTF: (x, y, z, w) -> glm::quat(w, x, y, z). Tangents are not unit length.
                    std::vector<glm::vec4> raw(outputAccessor.count);
                    fastgltf::copyFromAccessor<glm::vec4>(asset, outputAccessor, raw.data());
                    std::vector<glm::quat> output;
                    output.reserve(raw.size());
                    for (size_t i = 0; i < raw.size(); ++i) {
                        const glm::quat q(raw[i].w, raw[i].x, raw[i].y, raw[i].z);
                        const bool tangent = mode == KeyInterpolation::CubicSpline && i % 3 != 1;
                        output.push_back(tangent ? q : glm::normalize(q));
                    }
                    assigned = target.rotation.assign(mode, std::move(times), output);
                    break;
                }
                case fastgltf::AnimationPath::Scale: {
                    std::vector<glm::vec3> output(outputAccessor.count);
                    fastgltf::copyFromAccessor<glm::vec3>(asset, outputAccessor, output.data());
                    assigned = target.scale.assign(mode, std::move(times), output);
                    break;
                }
                default:
                    break;
            }
            if (!assigned) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "GLTFLoader: Cubic spline output of node %zu in '%s' is not three values per key",
                    nodeIndex, anim.name.c_str());
            }
        }

        result.push_back(std::move(anim));
    }
    return result;
}

} // anonymous namespace

std::optional<AnimationClip> convertAnimation(const GLBAnimation& animation,
                                              const std::optional<Skeleton>& skeleton) {
    if (animation.duration <= 0.0f) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
            "GLTFLoader: Animation '%s' has zero or negative duration", animation.name.c_str());
        return std::nullopt;
    }

    const uint32_t frameCount = static_cast<uint32_t>(std::ceil(animation.duration * GLB_TARGET_FPS));

    AnimationClip clip;
    clip.name = animation.name;
    clip.numFrames = frameCount;
    clip.timePerFrame = 1.0f / GLB_TARGET_FPS;
    clip.duration = animation.duration;
    clip.blendLength = AnimationClip::DEFAULT_BLEND_LENGTH;

    for (const auto& node : animation.nodes) {
        JointId jointId = static_cast<JointId>(node.nodeIndex);
        const JointRestTransform* rest = nullptr;
        if (skeleton) {
            if (auto mapped = skeleton->jointForNode(node.nodeIndex)) {
                jointId = *mapped;
            } else {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "GLTFLoader: No joint mapping for node %zu, using joint %u", node.nodeIndex, jointId);
            }
            rest = skeleton->restTransform(jointId);
        }

        const JointRestTransform restDefaults;
        const JointRestTransform& restValues = rest ? *rest : restDefaults;

        std::vector<glm::mat4> frames;
        frames.reserve(frameCount);
        for (uint32_t frame = 0; frame < frameCount; ++frame) {
            const float time = static_cast<float>(frame) / GLB_TARGET_FPS;

            glm::vec3 translation = node.translation.sample(time).value_or(restValues.translation);
            glm::quat rotation = node.rotation.sample(time).value_or(restValues.rotation);
            glm::vec3 scale = node.scale.sample(time).value_or(restValues.scale);

            glm::mat4 animated = glm::translate(glm::mat4(1.0f), translation)
                               * glm::mat4_cast(rotation)
                               * glm::scale(glm::mat4(1.0f), scale);
            frames.push_back(restValues.localInverse * animated);
        }
        clip.jointToFrame[jointId] = std::move(frames);
    }

    SDL_Log("GLTFLoader: Converted '%s' -> %u frames @ %.0ffps (duration %.2fs)",
            animation.name.c_str(), frameCount, GLB_TARGET_FPS, animation.duration);
    return clip;
}

std::optional<GLBAnimationSet> loadAnimations(const std::string& path) {
    fastgltf::Parser parser;

    std::filesystem::path filePath(path);
    if (!std::filesystem::exists(filePath)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "GLTFLoader: File not found: %s", path.c_str());
        return std::nullopt;
    }

    auto data = fastgltf::GltfDataBuffer::FromPath(filePath);
    if (data.error() != fastgltf::Error::None) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "GLTFLoader: Failed to load file: %s", path.c_str());
        return std::nullopt;
    }

    // External buffers are intentionally not loaded so that URI sources can be rejected
    auto asset = parser.loadGltfBinary(data.get(), filePath.parent_path(), fastgltf::Options::None);
    if (asset.error() != fastgltf::Error::None) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "GLTFLoader: Failed to parse GLB: %s (error: %d)",
                    path.c_str(), static_cast<int>(asset.error()));
        return std::nullopt;
    }

    auto buffers = collectBuffers(asset.get(), path);
    if (!buffers) {
        return std::nullopt;
    }

    GLBAnimationSet result;
    if (const auto* skin = findFirstSkin(asset.get())) {
        result.skeleton = buildSkeleton(asset.get(), *skin, *buffers);
    }

    for (const auto& animation : extractAnimations(asset.get())) {
        if (auto clip = convertAnimation(animation, result.skeleton)) {
            result.clips.push_back(std::move(*clip));
        }
    }

    SDL_Log("GLTFLoader: Loaded %zu animations from %s", result.clips.size(), path.c_str());
    return result;
}

} // namespace GLTFLoader
