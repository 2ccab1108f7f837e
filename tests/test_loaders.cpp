#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

#include "core/DarkConstants.h"
#include "loaders/CalLoader.h"
#include "loaders/GLTFLoader.h"
#include "loaders/MotionClipLoader.h"

static bool approxEqual(const glm::vec3& a, const glm::vec3& b, float eps = 0.001f) {
    return glm::length(a - b) < eps;
}

namespace {

class ByteWriter {
public:
    template<typename T>
    void put(T value) {
        uint8_t raw[sizeof(T)];
        std::memcpy(raw, &value, sizeof(T));
        bytes.insert(bytes.end(), raw, raw + sizeof(T));
    }
    void i16(int16_t v) { put(v); }
    void i32(int32_t v) { put(v); }
    void u32(uint32_t v) { put(v); }
    void f32(float v) { put(v); }
    void vec3(const glm::vec3& v) { f32(v.x); f32(v.y); f32(v.z); }

    std::vector<uint8_t> bytes;
};

// One torso (joint 0) with a fixed joint 1, and a two-segment limb 2 -> 3 hanging off joint 1
std::vector<uint8_t> calBytes() {
    ByteWriter w;
    w.i32(1);       // version
    w.i32(1);       // torsos
    w.i32(1);       // limbs

    w.i32(0);       // joint
    w.i32(-1);      // parent
    w.i32(1);       // fixed count
    for (size_t i = 0; i < CAL_MAX_FIXED_JOINTS; ++i) w.i32(i == 0 ? 1 : 0);
    for (size_t i = 0; i < CAL_MAX_FIXED_JOINTS; ++i) {
        w.vec3(i == 0 ? glm::vec3(0.0f, 2.5f, 0.0f) : glm::vec3(0.0f));
    }

    w.i32(0);       // torso index
    w.i32(0);       // bend
    w.i32(2);       // segments
    w.i16(1);       // attachment joint
    for (size_t i = 0; i < CAL_MAX_SEGMENTS + 1; ++i) w.i16(i < 2 ? static_cast<int16_t>(i + 2) : 0);
    for (size_t i = 0; i < CAL_MAX_SEGMENTS; ++i) w.vec3(glm::vec3(0.0f, 1.0f, 0.0f));
    for (size_t i = 0; i < CAL_MAX_SEGMENTS; ++i) w.f32(5.0f);
    return w.bytes;
}

// Two-joint .mc: root bob track then one rotation track, three frames each
std::vector<uint8_t> motionClipBytes() {
    ByteWriter w;
    w.u32(2);
    const uint32_t rootOffset = 4 + 2 * 4;
    const uint32_t jointOffset = rootOffset + 3 * 12;
    w.u32(rootOffset);
    w.u32(jointOffset);
    for (int frame = 0; frame < 3; ++frame) {
        w.vec3(glm::vec3(7.0f, 2.5f * static_cast<float>(frame), 9.0f));
    }
    for (int frame = 0; frame < 3; ++frame) {
        // x, y, z, w
        w.f32(0.0f); w.f32(0.0f); w.f32(0.0f); w.f32(1.0f);
    }
    return w.bytes;
}

void appendPadded(std::vector<uint8_t>& out, const std::vector<uint8_t>& chunk, uint8_t pad) {
    out.insert(out.end(), chunk.begin(), chunk.end());
    while (out.size() % 4 != 0) out.push_back(pad);
}

std::vector<uint8_t> glbFrom(const std::string& json, const std::vector<uint8_t>& bin) {
    std::vector<uint8_t> jsonChunk;
    appendPadded(jsonChunk, std::vector<uint8_t>(json.begin(), json.end()), ' ');
    std::vector<uint8_t> binChunk;
    appendPadded(binChunk, bin, 0);

    ByteWriter glb;
    glb.u32(0x46546C67);    // "glTF"
    glb.u32(2);
    const size_t binSize = binChunk.empty() ? 0 : 8 + binChunk.size();
    glb.u32(static_cast<uint32_t>(12 + 8 + jsonChunk.size() + binSize));
    glb.u32(static_cast<uint32_t>(jsonChunk.size()));
    glb.u32(0x4E4F534A);    // "JSON"
    glb.bytes.insert(glb.bytes.end(), jsonChunk.begin(), jsonChunk.end());
    if (!binChunk.empty()) {
        glb.u32(static_cast<uint32_t>(binChunk.size()));
        glb.u32(0x004E4942);    // "BIN"
        glb.bytes.insert(glb.bytes.end(), binChunk.begin(), binChunk.end());
    }
    return glb.bytes;
}

// Minimal binary glTF: two-joint skin, one animation moving the child from y=1 to y=3 over a second
std::vector<uint8_t> glbBytes() {
    const std::string json = R"({
        "asset": {"version": "2.0"},
        "scene": 0,
        "scenes": [{"nodes": [0, 2]}],
        "nodes": [
            {"name": "root", "children": [1]},
            {"name": "arm", "translation": [0, 1, 0]},
            {"name": "body", "skin": 0}
        ],
        "skins": [{"joints": [0, 1]}],
        "buffers": [{"byteLength": 32}],
        "bufferViews": [
            {"buffer": 0, "byteOffset": 0, "byteLength": 8},
            {"buffer": 0, "byteOffset": 8, "byteLength": 24}
        ],
        "accessors": [
            {"bufferView": 0, "componentType": 5126, "count": 2, "type": "SCALAR", "min": [0], "max": [1]},
            {"bufferView": 1, "componentType": 5126, "count": 2, "type": "VEC3"}
        ],
        "animations": [{
            "name": "Raise",
            "samplers": [{"input": 0, "output": 1}],
            "channels": [{"sampler": 0, "target": {"node": 1, "path": "translation"}}]
        }]
    })";

    ByteWriter bin;
    bin.f32(0.0f);
    bin.f32(1.0f);
    bin.vec3(glm::vec3(0.0f, 1.0f, 0.0f));
    bin.vec3(glm::vec3(0.0f, 3.0f, 0.0f));

    return glbFrom(json, bin.bytes);
}

// Unskinned hinge node with a STEP rotation: a quarter turn about Y, then back to identity at t=1.
// Quaternions are written in glTF order (x, y, z, w).
std::vector<uint8_t> hingeGlbBytes() {
    const std::string json = R"({
        "asset": {"version": "2.0"},
        "scene": 0,
        "scenes": [{"nodes": [0]}],
        "nodes": [{"name": "hinge"}],
        "buffers": [{"byteLength": 40}],
        "bufferViews": [
            {"buffer": 0, "byteOffset": 0, "byteLength": 8},
            {"buffer": 0, "byteOffset": 8, "byteLength": 32}
        ],
        "accessors": [
            {"bufferView": 0, "componentType": 5126, "count": 2, "type": "SCALAR", "min": [0], "max": [1]},
            {"bufferView": 1, "componentType": 5126, "count": 2, "type": "VEC4"}
        ],
        "animations": [{
            "name": "Swing",
            "samplers": [{"input": 0, "output": 1, "interpolation": "STEP"}],
            "channels": [{"sampler": 0, "target": {"node": 0, "path": "rotation"}}]
        }]
    })";

    const float half = std::sqrt(0.5f);
    ByteWriter bin;
    bin.f32(0.0f);
    bin.f32(1.0f);
    bin.f32(0.0f); bin.f32(half); bin.f32(0.0f); bin.f32(half);
    bin.f32(0.0f); bin.f32(0.0f); bin.f32(0.0f); bin.f32(1.0f);
    return glbFrom(json, bin.bytes);
}

// Buffer that points at a file beside the .glb instead of the binary chunk
std::vector<uint8_t> externalBufferGlbBytes() {
    const std::string json = R"({
        "asset": {"version": "2.0"},
        "scene": 0,
        "scenes": [{"nodes": [0]}],
        "nodes": [{"name": "hinge"}],
        "buffers": [{"byteLength": 8, "uri": "darkcore_external.bin"}],
        "bufferViews": [{"buffer": 0, "byteOffset": 0, "byteLength": 8}],
        "accessors": [{"bufferView": 0, "componentType": 5126, "count": 2, "type": "SCALAR", "min": [0], "max": [1]}]
    })";
    return glbFrom(json, {});
}

std::string writeTemp(const std::string& name, const std::vector<uint8_t>& bytes) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return path.string();
}

}  // namespace

TEST_SUITE("CalLoader") {
    TEST_CASE("parses torsos and limbs") {
        auto cal = CalLoader::parse(calBytes());
        REQUIRE(cal.has_value());
        CHECK(cal->version == 1);
        REQUIRE(cal->torsos.size() == 1);
        REQUIRE(cal->limbs.size() == 1);
        CHECK(cal->torsos[0].parent == -1);
        CHECK(cal->limbs[0].numSegments == 2);
        CHECK(cal->limbs[0].segmentLengths[0] == doctest::Approx(5.0f));
    }

    TEST_CASE("builds a scaled hierarchy") {
        auto cal = CalLoader::parse(calBytes());
        REQUIRE(cal.has_value());
        Skeleton skeleton = CalLoader::createSkeleton(*cal);
        CHECK(skeleton.boneCount() == 4);

        // Offsets along Y are unaffected by the torso's 90 degree yaw
        CHECK(approxEqual(glm::vec3(skeleton.globalTransform(1)[3]), glm::vec3(0.0f, 1.0f, 0.0f)));
        CHECK(approxEqual(glm::vec3(skeleton.globalTransform(2)[3]), glm::vec3(0.0f, 3.0f, 0.0f)));
        CHECK(approxEqual(glm::vec3(skeleton.globalTransform(3)[3]), glm::vec3(0.0f, 5.0f, 0.0f)));
    }

    TEST_CASE("truncated or negative counts are rejected") {
        std::vector<uint8_t> bytes = calBytes();
        bytes.resize(bytes.size() - 4);
        CHECK_FALSE(CalLoader::parse(bytes).has_value());

        ByteWriter w;
        w.i32(1);
        w.i32(-1);
        w.i32(0);
        CHECK_FALSE(CalLoader::parse(w.bytes).has_value());
    }

    TEST_CASE("no torsos gives an empty skeleton") {
        CalFile cal;
        CHECK(CalLoader::createSkeleton(cal).boneCount() == 0);
    }
}

TEST_SUITE("MotionClipLoader") {
    TEST_CASE("decodes tracks and takes timing from the motion info") {
        MotionInfo info;
        info.name = "walk";
        info.frameCount = 3.0f;
        info.fps = 10.0f;
        info.duration = 0.5f;
        info.translation = glm::vec3(5.0f, 0.0f, 0.0f);
        info.endDirection = 30.0f;
        info.flags = {{1, MotionFlag::LeftFootfall}};

        auto clip = MotionClipLoader::decode(motionClipBytes(), info);
        REQUIRE(clip.has_value());
        CHECK(clip->numFrames == 3);
        CHECK(clip->timePerFrame == doctest::Approx(0.1f));
        CHECK(clip->endRotation == doctest::Approx(30.0f));
        CHECK(approxEqual(clip->translation, glm::vec3(2.0f, 0.0f, 0.0f)));
        CHECK(approxEqual(clip->slidingVelocity, glm::vec3(4.0f, 0.0f, 0.0f)));
        CHECK(clip->motionFlags.size() == 1);

        // Root track keeps only the vertical bob, scaled to runtime units
        REQUIRE(clip->rootTransforms.size() == 3);
        CHECK(approxEqual(glm::vec3(clip->rootTransforms[2][3]), glm::vec3(0.0f, 2.0f, 0.0f)));
        CHECK(clip->jointToFrame.count(0) == 1);
        REQUIRE(clip->jointToFrame.count(1) == 1);
        CHECK(clip->jointToFrame.at(1).size() == 3);
    }

    TEST_CASE("out of range offsets fail the decode") {
        MotionInfo info;
        info.name = "broken";
        info.frameCount = 3.0f;

        std::vector<uint8_t> bytes = motionClipBytes();
        bytes.resize(bytes.size() - 16);
        CHECK_FALSE(MotionClipLoader::decode(bytes, info).has_value());
        CHECK_FALSE(MotionClipLoader::decode({}, info).has_value());
    }
}

TEST_SUITE("GLTFLoader") {
    TEST_CASE("keyframe sampling interpolates and clamps") {
        KeyframeTrack<glm::vec3> track;
        track.times = {0.0f, 1.0f};
        track.values = {glm::vec3(0.0f), glm::vec3(2.0f, 0.0f, 0.0f)};

        CHECK(approxEqual(*track.sample(0.5f), glm::vec3(1.0f, 0.0f, 0.0f)));
        CHECK(approxEqual(*track.sample(-1.0f), glm::vec3(0.0f)));
        CHECK(approxEqual(*track.sample(4.0f), glm::vec3(2.0f, 0.0f, 0.0f)));
        CHECK_FALSE(KeyframeTrack<glm::vec3>{}.sample(0.0f).has_value());
    }

    TEST_CASE("step tracks hold the earlier key") {
        KeyframeTrack<glm::vec3> track;
        REQUIRE(track.assign(KeyInterpolation::Step, {0.0f, 1.0f}, {glm::vec3(0.0f), glm::vec3(2.0f, 0.0f, 0.0f)}));

        CHECK(approxEqual(*track.sample(0.0f), glm::vec3(0.0f)));
        CHECK(approxEqual(*track.sample(0.99f), glm::vec3(0.0f)));
        CHECK(approxEqual(*track.sample(1.0f), glm::vec3(2.0f, 0.0f, 0.0f)));
    }

    TEST_CASE("cubic spline tracks split tangents from values") {
        // (in, value, out) per key, flat tangents
        const std::vector<glm::vec3> output = {
            glm::vec3(0.0f), glm::vec3(0.0f), glm::vec3(0.0f),
            glm::vec3(0.0f), glm::vec3(2.0f, 0.0f, 0.0f), glm::vec3(0.0f)};
        KeyframeTrack<glm::vec3> track;
        REQUIRE(track.assign(KeyInterpolation::CubicSpline, {0.0f, 1.0f}, output));
        REQUIRE(track.values.size() == 2);
        CHECK(approxEqual(track.values[1], glm::vec3(2.0f, 0.0f, 0.0f)));

        CHECK(approxEqual(*track.sample(0.5f), glm::vec3(1.0f, 0.0f, 0.0f)));
        // Eases in: a quarter of the way the curve is well behind the straight line
        CHECK(approxEqual(*track.sample(0.25f), glm::vec3(0.3125f, 0.0f, 0.0f)));
        CHECK(approxEqual(*track.sample(1.0f), glm::vec3(2.0f, 0.0f, 0.0f)));

        KeyframeTrack<glm::vec3> ragged;
        CHECK_FALSE(ragged.assign(KeyInterpolation::CubicSpline, {0.0f, 1.0f}, {glm::vec3(0.0f)}));
        CHECK(ragged.empty());
    }

    TEST_CASE("cubic spline rotations stay unit length") {
        const glm::quat quarter = glm::angleAxis(glm::radians(90.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        const glm::quat zero(0.0f, 0.0f, 0.0f, 0.0f);
        KeyframeTrack<glm::quat> track;
        REQUIRE(track.assign(KeyInterpolation::CubicSpline, {0.0f, 1.0f},
                             {zero, glm::quat(1.0f, 0.0f, 0.0f, 0.0f), zero, zero, quarter, zero}));
        glm::quat mid = *track.sample(0.5f);
        CHECK(glm::length(mid) == doctest::Approx(1.0f).epsilon(1e-5));
    }

    TEST_CASE("conversion without a skeleton resamples at the target rate") {
        GLBAnimation animation;
        animation.name = "slide";
        animation.duration = 0.5f;
        NodeAnimation node;
        node.nodeIndex = 4;
        node.translation.times = {0.0f, 0.5f};
        node.translation.values = {glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 3.0f)};
        animation.nodes.push_back(node);

        auto clip = GLTFLoader::convertAnimation(animation, std::nullopt);
        REQUIRE(clip.has_value());
        CHECK(clip->numFrames == 15);
        CHECK(clip->timePerFrame == doctest::Approx(1.0f / GLB_TARGET_FPS));
        REQUIRE(clip->jointToFrame.count(4) == 1);
        CHECK(approxEqual(glm::vec3(clip->jointToFrame.at(4)[0][3]), glm::vec3(0.0f)));
    }

    TEST_CASE("zero duration animations are dropped") {
        GLBAnimation animation;
        animation.name = "empty";
        CHECK_FALSE(GLTFLoader::convertAnimation(animation, std::nullopt).has_value());
    }

    TEST_CASE("loads skeleton and clips from a binary file") {
        std::string path = writeTemp("darkcore_test_raise.glb", glbBytes());

        auto set = GLTFLoader::loadAnimations(path);
        REQUIRE(set.has_value());
        REQUIRE(set->skeleton.has_value());
        CHECK(set->skeleton->boneCount() == 2);
        CHECK(approxEqual(glm::vec3(set->skeleton->globalTransform(1)[3]), glm::vec3(0.0f, 1.0f, 0.0f)));

        REQUIRE(set->clips.size() == 1);
        const AnimationClip& clip = set->clips[0];
        CHECK(clip.name == std::optional<std::string>("Raise"));
        CHECK(clip.numFrames == 30);

        // Frames are relative to the rest pose: halfway the arm sits one unit above rest
        Skeleton posed = Skeleton::animate(*set->skeleton, AnimationInfo{&clip, 15}, {});
        CHECK(approxEqual(glm::vec3(posed.globalTransform(1)[3]), glm::vec3(0.0f, 2.0f, 0.0f)));
        Skeleton start = Skeleton::animate(*set->skeleton, AnimationInfo{&clip, 0}, {});
        CHECK(approxEqual(glm::vec3(start.globalTransform(1)[3]), glm::vec3(0.0f, 1.0f, 0.0f)));

        std::filesystem::remove(path);
    }

    TEST_CASE("rotations keep the glTF component order and honor the sampler mode") {
        std::string path = writeTemp("darkcore_test_hinge.glb", hingeGlbBytes());

        auto set = GLTFLoader::loadAnimations(path);
        REQUIRE(set.has_value());
        CHECK_FALSE(set->skeleton.has_value());
        REQUIRE(set->clips.size() == 1);
        const AnimationClip& clip = set->clips[0];
        REQUIRE(clip.jointToFrame.count(0) == 1);
        const auto& frames = clip.jointToFrame.at(0);
        REQUIRE(frames.size() == 30);

        // Disk (0, s, 0, s) is a quarter turn about Y, w last
        const glm::quat first = glm::quat_cast(glm::mat3(frames[0]));
        CHECK(glm::length(first) == doctest::Approx(1.0f).epsilon(1e-5));
        CHECK(std::abs(first.w) == doctest::Approx(std::sqrt(0.5f)).epsilon(1e-5));
        CHECK(std::abs(first.y) == doctest::Approx(std::sqrt(0.5f)).epsilon(1e-5));
        CHECK(approxEqual(glm::vec3(frames[0] * glm::vec4(1.0f, 0.0f, 0.0f, 0.0f)), glm::vec3(0.0f, 0.0f, -1.0f)));

        // STEP: still the first key halfway through
        CHECK(approxEqual(glm::vec3(frames[15] * glm::vec4(1.0f, 0.0f, 0.0f, 0.0f)), glm::vec3(0.0f, 0.0f, -1.0f)));

        std::filesystem::remove(path);
    }

    TEST_CASE("external buffers fail the load") {
        std::string path = writeTemp("darkcore_test_external.glb", externalBufferGlbBytes());
        CHECK_FALSE(GLTFLoader::loadAnimations(path).has_value());
        std::filesystem::remove(path);
    }

    TEST_CASE("missing files fail the load") {
        CHECK_FALSE(GLTFLoader::loadAnimations("/nonexistent/model.glb").has_value());
    }
}
