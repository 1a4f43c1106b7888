#pragma once

#include "armgen/deform.h"
#include "armgen/error.h"
#include "armgen/length.h"
#include "armgen/math.h"
#include "armgen/profile.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace armgen::spec {

enum class PrimitiveKind : uint8_t {
  Cube = 0,
  Sphere = 1,
  Cylinder = 2,
  Cone = 3,
  Torus = 4,
  Plane = 5,
  IcoSphere = 6
};

const char* primitive_kind_name(PrimitiveKind kind);
bool parse_primitive_kind(const nlohmann::json& value,
                          const std::string& path,
                          PrimitiveKind& out,
                          Error& error);

struct PrimitiveAttachment {
  PrimitiveKind primitive = PrimitiveKind::Cube;
  Vec3 dimensions{};  // bone-relative
  Vec3 offset{};      // bone-relative
  std::optional<Vec3> rotation;
  std::optional<uint32_t> material_index;
};

struct ExtrudeAttachment {
  Profile profile{};
  Vec3 start{};  // bone-relative
  Vec3 end{};    // bone-relative
  BoneRelativeLength profile_radius{BoneRelativeLength::Form::Relative, 0.05, 0.05};
  double taper = 1.0;
};

struct AssetAttachment {
  std::string asset;
  Vec3 offset{};  // bone-relative
  std::optional<Vec3> rotation;
  double scale = 1.0;
};

using AttachmentSpec = std::variant<PrimitiveAttachment, ExtrudeAttachment, AssetAttachment>;

enum class BoolOp : uint8_t {
  Union = 0,
  Difference = 1,
  Intersect = 2
};

const char* bool_op_name(BoolOp op);

struct BevelModifier {
  double width = 0.0;
  uint32_t segments = 1;
};

struct SubdivideModifier {
  uint32_t cuts = 1;
};

struct BoolModifier {
  BoolOp operation = BoolOp::Difference;
  std::string target;  // key into bool_shapes
};

using ModifierSpec = std::variant<BevelModifier, SubdivideModifier, BoolModifier>;

// How a bone mesh end meets the mesh of the adjacent bone.
enum class ConnectMode : uint8_t {
  Segmented = 0,
  Bridge = 1
};

// One extrusion of the top ring. A bare number is {extrude: n}. Distances
// are bone-relative, angles in degrees, and every value applies on top of
// the previous steps.
struct ExtrusionStep {
  double extrude = 0.0;  // > 0
  double scale_x = 1.0;
  double scale_y = 1.0;
  Vec3 translate{};
  double rotate = 0.0;  // about the bone axis
  double tilt_x = 0.0;
  double tilt_y = 0.0;
  double bulge_side = 1.0;
  double bulge_front = 1.0;
};

using PartShape = std::variant<PrimitiveAttachment, AssetAttachment>;

struct PartOperation {
  BoolOp op = BoolOp::Union;
  PartShape target;
};

// A modelled piece that replaces the extruded segment: `base`, then each
// operation applied to it in order.
struct BonePartSpec {
  PartShape base;
  std::vector<PartOperation> operations;
};

struct BoneMeshSpec {
  Profile profile{};
  BoneRelativeLength profile_radius{BoneRelativeLength::Form::Relative, 0.1, 0.1};
  bool cap_start = true;
  bool cap_end = true;
  double taper = 1.0;
  std::vector<BulgePoint> bulge;  // input order; sorted when the field is built
  double twist = 0.0;             // degrees over the full segment
  Vec3 translate{};               // bone-relative
  std::optional<Vec3> rotate;     // degrees
  std::vector<AttachmentSpec> attachments;
  std::vector<ModifierSpec> modifiers;
  std::optional<uint32_t> material_index;
  std::vector<ExtrusionStep> extrusion_steps;  // exclusive with part
  ConnectMode connect_start = ConnectMode::Segmented;
  ConnectMode connect_end = ConnectMode::Segmented;
  std::optional<BonePartSpec> part;
};

// Anchored shapes use bone-relative position and dimensions; unanchored
// shapes are absolute world units.
struct BoolShapeSpec {
  PrimitiveKind primitive = PrimitiveKind::Cube;
  Vec3 dimensions{};
  Vec3 position{};
  std::optional<Vec3> rotation;
  std::optional<std::string> bone;
};

bool parse_attachment(const nlohmann::json& value,
                      const std::string& path,
                      AttachmentSpec& out,
                      Error& error);

bool parse_modifier(const nlohmann::json& value,
                    const std::string& path,
                    ModifierSpec& out,
                    Error& error);

bool parse_bone_mesh(const nlohmann::json& value,
                     const std::string& path,
                     BoneMeshSpec& out,
                     Error& error,
                     uint32_t default_segments = kDefaultProfileSegments);

// Reflects a definition across the YZ plane for use on the opposite side.
// The mirrored bone's frame has its local X negated, so X offsets flip sign
// and rotations about local Y and Z (twist included) change direction.
void mirror_across_x(BoneMeshSpec& mesh);

bool parse_bool_shape(const nlohmann::json& value,
                      const std::string& path,
                      BoolShapeSpec& out,
                      Error& error);

} // namespace armgen::spec
