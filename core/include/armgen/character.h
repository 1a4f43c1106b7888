#pragma once

#include "armgen/config.h"
#include "armgen/deform.h"
#include "armgen/error.h"
#include "armgen/frame.h"
#include "armgen/length.h"
#include "armgen/mesh_kernel.h"
#include "armgen/skeleton.h"
#include "armgen/spec.h"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace armgen {

// One piece of geometry ready for IMeshKernel::create_primitive, plus the
// deformation to run on it afterwards (extrusions only).
struct ResolvedPart {
  PrimitiveDesc desc{};
  Transform world{};
  std::optional<DeformationField> field;
  std::optional<uint32_t> material_index;
};

struct ResolvedBoolShape {
  std::string name;
  ResolvedPart part{};
  std::string anchor_bone;  // empty when placed in absolute units
};

struct ResolvedPartOperation {
  spec::BoolOp op = spec::BoolOp::Union;
  ResolvedPart target{};
};

// Built in place of the extruded segment.
struct ResolvedBonePart {
  ResolvedPart base{};
  std::vector<ResolvedPartOperation> operations;
};

struct ResolvedBoneMesh {
  std::string bone;
  std::string parent;  // skeleton parent, empty for roots
  BoneFrame frame{};
  Profile profile{};
  ResolvedLength radius{};
  // scale = (radius x, radius y, bone length); with extrusion steps the
  // height is the bone length times the summed step distances.
  Transform segment{};
  DeformationField field{};
  bool cap_start = true;
  bool cap_end = true;
  spec::ConnectMode connect_start = spec::ConnectMode::Segmented;
  spec::ConnectMode connect_end = spec::ConnectMode::Segmented;
  std::optional<ResolvedBonePart> part;
  std::vector<ResolvedPart> attachments;
  std::vector<spec::ModifierSpec> modifiers;
  std::optional<uint32_t> material_index;

  // Cross-section radius at normalized height t, before bulge/twist.
  double radius_at(double t) const;
};

// The parent's end loop is bridged to the child's start loop. Both meshes
// asked for it (parent connect_end, child connect_start) and both caps at the
// junction are removed.
struct BridgeLink {
  std::string parent;
  std::string child;
};

struct ResolvedCharacter {
  std::vector<ResolvedBoneMesh> bones;  // sorted by bone name
  std::vector<BridgeLink> bridges;      // sorted by child
  std::map<std::string, ResolvedBoolShape> bool_shapes;
  std::vector<Warning> warnings;
};

ResolvedPart resolve_primitive_attachment(const BoneFrame& frame, const spec::PrimitiveAttachment& attachment);
bool resolve_extrude_attachment(const BoneFrame& frame,
                                const spec::ExtrudeAttachment& attachment,
                                double degenerate_epsilon,
                                const std::string& path,
                                ResolvedPart& out,
                                Error& error);
ResolvedPart resolve_asset_attachment(const BoneFrame& frame, const spec::AssetAttachment& attachment);

// Anchored shapes resolve against `frame`; pass nullptr for absolute shapes.
ResolvedBoolShape resolve_bool_shape(const std::string& name,
                                     const spec::BoolShapeSpec& shape,
                                     const BoneFrame* frame);

// Rings for the cumulative extrusion steps, normalized to the total height,
// which is returned in bone lengths.
bool rings_from_steps(const std::vector<spec::ExtrusionStep>& steps,
                      const std::string& path,
                      std::vector<FieldRing>& rings,
                      double& height,
                      Error& error);

bool resolve_bone_mesh(const std::string& bone,
                       const BoneFrame& frame,
                       const spec::BoneMeshSpec& mesh,
                       const GeneratorConfig& cfg,
                       ResolvedBoneMesh& out,
                       Error& error);

// Resolves `params` = {bone_meshes, bool_shapes, material_slots} against a
// posed skeleton. Bone meshes for bones absent from the skeleton become
// warnings unless cfg.strict_bones is set. A mirrored entry whose key is the
// opposite-side name of its source is reflected with spec::mirror_across_x.
bool resolve_character(const nlohmann::json& params,
                       const Skeleton& skeleton,
                       const GeneratorConfig& cfg,
                       ResolvedCharacter& out,
                       Error& error);

// Builds the skeleton from params["skeleton_preset"] and params["skeleton"]
// first (see Skeleton::from_params).
bool resolve_character(const nlohmann::json& params,
                       const GeneratorConfig& cfg,
                       ResolvedCharacter& out,
                       Error& error);

} // namespace armgen
