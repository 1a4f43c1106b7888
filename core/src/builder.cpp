#include "armgen/builder.h"

#include "armgen/log.h"

#include <algorithm>
#include <map>
#include <utility>
#include <variant>

namespace armgen {

namespace {

bool kernel_failed(Error& error, const std::string& what) {
  if (error.kind == ErrorKind::None) {
    error.kind = ErrorKind::Kernel;
  }
  error.message = what + ": " + (error.message.empty() ? std::string("kernel call failed") : error.message);
  return false;
}

bool create_part(IMeshKernel& kernel, const ResolvedPart& part, MeshHandle& out, Error& error,
                 const std::string& what) {
  MeshHandle handle = kInvalidMesh;
  if (!kernel.create_primitive(part.desc, mat4_from_transform(part.world), handle, error)) {
    return kernel_failed(error, what);
  }
  if (part.field.has_value() && !part.field->is_identity()) {
    if (!kernel.deform_vertices(handle, *part.field, handle, error)) {
      return kernel_failed(error, what + " deform");
    }
  }
  out = handle;
  return true;
}

bool apply_modifier(IMeshKernel& kernel,
                    const ResolvedCharacter& character,
                    const spec::ModifierSpec& modifier,
                    const std::string& what,
                    MeshHandle& mesh,
                    Error& error) {
  if (const auto* bevel = std::get_if<spec::BevelModifier>(&modifier)) {
    if (!kernel.apply_bevel(mesh, bevel->width, bevel->segments, mesh, error)) {
      return kernel_failed(error, what + " bevel");
    }
    return true;
  }
  if (const auto* subdivide = std::get_if<spec::SubdivideModifier>(&modifier)) {
    if (!kernel.apply_subdivide(mesh, subdivide->cuts, mesh, error)) {
      return kernel_failed(error, what + " subdivide");
    }
    return true;
  }
  const auto& boolean = std::get<spec::BoolModifier>(modifier);
  const auto it = character.bool_shapes.find(boolean.target);
  if (it == character.bool_shapes.end()) {
    return fail(error, ErrorKind::MissingTarget,
                "bool modifier target '" + boolean.target + "' not found in bool_shapes", what);
  }
  MeshHandle operand = kInvalidMesh;
  if (!create_part(kernel, it->second.part, operand, error, what + " bool shape '" + boolean.target + "'")) {
    return false;
  }
  if (!kernel.apply_boolean(mesh, operand, boolean.operation, mesh, error)) {
    return kernel_failed(error, what + " bool " + spec::bool_op_name(boolean.operation));
  }
  return true;
}

bool build_bone(IMeshKernel& kernel,
                const ResolvedCharacter& character,
                const ResolvedBoneMesh& bone,
                const GeneratorConfig& cfg,
                MeshHandle& out,
                Error& error) {
  const std::string what = "bone '" + bone.bone + "'";

  MeshHandle mesh = kInvalidMesh;
  if (bone.part.has_value()) {
    if (!create_part(kernel, bone.part->base, mesh, error, what + " part")) return false;
    for (size_t i = 0; i < bone.part->operations.size(); ++i) {
      const ResolvedPartOperation& operation = bone.part->operations[i];
      const std::string op_what = what + " part operation " + std::to_string(i);
      MeshHandle operand = kInvalidMesh;
      if (!create_part(kernel, operation.target, operand, error, op_what)) return false;
      if (!kernel.apply_boolean(mesh, operand, operation.op, mesh, error)) {
        return kernel_failed(error, op_what + " " + spec::bool_op_name(operation.op));
      }
    }
  } else {
    PrimitiveDesc segment_desc;
    segment_desc.source = PrimitiveDesc::Source::Profile;
    segment_desc.profile = bone.profile;
    if (!kernel.create_primitive(segment_desc, mat4_from_transform(bone.segment), mesh, error)) {
      return kernel_failed(error, what + " segment");
    }
    if (!bone.field.is_identity()) {
      if (!kernel.deform_vertices(mesh, bone.field, mesh, error)) {
        return kernel_failed(error, what + " deform");
      }
    }
    if (!bone.cap_start || !bone.cap_end) {
      if (!kernel.remove_caps(mesh, bone.cap_start, bone.cap_end, mesh, error)) {
        return kernel_failed(error, what + " caps");
      }
    }
  }

  if (!bone.attachments.empty()) {
    std::vector<MeshHandle> parts{mesh};
    for (size_t i = 0; i < bone.attachments.size(); ++i) {
      MeshHandle part = kInvalidMesh;
      if (!create_part(kernel, bone.attachments[i], part, error,
                       what + " attachment " + std::to_string(i))) {
        return false;
      }
      parts.push_back(part);
    }
    if (!kernel.join(parts, mesh, error)) {
      return kernel_failed(error, what + " join attachments");
    }
  }

  for (const auto& modifier : bone.modifiers) {
    if (!apply_modifier(kernel, character, modifier, what, mesh, error)) return false;
  }

  if (!kernel.bind_to_skeleton(mesh, bone.bone, cfg.bind_weight, error)) {
    return kernel_failed(error, what + " bind");
  }
  out = mesh;
  return true;
}

} // namespace

bool build_character(IMeshKernel& kernel,
                     const ResolvedCharacter& character,
                     const GeneratorConfig& cfg,
                     BuildResult& out,
                     Error& error) {
  if (character.bones.empty()) {
    return fail(error, ErrorKind::Shape, "no bone meshes to build", "bone_meshes");
  }

  BuildResult result;
  std::map<std::string, MeshHandle> current;
  for (const auto& bone : character.bones) {
    MeshHandle mesh = kInvalidMesh;
    if (!build_bone(kernel, character, bone, cfg, mesh, error)) {
      log::error(error.describe());
      return false;
    }
    result.bones.push_back({bone.bone, mesh});
    current[bone.bone] = mesh;
  }

  // A bridge merges two meshes; every bone that pointed at either now
  // points at the result.
  for (const auto& link : character.bridges) {
    const auto parent = current.find(link.parent);
    const auto child = current.find(link.child);
    if (parent == current.end() || child == current.end()) {
      fail(error, ErrorKind::MissingTarget,
           "bridge '" + link.parent + "' -> '" + link.child + "' names a bone without a mesh", "bridges");
      log::error(error.describe());
      return false;
    }
    const MeshHandle from = parent->second;
    const MeshHandle to = child->second;
    MeshHandle bridged = kInvalidMesh;
    if (!kernel.bridge(from, to, bridged, error)) {
      kernel_failed(error, "bridge '" + link.parent + "' -> '" + link.child + "'");
      log::error(error.describe());
      return false;
    }
    for (auto& entry : current) {
      if (entry.second == from || entry.second == to) entry.second = bridged;
    }
  }

  std::vector<MeshHandle> parts;
  for (const auto& bone : result.bones) {
    const MeshHandle mesh = current[bone.bone];
    if (std::find(parts.begin(), parts.end(), mesh) == parts.end()) parts.push_back(mesh);
  }

  if (parts.size() == 1) {
    result.mesh = parts.front();
  } else if (!kernel.join(parts, result.mesh, error)) {
    kernel_failed(error, "join character");
    log::error(error.describe());
    return false;
  }

  log::info("built character from " + std::to_string(result.bones.size()) + " bone meshes, " +
            std::to_string(character.bridges.size()) + " bridges");
  out = std::move(result);
  return true;
}

bool apply_vertex_group_mapping(IMeshKernel& kernel,
                                MeshHandle mesh,
                                const groups::NameMapping& mapping,
                                const groups::NameSet& existing,
                                const GeneratorConfig& cfg,
                                groups::GroupPlan& applied,
                                Error& error) {
  groups::GroupPlan plan;
  if (!groups::plan_group_mapping(mapping, existing, cfg.temp_prefix, plan, error)) return false;

  for (const auto& merge : plan.merges) {
    if (!kernel.merge_vertex_group(mesh, merge.src, merge.dst, error)) {
      return kernel_failed(error, "merge vertex group '" + merge.src + "' into '" + merge.dst + "'");
    }
  }
  for (const auto& step : plan.renames) {
    if (!kernel.rename_vertex_group(mesh, step.src, step.dst, error)) {
      return kernel_failed(error, "rename vertex group '" + step.src + "' to '" + step.dst + "'");
    }
  }
  if (!plan.merges.empty() || !plan.renames.empty()) {
    log::info("vertex groups: " + std::to_string(plan.merges.size()) + " merges, " +
              std::to_string(plan.renames.size()) + " renames");
  }
  applied = std::move(plan);
  return true;
}

} // namespace armgen
