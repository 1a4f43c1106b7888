#include "armgen/character.h"

#include "armgen/alias.h"
#include "armgen/log.h"
#include "armgen/validate.h"

#include <type_traits>
#include <variant>

namespace armgen {

namespace {

using json = nlohmann::json;
using validate::index_path;
using validate::join_path;

const json& section(const json& params, const char* key) {
  static const json kMissing;
  const auto it = params.find(key);
  return it == params.end() ? kMissing : *it;
}

bool check_material_index(const std::optional<uint32_t>& index,
                          size_t slot_count,
                          const std::string& path,
                          Error& error) {
  if (!index.has_value() || *index < slot_count) return true;
  return fail(error, ErrorKind::Range,
              "material_index " + std::to_string(*index) + " out of range for material_slots (len=" +
                  std::to_string(slot_count) + ")",
              join_path(path, "material_index"));
}

bool check_mesh_references(const spec::BoneMeshSpec& mesh,
                           const std::map<std::string, ResolvedBoolShape>& bool_shapes,
                           size_t slot_count,
                           const std::string& path,
                           Error& error) {
  if (!check_material_index(mesh.material_index, slot_count, path, error)) return false;
  for (size_t i = 0; i < mesh.modifiers.size(); ++i) {
    const auto* modifier = std::get_if<spec::BoolModifier>(&mesh.modifiers[i]);
    if (!modifier) continue;
    if (bool_shapes.count(modifier->target) == 0) {
      return fail(error, ErrorKind::MissingTarget,
                  "bool modifier target '" + modifier->target + "' not found in bool_shapes",
                  index_path(join_path(path, "modifiers"), i) + ".bool.target");
    }
  }
  for (size_t i = 0; i < mesh.attachments.size(); ++i) {
    const auto* primitive = std::get_if<spec::PrimitiveAttachment>(&mesh.attachments[i]);
    if (!primitive) continue;
    if (!check_material_index(primitive->material_index, slot_count,
                              index_path(join_path(path, "attachments"), i), error)) {
      return false;
    }
  }
  return true;
}

void add_warning(std::vector<Warning>& warnings, const std::string& bone, const std::string& reason) {
  log::warn("bone '" + bone + "': " + reason);
  warnings.push_back({bone, reason});
}

ResolvedPart resolve_part_shape(const BoneFrame& frame, const spec::PartShape& shape) {
  if (const auto* primitive = std::get_if<spec::PrimitiveAttachment>(&shape)) {
    return resolve_primitive_attachment(frame, *primitive);
  }
  return resolve_asset_attachment(frame, std::get<spec::AssetAttachment>(shape));
}

bool crosses_sides(const std::string& key, const std::string& source) {
  return key != source && mirror_bone_name(source) == key;
}

// Pairs child connect_start with parent connect_end. Unpaired requests fall
// back to segmented ends with a warning.
void link_bridges(ResolvedCharacter& character) {
  std::map<std::string, size_t> index;
  for (size_t i = 0; i < character.bones.size(); ++i) index[character.bones[i].bone] = i;

  std::vector<bool> end_linked(character.bones.size(), false);
  for (auto& child : character.bones) {
    if (child.connect_start != spec::ConnectMode::Bridge) continue;
    const auto it = child.parent.empty() ? index.end() : index.find(child.parent);
    if (it == index.end() || character.bones[it->second].connect_end != spec::ConnectMode::Bridge) {
      add_warning(character.warnings, child.bone,
                  "connect_start='bridge' has no parent mesh bridging its end; kept segmented");
      child.connect_start = spec::ConnectMode::Segmented;
      continue;
    }
    ResolvedBoneMesh& parent = character.bones[it->second];
    parent.cap_end = false;
    child.cap_start = false;
    end_linked[it->second] = true;
    character.bridges.push_back({parent.bone, child.bone});
  }
  for (size_t i = 0; i < character.bones.size(); ++i) {
    ResolvedBoneMesh& bone = character.bones[i];
    if (bone.connect_end != spec::ConnectMode::Bridge || end_linked[i]) continue;
    add_warning(character.warnings, bone.bone,
                "connect_end='bridge' has no child mesh bridging its start; kept segmented");
    bone.connect_end = spec::ConnectMode::Segmented;
  }
}

} // namespace

double ResolvedBoneMesh::radius_at(double t) const {
  return radius.x * field.taper_scale(t);
}

ResolvedPart resolve_primitive_attachment(const BoneFrame& frame, const spec::PrimitiveAttachment& attachment) {
  ResolvedPart part;
  part.desc.source = PrimitiveDesc::Source::Primitive;
  part.desc.primitive = attachment.primitive;
  part.world = place_relative(frame, attachment.offset, attachment.rotation,
                              vec3_mul(attachment.dimensions, frame.length));
  part.material_index = attachment.material_index;
  return part;
}

bool resolve_extrude_attachment(const BoneFrame& frame,
                                const spec::ExtrudeAttachment& attachment,
                                double degenerate_epsilon,
                                const std::string& path,
                                ResolvedPart& out,
                                Error& error) {
  const Vec3 start = bone_relative_point(frame, attachment.start);
  const Vec3 end = bone_relative_point(frame, attachment.end);
  BoneFrame span;
  if (!compute_bone_frame(frame.name, start, end, degenerate_epsilon, span, error)) {
    error.message = "extrude start and end coincide: " + error.message;
    error.path = path;
    return false;
  }

  ResolvedLength radius;
  if (!resolve_length(attachment.profile_radius, frame.length, join_path(path, "profile_radius"), radius, error)) {
    return false;
  }
  DeformationField field;
  if (!DeformationField::build(attachment.taper, {}, 0.0, path, field, error)) return false;

  ResolvedPart part;
  part.desc.source = PrimitiveDesc::Source::Profile;
  part.desc.profile = attachment.profile;
  part.world.position = start;
  part.world.rotation = span.orientation;
  part.world.scale = {radius.x, radius.y, span.length};
  part.field = std::move(field);
  out = std::move(part);
  return true;
}

ResolvedPart resolve_asset_attachment(const BoneFrame& frame, const spec::AssetAttachment& attachment) {
  ResolvedPart part;
  part.desc.source = PrimitiveDesc::Source::Asset;
  part.desc.asset_path = attachment.asset;
  part.world = place_relative(frame, attachment.offset, attachment.rotation,
                              {attachment.scale, attachment.scale, attachment.scale});
  return part;
}

ResolvedBoolShape resolve_bool_shape(const std::string& name,
                                     const spec::BoolShapeSpec& shape,
                                     const BoneFrame* frame) {
  ResolvedBoolShape out;
  out.name = name;
  out.part.desc.source = PrimitiveDesc::Source::Primitive;
  out.part.desc.primitive = shape.primitive;
  if (frame) {
    out.anchor_bone = frame->name;
    out.part.world = place_relative(*frame, shape.position, shape.rotation,
                                    vec3_mul(shape.dimensions, frame->length));
  } else {
    out.part.world = place_absolute(shape.position, shape.rotation, shape.dimensions);
  }
  return out;
}

bool rings_from_steps(const std::vector<spec::ExtrusionStep>& steps,
                      const std::string& path,
                      std::vector<FieldRing>& rings,
                      double& height,
                      Error& error) {
  rings.clear();
  height = 1.0;
  if (steps.empty()) return true;

  const std::string steps_path = join_path(path, "extrusion_steps");
  std::vector<FieldRing> result{FieldRing{}};
  FieldRing ring;
  double z = 0.0;
  for (size_t i = 0; i < steps.size(); ++i) {
    const spec::ExtrusionStep& step = steps[i];
    const double next = z + step.extrude + step.translate.z;
    if (!(next > z)) {
      return fail(error, ErrorKind::Range, "extrusion step does not advance along the bone",
                  index_path(steps_path, i));
    }
    z = next;
    ring.position = z;
    ring.scale_x *= step.scale_x * step.bulge_side;
    ring.scale_y *= step.scale_y * step.bulge_front;
    ring.twist_degrees += step.rotate;
    ring.offset_x += step.translate.x;
    ring.offset_y += step.translate.y;
    ring.tilt_x_degrees += step.tilt_x;
    ring.tilt_y_degrees += step.tilt_y;
    result.push_back(ring);
  }
  for (auto& r : result) {
    r.position /= z;
    r.offset_x /= z;
    r.offset_y /= z;
  }
  result.back().position = 1.0;
  rings = std::move(result);
  height = z;
  return true;
}

bool resolve_bone_mesh(const std::string& bone,
                       const BoneFrame& frame,
                       const spec::BoneMeshSpec& mesh,
                       const GeneratorConfig& cfg,
                       ResolvedBoneMesh& out,
                       Error& error) {
  const std::string path = join_path("bone_meshes", bone);

  ResolvedBoneMesh resolved;
  resolved.bone = bone;
  resolved.frame = frame;
  resolved.profile = mesh.profile;
  resolved.cap_start = mesh.cap_start;
  resolved.cap_end = mesh.cap_end;
  resolved.connect_start = mesh.connect_start;
  resolved.connect_end = mesh.connect_end;
  resolved.material_index = mesh.material_index;
  resolved.modifiers = mesh.modifiers;

  if (!resolve_length(mesh.profile_radius, frame.length, join_path(path, "profile_radius"), resolved.radius,
                      error)) {
    return false;
  }
  std::vector<FieldRing> rings;
  double height = 1.0;
  if (!rings_from_steps(mesh.extrusion_steps, path, rings, height, error)) return false;
  if (!DeformationField::build(mesh.taper, mesh.bulge, mesh.twist, std::move(rings), path, resolved.field, error)) {
    return false;
  }

  resolved.segment = place_relative(frame, mesh.translate, mesh.rotate,
                                    {resolved.radius.x, resolved.radius.y, frame.length * height});

  if (mesh.part.has_value()) {
    ResolvedBonePart part;
    part.base = resolve_part_shape(frame, mesh.part->base);
    for (const auto& operation : mesh.part->operations) {
      part.operations.push_back({operation.op, resolve_part_shape(frame, operation.target)});
    }
    resolved.part = std::move(part);
  }

  const std::string attachments_path = join_path(path, "attachments");
  for (size_t i = 0; i < mesh.attachments.size(); ++i) {
    const std::string item_path = index_path(attachments_path, i);
    ResolvedPart part;
    bool ok = true;
    std::visit(
        [&](const auto& attachment) {
          using T = std::decay_t<decltype(attachment)>;
          if constexpr (std::is_same_v<T, spec::PrimitiveAttachment>) {
            part = resolve_primitive_attachment(frame, attachment);
          } else if constexpr (std::is_same_v<T, spec::ExtrudeAttachment>) {
            ok = resolve_extrude_attachment(frame, attachment, cfg.degenerate_epsilon,
                                            join_path(item_path, "extrude"), part, error);
          } else {
            part = resolve_asset_attachment(frame, attachment);
          }
        },
        mesh.attachments[i]);
    if (!ok) return false;
    resolved.attachments.push_back(std::move(part));
  }

  out = std::move(resolved);
  return true;
}

bool resolve_character(const json& params,
                       const Skeleton& skeleton,
                       const GeneratorConfig& cfg,
                       ResolvedCharacter& out,
                       Error& error) {
  if (!validate::require_object(params, "params", error)) return false;

  alias::DefinitionTable bone_meshes;
  if (!alias::resolve(section(params, "bone_meshes"), "bone_meshes", bone_meshes, error)) return false;
  if (bone_meshes.empty()) {
    return fail(error, ErrorKind::Shape, "'bone_meshes' must not be empty", "bone_meshes");
  }
  alias::DefinitionTable bool_shapes;
  if (!alias::resolve(section(params, "bool_shapes"), "bool_shapes", bool_shapes, error)) return false;

  size_t slot_count = 0;
  const json& slots = section(params, "material_slots");
  if (!slots.is_null()) {
    if (!slots.is_array()) {
      return fail(error, ErrorKind::Shape, "material_slots must be a list", "material_slots");
    }
    slot_count = slots.size();
  }

  ResolvedCharacter result;
  for (const auto& [name, def] : bool_shapes) {
    const std::string path = join_path("bool_shapes", name);
    spec::BoolShapeSpec shape;
    if (!spec::parse_bool_shape(def, path, shape, error)) return false;
    const BoneFrame* frame = nullptr;
    if (shape.bone.has_value()) {
      frame = skeleton.frame(*shape.bone);
      if (!frame) {
        return fail(error, ErrorKind::MissingTarget,
                    "bool_shapes['" + name + "'].bone refers to unknown bone '" + *shape.bone + "'",
                    join_path(path, "bone"));
      }
    }
    result.bool_shapes.emplace(name, resolve_bool_shape(name, shape, frame));
  }

  for (const auto& [bone, def] : bone_meshes) {
    const std::string path = join_path("bone_meshes", bone);
    spec::BoneMeshSpec mesh;
    if (!spec::parse_bone_mesh(def, path, mesh, error, cfg.default_segments)) return false;
    if (!check_mesh_references(mesh, result.bool_shapes, slot_count, path, error)) return false;
    if (crosses_sides(bone, alias::source_key(section(params, "bone_meshes"), bone))) {
      spec::mirror_across_x(mesh);
    }
    if (mesh.part.has_value()) {
      if (mesh.connect_start == spec::ConnectMode::Bridge) {
        add_warning(result.warnings, bone, "connect_start='bridge' is ignored when part is set");
        mesh.connect_start = spec::ConnectMode::Segmented;
      }
      if (mesh.connect_end == spec::ConnectMode::Bridge) {
        add_warning(result.warnings, bone, "connect_end='bridge' is ignored when part is set");
        mesh.connect_end = spec::ConnectMode::Segmented;
      }
    }

    const BoneFrame* frame = skeleton.frame(bone);
    if (!frame) {
      if (cfg.strict_bones) {
        return fail(error, ErrorKind::MissingTarget, "bone_meshes key '" + bone + "' refers to unknown bone", path);
      }
      add_warning(result.warnings, bone, "bone not found in skeleton; mesh skipped");
      continue;
    }

    ResolvedBoneMesh resolved;
    if (!resolve_bone_mesh(bone, *frame, mesh, cfg, resolved, error)) return false;
    resolved.parent = skeleton.find(bone)->parent;
    result.bones.push_back(std::move(resolved));
  }
  link_bridges(result);

  log::info("resolved " + std::to_string(result.bones.size()) + " bone meshes, " +
            std::to_string(result.bool_shapes.size()) + " bool shapes, " +
            std::to_string(result.bridges.size()) + " bridges, " +
            std::to_string(result.warnings.size()) + " warnings");
  out = std::move(result);
  return true;
}

bool resolve_character(const json& params,
                       const GeneratorConfig& cfg,
                       ResolvedCharacter& out,
                       Error& error) {
  if (!validate::require_object(params, "params", error)) return false;
  Skeleton skeleton;
  std::vector<Warning> skeleton_warnings;
  if (!Skeleton::from_params(section(params, "skeleton_preset"), section(params, "skeleton"),
                             cfg.degenerate_epsilon, skeleton, skeleton_warnings, error)) {
    return false;
  }
  if (!resolve_character(params, skeleton, cfg, out, error)) return false;
  out.warnings.insert(out.warnings.begin(), skeleton_warnings.begin(), skeleton_warnings.end());
  return true;
}

} // namespace armgen
