#include "armgen/spec.h"

#include "armgen/validate.h"

namespace armgen::spec {

namespace {

using json = nlohmann::json;
using validate::index_path;
using validate::join_path;

struct NamedPrimitive {
  const char* name;
  PrimitiveKind kind;
};

constexpr NamedPrimitive kPrimitives[] = {
    {"cube", PrimitiveKind::Cube},
    {"sphere", PrimitiveKind::Sphere},
    {"cylinder", PrimitiveKind::Cylinder},
    {"cone", PrimitiveKind::Cone},
    {"torus", PrimitiveKind::Torus},
    {"plane", PrimitiveKind::Plane},
    {"ico_sphere", PrimitiveKind::IcoSphere},
};

const json& field(const json& obj, const char* key) {
  static const json kMissing;
  const auto it = obj.find(key);
  return it == obj.end() ? kMissing : *it;
}

bool read_optional_vec3(const json& obj, const char* key, const std::string& path,
                        std::optional<Vec3>& out, Error& error) {
  if (!obj.contains(key) || field(obj, key).is_null()) {
    out.reset();
    return true;
  }
  Vec3 v{};
  if (!validate::read_vec3(field(obj, key), join_path(path, key), v, error)) return false;
  out = v;
  return true;
}

bool read_vec3_or_zero(const json& obj, const char* key, const std::string& path, Vec3& out, Error& error) {
  std::optional<Vec3> v;
  if (!read_optional_vec3(obj, key, path, v, error)) return false;
  out = v.value_or(Vec3{});
  return true;
}

bool read_positive_vec3(const json& value, const std::string& path, Vec3& out, Error& error) {
  if (!validate::read_vec3(value, path, out, error)) return false;
  if (!validate::require_positive(out.x, index_path(path, 0), error)) return false;
  if (!validate::require_positive(out.y, index_path(path, 1), error)) return false;
  return validate::require_positive(out.z, index_path(path, 2), error);
}

bool read_optional_index(const json& obj, const std::string& path,
                         std::optional<uint32_t>& out, Error& error) {
  if (!obj.contains("material_index") || field(obj, "material_index").is_null()) {
    out.reset();
    return true;
  }
  uint32_t v = 0;
  if (!validate::read_uint(field(obj, "material_index"), join_path(path, "material_index"), v, error)) return false;
  out = v;
  return true;
}

bool parse_bulge_point(const json& value, const std::string& path, BulgePoint& out, Error& error) {
  if (value.is_array()) {
    if (value.size() != 2) {
      return fail(error, ErrorKind::Shape, "bulge point must be [at, scale]", path);
    }
    if (!validate::read_number(value[0], index_path(path, 0), out.position, error)) return false;
    return validate::read_positive(value[1], index_path(path, 1), out.scale, error);
  }
  if (!validate::check_keys(value, {"at", "scale"}, path, error)) return false;
  if (!value.contains("at") || !value.contains("scale")) {
    return fail(error, ErrorKind::Shape, "bulge point requires 'at' and 'scale'", path);
  }
  if (!validate::read_number(field(value, "at"), join_path(path, "at"), out.position, error)) return false;
  return validate::read_positive(field(value, "scale"), join_path(path, "scale"), out.scale, error);
}

bool parse_primitive_attachment(const json& value, const std::string& path,
                                PrimitiveAttachment& out, Error& error) {
  if (!validate::check_keys(value, {"primitive", "dimensions", "offset", "rotation", "material_index"},
                            path, error)) {
    return false;
  }
  if (!value.contains("dimensions")) {
    return fail(error, ErrorKind::Shape, "primitive attachment requires 'dimensions'", path);
  }
  if (!parse_primitive_kind(field(value, "primitive"), join_path(path, "primitive"), out.primitive, error)) return false;
  if (!read_positive_vec3(field(value, "dimensions"), join_path(path, "dimensions"), out.dimensions, error)) return false;
  if (!read_vec3_or_zero(value, "offset", path, out.offset, error)) return false;
  if (!read_optional_vec3(value, "rotation", path, out.rotation, error)) return false;
  return read_optional_index(value, path, out.material_index, error);
}

bool parse_extrude_attachment(const json& value, const std::string& path,
                              ExtrudeAttachment& out, Error& error) {
  if (!validate::check_keys(value, {"profile", "start", "end", "profile_radius", "taper"}, path, error)) {
    return false;
  }
  if (!value.contains("start") || !value.contains("end")) {
    return fail(error, ErrorKind::Shape, "extrude attachment requires 'start' and 'end'", path);
  }
  const json profile = value.contains("profile") ? field(value, "profile") : json();
  if (!parse_profile(profile, join_path(path, "profile"), out.profile, error)) return false;
  if (!validate::read_vec3(field(value, "start"), join_path(path, "start"), out.start, error)) return false;
  if (!validate::read_vec3(field(value, "end"), join_path(path, "end"), out.end, error)) return false;
  if (value.contains("profile_radius") && !field(value, "profile_radius").is_null()) {
    if (!parse_length(field(value, "profile_radius"), join_path(path, "profile_radius"), out.profile_radius, error)) {
      return false;
    }
  }
  if (value.contains("taper") && !field(value, "taper").is_null()) {
    if (!validate::read_positive(field(value, "taper"), join_path(path, "taper"), out.taper, error)) return false;
  }
  return true;
}

bool parse_asset_attachment(const json& value, const std::string& path,
                            AssetAttachment& out, Error& error) {
  if (!validate::check_keys(value, {"asset", "offset", "rotation", "scale"}, path, error)) return false;
  if (!validate::read_string(field(value, "asset"), join_path(path, "asset"), out.asset, error)) return false;
  if (out.asset.find_first_not_of(" \t\r\n") == std::string::npos) {
    return fail(error, ErrorKind::Shape, "asset path must be a non-empty string", join_path(path, "asset"));
  }
  if (!read_vec3_or_zero(value, "offset", path, out.offset, error)) return false;
  if (!read_optional_vec3(value, "rotation", path, out.rotation, error)) return false;
  if (value.contains("scale") && !field(value, "scale").is_null()) {
    if (!validate::read_positive(field(value, "scale"), join_path(path, "scale"), out.scale, error)) return false;
  }
  return true;
}

bool parse_bool_op(const json& value, const std::string& path, BoolOp& out, Error& error) {
  std::string text;
  if (!validate::read_string(value, path, text, error)) return false;
  if (text == "union") {
    out = BoolOp::Union;
  } else if (text == "difference" || text == "subtract") {
    out = BoolOp::Difference;
  } else if (text == "intersect" || text == "intersection") {
    out = BoolOp::Intersect;
  } else {
    return fail(error, ErrorKind::Shape,
                "unknown bool operation '" + text + "'; expected union, difference or intersect", path);
  }
  return true;
}

// A number sets both components; a two-element list sets them separately.
bool read_pair(const json& value, const std::string& path, bool positive, double& a, double& b, Error& error) {
  bool (*read)(const json&, const std::string&, double&, Error&) =
      positive ? &validate::read_positive : &validate::read_number;
  if (!value.is_array()) {
    if (!read(value, path, a, error)) return false;
    b = a;
    return true;
  }
  if (value.size() != 2) {
    return fail(error, ErrorKind::Shape, "expected a number or a [x, y] pair", path);
  }
  if (!read(value[0], index_path(path, 0), a, error)) return false;
  return read(value[1], index_path(path, 1), b, error);
}

bool parse_extrusion_step(const json& value, const std::string& path, ExtrusionStep& out, Error& error) {
  ExtrusionStep step;
  if (value.is_number()) {
    if (!validate::read_positive(value, path, step.extrude, error)) return false;
    out = step;
    return true;
  }
  if (!validate::require_object(value, path, error)) return false;
  if (!validate::check_keys(value, {"extrude", "scale", "translate", "rotate", "tilt", "bulge"}, path, error)) {
    return false;
  }
  if (!value.contains("extrude")) {
    return fail(error, ErrorKind::Shape, "extrusion step requires 'extrude'", path);
  }
  if (!validate::read_positive(field(value, "extrude"), join_path(path, "extrude"), step.extrude, error)) {
    return false;
  }
  if (value.contains("scale")) {
    if (!read_pair(field(value, "scale"), join_path(path, "scale"), true, step.scale_x, step.scale_y, error)) {
      return false;
    }
  }
  if (!read_vec3_or_zero(value, "translate", path, step.translate, error)) return false;
  if (value.contains("rotate")) {
    if (!validate::read_number(field(value, "rotate"), join_path(path, "rotate"), step.rotate, error)) return false;
  }
  if (value.contains("tilt")) {
    if (!read_pair(field(value, "tilt"), join_path(path, "tilt"), false, step.tilt_x, step.tilt_y, error)) {
      return false;
    }
  }
  if (value.contains("bulge")) {
    if (!read_pair(field(value, "bulge"), join_path(path, "bulge"), true, step.bulge_side, step.bulge_front,
                   error)) {
      return false;
    }
  }
  out = step;
  return true;
}

bool parse_connect_mode(const json& value, const std::string& path, ConnectMode& out, Error& error) {
  std::string text;
  if (!validate::read_string(value, path, text, error)) return false;
  if (text == "segmented") {
    out = ConnectMode::Segmented;
  } else if (text == "bridge") {
    out = ConnectMode::Bridge;
  } else {
    return fail(error, ErrorKind::Shape, "unknown connection mode '" + text + "'; expected segmented or bridge",
                path);
  }
  return true;
}

bool parse_part_shape(const json& value, const std::string& path, PartShape& out, Error& error) {
  if (!validate::require_object(value, path, error)) return false;
  if (value.contains("primitive") == value.contains("asset")) {
    return fail(error, ErrorKind::Shape, "part shape must carry exactly one of 'primitive' or 'asset'", path);
  }
  if (value.contains("primitive")) {
    PrimitiveAttachment primitive;
    if (!parse_primitive_attachment(value, path, primitive, error)) return false;
    out = std::move(primitive);
    return true;
  }
  AssetAttachment asset;
  if (!parse_asset_attachment(value, path, asset, error)) return false;
  out = std::move(asset);
  return true;
}

bool parse_part(const json& value, const std::string& path, BonePartSpec& out, Error& error) {
  if (!validate::require_object(value, path, error)) return false;
  if (!validate::check_keys(value, {"base", "operations"}, path, error)) return false;
  if (!value.contains("base")) {
    return fail(error, ErrorKind::Shape, "part requires 'base'", path);
  }
  BonePartSpec part;
  if (!parse_part_shape(field(value, "base"), join_path(path, "base"), part.base, error)) return false;
  if (value.contains("operations")) {
    const std::string list_path = join_path(path, "operations");
    const json& list = field(value, "operations");
    if (!list.is_array()) {
      return fail(error, ErrorKind::Shape, "operations must be a list", list_path);
    }
    for (size_t i = 0; i < list.size(); ++i) {
      const std::string op_path = index_path(list_path, i);
      if (!validate::require_object(list[i], op_path, error)) return false;
      if (!validate::check_keys(list[i], {"op", "target"}, op_path, error)) return false;
      if (!list[i].contains("target")) {
        return fail(error, ErrorKind::Shape, "part operation requires 'target'", op_path);
      }
      PartOperation operation;
      if (list[i].contains("op")) {
        if (!parse_bool_op(field(list[i], "op"), join_path(op_path, "op"), operation.op, error)) return false;
      }
      if (!parse_part_shape(field(list[i], "target"), join_path(op_path, "target"), operation.target, error)) {
        return false;
      }
      part.operations.push_back(std::move(operation));
    }
  }
  out = std::move(part);
  return true;
}

Vec3 mirror_offset(const Vec3& offset) {
  return vec3_hadamard(offset, {-1.0, 1.0, 1.0});
}

void mirror_rotation(std::optional<Vec3>& rotation) {
  if (rotation.has_value()) {
    rotation = vec3_hadamard(*rotation, {1.0, -1.0, -1.0});
  }
}

void mirror_shape(PrimitiveAttachment& shape) {
  shape.offset = mirror_offset(shape.offset);
  mirror_rotation(shape.rotation);
}

void mirror_shape(ExtrudeAttachment& shape) {
  shape.start = mirror_offset(shape.start);
  shape.end = mirror_offset(shape.end);
}

void mirror_shape(AssetAttachment& shape) {
  shape.offset = mirror_offset(shape.offset);
  mirror_rotation(shape.rotation);
}

} // namespace

const char* primitive_kind_name(PrimitiveKind kind) {
  for (const auto& entry : kPrimitives) {
    if (entry.kind == kind) return entry.name;
  }
  return "unknown";
}

bool parse_primitive_kind(const json& value, const std::string& path, PrimitiveKind& out, Error& error) {
  std::string text;
  if (!validate::read_string(value, path, text, error)) return false;
  for (const auto& entry : kPrimitives) {
    if (text == entry.name) {
      out = entry.kind;
      return true;
    }
  }
  return fail(error, ErrorKind::Shape,
              "unknown primitive '" + text + "'; expected cube, sphere, cylinder, cone, torus, plane or ico_sphere",
              path);
}

const char* bool_op_name(BoolOp op) {
  switch (op) {
    case BoolOp::Union:
      return "union";
    case BoolOp::Difference:
      return "difference";
    case BoolOp::Intersect:
      return "intersect";
  }
  return "unknown";
}

bool parse_attachment(const json& value, const std::string& path, AttachmentSpec& out, Error& error) {
  if (!validate::require_object(value, path, error)) return false;
  const int tags = static_cast<int>(value.contains("primitive")) +
                   static_cast<int>(value.contains("extrude")) +
                   static_cast<int>(value.contains("asset"));
  if (tags != 1) {
    return fail(error, ErrorKind::Shape,
                "attachment must carry exactly one of 'primitive', 'extrude' or 'asset'", path);
  }

  if (value.contains("primitive")) {
    PrimitiveAttachment primitive;
    if (!parse_primitive_attachment(value, path, primitive, error)) return false;
    out = std::move(primitive);
    return true;
  }
  if (value.contains("extrude")) {
    if (value.size() != 1) {
      return fail(error, ErrorKind::Shape, "extrude attachment must not carry other fields", path);
    }
    const std::string extrude_path = join_path(path, "extrude");
    if (!validate::require_object(field(value, "extrude"), extrude_path, error)) return false;
    ExtrudeAttachment extrude;
    if (!parse_extrude_attachment(field(value, "extrude"), extrude_path, extrude, error)) return false;
    out = std::move(extrude);
    return true;
  }
  AssetAttachment asset;
  if (!parse_asset_attachment(value, path, asset, error)) return false;
  out = std::move(asset);
  return true;
}

bool parse_modifier(const json& value, const std::string& path, ModifierSpec& out, Error& error) {
  if (!validate::require_object(value, path, error)) return false;
  if (value.size() != 1) {
    return fail(error, ErrorKind::Shape, "modifier must carry exactly one of 'bevel', 'subdivide' or 'bool'", path);
  }

  if (value.contains("bevel")) {
    const std::string p = join_path(path, "bevel");
    const json& body = field(value, "bevel");
    if (!validate::check_keys(body, {"width", "segments"}, p, error)) return false;
    BevelModifier bevel;
    if (!validate::read_positive(field(body, "width"), join_path(p, "width"), bevel.width, error)) return false;
    if (body.contains("segments")) {
      if (!validate::read_uint(field(body, "segments"), join_path(p, "segments"), bevel.segments, error)) return false;
      if (bevel.segments < 1) {
        return fail(error, ErrorKind::Range, "bevel segments must be >= 1", join_path(p, "segments"));
      }
    }
    out = bevel;
    return true;
  }
  if (value.contains("subdivide")) {
    const std::string p = join_path(path, "subdivide");
    const json& body = field(value, "subdivide");
    if (!validate::check_keys(body, {"cuts"}, p, error)) return false;
    SubdivideModifier subdivide;
    if (!validate::read_uint(field(body, "cuts"), join_path(p, "cuts"), subdivide.cuts, error)) return false;
    if (subdivide.cuts < 1) {
      return fail(error, ErrorKind::Range, "subdivide cuts must be >= 1", join_path(p, "cuts"));
    }
    out = subdivide;
    return true;
  }
  if (value.contains("bool")) {
    const std::string p = join_path(path, "bool");
    const json& body = field(value, "bool");
    if (!validate::check_keys(body, {"operation", "target"}, p, error)) return false;
    BoolModifier modifier;
    if (body.contains("operation")) {
      if (!parse_bool_op(field(body, "operation"), join_path(p, "operation"), modifier.operation, error)) return false;
    }
    if (!validate::read_string(field(body, "target"), join_path(p, "target"), modifier.target, error)) return false;
    out = std::move(modifier);
    return true;
  }
  return fail(error, ErrorKind::Shape, "modifier must carry exactly one of 'bevel', 'subdivide' or 'bool'", path);
}

bool parse_bone_mesh(const json& value,
                     const std::string& path,
                     BoneMeshSpec& out,
                     Error& error,
                     uint32_t default_segments) {
  if (!validate::check_keys(value,
                            {"profile", "profile_radius", "cap_start", "cap_end", "taper", "bulge", "twist",
                             "translate", "rotate", "attachments", "modifiers", "material_index",
                             "extrusion_steps", "connect_start", "connect_end", "part"},
                            path, error)) {
    return false;
  }

  BoneMeshSpec mesh;
  const json profile = value.contains("profile") ? field(value, "profile") : json();
  if (!parse_profile(profile, join_path(path, "profile"), mesh.profile, error, default_segments)) return false;

  if (value.contains("profile_radius") && !field(value, "profile_radius").is_null()) {
    if (!parse_length(field(value, "profile_radius"), join_path(path, "profile_radius"), mesh.profile_radius, error)) {
      return false;
    }
  }
  if (value.contains("cap_start")) {
    if (!validate::read_bool(field(value, "cap_start"), join_path(path, "cap_start"), mesh.cap_start, error)) return false;
  }
  if (value.contains("cap_end")) {
    if (!validate::read_bool(field(value, "cap_end"), join_path(path, "cap_end"), mesh.cap_end, error)) return false;
  }
  if (value.contains("taper")) {
    if (!validate::read_positive(field(value, "taper"), join_path(path, "taper"), mesh.taper, error)) return false;
  }
  if (value.contains("twist")) {
    if (!validate::read_number(field(value, "twist"), join_path(path, "twist"), mesh.twist, error)) return false;
  }
  if (value.contains("bulge")) {
    const std::string bulge_path = join_path(path, "bulge");
    if (!field(value, "bulge").is_array()) {
      return fail(error, ErrorKind::Shape, "bulge must be a list of control points", bulge_path);
    }
    for (size_t i = 0; i < field(value, "bulge").size(); ++i) {
      BulgePoint point;
      if (!parse_bulge_point(field(value, "bulge")[i], index_path(bulge_path, i), point, error)) return false;
      mesh.bulge.push_back(point);
    }
  }
  if (!read_vec3_or_zero(value, "translate", path, mesh.translate, error)) return false;
  if (!read_optional_vec3(value, "rotate", path, mesh.rotate, error)) return false;

  if (value.contains("attachments")) {
    const std::string list_path = join_path(path, "attachments");
    if (!field(value, "attachments").is_array()) {
      return fail(error, ErrorKind::Shape, "attachments must be a list", list_path);
    }
    for (size_t i = 0; i < field(value, "attachments").size(); ++i) {
      AttachmentSpec attachment;
      if (!parse_attachment(field(value, "attachments")[i], index_path(list_path, i), attachment, error)) return false;
      mesh.attachments.push_back(std::move(attachment));
    }
  }
  if (value.contains("modifiers")) {
    const std::string list_path = join_path(path, "modifiers");
    if (!field(value, "modifiers").is_array()) {
      return fail(error, ErrorKind::Shape, "modifiers must be a list", list_path);
    }
    for (size_t i = 0; i < field(value, "modifiers").size(); ++i) {
      ModifierSpec modifier;
      if (!parse_modifier(field(value, "modifiers")[i], index_path(list_path, i), modifier, error)) return false;
      mesh.modifiers.push_back(std::move(modifier));
    }
  }
  if (!read_optional_index(value, path, mesh.material_index, error)) return false;

  if (value.contains("extrusion_steps")) {
    const std::string list_path = join_path(path, "extrusion_steps");
    const json& list = field(value, "extrusion_steps");
    if (!list.is_array()) {
      return fail(error, ErrorKind::Shape, "extrusion_steps must be a list", list_path);
    }
    for (size_t i = 0; i < list.size(); ++i) {
      ExtrusionStep step;
      if (!parse_extrusion_step(list[i], index_path(list_path, i), step, error)) return false;
      mesh.extrusion_steps.push_back(step);
    }
  }
  if (value.contains("connect_start")) {
    if (!parse_connect_mode(field(value, "connect_start"), join_path(path, "connect_start"), mesh.connect_start,
                            error)) {
      return false;
    }
  }
  if (value.contains("connect_end")) {
    if (!parse_connect_mode(field(value, "connect_end"), join_path(path, "connect_end"), mesh.connect_end, error)) {
      return false;
    }
  }
  if (value.contains("part") && !field(value, "part").is_null()) {
    BonePartSpec part;
    if (!parse_part(field(value, "part"), join_path(path, "part"), part, error)) return false;
    if (!mesh.extrusion_steps.empty()) {
      return fail(error, ErrorKind::Shape, "part and extrusion_steps are mutually exclusive; choose one", path);
    }
    if (value.contains("taper") || value.contains("bulge") || value.contains("twist")) {
      return fail(error, ErrorKind::Shape, "part replaces the extruded segment; taper, bulge and twist do not apply",
                  path);
    }
    mesh.part = std::move(part);
  }

  out = std::move(mesh);
  return true;
}

void mirror_across_x(BoneMeshSpec& mesh) {
  mesh.translate = mirror_offset(mesh.translate);
  mirror_rotation(mesh.rotate);
  mesh.twist = -mesh.twist;
  for (auto& attachment : mesh.attachments) {
    std::visit([](auto& shape) { mirror_shape(shape); }, attachment);
  }
  for (auto& step : mesh.extrusion_steps) {
    step.translate = mirror_offset(step.translate);
    step.rotate = -step.rotate;
    step.tilt_y = -step.tilt_y;
  }
  if (mesh.part.has_value()) {
    std::visit([](auto& shape) { mirror_shape(shape); }, mesh.part->base);
    for (auto& operation : mesh.part->operations) {
      std::visit([](auto& shape) { mirror_shape(shape); }, operation.target);
    }
  }
}

bool parse_bool_shape(const json& value, const std::string& path, BoolShapeSpec& out, Error& error) {
  if (!validate::check_keys(value, {"primitive", "dimensions", "position", "rotation", "bone"}, path, error)) {
    return false;
  }
  if (!value.contains("dimensions") || !value.contains("position")) {
    return fail(error, ErrorKind::Shape, "bool shape requires 'dimensions' and 'position'", path);
  }
  BoolShapeSpec shape;
  if (!parse_primitive_kind(field(value, "primitive"), join_path(path, "primitive"), shape.primitive, error)) return false;
  if (!read_positive_vec3(field(value, "dimensions"), join_path(path, "dimensions"), shape.dimensions, error)) return false;
  if (!validate::read_vec3(field(value, "position"), join_path(path, "position"), shape.position, error)) return false;
  if (!read_optional_vec3(value, "rotation", path, shape.rotation, error)) return false;
  if (value.contains("bone") && !field(value, "bone").is_null()) {
    std::string bone;
    if (!validate::read_string(field(value, "bone"), join_path(path, "bone"), bone, error)) return false;
    shape.bone = bone;
  }
  out = std::move(shape);
  return true;
}

} // namespace armgen::spec
