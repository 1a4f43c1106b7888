#pragma once

#include "armgen/deform.h"
#include "armgen/error.h"
#include "armgen/math.h"
#include "armgen/profile.h"
#include "armgen/spec.h"

#include <cstdint>
#include <string>
#include <vector>

namespace armgen {

using MeshHandle = uint32_t;
constexpr MeshHandle kInvalidMesh = 0;

// What the kernel should instantiate before `world` is applied.
//  - Profile: a prism of `profile` spanning local z in [0, 1] with unit
//    cross-section radius, capped at both ends.
//  - Primitive: a unit-sized primitive centered on the origin.
//  - Asset: the external file at `asset_path`, in its own units.
struct PrimitiveDesc {
  enum class Source : uint8_t {
    Profile = 0,
    Primitive = 1,
    Asset = 2
  };

  Source source = Source::Profile;
  Profile profile{};
  spec::PrimitiveKind primitive = spec::PrimitiveKind::Cube;
  std::string asset_path;
};

// Host mesh kernel. Calls are issued in order, never concurrently, and every
// failure is reported through `error` (kind Kernel) instead of being dropped.
class IMeshKernel {
 public:
  virtual ~IMeshKernel() = default;

  virtual bool create_primitive(const PrimitiveDesc& desc, const Mat4& world, MeshHandle& out, Error& error) = 0;
  virtual bool apply_boolean(MeshHandle target, MeshHandle operand, spec::BoolOp op, MeshHandle& out,
                             Error& error) = 0;
  virtual bool apply_bevel(MeshHandle target, double width, uint32_t segments, MeshHandle& out, Error& error) = 0;
  virtual bool apply_subdivide(MeshHandle target, uint32_t cuts, MeshHandle& out, Error& error) = 0;
  virtual bool remove_caps(MeshHandle target, bool keep_start, bool keep_end, MeshHandle& out, Error& error) = 0;
  // `field` is sampled with each vertex's normalized height along local Z.
  // The cross-section is scaled, twisted, tilted, then offset, in that order.
  virtual bool deform_vertices(MeshHandle target, const DeformationField& field, MeshHandle& out,
                               Error& error) = 0;
  virtual bool join(const std::vector<MeshHandle>& parts, MeshHandle& out, Error& error) = 0;
  // Connects the open end loop of `parent` to the open start loop of `child`
  // with a band of faces; the result replaces both meshes.
  virtual bool bridge(MeshHandle parent, MeshHandle child, MeshHandle& out, Error& error) = 0;
  virtual bool bind_to_skeleton(MeshHandle mesh, const std::string& bone_name, double weight, Error& error) = 0;
  virtual bool rename_vertex_group(MeshHandle mesh, const std::string& src, const std::string& dst,
                                   Error& error) = 0;
  virtual bool merge_vertex_group(MeshHandle mesh, const std::string& src, const std::string& dst,
                                  Error& error) = 0;
};

} // namespace armgen
