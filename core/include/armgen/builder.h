#pragma once

#include "armgen/character.h"
#include "armgen/config.h"
#include "armgen/error.h"
#include "armgen/mesh_kernel.h"
#include "armgen/rename_plan.h"

#include <string>
#include <vector>

namespace armgen {

struct BuiltBone {
  std::string bone;
  MeshHandle mesh = kInvalidMesh;
};

struct BuildResult {
  MeshHandle mesh = kInvalidMesh;  // joined character
  std::vector<BuiltBone> bones;
};

// Replays `character` through `kernel` bone by bone: segment (or part base
// and its booleans), deformation, caps, attachments, modifiers in order, skin
// binding. Then issues the bridges and joins the remaining meshes. Stops at
// the first kernel failure. `bones` holds each bone's mesh before bridging.
bool build_character(IMeshKernel& kernel,
                     const ResolvedCharacter& character,
                     const GeneratorConfig& cfg,
                     BuildResult& out,
                     Error& error);

// Plans merges + renames for `mapping` over the groups currently on `mesh`
// and issues them through `kernel`. `applied` receives the executed plan.
bool apply_vertex_group_mapping(IMeshKernel& kernel,
                                MeshHandle mesh,
                                const groups::NameMapping& mapping,
                                const groups::NameSet& existing,
                                const GeneratorConfig& cfg,
                                groups::GroupPlan& applied,
                                Error& error);

} // namespace armgen
