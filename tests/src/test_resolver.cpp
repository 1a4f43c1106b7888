#include "armgen/alias.h"
#include "armgen/config.h"
#include "armgen/deform.h"
#include "armgen/error.h"
#include "armgen/frame.h"
#include "armgen/length.h"
#include "armgen/log.h"
#include "armgen/math.h"
#include "armgen/profile.h"
#include "armgen/rename_plan.h"
#include "armgen/skeleton.h"
#include "armgen/skeleton_presets.h"
#include "armgen/spec.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

bool near_vec(const armgen::Vec3& a, const armgen::Vec3& b, double eps = 1e-9) {
  return near(a.x, b.x, eps) && near(a.y, b.y, eps) && near(a.z, b.z, eps);
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

bool write_text(const fs::path& path, const std::string& contents) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  if (!out) return false;
  out << contents;
  return true;
}

} // namespace

int main() {
  armgen::log::init();

  int failures = 0;

  // Test: alias resolution leaves no mirror records and copies deeply.
  {
    const json table = {
        {"arm_L", {{"profile", "square"}, {"bulge", json::array({json::array({0.0, 1.0})})}}},
        {"arm_R", {{"mirror", "arm_L"}}},
        {"arm_R2", {{"mirror", "arm_R"}}},
    };
    armgen::alias::DefinitionTable out;
    armgen::Error error;
    if (!armgen::alias::resolve(table, "bone_meshes", out, error)) {
      std::cerr << "alias resolve failed: " << error.describe() << "\n";
      ++failures;
    } else {
      for (const auto& [key, value] : out) {
        if (armgen::alias::is_alias(value) || value.contains("mirror")) {
          std::cerr << "alias residue left on " << key << "\n";
          ++failures;
        }
      }
      if (out.size() != 3 || out["arm_R2"].value("profile", "") != "square") {
        std::cerr << "alias chain not followed\n";
        ++failures;
      }
      out["arm_R"]["bulge"].push_back(json::array({1.0, 2.0}));
      if (out["arm_L"]["bulge"].size() != 1 || out["arm_R2"]["bulge"].size() != 1) {
        std::cerr << "alias entries share storage\n";
        ++failures;
      }
    }
  }

  // Test: alias cycle, missing target and mixed record.
  {
    const json cycle = {{"a", {{"mirror", "b"}}}, {"b", {{"mirror", "a"}}}};
    armgen::alias::DefinitionTable out;
    armgen::Error error;
    if (armgen::alias::resolve(cycle, "bone_meshes", out, error) || error.kind != armgen::ErrorKind::Cycle ||
        !(contains(error.message, "'a'") || contains(error.message, "'b'"))) {
      std::cerr << "alias cycle not reported: " << error.describe() << "\n";
      ++failures;
    }

    const json self = {{"a", {{"mirror", "a"}}}};
    error = {};
    if (armgen::alias::resolve(self, "bone_meshes", out, error) || error.kind != armgen::ErrorKind::Cycle) {
      std::cerr << "self alias not reported as cycle\n";
      ++failures;
    }

    const json missing = {{"a", {{"mirror", "ghost"}}}};
    error = {};
    if (armgen::alias::resolve(missing, "bone_meshes", out, error) ||
        error.kind != armgen::ErrorKind::MissingTarget || !contains(error.message, "ghost")) {
      std::cerr << "alias missing target not reported\n";
      ++failures;
    }

    const json mixed = {{"a", {{"profile", "square"}}}, {"b", {{"mirror", "a"}, {"taper", 0.5}}}};
    error = {};
    if (armgen::alias::resolve(mixed, "bone_meshes", out, error) || error.kind != armgen::ErrorKind::Shape) {
      std::cerr << "alias with extra keys accepted\n";
      ++failures;
    }

    error = {};
    if (!armgen::alias::resolve(json(), "bool_shapes", out, error) || !out.empty()) {
      std::cerr << "null alias table should resolve to empty\n";
      ++failures;
    }
  }

  // Test: bone-relative lengths.
  {
    armgen::ResolvedLength out;
    armgen::Error error;
    if (!armgen::resolve_length(json(0.4), 2.5, "len", out, error) || !near(out.x, 1.0) || out.paired) {
      std::cerr << "resolve_length scalar wrong\n";
      ++failures;
    }
    if (!armgen::resolve_length(json::array({0.2, 0.6}), 10.0, "len", out, error) || !out.paired ||
        !near(out.x, 2.0) || !near(out.y, 6.0)) {
      std::cerr << "resolve_length pair wrong\n";
      ++failures;
    }
    if (!armgen::resolve_length(json{{"absolute", 1.23}}, 999.0, "len", out, error) || !near(out.x, 1.23)) {
      std::cerr << "resolve_length absolute wrong\n";
      ++failures;
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    struct RangeCase {
      json value;
      double bone_length;
      const char* label;
    };
    const RangeCase range_cases[] = {
        {json(0.0), 1.0, "zero"},
        {json(-0.5), 1.0, "negative"},
        {json(nan), 1.0, "nan value"},
        {json(inf), 1.0, "inf value"},
        {json(0.5), nan, "nan bone length"},
        {json(0.5), 0.0, "zero bone length"},
        {json(0.5), -2.0, "negative bone length"},
        {json(1e308), 1e10, "overflow"},
        {json::array({0.2, -0.1}), 1.0, "negative pair element"},
        {json{{"absolute", 0.0}}, 1.0, "zero absolute"},
    };
    for (const auto& c : range_cases) {
      error = {};
      if (armgen::resolve_length(c.value, c.bone_length, "len", out, error) ||
          error.kind != armgen::ErrorKind::Range) {
        std::cerr << "resolve_length should reject (range): " << c.label << "\n";
        ++failures;
      }
    }

    const json shape_cases[] = {
        json(true),
        json::array({0.1, 0.2, 0.3}),
        json::array({0.1}),
        json::array({true, 0.2}),
        json{{"absolute", 1.0}, {"relative", 0.5}},
        json{{"relative", 0.5}},
        json("0.5"),
    };
    for (const auto& value : shape_cases) {
      error = {};
      if (armgen::resolve_length(value, 1.0, "len", out, error) || error.kind != armgen::ErrorKind::Shape) {
        std::cerr << "resolve_length should reject (shape): " << value.dump() << "\n";
        ++failures;
      }
    }
  }

  // Test: profile grammar.
  {
    armgen::Profile profile;
    armgen::Error error;
    if (!armgen::parse_profile(std::nullopt, profile, error) || profile.kind != armgen::ProfileKind::Circle ||
        profile.segments != 12) {
      std::cerr << "default profile wrong\n";
      ++failures;
    }
    if (!armgen::parse_profile(std::string("hexagon(6)"), profile, error) ||
        profile.kind != armgen::ProfileKind::Circle || profile.segments != 6) {
      std::cerr << "hexagon profile wrong\n";
      ++failures;
    }
    if (!armgen::parse_profile(std::string("square"), profile, error) ||
        profile.kind != armgen::ProfileKind::Square || profile.segments != 4) {
      std::cerr << "square profile wrong\n";
      ++failures;
    }
    if (!armgen::parse_profile(std::string(" circle( 8 ) "), profile, error) || profile.segments != 8) {
      std::cerr << "padded circle profile wrong\n";
      ++failures;
    }
    error = {};
    if (armgen::parse_profile(std::string("circle(2)"), profile, error) ||
        error.kind != armgen::ErrorKind::Range) {
      std::cerr << "circle(2) should be rejected\n";
      ++failures;
    }
    error = {};
    if (armgen::parse_profile(std::string("triangle"), profile, error) || !contains(error.message, "circle(N)")) {
      std::cerr << "unknown profile message missing grammar: " << error.message << "\n";
      ++failures;
    }
    error = {};
    if (armgen::parse_profile(json(6), "profile", profile, error) || error.kind != armgen::ErrorKind::Shape ||
        !contains(error.message, "circle(N)")) {
      std::cerr << "non-string profile should be a shape error\n";
      ++failures;
    }
    error = {};
    if (!armgen::parse_profile(json(), "profile", profile, error, 24) || profile.segments != 24) {
      std::cerr << "configured default segments ignored\n";
      ++failures;
    }
  }

  // Test: deformation field.
  {
    armgen::DeformationField field;
    armgen::Error error;
    if (!armgen::DeformationField::build(1.0, {{1.0, 1.0}, {0.0, 1.0}, {0.5, 2.0}}, 0.0, "mesh", field, error)) {
      std::cerr << "deformation field build failed: " << error.describe() << "\n";
      ++failures;
    } else {
      if (!near(field.evaluate(0.25).radial_scale, 1.5) || !near(field.evaluate(0.0).radial_scale, 1.0) ||
          !near(field.evaluate(1.0).radial_scale, 1.0) || !near(field.evaluate(0.5).radial_scale, 2.0)) {
        std::cerr << "bulge interpolation wrong\n";
        ++failures;
      }
    }

    if (!armgen::DeformationField::build(0.5, {{-1.0, 3.0}, {0.5, 1.0}}, 90.0, "mesh", field, error)) {
      std::cerr << "taper/twist field build failed\n";
      ++failures;
    } else {
      if (!near(field.bulge().front().position, 0.0) || !near(field.bulge_scale(0.0), 3.0) ||
          !near(field.bulge_scale(1.0), 1.0)) {
        std::cerr << "bulge clamping wrong\n";
        ++failures;
      }
      if (!near(field.taper_scale(1.0), 0.5) || !near(field.twist_radians(1.0), armgen::kPi / 2.0) ||
          !near(field.twist_radians(0.5), armgen::kPi / 4.0)) {
        std::cerr << "taper/twist ramp wrong\n";
        ++failures;
      }
    }

    armgen::DeformationField empty;
    if (!armgen::DeformationField::build(1.0, {}, 0.0, "mesh", empty, error) || !empty.is_identity() ||
        !near(empty.bulge_scale(0.7), 1.0)) {
      std::cerr << "empty field should be identity\n";
      ++failures;
    }

    error = {};
    if (armgen::DeformationField::build(0.0, {}, 0.0, "mesh", field, error) ||
        error.kind != armgen::ErrorKind::Range) {
      std::cerr << "zero taper accepted\n";
      ++failures;
    }
    error = {};
    if (armgen::DeformationField::build(1.0, {{0.5, -1.0}}, 0.0, "mesh", field, error) ||
        error.kind != armgen::ErrorKind::Range) {
      std::cerr << "negative bulge scale accepted\n";
      ++failures;
    }
  }

  // Test: rings shape the field between extrusion heights.
  {
    std::vector<armgen::FieldRing> rings(3);
    rings[1].position = 0.5;
    rings[2].position = 1.0;
    rings[2].scale_x = 0.5;
    rings[2].scale_y = 0.25;
    rings[2].twist_degrees = 90.0;
    rings[2].offset_x = 0.2;
    rings[2].tilt_y_degrees = 30.0;
    armgen::DeformationField field;
    armgen::Error error;
    if (!armgen::DeformationField::build(1.0, {}, 0.0, rings, "mesh", field, error)) {
      std::cerr << "ring field build failed: " << error.describe() << "\n";
      ++failures;
    } else {
      const armgen::FieldSample top = field.evaluate(1.0);
      const armgen::FieldSample mid = field.evaluate(0.75);
      if (field.is_identity() || !near(top.scale_x, 0.5) || !near(top.scale_y, 0.25) ||
          !near(top.twist_radians, armgen::kPi / 2.0) || !near(top.offset_x, 0.2) ||
          !near(top.tilt_y_radians, armgen::kPi / 6.0)) {
        std::cerr << "ring field top wrong\n";
        ++failures;
      }
      if (!near(mid.scale_x, 0.75) || !near(mid.offset_x, 0.1) || !near(field.evaluate(0.25).scale_x, 1.0) ||
          !near(mid.radial_scale, 1.0)) {
        std::cerr << "ring interpolation wrong\n";
        ++failures;
      }
    }

    rings[1].position = 1.0;
    error = {};
    if (armgen::DeformationField::build(1.0, {}, 0.0, rings, "mesh", field, error) ||
        error.kind != armgen::ErrorKind::Range) {
      std::cerr << "rings out of order accepted\n";
      ++failures;
    }
  }

  // Test: bone frames and placement.
  {
    armgen::BoneFrame frame;
    armgen::Error error;
    if (!armgen::compute_bone_frame("spine", {0.0, 0.0, 0.0}, {0.0, 0.0, 2.0}, armgen::kDegenerateEpsilon, frame,
                                    error)) {
      std::cerr << "frame along +Z failed\n";
      ++failures;
    } else {
      if (!near(frame.length, 2.0) ||
          !near_vec(armgen::bone_relative_point(frame, {0.0, 0.0, 0.5}), {0.0, 0.0, 1.0})) {
        std::cerr << "frame along +Z wrong\n";
        ++failures;
      }
      const armgen::Quat rot = armgen::bone_relative_rotation(frame, armgen::Vec3{0.0, 0.0, 90.0});
      if (!near_vec(armgen::quat_rotate(rot, {1.0, 0.0, 0.0}), {0.0, 1.0, 0.0}, 1e-9)) {
        std::cerr << "rotation override wrong\n";
        ++failures;
      }
    }

    if (!armgen::compute_bone_frame("arm_L", {1.0, 0.0, 0.0}, {3.0, 0.0, 0.0}, armgen::kDegenerateEpsilon, frame,
                                    error)) {
      std::cerr << "frame along +X failed\n";
      ++failures;
    } else {
      if (!near_vec(armgen::bone_relative_point(frame, {0.0, 0.0, 1.0}), {3.0, 0.0, 0.0}) ||
          !near_vec(armgen::bone_relative_point(frame, {0.0, 0.5, 0.0}), {1.0, 1.0, 0.0})) {
        std::cerr << "frame along +X wrong\n";
        ++failures;
      }
      const armgen::Transform placed = armgen::place_relative(frame, {0.0, 0.0, 0.5}, std::nullopt, {1.0, 1.0, 1.0});
      if (!near_vec(placed.position, {2.0, 0.0, 0.0})) {
        std::cerr << "place_relative position wrong\n";
        ++failures;
      }
    }

    if (!armgen::compute_bone_frame("neck", {0.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, armgen::kDegenerateEpsilon, frame,
                                    error) ||
        !near_vec(armgen::quat_rotate(frame.orientation, {0.0, 0.0, 1.0}), {0.0, 1.0, 0.0})) {
      std::cerr << "frame along +Y wrong\n";
      ++failures;
    }

    error = {};
    if (armgen::compute_bone_frame("tiny", {1.0, 1.0, 1.0}, {1.0, 1.0, 1.0 + 1e-9}, armgen::kDegenerateEpsilon,
                                   frame, error) ||
        error.kind != armgen::ErrorKind::Range || !contains(error.message, "degenerate")) {
      std::cerr << "degenerate bone accepted\n";
      ++failures;
    }

    const armgen::Transform absolute = armgen::place_absolute({1.0, 2.0, 3.0}, std::nullopt, {0.5, 0.5, 0.5});
    if (!near_vec(absolute.position, {1.0, 2.0, 3.0}) || !near(absolute.rotation.w, 1.0)) {
      std::cerr << "place_absolute wrong\n";
      ++failures;
    }
  }

  // Test: swap rename never collides.
  {
    const armgen::groups::NameSet existing{"A", "B"};
    armgen::groups::RenamePlan plan;
    armgen::Error error;
    if (!armgen::groups::plan_renames({{"A", "B"}, {"B", "A"}}, existing, armgen::groups::kDefaultTempPrefix, plan,
                                      error)) {
      std::cerr << "swap plan failed: " << error.describe() << "\n";
      ++failures;
    } else {
      armgen::groups::NameSet names = existing;
      if (!armgen::groups::apply_rename_plan(names, plan, error) || names != existing) {
        std::cerr << "swap plan collided or changed the name set\n";
        ++failures;
      }
    }
  }

  // Test: chains, temp-name suffixes and no-ops.
  {
    armgen::groups::RenamePlan plan;
    armgen::Error error;
    armgen::groups::NameSet names{"A", "B"};
    if (!armgen::groups::plan_renames({{"A", "B"}, {"B", "C"}, {"Z", "Z"}}, names, "__armgen_tmp_", plan, error) ||
        !armgen::groups::apply_rename_plan(names, plan, error) ||
        names != armgen::groups::NameSet{"B", "C"}) {
      std::cerr << "chain plan wrong\n";
      ++failures;
    }

    const armgen::groups::NameSet crowded{"A", "B", "__armgen_tmp_A"};
    if (!armgen::groups::plan_renames({{"A", "B"}, {"B", "A"}}, crowded, "__armgen_tmp_", plan, error)) {
      std::cerr << "crowded swap failed\n";
      ++failures;
    } else {
      bool suffixed = false;
      for (const auto& step : plan) {
        if (step.dst == "__armgen_tmp_A_1") suffixed = true;
      }
      armgen::groups::NameSet after = crowded;
      if (!suffixed || !armgen::groups::apply_rename_plan(after, plan, error) || after != crowded) {
        std::cerr << "temp name not disambiguated\n";
        ++failures;
      }
    }

    if (!armgen::groups::plan_renames({{"A", "A"}}, {"A"}, "__armgen_tmp_", plan, error) || !plan.empty()) {
      std::cerr << "no-op mapping produced steps\n";
      ++failures;
    }
  }

  // Test: rename plan rejections.
  {
    armgen::groups::RenamePlan plan;
    armgen::Error error;
    if (armgen::groups::plan_renames({{"A", "X"}, {"B", "X"}}, {"A", "B"}, "__armgen_tmp_", plan, error) ||
        error.kind != armgen::ErrorKind::Collision || !contains(error.message, "X")) {
      std::cerr << "many-to-one mapping accepted: " << error.describe() << "\n";
      ++failures;
    }
    error = {};
    if (armgen::groups::plan_renames({{"A", "B"}}, {"A", "B"}, "__armgen_tmp_", plan, error) ||
        error.kind != armgen::ErrorKind::Conflict || !contains(error.message, "B")) {
      std::cerr << "existing destination accepted\n";
      ++failures;
    }
    error = {};
    if (armgen::groups::plan_renames({{"Q", "R"}}, {"A"}, "__armgen_tmp_", plan, error) ||
        error.kind != armgen::ErrorKind::MissingTarget) {
      std::cerr << "missing source accepted\n";
      ++failures;
    }

    armgen::groups::NameSet names{"A"};
    error = {};
    if (armgen::groups::apply_rename_plan(names, {{"A", "B"}, {"C", "D"}}, error) ||
        error.kind != armgen::ErrorKind::MissingTarget) {
      std::cerr << "apply_rename_plan ran an unsafe step\n";
      ++failures;
    }
  }

  // Test: group mapping splits merges from renames.
  {
    armgen::groups::GroupPlan plan;
    armgen::Error error;
    const armgen::groups::NameSet existing{"thigh.L", "thigh_twist.L", "shin.L", "foot.L"};
    const armgen::groups::NameMapping mapping{
        {"thigh.L", "upper_leg_l"}, {"thigh_twist.L", "upper_leg_l"}, {"shin.L", "lower_leg_l"}};
    if (!armgen::groups::plan_group_mapping(mapping, existing, "__armgen_tmp_", plan, error)) {
      std::cerr << "group mapping failed: " << error.describe() << "\n";
      ++failures;
    } else {
      if (plan.merges.size() != 2 || plan.renames.size() != 1 || plan.renames.front().src != "shin.L") {
        std::cerr << "group mapping split wrong\n";
        ++failures;
      }
    }
  }

  // Test: mirrored bone names and skeleton mirroring.
  {
    if (armgen::mirror_bone_name("arm_L") != "arm_R" || armgen::mirror_bone_name("leg_r") != "leg_l" ||
        armgen::mirror_bone_name("finger_l_01") != "finger_r_01" || armgen::mirror_bone_name("spine") != "spine") {
      std::cerr << "mirror_bone_name wrong\n";
      ++failures;
    }

    const json bones = json::array({
        {{"bone", "spine"}, {"head", {0.0, 0.0, 0.0}}, {"tail", {0.0, 0.0, 1.0}}},
        {{"bone", "shoulder_L"}, {"head", {0.1, 0.0, 1.0}}, {"tail", {0.3, 0.0, 1.0}}, {"parent", "spine"}},
        {{"bone", "arm_L"}, {"head", {0.3, 0.0, 1.0}}, {"tail", {0.8, 0.0, 1.0}}, {"parent", "shoulder_L"}},
        {{"bone", "shoulder_R"}, {"mirror", "shoulder_L"}},
        {{"bone", "arm_R"}, {"mirror", "arm_L"}},
        {{"bone", "tail_R"}, {"mirror", "tail_L"}},
        {{"bone", "head"}, {"head", {0.0, 0.0, 1.0}}, {"tail", {0.0, 0.0, 1.3}}, {"parent", "neck"}},
    });
    armgen::Skeleton skeleton;
    std::vector<armgen::Warning> warnings;
    armgen::Error error;
    if (!armgen::Skeleton::from_json(bones, armgen::kDegenerateEpsilon, skeleton, warnings, error)) {
      std::cerr << "skeleton build failed: " << error.describe() << "\n";
      ++failures;
    } else {
      const armgen::Bone* arm_r = skeleton.find("arm_R");
      if (!arm_r || !near_vec(arm_r->head, {-0.3, 0.0, 1.0}) || !near_vec(arm_r->tail, {-0.8, 0.0, 1.0}) ||
          arm_r->parent != "shoulder_R") {
        std::cerr << "mirrored bone wrong\n";
        ++failures;
      }
      if (skeleton.contains("tail_R") || warnings.size() != 2) {
        std::cerr << "skeleton warnings wrong: " << warnings.size() << "\n";
        ++failures;
      }
      const armgen::Bone* head = skeleton.find("head");
      if (!head || !head->parent.empty()) {
        std::cerr << "missing parent not cleared\n";
        ++failures;
      }
    }

    error = {};
    const json duplicate = json::array({{{"bone", "a"}, {"tail", {0.0, 0.0, 1.0}}},
                                        {{"bone", "a"}, {"tail", {0.0, 0.0, 2.0}}}});
    if (armgen::Skeleton::from_json(duplicate, armgen::kDegenerateEpsilon, skeleton, warnings, error) ||
        error.kind != armgen::ErrorKind::Shape) {
      std::cerr << "duplicate bone accepted\n";
      ++failures;
    }
  }

  // Test: presets, overrides and the default skeleton.
  {
    armgen::Skeleton skeleton;
    std::vector<armgen::Warning> warnings;
    armgen::Error error;
    if (!armgen::Skeleton::from_params(json(), json(), armgen::kDegenerateEpsilon, skeleton, warnings, error)) {
      std::cerr << "default skeleton failed: " << error.describe() << "\n";
      ++failures;
    } else if (skeleton.bones().size() != 20 || skeleton.frames().size() != 20 ||
               skeleton.bones().front().name != "root" || !warnings.empty() ||
               skeleton.find("hand_r") == nullptr || skeleton.find("hand_r")->parent != "lower_arm_r") {
      std::cerr << "default skeleton should be humanoid_basic_v1\n";
      ++failures;
    }

    for (const auto& name : armgen::skeleton_preset_names()) {
      error = {};
      if (!armgen::Skeleton::from_params(json(name), json(), armgen::kDegenerateEpsilon, skeleton, warnings, error) ||
          !warnings.empty()) {
        std::cerr << "preset " << name << " failed: " << error.describe() << "\n";
        ++failures;
      }
    }
    if (!armgen::Skeleton::from_params(json("humanoid_detailed_v1"), json(), armgen::kDegenerateEpsilon, skeleton,
                                       warnings, error) ||
        skeleton.bones().size() != 52 || !skeleton.contains("pinky_03_l")) {
      std::cerr << "detailed preset wrong\n";
      ++failures;
    }

    const json overrides = json::array({
        {{"bone", "spine"}, {"tail", {0.0, 0.0, 1.3}}},
        {{"bone", "tail_bone"}, {"head", {0.0, 0.0, 0.9}}, {"tail", {0.0, -0.2, 0.8}}, {"parent", "hips"}},
        {{"bone", "wing_r"}, {"mirror", "wing_l"}},
    });
    error = {};
    if (!armgen::Skeleton::from_params(json("humanoid_basic_v1"), overrides, armgen::kDegenerateEpsilon, skeleton,
                                       warnings, error)) {
      std::cerr << "preset overrides failed: " << error.describe() << "\n";
      ++failures;
    } else {
      const armgen::Bone* spine = skeleton.find("spine");
      const armgen::BoneFrame* spine_frame = skeleton.frame("spine");
      if (!spine || !near_vec(spine->head, {0.0, 0.0, 1.0}) || spine->parent != "hips" || !spine_frame ||
          !near(spine_frame->length, 0.3)) {
        std::cerr << "preset bone override wrong\n";
        ++failures;
      }
      if (skeleton.bones().size() != 21 || !skeleton.contains("tail_bone") || warnings.size() != 1) {
        std::cerr << "preset additions wrong\n";
        ++failures;
      }
    }

    error = {};
    if (armgen::Skeleton::from_params(json("quadruped_v9"), json(), armgen::kDegenerateEpsilon, skeleton, warnings,
                                      error) ||
        error.kind != armgen::ErrorKind::Shape || !contains(error.message, "humanoid_game_v1")) {
      std::cerr << "unknown preset accepted\n";
      ++failures;
    }
  }

  // Test: extrusion steps, connect modes and parts.
  {
    const json value = {
        {"extrusion_steps",
         json::array({0.25, {{"extrude", 0.5}, {"scale", {0.5, 0.8}}, {"rotate", 15.0}, {"tilt", 10.0},
                             {"bulge", 1.2}, {"translate", {0.1, 0.0, 0.0}}}})},
        {"connect_start", "bridge"},
    };
    armgen::spec::BoneMeshSpec mesh;
    armgen::Error error;
    if (!armgen::spec::parse_bone_mesh(value, "bone_meshes.spine", mesh, error)) {
      std::cerr << "extrusion steps rejected: " << error.describe() << "\n";
      ++failures;
    } else {
      const auto& steps = mesh.extrusion_steps;
      if (steps.size() != 2 || !near(steps[0].extrude, 0.25) || !near(steps[0].scale_x, 1.0) ||
          !near(steps[1].scale_y, 0.8) || !near(steps[1].tilt_x, 10.0) || !near(steps[1].tilt_y, 10.0) ||
          !near(steps[1].bulge_front, 1.2) || !near(steps[1].translate.x, 0.1) ||
          mesh.connect_start != armgen::spec::ConnectMode::Bridge ||
          mesh.connect_end != armgen::spec::ConnectMode::Segmented) {
        std::cerr << "extrusion steps parsed wrong\n";
        ++failures;
      }
    }

    error = {};
    if (armgen::spec::parse_bone_mesh(json{{"extrusion_steps", json::array({0.5, 0.0})}}, "bone_meshes.spine", mesh,
                                      error) ||
        error.kind != armgen::ErrorKind::Range || error.path != "bone_meshes.spine.extrusion_steps[1]") {
      std::cerr << "zero extrusion accepted\n";
      ++failures;
    }
    error = {};
    if (armgen::spec::parse_bone_mesh(json{{"connect_end", "weld"}}, "bone_meshes.spine", mesh, error) ||
        error.kind != armgen::ErrorKind::Shape) {
      std::cerr << "unknown connection mode accepted\n";
      ++failures;
    }

    const json part = {
        {"base", {{"primitive", "cylinder"}, {"dimensions", {0.3, 0.3, 1.0}}}},
        {"operations", json::array({{{"op", "difference"},
                                     {"target", {{"primitive", "sphere"}, {"dimensions", {0.2, 0.2, 0.2}}}}},
                                    {{"target", {{"asset", "parts/visor.glb"}, {"scale", 0.5}}}}})},
    };
    error = {};
    if (!armgen::spec::parse_bone_mesh(json{{"part", part}}, "bone_meshes.head", mesh, error) ||
        !mesh.part.has_value() || mesh.part->operations.size() != 2 ||
        mesh.part->operations[0].op != armgen::spec::BoolOp::Difference ||
        mesh.part->operations[1].op != armgen::spec::BoolOp::Union ||
        !std::holds_alternative<armgen::spec::AssetAttachment>(mesh.part->operations[1].target)) {
      std::cerr << "part parsed wrong: " << error.describe() << "\n";
      ++failures;
    }
    error = {};
    if (armgen::spec::parse_bone_mesh(json{{"part", part}, {"extrusion_steps", json::array({0.5})}},
                                      "bone_meshes.head", mesh, error) ||
        error.kind != armgen::ErrorKind::Shape || !contains(error.message, "mutually exclusive")) {
      std::cerr << "part with extrusion steps accepted\n";
      ++failures;
    }
  }

  // Test: reflecting a definition for the opposite side.
  {
    const json value = {
        {"translate", {0.1, 0.2, 0.3}},
        {"rotate", {10.0, 20.0, 30.0}},
        {"twist", 45.0},
        {"extrusion_steps", json::array({{{"extrude", 0.5}, {"rotate", 15.0}, {"tilt", {5.0, 6.0}},
                                          {"translate", {0.1, 0.0, 0.0}}}})},
        {"attachments",
         json::array({{{"primitive", "cube"}, {"dimensions", {0.1, 0.1, 0.1}}, {"offset", {0.4, 0.0, 0.5}},
                       {"rotation", {0.0, 90.0, 0.0}}},
                      {{"extrude", {{"start", {0.1, 0.0, 0.0}}, {"end", {0.5, 0.0, 1.0}}}}}})},
    };
    armgen::spec::BoneMeshSpec mesh;
    armgen::Error error;
    if (!armgen::spec::parse_bone_mesh(value, "bone_meshes.arm_L", mesh, error)) {
      std::cerr << "mirror fixture rejected: " << error.describe() << "\n";
      ++failures;
    } else {
      armgen::spec::mirror_across_x(mesh);
      const auto& cube = std::get<armgen::spec::PrimitiveAttachment>(mesh.attachments[0]);
      const auto& extrude = std::get<armgen::spec::ExtrudeAttachment>(mesh.attachments[1]);
      const auto& step = mesh.extrusion_steps[0];
      if (!near_vec(mesh.translate, {-0.1, 0.2, 0.3}) || !near_vec(*mesh.rotate, {10.0, -20.0, -30.0}) ||
          !near(mesh.twist, -45.0) || !near_vec(cube.offset, {-0.4, 0.0, 0.5}) ||
          !near_vec(*cube.rotation, {0.0, -90.0, 0.0}) || !near_vec(extrude.end, {-0.5, 0.0, 1.0}) ||
          !near(step.rotate, -15.0) || !near(step.tilt_x, 5.0) || !near(step.tilt_y, -6.0) ||
          !near(step.translate.x, -0.1)) {
        std::cerr << "mirror_across_x wrong\n";
        ++failures;
      }
    }
  }

  // Test: bone mesh parsing rejects unknown and malformed fields.
  {
    armgen::spec::BoneMeshSpec mesh;
    armgen::Error error;
    const json good = {
        {"profile", "circle(8)"},
        {"profile_radius", json::array({0.1, 0.2})},
        {"bulge", json::array({{{"at", 0.5}, {"scale", 1.2}}, json::array({1.0, 0.8})})},
        {"attachments", json::array({{{"primitive", "sphere"}, {"dimensions", {0.2, 0.2, 0.2}}},
                                     {{"extrude", {{"start", {0.0, 0.0, 0.5}}, {"end", {0.0, 0.5, 0.5}}}}}})},
        {"modifiers", json::array({{{"bevel", {{"width", 0.01}}}}, {{"bool", {{"target", "socket"}}}}})},
    };
    if (!armgen::spec::parse_bone_mesh(good, "bone_meshes.arm_L", mesh, error) || mesh.bulge.size() != 2 ||
        mesh.attachments.size() != 2 || mesh.modifiers.size() != 2 || mesh.profile.segments != 8) {
      std::cerr << "bone mesh parse failed: " << error.describe() << "\n";
      ++failures;
    } else if (std::get<armgen::spec::BoolModifier>(mesh.modifiers[1]).operation !=
               armgen::spec::BoolOp::Difference) {
      std::cerr << "bool modifier default operation wrong\n";
      ++failures;
    }

    error = {};
    if (armgen::spec::parse_bone_mesh(json{{"radius", 0.1}}, "bone_meshes.arm_L", mesh, error) ||
        error.kind != armgen::ErrorKind::Shape) {
      std::cerr << "unknown bone mesh key accepted\n";
      ++failures;
    }
    error = {};
    if (armgen::spec::parse_bone_mesh(json{{"taper", true}}, "bone_meshes.arm_L", mesh, error) ||
        error.kind != armgen::ErrorKind::Shape) {
      std::cerr << "boolean taper accepted\n";
      ++failures;
    }
    error = {};
    const json two_tags = {{"attachments", json::array({{{"primitive", "cube"}, {"asset", "x.glb"}}})}};
    if (armgen::spec::parse_bone_mesh(two_tags, "bone_meshes.arm_L", mesh, error) ||
        error.kind != armgen::ErrorKind::Shape) {
      std::cerr << "attachment with two tags accepted\n";
      ++failures;
    }
  }

  // Test: generator config from JSON with fallbacks.
  {
    const fs::path dir = fs::temp_directory_path() / "armgen_test_resolver";
    const fs::path path = dir / "generator.json";
    const std::string text =
        R"({"generator":{"temp_prefix":"__tmp_","bind_weight":0.5,"strict_bones":true,"default_segments":2}})";
    if (!write_text(path, text)) {
      std::cerr << "failed to write config fixture\n";
      ++failures;
    } else {
      const armgen::GeneratorConfig cfg = armgen::load_generator_config(path);
      if (cfg.temp_prefix != "__tmp_" || !near(cfg.bind_weight, 0.5) || !cfg.strict_bones ||
          cfg.default_segments != armgen::kDefaultProfileSegments) {
        std::cerr << "generator config fields wrong\n";
        ++failures;
      }
    }
    const armgen::GeneratorConfig missing = armgen::load_generator_config(dir / "absent.json");
    if (missing.temp_prefix != armgen::groups::kDefaultTempPrefix || missing.strict_bones) {
      std::cerr << "missing config should fall back to defaults\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  // Test: generator config from YAML.
  {
    const fs::path dir = fs::temp_directory_path() / "armgen_test_resolver_yaml";
    const fs::path path = dir / "generator.yaml";
    const std::string text =
        "generator:\n"
        "  temp_prefix: __yaml_\n"
        "  bind_weight: 0.25\n"
        "  strict_bones: true\n"
        "  default_segments: 24\n";
    if (!write_text(path, text)) {
      std::cerr << "failed to write yaml config fixture\n";
      ++failures;
    } else {
      const armgen::GeneratorConfig cfg = armgen::load_generator_config(path);
#if ARMGEN_ENABLE_DATA_YAML
      if (cfg.temp_prefix != "__yaml_" || !near(cfg.bind_weight, 0.25) || !cfg.strict_bones ||
          cfg.default_segments != 24 || !near(cfg.degenerate_epsilon, 1e-6)) {
        std::cerr << "yaml generator config fields wrong\n";
        ++failures;
      }
#else
      if (cfg.temp_prefix != armgen::groups::kDefaultTempPrefix || cfg.strict_bones) {
        std::cerr << "yaml config without yaml support should fall back to defaults\n";
        ++failures;
      }
#endif
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  if (failures == 0) {
    std::cout << "armgen_test_resolver: all tests passed\n";
  } else {
    std::cerr << "armgen_test_resolver: " << failures << " failures\n";
  }
  armgen::log::shutdown();
  return failures == 0 ? 0 : 1;
}
