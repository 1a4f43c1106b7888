#include "armgen/deform.h"

#include "armgen/math.h"
#include "armgen/validate.h"

#include <algorithm>

namespace armgen {

bool DeformationField::build(double taper,
                             std::vector<BulgePoint> bulge,
                             double twist_degrees,
                             const std::string& path,
                             DeformationField& out,
                             Error& error) {
  return build(taper, std::move(bulge), twist_degrees, {}, path, out, error);
}

bool DeformationField::build(double taper,
                             std::vector<BulgePoint> bulge,
                             double twist_degrees,
                             std::vector<FieldRing> rings,
                             const std::string& path,
                             DeformationField& out,
                             Error& error) {
  if (!validate::require_positive(taper, validate::join_path(path, "taper"), error)) return false;
  if (!validate::require_finite(twist_degrees, validate::join_path(path, "twist"), error)) return false;

  const std::string bulge_path = validate::join_path(path, "bulge");
  for (size_t i = 0; i < bulge.size(); ++i) {
    auto& point = bulge[i];
    const std::string point_path = validate::index_path(bulge_path, i);
    if (!validate::require_finite(point.position, point_path + ".at", error)) return false;
    if (!validate::require_positive(point.scale, point_path + ".scale", error)) return false;
    point.position = std::clamp(point.position, 0.0, 1.0);
  }
  std::stable_sort(bulge.begin(), bulge.end(),
                   [](const BulgePoint& a, const BulgePoint& b) { return a.position < b.position; });

  const std::string rings_path = validate::join_path(path, "extrusion_steps");
  for (size_t i = 0; i < rings.size(); ++i) {
    const FieldRing& ring = rings[i];
    const std::string ring_path = validate::index_path(rings_path, i);
    if (!validate::require_finite(ring.position, ring_path, error)) return false;
    if (ring.position < 0.0 || ring.position > 1.0 || (i > 0 && ring.position <= rings[i - 1].position)) {
      return fail(error, ErrorKind::Range, "ring heights must increase within the segment", ring_path);
    }
    if (!validate::require_positive(ring.scale_x, ring_path, error)) return false;
    if (!validate::require_positive(ring.scale_y, ring_path, error)) return false;
    for (double value : {ring.twist_degrees, ring.offset_x, ring.offset_y, ring.tilt_x_degrees, ring.tilt_y_degrees}) {
      if (!validate::require_finite(value, ring_path, error)) return false;
    }
  }

  out.taper_ = taper;
  out.twist_degrees_ = twist_degrees;
  out.bulge_ = std::move(bulge);
  out.rings_ = std::move(rings);
  return true;
}

double DeformationField::taper_scale(double t) const {
  return 1.0 + (taper_ - 1.0) * t;
}

double DeformationField::bulge_scale(double t) const {
  if (bulge_.empty()) {
    return 1.0;
  }
  if (t <= bulge_.front().position) {
    return bulge_.front().scale;
  }
  if (t >= bulge_.back().position) {
    return bulge_.back().scale;
  }
  for (size_t i = 0; i + 1 < bulge_.size(); ++i) {
    const BulgePoint& p0 = bulge_[i];
    const BulgePoint& p1 = bulge_[i + 1];
    if (t > p1.position) continue;
    const double span = p1.position - p0.position;
    if (span <= 0.0) {
      return p1.scale;
    }
    const double f = (t - p0.position) / span;
    return p0.scale + (p1.scale - p0.scale) * f;
  }
  return bulge_.back().scale;
}

double DeformationField::twist_radians(double t) const {
  return deg_to_rad(twist_degrees_ * t);
}

FieldRing DeformationField::ring_at(double t) const {
  if (rings_.empty()) {
    FieldRing identity;
    identity.position = t;
    return identity;
  }
  if (t <= rings_.front().position) {
    return rings_.front();
  }
  if (t >= rings_.back().position) {
    return rings_.back();
  }
  size_t i = 1;
  while (rings_[i].position < t) ++i;
  const FieldRing& r0 = rings_[i - 1];
  const FieldRing& r1 = rings_[i];
  const double f = (t - r0.position) / (r1.position - r0.position);
  auto lerp = [f](double a, double b) { return a + (b - a) * f; };
  FieldRing ring;
  ring.position = t;
  ring.scale_x = lerp(r0.scale_x, r1.scale_x);
  ring.scale_y = lerp(r0.scale_y, r1.scale_y);
  ring.twist_degrees = lerp(r0.twist_degrees, r1.twist_degrees);
  ring.offset_x = lerp(r0.offset_x, r1.offset_x);
  ring.offset_y = lerp(r0.offset_y, r1.offset_y);
  ring.tilt_x_degrees = lerp(r0.tilt_x_degrees, r1.tilt_x_degrees);
  ring.tilt_y_degrees = lerp(r0.tilt_y_degrees, r1.tilt_y_degrees);
  return ring;
}

FieldSample DeformationField::evaluate(double t) const {
  const FieldRing ring = ring_at(t);
  FieldSample sample;
  sample.radial_scale = taper_scale(t) * bulge_scale(t);
  sample.twist_radians = twist_radians(t) + deg_to_rad(ring.twist_degrees);
  sample.scale_x = ring.scale_x;
  sample.scale_y = ring.scale_y;
  sample.offset_x = ring.offset_x;
  sample.offset_y = ring.offset_y;
  sample.tilt_x_radians = deg_to_rad(ring.tilt_x_degrees);
  sample.tilt_y_radians = deg_to_rad(ring.tilt_y_degrees);
  return sample;
}

bool DeformationField::is_identity() const {
  if (taper_ != 1.0 || twist_degrees_ != 0.0) return false;
  for (const auto& point : bulge_) {
    if (point.scale != 1.0) return false;
  }
  for (const auto& ring : rings_) {
    if (ring.scale_x != 1.0 || ring.scale_y != 1.0 || ring.twist_degrees != 0.0 || ring.offset_x != 0.0 ||
        ring.offset_y != 0.0 || ring.tilt_x_degrees != 0.0 || ring.tilt_y_degrees != 0.0) {
      return false;
    }
  }
  return true;
}

} // namespace armgen
