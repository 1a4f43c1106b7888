#pragma once

#include "armgen/error.h"

#include <string>
#include <vector>

namespace armgen {

struct BulgePoint {
  double position = 0.0;  // fraction of the segment height
  double scale = 1.0;
};

// Cross-section shape at one height, accumulated over extrusion steps.
// Offsets are in segment heights, tilts rotate the ring about local X and Y.
struct FieldRing {
  double position = 0.0;  // fraction of the segment height
  double scale_x = 1.0;
  double scale_y = 1.0;
  double twist_degrees = 0.0;
  double offset_x = 0.0;
  double offset_y = 0.0;
  double tilt_x_degrees = 0.0;
  double tilt_y_degrees = 0.0;
};

struct FieldSample {
  double radial_scale = 1.0;
  double twist_radians = 0.0;
  double scale_x = 1.0;
  double scale_y = 1.0;
  double offset_x = 0.0;
  double offset_y = 0.0;
  double tilt_x_radians = 0.0;
  double tilt_y_radians = 0.0;
};

// Radial scale and twist as a function of normalized height t in [0, 1],
// optionally shaped further by rings interpolated piecewise linearly.
// Immutable once built; evaluate() has no side effects.
class DeformationField {
 public:
  DeformationField() = default;

  // taper > 0, every bulge scale > 0, all values finite. Bulge positions are
  // clamped to [0, 1] and sorted; equal positions keep their input order.
  static bool build(double taper,
                    std::vector<BulgePoint> bulge,
                    double twist_degrees,
                    const std::string& path,
                    DeformationField& out,
                    Error& error);

  // Ring positions must lie in [0, 1] and strictly increase; ring scales > 0.
  static bool build(double taper,
                    std::vector<BulgePoint> bulge,
                    double twist_degrees,
                    std::vector<FieldRing> rings,
                    const std::string& path,
                    DeformationField& out,
                    Error& error);

  FieldSample evaluate(double t) const;
  double taper_scale(double t) const;
  double bulge_scale(double t) const;
  double twist_radians(double t) const;
  FieldRing ring_at(double t) const;

  double taper() const { return taper_; }
  double twist_degrees() const { return twist_degrees_; }
  const std::vector<BulgePoint>& bulge() const { return bulge_; }
  const std::vector<FieldRing>& rings() const { return rings_; }
  bool is_identity() const;

 private:
  double taper_ = 1.0;
  double twist_degrees_ = 0.0;
  std::vector<BulgePoint> bulge_;
  std::vector<FieldRing> rings_;
};

} // namespace armgen
