#pragma once
// Joinery: parametric woodworking joints between two boards
//
// Planning is pure arithmetic on the joint parameters (segment layout along
// the joint width). Application places the planned solids on the board
// faces picked from the boards' relative position, then merges or cuts
// them through the Kernel. All intermediate solids are scratch groups.

#include <kerf/geometry.hpp>
#include <kerf/kernel.hpp>
#include <string>
#include <vector>

namespace kerf::joinery {

constexpr double DEFAULT_SIZE = 1.0;
constexpr double DEFAULT_DOVETAIL_ANGLE = 15.0;  // degrees
constexpr int DEFAULT_TAILS = 3;
constexpr int DEFAULT_FINGERS = 5;
constexpr int MAX_JOINT_COUNT = 1000;

struct JointParams {
    double width = DEFAULT_SIZE;
    double height = DEFAULT_SIZE;
    double depth = DEFAULT_SIZE;
    Vec3 offset = Vec3::Zero();
    double angle = DEFAULT_DOVETAIL_ANGLE;
    // Tails or fingers as requested; check() vets it before segments() is used
    double count = 0;

    int segments() const { return static_cast<int>(count); }
};

// Span along the joint width, measured from the face center
struct Span {
    double start = 0.0;
    double end = 0.0;

    double length() const { return end - start; }
};

// Dovetail tail in the (width, normal) plane: `top` lies on the face,
// `bottom` is `depth` out from it and flared by the angle on both sides
struct Tail {
    Span top;
    Span bottom;
};

struct FingerPlan {
    std::vector<Span> board1_cuts;   // odd segments
    std::vector<Span> board2_slots;  // even segments
};

// Empty when the parameters are usable, otherwise the reason
std::string check(const JointParams& params, bool uses_count);

double tail_width(double width, int num_tails);
std::vector<Tail> plan_dovetail(double width, double depth, double angle_degrees, int num_tails);
FingerPlan plan_fingers(double width, int num_fingers);

// Face of `a` looking toward `b`
geometry::FaceDirection facing(const Kernel& kernel, EntityId a, EntityId b);

// Results report the faces used, for the tool payloads
struct Placement {
    geometry::FaceDirection first;
    geometry::FaceDirection second;
};

Placement mortise_tenon(Kernel& kernel, EntityId mortise, EntityId tenon, const JointParams& params);
Placement dovetail(Kernel& kernel, EntityId tail_board, EntityId pin_board, const JointParams& params);
Placement finger_joint(Kernel& kernel, EntityId board1, EntityId board2, const JointParams& params);

} // namespace kerf::joinery
