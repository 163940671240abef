#include <kerf/joinery.hpp>
#include <cmath>
#include <string>

namespace kerf::joinery {

using geometry::FaceDirection;
using geometry::FaceFrame;

namespace {

// Box on a face: `span` along the width, full height, `depth` along
// the normal (positive grows out of the board, negative cuts in)
ScratchGroup face_box(Kernel& kernel, const FaceFrame& frame, const Span& span,
                      double height, double depth) {
    Polygon base = geometry::frame_rect(frame, span.start, span.end, -height / 2.0, height / 2.0);
    Vec3 direction = depth >= 0 ? frame.normal : Vec3(-frame.normal);
    return geometry::extrude(kernel, base, direction, std::abs(depth));
}

ScratchGroup tail_solid(Kernel& kernel, const FaceFrame& frame, const Tail& tail,
                        double height, double depth) {
    double v0 = -height / 2.0;
    Polygon profile = {
        frame.at(tail.top.start, v0, 0.0),
        frame.at(tail.top.end, v0, 0.0),
        frame.at(tail.bottom.end, v0, depth),
        frame.at(tail.bottom.start, v0, depth)
    };
    return geometry::extrude(kernel, profile, frame.v, height);
}

// Merge a scratch solid into a board, through the board's own transform
void attach(Kernel& kernel, const ScratchGroup& solid, EntityId board) {
    kernel.copy_geometry(solid.id(), board);
}

Span full_width(double width) {
    return {-width / 2.0, width / 2.0};
}

} // anonymous namespace

std::string check(const JointParams& params, bool uses_count) {
    if (!(params.width > 0) || !(params.height > 0) || !(params.depth > 0)) {
        return "Joint width, height and depth must be positive";
    }
    if (uses_count) {
        if (!(params.count >= 1)) return "Joint count must be at least 1";
        if (params.count > MAX_JOINT_COUNT) {
            return "Joint count must be at most " + std::to_string(MAX_JOINT_COUNT);
        }
        if (std::floor(params.count) != params.count) return "Joint count must be a whole number";
    }
    if (!(std::abs(params.angle) < 90.0)) {
        return "Dovetail angle must be between -90 and 90 degrees";
    }
    return "";
}

double tail_width(double width, int num_tails) {
    return width / (2.0 * num_tails - 1.0);
}

std::vector<Tail> plan_dovetail(double width, double depth, double angle_degrees, int num_tails) {
    double tw = tail_width(width, num_tails);
    double flare = depth * std::tan(degrees_to_radians(angle_degrees));

    std::vector<Tail> tails;
    tails.reserve(static_cast<size_t>(num_tails));
    for (int i = 0; i < num_tails; ++i) {
        double start = -width / 2.0 + 2.0 * i * tw;
        Tail t;
        t.top = {start, start + tw};
        t.bottom = {start - flare, start + tw + flare};
        tails.push_back(t);
    }
    return tails;
}

FingerPlan plan_fingers(double width, int num_fingers) {
    double seg = width / num_fingers;
    FingerPlan plan;
    for (int i = 0; i < num_fingers; ++i) {
        Span s{-width / 2.0 + i * seg, -width / 2.0 + (i + 1) * seg};
        if (i % 2 == 1) {
            plan.board1_cuts.push_back(s);
        } else {
            plan.board2_slots.push_back(s);
        }
    }
    return plan;
}

FaceDirection facing(const Kernel& kernel, EntityId a, EntityId b) {
    Vec3 direction = kernel.bounds(b).center() - kernel.bounds(a).center();
    return geometry::classify(direction);
}

// ═══════════════════════════════════════════════════════════════════
// Mortise and tenon
// ═══════════════════════════════════════════════════════════════════

Placement mortise_tenon(Kernel& kernel, EntityId mortise, EntityId tenon, const JointParams& params) {
    FaceDirection dir = facing(kernel, mortise, tenon);
    FaceDirection back = geometry::opposite(dir);

    FaceFrame mortise_face = geometry::face_frame(kernel.bounds(mortise), dir, params.offset);
    FaceFrame tenon_face = geometry::face_frame(kernel.bounds(tenon), back, params.offset);
    Span span = full_width(params.width);

    {
        ScratchGroup pocket = face_box(kernel, mortise_face, span, params.height, -params.depth);
        kernel.subtract(mortise, pocket.id());
    }
    {
        ScratchGroup boss = face_box(kernel, tenon_face, span, params.height, params.depth);
        attach(kernel, boss, tenon);
        kernel.outer_shell(tenon);
    }
    return {dir, back};
}

// ═══════════════════════════════════════════════════════════════════
// Dovetail
// ═══════════════════════════════════════════════════════════════════

Placement dovetail(Kernel& kernel, EntityId tail_board, EntityId pin_board, const JointParams& params) {
    FaceDirection dir = facing(kernel, tail_board, pin_board);

    FaceFrame tail_face = geometry::face_frame(kernel.bounds(tail_board), dir, params.offset);
    FaceFrame pin_face = geometry::face_frame(kernel.bounds(pin_board), dir, params.offset);
    auto tails = plan_dovetail(params.width, params.depth, params.angle, params.segments());

    for (const auto& tail : tails) {
        ScratchGroup solid = tail_solid(kernel, tail_face, tail, params.height, params.depth);
        attach(kernel, solid, tail_board);
    }
    kernel.outer_shell(tail_board);

    ScratchGroup pins = face_box(kernel, pin_face, full_width(params.width),
                                 params.height, params.depth);
    for (const auto& tail : tails) {
        ScratchGroup cutter = tail_solid(kernel, pin_face, tail, params.height, params.depth);
        kernel.subtract(pins.id(), cutter.id());
    }
    attach(kernel, pins, pin_board);
    kernel.outer_shell(pin_board);

    return {dir, dir};
}

// ═══════════════════════════════════════════════════════════════════
// Finger joint
// ═══════════════════════════════════════════════════════════════════

Placement finger_joint(Kernel& kernel, EntityId board1, EntityId board2, const JointParams& params) {
    FaceDirection dir = facing(kernel, board1, board2);

    FaceFrame face1 = geometry::face_frame(kernel.bounds(board1), dir, params.offset);
    FaceFrame face2 = geometry::face_frame(kernel.bounds(board2), dir, params.offset);
    FingerPlan plan = plan_fingers(params.width, params.segments());

    ScratchGroup fingers = face_box(kernel, face1, full_width(params.width),
                                    params.height, params.depth);
    for (const auto& cut : plan.board1_cuts) {
        ScratchGroup cutter = face_box(kernel, face1, cut, params.height, params.depth);
        kernel.subtract(fingers.id(), cutter.id());
    }
    attach(kernel, fingers, board1);
    kernel.outer_shell(board1);

    for (const auto& slot : plan.board2_slots) {
        ScratchGroup cutter = face_box(kernel, face2, slot, params.height, -params.depth);
        kernel.subtract(board2, cutter.id());
    }

    return {dir, dir};
}

} // namespace kerf::joinery
