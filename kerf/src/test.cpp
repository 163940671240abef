#undef NDEBUG
#include <kerf/edges.hpp>
#include <kerf/geometry.hpp>
#include <kerf/joinery.hpp>
#include <kerf/rpc/handler.hpp>
#include <kerf/scene.hpp>
#include <kerf/socket_client.hpp>
#include <kerf/socket_server.hpp>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

using namespace kerf;
using json = nlohmann::json;

namespace {

bool near(double a, double b, double tol = 1e-6) {
    return std::fabs(a - b) <= tol;
}

json call(rpc::Handler& handler, const std::string& tool, const json& args, int id = 1) {
    json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "tools/call"},
        {"params", {{"name", tool}, {"arguments", args}}}
    };
    return json::parse(handler.handle(request.dump()));
}

EntityId created_id(const json& response) {
    assert(response.contains("result"));
    return response["result"]["structured"]["id"].get<EntityId>();
}

std::string error_message(const json& response) {
    assert(response.contains("error"));
    return response["error"]["message"].get<std::string>();
}

bool file_exists(const std::string& path) {
    std::ifstream in(path);
    return in.good();
}

std::string temp_dir() {
    char tmpl[] = "/tmp/kerf_test_XXXXXX";
    char* dir = mkdtemp(tmpl);
    assert(dir != nullptr);
    return dir;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════
// Protocol
// ═══════════════════════════════════════════════════════════════════════════

void test_parse_error() {
    std::cout << "Testing parse error envelope..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    json resp = json::parse(handler.handle("{"));
    assert(resp["jsonrpc"] == "2.0");
    assert(resp["id"].is_null());
    assert(resp["error"]["code"] == rpc::error::PARSE_ERROR);

    // id survives when the line is broken after it
    resp = json::parse(handler.handle(R"({"id": 7, broken)"));
    assert(resp["id"] == 7);
    assert(resp["error"]["code"] == rpc::error::PARSE_ERROR);

    // Long runs after the key are scanned, not matched recursively
    resp = json::parse(handler.handle("{\"id\":" + std::string(100000, ' ') + "7, broken"));
    assert(resp["id"] == 7);
    assert(resp["error"]["code"] == rpc::error::PARSE_ERROR);

    resp = json::parse(handler.handle("{\"id\": 1" + std::string(100000, '0') + ", broken"));
    assert(resp["id"].is_null());
    assert(resp["error"]["code"] == rpc::error::PARSE_ERROR);

    std::cout << "  PASS" << std::endl;
}

void test_legacy_shape() {
    std::cout << "Testing legacy command shape..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    json legacy = {
        {"id", 42},
        {"command", "create_component"},
        {"parameters", {{"type", "cube"}, {"dimensions", {2, 2, 2}}}}
    };
    json resp = json::parse(handler.handle(legacy.dump()));
    assert(resp["id"] == 42);
    assert(resp["jsonrpc"] == "2.0");
    assert(resp["result"]["success"] == true);
    assert(resp["result"]["isError"] == false);
    assert(scene.group_count() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_unknown_method_and_tool() {
    std::cout << "Testing unknown method and tool..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    json resp = json::parse(handler.handle(R"({"jsonrpc":"2.0","id":3,"method":"frobnicate"})"));
    assert(resp["error"]["code"] == rpc::error::METHOD_NOT_FOUND);
    assert(resp["id"] == 3);

    resp = call(handler, "make_teapot", json::object(), 4);
    assert(resp["error"]["code"] == rpc::error::INTERNAL_ERROR);
    assert(resp["error"]["data"]["success"] == false);
    assert(error_message(resp) == "Unknown tool: make_teapot");

    std::cout << "  PASS" << std::endl;
}

void test_lifecycle_methods() {
    std::cout << "Testing initialize/tools/resources/prompts..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    json resp = json::parse(handler.handle(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})"));
    assert(resp["result"]["serverInfo"]["name"] == KERF_SERVER_NAME);

    resp = json::parse(handler.handle(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"));
    assert(resp["result"]["tools"].size() == handler.tools().size());
    assert(handler.tools().size() >= 12);

    // A request without an id is still answered, with a null id
    resp = json::parse(handler.handle(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"get_selection","arguments":{}}})"));
    assert(resp.contains("id") && resp["id"].is_null());
    assert(resp["result"]["success"] == true);

    resp = json::parse(handler.handle(R"({"jsonrpc":"2.0","id":3,"method":"prompts/list"})"));
    assert(resp["result"]["prompts"].empty());

    call(handler, "create_component", {{"type", "cube"}});
    resp = json::parse(handler.handle(R"({"jsonrpc":"2.0","id":4,"method":"resources/list"})"));
    assert(resp["result"]["resources"].size() == 1);
    assert(resp["result"]["resources"][0]["type"] == "group");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Components and transforms
// ═══════════════════════════════════════════════════════════════════════════

void test_create_cube() {
    std::cout << "Testing create_component cube..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    json resp = call(handler, "create_component",
                     {{"type", "cube"}, {"position", {1, 2, 3}}, {"dimensions", {4, 5, 6}}});
    EntityId id = created_id(resp);
    assert(resp["result"]["resourceId"] == id);

    Bounds b = scene.bounds(id);
    assert(coincident(b.min, Vec3(1, 2, 3)));
    assert(coincident(b.max, Vec3(5, 7, 9)));
    assert(near(scene.volume(id), 120.0));

    resp = call(handler, "create_component", {{"type", "cube"}, {"dimensions", {1, 0, 1}}});
    assert(error_message(resp) == "Dimensions must be positive");

    resp = call(handler, "create_component", {{"type", "torus"}});
    assert(error_message(resp) == "Unknown component type: torus");
    assert(scene.group_count() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_create_round_primitives() {
    std::cout << "Testing cylinder/sphere/cone..." << std::endl;

    Scene scene;
    EntityId cyl = geometry::create_cylinder(scene, {0, 0, 0}, {2, 2, 5});
    double expected = PI * 1.0 * 5.0;
    assert(std::fabs(scene.volume(cyl) - expected) / expected < 0.03);

    Bounds b = scene.bounds(cyl);
    assert(near(b.min.z(), 0.0) && near(b.max.z(), 5.0));

    EntityId sphere = geometry::create_sphere(scene, {0, 0, 0}, {3, 3, 3});
    double sphere_expected = 4.0 / 3.0 * PI * 1.5 * 1.5 * 1.5;
    assert(scene.volume(sphere) < sphere_expected);
    assert(scene.volume(sphere) > sphere_expected * 0.9);

    EntityId cone = geometry::create_cone(scene, {0, 0, 0}, {2, 2, 3});
    double cone_expected = PI * 1.0 * 3.0 / 3.0;
    assert(std::fabs(scene.volume(cone) - cone_expected) / cone_expected < 0.03);

    std::cout << "  PASS" << std::endl;
}

void test_transform_roundtrip() {
    std::cout << "Testing transform_component..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    EntityId id = created_id(call(handler, "create_component",
                                  {{"type", "cube"}, {"dimensions", {2, 2, 2}}}));
    Bounds before = scene.bounds(id);

    json resp = call(handler, "transform_component", {{"id", id}, {"position", {3, -1, 4}}});
    assert(resp["result"]["structured"]["bounds"]["min"][0] == 3.0);
    assert(coincident(scene.bounds(id).min, Vec3(3, -1, 4)));

    call(handler, "transform_component", {{"id", id}, {"position", {-3, 1, -4}}});
    assert(coincident(scene.bounds(id).min, before.min));
    assert(coincident(scene.bounds(id).max, before.max));

    // Uniform scale about the center keeps the center
    call(handler, "transform_component", {{"id", id}, {"scale", 2}});
    assert(coincident(scene.bounds(id).min, Vec3(-1, -1, -1)));
    assert(near(scene.volume(id), 64.0));

    resp = call(handler, "transform_component", {{"id", id}, {"scale", {1, 0, 1}}});
    assert(resp.contains("error"));

    resp = call(handler, "transform_component", {{"id", 9999}, {"position", {1, 0, 0}}});
    assert(error_message(resp) == "Entity not found");

    resp = call(handler, "transform_component", {{"id", 1e300}, {"position", {1, 0, 0}}});
    assert(error_message(resp) == "Entity not found");

    std::cout << "  PASS" << std::endl;
}

void test_transform_rotation() {
    std::cout << "Testing transform_component rotation..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    // Center (1, 2, 3)
    EntityId id = created_id(call(handler, "create_component",
                                  {{"type", "cube"}, {"dimensions", {2, 4, 6}}}));

    json resp = call(handler, "transform_component", {{"id", id}, {"rotation", {0, 0, 90}}});
    assert(resp.contains("result"));
    assert(coincident(scene.bounds(id).min, Vec3(-1, 1, 0)));
    assert(coincident(scene.bounds(id).max, Vec3(3, 3, 6)));

    call(handler, "transform_component", {{"id", id}, {"rotation", {0, 0, -90}}});
    assert(coincident(scene.bounds(id).min, Vec3(0, 0, 0)));
    assert(coincident(scene.bounds(id).max, Vec3(2, 4, 6)));

    // x is applied before z, both about the starting center
    call(handler, "transform_component", {{"id", id}, {"rotation", {90, 0, 90}}});
    assert(coincident(scene.bounds(id).min, Vec3(-2, 1, 1)));
    assert(coincident(scene.bounds(id).max, Vec3(4, 3, 5)));
    assert(near(scene.volume(id), 48.0));

    std::cout << "  PASS" << std::endl;
}

void test_delete_and_selection() {
    std::cout << "Testing delete_component and get_selection..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    EntityId a = created_id(call(handler, "create_component", {{"type", "cube"}}));
    EntityId b = created_id(call(handler, "create_component", {{"type", "cube"}}));

    scene.select({a});
    json resp = call(handler, "get_selection", json::object());
    assert(resp["result"]["structured"]["selection"].size() == 1);
    assert(resp["result"]["structured"]["selection"][0]["id"] == a);

    // String ids are accepted
    resp = call(handler, "delete_component", {{"id", std::to_string(b)}});
    assert(resp.contains("result"));
    assert(!scene.valid(b));

    resp = call(handler, "delete_component", {{"id", b}});
    assert(error_message(resp) == "Entity not found");

    std::cout << "  PASS" << std::endl;
}

void test_set_material() {
    std::cout << "Testing set_material..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    EntityId id = created_id(call(handler, "create_component", {{"type", "cube"}}));
    json resp = call(handler, "set_material", {{"id", id}, {"material", "#ff8000"}});
    assert(resp["result"]["structured"]["material"] == "#ff8000");
    assert(scene.material(id) == std::optional<std::string>("#ff8000"));

    auto mat = scene.find_material("#ff8000");
    assert(mat && mat->color);
    assert(mat->color->r == 255 && mat->color->g == 128 && mat->color->b == 0);

    call(handler, "set_material", {{"id", id}, {"material", "oak"}});
    assert(scene.material(id) == std::optional<std::string>("oak"));

    std::cout << "  PASS" << std::endl;
}

void test_export() {
    std::cout << "Testing export..." << std::endl;

    Scene scene;
    std::string dir = temp_dir();
    rpc::Handler handler(scene, rpc::HandlerContext{dir});

    call(handler, "create_component", {{"type", "cube"}, {"dimensions", {3, 3, 3}}});

    json resp = call(handler, "export", {{"format", "obj"}});
    std::string obj_path = resp["result"]["structured"]["path"];
    assert(obj_path.rfind(dir, 0) == 0);
    assert(file_exists(obj_path));

    resp = call(handler, "export_scene", {{"format", "skp"}});
    assert(resp["result"]["structured"]["format"] == "skp");
    assert(file_exists(resp["result"]["structured"]["path"].get<std::string>()));

    resp = call(handler, "export", {{"format", "png"}, {"width", 64}, {"height", 48}});
    assert(file_exists(resp["result"]["structured"]["path"].get<std::string>()));

    resp = call(handler, "export", {{"format", "gltf"}});
    assert(resp.contains("error"));

    resp = call(handler, "export", {{"format", "png"}, {"width", 1e12}, {"height", 48}});
    assert(error_message(resp) == "Image width and height must be between 1 and 8192");
    resp = call(handler, "export", {{"format", "jpg"}, {"width", 64}, {"height", 0}});
    assert(resp.contains("error"));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Booleans
// ═══════════════════════════════════════════════════════════════════════════

void test_boolean_missing_entity() {
    std::cout << "Testing boolean_operation missing entity..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    EntityId target = created_id(call(handler, "create_component", {{"type", "cube"}}));
    size_t groups = scene.group_count();

    json resp = call(handler, "boolean_operation",
                     {{"operation", "union"}, {"target_id", target}, {"tool_id", 777}});
    assert(error_message(resp) == "Entity not found: tool");

    resp = call(handler, "boolean_operation",
                {{"operation", "union"}, {"target_id", 555}, {"tool_id", 777}});
    assert(error_message(resp) == "Entity not found: target, tool");

    resp = call(handler, "boolean_operation",
                {{"operation", "xor"}, {"target_id", target}, {"tool_id", target}});
    assert(resp.contains("error"));

    // Failed operations leave no scratch groups behind
    assert(scene.group_count() == groups);

    std::cout << "  PASS" << std::endl;
}

void test_boolean_operations() {
    std::cout << "Testing boolean difference/union/intersection..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    EntityId a = created_id(call(handler, "create_component",
                                 {{"type", "cube"}, {"dimensions", {10, 10, 10}}}));
    EntityId b = created_id(call(handler, "create_component",
                                 {{"type", "cube"}, {"position", {5, 0, 0}},
                                  {"dimensions", {10, 10, 10}}}));

    EntityId diff = created_id(call(handler, "boolean_operation",
                                    {{"operation", "difference"}, {"target_id", a}, {"tool_id", b}}));
    assert(near(scene.volume(diff), 500.0, 1e-4));
    assert(scene.valid(a) && scene.valid(b));

    EntityId uni = created_id(call(handler, "boolean_operation",
                                   {{"operation", "union"}, {"target_id", a}, {"tool_id", b}}));
    assert(near(scene.volume(uni), 1500.0, 1e-4));
    assert(scene.shell_count(uni) == 1);

    EntityId inter = created_id(call(handler, "boolean_operation",
                                     {{"operation", "intersection"}, {"target_id", a},
                                      {"tool_id", b}, {"delete_originals", true}}));
    assert(near(scene.volume(inter), 500.0, 1e-4));
    assert(!scene.valid(a) && !scene.valid(b));

    // Three results remain, originals gone
    assert(scene.group_count() == 3);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Edges
// ═══════════════════════════════════════════════════════════════════════════

void test_chamfer() {
    std::cout << "Testing chamfer_edges..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    EntityId cube = created_id(call(handler, "create_component",
                                    {{"type", "cube"}, {"dimensions", {10, 10, 10}}}));
    json resp = call(handler, "chamfer_edges",
                     {{"entity_id", cube}, {"edge_indices", {0}}, {"distance", 1.0}});
    EntityId result = created_id(resp);
    assert(result != cube);
    assert(resp["result"]["structured"]["edges_treated"] == 1);
    assert(near(scene.volume(result), 995.0, 1e-6));
    assert(near(scene.volume(cube), 1000.0));

    resp = call(handler, "chamfer_edges", {{"entity_id", cube}, {"distance", -1}});
    assert(resp.contains("error"));

    resp = call(handler, "chamfer_edges",
                {{"entity_id", cube}, {"edge_indices", {0}}, {"delete_original", true}});
    assert(resp.contains("result"));
    assert(!scene.valid(cube));

    std::cout << "  PASS" << std::endl;
}

void test_fillet() {
    std::cout << "Testing fillet_edges..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    EntityId cube = created_id(call(handler, "create_component",
                                    {{"type", "cube"}, {"dimensions", {10, 10, 10}}}));
    json resp = call(handler, "fillet_edges",
                     {{"entity_id", cube}, {"edge_indices", {0}}, {"radius", 1.0}, {"segments", 6}});
    EntityId result = created_id(resp);
    double v = scene.volume(result);
    assert(v > 995.0 && v < 1000.0);

    resp = call(handler, "fillet_edges", {{"entity_id", cube}, {"segments", 0}});
    assert(resp.contains("error"));

    std::cout << "  PASS" << std::endl;
}

void test_edge_selection() {
    std::cout << "Testing edge selection..." << std::endl;

    Scene scene;
    EntityId cube = geometry::create_cube(scene, {0, 0, 0}, {1, 1, 1});
    auto all = scene.edges(cube);
    assert(all.size() == 12);

    assert(edges::select_edges(all, std::nullopt).size() == 12);
    auto some = edges::select_edges(all, std::vector<int64_t>{0, 3, 99, -1});
    assert(some.size() == 2);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Joinery
// ═══════════════════════════════════════════════════════════════════════════

void test_joint_planning() {
    std::cout << "Testing joint planning..." << std::endl;

    assert(near(joinery::tail_width(12.0, 3), 2.4));

    auto tails = joinery::plan_dovetail(12.0, 1.0, 15.0, 3);
    assert(tails.size() == 3);
    for (const auto& tail : tails) {
        assert(near(tail.top.length(), 2.4));
        assert(tail.bottom.length() > tail.top.length());
    }

    auto plan = joinery::plan_fingers(5.0, 5);
    assert(plan.board1_cuts.size() == 2);
    assert(plan.board2_slots.size() == 3);
    assert(near(plan.board2_slots[0].length(), 1.0));

    joinery::JointParams params;
    assert(joinery::check(params, false).empty());
    params.width = 0;
    assert(!joinery::check(params, false).empty());
    params.width = 1;
    params.count = 0;
    assert(!joinery::check(params, true).empty());
    params.count = joinery::MAX_JOINT_COUNT;
    assert(joinery::check(params, true).empty());
    params.count = 3e9;
    assert(joinery::check(params, true) == "Joint count must be at most 1000");
    params.count = 1.5;
    assert(!joinery::check(params, true).empty());

    // No int overflow in the width arithmetic
    assert(joinery::tail_width(1.0, 2000000000) > 0.0);

    std::cout << "  PASS" << std::endl;
}

void test_mortise_tenon() {
    std::cout << "Testing create_mortise_tenon..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    EntityId a = created_id(call(handler, "create_component",
                                 {{"type", "cube"}, {"dimensions", {10, 10, 10}}}));
    EntityId b = created_id(call(handler, "create_component",
                                 {{"type", "cube"}, {"position", {10, 0, 0}},
                                  {"dimensions", {10, 10, 10}}}));
    size_t groups = scene.group_count();

    json resp = call(handler, "create_mortise_tenon",
                     {{"mortise_id", a}, {"tenon_id", b},
                      {"width", 2}, {"height", 2}, {"depth", 2}});
    assert(resp["result"]["structured"]["mortise_face"] == "east");
    assert(resp["result"]["structured"]["tenon_face"] == "west");
    assert(near(scene.volume(a), 992.0, 1e-4));
    assert(near(scene.volume(b), 1008.0, 1e-4));
    assert(scene.shell_count(b) == 1);
    assert(scene.group_count() == groups);

    resp = call(handler, "create_mortise_tenon", {{"mortise_id", a}, {"tenon_id", a}});
    assert(resp.contains("error"));

    resp = call(handler, "create_mortise_tenon", {{"mortise_id", 404}, {"tenon_id", 405}});
    assert(error_message(resp) == "Entity not found: mortise, tenon");

    std::cout << "  PASS" << std::endl;
}

void test_dovetail() {
    std::cout << "Testing create_dovetail..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    EntityId tail = created_id(call(handler, "create_component",
                                    {{"type", "cube"}, {"dimensions", {20, 20, 5}}}));
    EntityId pin = created_id(call(handler, "create_component",
                                   {{"type", "cube"}, {"position", {20, 0, 0}},
                                    {"dimensions", {20, 20, 5}}}));
    double tail_before = scene.volume(tail);
    double pin_before = scene.volume(pin);

    json resp = call(handler, "create_dovetail",
                     {{"tail_id", tail}, {"pin_id", pin}, {"width", 12},
                      {"height", 2}, {"depth", 1}, {"num_tails", 3}});
    assert(near(resp["result"]["structured"]["tail_width"].get<double>(), 2.4));
    assert(resp["result"]["structured"]["face"] == "east");

    // Each tail is a trapezoid 2.4 wide on the face, flared by tan(15) per
    // side at depth 1, and 2 high
    double flare = std::tan(15.0 * PI / 180.0);
    double tail_area = (2.4 + 2.4 + 2.0 * flare) / 2.0;
    assert(near(scene.volume(tail) - tail_before, 3.0 * tail_area * 2.0, 1e-4));

    // Pins are built on the same face label as the tails: a 12 x 2 x 1
    // block less the cutters, whose outer flares overhang the block
    double cut_area = 3.0 * tail_area - 2.0 * (flare / 2.0);
    assert(near(scene.volume(pin) - pin_before, 24.0 - cut_area * 2.0, 1e-4));
    assert(scene.shell_count(pin) == 1);

    resp = call(handler, "create_dovetail", {{"tail_id", tail}, {"pin_id", pin}, {"num_tails", 0}});
    assert(resp.contains("error"));

    double tail_after = scene.volume(tail);
    resp = call(handler, "create_dovetail", {{"tail_id", tail}, {"pin_id", pin}, {"num_tails", 3e9}});
    assert(error_message(resp) == "Joint count must be at most 1000");
    resp = call(handler, "create_dovetail", {{"tail_id", tail}, {"pin_id", pin}, {"num_tails", 2.5}});
    assert(error_message(resp) == "Joint count must be a whole number");
    assert(near(scene.volume(tail), tail_after));

    std::cout << "  PASS" << std::endl;
}

void test_finger_joint() {
    std::cout << "Testing create_finger_joint..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);

    EntityId a = created_id(call(handler, "create_component",
                                 {{"type", "cube"}, {"dimensions", {10, 10, 10}}}));
    EntityId b = created_id(call(handler, "create_component",
                                 {{"type", "cube"}, {"position", {10, 0, 0}},
                                  {"dimensions", {10, 10, 10}}}));

    json resp = call(handler, "create_finger_joint",
                     {{"board1_id", a}, {"board2_id", b}, {"width", 5},
                      {"height", 2}, {"depth", 1}, {"num_fingers", 5}});
    assert(resp["result"]["structured"]["board1_cuts"] == 2);
    assert(resp["result"]["structured"]["board2_slots"] == 3);
    assert(near(scene.volume(a), 1006.0, 1e-4));
    assert(near(scene.volume(b), 994.0, 1e-4));

    resp = call(handler, "create_finger_joint",
                {{"board1_id", a}, {"board2_id", b}, {"num_fingers", 100000}});
    assert(error_message(resp) == "Joint count must be at most 1000");
    assert(near(scene.volume(b), 994.0, 1e-4));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Transport
// ═══════════════════════════════════════════════════════════════════════════

void test_socket_roundtrip() {
    std::cout << "Testing socket round trip..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);
    SocketServer server("127.0.0.1", 0);
    assert(server.start());
    assert(server.running());
    uint16_t port = server.port();
    assert(port != 0);

    std::optional<std::string> reply;
    std::thread client_thread([&reply, port]() {
        SocketClient client("127.0.0.1", port);
        reply = client.request(
            R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"create_component","arguments":{"type":"cube"}}})");
    });

    std::optional<ClientRequest> request;
    for (int i = 0; i < 50 && !request; ++i) {
        request = server.poll(100);
    }
    assert(request);
    server.respond(*request, handler.handle(request->data));
    client_thread.join();

    assert(reply);
    json resp = json::parse(*reply);
    assert(resp["id"] == 9);
    assert(resp["result"]["success"] == true);
    assert(scene.group_count() == 1);

    // Nobody connecting: poll returns empty after the timeout
    assert(!server.poll(10));

    server.stop();
    assert(!server.running());

    std::cout << "  PASS" << std::endl;
}

void test_socket_one_connection_per_tick() {
    std::cout << "Testing one connection per poll..." << std::endl;

    Scene scene;
    rpc::Handler handler(scene);
    SocketServer server("127.0.0.1", 0);
    assert(server.start());
    uint16_t port = server.port();

    std::atomic<int> answered{0};
    std::optional<std::string> replies[2];
    auto send = [&answered, &replies, port](int slot) {
        SocketClient client("127.0.0.1", port);
        replies[slot] = client.request(
            R"({"jsonrpc":"2.0","id":)" + std::to_string(slot + 1) +
            R"(,"method":"tools/call","params":{"name":"create_component","arguments":{"type":"cube"}}})");
        answered++;
    };
    std::thread first(send, 0);
    std::thread second(send, 1);

    // Both connections are queued before the first poll
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto request = server.poll(100);
    assert(request);
    server.respond(*request, handler.handle(request->data));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    assert(answered == 1);
    assert(scene.group_count() == 1);

    request.reset();
    for (int i = 0; i < 50 && !request; ++i) {
        request = server.poll(100);
    }
    assert(request);
    server.respond(*request, handler.handle(request->data));
    first.join();
    second.join();

    assert(answered == 2);
    assert(replies[0] && replies[1]);
    json a = json::parse(*replies[0]);
    json b = json::parse(*replies[1]);
    assert(a["id"] == 1 && b["id"] == 2);
    assert(a["result"]["success"] == true && b["result"]["success"] == true);
    assert(scene.group_count() == 2);

    server.stop();

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== kerf Tests ===" << std::endl;

    test_parse_error();
    test_legacy_shape();
    test_unknown_method_and_tool();
    test_lifecycle_methods();

    test_create_cube();
    test_create_round_primitives();
    test_transform_roundtrip();
    test_transform_rotation();
    test_delete_and_selection();
    test_set_material();
    test_export();

    test_boolean_missing_entity();
    test_boolean_operations();

    test_chamfer();
    test_fillet();
    test_edge_selection();

    test_joint_planning();
    test_mortise_tenon();
    test_dovetail();
    test_finger_joint();

    test_socket_roundtrip();
    test_socket_one_connection_per_tick();

    std::cout << "\n=== All tests passed ===" << std::endl;
    return 0;
}
