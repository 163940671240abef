#include <kerf/scene.hpp>
#include <kerf/solid.hpp>
#include <kerf/export.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <tuple>

namespace kerf {

namespace {

// Points closer than this are merged when a face is added
constexpr double MERGE_TOLERANCE = 1e-9;
// Faces with less area than this are rejected as degenerate
constexpr double MIN_FACE_AREA = 1e-12;

// Drop repeated points (including a closing duplicate of the first point)
Polygon clean_polygon(const Polygon& points) {
    Polygon out;
    out.reserve(points.size());
    for (const auto& p : points) {
        if (out.empty() || !coincident(out.back(), p, MERGE_TOLERANCE)) {
            out.push_back(p);
        }
    }
    while (out.size() > 1 && coincident(out.front(), out.back(), MERGE_TOLERANCE)) {
        out.pop_back();
    }
    return out;
}

Polygon transform_polygon(const Transform& t, const Polygon& poly) {
    Polygon out = t.apply(poly);
    if (t.mirrors()) std::reverse(out.begin(), out.end());
    return out;
}

// Quantized point key for edge deduplication
using PointKey = std::tuple<long long, long long, long long>;

PointKey point_key(const Vec3& p) {
    constexpr double SCALE = 1e6;
    return {std::llround(p.x() * SCALE), std::llround(p.y() * SCALE), std::llround(p.z() * SCALE)};
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════
// Lookup
// ═══════════════════════════════════════════════════════════════════

bool Scene::valid(EntityId id) const {
    return groups_.count(id) > 0 || face_owner_.count(id) > 0;
}

EntityKind Scene::kind(EntityId id) const {
    if (groups_.count(id)) return EntityKind::Group;
    if (face_owner_.count(id)) return EntityKind::Face;
    return EntityKind::Unknown;
}

std::vector<EntityId> Scene::top_level() const {
    std::vector<EntityId> ids;
    ids.reserve(groups_.size());
    for (const auto& entry : groups_) ids.push_back(entry.first);
    return ids;
}

void Scene::select(const std::vector<EntityId>& ids) {
    selection_.clear();
    for (EntityId id : ids) {
        if (valid(id)) selection_.push_back(id);
    }
}

Scene::GroupRecord& Scene::group_ref(EntityId id) {
    auto it = groups_.find(id);
    if (it == groups_.end()) {
        throw KernelError("Group not found: " + std::to_string(id));
    }
    return it->second;
}

const Scene::GroupRecord& Scene::group_ref(EntityId id) const {
    auto it = groups_.find(id);
    if (it == groups_.end()) {
        throw KernelError("Group not found: " + std::to_string(id));
    }
    return it->second;
}

Scene::FaceRecord& Scene::face_ref(EntityId face, EntityId& owner, size_t& shell_index) {
    auto it = face_owner_.find(face);
    if (it == face_owner_.end()) {
        throw KernelError("Face not found: " + std::to_string(face));
    }
    owner = it->second;
    auto& g = group_ref(owner);
    for (size_t s = 0; s < g.shells.size(); ++s) {
        for (auto& rec : g.shells[s]) {
            if (rec.id == face) {
                shell_index = s;
                return rec;
            }
        }
    }
    throw KernelError("Face index out of sync: " + std::to_string(face));
}

size_t Scene::shell_count(EntityId group) const {
    return group_ref(group).shells.size();
}

// ═══════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════

EntityId Scene::create_group() {
    EntityId id = issue_id();
    groups_.emplace(id, GroupRecord{});
    return id;
}

std::optional<EntityId> Scene::add_face(EntityId group, const Polygon& points) {
    auto& g = group_ref(group);

    Polygon cleaned = clean_polygon(points);
    if (cleaned.size() < 3 || polygon_area(cleaned) < MIN_FACE_AREA) {
        return std::nullopt;
    }

    if (g.shells.empty()) g.shells.emplace_back();
    EntityId id = issue_id();
    g.shells.back().push_back({id, std::move(cleaned)});
    face_owner_[id] = group;
    return id;
}

void Scene::pushpull(EntityId face, double distance) {
    EntityId owner = 0;
    size_t shell_index = 0;
    FaceRecord& rec = face_ref(face, owner, shell_index);

    Vec3 normal = unit(polygon_normal(rec.points));
    if (is_zero(normal)) {
        throw KernelError("Cannot push/pull a degenerate face");
    }
    if (std::abs(distance) < EPSILON) return;

    const Polygon base = rec.points;
    const Vec3 offset = normal * distance;
    const bool outward = distance > 0;

    Polygon top;
    top.reserve(base.size());
    for (const auto& p : base) top.push_back(p + offset);

    // The original face becomes the cap on the far side of the extrusion
    Polygon cap = base;
    if (outward) {
        std::reverse(cap.begin(), cap.end());
    } else {
        std::reverse(top.begin(), top.end());
    }
    rec.points = cap;

    std::vector<Polygon> added;
    added.push_back(top);
    for (size_t i = 0; i < base.size(); ++i) {
        const Vec3& a = base[i];
        const Vec3& b = base[(i + 1) % base.size()];
        Polygon side = {a, b, b + offset, a + offset};
        if (!outward) std::reverse(side.begin(), side.end());
        added.push_back(std::move(side));
    }

    auto& shell = group_ref(owner).shells[shell_index];
    for (auto& poly : added) {
        EntityId id = issue_id();
        shell.push_back({id, std::move(poly)});
        face_owner_[id] = owner;
    }
}

Scene::Shell Scene::make_shell(EntityId owner, const std::vector<Polygon>& polys) {
    Shell shell;
    shell.reserve(polys.size());
    for (const auto& poly : polys) {
        Polygon cleaned = clean_polygon(poly);
        if (cleaned.size() < 3 || polygon_area(cleaned) < MIN_FACE_AREA) continue;
        EntityId id = issue_id();
        shell.push_back({id, std::move(cleaned)});
        face_owner_[id] = owner;
    }
    return shell;
}

std::vector<Polygon> Scene::shell_polygons(const Shell& shell) const {
    std::vector<Polygon> out;
    out.reserve(shell.size());
    for (const auto& rec : shell) out.push_back(rec.points);
    return out;
}

void Scene::drop_faces(GroupRecord& g) {
    for (const auto& shell : g.shells) {
        for (const auto& rec : shell) face_owner_.erase(rec.id);
    }
    g.shells.clear();
}

// ═══════════════════════════════════════════════════════════════════
// Placement and measurement
// ═══════════════════════════════════════════════════════════════════

Transform Scene::transformation(EntityId group) const {
    return group_ref(group).transform;
}

void Scene::set_transformation(EntityId group, const Transform& t) {
    group_ref(group).transform = t;
}

void Scene::transform(EntityId group, const Transform& t) {
    auto& g = group_ref(group);
    g.transform = t * g.transform;
}

Bounds Scene::bounds(EntityId id) const {
    Bounds b;
    if (auto it = groups_.find(id); it != groups_.end()) {
        for (const auto& shell : it->second.shells) {
            for (const auto& rec : shell) {
                for (const auto& p : rec.points) b.add(it->second.transform.apply(p));
            }
        }
        return b;
    }
    if (auto it = face_owner_.find(id); it != face_owner_.end()) {
        const auto& g = group_ref(it->second);
        for (const auto& shell : g.shells) {
            for (const auto& rec : shell) {
                if (rec.id != id) continue;
                for (const auto& p : rec.points) b.add(g.transform.apply(p));
            }
        }
        return b;
    }
    throw KernelError("Entity not found: " + std::to_string(id));
}

double Scene::volume(EntityId group) const {
    const auto& g = group_ref(group);
    double local = 0.0;
    for (const auto& shell : g.shells) {
        local += solid::volume(shell_polygons(shell));
    }
    return local * std::abs(g.transform.determinant3());
}

std::vector<Polygon> Scene::faces(EntityId group) const {
    std::vector<Polygon> out;
    for (const auto& shell : group_ref(group).shells) {
        for (const auto& rec : shell) out.push_back(rec.points);
    }
    return out;
}

std::vector<Edge> Scene::edges(EntityId group) const {
    std::vector<Edge> out;
    std::map<std::pair<PointKey, PointKey>, size_t> seen;

    for (const auto& shell : group_ref(group).shells) {
        for (const auto& rec : shell) {
            const auto& pts = rec.points;
            for (size_t i = 0; i < pts.size(); ++i) {
                const Vec3& a = pts[i];
                const Vec3& b = pts[(i + 1) % pts.size()];
                PointKey ka = point_key(a);
                PointKey kb = point_key(b);
                auto key = ka < kb ? std::make_pair(ka, kb) : std::make_pair(kb, ka);
                if (seen.emplace(key, out.size()).second) {
                    out.push_back({a, b});
                }
            }
        }
    }
    return out;
}

void Scene::replace_faces(EntityId group, const std::vector<Polygon>& polys) {
    auto& g = group_ref(group);
    drop_faces(g);
    g.shells.push_back(make_shell(group, polys));
}

// ═══════════════════════════════════════════════════════════════════
// Copies and booleans
// ═══════════════════════════════════════════════════════════════════

EntityId Scene::copy(EntityId group) {
    const GroupRecord source = group_ref(group);
    EntityId id = create_group();
    auto& g = group_ref(id);
    g.transform = source.transform;
    g.material = source.material;
    for (const auto& shell : source.shells) {
        g.shells.push_back(make_shell(id, shell_polygons(shell)));
    }
    return id;
}

void Scene::copy_geometry(EntityId from, EntityId into) {
    const GroupRecord source = group_ref(from);
    auto& target = group_ref(into);

    auto inv = target.transform.inverse();
    if (!inv) {
        throw KernelError("Target transform is not invertible");
    }
    // Source local -> world -> target local
    Transform to_local = *inv * source.transform;

    std::vector<Shell> shells;
    for (const auto& shell : source.shells) {
        std::vector<Polygon> polys;
        polys.reserve(shell.size());
        for (const auto& rec : shell) polys.push_back(transform_polygon(to_local, rec.points));
        shells.push_back(make_shell(into, polys));
    }
    auto& g = group_ref(into);
    for (auto& s : shells) g.shells.push_back(std::move(s));
}

std::vector<Polygon> Scene::world_solid(EntityId group) const {
    const auto& g = group_ref(group);
    std::vector<solid::Mesh> shells;
    for (const auto& shell : g.shells) {
        solid::Mesh mesh;
        mesh.reserve(shell.size());
        for (const auto& rec : shell) mesh.push_back(transform_polygon(g.transform, rec.points));
        shells.push_back(std::move(mesh));
    }
    if (shells.size() == 1) return shells.front();
    return solid::unite_all(shells);
}

void Scene::store_world_mesh(EntityId group, const std::vector<Polygon>& mesh, bool append) {
    auto& g = group_ref(group);
    auto inv = g.transform.inverse();
    if (!inv) {
        throw KernelError("Group transform is not invertible");
    }

    std::vector<Polygon> local;
    local.reserve(mesh.size());
    for (const auto& poly : mesh) local.push_back(transform_polygon(*inv, poly));

    if (!append) drop_faces(g);
    Shell shell = make_shell(group, local);
    group_ref(group).shells.push_back(std::move(shell));
}

void Scene::subtract(EntityId target, EntityId tool) {
    auto a = world_solid(target);
    auto b = world_solid(tool);
    store_world_mesh(target, solid::subtract(a, b), false);
}

void Scene::intersect(EntityId a, EntityId b, EntityId into) {
    auto ma = world_solid(a);
    auto mb = world_solid(b);
    group_ref(into);  // validate before computing
    store_world_mesh(into, solid::intersect(ma, mb), true);
}

void Scene::outer_shell(EntityId group) {
    if (group_ref(group).shells.size() <= 1) return;
    auto merged = world_solid(group);
    store_world_mesh(group, merged, false);
}

void Scene::erase(EntityId id) {
    if (auto it = groups_.find(id); it != groups_.end()) {
        drop_faces(it->second);
        groups_.erase(it);
    } else if (auto fit = face_owner_.find(id); fit != face_owner_.end()) {
        auto& g = group_ref(fit->second);
        for (auto& shell : g.shells) {
            shell.erase(std::remove_if(shell.begin(), shell.end(),
                                       [id](const FaceRecord& r) { return r.id == id; }),
                        shell.end());
        }
        face_owner_.erase(fit);
    } else {
        throw KernelError("Entity not found: " + std::to_string(id));
    }
    selection_.erase(std::remove(selection_.begin(), selection_.end(), id), selection_.end());
}

// ═══════════════════════════════════════════════════════════════════
// Materials
// ═══════════════════════════════════════════════════════════════════

std::optional<Color> Scene::named_color(const std::string& name) {
    static const std::map<std::string, Color> table = {
        {"red", {255, 0, 0}},
        {"green", {0, 128, 0}},
        {"blue", {0, 0, 255}},
        {"white", {255, 255, 255}},
        {"black", {0, 0, 0}},
        {"gray", {128, 128, 128}},
        {"grey", {128, 128, 128}},
        {"yellow", {255, 255, 0}},
        {"orange", {255, 165, 0}},
        {"brown", {139, 69, 19}},
        {"wood", {193, 154, 107}},
        {"oak", {196, 164, 132}},
        {"walnut", {93, 67, 44}},
        {"maple", {230, 205, 160}},
        {"cherry", {150, 74, 48}},
    };
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = table.find(key);
    if (it == table.end()) return std::nullopt;
    return it->second;
}

void Scene::set_material(EntityId id, const std::string& name,
                         const std::optional<Color>& color) {
    EntityId target = id;
    if (auto fit = face_owner_.find(id); fit != face_owner_.end()) {
        target = fit->second;
    }
    auto& g = group_ref(target);

    auto [it, created] = materials_.try_emplace(name, Material{name, std::nullopt});
    if (color) {
        it->second.color = color;
    } else if (created) {
        it->second.color = named_color(name);
    }
    g.material = name;
}

std::optional<std::string> Scene::material(EntityId id) const {
    EntityId target = id;
    if (auto fit = face_owner_.find(id); fit != face_owner_.end()) {
        target = fit->second;
    }
    return group_ref(target).material;
}

std::optional<Material> Scene::find_material(const std::string& name) const {
    auto it = materials_.find(name);
    if (it == materials_.end()) return std::nullopt;
    return it->second;
}

// ═══════════════════════════════════════════════════════════════════
// Document output
// ═══════════════════════════════════════════════════════════════════

std::vector<SceneSolid> Scene::solids() const {
    std::vector<SceneSolid> out;
    out.reserve(groups_.size());
    for (const auto& [id, g] : groups_) {
        SceneSolid solid;
        solid.id = id;
        for (const auto& shell : g.shells) {
            for (const auto& rec : shell) {
                solid.faces.push_back(transform_polygon(g.transform, rec.points));
            }
        }
        if (g.material) {
            solid.material = *g.material;
            if (auto m = find_material(*g.material)) solid.color = m->color;
        }
        out.push_back(std::move(solid));
    }
    return out;
}

void Scene::save(const std::string& path, ExportFormat format) {
    if (is_image_format(format)) {
        throw KernelError("Image formats are rendered, not saved");
    }
    write_model(solids(), path, format);
}

void Scene::render_view(const std::string& path, ExportFormat format,
                        int width, int height) {
    if (!is_image_format(format)) {
        throw KernelError("Render target must be png or jpg");
    }
    render_image(solids(), path, format, width, height);
}

} // namespace kerf
