#pragma once
// Scene: in-memory host model implementing the Kernel interface
//
// A flat list of groups. Each group has a transform, an optional material
// and one or more shells; a shell is a closed set of planar faces in
// group-local coordinates. Faces carry their own ids so push/pull can
// address them. Booleans run on world-space meshes (see solid.hpp) and are
// written back through the target's inverse transform.

#include <kerf/kernel.hpp>
#include <kerf/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kerf {

struct Material {
    std::string name;
    std::optional<Color> color;
};

// World-space view of a group, consumed by exporters and the renderer
struct SceneSolid {
    EntityId id = 0;
    std::vector<Polygon> faces;
    std::string material;
    std::optional<Color> color;
};

class Scene : public Kernel {
public:
    Scene() = default;

    // Non-copyable: ids are only meaningful inside one scene
    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    // Kernel interface
    bool valid(EntityId id) const override;
    EntityKind kind(EntityId id) const override;
    std::vector<EntityId> top_level() const override;
    std::vector<EntityId> selection() const override { return selection_; }

    EntityId create_group() override;
    std::optional<EntityId> add_face(EntityId group, const Polygon& points) override;
    void pushpull(EntityId face, double distance) override;

    Transform transformation(EntityId group) const override;
    void set_transformation(EntityId group, const Transform& t) override;
    void transform(EntityId group, const Transform& t) override;

    Bounds bounds(EntityId id) const override;
    double volume(EntityId group) const override;

    std::vector<Polygon> faces(EntityId group) const override;
    std::vector<Edge> edges(EntityId group) const override;
    void replace_faces(EntityId group, const std::vector<Polygon>& faces) override;

    EntityId copy(EntityId group) override;
    void copy_geometry(EntityId from, EntityId into) override;

    void subtract(EntityId target, EntityId tool) override;
    void intersect(EntityId a, EntityId b, EntityId into) override;
    void outer_shell(EntityId group) override;

    void erase(EntityId id) override;

    void set_material(EntityId id, const std::string& name,
                      const std::optional<Color>& color) override;
    std::optional<std::string> material(EntityId id) const override;

    void save(const std::string& path, ExportFormat format) override;
    void render_view(const std::string& path, ExportFormat format,
                     int width, int height) override;

    // Host-side operations (not part of the kernel contract)
    void select(const std::vector<EntityId>& ids);
    size_t group_count() const { return groups_.size(); }
    size_t shell_count(EntityId group) const;
    std::optional<Material> find_material(const std::string& name) const;
    std::vector<SceneSolid> solids() const;

    // Reference color for a handful of common material names
    static std::optional<Color> named_color(const std::string& name);

private:
    struct FaceRecord {
        EntityId id = 0;
        Polygon points;
    };

    using Shell = std::vector<FaceRecord>;

    struct GroupRecord {
        Transform transform;
        std::vector<Shell> shells;
        std::optional<std::string> material;
    };

    std::map<EntityId, GroupRecord> groups_;
    std::unordered_map<EntityId, EntityId> face_owner_;
    std::map<std::string, Material> materials_;
    std::vector<EntityId> selection_;
    EntityId next_id_ = 1;

    EntityId issue_id() { return next_id_++; }

    GroupRecord& group_ref(EntityId id);
    const GroupRecord& group_ref(EntityId id) const;

    FaceRecord& face_ref(EntityId face, EntityId& owner, size_t& shell_index);

    Shell make_shell(EntityId owner, const std::vector<Polygon>& polys);
    std::vector<Polygon> shell_polygons(const Shell& shell) const;

    // All shells of a group in world space, merged into one solid
    std::vector<Polygon> world_solid(EntityId group) const;

    // Replace a group's contents with a world-space mesh
    void store_world_mesh(EntityId group, const std::vector<Polygon>& mesh, bool append);

    void drop_faces(GroupRecord& g);
};

} // namespace kerf
