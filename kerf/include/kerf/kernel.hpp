#pragma once
// Kernel: the host geometry interface consumed by the tool handlers
//
// Handlers never own entities. They look them up by id, mutate them
// through this interface, and erase what they created as scratch.
// Every failure inside the kernel is reported as KernelError.

#include <kerf/types.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace kerf {

class KernelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class EntityKind {
    Group,
    Face,
    Unknown
};

inline const char* entity_kind_name(EntityKind kind) {
    switch (kind) {
        case EntityKind::Group: return "group";
        case EntityKind::Face: return "face";
        default: return "unknown";
    }
}

// Undirected edge of a group's faces, in group-local coordinates
struct Edge {
    Vec3 start = Vec3::Zero();
    Vec3 end = Vec3::Zero();
};

enum class ExportFormat {
    Skp,
    Obj,
    Dae,
    Stl,
    Png,
    Jpg
};

inline std::optional<ExportFormat> export_format_from_string(const std::string& s) {
    if (s == "skp") return ExportFormat::Skp;
    if (s == "obj") return ExportFormat::Obj;
    if (s == "dae") return ExportFormat::Dae;
    if (s == "stl") return ExportFormat::Stl;
    if (s == "png") return ExportFormat::Png;
    if (s == "jpg" || s == "jpeg") return ExportFormat::Jpg;
    return std::nullopt;
}

inline const char* export_format_extension(ExportFormat format) {
    switch (format) {
        case ExportFormat::Skp: return "skp";
        case ExportFormat::Obj: return "obj";
        case ExportFormat::Dae: return "dae";
        case ExportFormat::Stl: return "stl";
        case ExportFormat::Png: return "png";
        case ExportFormat::Jpg: return "jpg";
    }
    return "bin";
}

inline bool is_image_format(ExportFormat format) {
    return format == ExportFormat::Png || format == ExportFormat::Jpg;
}

class Kernel {
public:
    virtual ~Kernel() = default;

    // Lookup
    virtual bool valid(EntityId id) const = 0;
    virtual EntityKind kind(EntityId id) const = 0;
    virtual std::vector<EntityId> top_level() const = 0;
    virtual std::vector<EntityId> selection() const = 0;

    // Construction. add_face returns nullopt for degenerate input.
    virtual EntityId create_group() = 0;
    virtual std::optional<EntityId> add_face(EntityId group, const Polygon& points) = 0;
    virtual void pushpull(EntityId face, double distance) = 0;

    // Placement
    virtual Transform transformation(EntityId group) const = 0;
    virtual void set_transformation(EntityId group, const Transform& t) = 0;
    virtual void transform(EntityId group, const Transform& t) = 0;

    // Measurement (world coordinates)
    virtual Bounds bounds(EntityId id) const = 0;
    virtual double volume(EntityId group) const = 0;

    // Group contents in group-local coordinates
    virtual std::vector<Polygon> faces(EntityId group) const = 0;
    virtual std::vector<Edge> edges(EntityId group) const = 0;
    virtual void replace_faces(EntityId group, const std::vector<Polygon>& faces) = 0;

    // Copies
    virtual EntityId copy(EntityId group) = 0;
    virtual void copy_geometry(EntityId from, EntityId into) = 0;

    // Solid booleans. target/into keep their own transforms.
    virtual void subtract(EntityId target, EntityId tool) = 0;
    virtual void intersect(EntityId a, EntityId b, EntityId into) = 0;
    virtual void outer_shell(EntityId group) = 0;

    virtual void erase(EntityId id) = 0;

    // Materials: get-or-create by name, optional color, assign to entity
    virtual void set_material(EntityId id, const std::string& name,
                              const std::optional<Color>& color) = 0;
    virtual std::optional<std::string> material(EntityId id) const = 0;

    // Document output
    virtual void save(const std::string& path, ExportFormat format) = 0;
    virtual void render_view(const std::string& path, ExportFormat format,
                             int width, int height) = 0;
};

// Scratch group that is erased when it leaves scope
class ScratchGroup {
public:
    ScratchGroup(Kernel& kernel, EntityId id) : kernel_(&kernel), id_(id) {}
    explicit ScratchGroup(Kernel& kernel) : kernel_(&kernel), id_(kernel.create_group()) {}

    ~ScratchGroup() { reset(); }

    ScratchGroup(const ScratchGroup&) = delete;
    ScratchGroup& operator=(const ScratchGroup&) = delete;

    ScratchGroup(ScratchGroup&& other) noexcept : kernel_(other.kernel_), id_(other.id_) {
        other.id_ = 0;
    }

    EntityId id() const { return id_; }

    // Keep the group: it becomes a real result
    EntityId release() {
        EntityId id = id_;
        id_ = 0;
        return id;
    }

    void reset() {
        if (id_ != 0 && kernel_->valid(id_)) {
            try {
                kernel_->erase(id_);
            } catch (const KernelError&) {
                // Already detached by the host; nothing left to clean up
            }
        }
        id_ = 0;
    }

private:
    Kernel* kernel_;
    EntityId id_;
};

} // namespace kerf
