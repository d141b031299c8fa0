#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace scriptscene::scene {

// CPU-side box mesh: six segmented faces, centred on the origin.
struct BoxGeometry {
    std::vector<float> positions;  // xyz
    std::vector<float> normals;    // xyz
    std::vector<float> texcoords;  // uv
    std::vector<std::uint32_t> indices;

    std::uint32_t vertex_count() const { return static_cast<std::uint32_t>(positions.size() / 3); }
};

// `segments` are per axis (x, y, z) and must be at least 1.
BoxGeometry build_box_geometry(const std::array<float, 3>& size, const std::array<std::uint32_t, 3>& segments);

} // namespace scriptscene::scene
