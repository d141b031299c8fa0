#include "box_geometry.hpp"

namespace scriptscene::scene {

namespace {

// Emits one face as a (gridX x gridY) quad grid. u, v, w are axis indices:
// the face spans u/v and sits at w = depth / 2.
void build_face(BoxGeometry& out, int u, int v, int w, float udir, float vdir,
                float width, float height, float depth, std::uint32_t gridX, std::uint32_t gridY) {
    const float segmentWidth = width / static_cast<float>(gridX);
    const float segmentHeight = height / static_cast<float>(gridY);
    const float halfWidth = width / 2.0f;
    const float halfHeight = height / 2.0f;
    const float halfDepth = depth / 2.0f;

    const std::uint32_t gridX1 = gridX + 1;
    const std::uint32_t gridY1 = gridY + 1;
    const std::uint32_t base = out.vertex_count();

    for (std::uint32_t iy = 0; iy < gridY1; ++iy) {
        const float y = static_cast<float>(iy) * segmentHeight - halfHeight;

        for (std::uint32_t ix = 0; ix < gridX1; ++ix) {
            const float x = static_cast<float>(ix) * segmentWidth - halfWidth;

            float p[3] = {0.0f, 0.0f, 0.0f};
            p[u] = x * udir;
            p[v] = y * vdir;
            p[w] = halfDepth;
            out.positions.insert(out.positions.end(), {p[0], p[1], p[2]});

            float n[3] = {0.0f, 0.0f, 0.0f};
            n[w] = depth > 0.0f ? 1.0f : -1.0f;
            out.normals.insert(out.normals.end(), {n[0], n[1], n[2]});

            out.texcoords.push_back(static_cast<float>(ix) / static_cast<float>(gridX));
            out.texcoords.push_back(1.0f - static_cast<float>(iy) / static_cast<float>(gridY));
        }
    }

    for (std::uint32_t iy = 0; iy < gridY; ++iy) {
        for (std::uint32_t ix = 0; ix < gridX; ++ix) {
            const std::uint32_t a = base + ix + gridX1 * iy;
            const std::uint32_t b = base + ix + gridX1 * (iy + 1);
            const std::uint32_t c = base + (ix + 1) + gridX1 * (iy + 1);
            const std::uint32_t d = base + (ix + 1) + gridX1 * iy;

            out.indices.insert(out.indices.end(), {a, b, d, b, c, d});
        }
    }
}

} // namespace

BoxGeometry build_box_geometry(const std::array<float, 3>& size, const std::array<std::uint32_t, 3>& segments) {
    const float width = size[0];
    const float height = size[1];
    const float depth = size[2];
    const std::uint32_t sx = segments[0];
    const std::uint32_t sy = segments[1];
    const std::uint32_t sz = segments[2];

    BoxGeometry out;

    // +x, -x, +y, -y, +z, -z
    build_face(out, 2, 1, 0, -1.0f, -1.0f, depth, height, width, sz, sy);
    build_face(out, 2, 1, 0, 1.0f, -1.0f, depth, height, -width, sz, sy);
    build_face(out, 0, 2, 1, 1.0f, 1.0f, width, depth, height, sx, sz);
    build_face(out, 0, 2, 1, 1.0f, -1.0f, width, depth, -height, sx, sz);
    build_face(out, 0, 1, 2, 1.0f, -1.0f, width, height, depth, sx, sy);
    build_face(out, 0, 1, 2, -1.0f, -1.0f, width, height, -depth, sx, sy);

    return out;
}

} // namespace scriptscene::scene
