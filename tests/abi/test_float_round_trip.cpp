/**
 * @file test_float_round_trip.cpp
 * @brief Float arrays written by a guest read back bit for bit.
 */

#include <catch2/catch_test_macros.hpp>

#include "helpers/host_fixture.hpp"

#include <bit>
#include <cmath>
#include <cstring>
#include <random>
#include <vector>

using namespace scriptscene;
using namespace test_helpers;

namespace {

constexpr int kIterations = 10000;

// Any finite or infinite float; NaN payloads are excluded.
float random_float(std::mt19937& rng) {
    for (;;) {
        const float f = std::bit_cast<float>(static_cast<std::uint32_t>(rng()));
        if (!std::isnan(f)) return f;
    }
}

std::vector<float> random_vector(std::mt19937& rng, std::size_t n) {
    std::vector<float> v(n);
    for (float& f : v) f = random_float(rng);
    return v;
}

bool same_bits(const std::vector<float>& a, const std::vector<float>& b) {
    return a.size() == b.size() && std::memcmp(a.data(), b.data(), a.size() * sizeof(float)) == 0;
}

void write_guest(GuestMemory& mem, std::uint32_t ptr, const std::vector<float>& v) {
    std::memcpy(mem.bytes().data() + ptr, v.data(), v.size() * sizeof(float));
}

} // namespace

TEST_CASE("Float arrays survive set and get unchanged", "[abi][float]") {
    TwoEnvFixture f;
    std::mt19937 rng(0x5eed);

    const double material = f.call(f.a, "world_create_material", {double(material_block(f.a.memory, 0))});
    const double light = f.call(f.a, "create_light", {1.0});
    const double node = f.create_node(f.a);
    REQUIRE(material > 0.0);
    REQUIRE(light > 0.0);
    REQUIRE(node > 0.0);

    const std::uint32_t in = f.a.memory.alloc(64, 4);
    const std::uint32_t out = f.a.memory.alloc(64, 4);

    SECTION("length 4: material base color") {
        for (int i = 0; i < kIterations; ++i) {
            const auto v = random_vector(rng, 4);
            write_guest(f.a.memory, in, v);
            REQUIRE(f.call(f.a, "material_set_base_color_factor", {material, double(in)}) == 0.0);
            REQUIRE(f.call(f.a, "material_get_base_color_factor", {material, double(out)}) == 0.0);
            REQUIRE(same_bits(read_floats(f.a.memory, out, 4), v));
        }
    }

    SECTION("length 3: light color") {
        for (int i = 0; i < kIterations; ++i) {
            const auto v = random_vector(rng, 3);
            write_guest(f.a.memory, in, v);
            REQUIRE(f.call(f.a, "light_set_color", {light, double(in)}) == 0.0);
            REQUIRE(f.call(f.a, "light_get_color", {light, double(out)}) == 0.0);
            REQUIRE(same_bits(read_floats(f.a.memory, out, 3), v));
        }
    }

    SECTION("length 16: node matrix") {
        for (int i = 0; i < kIterations; ++i) {
            const auto v = random_vector(rng, 16);
            write_guest(f.a.memory, in, v);
            REQUIRE(f.call(f.a, "node_set_matrix", {node, double(in)}) == 0.0);
            REQUIRE(f.call(f.a, "node_get_matrix", {node, double(out)}) == 0.0);
            REQUIRE(same_bits(read_floats(f.a.memory, out, 16), v));
        }
    }

    SECTION("length 2: cursor arrays") {
        for (int i = 0; i < kIterations; ++i) {
            const auto v = random_vector(rng, 2);
            CursorView cursor = f.a.memory.cursor(f.config.memory.max_string_bytes);
            cursor.move_to(in);
            cursor.write_f32_array(v);

            std::vector<float> back(2);
            cursor.move_to(in);
            cursor.read_f32_array(back);
            REQUIRE(same_bits(back, v));
        }
    }
}
