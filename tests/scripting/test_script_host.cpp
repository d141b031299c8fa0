/**
 * @file test_script_host.cpp
 * @brief Lua scripts driving the host through the websg and memory tables.
 */

#include <catch2/catch_test_macros.hpp>

#include "helpers/host_fixture.hpp"
#include "scriptscene/scripting/script_host.hpp"

#include <string>

using namespace scriptscene;
using namespace scriptscene::scripting;
using namespace test_helpers;
namespace res = scriptscene::resource;

namespace {

// Lua helper that builds a 68-byte node block in the script's heap.
const std::string kNodeBlockLua = R"lua(
local function node_block(name)
  local ptr = memory.alloc(68, 4)
  for i = 0, 16 do memory.write_u32(ptr + i * 4, 0) end
  memory.write_f32(ptr + 24, 1.0)
  for i = 0, 2 do memory.write_f32(ptr + 28 + i * 4, 1.0) end
  if name then
    local s = memory.alloc(#name, 1)
    memory.write_u32(ptr + 60, s)
    memory.write_u32(ptr + 64, memory.write_string(s, name))
  end
  return ptr
end
)lua";

struct ScriptFixture {
    core::HostConfig config{make_test_config()};
    host::HostContext host{config};
    ScriptHost scripts{host};

    EnvironmentId load(const std::string& name, const std::string& body) {
        EnvironmentId id = 0;
        const ScriptResult result = scripts.load_script(name, kNodeBlockLua + body, &id);
        INFO(result.error);
        REQUIRE(result);
        return id;
    }
};

} // namespace

TEST_CASE("Script creates and updates a node", "[scripting][host]") {
    ScriptFixture f;
    LogCapture log;

    const EnvironmentId id = f.load("spinner", R"lua(
node = 0
function on_init()
  node = websg.world_create_node(node_block("spinner_root"))
  print("created", node > 0)
end
function on_update(dt)
  websg.node_set_translation_element(node, 0, dt)
end
)lua");

    REQUIRE(log.contains("script", "[spinner] created\ttrue"));

    res::Resource* node = f.host.registry().find_by_name(res::ResourceType::Node, "spinner_root").front();
    REQUIRE(node->owner == id);

    f.scripts.update(0.5f);
    REQUIRE(node->as<res::Node>()->translation.x == 0.5f);

    REQUIRE(f.scripts.unload(id));
    REQUIRE(f.host.registry().size() == 0);
    REQUIRE(f.scripts.script_count() == 0);
}

TEST_CASE("Failed load leaves nothing behind", "[scripting][host]") {
    ScriptFixture f;
    LogCapture log;

    SECTION("runtime error in the chunk") {
        const ScriptResult result = f.scripts.load_script("broken", kNodeBlockLua + R"lua(
websg.world_create_node(node_block("orphan"))
error("boom")
)lua");
        REQUIRE_FALSE(result);
        REQUIRE(result.error.find("boom") != std::string::npos);
        REQUIRE(log.contains("script", "boom"));
    }

    SECTION("forbidden call") {
        const ScriptResult result = f.scripts.load_script("escape", "os.execute('ls')");
        REQUIRE_FALSE(result);
        REQUIRE(result.error.find("validation") != std::string::npos);
    }

    SECTION("syntax error") {
        REQUIRE_FALSE(f.scripts.load_script("typo", "function on_init("));
    }

    REQUIRE(f.host.registry().size() == 0);
    REQUIRE(f.scripts.script_count() == 0);
    REQUIRE(f.host.environment_ids().empty());
}

TEST_CASE("Guest errors stay inside the guest", "[scripting][host]") {
    ScriptFixture f;
    LogCapture log;

    const EnvironmentId id = f.load("careless", R"lua(
function on_init()
  print("bad id", websg.node_set_visible(4242, 1))
  print("bad arg", websg.node_set_visible("x", 1))
  print("unknown", websg.no_such_function == nil)
  local ok = pcall(memory.read_u32, 1e9)
  print("oob", ok)
end
function on_update(dt)
  error("update failed")
end
)lua");

    REQUIRE(log.contains("script", "bad id\t-1"));
    REQUIRE(log.contains("script", "bad arg\t-1"));
    REQUIRE(log.contains("script", "unknown\ttrue"));
    REQUIRE(log.contains("script", "oob\tfalse"));
    REQUIRE(log.contains("abi", "node_set_visible"));

    f.scripts.update(0.1f);
    REQUIRE(log.contains("script", "update failed"));
    REQUIRE(f.scripts.script(id)->is_loaded());
}

TEST_CASE("Scripts only see what they were granted", "[scripting][host]") {
    ScriptFixture f;
    LogCapture log;

    const ResourceId hostScene = f.host.create_resource(nullptr, "environment", res::Scene{}).id;
    f.host.set_environment_scene(hostScene);

    f.load("owner", R"lua(
function on_init()
  local scene = websg.world_get_environment()
  local node = websg.world_create_node(node_block("shared_name"))
  print("owner", scene, websg.scene_add_node(scene, node))
end
)lua");

    f.load("other", R"lua(
function on_init()
  local scene = websg.world_get_environment()
  local s = memory.alloc(11, 1)
  memory.write_string(s, "shared_name")
  print("other", websg.scene_get_node_count(scene), websg.world_find_node_by_name(s, 11))
end
)lua");

    REQUIRE(log.contains("script", "[owner] owner\t" + std::to_string(hostScene) + "\t0"));
    REQUIRE(log.contains("script", "[other] other\t0\t0"));
}

TEST_CASE("unload_all releases every script", "[scripting][host]") {
    ScriptFixture f;
    const ResourceId hostScene = f.host.create_resource(nullptr, "environment", res::Scene{}).id;
    f.host.set_environment_scene(hostScene);
    const std::size_t baseline = f.host.registry().size();

    const std::string body = R"lua(
function on_init()
  local scene = websg.world_get_environment()
  for i = 1, 3 do
    websg.scene_add_node(scene, websg.world_create_node(node_block()))
  end
end
function on_unload()
  print("bye")
end
)lua";

    f.load("one", body);
    f.load("two", body);
    REQUIRE(f.host.registry().size() == baseline + 6);

    LogCapture log;
    f.scripts.unload_all();
    REQUIRE(log.contains("script", "[one] bye"));
    REQUIRE(log.contains("script", "[two] bye"));
    REQUIRE(f.host.registry().size() == baseline);
    REQUIRE(f.host.registry().find_as<res::Scene>(hostScene)->firstNode == 0);
    REQUIRE(f.scripts.script_count() == 0);
}

TEST_CASE("load_file", "[scripting][host]") {
    ScriptFixture f;
    REQUIRE_FALSE(f.scripts.load_file("/nonexistent/dir/script.lua"));
    REQUIRE(f.scripts.script_count() == 0);
}
