#include <gtest/gtest.h>
#include "portmapper/config.hpp"
#include "portmapper/configured_router.hpp"
#include "test_doubles.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace portmapper;
using portmapper::test::FakeAddressProbe;

class ConfigTest : public ::testing::Test {
protected:
    const std::string full_config = R"(
resolver:
  probe_address: 203.0.113.1
  probe_port: 9
routers:
  - name: home-gateway
    host: 192.168.1.1
    port: 2869
    connect: true
  - name: lab-gateway
    host: gateway.lab.example
    port: 5000
)";
};

TEST_F(ConfigTest, ParsesRoutersAndResolver) {
    auto config = parse_config(full_config);

    EXPECT_EQ(config.resolver.probe_address, "203.0.113.1");
    EXPECT_EQ(config.resolver.probe_port, 9);

    ASSERT_EQ(config.routers.size(), 2u);
    EXPECT_EQ(config.routers[0].name, "home-gateway");
    EXPECT_EQ(config.routers[0].host, "192.168.1.1");
    EXPECT_EQ(config.routers[0].port, 2869);
    EXPECT_TRUE(config.routers[0].connect_on_start);
    EXPECT_EQ(config.routers[1].name, "lab-gateway");
    EXPECT_EQ(config.routers[1].host, "gateway.lab.example");
    EXPECT_EQ(config.routers[1].port, 5000);
    EXPECT_FALSE(config.routers[1].connect_on_start);
}

TEST_F(ConfigTest, ResolverDefaults) {
    auto config = parse_config(R"(
routers:
  - name: gw
    host: 10.0.0.1
    port: 80
)");

    EXPECT_EQ(config.resolver.probe_address, "255.255.255.0");
    EXPECT_EQ(config.resolver.probe_port, 0);
    EXPECT_EQ(config.routers.size(), 1u);
}

TEST_F(ConfigTest, EmptyDocument) {
    auto config = parse_config("");
    EXPECT_TRUE(config.routers.empty());
    EXPECT_EQ(config.resolver.probe_address, "255.255.255.0");
}

TEST_F(ConfigTest, RejectsInvalidRouters) {
    EXPECT_THROW(parse_config("routers:\n  - host: 10.0.0.1\n    port: 80\n"), std::runtime_error);
    EXPECT_THROW(parse_config("routers:\n  - name: gw\n    port: 80\n"), std::runtime_error);
    EXPECT_THROW(parse_config("routers:\n  - name: gw\n    host: 10.0.0.1\n"), std::runtime_error);
    EXPECT_THROW(parse_config("routers:\n  - name: gw\n    host: 10.0.0.1\n    port: 0\n"),
                 std::runtime_error);
    EXPECT_THROW(parse_config("routers:\n  - name: gw\n    host: 10.0.0.1\n    port: 70000\n"),
                 std::runtime_error);
    EXPECT_THROW(parse_config("routers:\n  - name: gw\n    host: 10.0.0.1\n    port: http\n"),
                 std::runtime_error);
    EXPECT_THROW(parse_config("routers: gw\n"), std::runtime_error);
}

TEST_F(ConfigTest, RejectsDuplicateNames) {
    try {
        parse_config(R"(
routers:
  - name: gw
    host: 10.0.0.1
    port: 80
  - name: gw
    host: 10.0.0.2
    port: 80
)");
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Duplicate router name: gw"), std::string::npos);
    }
}

TEST_F(ConfigTest, RejectsMalformedYaml) {
    EXPECT_THROW(parse_config("routers: [\n"), std::runtime_error);
    EXPECT_THROW(parse_config("- just\n- a list\n"), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() /
                ("portmapper-config-" + std::to_string(getpid()) + ".yml");
    {
        std::ofstream file(path);
        file << full_config;
    }

    auto config = load_config(path.string());
    std::filesystem::remove(path);

    EXPECT_EQ(config.routers.size(), 2u);
}

TEST_F(ConfigTest, LoadMissingFile) {
    EXPECT_THROW(load_config("/nonexistent/portmapper.yml"), std::runtime_error);
}

TEST_F(ConfigTest, MakeRoutersBuildsDisconnectedRouters) {
    auto probe = std::make_shared<FakeAddressProbe>();
    auto routers = make_routers(parse_config(full_config), probe);

    ASSERT_EQ(routers.size(), 2u);
    EXPECT_EQ(routers[0]->get_name(), "home-gateway");
    EXPECT_EQ(routers[0]->get_internal_host_name(), "192.168.1.1");
    EXPECT_FALSE(routers[0]->is_connected());
    EXPECT_EQ(routers[1]->to_string(), "lab-gateway (gateway.lab.example)");

    auto* configured = dynamic_cast<ConfiguredRouter*>(routers[0].get());
    ASSERT_NE(configured, nullptr);
    EXPECT_EQ(configured->configured_port(), 2869);
}

TEST_F(ConfigTest, MakeRoutersAppliesResolverOptions) {
    auto probe = std::make_shared<FakeAddressProbe>();
    probe->on_udp = FakeAddressProbe::returns("192.168.1.50");
    auto routers = make_routers(parse_config(full_config), probe);

    EXPECT_EQ(routers[0]->get_local_host_address(), "192.168.1.50");
    EXPECT_EQ(probe->last_udp_address, "203.0.113.1");
    EXPECT_EQ(probe->last_udp_port, 9);
}
