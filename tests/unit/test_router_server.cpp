#include <gtest/gtest.h>
#include "router_server.hpp"
#include "portmapper/configured_router.hpp"
#include "test_doubles.hpp"
#include <cerrno>
#include <memory>
#include <system_error>

using namespace portmapper;
using portmapper::test::FakeAddressProbe;
namespace rs = portmapper::router_service;

class RouterServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        probe_ = std::make_shared<FakeAddressProbe>();
        probe_->on_tcp = FakeAddressProbe::returns("192.168.1.42");

        auto resolver = std::make_shared<const LocalAddressResolver>(probe_);
        std::vector<std::unique_ptr<Router>> routers;
        routers.push_back(std::make_unique<ConfiguredRouter>(
            "home-gateway", "192.168.1.1", 2869, probe_, resolver));
        routers.push_back(std::make_unique<ConfiguredRouter>(
            "lab-gateway", "10.0.0.1", 5000, probe_, resolver));
        server_ = std::make_unique<reference::RouterServer>(std::move(routers));
    }

    grpc::Status connect(const std::string& name, rs::connect_router_response* response) {
        rs::connect_router_request request;
        request.set_router_name(name);
        return server_->connect_router(&context_, &request, response);
    }

    grpc::Status resolve(const std::string& name, rs::get_local_host_address_response* response) {
        rs::get_local_host_address_request request;
        request.set_router_name(name);
        return server_->get_local_host_address(&context_, &request, response);
    }

    grpc::ServerContext context_;
    std::shared_ptr<FakeAddressProbe> probe_;
    std::unique_ptr<reference::RouterServer> server_;
};

TEST_F(RouterServerTest, ListRouters) {
    rs::list_routers_request request;
    rs::list_routers_response response;

    auto status = server_->list_routers(&context_, &request, &response);
    ASSERT_TRUE(status.ok());
    ASSERT_EQ(response.routers_size(), 2);

    const auto& first = response.routers(0);
    EXPECT_EQ(first.name(), "home-gateway");
    EXPECT_EQ(first.internal_host_name(), "192.168.1.1");
    EXPECT_EQ(first.internal_port(), -1);
    EXPECT_FALSE(first.connected());
    EXPECT_EQ(first.description(), "home-gateway (192.168.1.1)");
    EXPECT_EQ(response.routers(1).name(), "lab-gateway");
}

TEST_F(RouterServerTest, ConnectAndDisconnect) {
    rs::connect_router_response connected;
    ASSERT_TRUE(connect("home-gateway", &connected).ok());
    EXPECT_TRUE(connected.router().connected());
    EXPECT_EQ(connected.router().internal_port(), 2869);

    rs::disconnect_router_request request;
    request.set_router_name("home-gateway");
    rs::disconnect_router_response disconnected;
    ASSERT_TRUE(server_->disconnect_router(&context_, &request, &disconnected).ok());
    EXPECT_FALSE(disconnected.router().connected());

    // Disconnecting again is not an error
    rs::disconnect_router_response again;
    EXPECT_TRUE(server_->disconnect_router(&context_, &request, &again).ok());
}

TEST_F(RouterServerTest, ConnectFailureIsUnavailable) {
    probe_->on_tcp = [](const std::string&, uint16_t) -> std::optional<std::string> {
        throw std::system_error(ECONNREFUSED, std::generic_category(), "connect");
    };

    rs::connect_router_response response;
    auto status = connect("lab-gateway", &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_NE(status.error_message().find("Could not connect to router 10.0.0.1:5000"),
              std::string::npos);
}

TEST_F(RouterServerTest, GetLocalHostAddress) {
    rs::connect_router_response connected;
    ASSERT_TRUE(connect("home-gateway", &connected).ok());

    rs::get_local_host_address_response response;
    auto status = resolve("home-gateway", &response);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(response.address(), "192.168.1.42");
}

TEST_F(RouterServerTest, GetLocalHostAddressOnlyLoopback) {
    probe_->on_host = FakeAddressProbe::host_returns("127.0.0.1");
    probe_->on_udp = FakeAddressProbe::returns("127.0.0.1");

    rs::get_local_host_address_response response;
    auto status = resolve("lab-gateway", &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_NE(status.error_message().find("begins with '127.'"), std::string::npos);
    EXPECT_TRUE(response.address().empty());
}

TEST_F(RouterServerTest, UnknownRouter) {
    rs::connect_router_response connected;
    EXPECT_EQ(connect("attic", &connected).error_code(), grpc::StatusCode::NOT_FOUND);

    rs::get_local_host_address_response resolved;
    EXPECT_EQ(resolve("attic", &resolved).error_code(), grpc::StatusCode::NOT_FOUND);
}
