#include "router_server.hpp"
#include <portmapper/router_exception.hpp>
#include <glog/logging.h>
#include <grpcpp/server_builder.h>
#include <stdexcept>

namespace portmapper::reference {

namespace rs = portmapper::router_service;

RouterServer::RouterServer(std::vector<std::unique_ptr<Router>> routers)
    : routers_(std::move(routers)) {
    LOG(INFO) << "Initializing Router Server with " << routers_.size() << " router(s)";
}

RouterServer::~RouterServer() {
    if (server_) {
        Shutdown();
    }
    for (auto& router : routers_) {
        router->close();
    }
}

void RouterServer::Start(const std::string& listen_address) {
    grpc::ServerBuilder builder;
    builder.AddListeningPort(listen_address, grpc::InsecureServerCredentials());

    builder.RegisterService(static_cast<rs::list_routers_service::Service*>(this));
    builder.RegisterService(static_cast<rs::connect_router_service::Service*>(this));
    builder.RegisterService(static_cast<rs::disconnect_router_service::Service*>(this));
    builder.RegisterService(static_cast<rs::get_local_host_address_service::Service*>(this));

    server_ = builder.BuildAndStart();
    if (!server_) {
        throw std::runtime_error("Failed to listen on " + listen_address);
    }
    LOG(INFO) << "Router server listening on " << listen_address;
}

void RouterServer::Shutdown() {
    if (server_) {
        LOG(INFO) << "Shutting down router server";
        server_->Shutdown();
    }
}

void RouterServer::Wait() {
    if (server_) {
        server_->Wait();
    }
}

Router* RouterServer::find_router(const std::string& name) const {
    for (const auto& router : routers_) {
        if (router->get_name() == name) {
            return router.get();
        }
    }
    return nullptr;
}

void RouterServer::fill_router_info(const Router& router, rs::router_info_t* info) {
    info->set_name(router.get_name());
    info->set_internal_host_name(router.get_internal_host_name());
    info->set_internal_port(router.get_internal_port());
    info->set_connected(router.is_connected());
    info->set_description(router.to_string());
}

grpc::Status RouterServer::list_routers(
    grpc::ServerContext* context,
    const rs::list_routers_request* request,
    rs::list_routers_response* response) {

    VLOG(1) << "list_routers called";
    for (const auto& router : routers_) {
        fill_router_info(*router, response->add_routers());
    }
    return grpc::Status::OK;
}

grpc::Status RouterServer::connect_router(
    grpc::ServerContext* context,
    const rs::connect_router_request* request,
    rs::connect_router_response* response) {

    LOG(INFO) << "connect_router called for: " << request->router_name();
    Router* router = find_router(request->router_name());
    if (!router) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            "Router not found: " + request->router_name());
    }

    try {
        router->connect();
    } catch (const RouterException& e) {
        LOG(WARNING) << "Failed to connect router " << router->get_name() << ": "
                     << describe_exception(e);
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, describe_exception(e));
    }

    fill_router_info(*router, response->mutable_router());
    return grpc::Status::OK;
}

grpc::Status RouterServer::disconnect_router(
    grpc::ServerContext* context,
    const rs::disconnect_router_request* request,
    rs::disconnect_router_response* response) {

    LOG(INFO) << "disconnect_router called for: " << request->router_name();
    Router* router = find_router(request->router_name());
    if (!router) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            "Router not found: " + request->router_name());
    }

    router->close();
    fill_router_info(*router, response->mutable_router());
    return grpc::Status::OK;
}

grpc::Status RouterServer::get_local_host_address(
    grpc::ServerContext* context,
    const rs::get_local_host_address_request* request,
    rs::get_local_host_address_response* response) {

    VLOG(1) << "get_local_host_address called for: " << request->router_name();
    Router* router = find_router(request->router_name());
    if (!router) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            "Router not found: " + request->router_name());
    }

    try {
        response->set_address(router->get_local_host_address());
    } catch (const RouterException& e) {
        LOG(WARNING) << "Could not resolve local address via " << *router << ": "
                     << describe_exception(e);
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, describe_exception(e));
    }

    LOG(INFO) << "Local address via " << *router << " is " << response->address();
    return grpc::Status::OK;
}

} // namespace portmapper::reference
