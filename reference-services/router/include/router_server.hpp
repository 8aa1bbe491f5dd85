#pragma once

#include "router-service.grpc.pb.h"
#include <portmapper/router.hpp>
#include <grpcpp/grpcpp.h>
#include <memory>
#include <string>
#include <vector>

namespace portmapper::reference {

// Combined service that exposes the configured routers over gRPC
class RouterServer final :
    public portmapper::router_service::list_routers_service::Service,
    public portmapper::router_service::connect_router_service::Service,
    public portmapper::router_service::disconnect_router_service::Service,
    public portmapper::router_service::get_local_host_address_service::Service {
public:
    explicit RouterServer(std::vector<std::unique_ptr<Router>> routers);
    ~RouterServer();

    // Server lifecycle
    void Start(const std::string& listen_address);
    void Shutdown();
    void Wait();

    // list_routers_service methods
    grpc::Status list_routers(grpc::ServerContext* context,
                              const portmapper::router_service::list_routers_request* request,
                              portmapper::router_service::list_routers_response* response) override;

    // connect_router_service methods
    grpc::Status connect_router(grpc::ServerContext* context,
                                const portmapper::router_service::connect_router_request* request,
                                portmapper::router_service::connect_router_response* response) override;

    // disconnect_router_service methods
    grpc::Status disconnect_router(grpc::ServerContext* context,
                                   const portmapper::router_service::disconnect_router_request* request,
                                   portmapper::router_service::disconnect_router_response* response) override;

    // get_local_host_address_service methods
    grpc::Status get_local_host_address(grpc::ServerContext* context,
                                        const portmapper::router_service::get_local_host_address_request* request,
                                        portmapper::router_service::get_local_host_address_response* response) override;

private:
    Router* find_router(const std::string& name) const;
    static void fill_router_info(const Router& router,
                                 portmapper::router_service::router_info_t* info);

    std::unique_ptr<grpc::Server> server_;

    // Fixed at construction; Router accessors are safe to call concurrently
    std::vector<std::unique_ptr<Router>> routers_;
};

} // namespace portmapper::reference
