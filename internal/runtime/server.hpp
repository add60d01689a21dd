#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "internal/config/options.hpp"
#include "internal/runtime/periodic_worker.hpp"

namespace taskorch::runtime {

/*
  Server

  Owns the gRPC services and the background workers of one
  orchestrator process.

    Start: listen -> workers
    Stop:  workers -> drain RPCs until the grace deadline

  Workers start only once the port is bound, so a second instance on
  the same address fails before it sweeps or reviews anything.
*/
class Server {
 public:
  Server(taskorch::config::ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services,
         std::vector<std::shared_ptr<BackgroundWorker>> workers = {});
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  // Idempotent.
  void Stop();

  // The port actually bound; differs from bind_address for ":0".
  int Port() const {
    return selected_port_;
  }

 private:
  taskorch::config::ServerOptions                options_;
  std::vector<std::unique_ptr<::grpc::Service>>  services_;
  std::vector<std::shared_ptr<BackgroundWorker>> workers_;
  std::unique_ptr<::grpc::Server>                grpc_server_;
  int                                            selected_port_{0};
  bool                                           workers_running_{false};
};

} // namespace taskorch::runtime
