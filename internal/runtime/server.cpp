#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace taskorch::runtime {

using observability::IntField;
using observability::StringField;

Server::Server(taskorch::config::ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services,
               std::vector<std::shared_ptr<BackgroundWorker>> workers)
    : options_(std::move(options)), services_(std::move(services)), workers_(std::move(workers)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) {
    return;
  }

  ::grpc::ServerBuilder builder;
  // gRPC defaults to SO_REUSEPORT; two orchestrators must not share a port
  builder.AddChannelArgument(GRPC_ARG_ALLOW_REUSEPORT, 0);
  builder.AddListeningPort(options_.bind_address, ::grpc::InsecureServerCredentials(), &selected_port_);
  if (options_.max_message_bytes > 0) {
    builder.SetMaxReceiveMessageSize(static_cast<int>(options_.max_message_bytes));
    builder.SetMaxSendMessageSize(static_cast<int>(options_.max_message_bytes));
  }

  // the builder only borrows the services
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to listen on " + options_.bind_address);
  }
  TASKORCH_LOG_INFO("gRPC server listening", {StringField("bind_address", options_.bind_address), IntField("port", selected_port_)});

  for (auto& worker : workers_) {
    worker->Start();
  }
  workers_running_ = true;
}

void Server::Wait() {
  if (grpc_server_) {
    grpc_server_->Wait();
  }
}

void Server::Stop() {
  // workers first so no sweep starts during the drain
  if (workers_running_) {
    for (auto& worker : workers_) {
      worker->Stop();
    }
    workers_running_ = false;
  }

  if (grpc_server_) {
    grpc_server_->Shutdown(std::chrono::system_clock::now() + options_.shutdown_grace);
    grpc_server_.reset();
    TASKORCH_LOG_INFO("gRPC server stopped", {IntField("port", selected_port_)});
  }
}

} // namespace taskorch::runtime
