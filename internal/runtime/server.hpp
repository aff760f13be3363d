#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace slideshow::runtime {

class Server {
public:
  // max_message_bytes of zero keeps the gRPC default.
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services, int max_message_bytes = 0);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

private:
  std::string bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  int max_message_bytes_;
  std::unique_ptr<::grpc::Server> grpc_server_;
};

} // namespace slideshow::runtime
