#ifndef RCACHE_NETWORK_TCP_REMOTE_STORE_HPP
#define RCACHE_NETWORK_TCP_REMOTE_STORE_HPP

#include <memory>
#include <string>
#include "network/connection.hpp"
#include "network/remote_store.hpp"

namespace rcache {
namespace network {

// RemoteStore over the framed TCP protocol. Each call opens its own connection,
// so concurrent lookups never share a socket.
class TcpRemoteStore : public RemoteStore {
public:
  // ---- CONSTRUCTOR ----
  TcpRemoteStore(Endpoint endpoint, std::string credential);


  // ---- ACTION CACHE ----
  void register_association(const std::string& fingerprint, const ActionResult& result) override;
  ActionResult lookup_association(const std::string& fingerprint) override;


  // ---- BYTE STREAM ----
  std::unique_ptr<UploadStream> open_upload_stream() override;
  std::unique_ptr<DownloadStream> open_download_stream(const std::string& resource_name) override;

private:
  Endpoint endpoint_;
  std::string credential_;

  std::unique_ptr<Connection> connect() const;
};

} // namespace network
} // namespace rcache

#endif // RCACHE_NETWORK_TCP_REMOTE_STORE_HPP
