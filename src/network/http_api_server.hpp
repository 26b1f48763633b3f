#ifndef PIIGUARD_NETWORK_HTTP_API_SERVER_HPP
#define PIIGUARD_NETWORK_HTTP_API_SERVER_HPP

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include "service_manager.hpp"
#include "../service/request.hpp"
#include "../service/response.hpp"
#include "../util/thread_pool.hpp"

namespace piiguard {
namespace network {

/*
  HttpApiServer
  --------------------------------------------------------
  A small HTTP/1.1 front for the ServiceManager over plain
  POSIX sockets.

  - One accept loop on its own thread; every accepted
    connection is handled on a ThreadPool worker.
  - One request per connection (Connection: close).
  - Bodies are read up to Content-Length; a declared length
    above maxContentLength is answered with 413 without
    reading the body.
  - The accept loop polls so Stop() returns promptly.
*/
class HttpApiServer {
  public:
    HttpApiServer(const ServiceManager& manager, const std::string& host, int port,
                  size_t maxContentLength, size_t workers)
        : m_manager(manager), m_host(host), m_port(port), m_maxContentLength(maxContentLength),
          m_workers(workers == 0 ? 1 : workers), m_serverFd(-1), m_running(false) {}

    ~HttpApiServer() { Stop(); }

    HttpApiServer(const HttpApiServer&) = delete;
    HttpApiServer& operator=(const HttpApiServer&) = delete;

    /// Binds and starts accepting. Returns false if the socket cannot be set up.
    bool Start();

    void Stop();

    bool IsRunning() const { return m_running.load(); }

    /// The bound port; useful when constructed with port 0.
    int Port() const { return m_port; }

    /**
     * Read one request from @p fd and answer it. Exposed for tests over a socketpair.
     */
    void HandleConnection(int fd) const;

  private:
    enum class ReadStatus { Ok, Closed, Malformed, TooLarge };

    void run();
    ReadStatus readRequest(int fd, service::Request& req, std::string& error) const;
    static bool sendAll(int fd, const std::string& data);

    const ServiceManager& m_manager;
    std::string m_host;
    int m_port;
    size_t m_maxContentLength;
    size_t m_workers;
    int m_serverFd;
    std::atomic_bool m_running;
    std::thread m_thread;
    std::unique_ptr<util::ThreadPool> m_pool;
};

} // namespace network
} // namespace piiguard

#endif // PIIGUARD_NETWORK_HTTP_API_SERVER_HPP
