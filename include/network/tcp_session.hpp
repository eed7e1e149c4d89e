#ifndef TCP_SESSION_HPP_
#define TCP_SESSION_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace netctrl {
namespace network {

enum class ReadMode {
  Blocking,
  NonBlocking
};

/**
 * One persistent TCP stream to a control endpoint.
 * Not thread-safe; the owner serializes access.
 */
class TCPSession {
 public:
  TCPSession();
  ~TCPSession();

  // Non-copyable
  TCPSession(const TCPSession&) = delete;
  TCPSession& operator=(const TCPSession&) = delete;

  /**
   * Connect to host:port. Throws ConnectionError when the host does not
   * resolve or refuses, TimeoutError when timeout_ms elapses first.
   */
  void connect(const std::string& host, uint16_t port, int timeout_ms = 5000);

  /**
   * Write every byte of data or throw IoError.
   */
  void write(const std::string& data);

  /**
   * Read up to max_bytes.
   * NonBlocking returns an empty string when nothing is queued.
   * Blocking waits up to timeout_ms (negative waits forever) for at least
   * one byte and throws TimeoutError on expiry.
   * Throws IoError on failure or when the peer closed the connection.
   */
  std::string readAvailable(size_t max_bytes, ReadMode mode, int timeout_ms = -1);

  /**
   * Release the socket. Safe to call repeatedly.
   */
  void close();

  bool isOpen() const { return socket_ >= 0; }

  /**
   * Get peer description for logging.
   */
  const std::string& getPeer() const { return peer_; }

 private:
  int socket_;
  std::string peer_;
};

}  // namespace network
}  // namespace netctrl

#endif  // TCP_SESSION_HPP_
