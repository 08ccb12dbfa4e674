#ifndef __VC_STREAM_PROXY_HPP__
#define __VC_STREAM_PROXY_HPP__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace vc {
/**
 * @brief Thrown when the remote side of a tunnel fails or closes.  The
 * reconnect layer treats it as retryable.
 */
class TunnelBrokenException : public std::runtime_error {
 public:
  explicit TunnelBrokenException(const string& msg)
      : std::runtime_error(msg) {}
};

/**
 * @brief Fixed-size byte buffer with a start/end cursor pair around the
 * unconsumed region.
 */
class ProxyBuffer {
 public:
  explicit ProxyBuffer(size_t blockSize) : data(blockSize), start(0), end(0) {}

  bool empty() const { return start == end; }
  size_t pending() const { return end - start; }
  size_t room() const { return data.size() - end; }

  const char* readPtr() const { return &data[start]; }
  char* writePtr() { return &data[end]; }

  /** @brief Marks `count` bytes as written out; rewinds once drained. */
  void consume(size_t count) {
    start += count;
    if (start == end) {
      start = end = 0;
    }
  }

  /** @brief Marks `count` bytes past the end cursor as filled. */
  void commit(size_t count) { end += count; }

 protected:
  vector<char> data;
  size_t start;
  size_t end;
};

/**
 * @brief Relays bytes between a local input/output pair (normally the
 * terminal) and a connected remote socket until the operator types the escape
 * byte.
 *
 * Buffered data for a direction is always written out before anything new is
 * read, and nothing is read while either buffer still holds data.
 */
class StreamProxy {
 public:
  StreamProxy(shared_ptr<SocketHandler> _socketHandler, int _remoteFd,
              int _localInFd = STDIN_FILENO, int _localOutFd = STDOUT_FILENO,
              size_t blockSize = DEFAULT_PROXY_BLOCK_SIZE);

  /**
   * @brief Runs the relay loop.
   *
   * Returns after the escape byte (or end of local input) was seen and every
   * buffered byte was delivered.
   * @throws TunnelBrokenException when the remote socket errors or closes.
   * @throws std::runtime_error when the local descriptors fail.
   */
  void run();

  int64_t getBytesToRemote() const { return bytesToRemote; }
  int64_t getBytesToLocal() const { return bytesToLocal; }

 protected:
  void writeToLocal();
  void writeToRemote();
  /** @brief Blocks until a source is readable and fills the buffers. */
  void waitAndRead();
  void readFromLocal();
  void readFromRemote();

  shared_ptr<SocketHandler> socketHandler;
  int remoteFd;
  int localInFd;
  int localOutFd;
  /** @brief remote -> local */
  ProxyBuffer toLocal;
  /** @brief local -> remote */
  ProxyBuffer toRemote;
  bool finished;
  int64_t bytesToRemote;
  int64_t bytesToLocal;
};
}  // namespace vc

#endif  // __VC_STREAM_PROXY_HPP__
