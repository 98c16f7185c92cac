#pragma once

#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace toolwire::mcp {

constexpr std::size_t kDefaultMaxFrameBytes = 4U * 1024U * 1024U;

class Transport {
 public:
  virtual ~Transport() = default;

  // Next complete frame, or std::nullopt once the stream has ended. Throws TransportError.
  virtual std::optional<std::string> receive() = 0;

  // Writes one frame atomically with respect to other senders. Returns false when the
  // transport is already closed. Throws TransportError when the write fails.
  virtual bool send(std::string_view frame) = 0;

  virtual void close() noexcept = 0;
};

// Newline-delimited frames over a stream pair (stdin/stdout in the server binary).
class StreamTransport : public Transport {
 public:
  StreamTransport(std::istream& in, std::ostream& out, std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

  StreamTransport(const StreamTransport&) = delete;
  StreamTransport& operator=(const StreamTransport&) = delete;

  std::optional<std::string> receive() override;
  bool send(std::string_view frame) override;
  void close() noexcept override;

  [[nodiscard]] bool closed() const noexcept { return closed_.load(); }

 private:
  std::istream& in_;
  std::ostream& out_;
  std::size_t max_frame_bytes_;
  std::mutex write_mutex_;
  std::atomic<bool> closed_{false};
  bool end_of_stream_{false};
};

}  // namespace toolwire::mcp
