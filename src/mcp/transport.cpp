#include "mcp/transport.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <streambuf>

#include "mcp/errors.hpp"

namespace toolwire::mcp {

namespace {

bool is_blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

StreamTransport::StreamTransport(std::istream& in, std::ostream& out, const std::size_t max_frame_bytes)
    : in_(in), out_(out), max_frame_bytes_(max_frame_bytes) {
  if (max_frame_bytes_ == 0) {
    throw std::invalid_argument("max_frame_bytes must be greater than 0");
  }
}

std::optional<std::string> StreamTransport::receive() {
  using traits = std::streambuf::traits_type;

  std::streambuf* buffer = in_.rdbuf();
  if (buffer == nullptr) {
    throw TransportError("input stream has no buffer");
  }

  std::string frame;
  while (!end_of_stream_ && !closed_.load()) {
    traits::int_type ch = traits::eof();
    try {
      ch = buffer->sbumpc();
    } catch (const std::exception& ex) {
      throw TransportError(std::string("read failed: ") + ex.what());
    }

    if (traits::eq_int_type(ch, traits::eof())) {
      end_of_stream_ = true;
      break;
    }

    const char c = traits::to_char_type(ch);
    if (c == '\n') {
      if (!frame.empty() && frame.back() == '\r') {
        frame.pop_back();
      }
      if (is_blank(frame)) {
        frame.clear();
        continue;
      }
      return frame;
    }

    if (frame.size() >= max_frame_bytes_) {
      throw TransportError("no frame delimiter within " + std::to_string(max_frame_bytes_) + " bytes");
    }
    frame.push_back(c);
  }

  // An unterminated final line still counts as a frame.
  if (!frame.empty() && frame.back() == '\r') {
    frame.pop_back();
  }
  if (is_blank(frame)) {
    return std::nullopt;
  }
  return frame;
}

bool StreamTransport::send(std::string_view frame) {
  if (frame.find('\n') != std::string_view::npos) {
    throw std::invalid_argument("frame must not contain a newline");
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (closed_.load()) {
    return false;
  }

  out_.write(frame.data(), static_cast<std::streamsize>(frame.size()));
  out_.put('\n');
  out_.flush();
  if (!out_) {
    throw TransportError("write to output stream failed");
  }
  return true;
}

void StreamTransport::close() noexcept {
  std::lock_guard<std::mutex> lock(write_mutex_);
  closed_.store(true);
}

}  // namespace toolwire::mcp
