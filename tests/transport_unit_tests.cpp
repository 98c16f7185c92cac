#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>
#include <streambuf>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "mcp/errors.hpp"
#include "mcp/transport.hpp"

using toolwire::mcp::StreamTransport;
using toolwire::mcp::TransportError;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

// Hands out at most chunk_size bytes per underflow, like a pipe delivering partial reads.
class ChunkedStreambuf : public std::streambuf {
 public:
  ChunkedStreambuf(std::string data, std::size_t chunk_size) : data_(std::move(data)), chunk_size_(chunk_size) {}

 protected:
  int_type underflow() override {
    if (position_ >= data_.size()) {
      return traits_type::eof();
    }
    const std::size_t length = std::min(chunk_size_, data_.size() - position_);
    chunk_.assign(data_, position_, length);
    position_ += length;
    setg(chunk_.data(), chunk_.data(), chunk_.data() + chunk_.size());
    return traits_type::to_int_type(chunk_.front());
  }

 private:
  std::string data_;
  std::size_t chunk_size_;
  std::size_t position_{0};
  std::string chunk_;
};

int test_frames_survive_single_byte_chunks() {
  ChunkedStreambuf buffer("{\"a\":1}\n{\"b\":2}\n", 1);
  std::istream in(&buffer);
  std::ostringstream out;
  StreamTransport transport(in, out);

  const auto first = transport.receive();
  const auto second = transport.receive();
  const auto third = transport.receive();

  if (!first.has_value() || *first != "{\"a\":1}") {
    return fail("test_frames_survive_single_byte_chunks", "first frame mismatch");
  }
  if (!second.has_value() || *second != "{\"b\":2}") {
    return fail("test_frames_survive_single_byte_chunks", "second frame mismatch");
  }
  if (third.has_value()) {
    return fail("test_frames_survive_single_byte_chunks", "expected end of stream");
  }
  return 0;
}

int test_frame_split_across_uneven_chunks() {
  const std::string payload = "{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":7}";
  ChunkedStreambuf buffer(payload + "\n", 5);
  std::istream in(&buffer);
  std::ostringstream out;
  StreamTransport transport(in, out);

  const auto frame = transport.receive();
  if (!frame.has_value() || *frame != payload) {
    return fail("test_frame_split_across_uneven_chunks", "frame was not reassembled");
  }
  return 0;
}

int test_blank_lines_and_crlf_are_skipped() {
  std::istringstream in("\n\r\n  \n{\"x\":true}\r\n\n");
  std::ostringstream out;
  StreamTransport transport(in, out);

  const auto frame = transport.receive();
  if (!frame.has_value() || *frame != "{\"x\":true}") {
    return fail("test_blank_lines_and_crlf_are_skipped", "expected CR-stripped frame");
  }
  if (transport.receive().has_value()) {
    return fail("test_blank_lines_and_crlf_are_skipped", "trailing blank line produced a frame");
  }
  return 0;
}

int test_unterminated_final_line_is_a_frame() {
  std::istringstream in("{\"last\":1}");
  std::ostringstream out;
  StreamTransport transport(in, out);

  const auto frame = transport.receive();
  if (!frame.has_value() || *frame != "{\"last\":1}") {
    return fail("test_unterminated_final_line_is_a_frame", "expected final unterminated frame");
  }
  if (transport.receive().has_value()) {
    return fail("test_unterminated_final_line_is_a_frame", "expected end of stream after final frame");
  }
  return 0;
}

int test_missing_delimiter_is_fatal() {
  std::istringstream in(std::string(64, 'x') + "\n");
  std::ostringstream out;
  StreamTransport transport(in, out, 16);

  bool threw = false;
  try {
    (void)transport.receive();
  } catch (const TransportError&) {
    threw = true;
  }

  if (!threw) {
    return fail("test_missing_delimiter_is_fatal", "expected TransportError for oversized frame");
  }
  return 0;
}

int test_send_appends_delimiter() {
  std::istringstream in;
  std::ostringstream out;
  StreamTransport transport(in, out);

  if (!transport.send("{\"id\":1}") || !transport.send("{\"id\":2}")) {
    return fail("test_send_appends_delimiter", "send reported a closed transport");
  }
  if (out.str() != "{\"id\":1}\n{\"id\":2}\n") {
    return fail("test_send_appends_delimiter", "unexpected output framing");
  }
  return 0;
}

std::string thread_frame(const int t) {
  return "{\"thread\":" + std::to_string(t) + ",\"pad\":\"" + std::string(256, static_cast<char>('a' + t)) + "\"}";
}

int test_concurrent_sends_do_not_interleave() {
  std::istringstream in;
  std::ostringstream out;
  StreamTransport transport(in, out);

  constexpr int kThreads = 8;
  constexpr int kFramesPerThread = 200;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&transport, t]() {
      const std::string frame = thread_frame(t);
      for (int i = 0; i < kFramesPerThread; ++i) {
        (void)transport.send(frame);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<std::string> expected;
  for (int t = 0; t < kThreads; ++t) {
    expected.insert(thread_frame(t));
  }

  std::istringstream lines(out.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    if (expected.find(line) == expected.end()) {
      return fail("test_concurrent_sends_do_not_interleave", "found an interleaved frame");
    }
    ++count;
  }

  if (count != kThreads * kFramesPerThread) {
    return fail("test_concurrent_sends_do_not_interleave", "frame count mismatch");
  }
  return 0;
}

int test_send_after_close_is_dropped() {
  std::istringstream in("{\"a\":1}\n");
  std::ostringstream out;
  StreamTransport transport(in, out);
  transport.close();

  if (transport.send("{\"late\":true}")) {
    return fail("test_send_after_close_is_dropped", "send succeeded on a closed transport");
  }
  if (!out.str().empty()) {
    return fail("test_send_after_close_is_dropped", "closed transport wrote output");
  }
  if (transport.receive().has_value()) {
    return fail("test_send_after_close_is_dropped", "closed transport still produced frames");
  }
  return 0;
}

int test_failed_write_is_fatal() {
  std::istringstream in;
  std::ostringstream out;
  out.setstate(std::ios::badbit);
  StreamTransport transport(in, out);

  bool threw = false;
  try {
    (void)transport.send("{}");
  } catch (const TransportError&) {
    threw = true;
  }

  if (!threw) {
    return fail("test_failed_write_is_fatal", "expected TransportError for a broken output stream");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_frames_survive_single_byte_chunks(); rc != 0) {
    return rc;
  }
  if (int rc = test_frame_split_across_uneven_chunks(); rc != 0) {
    return rc;
  }
  if (int rc = test_blank_lines_and_crlf_are_skipped(); rc != 0) {
    return rc;
  }
  if (int rc = test_unterminated_final_line_is_a_frame(); rc != 0) {
    return rc;
  }
  if (int rc = test_missing_delimiter_is_fatal(); rc != 0) {
    return rc;
  }
  if (int rc = test_send_appends_delimiter(); rc != 0) {
    return rc;
  }
  if (int rc = test_concurrent_sends_do_not_interleave(); rc != 0) {
    return rc;
  }
  if (int rc = test_send_after_close_is_dropped(); rc != 0) {
    return rc;
  }
  if (int rc = test_failed_write_is_fatal(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] transport unit tests\n";
  return 0;
}
