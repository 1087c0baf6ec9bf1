#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "nb_types.hpp"

namespace nb {

// Reserved message that terminates a stream.
inline constexpr const char* kStreamEndSentinel = "__STREAM_END__";

struct StreamEvent {
    enum Kind { Progress, Error, End };

    uint64_t stream_id = 0;
    std::string module;
    Kind kind = Progress;
    std::string message;

    bool is_end() const { return kind == End; }
};

NATIVEBRIDGE_API const char* to_string(StreamEvent::Kind kind) noexcept;

class NATIVEBRIDGE_API EventChannel {
 public:
  using Listener = std::function<void(const StreamEvent&)>;

  explicit EventChannel(std::string name = "native-stream") : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  int subscribe(Listener listener);
  bool unsubscribe(int id);

  // Delivers to every listener in subscription order. Calls are serialized,
  // so events published from one thread reach listeners in that order.
  // Listeners must not call back into the channel.
  void publish(const StreamEvent& event);

  // When enabled, published events are also kept until drained.
  void set_buffering(bool enabled);
  std::vector<StreamEvent> drain();

  // Exceptions thrown by listeners are contained and counted here.
  int listener_failures() const;

 private:
  std::string name_;
  mutable std::mutex mutex_;
  std::map<int, Listener> listeners_;
  int next_id_ = 1;
  bool buffering_ = false;
  std::vector<StreamEvent> buffer_;
  int listener_failures_ = 0;
};

}  // namespace nb
