// include/mqtt2db/mqtt_handle.hpp
#pragma once

#include <utility>

#include <MQTTAsync.h>

namespace mqtt2db {

/**
 * @brief Owning RAII wrapper around a Paho MQTTAsync client handle.
 *
 * Destroys the client with MQTTAsync_destroy() when reset or destroyed.
 */
class MQTTAsyncHandle {
public:
  MQTTAsyncHandle() noexcept = default;
  explicit MQTTAsyncHandle(MQTTAsync client) noexcept : client_(client) {}
  ~MQTTAsyncHandle() noexcept;

  MQTTAsyncHandle(const MQTTAsyncHandle&) = delete;
  MQTTAsyncHandle& operator=(const MQTTAsyncHandle&) = delete;

  MQTTAsyncHandle(MQTTAsyncHandle&& other) noexcept
      : client_(std::exchange(other.client_, nullptr)) {}

  MQTTAsyncHandle& operator=(MQTTAsyncHandle&& other) noexcept {
    if (this != &other) {
      reset();
      client_ = std::exchange(other.client_, nullptr);
    }
    return *this;
  }

  void reset() noexcept;

  [[nodiscard]] MQTTAsync get() const noexcept { return client_; }

  [[nodiscard]] explicit operator bool() const noexcept { return client_ != nullptr; }

private:
  MQTTAsync client_{nullptr};
};

} // namespace mqtt2db
