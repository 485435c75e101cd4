#pragma once

#include <chrono>
#include <functional>
#include <string>

using SystemClock = std::function<std::chrono::system_clock::time_point()>;

SystemClock default_clock();

// Opaque bearer credential with an absolute expiry. Immutable once created.
class AccessToken {
public:
  static constexpr std::size_t kEntropyBytes = 32;

  // Throws InvalidConfiguration when ttl is not positive.
  static AccessToken generate(std::chrono::system_clock::duration ttl,
                              const SystemClock& clock = default_clock());

  // Throws Unauthorized on mismatch or expiry. Both cases look the same to
  // the caller.
  void validate(const std::string& candidate) const;
  bool is_valid(const std::string& candidate) const;

  const std::string& value() const { return value_; }
  std::chrono::system_clock::time_point expires_at() const { return expires_at_; }

private:
  AccessToken(std::string value,
              std::chrono::system_clock::time_point expires_at,
              SystemClock clock);

  std::string value_;
  std::chrono::system_clock::time_point expires_at_;
  SystemClock clock_;
};
