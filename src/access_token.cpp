#include "access_token.hpp"
#include "errors.hpp"
#include "utils.hpp"

SystemClock default_clock(){
  return []{ return std::chrono::system_clock::now(); };
}

AccessToken::AccessToken(std::string value,
                         std::chrono::system_clock::time_point expires_at,
                         SystemClock clock)
: value_(std::move(value)),
  expires_at_(expires_at),
  clock_(std::move(clock))
{
}

AccessToken AccessToken::generate(std::chrono::system_clock::duration ttl,
                                  const SystemClock& clock){
  if(ttl <= std::chrono::system_clock::duration::zero()){
    throw InvalidConfiguration("token ttl must be positive");
  }
  SystemClock effective = clock ? clock : default_clock();
  auto value = base64url_from_bytes(secure_random_bytes(kEntropyBytes));
  return AccessToken(std::move(value), effective() + ttl, std::move(effective));
}

bool AccessToken::is_valid(const std::string& candidate) const {
  // evaluate both so mismatch and expiry take the same path
  bool matches = constant_time_equals(candidate, value_);
  bool live = clock_() < expires_at_;
  return matches && live;
}

void AccessToken::validate(const std::string& candidate) const {
  if(!is_valid(candidate)) throw Unauthorized();
}
