#pragma once

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace utils {

inline std::string get_env(const std::string &env_var, const std::string &default_value) {
#if defined(_WIN32) && defined(_MSC_VER)
  char *env_value = nullptr;
  size_t len = 0;
  if (_dupenv_s(&env_value, &len, env_var.c_str()) == 0 && env_value != nullptr) {
    std::string result(env_value);
    free(env_value);
    return result;
  }
  return default_value;
#else
  const char *env_value = std::getenv(env_var.c_str());
  return env_value ? std::string(env_value) : default_value;
#endif
}

inline bool has_env(const std::string &env_var) {
  return std::getenv(env_var.c_str()) != nullptr;
}

template <typename T> T get_env(const std::string &env_var, const T &default_value) {
  if (!has_env(env_var)) {
    return default_value;
  }
  const std::string raw = get_env(env_var, std::string());
  if constexpr (std::is_same<T, bool>::value) {
    return raw == "1" || raw == "true" || raw == "TRUE" || raw == "yes" || raw == "on";
  } else {
    std::istringstream iss(raw);
    T value{};
    if (!(iss >> value)) {
      throw std::runtime_error("Invalid value '" + raw + "' for environment variable " + env_var);
    }
    return value;
  }
}

} // namespace utils
