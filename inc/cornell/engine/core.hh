#pragma once

#include <functional>
#include <string>
#include <array>
#include <span>
#include <concepts>
#include <type_traits>
#include <unordered_map>

#include <cstdint>
#include <cstddef>

#include "fmt/format.h"

//
// Panic, Check:
//

namespace cornell {
  [[noreturn]] void panic(std::string message, const char *file, int64_t line);
  void check(bool condition, const char *codestr, const char *more, const char *file, int64_t line);
  void check(bool condition, const char *codestr, std::function<std::string()> more, const char *file, int64_t line);
}

#define PANIC(...)        cornell::panic(fmt::format(__VA_ARGS__), __FILE__, __LINE__)
#define CHECK(COND, MORE) cornell::check((COND), #COND, (MORE), __FILE__, __LINE__)

#ifdef NDEBUG
# define DEBUG_CHECK(COND, MORE) /* no expansion: disabled in release mode */
#else
# define DEBUG_CHECK(COND, MORE) CHECK((COND), MORE)
#endif

//
// File I/O:
//

namespace cornell {
  std::string readTextFile(const char *file_path);
}

//
// Bind group count concepts:
//

namespace cornell {
  template <uint32_t v> concept IsPositiveU32 = v > 0;
  template <uint32_t v> concept IsZeroU32 = v == 0;
}

//
// EnumType, EnumMap
//

namespace cornell {
  template <typename T>
  concept EnumType = std::is_enum_v<T>;
}
namespace cornell {
  template <EnumType E>
  constexpr size_t enum_count() {
    return static_cast<size_t>(E::Metadata_Count);
  }
}
namespace cornell {
  template <EnumType E, typename T>
  class EnumMap: public std::array<T, enum_count<E>()> {
  private:
    using Base = std::array<T, enum_count<E>()>;
  public:
    using Base::Base;
    using Base::data;
    using Base::size;
    using Base::operator[];
  public:
    T &operator[] (E key);
    constexpr T const &operator[] (E key) const;
  };
}
namespace cornell {
  template <EnumType E, typename T>
  T &EnumMap<E, T>::operator[] (E key) {
    return Base::operator[](static_cast<size_t>(key));
  }
  template <EnumType E, typename T>
  constexpr T const &EnumMap<E, T>::operator[] (E key) const {
    return Base::operator[](static_cast<size_t>(key));
  }
}

//
// String replacement:
//

namespace cornell {
  std::string replaceAll(const std::string &s, std::unordered_map<std::string, std::string> const &rw_map);
}

//
// Integer helpers:
//

namespace cornell {
  constexpr uint32_t divRoundUp(uint32_t value, uint32_t divisor) {
    return (value + divisor - 1) / divisor;
  }
}
