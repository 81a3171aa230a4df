#include "cornell/engine/core.hh"

#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <vector>
#include <string_view>
#include <utility>

#include <cstdlib>

//
// Panic, Check:
//

namespace cornell {
  void panic(std::string message, const char *file, int64_t line) {
    std::cerr
      << "ERROR: " << message << std::endl
      << "- see: " << file << ':' << line << std::endl;
    std::abort();
  }
  void check(bool condition, const char *codestr, const char *more, const char *file, int64_t line) {
    if (!condition) [[unlikely]] {
      panic(fmt::format("check failed: {}\n- condition: {}", more, codestr), file, line);
    }
  }
  void check(bool condition, const char *codestr, std::function<std::string()> more, const char *file, int64_t line) {
    if (!condition) [[unlikely]] {
      panic(fmt::format("check failed: {}\n- condition: {}", more(), codestr), file, line);
    }
  }
}

//
// File I/O:
//

namespace cornell {
  std::string readTextFile(const char *file_path) {
    std::ifstream f{file_path, std::ios_base::binary};
    CHECK(
      f.good(),
      [file_path] () { return fmt::format("Failed to open text file:\nfilepath: {}", file_path); }
    );
    std::stringstream contents;
    contents << f.rdbuf();
    CHECK(
      !f.bad(),
      [file_path] () { return fmt::format("Failed to read text file:\nfilepath: {}", file_path); }
    );
    return contents.str();
  }
}

//
// String replacement:
//

namespace cornell {
  std::string replaceAll(const std::string &s, std::unordered_map<std::string, std::string> const &rw_map) {
    std::vector<std::pair<std::string_view, std::string_view>> keys;
    keys.reserve(rw_map.size());
    for (auto const &[find, replacement]: rw_map) {
      if (!find.empty()) {
        keys.emplace_back(find, replacement);
      }
    }
    std::sort(
      keys.begin(), keys.end(),
      [] (auto const &lt, auto const &rt) { return lt.first.size() > rt.first.size(); }
    );

    // Single left-to-right scan, longest match first; replacements are never rescanned.
    std::string res;
    res.reserve(s.size());
    std::string_view rest = s;
    while (!rest.empty()) {
      auto it = std::find_if(keys.begin(), keys.end(), [rest] (auto const &key) { return rest.starts_with(key.first); });
      if (it == keys.end()) {
        res.push_back(rest.front());
        rest.remove_prefix(1);
      } else {
        res.append(it->second);
        rest.remove_prefix(it->first.size());
      }
    }
    return res;
  }
}
