#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"
#include "gitwire/fs.hpp"
#include "gitwire/index.hpp"

#include "test_util.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using gitwire::Index;
using gitwire::IndexEntry;

static auto entry_for(std::string_view content, std::uint32_t mode) -> IndexEntry {
  IndexEntry e{};
  e.mtime = {.sec = 1710000000, .nsec = 5};
  e.mode = mode;
  e.size = static_cast<std::uint32_t>(content.size());
  e.sha = gitwire::hash_object(gitwire::consts::kTypeBlob,
                               std::span<const std::uint8_t>(
                                   reinterpret_cast<const std::uint8_t *>(content.data()),
                                   content.size()));
  return e;
}

static auto slurp(const fs::path &p) -> std::string {
  const auto bytes = gitwire::fs::read_file(p);
  return {bytes.begin(), bytes.end()};
}

static void spit(const fs::path &p, const std::string &s) {
  std::ofstream(p, std::ios::binary | std::ios::trunc) << s;
}

int main() {
  const fs::path dir = temp_dir("index_file");
  const fs::path path = dir / "index";

  try {
    // Missing file reads as empty
    {
      Index idx{path};
      check(idx.size() == 0, "missing file is empty");
      idx.read();
      check(idx.size() == 0, "read() on missing file is a no-op");
    }

    // Write sorted, checksummed; read back
    {
      Index idx{path};
      idx.set("src/main.cpp", entry_for("int main(){}\n", gitwire::consts::kModeFile));
      idx.set("README", entry_for("hi\n", gitwire::consts::kModeFile));
      idx.set("run.sh", entry_for("#!/bin/sh\n", gitwire::consts::kModeExec));
      idx.write();
    }
    {
      const std::string bytes = slurp(path);
      check(bytes.size() > 20, "file written");
      const auto body = std::string_view(bytes).substr(0, bytes.size() - 20);
      const auto digest = gitwire::sha1(body);
      check(bytes.substr(bytes.size() - 20) ==
                std::string(reinterpret_cast<const char *>(digest.data()), digest.size()),
            "trailer is SHA-1 of the rest");

      std::istringstream is(bytes);
      const auto entries = gitwire::read_index(is);
      check(entries.size() == 3 && entries[0].path == "README" && entries[1].path == "run.sh" &&
                entries[2].path == "src/main.cpp",
            "entries sorted by path");
    }
    {
      Index idx{path};
      check(idx.size() == 3, "three entries");
      check(idx.contains("run.sh") && !idx.contains("nope"), "contains");
      check(idx.get_mode("run.sh") == gitwire::consts::kModeExec, "get_mode");
      check(idx.get_sha1("README") == entry_for("hi\n", gitwire::consts::kModeFile).sha, "get_sha1");
      check(idx.get("README") == entry_for("hi\n", gitwire::consts::kModeFile), "get");

      idx.erase("README");
      check(!idx.contains("README"), "erase");
      check_throws<std::out_of_range>([&] { idx.erase("README"); }, "erase unknown");
      check_throws<std::out_of_range>([&] { (void)idx.get("README"); }, "get unknown");

      idx.update({{"a", entry_for("a", gitwire::consts::kModeFile)},
                  {"run.sh", entry_for("changed", 0100775)}});
      check(idx.size() == 3 && idx.get("run.sh").size == 7, "update");

      const auto blobs = idx.iterblobs();
      check(blobs.size() == 3 && blobs[0].path == "a", "iterblobs sorted");
      for (const auto &b : blobs) {
        if (b.path == "run.sh") {
          check(b.mode == 0100755, "iterblobs cleans modes");
        }
      }

      // read() replaces unsaved changes with the file's contents
      idx.read();
      check(idx.size() == 3 && idx.contains("README") && !idx.contains("a"), "read() reloads");

      idx.clear();
      check(idx.size() == 0, "clear");
    }

    // Unknown extension data before the checksum is tolerated
    {
      std::string bytes = slurp(path);
      std::string body = bytes.substr(0, bytes.size() - 20) + "TREE" + std::string(8, '\x01');
      const auto digest = gitwire::sha1(body);
      spit(path, body + std::string(reinterpret_cast<const char *>(digest.data()), digest.size()));
      Index idx{path};
      check(idx.size() == 3, "extension skipped");
      idx.write();
    }

    // Any single corrupted byte is detected
    {
      const std::string good = slurp(path);
      for (std::size_t i = 0; i < good.size(); ++i) {
        std::string bad = good;
        bad[i] = static_cast<char>(bad[i] ^ 0x5a);
        spit(path, bad);
        check_throws<gitwire::IndexError>([&] { Index idx{path}; },
                                          "corrupt byte " + std::to_string(i));
      }
      spit(path, good.substr(0, good.size() - 1));
      check_throws<gitwire::IndexError>([&] { Index idx{path}; }, "truncated file");
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(dir);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
