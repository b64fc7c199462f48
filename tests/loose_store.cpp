#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"
#include "gitwire/fs.hpp"
#include "gitwire/graph_walker.hpp"
#include "gitwire/object_store.hpp"
#include "gitwire/pack.hpp"
#include "gitwire/refs.hpp"

#include "test_util.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <vector>

using namespace std::string_literals;
using gitwire::LooseObjectStore;
using gitwire::oid;

namespace {

auto bytes(std::string_view s) -> std::vector<std::uint8_t> { return {s.begin(), s.end()}; }

auto write_blob(LooseObjectStore &store, std::string_view content) -> oid {
  return store.write(gitwire::consts::kTypeBlob, bytes(content));
}

auto write_commit(LooseObjectStore &store, const oid &tree, const std::vector<oid> &parents,
                  std::string_view message) -> oid {
  std::string text = "tree " + gitwire::to_hex(tree) + "\n";
  for (const auto &p : parents) {
    text += "parent " + gitwire::to_hex(p) + "\n";
  }
  text += "author A U Thor <author@example.com> 1700000000 +0000\n";
  text += "committer A U Thor <author@example.com> 1700000000 +0000\n\n";
  text += message;
  return store.write(gitwire::consts::kTypeCommit, bytes(text));
}

auto files_in(const std::filesystem::path &dir) -> std::vector<std::string> {
  std::vector<std::string> names;
  if (!std::filesystem::exists(dir)) {
    return names;
  }
  for (const auto &e : std::filesystem::directory_iterator(dir)) {
    names.push_back(e.path().filename().string());
  }
  std::ranges::sort(names);
  return names;
}

} // namespace

int main() {
  const auto gitdir = temp_dir("loose_store");
  try {
    LooseObjectStore store(gitdir);

    // Blobs: id, on-disk layout, read back
    const oid hello = write_blob(store, "hello\n");
    check(gitwire::to_hex(hello) == "ce013625030ba8dba906f756967f9e9ca394464a", "blob id");
    const auto path = store.path_for_oid(hello);
    check(path == gitdir / "objects" / "ce" / "013625030ba8dba906f756967f9e9ca394464a",
          "fan-out path");
    const auto raw = gitwire::fs::z_decompress(gitwire::fs::read_file(path));
    check(std::string(raw.begin(), raw.end()) == "blob 6\0hello\n"s, "loose file content");
    check(store.contains(hello), "contains");
    const auto obj = store.read(hello);
    check(obj.type == "blob" && obj.data == bytes("hello\n"), "read back");
    check(write_blob(store, "hello\n") == hello, "rewrite is idempotent");

    check(!store.contains(oid_of('9')), "missing object");
    check_throws<gitwire::GitError>([&] { (void)store.read(oid_of('9')); }, "read missing");

    // Trees and flattened contents
    const oid readme = write_blob(store, "readme\n");
    gitwire::Tree sub;
    sub.add("hello.txt", gitwire::consts::kModeFile, hello);
    const oid sub_id = store.add_object(sub);
    gitwire::Tree root;
    root.add("README", gitwire::consts::kModeFile, readme);
    root.add("src", gitwire::consts::kModeTree, sub_id);
    const oid root_id = store.add_object(root);

    const auto read_root = store.read_tree(root_id);
    check(read_root.id() == root_id && read_root.size() == 2, "tree round trip");
    const auto contents = store.iter_tree_contents(root_id);
    check(contents.size() == 2, "two leaves");
    check(contents[0].path == "README" && contents[0].id == readme, "README leaf");
    check(contents[1].path == "src/hello.txt" && contents[1].id == hello, "nested leaf");
    check_throws<gitwire::GitError>([&] { (void)store.read_tree(hello); }, "blob is not a tree");

    // History: c1 -> c2 -> c3
    gitwire::Tree t1;
    t1.add("a.txt", gitwire::consts::kModeFile, hello);
    const oid t1_id = store.add_object(t1);
    const oid c1 = write_commit(store, t1_id, {}, "first\n");

    const oid b2 = write_blob(store, "second file\n");
    gitwire::Tree t2;
    t2.add("a.txt", gitwire::consts::kModeFile, hello);
    t2.add("b.txt", gitwire::consts::kModeFile, b2);
    const oid t2_id = store.add_object(t2);
    const oid c2 = write_commit(store, t2_id, {c1}, "second\n");
    const oid c3 = write_commit(store, t2_id, {c2}, "third\n");

    {
      const auto missing = store.find_missing_objects({c1}, {c2});
      std::set<oid> ids;
      for (const auto &o : missing) {
        ids.insert(o.id());
      }
      check(ids == std::set<oid>{b2, t2_id, c2}, "objects not reachable from have");
      check(store.find_missing_objects({c3}, {c3}).empty(), "nothing missing");
    }

    {
      const auto wants = store.determine_wants_all(
          {{"refs/heads/master", c3}, {"refs/heads/new", oid_of('a')}, {"refs/tags/v1^{}", oid_of('b')}});
      check(wants == std::vector<oid>{oid_of('a')}, "wants skip present and peeled");
    }

    // Walker
    {
      gitwire::ObjectStoreGraphWalker walker(store, {c2});
      check(walker.next_have() == c2, "walk head");
      check(walker.next_have() == c1, "walk parent");
      check(!walker.next_have(), "walk end");
      check(!walker.next_have(), "walk stays exhausted");
    }
    {
      gitwire::ObjectStoreGraphWalker walker(store, {c3});
      check(walker.next_have() == c3, "first have");
      walker.ack(c2);
      check(!walker.next_have(), "acked ancestry is not offered");
    }

    // Local heads from loose refs
    check(store.local_heads().empty(), "no refs yet");
    gitwire::update_ref(gitdir, "refs/heads/master", c3);
    gitwire::update_ref(gitdir, "refs/remotes/origin/master", c3);
    gitwire::update_ref(gitdir, "refs/tags/v1", c1);
    check(store.local_heads() == std::vector<oid>{std::min(c1, c3), std::max(c1, c3)},
          "distinct heads");

    // Ref names never leave the git directory
    for (const char *good : {"HEAD", "refs/heads/master", "refs/remotes/origin/feature-1",
                             "refs/tags/v1.0"}) {
      check(gitwire::is_valid_ref_name(good), std::string("valid ref ") + good);
    }
    for (const char *bad : {"", "@", "/refs/heads/x", "refs/heads/", "refs//heads",
                            "refs/heads/../../../../escaped", "refs/heads/.hidden",
                            "refs/heads/x.lock", "refs/heads/a b", "refs/heads/a~1",
                            "refs/heads/a:b", "refs/heads/x@{1}", "refs/heads/x.",
                            "refs/heads/tab\there"}) {
      check(!gitwire::is_valid_ref_name(bad), std::string("invalid ref ") + bad);
    }
    check_throws<gitwire::GitError>(
        [&] { gitwire::update_ref(gitdir, "refs/heads/../../escaped", c1); }, "update escaping ref");
    check(!std::filesystem::exists(gitdir.parent_path() / "escaped"), "nothing written outside");
    check_throws<gitwire::GitError>([&] { (void)gitwire::read_ref(gitdir, "../config"); },
                                    "read escaping ref");

    // Packs are named after their trailer; empty ones are dropped
    std::string pack_bytes;
    const oid trailer = gitwire::write_pack_objects(
        [&pack_bytes](std::span<const std::uint8_t> d) { pack_bytes.append(d.begin(), d.end()); },
        {gitwire::Object{.type = "blob", .data = bytes("packed\n")}});
    {
      auto pack = store.add_pack();
      pack.write(std::string_view(pack_bytes).substr(0, 10));
      pack.write(std::string_view(pack_bytes).substr(10));
      pack.commit();
    }
    const std::string pack_name = "pack-" + gitwire::to_hex(trailer) + ".pack";
    check(files_in(store.pack_dir()) == std::vector<std::string>{pack_name}, "pack stored");
    const auto stored = gitwire::fs::read_file(store.pack_dir() / pack_name);
    check(std::string(stored.begin(), stored.end()) == pack_bytes, "pack bytes verbatim");
    {
      auto pack = store.add_pack();
      pack.commit();
    }
    check(files_in(store.pack_dir()).size() == 1, "empty pack discarded");

    // Incomplete or corrupt packs are removed, not stored under their last 20 bytes
    for (const std::string &broken :
         {pack_bytes.substr(0, pack_bytes.size() - 1), "PACK\0\0\0\2 garbage"s,
          std::string(pack_bytes).replace(0, 4, "KCAP")}) {
      auto pack = store.add_pack();
      pack.write(broken);
      check_throws<gitwire::GitError>([&] { pack.commit(); }, "corrupt pack rejected");
    }
    check(files_in(store.pack_dir()) == std::vector<std::string>{pack_name},
          "corrupt packs leave no files");

    // Fetch into the store: local refs become haves, the pack lands in objects/pack
    {
      const auto target_dir = temp_dir("loose_fetch");
      LooseObjectStore target(target_dir);
      std::string remote_pack;
      const oid remote_trailer = gitwire::write_pack_objects(
          [&remote_pack](std::span<const std::uint8_t> d) {
            remote_pack.append(d.begin(), d.end());
          },
          {gitwire::Object{.type = "blob", .data = bytes("remote\n")}});

      const std::string server = pkt(hex_of('a') + " refs/heads/master\0side-band-64k\n"s) +
                                 kFlushPkt + pkt("NAK\n") + pkt("\x01" + remote_pack) + kFlushPkt;
      ScriptedClient client(server);
      const auto refs = client.fetch("/remote.git", target);
      check(refs.at("refs/heads/master") == oid_of('a'), "fetched refs");
      check(client.service == "upload-pack" && client.path == "/remote.git", "service");
      check(decode_pkts(client.written()) ==
                std::vector<std::string>{"want " + hex_of('a') + " side-band-64k\n", "<flush>",
                                         "done\n"},
            "empty store sends no haves");
      check(files_in(target.pack_dir()) ==
                std::vector<std::string>{"pack-" + gitwire::to_hex(remote_trailer) + ".pack"},
            "fetched pack stored");
      std::filesystem::remove_all(target_dir);
    }

    // Transfer aborted by the server: its error is reported and no pack is kept
    {
      const auto target_dir = temp_dir("loose_abort");
      LooseObjectStore target(target_dir);
      const std::string server = pkt(hex_of('a') + " refs/heads/master\0side-band-64k\n"s) +
                                 kFlushPkt + pkt("NAK\n") +
                                 pkt("\x01" + pack_bytes.substr(0, 39)) +
                                 pkt("\x03" "server died") + kFlushPkt;
      ScriptedClient client(server);
      try {
        client.fetch("/remote.git", target);
        check(false, "aborted fetch must throw");
      } catch (const gitwire::ProtocolError &e) {
        check(std::string(e.what()).find("server died") != std::string::npos,
              "transfer error reported");
      }
      check(files_in(target.pack_dir()).empty(), "partial pack removed");
      std::filesystem::remove_all(target_dir);
    }

    // Nothing wanted: no pack file is left behind
    {
      const std::string server =
          pkt(gitwire::to_hex(c3) + " refs/heads/master\0side-band-64k\n"s) + kFlushPkt;
      ScriptedClient client(server);
      client.fetch("/self.git", store);
      check(decode_pkts(client.written()) == std::vector<std::string>{"<flush>"}, "flush only");
      check(files_in(store.pack_dir()).size() == 1, "no new pack");
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    std::filesystem::remove_all(gitdir);
    return 1;
  }
  std::filesystem::remove_all(gitdir);
  return 0;
}
