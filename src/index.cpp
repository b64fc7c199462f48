#include "gitwire/index.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"
#include "gitwire/fs.hpp"
#include "gitwire/object_store.hpp"
#include "gitwire/tree_builder.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <sys/stat.h>

namespace gitwire {

// Hashing stream buffers

auto Sha1ReadBuf::underflow() -> int_type { return src_->sgetc(); }

auto Sha1ReadBuf::uflow() -> int_type {
  const int_type c = src_->sbumpc();
  if (!traits_type::eq_int_type(c, traits_type::eof())) {
    const auto byte = static_cast<std::uint8_t>(traits_type::to_char_type(c));
    sha_.update(std::span<const std::uint8_t>(&byte, 1));
    ++consumed_;
  }
  return c;
}

auto Sha1ReadBuf::xsgetn(char *s, std::streamsize n) -> std::streamsize {
  const std::streamsize got = src_->sgetn(s, n);
  if (got > 0) {
    sha_.update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s),
                                              static_cast<std::size_t>(got)));
    consumed_ += static_cast<std::uint64_t>(got);
  }
  return got;
}

auto Sha1WriteBuf::overflow(int_type c) -> int_type {
  if (traits_type::eq_int_type(c, traits_type::eof())) {
    return traits_type::not_eof(c);
  }
  const char ch = traits_type::to_char_type(c);
  return xsputn(&ch, 1) == 1 ? c : traits_type::eof();
}

auto Sha1WriteBuf::xsputn(const char *s, std::streamsize n) -> std::streamsize {
  const std::streamsize put = dst_->sputn(s, n);
  if (put > 0) {
    sha_.update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s),
                                              static_cast<std::size_t>(put)));
  }
  return put;
}

// Record codec

namespace {

// ctime + mtime + dev/ino/mode/uid/gid/size + sha + flags
constexpr std::size_t kEntryFixedSize = 8 + 8 + (6 * 4) + 20 + 2;

void read_exact(std::istream &in, char *dst, std::size_t n) {
  in.read(dst, static_cast<std::streamsize>(n));
  if (static_cast<std::size_t>(in.gcount()) != n) {
    throw IndexError("index file truncated");
  }
}

auto get_be32(const std::uint8_t *p) -> std::uint32_t {
  return (static_cast<std::uint32_t>(p[0]) << 24U) | (static_cast<std::uint32_t>(p[1]) << 16U) |
         (static_cast<std::uint32_t>(p[2]) << 8U) | static_cast<std::uint32_t>(p[3]);
}

auto get_be16(const std::uint8_t *p) -> std::uint16_t {
  return static_cast<std::uint16_t>((p[0] << 8U) | p[1]);
}

void put_be32(std::string &out, std::uint32_t v) {
  out.push_back(static_cast<char>(v >> 24U));
  out.push_back(static_cast<char>(v >> 16U));
  out.push_back(static_cast<char>(v >> 8U));
  out.push_back(static_cast<char>(v));
}

void put_be16(std::string &out, std::uint16_t v) {
  out.push_back(static_cast<char>(v >> 8U));
  out.push_back(static_cast<char>(v));
}

// Entries are NUL-padded to a multiple of 8 bytes, with at least one NUL.
constexpr auto padded_size(std::size_t used) -> std::size_t { return (used + 8) & ~std::size_t{7}; }

auto read_cache_entry(std::istream &in) -> NamedIndexEntry {
  std::array<std::uint8_t, kEntryFixedSize> raw{};
  read_exact(in, reinterpret_cast<char *>(raw.data()), raw.size());
  const std::uint8_t *p = raw.data();

  NamedIndexEntry out;
  IndexEntry &e = out.entry;
  e.ctime = CacheTime{get_be32(p), get_be32(p + 4)};
  e.mtime = CacheTime{get_be32(p + 8), get_be32(p + 12)};
  p += 16;
  e.dev = get_be32(p);
  e.ino = get_be32(p + 4);
  e.mode = get_be32(p + 8);
  e.uid = get_be32(p + 12);
  e.gid = get_be32(p + 16);
  e.size = get_be32(p + 20);
  p += 24;
  std::memcpy(e.sha.data(), p, consts::kOidRawLen);
  p += consts::kOidRawLen;
  const std::uint16_t flags = get_be16(p);
  e.flags = static_cast<std::uint16_t>(flags & ~consts::kIndexNameMask);

  const std::size_t name_len = flags & consts::kIndexNameMask;
  out.path.resize(name_len);
  read_exact(in, out.path.data(), name_len);

  const std::size_t used = kEntryFixedSize + name_len;
  std::array<char, 8> pad{};
  read_exact(in, pad.data(), padded_size(used) - used);
  return out;
}

void write_cache_entry(std::ostream &out, const NamedIndexEntry &named) {
  const IndexEntry &e = named.entry;
  if (named.path.size() > consts::kIndexNameMask) {
    throw std::invalid_argument("index path too long: " + named.path);
  }

  std::string rec;
  rec.reserve(padded_size(kEntryFixedSize + named.path.size()));
  put_be32(rec, e.ctime.sec);
  put_be32(rec, e.ctime.nsec);
  put_be32(rec, e.mtime.sec);
  put_be32(rec, e.mtime.nsec);
  put_be32(rec, e.dev);
  put_be32(rec, e.ino);
  put_be32(rec, e.mode);
  put_be32(rec, e.uid);
  put_be32(rec, e.gid);
  put_be32(rec, e.size);
  rec.append(reinterpret_cast<const char *>(e.sha.data()), e.sha.size());
  put_be16(rec, static_cast<std::uint16_t>(named.path.size() |
                                           (e.flags & ~consts::kIndexNameMask)));
  rec.append(named.path);
  rec.resize(padded_size(rec.size()), consts::kNul);

  out.write(rec.data(), static_cast<std::streamsize>(rec.size()));
}

} // namespace

auto read_index(std::istream &in) -> std::vector<NamedIndexEntry> {
  std::array<std::uint8_t, 12> header{};
  read_exact(in, reinterpret_cast<char *>(header.data()), header.size());
  if (std::string_view(reinterpret_cast<const char *>(header.data()), 4) != consts::kIndexMagic) {
    throw IndexError("invalid index file header");
  }
  const std::uint32_t version = get_be32(header.data() + 4);
  if (version != 1 && version != 2) {
    throw IndexError("unsupported index version " + std::to_string(version));
  }
  const std::uint32_t count = get_be32(header.data() + 8);

  std::vector<NamedIndexEntry> entries;
  for (std::uint32_t i = 0; i < count; ++i) {
    entries.push_back(read_cache_entry(in));
  }
  return entries;
}

auto read_index_dict(std::istream &in) -> IndexMap {
  IndexMap out;
  for (auto &named : read_index(in)) {
    out[named.path] = named.entry;
  }
  return out;
}

void write_index(std::ostream &out, const std::vector<NamedIndexEntry> &entries) {
  std::string header(consts::kIndexMagic);
  put_be32(header, consts::kIndexVersion);
  put_be32(header, static_cast<std::uint32_t>(entries.size()));
  out.write(header.data(), static_cast<std::streamsize>(header.size()));
  for (const auto &e : entries) {
    write_cache_entry(out, e);
  }
  if (!out) {
    throw std::runtime_error("index write failed");
  }
}

void write_index_dict(std::ostream &out, const IndexMap &entries) {
  std::vector<NamedIndexEntry> list;
  list.reserve(entries.size());
  for (const auto &[path, e] : entries) {
    list.push_back(NamedIndexEntry{.path = path, .entry = e});
  }
  write_index(out, list);
}

auto cleanup_mode(std::uint32_t mode) -> std::uint32_t {
  const std::uint32_t type = mode & consts::kModeTypeMask;
  if (type == consts::kModeSymlink) {
    return consts::kModeSymlink;
  }
  if (type == consts::kModeTree) {
    return consts::kModeTree;
  }
  if (type == consts::kModeGitlink) {
    return consts::kModeGitlink;
  }
  return consts::kModeFile | (mode & 0111U);
}

auto index_entry_from_stat(const std::filesystem::path &file, const oid &sha) -> IndexEntry {
  struct stat st{};
  if (::lstat(file.c_str(), &st) != 0) {
    throw std::system_error(errno, std::generic_category(), "lstat " + file.string());
  }
  IndexEntry e{};
  e.ctime = CacheTime{static_cast<std::uint32_t>(st.st_ctim.tv_sec),
                      static_cast<std::uint32_t>(st.st_ctim.tv_nsec)};
  e.mtime = CacheTime{static_cast<std::uint32_t>(st.st_mtim.tv_sec),
                      static_cast<std::uint32_t>(st.st_mtim.tv_nsec)};
  e.dev = static_cast<std::uint32_t>(st.st_dev);
  e.ino = static_cast<std::uint32_t>(st.st_ino);
  e.mode = cleanup_mode(static_cast<std::uint32_t>(st.st_mode));
  e.uid = static_cast<std::uint32_t>(st.st_uid);
  e.gid = static_cast<std::uint32_t>(st.st_gid);
  e.size = static_cast<std::uint32_t>(st.st_size);
  e.sha = sha;
  return e;
}

// Index

Index::Index(std::filesystem::path filename) : filename_(std::move(filename)) { read(); }

void Index::read() {
  byname_.clear();
  if (!fs::exists(filename_)) {
    return;
  }

  std::ifstream file(filename_, std::ios::binary);
  if (!file) {
    throw std::runtime_error("open index for read failed: " + filename_.string());
  }
  const auto file_size = std::filesystem::file_size(filename_);

  Sha1ReadBuf hashed(file.rdbuf());
  std::istream in(&hashed);
  for (auto &named : read_index(in)) {
    byname_[named.path] = named.entry;
  }

  // Extension data between the entries and the checksum is not interpreted.
  if (hashed.consumed() + consts::kOidRawLen > file_size) {
    throw IndexError("index file truncated");
  }
  std::uint64_t trailer = file_size - consts::kOidRawLen - hashed.consumed();
  std::array<char, 4096> skip{};
  while (trailer > 0) {
    const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(trailer, skip.size()));
    read_exact(in, skip.data(), n);
    trailer -= n;
  }

  oid stored{};
  if (file.rdbuf()->sgetn(reinterpret_cast<char *>(stored.data()),
                          static_cast<std::streamsize>(stored.size())) !=
      static_cast<std::streamsize>(stored.size())) {
    throw IndexError("index file truncated");
  }
  if (stored != hashed.digest()) {
    throw IndexError("index checksum mismatch: expected " + to_hex(hashed.digest()) + ", got " +
                     to_hex(stored));
  }
}

void Index::write() const {
  std::ostringstream os;
  Sha1WriteBuf hashed(os.rdbuf());
  std::ostream out(&hashed);
  write_index_dict(out, byname_);
  out.flush();
  const oid digest = hashed.digest();
  os.write(reinterpret_cast<const char *>(digest.data()), static_cast<std::streamsize>(digest.size()));
  fs::write_file_atomic(filename_, os.str());
}

auto Index::get(const std::string &name) const -> const IndexEntry & {
  const auto it = byname_.find(name);
  if (it == byname_.end()) {
    throw std::out_of_range("path not in index: " + name);
  }
  return it->second;
}

void Index::erase(const std::string &name) {
  if (byname_.erase(name) == 0) {
    throw std::out_of_range("path not in index: " + name);
  }
}

void Index::update(const IndexMap &entries) {
  for (const auto &[name, e] : entries) {
    byname_[name] = e;
  }
}

auto Index::iterblobs() const -> std::vector<BlobEntry> {
  std::vector<BlobEntry> out;
  out.reserve(byname_.size());
  for (const auto &[name, e] : byname_) {
    out.push_back(BlobEntry{.path = name, .sha = e.sha, .mode = cleanup_mode(e.mode)});
  }
  return out;
}

auto Index::changes_from_tree(const ObjectStore &store, const oid &tree,
                              bool want_unchanged) const -> std::vector<TreeChange> {
  std::vector<TreeChange> changes;
  std::set<std::string> mine;
  for (const auto &[name, e] : byname_) {
    mine.insert(name);
  }

  for (const auto &[name, mode, sha] : store.iter_tree_contents(tree)) {
    if (const auto it = mine.find(name); it != mine.end()) {
      const IndexEntry &e = get(name);
      if (want_unchanged || e.sha != sha || e.mode != mode) {
        changes.push_back(TreeChange{.old_path = name, .new_path = name,
                                     .old_mode = mode, .new_mode = e.mode,
                                     .old_sha = sha, .new_sha = e.sha});
      }
      mine.erase(it);
    } else {
      changes.push_back(TreeChange{.old_path = name, .new_path = std::nullopt,
                                   .old_mode = mode, .new_mode = std::nullopt,
                                   .old_sha = sha, .new_sha = std::nullopt});
    }
  }

  for (const auto &name : mine) {
    const IndexEntry &e = get(name);
    changes.push_back(TreeChange{.old_path = std::nullopt, .new_path = name,
                                 .old_mode = std::nullopt, .new_mode = e.mode,
                                 .old_sha = std::nullopt, .new_sha = e.sha});
  }
  return changes;
}

auto Index::commit(ObjectStore &store) const -> oid { return commit_tree(store, iterblobs()); }

} // namespace gitwire
