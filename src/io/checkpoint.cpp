#include "kestrel/io/checkpoint.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <type_traits>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

#ifdef KESTREL_HAS_ZSTD
#include <zstd.h>
#endif

#include "kestrel/core/platform_utils.hpp"
#include "kestrel/validation.hpp"

namespace kestrel::io {

namespace {

using core::error;
using core::error_code;

auto fnv64(const void* ptr, std::size_t nbytes) -> std::uint64_t {
  std::uint64_t h = 1469598103934665603ull;
  const auto* p = static_cast<const std::uint8_t*>(ptr);
  constexpr std::uint64_t P = 1099511628211ull;
  for (std::size_t i = 0; i < nbytes; ++i) { h ^= p[i]; h *= P; }
  return h;
}

auto fail(error_code code, std::string message) -> std::unexpected<error> {
  return core::make_error(code, std::move(message), "checkpoint");
}

auto fsync_path(const std::filesystem::path& p) -> bool {
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(p.string().c_str(), O_RDONLY);
  if (fd < 0) return false;
  (void)::fsync(fd);
  (void)::close(fd);
#else
  (void)p;
#endif
  return true;
}

// tmp write -> fsync -> rename over destination -> directory fsync
auto write_atomic(const std::filesystem::path& dir, const std::string& name,
                  const std::string& bytes) -> std::expected<void, error> {
  const auto p_tmp = dir / (name + ".tmp");
  const auto p_dst = dir / name;
  {
    std::ofstream out(p_tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) return fail(error_code::io_failed, "tmp open failed: " + p_tmp.string());
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out.good()) {
      std::error_code rec; (void)std::filesystem::remove(p_tmp, rec);
      return fail(error_code::io_failed, "tmp write failed: " + p_tmp.string());
    }
  }
  if (!fsync_path(p_tmp)) {
    std::error_code rec; (void)std::filesystem::remove(p_tmp, rec);
    return fail(error_code::io_failed, "tmp fsync open failed: " + p_tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(p_tmp, p_dst, ec);
  if (ec) {
    std::error_code rec; (void)std::filesystem::remove(p_tmp, rec);
    return fail(error_code::io_failed, "rename failed: " + ec.message());
  }
  (void)fsync_path(dir);
  return {};
}

auto resolve_zstd_level(int requested) -> int {
  if (requested >= 0) return std::min(requested, 3);
  if (auto v = core::safe_getenv("KESTREL_CHECKPOINT_ZSTD_LEVEL")) {
    if (auto n = core::parse_number<int>(*v); n && *n >= 1 && *n <= 3) return *n;
  }
  return 0;
}

auto append_raw(std::string& buf, const void* p, std::size_t n) -> void {
  buf.append(static_cast<const char*>(p), n);
}

auto encode_payload(const ModelParameters& params) -> std::string {
  const std::size_t row_bytes = sizeof(std::uint64_t) + params.dimension * sizeof(float);
  std::string buf;
  buf.reserve((params.users.size() + params.items.size()) * row_bytes +
              params.dimension * sizeof(float));
  for (const auto* rows : {&params.users, &params.items}) {
    for (const auto& r : *rows) {
      const std::uint64_t id = r.id;
      append_raw(buf, &id, sizeof(id));
      append_raw(buf, r.values.data(), r.values.size() * sizeof(float));
    }
  }
  std::vector<float> bias = params.bias_weights;
  bias.resize(params.dimension, 0.0f);
  append_raw(buf, bias.data(), bias.size() * sizeof(float));
  return buf;
}

auto decode_rows(const char*& p, std::size_t count, std::size_t dim)
    -> std::vector<EmbeddingRecord> {
  std::vector<EmbeddingRecord> rows(count);
  for (auto& r : rows) {
    std::memcpy(&r.id, p, sizeof(std::uint64_t));
    p += sizeof(std::uint64_t);
    r.values.resize(dim);
    std::memcpy(r.values.data(), p, dim * sizeof(float));
    p += dim * sizeof(float);
  }
  return rows;
}

struct Header {
  CheckpointInfo info;
  std::uint64_t raw_bytes{0};
  std::uint64_t payload_bytes{0};
  std::uint64_t checksum{0};
};

auto read_header(std::istream& in, const std::filesystem::path& file)
    -> std::expected<Header, error> {
  std::string line;
  std::getline(in, line);
  if (line != kCheckpointHeader) {
    return fail(error_code::data_integrity, "bad checkpoint header: " + file.string());
  }
  Header h;
  h.info.path = file;
  bool have_version = false, have_dim = false, have_raw = false, have_payload = false,
       have_sum = false;
  while (std::getline(in, line) && !line.empty()) {
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      return fail(error_code::data_integrity, "malformed header line: " + line);
    }
    const std::string key = line.substr(0, eq);
    const std::string val = line.substr(eq + 1);
    auto num = [&](auto& out) -> bool {
      using T = std::remove_reference_t<decltype(out)>;
      auto n = core::parse_number<T>(val);
      if (n) out = *n;
      return n.has_value();
    };
    bool ok = true;
    if (key == "version") { h.info.version = val; have_version = true; }
    else if (key == "dimension") { ok = num(h.info.dimension); have_dim = ok; }
    else if (key == "users") ok = num(h.info.users);
    else if (key == "items") ok = num(h.info.items);
    else if (key == "updated_at_ms") ok = num(h.info.updated_at_ms);
    else if (key == "compression") {
      if (val == "zstd") h.info.compressed = true;
      else if (val != "none") ok = false;
    }
    else if (key == "raw_bytes") { ok = num(h.raw_bytes); have_raw = ok; }
    else if (key == "payload_bytes") { ok = num(h.payload_bytes); have_payload = ok; }
    else if (key == "checksum") { ok = num(h.checksum); have_sum = ok; }
    if (!ok) return fail(error_code::data_integrity, "malformed header value: " + line);
  }
  if (!have_version || !have_dim || !have_raw || !have_payload || !have_sum) {
    return fail(error_code::data_integrity, "incomplete checkpoint header: " + file.string());
  }
  return h;
}

// Payload size implied by the header counts; nullopt when it overflows.
auto expected_raw_bytes(std::uint64_t users, std::uint64_t items, std::uint64_t dim)
    -> std::optional<std::uint64_t> {
  constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
  if (dim > validation::kMaxEmbeddingDimension) return std::nullopt;
  const std::uint64_t row = sizeof(std::uint64_t) + dim * sizeof(float);
  if (users > kMax - items) return std::nullopt;
  const std::uint64_t rows = users + items;
  if (rows > (kMax - dim * sizeof(float)) / row) return std::nullopt;
  const std::uint64_t total = rows * row + dim * sizeof(float);
  if (total > std::numeric_limits<std::size_t>::max()) return std::nullopt;
  return total;
}

#ifdef KESTREL_HAS_ZSTD
// Streams the frame so memory grows with real output, never past `limit`.
auto decompress_bounded(const std::string& payload, std::uint64_t limit)
    -> std::optional<std::string> {
  std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> dctx(ZSTD_createDCtx(), &ZSTD_freeDCtx);
  if (!dctx) return std::nullopt;
  std::string out;
  const std::size_t chunk = ZSTD_DStreamOutSize();
  ZSTD_inBuffer input{payload.data(), payload.size(), 0};
  for (;;) {
    // One byte past the limit is enough to detect an oversized frame.
    const std::uint64_t left = limit - out.size();
    const std::size_t room = left < chunk ? static_cast<std::size_t>(left) + 1 : chunk;
    const std::size_t before = out.size();
    out.resize(before + room);
    ZSTD_outBuffer output{out.data() + before, room, 0};
    const std::size_t ret = ZSTD_decompressStream(dctx.get(), &output, &input);
    if (ZSTD_isError(ret)) return std::nullopt;
    out.resize(before + output.pos);
    if (out.size() > limit) return std::nullopt;
    if (ret == 0) break;
    if (output.pos == 0 && input.pos == input.size) return std::nullopt;
  }
  if (input.pos != input.size) return std::nullopt;
  return out;
}
#endif

auto read_info(const std::filesystem::path& file) -> std::expected<CheckpointInfo, error> {
  std::ifstream in(file, std::ios::binary);
  if (!in.good()) return fail(error_code::not_found, "open failed: " + file.string());
  auto h = read_header(in, file);
  if (!h) return std::unexpected(h.error());
  return h->info;
}

} // namespace

auto checkpoint_file_name(const std::string& version) -> std::string {
  std::string safe = version;
  for (auto& c : safe) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '.' || c == '_' || c == '-';
    if (!ok) c = '_';
  }
  return "checkpoint-" + safe + kCheckpointExtension;
}

auto save_checkpoint(const std::filesystem::path& dir, const ModelParameters& params,
                     int zstd_level) -> std::expected<std::filesystem::path, core::error> {
  if (auto ok = validation::validate_model_parameters(params); !ok) {
    return std::unexpected(ok.error());
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) return fail(error_code::io_failed, "create_directories failed: " + ec.message());

  const std::string raw = encode_payload(params);
  const std::uint64_t checksum = fnv64(raw.data(), raw.size());
  std::string stored;
  bool compressed = false;
  const int level = resolve_zstd_level(zstd_level);
#ifdef KESTREL_HAS_ZSTD
  if (level > 0 && !raw.empty()) {
    std::string out(ZSTD_compressBound(raw.size()), '\0');
    const std::size_t got = ZSTD_compress(out.data(), out.size(), raw.data(), raw.size(), level);
    if (!ZSTD_isError(got) && got < raw.size()) {
      out.resize(got);
      stored = std::move(out);
      compressed = true;
    }
  }
#else
  (void)level;
#endif
  const std::string& payload = compressed ? stored : raw;

  const auto updated_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      params.updated_at.time_since_epoch()).count();
  std::ostringstream hdr;
  hdr << kCheckpointHeader << "\n"
      << "version=" << params.version << "\n"
      << "dimension=" << params.dimension << "\n"
      << "users=" << params.users.size() << "\n"
      << "items=" << params.items.size() << "\n"
      << "updated_at_ms=" << updated_ms << "\n"
      << "compression=" << (compressed ? "zstd" : "none") << "\n"
      << "raw_bytes=" << raw.size() << "\n"
      << "payload_bytes=" << payload.size() << "\n"
      << "checksum=" << checksum << "\n\n";
  std::string bytes = hdr.str();
  bytes += payload;

  const std::string name = checkpoint_file_name(params.version);
  if (auto w = write_atomic(dir, name, bytes); !w) return std::unexpected(w.error());
  if (auto w = write_atomic(dir, kCurrentPointer, name + "\n"); !w) return std::unexpected(w.error());
  return dir / name;
}

auto load_checkpoint(const std::filesystem::path& file)
    -> std::expected<ModelParameters, core::error> {
  std::ifstream in(file, std::ios::binary);
  if (!in.good()) return fail(error_code::not_found, "open failed: " + file.string());
  auto h = read_header(in, file);
  if (!h) return std::unexpected(h.error());

  // Never size a buffer from header claims the file cannot back.
  std::error_code ec;
  const auto file_bytes = std::filesystem::file_size(file, ec);
  const auto header_end = in.tellg();
  if (ec || header_end < 0) return fail(error_code::io_failed, "cannot size checkpoint: " + file.string());
  const std::uint64_t remaining = file_bytes - static_cast<std::uint64_t>(header_end);
  if (h->payload_bytes > remaining) {
    return fail(error_code::io_eof, "truncated checkpoint payload: " + file.string());
  }

  const std::size_t dim = h->info.dimension;
  auto expected = expected_raw_bytes(h->info.users, h->info.items, dim);
  if (!expected || h->raw_bytes != *expected) {
    return fail(error_code::data_integrity, "payload size mismatch: " + file.string());
  }

  std::string payload(static_cast<std::size_t>(h->payload_bytes), '\0');
  in.read(payload.data(), static_cast<std::streamsize>(payload.size()));
  if (static_cast<std::uint64_t>(in.gcount()) != h->payload_bytes) {
    return fail(error_code::io_eof, "truncated checkpoint payload: " + file.string());
  }

  std::string raw;
  if (h->info.compressed) {
#ifdef KESTREL_HAS_ZSTD
    auto out = decompress_bounded(payload, *expected);
    if (!out) return fail(error_code::data_integrity, "decompression failed: " + file.string());
    raw = std::move(*out);
#else
    return fail(error_code::unsupported, "checkpoint is zstd-compressed but zstd support is not built in");
#endif
  } else {
    raw = std::move(payload);
  }

  if (raw.size() != *expected) {
    return fail(error_code::data_integrity, "payload size mismatch: " + file.string());
  }
  if (fnv64(raw.data(), raw.size()) != h->checksum) {
    return fail(error_code::data_integrity, "checksum mismatch: " + file.string());
  }

  ModelParameters params;
  params.version = h->info.version;
  params.dimension = dim;
  params.updated_at = time_point(std::chrono::milliseconds(h->info.updated_at_ms));
  const char* p = raw.data();
  params.users = decode_rows(p, h->info.users, dim);
  params.items = decode_rows(p, h->info.items, dim);
  params.bias_weights.resize(dim);
  std::memcpy(params.bias_weights.data(), p, dim * sizeof(float));
  return params;
}

auto load_latest_checkpoint(const std::filesystem::path& dir)
    -> std::expected<ModelParameters, core::error> {
  std::ifstream in(dir / kCurrentPointer);
  if (!in.good()) return fail(error_code::not_found, "no CURRENT pointer in " + dir.string());
  std::string name;
  std::getline(in, name);
  if (name.empty() || name.find('/') != std::string::npos) {
    return fail(error_code::data_integrity, "malformed CURRENT pointer");
  }
  return load_checkpoint(dir / name);
}

auto list_checkpoints(const std::filesystem::path& dir)
    -> std::expected<std::vector<CheckpointInfo>, core::error> {
  std::vector<CheckpointInfo> out;
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) return out;
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file()) continue;
    if (entry.path().extension() != kCheckpointExtension) continue;
    auto info = read_info(entry.path());
    if (!info) {
      std::cerr << "[checkpoint][list] skipping " << entry.path().string() << ": "
                << info.error().message << std::endl;
      continue;
    }
    out.push_back(std::move(*info));
  }
  if (ec) return fail(error_code::io_error, "directory scan failed: " + ec.message());
  std::sort(out.begin(), out.end(), [](const CheckpointInfo& a, const CheckpointInfo& b) {
    if (a.updated_at_ms != b.updated_at_ms) return a.updated_at_ms < b.updated_at_ms;
    return a.path.filename() < b.path.filename();
  });
  return out;
}

auto prune_checkpoints(const std::filesystem::path& dir, std::size_t keep_last)
    -> std::expected<std::size_t, core::error> {
  auto all = list_checkpoints(dir);
  if (!all) return std::unexpected(all.error());
  if (all->size() <= keep_last) return std::size_t{0};

  std::string current;
  {
    std::ifstream in(dir / kCurrentPointer);
    if (in.good()) std::getline(in, current);
  }
  std::size_t removed = 0;
  const std::size_t excess = all->size() - keep_last;
  for (std::size_t i = 0; i < excess; ++i) {
    const auto& info = (*all)[i];
    if (info.path.filename() == current) continue;
    std::error_code ec;
    if (std::filesystem::remove(info.path, ec)) {
      ++removed;
    } else if (ec) {
      return fail(error_code::io_failed, "remove failed: " + ec.message());
    }
  }
  return removed;
}

} // namespace kestrel::io
