#pragma once

/** \file checkpoint.hpp
 *  \brief Versioned on-disk model checkpoints.
 *
 * Layout inside a checkpoint directory:
 *   checkpoint-<version>.kckpt   one file per saved ModelParameters
 *   CURRENT                      name of the most recently saved file
 *
 * File format: text header lines terminated by an empty line, then a binary
 * payload (native little-endian). Header:
 *   kestrel-checkpoint v1
 *   version=<string>
 *   dimension=<D>  users=<n>  items=<m>  (one key per line)
 *   updated_at_ms=<unix millis>
 *   compression=none|zstd
 *   raw_bytes=<uncompressed payload size>
 *   payload_bytes=<stored payload size>
 *   checksum=<FNV-1a 64 of the uncompressed payload>
 * Payload: n user records, m item records (u64 id + D floats each), then D
 * bias floats.
 *
 * Every file is written to a temporary name, fsynced, renamed into place and
 * the directory fsynced, so a crash leaves either the old or the new file.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "kestrel/error.hpp"
#include "kestrel/types.hpp"

namespace kestrel::io {

inline constexpr const char* kCheckpointHeader = "kestrel-checkpoint v1";
inline constexpr const char* kCheckpointExtension = ".kckpt";
inline constexpr const char* kCurrentPointer = "CURRENT";

/** \brief Header summary of a checkpoint file. */
struct CheckpointInfo {
  std::filesystem::path path;
  std::string version;
  std::size_t dimension{0};
  std::size_t users{0};
  std::size_t items{0};
  std::int64_t updated_at_ms{0};
  bool compressed{false};
};

/** \brief File name used for `version`; characters outside [A-Za-z0-9._-] become '_'. */
auto checkpoint_file_name(const std::string& version) -> std::string;

/** \brief Atomically write `params` into `dir` and repoint CURRENT at it.
 *
 * \param zstd_level 1-3 compresses the payload (zstd builds only); 0 stores it
 *        raw; negative reads KESTREL_CHECKPOINT_ZSTD_LEVEL.
 * \return Path of the written file.
 */
auto save_checkpoint(const std::filesystem::path& dir, const ModelParameters& params,
                     int zstd_level = -1)
    -> std::expected<std::filesystem::path, core::error>;

/** \brief Read and verify one checkpoint file. */
auto load_checkpoint(const std::filesystem::path& file)
    -> std::expected<ModelParameters, core::error>;

/** \brief Read the file CURRENT points at; not_found when there is none. */
auto load_latest_checkpoint(const std::filesystem::path& dir)
    -> std::expected<ModelParameters, core::error>;

/** \brief Headers of every checkpoint in `dir`, oldest first. */
auto list_checkpoints(const std::filesystem::path& dir)
    -> std::expected<std::vector<CheckpointInfo>, core::error>;

/** \brief Delete all but the newest `keep_last` checkpoints; returns the number removed. */
auto prune_checkpoints(const std::filesystem::path& dir, std::size_t keep_last)
    -> std::expected<std::size_t, core::error>;

} // namespace kestrel::io
