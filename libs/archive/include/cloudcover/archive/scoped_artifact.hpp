/**
 * @file scoped_artifact.hpp
 * @brief RAII ownership of a downloaded file.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace cloudcover::archive {

/**
 * @brief Owns a local file and removes it when the guard goes out of scope.
 *
 * Arm the guard before the transfer starts so a partially written file is removed as well.
 */
class ScopedArtifact {
 public:
  ScopedArtifact() = default;
  explicit ScopedArtifact(std::filesystem::path file) : file_(std::move(file)) {}
  ~ScopedArtifact() { reset(); }

  ScopedArtifact(const ScopedArtifact&) = delete;
  ScopedArtifact& operator=(const ScopedArtifact&) = delete;

  ScopedArtifact(ScopedArtifact&& other) noexcept : file_(std::exchange(other.file_, {})) {}
  ScopedArtifact& operator=(ScopedArtifact&& other) noexcept {
    if (this != &other) {
      reset();
      file_ = std::exchange(other.file_, {});
    }
    return *this;
  }

  [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

  /**
   * @brief Give up ownership without deleting.
   */
  std::filesystem::path release() noexcept { return std::exchange(file_, {}); }

  /**
   * @brief Delete the owned file now, if any.
   */
  void reset() noexcept {
    if (file_.empty()) {
      return;
    }
    std::error_code ec;
    const bool removed = std::filesystem::remove(file_, ec);
    if (ec) {
      spdlog::warn("failed to remove temp file {}: {}", file_.string(), ec.message());
    } else if (removed) {
      spdlog::info("Removed temp file {}", file_.string());
    }
    file_.clear();
  }

 private:
  std::filesystem::path file_{};
};

}  // namespace cloudcover::archive
