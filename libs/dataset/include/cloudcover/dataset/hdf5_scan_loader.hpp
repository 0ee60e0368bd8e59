/**
 * @file hdf5_scan_loader.hpp
 * @brief netCDF-4 scan reader built on the HDF5 C library.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "cloudcover/core/interfaces.hpp"

namespace cloudcover::dataset {

/**
 * @brief Reads root-level 2-D variables and global string attributes of a netCDF-4 file.
 *
 * Packed variables are decoded the same way netCDF readers do: `_Unsigned` integers are
 * reinterpreted, `_FillValue`/`missing_value` pixels become NaN, then `scale_factor` and
 * `add_offset` are applied.
 */
class Hdf5ScanLoader final : public cloudcover::core::IScanLoader {
 public:
  [[nodiscard]] cloudcover::core::LoadResult load(const std::filesystem::path& file,
                                                  const std::vector<std::string>& band_names) const override;

  /**
   * @brief Names of every dataset in the root group; empty when the file cannot be opened.
   */
  [[nodiscard]] static std::vector<std::string> list_variables(const std::filesystem::path& file);
};

}  // namespace cloudcover::dataset
