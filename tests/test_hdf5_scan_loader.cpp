/**
 * @file test_hdf5_scan_loader.cpp
 * @brief netCDF-4 band decoding tests against a generated HDF5 file.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <hdf5.h>
#include <spdlog/spdlog.h>

#include "cloudcover/dataset/hdf5_scan_loader.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

bool write_scalar_attribute(hid_t obj, const char* name, hid_t type, const void* value) {
  const hid_t space = H5Screate(H5S_SCALAR);
  const hid_t attr = H5Acreate2(obj, name, type, space, H5P_DEFAULT, H5P_DEFAULT);
  const bool ok = attr >= 0 && H5Awrite(attr, type, value) >= 0;
  if (attr >= 0) {
    H5Aclose(attr);
  }
  H5Sclose(space);
  return ok;
}

bool write_fixed_string_attribute(hid_t obj, const char* name, const std::string& value) {
  const hid_t type = H5Tcopy(H5T_C_S1);
  H5Tset_size(type, value.size());
  H5Tset_strpad(type, H5T_STR_NULLTERM);
  const bool ok = write_scalar_attribute(obj, name, type, value.c_str());
  H5Tclose(type);
  return ok;
}

bool write_variable_string_attribute(hid_t obj, const char* name, const char* value) {
  const hid_t type = H5Tcopy(H5T_C_S1);
  H5Tset_size(type, H5T_VARIABLE);
  const bool ok = write_scalar_attribute(obj, name, type, &value);
  H5Tclose(type);
  return ok;
}

hid_t create_dataset(hid_t file, const char* name, hid_t type, const std::vector<hsize_t>& dims) {
  const hid_t space = H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr);
  const hid_t ds = H5Dcreate2(file, name, type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  H5Sclose(space);
  return ds;
}

// Mimics a packed ABI CMI variable: unsigned 16-bit counts stored as signed shorts.
bool write_scan(const std::filesystem::path& path) {
  const hid_t file = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
  if (file < 0) {
    return false;
  }
  bool ok = write_fixed_string_attribute(file, "time_coverage_start", "2024-03-15T02:01:17.0Z");
  ok = ok && write_variable_string_attribute(file, "platform_ID", "G19");
  const int orbit = 42;
  ok = ok && write_scalar_attribute(file, "orbit_number", H5T_NATIVE_INT, &orbit);

  const std::int16_t counts[6] = {100, 200, -1, 4095, -2, 0};
  const hid_t ir = create_dataset(file, "CMI_C13", H5T_STD_I16LE, {2, 3});
  ok = ok && ir >= 0 && H5Dwrite(ir, H5T_NATIVE_INT16, H5S_ALL, H5S_ALL, H5P_DEFAULT, counts) >= 0;
  const float scale = 0.01F;
  const float offset = 200.0F;
  const std::int16_t fill = -1;
  ok = ok && write_scalar_attribute(ir, "scale_factor", H5T_NATIVE_FLOAT, &scale);
  ok = ok && write_scalar_attribute(ir, "add_offset", H5T_NATIVE_FLOAT, &offset);
  ok = ok && write_scalar_attribute(ir, "_FillValue", H5T_NATIVE_INT16, &fill);
  ok = ok && write_fixed_string_attribute(ir, "_Unsigned", "true");
  if (ir >= 0) {
    H5Dclose(ir);
  }

  const float reflectance[6] = {0.05F, 0.45F, -999.0F, 0.2F, 0.9F, 0.31F};
  const hid_t vis = create_dataset(file, "CMI_C02", H5T_IEEE_F32LE, {2, 3});
  ok = ok && vis >= 0 && H5Dwrite(vis, H5T_NATIVE_FLOAT, H5S_ALL, H5S_ALL, H5P_DEFAULT, reflectance) >= 0;
  const float missing = -999.0F;
  ok = ok && write_scalar_attribute(vis, "missing_value", H5T_NATIVE_FLOAT, &missing);
  if (vis >= 0) {
    H5Dclose(vis);
  }

  const double cube[8] = {1, 2, 3, 4, 5, 6, 7, 8};
  const hid_t volume = create_dataset(file, "cube", H5T_IEEE_F64LE, {2, 2, 2});
  ok = ok && volume >= 0 && H5Dwrite(volume, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, cube) >= 0;
  if (volume >= 0) {
    H5Dclose(volume);
  }

  H5Fclose(file);
  return ok;
}

}  // namespace

int main() {
  namespace fs = std::filesystem;
  using cloudcover::core::Status;

  const fs::path path = fs::temp_directory_path() / "cloudcover_hdf5_loader_test.nc";
  if (!write_scan(path)) {
    spdlog::error("failed to write test scan");
    return 10;
  }

  const cloudcover::dataset::Hdf5ScanLoader loader{};
  const auto loaded = loader.load(path, {"CMI_C13", "CMI_C02", "CMI_C03"});
  if (loaded.status != Status::Ok || loaded.scan.bands.size() != 2 || loaded.scan.band("CMI_C03") != nullptr) {
    spdlog::error("load failed: {}", loaded.detail);
    return 1;
  }

  if (loaded.scan.attribute("time_coverage_start").value_or("") != "2024-03-15T02:01:17.0Z" ||
      loaded.scan.attribute("platform_ID").value_or("") != "G19" || loaded.scan.attribute("orbit_number")) {
    spdlog::error("global string attributes not decoded");
    return 2;
  }

  const auto* ir = loaded.scan.band("CMI_C13");
  if (ir == nullptr || ir->rows() != 2 || ir->cols() != 3) {
    spdlog::error("IR band shape mismatch");
    return 3;
  }
  const double scale = static_cast<double>(0.01F);
  const double expected[6] = {100 * scale + 200.0, 200 * scale + 200.0, 0.0,
                              4095 * scale + 200.0, 65534 * scale + 200.0, 200.0};
  for (int i = 0; i < 6; ++i) {
    const float v = (*ir)(i / 3, i % 3);
    if (i == 2) {
      if (!std::isnan(v)) {
        spdlog::error("fill value not masked");
        return 4;
      }
      continue;
    }
    if (!approx(v, expected[i], 1e-3)) {
      spdlog::error("IR pixel {} decoded as {}, expected {}", i, v, expected[i]);
      return 5;
    }
  }

  const auto* vis = loaded.scan.band("CMI_C02");
  if (vis == nullptr || !std::isnan((*vis)(0, 2)) || !approx((*vis)(1, 1), 0.9, 1e-6) ||
      !approx((*vis)(0, 0), 0.05, 1e-6)) {
    spdlog::error("visible band not decoded");
    return 6;
  }

  const auto cube = loader.load(path, {"cube"});
  if (cube.status != Status::InvalidInput) {
    spdlog::error("3-D variable must be rejected");
    return 7;
  }

  auto names = cloudcover::dataset::Hdf5ScanLoader::list_variables(path);
  std::sort(names.begin(), names.end());
  if (names != std::vector<std::string>{"CMI_C02", "CMI_C13", "cube"}) {
    spdlog::error("variable listing mismatch");
    return 8;
  }

  const fs::path missing = fs::temp_directory_path() / "cloudcover_no_such_scan.nc";
  const fs::path bogus = fs::temp_directory_path() / "cloudcover_not_hdf5.nc";
  {
    std::ofstream out(bogus);
    out << "<html>403 Forbidden</html>";
  }
  if (loader.load(missing, {"CMI_C13"}).status != Status::DataUnavailable ||
      loader.load(bogus, {"CMI_C13"}).status != Status::DataUnavailable ||
      !cloudcover::dataset::Hdf5ScanLoader::list_variables(bogus).empty()) {
    spdlog::error("unreadable files must be DataUnavailable");
    return 9;
  }

  fs::remove(path);
  fs::remove(bogus);
  return 0;
}
