/**
 * @file hdf5_scan_loader.cpp
 * @brief netCDF-4 scan reader implementation.
 * @author Watosn
 */

#include "cloudcover/dataset/hdf5_scan_loader.hpp"

#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <hdf5.h>
#include <spdlog/spdlog.h>

namespace cloudcover::dataset {
namespace {

using cloudcover::core::Status;

/**
 * @brief Owning HDF5 identifier.
 */
class Handle {
 public:
  using Closer = herr_t (*)(hid_t);

  Handle(hid_t id, Closer closer) : id_(id), closer_(closer) {}
  ~Handle() {
    if (id_ >= 0) {
      closer_(id_);
    }
  }
  Handle(const Handle&) = delete;
  Handle& operator=(const Handle&) = delete;

  [[nodiscard]] hid_t get() const { return id_; }
  [[nodiscard]] bool valid() const { return id_ >= 0; }

 private:
  hid_t id_{-1};
  Closer closer_{};
};

void silence_hdf5_errors() { H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr); }

std::optional<std::string> read_string(hid_t attr) {
  Handle type(H5Aget_type(attr), H5Tclose);
  Handle space(H5Aget_space(attr), H5Sclose);
  if (!type.valid() || !space.valid() || H5Tget_class(type.get()) != H5T_STRING ||
      H5Sget_simple_extent_npoints(space.get()) != 1) {
    return std::nullopt;
  }

  if (H5Tis_variable_str(type.get()) > 0) {
    Handle mem(H5Tcopy(H5T_C_S1), H5Tclose);
    H5Tset_size(mem.get(), H5T_VARIABLE);
    char* value = nullptr;
    if (H5Aread(attr, mem.get(), &value) < 0 || value == nullptr) {
      return std::nullopt;
    }
    std::string out(value);
    H5free_memory(value);
    return out;
  }

  // One extra byte so a string filling its declared size keeps its last character.
  const std::size_t size = H5Tget_size(type.get());
  Handle mem(H5Tcopy(H5T_C_S1), H5Tclose);
  H5Tset_size(mem.get(), size + 1);
  H5Tset_strpad(mem.get(), H5T_STR_NULLTERM);
  std::string buffer(size + 1, '\0');
  if (H5Aread(attr, mem.get(), buffer.data()) < 0) {
    return std::nullopt;
  }
  buffer.resize(buffer.find('\0'));
  return buffer;
}

std::optional<std::string> read_string_attribute(hid_t obj, const char* name) {
  if (H5Aexists(obj, name) <= 0) {
    return std::nullopt;
  }
  Handle attr(H5Aopen(obj, name, H5P_DEFAULT), H5Aclose);
  if (!attr.valid()) {
    return std::nullopt;
  }
  return read_string(attr.get());
}

std::optional<double> read_numeric_attribute(hid_t obj, const char* name) {
  if (H5Aexists(obj, name) <= 0) {
    return std::nullopt;
  }
  Handle attr(H5Aopen(obj, name, H5P_DEFAULT), H5Aclose);
  Handle type(H5Aget_type(attr.get()), H5Tclose);
  Handle space(H5Aget_space(attr.get()), H5Sclose);
  if (!attr.valid() || !type.valid() || !space.valid()) {
    return std::nullopt;
  }
  const H5T_class_t cls = H5Tget_class(type.get());
  const hssize_t count = H5Sget_simple_extent_npoints(space.get());
  if ((cls != H5T_INTEGER && cls != H5T_FLOAT) || count < 1) {
    return std::nullopt;
  }
  std::vector<double> values(static_cast<std::size_t>(count));
  if (H5Aread(attr.get(), H5T_NATIVE_DOUBLE, values.data()) < 0) {
    return std::nullopt;
  }
  return values.front();
}

herr_t collect_string_attribute(hid_t location, const char* name, const H5A_info_t* /*info*/, void* op_data) {
  auto* attributes = static_cast<std::map<std::string, std::string>*>(op_data);
  Handle attr(H5Aopen(location, name, H5P_DEFAULT), H5Aclose);
  if (attr.valid()) {
    if (auto value = read_string(attr.get())) {
      (*attributes)[name] = std::move(*value);
    }
  }
  return 0;
}

herr_t collect_dataset_name(hid_t group, const char* name, const H5L_info_t* /*info*/, void* op_data) {
  auto* names = static_cast<std::vector<std::string>*>(op_data);
  Handle obj(H5Oopen(group, name, H5P_DEFAULT), H5Oclose);
  if (obj.valid() && H5Iget_type(obj.get()) == H5I_DATASET) {
    names->emplace_back(name);
  }
  return 0;
}

bool is_dataset(hid_t file, const std::string& name) {
  if (name.empty() || H5Lexists(file, name.c_str(), H5P_DEFAULT) <= 0) {
    return false;
  }
  Handle obj(H5Oopen(file, name.c_str(), H5P_DEFAULT), H5Oclose);
  return obj.valid() && H5Iget_type(obj.get()) == H5I_DATASET;
}

Status read_band(hid_t file, const std::string& name, cloudcover::core::Band& band, std::string& detail) {
  Handle ds(H5Dopen2(file, name.c_str(), H5P_DEFAULT), H5Dclose);
  if (!ds.valid()) {
    detail = fmt::format("cannot open variable {}", name);
    return Status::DataUnavailable;
  }
  Handle space(H5Dget_space(ds.get()), H5Sclose);
  Handle type(H5Dget_type(ds.get()), H5Tclose);
  if (!space.valid() || !type.valid()) {
    detail = fmt::format("cannot inspect variable {}", name);
    return Status::DataUnavailable;
  }
  if (H5Sget_simple_extent_ndims(space.get()) != 2) {
    detail = fmt::format("variable {} is not two-dimensional", name);
    return Status::InvalidInput;
  }
  hsize_t dims[2] = {0, 0};
  H5Sget_simple_extent_dims(space.get(), dims, nullptr);
  const auto rows = static_cast<Eigen::Index>(dims[0]);
  const auto cols = static_cast<Eigen::Index>(dims[1]);
  const auto count = static_cast<std::size_t>(dims[0] * dims[1]);

  const H5T_class_t cls = H5Tget_class(type.get());
  const bool wrap_unsigned = read_string_attribute(ds.get(), "_Unsigned").value_or("") == "true" &&
                             cls == H5T_INTEGER && H5Tget_sign(type.get()) == H5T_SGN_2;
  const double wrap = std::ldexp(1.0, static_cast<int>(8 * H5Tget_size(type.get())));
  const auto unwrap = [&](double v) { return (wrap_unsigned && v < 0.0) ? v + wrap : v; };

  const double scale = read_numeric_attribute(ds.get(), "scale_factor").value_or(1.0);
  const double offset = read_numeric_attribute(ds.get(), "add_offset").value_or(0.0);
  std::optional<double> fill = read_numeric_attribute(ds.get(), "_FillValue");
  std::optional<double> missing = read_numeric_attribute(ds.get(), "missing_value");
  if (fill) {
    fill = unwrap(*fill);
  }
  if (missing) {
    missing = unwrap(*missing);
  }

  constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();
  const auto decode = [&](double v) -> float {
    if ((fill && v == *fill) || (missing && v == *missing)) {
      return kNaN;
    }
    return static_cast<float>(v * scale + offset);
  };

  band.resize(rows, cols);
  float* out = band.data();
  if (cls == H5T_INTEGER) {
    std::vector<long long> raw(count);
    if (H5Dread(ds.get(), H5T_NATIVE_LLONG, H5S_ALL, H5S_ALL, H5P_DEFAULT, raw.data()) < 0) {
      detail = fmt::format("cannot read variable {}", name);
      return Status::DataUnavailable;
    }
    for (std::size_t i = 0; i < count; ++i) {
      out[i] = decode(unwrap(static_cast<double>(raw[i])));
    }
  } else if (cls == H5T_FLOAT) {
    std::vector<double> raw(count);
    if (H5Dread(ds.get(), H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, raw.data()) < 0) {
      detail = fmt::format("cannot read variable {}", name);
      return Status::DataUnavailable;
    }
    for (std::size_t i = 0; i < count; ++i) {
      out[i] = decode(raw[i]);
    }
  } else {
    detail = fmt::format("variable {} is not numeric", name);
    return Status::InvalidInput;
  }
  return Status::Ok;
}

}  // namespace

cloudcover::core::LoadResult Hdf5ScanLoader::load(const std::filesystem::path& file,
                                                  const std::vector<std::string>& band_names) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    return cloudcover::core::LoadResult{.status = Status::DataUnavailable,
                                        .detail = fmt::format("no such file: {}", file.string())};
  }

  silence_hdf5_errors();
  Handle fh(H5Fopen(file.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT), H5Fclose);
  if (!fh.valid()) {
    return cloudcover::core::LoadResult{.status = Status::DataUnavailable,
                                        .detail = fmt::format("cannot open HDF5 file: {}", file.string())};
  }

  cloudcover::core::LoadResult result{};
  Handle root(H5Gopen2(fh.get(), "/", H5P_DEFAULT), H5Gclose);
  if (root.valid()) {
    hsize_t idx = 0;
    H5Aiterate2(root.get(), H5_INDEX_NAME, H5_ITER_NATIVE, &idx, collect_string_attribute, &result.scan.attributes);
  }

  for (const auto& name : band_names) {
    if (!is_dataset(fh.get(), name)) {
      spdlog::debug("variable {} not present in {}", name, file.string());
      continue;
    }
    cloudcover::core::Band band{};
    std::string detail{};
    const Status status = read_band(fh.get(), name, band, detail);
    if (status != Status::Ok) {
      spdlog::error("failed to decode {}: {}", name, detail);
      return cloudcover::core::LoadResult{.status = status, .detail = detail};
    }
    spdlog::debug("decoded {} ({}x{})", name, band.rows(), band.cols());
    result.scan.bands.emplace(name, std::move(band));
  }
  return result;
}

std::vector<std::string> Hdf5ScanLoader::list_variables(const std::filesystem::path& file) {
  silence_hdf5_errors();
  std::vector<std::string> names{};
  Handle fh(H5Fopen(file.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT), H5Fclose);
  if (!fh.valid()) {
    return names;
  }
  Handle root(H5Gopen2(fh.get(), "/", H5P_DEFAULT), H5Gclose);
  if (!root.valid()) {
    return names;
  }
  hsize_t idx = 0;
  H5Literate(root.get(), H5_INDEX_NAME, H5_ITER_NATIVE, &idx, collect_dataset_name, &names);
  return names;
}

}  // namespace cloudcover::dataset
