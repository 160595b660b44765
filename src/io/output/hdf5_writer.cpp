#include "seagas/io/output/hdf5_writer.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <set>
#include <sstream>
#include <vector>

namespace seagas::io::output {

namespace {

auto format_timestamp(std::chrono::system_clock::time_point time) -> std::string {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  auto tm = *std::gmtime(&time_t);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

} // namespace

auto HDF5Writer::write(const std::filesystem::path& file_path, const OutputDataset& dataset,
                       ProgressCallback progress) const -> std::expected<void, OutputError> {

  try {
    if (progress)
      progress(0.0, "Creating HDF5 file");

    auto file_result = create_file(file_path);
    if (!file_result) {
      return std::unexpected(file_result.error());
    }
    auto file = std::move(file_result.value());

    if (progress)
      progress(0.1, "Writing metadata");

    if (auto meta_result = write_metadata(file, dataset.metadata); !meta_result) {
      return std::unexpected(meta_result.error());
    }

    if (auto grid_result = write_grid(file, dataset.result); !grid_result) {
      return std::unexpected(grid_result.error());
    }

    if (progress)
      progress(0.3, "Writing property tables");

    if (auto tables_result = write_tables(file, dataset.result, progress); !tables_result) {
      return std::unexpected(tables_result.error());
    }

    if (progress)
      progress(1.0, "HDF5 write complete");

    return {};

  } catch (const OutputError& e) {
    return std::unexpected(OutputError(std::format("HDF5 write failed: {}", e.message())));
  }
}

auto HDF5Writer::create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError> {

  auto fapl = H5Pcreate(H5P_FILE_ACCESS);
  if (fapl < 0) {
    return std::unexpected(OutputError("Failed to create file access property list"));
  }

  H5Pset_fclose_degree(fapl, H5F_CLOSE_STRONG);

  auto file_id = H5Fcreate(file_path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, fapl);
  H5Pclose(fapl);

  if (file_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create HDF5 file: {}", file_path.string())));
  }

  return FileHandle(file_id);
}

auto HDF5Writer::write_metadata(FileHandle& file, const TableMetadata& metadata) const
    -> std::expected<void, OutputError> {

  auto metadata_group_result = create_group(file, "metadata");
  if (!metadata_group_result) {
    return std::unexpected(metadata_group_result.error());
  }
  auto metadata_group = std::move(metadata_group_result.value());

  const std::pair<std::string, std::string> attributes[] = {
      {"seagas_version", metadata.seagas_version},
      {"creation_time", format_timestamp(metadata.creation_time)},
      {"seawater_provider", metadata.seawater_provider},
      {"case_name", metadata.case_name},
  };

  for (const auto& [name, value] : attributes) {
    if (auto result = write_string(metadata_group, name, value); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_grid(FileHandle& file, const PropertyTableGenerator::Result& result) const
    -> std::expected<void, OutputError> {

  auto grid_group_result = create_group(file, "grid");
  if (!grid_group_result) {
    return std::unexpected(grid_group_result.error());
  }
  auto grid_group = std::move(grid_group_result.value());

  if (auto status = write_vector(grid_group, "salinity", result.salinities, "1"); !status) {
    return std::unexpected(status.error());
  }
  if (auto status = write_vector(grid_group, "temperature", result.temperatures, "degC"); !status) {
    return std::unexpected(status.error());
  }

  return {};
}

auto HDF5Writer::write_tables(FileHandle& file, const PropertyTableGenerator::Result& result,
                              ProgressCallback progress) const -> std::expected<void, OutputError> {

  // Gas groups are created on first use
  std::set<std::string> created_groups;

  for (std::size_t i = 0; i < result.tables.size(); ++i) {
    const auto& table = result.tables[i];

    if (progress) {
      double table_progress = 0.3 + 0.7 * (static_cast<double>(i) / result.tables.size());
      progress(table_progress, std::format("Writing {}", table_path(table)));
    }

    if (!table.gas) {
      if (auto status = write_matrix(file, std::string(quantity_name(table.quantity)), table.values, table.units);
          !status) {
        return std::unexpected(status.error());
      }
      continue;
    }

    const std::string group_name(gas::symbol(*table.gas));
    if (!created_groups.contains(group_name)) {
      auto group_result = create_group(file, group_name);
      if (!group_result) {
        return std::unexpected(group_result.error());
      }
      created_groups.insert(group_name);
    }

    auto group_id = H5Gopen2(file, group_name.c_str(), H5P_DEFAULT);
    if (group_id < 0) {
      return std::unexpected(OutputError(std::format("Failed to open group '{}'", group_name)));
    }
    GroupHandle group(group_id);

    if (auto status = write_matrix(group, std::string(quantity_name(table.quantity)), table.values, table.units);
        !status) {
      return std::unexpected(status.error());
    }
  }

  return {};
}

auto HDF5Writer::create_group(hid_t parent, const std::string& name) const -> std::expected<GroupHandle, OutputError> {

  auto group_id = H5Gcreate2(parent, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (group_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create group '{}'", name)));
  }

  return GroupHandle(group_id);
}

auto HDF5Writer::write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                              const std::string& units) const -> std::expected<void, OutputError> {

  if (data.empty()) {
    return {};
  }

  hsize_t dims = data.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_chunked_properties(data.size());
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  auto status = H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data());
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write data for '{}'", name)));
  }

  if (!units.empty()) {
    if (auto result = write_string(dataset, "units", units); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_matrix(hid_t parent, const std::string& name, const core::Matrix<double>& data,
                              const std::string& units) const -> std::expected<void, OutputError> {

  if (data.rows() == 0 || data.cols() == 0) {
    return {};
  }

  hsize_t dims[2] = {static_cast<hsize_t>(data.rows()), static_cast<hsize_t>(data.cols())};
  auto space_id = H5Screate_simple(2, dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for matrix '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_chunked_properties_2d(data.rows(), data.cols());
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  // Eigen storage is column-major, HDF5 expects row-major
  std::vector<double> row_major_data(data.rows() * data.cols());
  for (std::size_t i = 0; i < data.rows(); ++i) {
    for (std::size_t j = 0; j < data.cols(); ++j) {
      row_major_data[i * data.cols() + j] = data(i, j);
    }
  }

  auto status = H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, row_major_data.data());
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write matrix data for '{}'", name)));
  }

  if (!units.empty()) {
    if (auto result = write_string(dataset, "units", units); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

auto HDF5Writer::write_string(hid_t parent, const std::string& name, const std::string& value) const
    -> std::expected<void, OutputError> {

  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);

  H5Tset_size(string_type, value.length() + 1);
  H5Tset_strpad(string_type, H5T_STR_NULLTERM);

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto attr_id = H5Acreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string attribute '{}'", name)));
  }

  auto status = H5Awrite(attr_id, string_type, value.c_str());
  H5Aclose(attr_id);

  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string attribute '{}'", name)));
  }

  return {};
}

auto HDF5Writer::apply_filters(hid_t props) const -> void {
  if (hdf5_config_.compression_level <= 0) {
    return;
  }
  if (hdf5_config_.use_shuffle_filter) {
    H5Pset_shuffle(props);
  }
  H5Pset_deflate(props, static_cast<unsigned>(hdf5_config_.compression_level));
  if (hdf5_config_.use_fletcher32) {
    H5Pset_fletcher32(props);
  }
}

auto HDF5Writer::create_chunked_properties(std::size_t size) const -> std::expected<PropertyHandle, OutputError> {

  auto plist_id = H5Pcreate(H5P_DATASET_CREATE);
  if (plist_id < 0) {
    return std::unexpected(OutputError("Failed to create dataset property list"));
  }
  PropertyHandle props(plist_id);

  // Filters require a chunked layout
  if (!hdf5_config_.use_chunking) {
    return props;
  }

  hsize_t chunk_size = std::max<std::size_t>(std::min(size, hdf5_config_.chunk_size), 1);
  if (H5Pset_chunk(props, 1, &chunk_size) < 0) {
    return std::unexpected(OutputError("Failed to set chunking"));
  }

  apply_filters(props);
  return props;
}

auto HDF5Writer::create_chunked_properties_2d(std::size_t rows, std::size_t cols) const
    -> std::expected<PropertyHandle, OutputError> {

  auto plist_id = H5Pcreate(H5P_DATASET_CREATE);
  if (plist_id < 0) {
    return std::unexpected(OutputError("Failed to create dataset property list"));
  }
  PropertyHandle props(plist_id);

  if (!hdf5_config_.use_chunking) {
    return props;
  }

  hsize_t chunk_dims[2] = {std::max<std::size_t>(std::min(rows, hdf5_config_.chunk_size), 1),
                           std::max<std::size_t>(std::min(cols, hdf5_config_.chunk_size), 1)};

  if (H5Pset_chunk(props, 2, chunk_dims) < 0) {
    return std::unexpected(OutputError("Failed to set 2D chunking"));
  }

  apply_filters(props);
  return props;
}

namespace hdf5 {

auto initialize() -> std::expected<void, OutputError> {
  if (H5open() < 0) {
    return std::unexpected(OutputError("Failed to initialize HDF5 library"));
  }
  return {};
}

auto finalize() -> void { H5close(); }

auto check_version() -> std::expected<std::string, OutputError> {
  unsigned majnum, minnum, relnum;
  if (H5get_libversion(&majnum, &minnum, &relnum) < 0) {
    return std::unexpected(OutputError("Failed to get HDF5 version"));
  }

  return std::format("{}.{}.{}", majnum, minnum, relnum);
}

auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError> {

  if (!std::filesystem::exists(file_path)) {
    return std::unexpected(OutputError(std::format("File does not exist: {}", file_path.string())));
  }

  auto result = H5Fis_hdf5(file_path.c_str());
  if (result <= 0) {
    return std::unexpected(OutputError(std::format("Not a valid HDF5 file: {}", file_path.string())));
  }

  return {};
}

} // namespace hdf5

} // namespace seagas::io::output
