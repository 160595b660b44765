#pragma once
#include "output_writer.hpp"
#include <hdf5.h>
#include <string_view>
#include <vector>

namespace seagas::io::output {

// HDF5-specific configuration
struct HDF5Config {
  int compression_level = constants::io::default_hdf5_compression; // 0-9, higher = better compression
  bool use_chunking = true;
  bool use_shuffle_filter = true; // Reorder bytes for better compression
  bool use_fletcher32 = false;    // Checksum filter
  std::size_t chunk_size = constants::io::default_hdf5_chunk_size;
};

// RAII wrapper for HDF5 handles
template <typename HandleType, auto CloseFunc> class HDF5Handle {
private:
  HandleType handle_;

public:
  explicit HDF5Handle(HandleType handle) : handle_(handle) {
    if (handle_ < 0) {
      throw OutputError("Invalid HDF5 handle");
    }
  }

  ~HDF5Handle() {
    if (handle_ >= 0) {
      CloseFunc(handle_);
    }
  }

  // Move semantics only
  HDF5Handle(HDF5Handle&& other) noexcept : handle_(other.handle_) { other.handle_ = -1; }

  HDF5Handle& operator=(HDF5Handle&& other) noexcept {
    if (this != &other) {
      if (handle_ >= 0) {
        CloseFunc(handle_);
      }
      handle_ = other.handle_;
      other.handle_ = -1;
    }
    return *this;
  }

  HDF5Handle(const HDF5Handle&) = delete;
  HDF5Handle& operator=(const HDF5Handle&) = delete;

  [[nodiscard]] auto get() const noexcept -> HandleType { return handle_; }
  [[nodiscard]] auto valid() const noexcept -> bool { return handle_ >= 0; }

  // Implicit conversion for C API
  operator HandleType() const noexcept { return handle_; }
};

using FileHandle = HDF5Handle<hid_t, H5Fclose>;
using GroupHandle = HDF5Handle<hid_t, H5Gclose>;
using DatasetHandle = HDF5Handle<hid_t, H5Dclose>;
using DataspaceHandle = HDF5Handle<hid_t, H5Sclose>;
using PropertyHandle = HDF5Handle<hid_t, H5Pclose>;
using TypeHandle = HDF5Handle<hid_t, H5Tclose>;

// Layout:
//   /metadata            string attributes (seagas_version, creation_time, seawater_provider, case_name)
//   /grid/salinity       [n_salinity]
//   /grid/temperature    [n_temperature]
//   /<gas>/<quantity>    [n_salinity x n_temperature], "units" attribute
//   /viscosity           [n_salinity x n_temperature]
class HDF5Writer : public FormatWriter {
private:
  HDF5Config hdf5_config_;

  [[nodiscard]] auto create_file(const std::filesystem::path& file_path) const
      -> std::expected<FileHandle, OutputError>;

  [[nodiscard]] auto write_metadata(FileHandle& file, const TableMetadata& metadata) const
      -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_grid(FileHandle& file, const PropertyTableGenerator::Result& result) const
      -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_tables(FileHandle& file, const PropertyTableGenerator::Result& result,
                                  ProgressCallback progress) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto create_group(hid_t parent, const std::string& name) const
      -> std::expected<GroupHandle, OutputError>;

  [[nodiscard]] auto write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                                  const std::string& units = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_matrix(hid_t parent, const std::string& name, const core::Matrix<double>& data,
                                  const std::string& units = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_string(hid_t parent, const std::string& name, const std::string& value) const
      -> std::expected<void, OutputError>;

  [[nodiscard]] auto create_chunked_properties(std::size_t size) const -> std::expected<PropertyHandle, OutputError>;

  [[nodiscard]] auto create_chunked_properties_2d(std::size_t rows, std::size_t cols) const
      -> std::expected<PropertyHandle, OutputError>;

  auto apply_filters(hid_t props) const -> void;

public:
  explicit HDF5Writer(HDF5Config config = {}) : hdf5_config_(config) {}

  [[nodiscard]] auto write(const std::filesystem::path& file_path, const OutputDataset& dataset,
                           ProgressCallback progress = nullptr) const -> std::expected<void, OutputError> override;

  [[nodiscard]] auto get_extension() const noexcept -> std::string_view override { return ".h5"; }

  [[nodiscard]] auto supports_metadata() const noexcept -> bool override { return true; }

  auto set_hdf5_config(HDF5Config config) noexcept -> void { hdf5_config_ = config; }

  [[nodiscard]] auto get_hdf5_config() const noexcept -> const HDF5Config& { return hdf5_config_; }
};

namespace hdf5 {

// Initialize HDF5 library (call once at program start)
auto initialize() -> std::expected<void, OutputError>;

auto finalize() -> void;

[[nodiscard]] auto check_version() -> std::expected<std::string, OutputError>;

[[nodiscard]] auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError>;

} // namespace hdf5

} // namespace seagas::io::output
