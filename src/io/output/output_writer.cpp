#include "seagas/io/output/output_writer.hpp"
#include "seagas/io/output/csv_writer.hpp"
#include "seagas/io/output/hdf5_writer.hpp"
#include <algorithm>
#include <chrono>
#include <vector>

namespace seagas::io::output {

// WriterFactory implementation
auto WriterFactory::create_writer(OutputFormat format)
    -> std::expected<std::unique_ptr<FormatWriter>, UnsupportedFormatError> {

  switch (format) {
  case OutputFormat::HDF5:
    return std::make_unique<HDF5Writer>();
  case OutputFormat::CSV:
    return std::make_unique<CSVWriter>();
  }
  return std::unexpected(UnsupportedFormatError(format));
}

auto WriterFactory::get_available_formats() noexcept -> std::vector<OutputFormat> {
  return {OutputFormat::HDF5, OutputFormat::CSV};
}

// OutputWriter implementation
OutputWriter::OutputWriter(OutputConfig config) : config_(std::move(config)) {
  initialize_writers();
}

auto OutputWriter::initialize_writers() -> void {
  writers_.clear();

  for (auto format : config_.formats) {
    if (auto writer = WriterFactory::create_writer(format)) {
      writers_.push_back(std::move(writer.value()));
    }
  }
}

auto OutputWriter::write_tables(const PropertyTableGenerator::Result& result, std::string_view seawater_provider,
                                const std::string& case_name, ProgressCallback progress)
    -> std::expected<std::vector<std::filesystem::path>, OutputError> {

  OutputDataset dataset;
  dataset.metadata.creation_time = std::chrono::system_clock::now();
  dataset.metadata.seawater_provider = std::string(seawater_provider);
  dataset.metadata.case_name = case_name;
  dataset.result = result;

  auto file_paths = generate_file_paths(case_name);

  if (!file_paths.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(file_paths[0].parent_path(), ec);
    if (ec) {
      return std::unexpected(FileWriteError(file_paths[0].parent_path(), ec.message()));
    }
  }

  std::vector<std::filesystem::path> written_files;
  written_files.reserve(writers_.size());

  for (std::size_t i = 0; i < writers_.size() && i < file_paths.size(); ++i) {
    auto& writer = writers_[i];
    const auto& file_path = file_paths[i];

    if (progress) {
      progress(static_cast<double>(i) / writers_.size(), std::format("Writing {}", file_path.filename().string()));
    }

    if (auto write_result = writer->write(file_path, dataset, progress); !write_result) {
      return std::unexpected(FileWriteError(file_path, write_result.error().message()));
    }

    written_files.push_back(file_path);
  }

  if (progress) {
    progress(1.0, "Output complete");
  }

  return written_files;
}

auto OutputWriter::generate_file_paths(const std::string& case_name) const -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> paths;
  paths.reserve(writers_.size());

  for (const auto& writer : writers_) {
    auto filename = case_name + std::string(writer->get_extension());
    paths.push_back(std::filesystem::path(config_.output_directory) / filename);
  }

  return paths;
}

auto OutputWriter::validate_config() const -> std::expected<void, OutputError> {
  if (config_.formats.empty()) {
    return std::unexpected(OutputError("No output format selected"));
  }

  const auto available = WriterFactory::get_available_formats();
  for (auto format : config_.formats) {
    if (std::ranges::find(available, format) == available.end()) {
      return std::unexpected(UnsupportedFormatError(format));
    }
  }

  const std::filesystem::path directory(config_.output_directory);
  if (!std::filesystem::exists(directory)) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
      return std::unexpected(
          OutputError(std::format("Cannot create output directory '{}': {}", directory.string(), ec.message())));
    }
  }

  return {};
}

auto OutputWriter::get_output_info(const std::string& case_name) const
    -> std::vector<std::pair<OutputFormat, std::filesystem::path>> {
  std::vector<std::pair<OutputFormat, std::filesystem::path>> info;
  auto paths = generate_file_paths(case_name);

  for (std::size_t i = 0; i < std::min(config_.formats.size(), paths.size()); ++i) {
    info.emplace_back(config_.formats[i], paths[i]);
  }

  return info;
}

} // namespace seagas::io::output
