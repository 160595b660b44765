#pragma once
#include "output_writer.hpp"
#include <fstream>
#include <iomanip>

namespace seagas::io::output {

// CSV-specific configuration
struct CSVConfig {
    char delimiter = ',';
    int precision = 10;
    bool include_headers = true;
    bool scientific_notation = true; // diffusivities are O(1e-9)
    std::string line_ending = "\n";
};

// Long-format CSV: one row per (table, salinity, temperature) cell
//   gas,quantity,salinity,temperature,value,units
// Gas-independent tables leave the gas column empty.
class CSVWriter : public FormatWriter {
private:
    CSVConfig csv_config_;

    [[nodiscard]] auto format_value(double value) const -> std::string;

    auto write_header(std::ofstream& file, const TableMetadata& metadata) const -> void;

public:
    explicit CSVWriter(CSVConfig config = {}) : csv_config_(std::move(config)) {}

    [[nodiscard]] auto write(
        const std::filesystem::path& file_path,
        const OutputDataset& dataset,
        ProgressCallback progress = nullptr
    ) const -> std::expected<void, OutputError> override;

    [[nodiscard]] auto get_extension() const noexcept -> std::string_view override {
        return ".csv";
    }

    [[nodiscard]] auto supports_metadata() const noexcept -> bool override {
        return false;  // '#' comment lines only
    }

    auto set_csv_config(CSVConfig config) noexcept -> void {
        csv_config_ = std::move(config);
    }

    [[nodiscard]] auto get_csv_config() const noexcept -> const CSVConfig& {
        return csv_config_;
    }
};

} // namespace seagas::io::output
