#include "seagas/io/output/csv_writer.hpp"
#include <sstream>

namespace seagas::io::output {

auto CSVWriter::write(
    const std::filesystem::path& file_path,
    const OutputDataset& dataset,
    ProgressCallback progress
) const -> std::expected<void, OutputError> {

    if (progress) progress(0.0, "Creating CSV file");

    std::ofstream file(file_path);
    if (!file.is_open()) {
        return std::unexpected(FileWriteError(file_path, "Cannot open file for writing"));
    }

    if (csv_config_.include_headers) {
        write_header(file, dataset.metadata);
    }

    const auto& result = dataset.result;
    const auto d = csv_config_.delimiter;

    for (std::size_t t = 0; t < result.tables.size(); ++t) {
        const auto& table = result.tables[t];

        if (progress) {
            progress(static_cast<double>(t) / result.tables.size(), std::format("Writing {}", table_path(table)));
        }

        const std::string gas_name = table.gas ? std::string(gas::symbol(*table.gas)) : std::string{};
        const auto quantity = quantity_name(table.quantity);

        for (std::size_t i = 0; i < table.values.rows(); ++i) {
            for (std::size_t j = 0; j < table.values.cols(); ++j) {
                file << gas_name << d
                     << quantity << d
                     << format_value(result.salinities[i]) << d
                     << format_value(result.temperatures[j]) << d
                     << format_value(table.values(i, j)) << d
                     << table.units << csv_config_.line_ending;
            }
        }
    }

    file.flush();
    if (!file.good()) {
        return std::unexpected(FileWriteError(file_path, "Write failed"));
    }

    if (progress) progress(1.0, "CSV write complete");

    return {};
}

auto CSVWriter::write_header(std::ofstream& file, const TableMetadata& metadata) const -> void {
    const auto d = csv_config_.delimiter;

    file << "# seagas " << metadata.seagas_version << csv_config_.line_ending;
    file << "# case: " << metadata.case_name << csv_config_.line_ending;
    file << "# seawater provider: " << metadata.seawater_provider << csv_config_.line_ending;
    file << "# salinity: practical salinity, temperature: potential temperature (degC)" << csv_config_.line_ending;
    file << "gas" << d << "quantity" << d << "salinity" << d << "temperature" << d << "value" << d << "units"
         << csv_config_.line_ending;
}

auto CSVWriter::format_value(double value) const -> std::string {
    std::ostringstream oss;

    if (csv_config_.scientific_notation) {
        oss << std::scientific;
    } else {
        oss << std::fixed;
    }
    oss << std::setprecision(csv_config_.precision) << value;

    return oss.str();
}

} // namespace seagas::io::output
