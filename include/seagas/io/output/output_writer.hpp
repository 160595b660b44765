#pragma once
#include "output_types.hpp"
#include <expected>
#include <memory>
#include <vector>

namespace seagas::io::output {

// Abstract base class for format-specific writers
class FormatWriter {
public:
    virtual ~FormatWriter() = default;

    [[nodiscard]] virtual auto write(
        const std::filesystem::path& file_path,
        const OutputDataset& dataset,
        ProgressCallback progress = nullptr
    ) const -> std::expected<void, OutputError> = 0;

    [[nodiscard]] virtual auto get_extension() const noexcept -> std::string_view = 0;
    [[nodiscard]] virtual auto supports_metadata() const noexcept -> bool = 0;
};

// Factory for creating format-specific writers
class WriterFactory {
public:
    [[nodiscard]] static auto create_writer(OutputFormat format)
        -> std::expected<std::unique_ptr<FormatWriter>, UnsupportedFormatError>;

    [[nodiscard]] static auto get_available_formats() noexcept
        -> std::vector<OutputFormat>;
};

// Writes a generated table set in every configured format
class OutputWriter {
private:
    OutputConfig config_;
    std::vector<std::unique_ptr<FormatWriter>> writers_;

    [[nodiscard]] auto generate_file_paths(const std::string& case_name) const
        -> std::vector<std::filesystem::path>;

public:
    explicit OutputWriter(OutputConfig config = {});

    [[nodiscard]] auto write_tables(
        const PropertyTableGenerator::Result& result,
        std::string_view seawater_provider,
        const std::string& case_name,
        ProgressCallback progress = nullptr
    ) -> std::expected<std::vector<std::filesystem::path>, OutputError>;

    [[nodiscard]] auto get_config() const noexcept -> const OutputConfig& {
        return config_;
    }

    // Creates the output directory if needed, rejects unknown formats
    [[nodiscard]] auto validate_config() const -> std::expected<void, OutputError>;

    [[nodiscard]] auto get_output_info(const std::string& case_name) const
        -> std::vector<std::pair<OutputFormat, std::filesystem::path>>;

private:
    auto initialize_writers() -> void;
};

} // namespace seagas::io::output
