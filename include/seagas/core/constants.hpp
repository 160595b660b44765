#pragma once

#include <cstddef>

namespace seagas::constants {

// ================================================================================================
// FUNDAMENTAL PHYSICAL CONSTANTS
// ================================================================================================

namespace physical {
/// Universal gas constant used by the diffusivity fits [J/(mol·K)]
inline constexpr double gas_constant = 8.314510;

/// 0 °C expressed in kelvin
inline constexpr double celsius_to_kelvin = 273.15;

/// Upper reference temperature of the Benson & Krause scaled temperature [°C + 273.15]
inline constexpr double scaled_temperature_reference = 298.15;
}  // namespace physical

// ================================================================================================
// TEMPERATURE AND SALINITY SCALES
// ================================================================================================

namespace scales {
/// ITS-90 -> IPTS-68 multiplicative factor
inline constexpr double its90_to_ipts68 = 1.00024;

/// Practical salinity of standard seawater
inline constexpr double reference_practical_salinity = 35.0;

/// Absolute salinity of standard seawater [g/kg]
inline constexpr double reference_absolute_salinity = 35.16504;

/// SA/SP for reference-composition seawater
inline constexpr double reference_composition_ratio = reference_absolute_salinity / reference_practical_salinity;
}  // namespace scales

// ================================================================================================
// UNIT CONVERSION FACTORS
// ================================================================================================

namespace conversion {
/// Helium ideal-gas molar volume correction, mL/kg -> umol/kg
inline constexpr double helium_ml_to_umol = 44.55817671505537;

/// Krypton ideal-gas molar volume correction, mL/kg -> umol/kg
inline constexpr double krypton_ml_to_umol = 44.74052731185490;

/// Scale applied to the kinematic viscosity polynomial
inline constexpr double viscosity_polynomial_scale = 1e-4;

/// dbar -> bar
inline constexpr double dbar_to_bar = 0.1;

/// Progress percentage conversion factor
inline constexpr double to_percentage = 100.0;
}  // namespace conversion

// ================================================================================================
// DIFFUSIVITY
// ================================================================================================

namespace diffusion {
/// Fractional diffusivity reduction measured in NaCl solution
inline constexpr double salinity_attenuation = 0.049;

/// Salinity of the NaCl solution the attenuation was measured in
inline constexpr double attenuation_reference_salinity = 35.5;
}  // namespace diffusion

// ================================================================================================
// DEFAULT TABLE PARAMETERS
// ================================================================================================

namespace defaults {
inline constexpr double salinity_min = 0.0;
inline constexpr double salinity_max = 40.0;
inline constexpr int salinity_points = 9;

inline constexpr double temperature_min = -2.0;
inline constexpr double temperature_max = 40.0;
inline constexpr int temperature_points = 43;
}  // namespace defaults

// ================================================================================================
// I/O PARAMETERS
// ================================================================================================

namespace io {
/// Default HDF5 compression level
inline constexpr int default_hdf5_compression = 6;

/// Default HDF5 chunk size
inline constexpr std::size_t default_hdf5_chunk_size = 1024;

/// Bytes to KB conversion
inline constexpr double bytes_to_kb = 1024.0;

inline constexpr const char* default_seagas_version = "1.0.0";
inline constexpr const char* default_output_directory = "seagas_outputs";
inline constexpr const char* default_case_name = "table";
}  // namespace io

// ================================================================================================
// INDEXING AND EXIT CODES
// ================================================================================================

namespace indexing {
inline constexpr std::size_t first = 0;
inline constexpr std::size_t second = 1;
inline constexpr std::size_t third = 2;
}  // namespace indexing

// ================================================================================================
// STRING PROCESSING CONSTANTS
// ================================================================================================

namespace string_processing {
/// Length of comma-space separator for options
inline constexpr std::size_t option_separator_length = 2;

inline constexpr int float_precision_2 = 2;

inline constexpr int wide_field_width = 14;
inline constexpr int separator_width = 36;

namespace colors {
inline constexpr const char* reset = "\033[0m";
inline constexpr const char* red = "\033[31m";
inline constexpr const char* green = "\033[32m";
inline constexpr const char* blue = "\033[34m";
inline constexpr const char* cyan = "\033[36m";
}  // namespace colors
}  // namespace string_processing

}  // namespace seagas::constants
