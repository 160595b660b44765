#include "seagas/core/constants.hpp"
#include "seagas/gas/gas.hpp"
#include "seagas/io/config_types.hpp"
#include "seagas/io/property_table_generator.hpp"
#include "seagas/io/yaml_parser.hpp"
#include "seagas/seawater/seawater_interface.hpp"
#include "seagas/solubility/solubility.hpp"
#include "seagas/transport/diffusivity.hpp"
#include "seagas/transport/viscosity.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    std::cout << "Usage:\n";
    std::cout << "  seagas_point <gas> <practical_salinity> <potential_temperature_C> [quantity] [provider]\n";
    std::cout << "\nGases:\n";
    std::cout << "  He Ne Ar Kr Xe N2 N2O O2 CO2 CH4 H2\n";
    std::cout << "\nQuantities:\n";
    std::cout << "  solubility | diffusivity | schmidt | viscosity   (default: all available)\n";
    std::cout << "\nProviders:\n";
    std::cout << "  eos80 (default) | teos10\n";
    std::cout << "\nExamples:\n";
    std::cout << "  seagas_point O2 35 20\n";
    std::cout << "  seagas_point CO2 35 20 schmidt\n";
    std::cout << "  seagas_point Ar 0 4 solubility teos10\n";
}

auto parse_number(const std::string& text) -> std::optional<double> {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

template <typename Map>
auto lookup(const Map& map, std::string key) -> std::optional<typename Map::mapped_type> {
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });
    if (auto it = map.find(key); it != map.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto evaluate(const seagas::seawater::SeawaterInterface& seawater, seagas::io::Quantity quantity,
              double sp, double pt, seagas::gas::Gas gas) -> std::expected<double, seagas::core::PropertyError> {
    using seagas::io::Quantity;
    switch (quantity) {
    case Quantity::Solubility:
        return seagas::solubility::solubility(sp, pt, gas);
    case Quantity::Diffusivity:
        return seagas::transport::diffusion_coefficient(seawater, sp, pt, gas);
    case Quantity::SchmidtNumber:
        return seagas::transport::schmidt_number(seawater, sp, pt, gas);
    case Quantity::Viscosity:
        return seagas::transport::kinematic_viscosity(seawater, sp, pt);
    }
    return std::unexpected(seagas::core::PropertyError(seagas::core::PropertyError::Kind::UnsupportedGas,
                                                       "Unknown quantity"));
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 4 || argc > 6) {
        print_usage();
        return 1;
    }

    auto gas = seagas::gas::parse_gas(argv[1]);
    if (!gas) {
        std::cerr << "Error: " << gas.error().message() << std::endl;
        return 1;
    }

    auto sp = parse_number(argv[2]);
    auto pt = parse_number(argv[3]);
    if (!sp || !pt) {
        std::cerr << "Error: salinity and temperature must be numbers" << std::endl;
        print_usage();
        return 1;
    }

    using seagas::io::Quantity;
    std::vector<Quantity> quantities{Quantity::Solubility, Quantity::Diffusivity, Quantity::SchmidtNumber,
                                     Quantity::Viscosity};
    const bool explicit_quantity = argc >= 5;
    if (explicit_quantity) {
        auto quantity = lookup(seagas::io::enum_mappings::quantities, argv[4]);
        if (!quantity) {
            std::cerr << "Error: unknown quantity '" << argv[4] << "'" << std::endl;
            return 1;
        }
        quantities = {*quantity};
    }

    seagas::io::SeawaterConfig seawater_config;
    if (argc == 6) {
        auto provider = lookup(seagas::io::enum_mappings::seawater_providers, argv[5]);
        if (!provider) {
            std::cerr << "Error: unknown seawater provider '" << argv[5] << "'" << std::endl;
            return 1;
        }
        seawater_config.provider = *provider;
    }

    auto seawater = seagas::seawater::create_seawater(seawater_config);
    if (!seawater) {
        std::cerr << "Error: " << seawater.error().message() << std::endl;
        return 1;
    }

    std::cout << std::format("{} at SP = {}, pt = {} °C ({})\n", seagas::gas::symbol(*gas), *sp, *pt,
                             (*seawater)->name());
    std::cout << std::string(seagas::constants::string_processing::separator_width, '-') << "\n";

    for (const auto quantity : quantities) {
        auto value = evaluate(**seawater, quantity, *sp, *pt, *gas);
        if (!value) {
            // Skip quantities the gas has no correlation for unless one was asked for
            if (!explicit_quantity &&
                value.error().kind() == seagas::core::PropertyError::Kind::UnsupportedGas) {
                continue;
            }
            std::cerr << "Error: " << value.error().message() << std::endl;
            return 1;
        }

        auto units = seagas::io::PropertyTableGenerator::quantity_units(quantity, *gas);
        std::cout << std::format("  {:<12} {:>16.8g} {}\n", seagas::io::quantity_name(quantity), *value,
                                 units ? *units : std::string{});
    }

    return 0;
}
