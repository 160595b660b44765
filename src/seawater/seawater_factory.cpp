#include "seagas/seawater/eos80_seawater.hpp"
#include "seagas/seawater/seawater_interface.hpp"
#if defined(SEAGAS_HAVE_TEOS10)
#include "seagas/seawater/teos10_seawater.hpp"
#endif

namespace seagas::seawater {

auto create_seawater(const io::SeawaterConfig& config)
    -> std::expected<std::unique_ptr<SeawaterInterface>, SeawaterError> {

  switch (config.provider) {
  case io::SeawaterConfig::Provider::EOS80:
    return std::make_unique<Eos80Seawater>();
  case io::SeawaterConfig::Provider::TEOS10:
#if defined(SEAGAS_HAVE_TEOS10)
    return std::make_unique<Teos10Seawater>();
#else
    return std::unexpected(
        SeawaterError("TEOS-10 provider requested but seagas was built without the GSW library"));
#endif
  }
  return std::unexpected(SeawaterError("Unknown seawater provider"));
}

} // namespace seagas::seawater
