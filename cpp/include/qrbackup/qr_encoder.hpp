#pragma once

#include "qrbackup/capabilities.hpp"
#include "qrbackup/config.hpp"
#include "qrbackup/constants.hpp"

#include <string>

namespace qrbackup::symbols {

// Renders payloads as grey QR symbols through the qrcodegen library.
class QrSymbolEncoder : public SymbolEncoder {
public:
    explicit QrSymbolEncoder(config::RobustnessLevel level,
                             int module_scale = constants::kModuleScale,
                             int quiet_zone = constants::kQuietZoneModules);

    // Throws CapacityError when the payload does not fit a version 40 symbol.
    image::ImageBuffer Render(const std::string& payload) override;

private:
    config::RobustnessLevel level_;
    int module_scale_;
    int quiet_zone_;
};

}  // namespace qrbackup::symbols
