#include "qrbackup/qr_encoder.hpp"

#include "qrbackup/errors.hpp"

#include "qrcodegen.hpp"

#include <algorithm>
#include <stdexcept>

namespace qrbackup::symbols {

namespace {

qrcodegen::QrCode::Ecc ToEcc(config::RobustnessLevel level) {
    switch (level) {
        case config::RobustnessLevel::L:
            return qrcodegen::QrCode::Ecc::LOW;
        case config::RobustnessLevel::M:
            return qrcodegen::QrCode::Ecc::MEDIUM;
        case config::RobustnessLevel::Q:
            return qrcodegen::QrCode::Ecc::QUARTILE;
        case config::RobustnessLevel::H:
            return qrcodegen::QrCode::Ecc::HIGH;
    }
    return qrcodegen::QrCode::Ecc::LOW;
}

}  // namespace

QrSymbolEncoder::QrSymbolEncoder(config::RobustnessLevel level, int module_scale, int quiet_zone)
    : level_(level), module_scale_(module_scale), quiet_zone_(quiet_zone) {
    if (module_scale_ < 1 || quiet_zone_ < 0) {
        throw std::invalid_argument("Invalid QR module scale or quiet zone");
    }
}

image::ImageBuffer QrSymbolEncoder::Render(const std::string& payload) {
    // Upper-case base32 text lands in alphanumeric mode.
    try {
        const qrcodegen::QrCode qr = qrcodegen::QrCode::encodeText(payload.c_str(), ToEcc(level_));
        const int modules = qr.getSize();
        const int side = (modules + 2 * quiet_zone_) * module_scale_;
        image::ImageBuffer out = image::Blank(side, side, 1);
        for (int y = 0; y < modules; ++y) {
            for (int x = 0; x < modules; ++x) {
                if (!qr.getModule(x, y)) {
                    continue;
                }
                const int px = (x + quiet_zone_) * module_scale_;
                const int py = (y + quiet_zone_) * module_scale_;
                for (int dy = 0; dy < module_scale_; ++dy) {
                    std::uint8_t* row = out.pixels.data() + out.Offset(px, py + dy);
                    std::fill(row, row + module_scale_, image::kBlack);
                }
            }
        }
        return out;
    } catch (const qrcodegen::data_too_long& exc) {
        throw CapacityError(std::string("Payload does not fit a QR symbol at level ") + config::LevelName(level_)
                            + ": " + exc.what());
    }
}

}  // namespace qrbackup::symbols
