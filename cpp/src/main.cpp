#include "qrbackup/backup.hpp"
#include "qrbackup/cli_colors.hpp"
#include "qrbackup/codec.hpp"
#include "qrbackup/config.hpp"
#include "qrbackup/errors.hpp"
#include "qrbackup/qr_encoder.hpp"
#include "qrbackup/stb_canvas.hpp"
#include "qrbackup/zbar_detector.hpp"

#include <iostream>

int main(int argc, char** argv) {
    qrbackup::config::Options options;
    try {
        options = qrbackup::config::ParseArgs(argc, argv);
    } catch (const qrbackup::UsageError& exc) {
        std::cerr << qrbackup::cli::ErrorLine(exc.what()) << "\n\n";
        std::cerr << qrbackup::config::UsageText();
        return 2;
    }
    if (options.show_help) {
        std::cout << qrbackup::config::UsageText();
        return 0;
    }
    qrbackup::cli::SetColorsEnabled(options.color);

    try {
        qrbackup::codec::Base32Transcoder transcoder;
        qrbackup::symbols::StbCanvas canvas;
        if (options.IsEncode()) {
            qrbackup::symbols::QrSymbolEncoder encoder(options.level);
            qrbackup::backup::EncodeFile(options, transcoder, encoder, canvas, std::cout);
            return 0;
        }
        qrbackup::symbols::ZbarSymbolDetector detector(canvas);
        auto result = qrbackup::backup::DecodeInputs(options, transcoder, detector, canvas, std::cout);
        return result.Succeeded() ? 0 : 1;
    } catch (const std::exception& exc) {
        std::cerr << qrbackup::cli::ErrorLine(exc.what()) << "\n";
        return 1;
    }
}
