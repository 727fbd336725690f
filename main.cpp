#include "app/DobDecoderApp.hpp"

int main(int argc, char** argv) {
    dobdecoder::app::DobDecoderApp app(argc, argv);
    return app.Run();
}
