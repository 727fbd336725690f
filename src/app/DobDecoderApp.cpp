/**
 * @file DobDecoderApp.cpp
 * @brief Implementation of the DobDecoderApp class.
 */

#include "app/DobDecoderApp.hpp"

#include <iostream>
#include <memory>

#include "application/RenderService.hpp"
#include "domain/DecodeError.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PassthroughComposer.hpp"
#include "infrastructure/PathUtils.hpp"

namespace dobdecoder::app {

using namespace dobdecoder::infrastructure;

DobDecoderApp::DobDecoderApp(int argc, char** argv)
    : m_program(argc > 0 ? argv[0] : "dob_decoder") {
    for (int i = 1; i < argc; ++i) {
        m_args.emplace_back(argv[i]);
    }
}

void DobDecoderApp::PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " <trait-output> <trait-schema> [--config <dir>]\n"
              << "  Each buffer is a JSON string, or @path to read it from a file.\n";
}

bool DobDecoderApp::ParseArguments() {
    for (size_t i = 0; i < m_args.size(); ++i) {
        const std::string& arg = m_args[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (arg == "--config") {
            if (i + 1 >= m_args.size()) {
                std::cerr << "[DobDecoderApp] --config requires a directory" << std::endl;
                return false;
            }
            m_configDir = m_args[++i];
            continue;
        }
        // JSON buffers start with '[' and files with '@', never with '-'.
        if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "[DobDecoderApp] Unknown option: " << arg << std::endl;
            return false;
        }
        m_buffers.push_back(LoadBuffer(arg));
    }
    return true;
}

std::string DobDecoderApp::LoadBuffer(const std::string& argument) const {
    if (argument.size() < 2 || argument[0] != '@') {
        return argument;
    }
    auto content = PathUtils::ReadFile(argument.substr(1));
    if (!content) {
        // An empty buffer is rejected by the parser with the code of its position.
        std::cerr << "[DobDecoderApp] Cannot read input file: " << argument.substr(1) << std::endl;
        return {};
    }
    return *content;
}

int DobDecoderApp::Run() {
    if (!ParseArguments()) {
        PrintUsage(m_program.c_str());
        return static_cast<int>(domain::ErrorCode(domain::DecodeError::ParseInvalidArgCount));
    }

    const std::string configDir = m_configDir ? *m_configDir : PathUtils::GetDecoderConfigDir().string();
    DecoderSettings settings = ConfigLoader::Load(configDir);
    if (settings.verbose) {
        std::cerr << "[DobDecoderApp] Settings from " << configDir
                  << " (image_type=" << settings.imageType << ")" << std::endl;
    }

    auto composer = std::make_shared<PassthroughComposer>();
    application::RenderService service(composer, settings.imageType, settings.verbose);

    auto report = service.render(m_buffers);
    if (report.error) {
        return static_cast<int>(report.code);
    }

    std::cout << report.document.dump() << std::endl;
    return 0;
}

} // namespace dobdecoder::app
