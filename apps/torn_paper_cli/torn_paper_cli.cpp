// Command line front end for the torn paper renderer
// Build via CMake target: torn_paper_cli

#include "render_session.hpp"
#include "frame_export.hpp"
#include "util/RandomSource.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace
{
    void printUsage(const char* argv0)
    {
        std::cerr << "Usage: " << argv0 << " --input <image> [--output <file>] [--format png|jpg]\n"
                  << "  [--size N] [--edge-thickness N] [--edge-intensity N] [--edge-details N]\n"
                  << "  [--cutout-style N] [--texture N] [--shadow-x N] [--shadow-y N]\n"
                  << "  [--shadow-blur N] [--shadow-strength N] [--movement N]\n"
                  << "  [--max-width PX] [--max-height PX]\n"
                  << "  [--brightness PCT] [--contrast PCT] [--sepia PCT] [--grayscale] [--vignette]\n"
                  << "  [--seed N]\n"
                  << "Slider values N are 0..100.\n";
    }
}

int main(int argc, char** argv)
{
    std::string inputPath, outputPath, formatArg;
    StyleParameters params;
    ToneSettings tone;
    ContainerBounds bounds;
    long long seed = -1;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
                return argv[++i];
            };
            if (arg == "--input") inputPath = next();
            else if (arg == "--output") outputPath = next();
            else if (arg == "--format") formatArg = next();
            else if (arg == "--size") params.size = std::stod(next());
            else if (arg == "--edge-thickness") params.edgeThickness = std::stod(next());
            else if (arg == "--edge-intensity") params.edgeIntensity = std::stod(next());
            else if (arg == "--edge-details") params.edgeDetails = std::stod(next());
            else if (arg == "--cutout-style") params.cutoutStyle = std::stod(next());
            else if (arg == "--texture") params.textureStrength = std::stod(next());
            else if (arg == "--shadow-x") params.shadowOffsetX = std::stod(next());
            else if (arg == "--shadow-y") params.shadowOffsetY = std::stod(next());
            else if (arg == "--shadow-blur") params.shadowBlur = std::stod(next());
            else if (arg == "--shadow-strength") params.shadowStrength = std::stod(next());
            else if (arg == "--movement") params.movement = std::stod(next());
            else if (arg == "--max-width") bounds.width = std::stoi(next());
            else if (arg == "--max-height") bounds.height = std::stoi(next());
            else if (arg == "--brightness") tone.brightness = std::stoi(next());
            else if (arg == "--contrast") tone.contrast = std::stoi(next());
            else if (arg == "--sepia") tone.sepia = std::stoi(next());
            else if (arg == "--grayscale") tone.grayscale = true;
            else if (arg == "--vignette") tone.vignette = true;
            else if (arg == "--seed") seed = std::stoll(next());
            else if (arg == "--help" || arg == "-h") { printUsage(argv[0]); return 0; }
            else { std::cerr << "Unknown option: " << arg << "\n"; printUsage(argv[0]); return 1; }
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    if (inputPath.empty()) { printUsage(argv[0]); return 1; }

    std::unique_ptr<util::RandomSource> rng;
    if (seed >= 0) rng = std::make_unique<util::CvRandomSource>(static_cast<uint64_t>(seed));
    RenderSession session(std::move(rng));

    session.setSource(loadSourceImage(inputPath));
    const SourceImage& src = session.source();
    const EncodedFormat format = formatArg.empty()
        ? (outputPath.empty() ? src.format : formatFromExtension(outputPath))
        : formatFromExtension("." + formatArg);

    const RenderOutput frame = session.render(params, bounds, tone);
    if (frame.placeholder)
    {
        std::cerr << "Error: " << placeholderMessage(src.state == SourceState::DecodeFailed ? PlaceholderKind::DecodeFailed : PlaceholderKind::NoImage) << "\n";
        return 1;
    }

    if (outputPath.empty()) outputPath = makeExportPath(inputPath, format);
    if (!writeFrame(frame, outputPath, format)) { std::cerr << "Error: could not write " << outputPath << "\n"; return 1; }

    std::cout << "Saved to " << outputPath << " (" << frame.bitmap.cols << "x" << frame.bitmap.rows << ")\n";
    if (frame.motion.enabled)
        std::cout << "Motion: amplitude " << frame.motion.amplitude << " px, period " << frame.motion.period << " s\n";
    else
        std::cout << "Motion: disabled\n";
    return 0;
}
