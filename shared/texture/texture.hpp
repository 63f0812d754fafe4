#pragma once
namespace cv { class Mat; }
namespace util { class RandomSource; }

struct TextureSettings
{
    double grainAmplitude {0.0};   // +/- luminance levels per pixel
    int fiberCount {0};
    double fiberOpacity {0.0};
    bool enabled {false};
};

// Grain and fiber density both grow monotonically with textureStrength (0..100).
// Strength 0 disables the pass.
TextureSettings mapTextureSettings(double textureStrength, int canvasWidth, int canvasHeight);

// Perturb luminance and scatter fibers inside the coverage mask of a BGRA canvas
void applyPaperTexture(cv::Mat& canvas, const cv::Mat& coverage, const TextureSettings& texture, util::RandomSource& rng);
