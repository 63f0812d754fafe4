#pragma once
#include <string>
#include <vector>
#include "models/EncodedFormat.hpp"

struct RenderOutput;

constexpr int kDefaultJpegQuality = 92;

/**
 * @brief Encode the current frame for download.
 *        PNG keeps the transparent margin around the tear; JPEG is flattened
 *        onto white.
 * @return false for placeholder frames or when encoding fails.
 */
bool encodeFrame(const RenderOutput& frame, EncodedFormat format, std::vector<unsigned char>& outBytes, int jpegQuality = kDefaultJpegQuality);

// <dir>/<stem>_torn.<png|jpg> next to the input
std::string makeExportPath(const std::string& inPath, EncodedFormat format);

// Encode and write to disk; the extension of outPath must match format (front ends only)
bool writeFrame(const RenderOutput& frame, const std::string& outPath, EncodedFormat format);

