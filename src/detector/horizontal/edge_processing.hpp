#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace edge_processing
{
    // Horizontal line scan parameters
    struct EdgeParams
    {
        int levels = 10;              // Edge response is quantized to 0..levels
        int min_level = 2;            // Weakest quantized edge that can be part of a line
        double min_line_ratio = 0.9;  // A line must span this share of the image width
        int min_lines = 1;            // Lines needed to call the image a screenshot
    };

    // Result of the horizontal edge scan
    struct EdgeResult
    {
        std::vector<int> line_rows; // Rows carrying a horizontal line
        bool screenshot = false;
    };

    // Absolute response of the horizontal edge kernel, quantized to 0..params.levels (CV_8U).
    // A flat response yields an all-zero map. Uses OpenCL when useOpenCL is set.
    cv::Mat computeEdgeLevels(const cv::Mat &gray, const EdgeParams &params = EdgeParams(), bool useOpenCL = false);

    // Rows where one quantized edge level runs uninterrupted across most of the width
    std::vector<int> findHorizontalLines(const cv::Mat &levels, const EdgeParams &params = EdgeParams());

    // Full pipeline on a grayscale image
    EdgeResult processEdges(const cv::Mat &gray, const EdgeParams &params = EdgeParams(), bool useOpenCL = false);

} // namespace edge_processing
