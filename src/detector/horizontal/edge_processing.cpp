#include <opencv2/imgproc.hpp>
#include <algorithm>

#include "edge_processing.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

namespace edge_processing
{
    Mat computeEdgeLevels(const Mat &gray, const EdgeParams &params, bool useOpenCL)
    {
        // Horizontal edge kernel: rows below minus rows above
        Mat kernel = (Mat_<float>(3, 3) << -1, -1, -1,
                      0, 0, 0,
                      +1, +1, +1);

        Mat response;
        if (useOpenCL)
        {
            UMat src = gray.getUMat(ACCESS_READ);
            UMat dst;
            filter2D(src, dst, CV_32F, kernel, Point(-1, -1), 0, BORDER_REFLECT);
            dst.copyTo(response);
        }
        else
        {
            filter2D(gray, response, CV_32F, kernel, Point(-1, -1), 0, BORDER_REFLECT);
        }
        response = abs(response);

        double minVal = 0.0, maxVal = 0.0;
        minMaxLoc(response, &minVal, &maxVal);

        // Image without any variation
        if (maxVal <= minVal)
        {
            return Mat::zeros(response.size(), CV_8U);
        }

        // Map [min, max] onto [0, levels], truncating: only the strongest response reaches levels
        double scale = params.levels / (maxVal - minVal);
        Mat levels(response.size(), CV_8U);
        for (int y = 0; y < response.rows; y++)
        {
            const float *in = response.ptr<float>(y);
            uchar *out = levels.ptr<uchar>(y);
            for (int x = 0; x < response.cols; x++)
            {
                int level = in[x] >= maxVal ? params.levels : static_cast<int>((in[x] - minVal) * scale);
                out[x] = saturate_cast<uchar>(std::min(level, params.levels));
            }
        }
        return levels;
    }

    vector<int> findHorizontalLines(const Mat &levels, const EdgeParams &params)
    {
        vector<int> lines;
        if (levels.empty() || levels.type() != CV_8U)
            return lines;

        int minRun = std::max(1, static_cast<int>(levels.cols * params.min_line_ratio));
        int lastLineRow = -2;

        for (int y = 0; y < levels.rows; y++)
        {
            const uchar *row = levels.ptr<uchar>(y);
            int longestRun = 0;
            int run = 0;

            for (int x = 0; x < levels.cols; x++)
            {
                if (row[x] >= params.min_level && x > 0 && row[x] == row[x - 1] && run > 0)
                    run++;
                else
                    run = row[x] >= params.min_level ? 1 : 0;

                longestRun = std::max(longestRun, run);
            }

            if (longestRun >= minRun)
            {
                // Adjacent rows belong to the same edge (the kernel is three rows tall)
                if (y != lastLineRow + 1)
                {
                    lines.push_back(y);
                }
                lastLineRow = y;
            }
        }

        return lines;
    }

    EdgeResult processEdges(const Mat &gray, const EdgeParams &params, bool useOpenCL)
    {
        EdgeResult result;

        Mat single = gray;
        if (gray.channels() == 3)
            cvtColor(gray, single, COLOR_BGR2GRAY);
        else if (gray.channels() == 4)
            cvtColor(gray, single, COLOR_BGRA2GRAY);

        Mat levels = computeEdgeLevels(single, params, useOpenCL);
        result.line_rows = findHorizontalLines(levels, params);
        result.screenshot = static_cast<int>(result.line_rows.size()) >= params.min_lines;

        log_debug("Horizontal scan found " + log_string(result.line_rows.size()) + " lines");
        return result;
    }

} // namespace edge_processing
