#pragma once
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>
#include "network/knowledgenetwork.hpp"

namespace kbann {

/**
 * @brief Heat map of one weight matrix, one square cell per link.
 *
 * Weights are scaled symmetrically around zero so that 0 always maps to the
 * middle of the color map and positive/negative links of equal magnitude
 * get mirrored colors.
 */
inline cv::Mat colorizeWeights(const cv::Mat& weights,
                               int cellPx = 16,
                               int colormap = cv::COLORMAP_JET)
{
    CV_Assert(!weights.empty() && weights.type() == CV_64FC1 && cellPx > 0);

    /* 1.  [-max|w| .. +max|w|] -> [0 .. 255]  ------------------------- */
    double minVal, maxVal;
    cv::minMaxLoc(weights, &minVal, &maxVal);
    const double range = std::max(std::abs(minVal), std::abs(maxVal));
    const double scale = (range > 0) ? 127.5 / range : 0.0;

    cv::Mat1b w8u;
    weights.convertTo(w8u, CV_8U, scale, 127.5);

    /* 2.  color map  -------------------------------------------------- */
    cv::Mat3b color;
    cv::applyColorMap(w8u, color, colormap);

    /* 3.  blow every link up to a visible cell  ----------------------- */
    cv::Mat3b big;
    cv::resize(color, big, cv::Size(color.cols * cellPx, color.rows * cellPx),
               0, 0, cv::INTER_NEAREST);
    return big;
}

/**
 * @brief Write <prefix>_layer<k>.png for every weight layer.
 * @return Paths written.
 * @throws std::runtime_error if an image cannot be written.
 */
inline std::vector<std::string> writeWeightHeatmaps(const KnowledgeNetwork& net,
                                                    const std::string& prefix,
                                                    int cellPx = 16)
{
    std::vector<std::string> paths;
    for (std::size_t k = 0; k < net.depth(); ++k)
    {
        if (net.weights[k].empty())
            continue;
        const std::string path = prefix + "_layer" + std::to_string(k) + ".png";
        if (!cv::imwrite(path, colorizeWeights(net.weights[k], cellPx)))
            throw std::runtime_error("cannot write heat map '" + path + "'");
        paths.push_back(path);
    }
    return paths;
}

} // namespace kbann
