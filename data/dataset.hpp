#ifndef KBANN_DATASET_H
#define KBANN_DATASET_H

#include <istream>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace kbann {

/**
 * @brief Labelled training examples.
 *
 * File layout: the first line holds comma separated feature names (optionally
 * followed by the label column name); every other line holds the numeric
 * feature values followed by the label.
 */
struct Dataset
{
    std::vector<std::string> featureNames; ///< one per column of features
    std::string              labelName;    ///< empty when the header omits it
    cv::Mat1d                features;     ///< rows = examples, cols = features
    std::vector<std::string> labels;       ///< raw label text per example
    std::vector<int>         lineNumbers;  ///< source line of each example

    /** Number of examples. */
    int size() const noexcept { return features.rows; }

    /** Column of a feature, or -1. */
    int column(const std::string& name) const;

    /**
     * @brief Labels as an n x 1 CV_64F matrix.
     * @throws DatasetFormatError if a label is not numeric.
     */
    cv::Mat targets() const;

    /** @throws DatasetFormatError */
    static Dataset parse(std::istream& in);

    /** @throws std::runtime_error if the file cannot be opened. */
    static Dataset load(const std::string& path);
};

} // namespace kbann

#endif // KBANN_DATASET_H
