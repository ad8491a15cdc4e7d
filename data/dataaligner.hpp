#ifndef KBANN_DATAALIGNER_H
#define KBANN_DATAALIGNER_H

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "dataset.hpp"
#include "../network/knowledgenetwork.hpp"
#include "../config.hpp"

namespace kbann {

/** Raw-data columns entering the network at one weight layer. */
struct InputBlock
{
    std::size_t layer{0}; ///< weight layer the block feeds
    UnitNames   units;    ///< column names, in network order
    cv::Mat     data;     ///< CV_64F, rows = examples, cols = units.size()
};

/**
 * @brief Reorders dataset columns to match the network's input units.
 *
 * Layer 0 always gets a block. A deeper layer gets one only when its input
 * names contain units beyond those carried from the previous layer; those
 * columns receive a little uniform noise so identical units do not stay
 * identical during training.
 */
class DataAligner
{
public:
    explicit DataAligner(const AlignConfig& config) : config_(config) {}

    /** @throws UnknownFeatureReference for a unit that is not a dataset column. */
    std::vector<InputBlock> align(const Dataset& data, const KnowledgeNetwork& net) const;

    /** Columns of data selected by name, in the given order. */
    static cv::Mat selectColumns(const Dataset& data, const UnitNames& units, int layer);

private:
    AlignConfig config_;
};

/** Block feeding weight layer k, or nullptr. */
const InputBlock* findBlock(const std::vector<InputBlock>& blocks, std::size_t k);

} // namespace kbann

#endif // KBANN_DATAALIGNER_H
