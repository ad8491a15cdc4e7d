#include "dataaligner.hpp"

#include "../errors.hpp"

namespace kbann {

cv::Mat DataAligner::selectColumns(const Dataset& data, const UnitNames& units, int layer)
{
    cv::Mat out(data.size(), static_cast<int>(units.size()), CV_64F);
    for (std::size_t c = 0; c < units.size(); ++c)
    {
        const int src = data.column(units[c]);
        if (src < 0)
            throw UnknownFeatureReference(units[c], layer);
        data.features.col(src).copyTo(out.col(static_cast<int>(c)));
    }
    return out;
}

std::vector<InputBlock> DataAligner::align(const Dataset& data, const KnowledgeNetwork& net) const
{
    std::vector<InputBlock> blocks;
    cv::RNG rng(config_.seed);

    for (std::size_t k = 0; k < net.depth(); ++k)
    {
        UnitNames fresh = net.freshInputs(k);
        if (k > 0 && fresh.empty())
            continue;                           // fed by layer k-1 activations only

        InputBlock block;
        block.layer = k;
        block.data  = selectColumns(data, fresh, static_cast<int>(k));
        block.units = std::move(fresh);

        if (k > 0 && config_.noiseScale > 0.0 && !block.data.empty())
        {
            cv::Mat noise(block.data.size(), CV_64F);
            rng.fill(noise, cv::RNG::UNIFORM, 0.0, config_.noiseScale);
            block.data += noise;
        }
        blocks.push_back(std::move(block));
    }
    return blocks;
}

const InputBlock* findBlock(const std::vector<InputBlock>& blocks, std::size_t k)
{
    for (const auto& b : blocks)
        if (b.layer == k)
            return &b;
    return nullptr;
}

} // namespace kbann
