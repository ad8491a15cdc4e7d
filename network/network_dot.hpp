#pragma once
/*-----------------------------------------------------------------------------
 *  network_dot.hpp
 *
 *  Helper: dump a KnowledgeNetwork into Graphviz DOT syntax.
 *  Usage:
 *      #include "network_dot.hpp"
 *      std::ofstream ofs("network.dot");
 *      kbann::writeDot(net, ofs);
 *      // then   dot -Tpng network.dot -o network.png
 *---------------------------------------------------------------------------*/
#include <iomanip>
#include <ostream>
#include <sstream>
#include "knowledgenetwork.hpp"

namespace kbann {

/* --- main writer --------------------------------------------------------- */
/**
 * @brief Serialise a network into Graphviz DOT format.
 *
 * Units are grouped per name layer (one rank each); a unit name that occurs
 * in several layers gets one node per occurrence. Zero links are skipped.
 *
 * @param net          Network to serialise.
 * @param os           Output stream.
 * @param withWeights  If true, links are labelled with their weights.
 */
inline void writeDot(const KnowledgeNetwork& net, std::ostream& os, bool withWeights = true)
{
    auto nodeId = [](std::size_t layer, std::size_t unit) {
        return "u" + std::to_string(layer) + "_" + std::to_string(unit);
    };

    os << "digraph KnowledgeNetwork {\n";
    os << "  rankdir=LR;\n";
    os << "  node [shape=ellipse, style=filled, fillcolor=\"#e0f7ff\"];\n";

    /* --- nodes, one rank per name layer ---------------------------------- */
    for (std::size_t l = 0; l < net.layers.size(); ++l)
    {
        // Output layer l and input layer l+1 share their leading units; only
        // draw input layers for the units that enter from raw data.
        if (l > 0 && l % 2 == 0)
            continue;

        os << "  { rank=same;";
        for (std::size_t u = 0; u < net.layers[l].size(); ++u)
            os << ' ' << nodeId(l, u) << " [label=\"" << net.layers[l][u] << "\"];";
        os << " }\n";
    }

    /* --- edges ------------------------------------------------------------ */
    for (std::size_t k = 0; k < net.depth(); ++k)
    {
        const cv::Mat& w      = net.weights[k];
        const std::size_t in  = 2 * k;
        const std::size_t out = 2 * k + 1;
        const std::size_t carried = (k == 0) ? 0 : net.outputs(k - 1).size();

        for (int i = 0; i < w.rows; ++i)
        {
            // inputs carried from the previous layer are drawn as its outputs
            const std::string from = (k > 0 && static_cast<std::size_t>(i) < carried)
                                   ? nodeId(in - 1, static_cast<std::size_t>(i))
                                   : nodeId(in, static_cast<std::size_t>(i));
            if (k > 0 && static_cast<std::size_t>(i) >= carried)
                os << "  " << from << " [label=\"" << net.layers[in][i] << "\"];\n";

            for (int j = 0; j < w.cols; ++j)
            {
                const double v = w.at<double>(i, j);
                if (v == 0.0) continue;

                os << "  " << from << " -> " << nodeId(out, static_cast<std::size_t>(j));
                if (withWeights)
                {
                    std::ostringstream lbl;
                    lbl << std::fixed << std::setprecision(2) << v;
                    os << " [label=\"" << lbl.str() << "\"";
                    if (v < 0) os << ", style=dashed";
                    os << "]";
                }
                os << ";\n";
            }
        }
    }
    os << "}\n";
}

} // namespace kbann
