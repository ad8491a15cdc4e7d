#include "dataset.hpp"

#include <fstream>
#include <stdexcept>
#include "../errors.hpp"
#include "../utils.hpp"

namespace kbann {

namespace {

// Strict numeric cell: the whole cell must be consumed.
bool parseDouble(const std::string& cell, double& out)
{
    if (cell.empty()) return false;
    try {
        std::size_t used = 0;
        out = std::stod(cell, &used);
        return used == cell.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

int Dataset::column(const std::string& name) const
{
    return indexOf(featureNames, name);
}

cv::Mat Dataset::targets() const
{
    cv::Mat1d y(static_cast<int>(labels.size()), 1);
    for (std::size_t i = 0; i < labels.size(); ++i)
    {
        double v = 0.0;
        if (!parseDouble(labels[i], v))
            throw DatasetFormatError(i < lineNumbers.size() ? lineNumbers[i]
                                                            : static_cast<int>(i) + 2,
                                     "label '" + labels[i] + "' is not numeric");
        y(static_cast<int>(i), 0) = v;
    }
    return y;
}

Dataset Dataset::parse(std::istream& in)
{
    Dataset ds;
    std::vector<std::string> header;
    std::vector<double>      values;
    int valueCols = -1;
    int lineNo    = 0;

    std::string line;
    while (std::getline(in, line))
    {
        ++lineNo;
        if (trim(line).empty())
            continue;

        std::vector<std::string> row;
        for (const auto& cell : split(line, ','))
            row.push_back(trim(cell));

        if (header.empty())
        {
            header = row;
            continue;
        }

        if (row.size() < 2)
            throw DatasetFormatError(lineNo, "expected feature values and a label");

        const int cols = static_cast<int>(row.size()) - 1;
        if (valueCols < 0)
        {
            valueCols = cols;
            if (header.size() == row.size())
            {
                ds.labelName = header.back();
                header.pop_back();
            }
            else if (static_cast<int>(header.size()) != cols)
            {
                throw DatasetFormatError(lineNo, std::to_string(header.size()) +
                                         " names for " + std::to_string(cols) + " value columns");
            }
        }
        else if (cols != valueCols)
        {
            throw DatasetFormatError(lineNo, "expected " + std::to_string(valueCols + 1) +
                                     " cells, got " + std::to_string(row.size()));
        }

        for (int c = 0; c < cols; ++c)
        {
            double v = 0.0;
            if (!parseDouble(row[c], v))
                throw DatasetFormatError(lineNo, "value '" + row[c] + "' of column '" +
                                         header[c] + "' is not numeric");
            values.push_back(v);
        }
        ds.labels.push_back(row.back());
        ds.lineNumbers.push_back(lineNo);
    }

    ds.featureNames = header;
    const int rows = static_cast<int>(ds.labels.size());
    const int cols = rows > 0 ? valueCols : static_cast<int>(header.size());
    ds.features = cv::Mat1d(rows, cols, 0.0);
    if (rows > 0)
        cv::Mat1d(rows, cols, values.data()).copyTo(ds.features);
    return ds;
}

Dataset Dataset::load(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
        throw std::runtime_error("Could not open dataset: " + path);
    return parse(file);
}

} // namespace kbann
