#ifndef KBANN_UTILS_H
#define KBANN_UTILS_H

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace kbann {

/* ---------- strings ------------------------------------------------------- */

// Remove leading and trailing whitespace.
static inline std::string trim(const std::string& s)
{
    auto first = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c){ return std::isspace(c); });
    auto last  = std::find_if_not(s.rbegin(), s.rend(),
                                  [](unsigned char c){ return std::isspace(c); }).base();
    return (first < last) ? std::string(first, last) : std::string{};
}

// Split on a single delimiter; empty fields are kept.
static inline std::vector<std::string> split(const std::string& s, char delim)
{
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string tok;
    while (std::getline(ss, tok, delim))
        out.push_back(tok);
    if (!s.empty() && s.back() == delim)
        out.emplace_back();
    return out;
}

// Strip whitespace, hyphens and periods from a rule token.
static inline std::string cleanse(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
    {
        if (std::isspace(c) || c == '-' || c == '.')
            continue;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

/**
 * @brief Shortest decimal text that reads back as the same double.
 *
 * Integral values keep one decimal digit ("4.0"), so coefficients in
 * extracted rules always read as reals.
 */
static inline std::string formatNumber(double v)
{
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";

    std::string s;
    for (int prec = 1; prec <= 17; ++prec)
    {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << std::setprecision(prec) << v;
        s = oss.str();

        std::istringstream back(s);
        back.imbue(std::locale::classic());
        double parsed = 0.0;
        back >> parsed;
        if (parsed == v)
            break;
    }
    if (s.find_first_of(".eE") == std::string::npos)
        s += ".0";
    return s;
}

// Index of name in names, or -1.
static inline int indexOf(const std::vector<std::string>& names, const std::string& name)
{
    auto it = std::find(names.begin(), names.end(), name);
    return it == names.end() ? -1 : static_cast<int>(it - names.begin());
}

/* ---------- matrices ------------------------------------------------------ */

// "rows x cols 64FC1"; only the depths a network or heat map uses are named
static std::string matShapeStr(const cv::Mat& m)
{
    std::string depth;
    switch (m.depth())
    {
    case CV_8U:  depth = "8U";  break;
    case CV_32F: depth = "32F"; break;
    case CV_64F: depth = "64F"; break;
    default:     depth = "depth" + std::to_string(m.depth()); break;
    }

    std::ostringstream oss;
    oss << m.rows << 'x' << m.cols << ' ' << depth << 'C' << m.channels();
    return oss.str();
}

/**
 * @brief Insert zero rows into a matrix at the given position.
 *
 * @param src    Source matrix (any single channel type).
 * @param at     Row index where the zero block starts (0..rows).
 * @param count  Number of rows to insert.
 * @return       New matrix of (rows + count) x cols.
 */
static cv::Mat insertZeroRows(const cv::Mat& src, int at, int count)
{
    CV_Assert(at >= 0 && at <= src.rows && count >= 0);
    cv::Mat out = cv::Mat::zeros(src.rows + count, src.cols, src.type());
    if (at > 0)
        src.rowRange(0, at).copyTo(out.rowRange(0, at));
    if (at < src.rows)
        src.rowRange(at, src.rows).copyTo(out.rowRange(at + count, src.rows + count));
    return out;
}

// Append zero columns on the right.
static cv::Mat appendZeroCols(const cv::Mat& src, int count)
{
    CV_Assert(count >= 0);
    cv::Mat out = cv::Mat::zeros(src.rows, src.cols + count, src.type());
    if (src.cols > 0)
        src.copyTo(out.colRange(0, src.cols));
    return out;
}

/* ---------- printing ------------------------------------------------------ */

// "[a, b, c]"
static inline std::string listStr(const std::vector<std::string>& names)
{
    std::string out = "[";
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (i) out += ", ";
        out += names[i];
    }
    return out + "]";
}

} // namespace kbann

#endif // KBANN_UTILS_H
