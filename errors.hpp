#ifndef KBANN_ERRORS_H
#define KBANN_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>

namespace kbann {

/**
 * @brief Base class of every error raised by the translation engine.
 *
 * None of these are recoverable for the current run: the caller reports the
 * message and aborts.
 */
class KbannError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** A rule file line that cannot be split into head and body. */
class MalformedRuleLine : public KbannError
{
public:
    MalformedRuleLine(int lineNo, const std::string& line, const std::string& reason)
        : KbannError("rule line " + std::to_string(lineNo) + ": " + reason +
                     " ('" + line + "')")
        , lineNo_{lineNo}
        , line_{line}
    {}

    int                lineNo() const noexcept { return lineNo_; }
    const std::string& line()   const noexcept { return line_; }

private:
    int         lineNo_;
    std::string line_;
};

/** A unit name that is not a column of the dataset. */
class UnknownFeatureReference : public KbannError
{
public:
    explicit UnknownFeatureReference(const std::string& name, int layer = -1)
        : KbannError("unknown feature '" + name + "'" +
                     (layer >= 0 ? " referenced by layer " + std::to_string(layer) : std::string{}))
        , name_{name}
        , layer_{layer}
    {}

    const std::string& name()  const noexcept { return name_; }
    int                layer() const noexcept { return layer_; }

private:
    std::string name_;
    int         layer_;
};

/** The layering engine found no output frontier while rules remained. */
class CyclicRuleDependency : public KbannError
{
public:
    explicit CyclicRuleDependency(std::vector<std::string> heads)
        : KbannError("cyclic rule dependency among: " + join(heads))
        , heads_{std::move(heads)}
    {}

    const std::vector<std::string>& heads() const noexcept { return heads_; }

private:
    static std::string join(const std::vector<std::string>& names)
    {
        std::string out;
        for (const auto& n : names)
        {
            if (!out.empty()) out += ", ";
            out += n;
        }
        return out;
    }

    std::vector<std::string> heads_;
};

/** Nothing to cluster, or no mixture could be fitted. */
class DegenerateClusterInput : public KbannError
{
public:
    using KbannError::KbannError;
};

/** Weights, biases and unit names of a layer disagree. */
class ShapeMismatch : public KbannError
{
public:
    ShapeMismatch(int layer, const std::string& what)
        : KbannError("shape mismatch in layer " + std::to_string(layer) + ": " + what)
        , layer_{layer}
    {}

    int layer() const noexcept { return layer_; }

private:
    int layer_;
};

/** A dataset line that does not parse. */
class DatasetFormatError : public KbannError
{
public:
    DatasetFormatError(int lineNo, const std::string& reason)
        : KbannError("dataset line " + std::to_string(lineNo) + ": " + reason)
        , lineNo_{lineNo}
    {}

    int lineNo() const noexcept { return lineNo_; }

private:
    int lineNo_;
};

} // namespace kbann

#endif // KBANN_ERRORS_H
