/// @file src/model/labels.cpp
/// @brief One-hot encoding and argmax decoding.

#include "rfmc/labels.hpp"
#include "rfmc/errors.hpp"

#include <fmt/format.h>

namespace rfmc::model {

LabelMatrix onehot(const LabelVector& labels, std::size_t num_classes) {
    if (num_classes == 0) {
        throw InvalidArgument("one-hot encoding needs at least one class");
    }

    LabelMatrix out = LabelMatrix::Zero(static_cast<Eigen::Index>(labels.size()),
                                        static_cast<Eigen::Index>(num_classes));
    for (std::size_t n = 0; n < labels.size(); ++n) {
        const int y = labels[n];
        if (y < 0 || static_cast<std::size_t>(y) >= num_classes) {
            throw DimensionMismatch(fmt::format(
                "label {} at index {} outside [0, {})", y, n, num_classes));
        }
        out(static_cast<Eigen::Index>(n), y) = 1.0;
    }
    return out;
}

LabelVector argmax(const ProbabilityMatrix& probabilities) {
    if (probabilities.cols() == 0 && probabilities.rows() > 0) {
        throw DimensionMismatch("probability matrix has no class columns");
    }

    LabelVector out;
    out.reserve(static_cast<std::size_t>(probabilities.rows()));
    for (Eigen::Index m = 0; m < probabilities.rows(); ++m) {
        Eigen::Index best = 0;
        // maxCoeff returns the first maximal index on ties.
        probabilities.row(m).maxCoeff(&best);
        out.push_back(static_cast<int>(best));
    }
    return out;
}

}  // namespace rfmc::model
