// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "pairwise_aligner.hpp"

#include <vector>
#include <cstddef>
#include <algorithm>
#include <limits>
#include <utility>
#include <sstream>

#include "exceptions/program_error.hpp"

namespace polyscan { namespace coretools {

namespace {

using Score = ScoringScheme::ScoreType;

constexpr Score negative_infinity {-std::numeric_limits<Score>::infinity()};

enum class AlignmentMode { global, local };

// Row-major (nrows x ncols) cells in one block; rows follow the reference, columns the query.
template <typename Cell>
class DPMatrix
{
public:
    DPMatrix(const std::size_t nrows, const std::size_t ncols)
    : cells_(nrows * ncols)
    , nrows_ {nrows}
    , ncols_ {ncols}
    {}
    
    Cell& operator()(const std::size_t i, const std::size_t j) noexcept { return cells_[i * ncols_ + j]; }
    const Cell& operator()(const std::size_t i, const std::size_t j) const noexcept { return cells_[i * ncols_ + j]; }
    
    std::size_t nrows() const noexcept { return nrows_; }
    std::size_t ncols() const noexcept { return ncols_; }
    
private:
    std::vector<Cell> cells_;
    std::size_t nrows_, ncols_;
};

// Equal open and extend scores. The gap scores of a cell follow from its neighbours' best scores so only
// the best score is stored.
struct LinearGapModel
{
    struct Cell
    {
        Score best;
    };
    
    static Cell make_cell(const Score best, Score, Score) noexcept
    {
        return {best};
    }
    
    static Score next_deletion(const DPMatrix<Cell>& matrix, const std::size_t i, const std::size_t j,
                               const ScoringScheme& scheme) noexcept
    {
        return matrix(i - 1, j).best + scheme.gap_open_score;
    }
    
    static Score next_insertion(const DPMatrix<Cell>& matrix, const std::size_t i, const std::size_t j,
                                const ScoringScheme& scheme) noexcept
    {
        return matrix(i, j - 1).best + scheme.gap_open_score;
    }
    
    static Score deletion(const DPMatrix<Cell>& matrix, const std::size_t i, const std::size_t j,
                          const ScoringScheme& scheme) noexcept
    {
        return next_deletion(matrix, i, j, scheme);
    }
    
    static Score insertion(const DPMatrix<Cell>& matrix, const std::size_t i, const std::size_t j,
                           const ScoringScheme& scheme) noexcept
    {
        return next_insertion(matrix, i, j, scheme);
    }
};

struct AffineGapModel
{
    struct Cell
    {
        Score best, deletion, insertion;
    };
    
    static Cell make_cell(const Score best, const Score deletion, const Score insertion) noexcept
    {
        return {best, deletion, insertion};
    }
    
    static Score next_deletion(const DPMatrix<Cell>& matrix, const std::size_t i, const std::size_t j,
                               const ScoringScheme& scheme) noexcept
    {
        const auto& above = matrix(i - 1, j);
        return std::max(above.best + scheme.gap_open_score, above.deletion + scheme.gap_extend_score);
    }
    
    static Score next_insertion(const DPMatrix<Cell>& matrix, const std::size_t i, const std::size_t j,
                                const ScoringScheme& scheme) noexcept
    {
        const auto& left = matrix(i, j - 1);
        return std::max(left.best + scheme.gap_open_score, left.insertion + scheme.gap_extend_score);
    }
    
    static Score deletion(const DPMatrix<Cell>& matrix, const std::size_t i, const std::size_t j,
                          const ScoringScheme&) noexcept
    {
        return matrix(i, j).deletion;
    }
    
    static Score insertion(const DPMatrix<Cell>& matrix, const std::size_t i, const std::size_t j,
                           const ScoringScheme&) noexcept
    {
        return matrix(i, j).insertion;
    }
};

template <typename GapModel>
auto init_dp_matrix(const std::string& reference, const std::string& query,
                    const ScoringScheme& scheme, const AlignmentMode mode)
{
    DPMatrix<typename GapModel::Cell> result {reference.size() + 1, query.size() + 1};
    result(0, 0) = GapModel::make_cell(0, negative_infinity, negative_infinity);
    for (std::size_t i {1}; i < result.nrows(); ++i) {
        if (mode == AlignmentMode::global) {
            const auto score = extend_gap(result(i - 1, 0).best, i, scheme);
            result(i, 0) = GapModel::make_cell(score, score, negative_infinity);
        } else {
            result(i, 0) = GapModel::make_cell(0, negative_infinity, negative_infinity);
        }
    }
    for (std::size_t j {1}; j < result.ncols(); ++j) {
        if (mode == AlignmentMode::global) {
            const auto score = extend_gap(result(0, j - 1).best, j, scheme);
            result(0, j) = GapModel::make_cell(score, negative_infinity, score);
        } else {
            result(0, j) = GapModel::make_cell(0, negative_infinity, negative_infinity);
        }
    }
    return result;
}

Score match(const std::string& reference, const std::string& query, const std::size_t i, const std::size_t j,
            const Score diagonal, const ScoringScheme& scheme) noexcept
{
    return diagonal + substitution_score(scheme, reference[i - 1], query[j - 1]);
}

template <typename GapModel>
void fill(DPMatrix<typename GapModel::Cell>& matrix, const std::string& reference, const std::string& query,
          const ScoringScheme& scheme, const AlignmentMode mode) noexcept
{
    const Score floor {mode == AlignmentMode::local ? 0 : negative_infinity};
    for (std::size_t i {1}; i < matrix.nrows(); ++i) {
        for (std::size_t j {1}; j < matrix.ncols(); ++j) {
            const auto diagonal  = match(reference, query, i, j, matrix(i - 1, j - 1).best, scheme);
            const auto deletion  = GapModel::next_deletion(matrix, i, j, scheme);
            const auto insertion = GapModel::next_insertion(matrix, i, j, scheme);
            matrix(i, j) = GapModel::make_cell(std::max({floor, diagonal, deletion, insertion}), deletion, insertion);
        }
    }
}

template <typename Cell>
std::pair<std::size_t, std::size_t> find_first_max_cell(const DPMatrix<Cell>& matrix) noexcept
{
    std::size_t best_i {0}, best_j {0};
    for (std::size_t i {0}; i < matrix.nrows(); ++i) {
        for (std::size_t j {0}; j < matrix.ncols(); ++j) {
            if (matrix(i, j).best > matrix(best_i, best_j).best) {
                best_i = i;
                best_j = j;
            }
        }
    }
    return {best_i, best_j};
}

class TracebackError : public ProgramError
{
    std::string do_where() const override
    {
        return "traceback";
    }
    
    std::string do_why() const override
    {
        std::ostringstream ss {};
        ss << "no traceback move reproduces the score of alignment matrix cell (" << i_ << ", " << j_ << ')';
        return ss.str();
    }
    
    std::size_t i_, j_;
public:
    TracebackError(std::size_t i, std::size_t j) : i_ {i}, j_ {j} {}
};

template <typename GapModel>
TracebackMove choose_move(const DPMatrix<typename GapModel::Cell>& matrix,
                          const std::string& reference, const std::string& query,
                          const std::size_t i, const std::size_t j, const ScoringScheme& scheme)
{
    const auto target = matrix(i, j).best;
    for (const auto move : TracebackPreference) {
        switch (move) {
            case TracebackMove::diagonal:
                if (match(reference, query, i, j, matrix(i - 1, j - 1).best, scheme) == target) return move;
                break;
            case TracebackMove::up:
                if (GapModel::deletion(matrix, i, j, scheme) == target) return move;
                break;
            case TracebackMove::left:
                if (GapModel::insertion(matrix, i, j, scheme) == target) return move;
                break;
        }
    }
    throw TracebackError {i, j};
}

enum class GapState { none, deletion, insertion };

template <typename GapModel>
AlignedPair traceback(const DPMatrix<typename GapModel::Cell>& matrix,
                      const std::string& reference, const std::string& query,
                      const ScoringScheme& scheme, const AlignmentMode mode,
                      std::size_t i, std::size_t j)
{
    AlignedPair result {};
    result.score = matrix(i, j).best;
    const auto reference_end = i, query_end = j;
    auto& aligned_reference = result.aligned_reference;
    auto& aligned_query = result.aligned_query;
    GapState state {GapState::none};
    while (i > 0 || j > 0) {
        if (state == GapState::none) {
            if (mode == AlignmentMode::local && matrix(i, j).best == 0) break;
            if (i == 0) {
                state = GapState::insertion;
            } else if (j == 0) {
                state = GapState::deletion;
            } else {
                switch (choose_move<GapModel>(matrix, reference, query, i, j, scheme)) {
                    case TracebackMove::diagonal:
                        aligned_reference.push_back(reference[--i]);
                        aligned_query.push_back(query[--j]);
                        continue;
                    case TracebackMove::up:
                        state = GapState::deletion;
                        break;
                    case TracebackMove::left:
                        state = GapState::insertion;
                        break;
                }
            }
        }
        if (state == GapState::deletion) {
            // A gap that could have been opened here is preferred over extending a longer one
            const bool opened {j == 0 || matrix(i - 1, j).best + scheme.gap_open_score == GapModel::deletion(matrix, i, j, scheme)};
            aligned_reference.push_back(reference[i - 1]);
            aligned_query.push_back(AlignedPair::gap_symbol);
            --i;
            if (opened) state = GapState::none;
        } else {
            const bool opened {i == 0 || matrix(i, j - 1).best + scheme.gap_open_score == GapModel::insertion(matrix, i, j, scheme)};
            aligned_reference.push_back(AlignedPair::gap_symbol);
            aligned_query.push_back(query[j - 1]);
            --j;
            if (opened) state = GapState::none;
        }
    }
    std::reverse(std::begin(aligned_reference), std::end(aligned_reference));
    std::reverse(std::begin(aligned_query), std::end(aligned_query));
    result.reference_region = SequenceRegion {i, reference_end};
    result.query_region     = SequenceRegion {j, query_end};
    return result;
}

template <typename GapModel>
AlignedPair align_with(const std::string& reference, const std::string& query,
                       const ScoringScheme& scheme, const AlignmentMode mode)
{
    auto matrix = init_dp_matrix<GapModel>(reference, query, scheme, mode);
    fill<GapModel>(matrix, reference, query, scheme, mode);
    if (mode == AlignmentMode::global) {
        return traceback<GapModel>(matrix, reference, query, scheme, mode, matrix.nrows() - 1, matrix.ncols() - 1);
    }
    const auto start = find_first_max_cell(matrix);
    return traceback<GapModel>(matrix, reference, query, scheme, mode, start.first, start.second);
}

AlignedPair align(const std::string& reference, const std::string& query,
                  const ScoringScheme& scheme, const AlignmentMode mode)
{
    if (is_linear(scheme)) {
        return align_with<LinearGapModel>(reference, query, scheme, mode);
    } else {
        return align_with<AffineGapModel>(reference, query, scheme, mode);
    }
}

} // namespace

AlignedPair global_align(const std::string& reference, const std::string& query, const ScoringScheme& scheme)
{
    if (reference.empty() || query.empty()) {
        AlignedPair result {};
        result.aligned_reference = reference.empty() ? std::string(query.size(), AlignedPair::gap_symbol) : reference;
        result.aligned_query     = query.empty() ? std::string(reference.size(), AlignedPair::gap_symbol) : query;
        result.score             = gap_score(scheme, std::max(reference.size(), query.size()));
        result.reference_region  = full_region(reference.size());
        result.query_region      = full_region(query.size());
        return result;
    }
    return align(reference, query, scheme, AlignmentMode::global);
}

AlignedPair local_align(const std::string& reference, const std::string& query, const ScoringScheme& scheme)
{
    if (reference.empty() || query.empty()) return AlignedPair {};
    return align(reference, query, scheme, AlignmentMode::local);
}

} // namespace coretools
} // namespace polyscan
