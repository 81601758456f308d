#include "result_extractor.hpp"
#include <algorithm>
#include <cstring>
#include <sstream>

namespace ecobatch {

namespace {

std::string shape_to_string(const std::vector<size_t>& shape) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << shape[i];
    }
    oss << ")";
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// ArrayView
// ============================================================================

size_t ArrayView::size() const {
    size_t total = 1;
    for (size_t extent : shape) {
        total *= extent;
    }
    return shape.empty() ? 0 : total;
}

double ArrayView::at(const std::vector<size_t>& index) const {
    size_t offset = 0;
    for (size_t axis = 0; axis < index.size(); ++axis) {
        offset += index[axis] * strides[axis];
    }
    return data[offset];
}

void ArrayView::copy_to(double* out) const {
    const size_t total = size();
    if (total == 0) {
        return;
    }

    const size_t rank = shape.size();
    const size_t inner = shape[rank - 1];
    const bool contiguous_inner = strides[rank - 1] == 1;

    // Odometer over every axis except the innermost
    std::vector<size_t> index(rank, 0);
    size_t written = 0;
    while (written < total) {
        size_t offset = 0;
        for (size_t axis = 0; axis + 1 < rank; ++axis) {
            offset += index[axis] * strides[axis];
        }
        if (contiguous_inner) {
            std::memcpy(out + written, data + offset, inner * sizeof(double));
        } else {
            for (size_t k = 0; k < inner; ++k) {
                out[written + k] = data[offset + k * strides[rank - 1]];
            }
        }
        written += inner;

        for (size_t axis = rank - 1; axis-- > 0;) {
            if (++index[axis] < shape[axis]) {
                break;
            }
            index[axis] = 0;
        }
    }
}

// ============================================================================
// ResultExtractor
// ============================================================================

ResultExtractor::ResultExtractor(EngineSession& engine, ResultSource source)
    : engine_(engine),
      source_(source),
      packed_(source_is_packed(source)),
      drop_flags_(source_drop_flags(source)) {}

void ResultExtractor::check_ready() const {
    EngineStateSnapshot state = engine_.state();
    const Stage required = stage_of(source_);

    for (Stage stage : {Stage::MASS_BALANCE, Stage::DYNAMIC, Stage::TRACER}) {
        if (!state.has_run(stage)) {
            throw_stage_not_ready(stage, state);
        }
        if (stage == required) {
            break;
        }
    }
}

void ResultExtractor::refresh() {
    check_ready();

    ResultArrayView view = engine_.result_array(source_);
    if (view.empty()) {
        throw EngineError("Engine returned no data for " + result_source_to_string(source_),
                          engine_.state());
    }

    const size_t expected_rank = drop_flags_.size() + (packed_ ? 1 : 0);
    if (view.shape.size() != expected_rank) {
        throw ConfigurationError(result_source_to_string(source_) + " has rank " +
                                 std::to_string(view.shape.size()) + ", expected " +
                                 std::to_string(expected_rank));
    }

    if (buffer_.empty()) {
        shape_ = view.shape;
        buffer_.resize(view.size());
    } else if (view.shape != shape_) {
        throw ConfigurationError("Shape of " + result_source_to_string(source_) + " changed from " +
                                 shape_to_string(shape_) + " to " + shape_to_string(view.shape));
    }

    std::memcpy(buffer_.data(), view.data, buffer_.size() * sizeof(double));
}

std::vector<size_t> ResultExtractor::result_shape() const {
    std::vector<size_t> shape;
    const size_t first_axis = packed_ ? 1 : 0;
    for (size_t axis = first_axis; axis < shape_.size(); ++axis) {
        size_t extent = shape_[axis];
        if (drop_flags_[axis - first_axis] != DropFlag::NO_DROP) {
            extent = extent > 0 ? extent - 1 : 0;
        }
        shape.push_back(extent);
    }
    return shape;
}

ArrayView ResultExtractor::make_view(size_t offset, size_t first_axis) const {
    ArrayView view;

    std::vector<size_t> strides(shape_.size(), 1);
    for (size_t axis = shape_.size(); axis-- > 1;) {
        strides[axis - 1] = strides[axis] * shape_[axis];
    }

    for (size_t axis = first_axis; axis < shape_.size(); ++axis) {
        if (drop_flags_[axis - first_axis] == DropFlag::DROP_FIRST) {
            offset += strides[axis];
        }
        view.strides.push_back(strides[axis]);
    }
    view.shape = result_shape();
    view.data = buffer_.data() + offset;
    return view;
}

ArrayView ResultExtractor::get_result() const {
    if (buffer_.empty()) {
        throw EcoBatchError("Result buffer for " + result_source_to_string(source_) +
                            " has not been refreshed");
    }
    if (packed_) {
        throw ConfigurationError(result_source_to_string(source_) + " is packed, a key is required");
    }
    return make_view(0, 0);
}

ArrayView ResultExtractor::get_result(size_t key) const {
    if (buffer_.empty()) {
        throw EcoBatchError("Result buffer for " + result_source_to_string(source_) +
                            " has not been refreshed");
    }
    if (!packed_) {
        throw ConfigurationError(result_source_to_string(source_) + " is not packed");
    }
    if (key >= shape_[0]) {
        throw IndexError("Packed key " + std::to_string(key) + " outside 0.." +
                         std::to_string(shape_[0] - 1));
    }

    size_t stride0 = 1;
    for (size_t axis = 1; axis < shape_.size(); ++axis) {
        stride0 *= shape_[axis];
    }
    return make_view(key * stride0, 1);
}

} // namespace ecobatch
