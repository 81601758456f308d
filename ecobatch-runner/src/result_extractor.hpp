/**
 * @file result_extractor.hpp
 * @brief Copies engine-internal result arrays into owned buffers
 *
 * Engine result arrays are only valid until the next run, so an extractor copies
 * the whole source array right after a run and serves trimmed, read-only strided
 * views over its own copy. The copy is allocated on the first refresh and
 * reused afterwards.
 */

#ifndef ECOBATCH_RUNNER_RESULT_EXTRACTOR_HPP
#define ECOBATCH_RUNNER_RESULT_EXTRACTOR_HPP

#include "result_config.hpp"
#include <cstddef>
#include <vector>

namespace ecobatch {

/**
 * @brief Read-only strided view, strides in elements
 */
struct ArrayView {
    const double* data;
    std::vector<size_t> shape;
    std::vector<size_t> strides;

    ArrayView() : data(nullptr) {}

    size_t size() const;
    double at(const std::vector<size_t>& index) const;

    /**
     * @brief Dense row-major copy into out, which must hold size() values
     */
    void copy_to(double* out) const;
};

class ResultExtractor {
public:
    ResultExtractor(EngineSession& engine, ResultSource source);

    ResultSource source() const { return source_; }
    bool is_packed() const { return packed_; }
    bool has_buffer() const { return !buffer_.empty(); }

    /**
     * @brief Verify the producing stage (and every stage before it) has run
     *
     * @throws StageNotReadyError Stage-specific subclass with an engine snapshot
     */
    void check_ready() const;

    /**
     * @brief Copy the engine's current array into the owned buffer
     *
     * @throws StageNotReadyError If the stage has not run; the buffer is untouched
     * @throws ConfigurationError If the source shape changed since the first refresh
     * @throws EngineError If the engine returns no data for a stage that ran
     */
    void refresh();

    /**
     * @brief Trimmed view of a single-variable source
     */
    ArrayView get_result() const;

    /**
     * @brief Trimmed view of one variable of a packed source
     *
     * @throws IndexError If key is outside the packed axis
     */
    ArrayView get_result(size_t key) const;

    /**
     * @brief Shape of get_result() given the current buffer shape
     */
    std::vector<size_t> result_shape() const;

private:
    EngineSession& engine_;
    ResultSource source_;
    bool packed_;
    std::vector<DropFlag> drop_flags_;
    std::vector<double> buffer_;
    std::vector<size_t> shape_;

    ArrayView make_view(size_t offset, size_t first_axis) const;
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_RESULT_EXTRACTOR_HPP
