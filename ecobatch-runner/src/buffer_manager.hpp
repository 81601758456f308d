#ifndef ECOBATCH_RUNNER_BUFFER_MANAGER_HPP
#define ECOBATCH_RUNNER_BUFFER_MANAGER_HPP

#include "../../ecobatch-engine/src/engine_session.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace ecobatch {

// ============================================================================
// Buffer Metadata
// ============================================================================

enum class BufferMode {
    EXCLUSIVE,   // Process-private heap memory (sequential runs)
    SHARED       // Anonymous shared mapping inherited by forked workers
};

/**
 * Dense result buffer, dims (scenario, [fleet], [group], time), row-major.
 * Scenario i owns the contiguous slice [i * scenario_stride(), (i + 1) * scenario_stride()).
 */
struct BufferInfo {
    std::string name;           // Variable name
    std::vector<size_t> shape;  // Leading axis is the scenario axis
    size_t num_values;          // Product of shape
    size_t total_size;          // Bytes
    double* data;               // 16-byte aligned (heap) or page aligned (shared)
    BufferMode mode;

    BufferInfo()
        : num_values(0), total_size(0), data(nullptr), mode(BufferMode::EXCLUSIVE) {}

    size_t n_scenarios() const { return shape.empty() ? 0 : shape[0]; }
    size_t scenario_stride() const { return n_scenarios() == 0 ? 0 : num_values / n_scenarios(); }
};

// ============================================================================
// Buffer Manager
// ============================================================================

/**
 * BufferManager: Allocates and owns the scenario-indexed result buffers of a run
 *
 * Features:
 * - EXCLUSIVE buffers come from 16-byte aligned heap memory
 * - SHARED buffers come from an anonymous MAP_SHARED mapping, so writes made by
 *   forked workers are visible to the parent without copying
 * - Fresh buffers are NaN-filled so unwritten scenario slices stay visible
 *
 * Shared buffers must be allocated before workers are forked. Workers address
 * them through BufferInfo copies and never free them.
 *
 * Usage:
 *   BufferManager manager(BufferMode::SHARED);
 *   auto biomass = manager.allocate_buffer("Biomass", {n_scenarios, n_groups, n_months});
 *   double* slice = manager.scenario_slice("Biomass", 3);
 */
class BufferManager {
public:
    explicit BufferManager(BufferMode mode = BufferMode::EXCLUSIVE);
    ~BufferManager();

    // Disable copy/move (buffers are not copyable)
    BufferManager(const BufferManager&) = delete;
    BufferManager& operator=(const BufferManager&) = delete;

    BufferMode mode() const { return mode_; }

    /**
     * Allocate a NaN-filled buffer
     *
     * @throws BufferError If the name exists, the shape is empty or allocation fails
     * @throws BufferOverflowError If the buffer exceeds get_max_values()
     */
    BufferInfo allocate_buffer(const std::string& name, const std::vector<size_t>& shape);

    /**
     * @throws BufferNotFoundError If buffer not found
     */
    BufferInfo get_buffer(const std::string& name) const;

    bool has_buffer(const std::string& name) const;

    /**
     * Start of one scenario's slice
     *
     * @throws BufferNotFoundError If buffer not found
     * @throws BufferOverflowError If scenario_index is outside the scenario axis
     */
    double* scenario_slice(const std::string& name, size_t scenario_index) const;

    /**
     * Overwrite one scenario's slice with NaN
     */
    void fill_scenario_nan(const std::string& name, size_t scenario_index);

    void free_all();

    size_t get_total_allocated() const;

    /**
     * Maximum doubles per buffer: 500M values (4 GB)
     */
    static size_t get_max_values();

private:
    BufferMode mode_;
    std::map<std::string, BufferInfo> buffers_;
    size_t total_allocated_;

    static void* allocate_aligned(size_t size);
    static void free_aligned(void* ptr);
    static void* map_shared(size_t size);
    static void unmap_shared(void* ptr, size_t size);
};

// ============================================================================
// Buffer Errors
// ============================================================================

class BufferError : public EcoBatchError {
public:
    explicit BufferError(const std::string& message) : EcoBatchError(message) {}
};

class BufferOverflowError : public BufferError {
public:
    explicit BufferOverflowError(const std::string& message) : BufferError(message) {}
};

class BufferNotFoundError : public BufferError {
public:
    explicit BufferNotFoundError(const std::string& message) : BufferError(message) {}
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_BUFFER_MANAGER_HPP
