#include "buffer_manager.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <new>
#include <sstream>
#include <sys/mman.h>

namespace ecobatch {

// ============================================================================
// BufferManager Implementation
// ============================================================================

BufferManager::BufferManager(BufferMode mode) : mode_(mode), total_allocated_(0) {}

BufferManager::~BufferManager() {
    free_all();
}

BufferInfo BufferManager::allocate_buffer(const std::string& name, const std::vector<size_t>& shape) {
    // Check if buffer already exists
    if (has_buffer(name)) {
        std::ostringstream oss;
        oss << "Buffer '" << name << "' already exists";
        throw BufferError(oss.str());
    }

    if (shape.empty()) {
        throw BufferError("Cannot allocate buffer '" + name + "' without dimensions");
    }

    size_t num_values = 1;
    for (size_t extent : shape) {
        num_values *= extent;
    }
    if (num_values == 0) {
        throw BufferError("Cannot allocate buffer '" + name + "' with 0 values");
    }

    if (num_values > get_max_values()) {
        std::ostringstream oss;
        oss << "Buffer '" << name << "' exceeds maximum values: "
            << num_values << " > " << get_max_values()
            << " (consider fewer scenarios per batch)";
        throw BufferOverflowError(oss.str());
    }

    size_t total_size = num_values * sizeof(double);

    void* data = nullptr;
    try {
        data = mode_ == BufferMode::SHARED ? map_shared(total_size) : allocate_aligned(total_size);
    } catch (const std::bad_alloc&) {
        std::ostringstream oss;
        oss << "Failed to allocate " << total_size << " bytes for buffer '" << name << "'";
        throw BufferError(oss.str());
    }

    double* values = static_cast<double*>(data);
    std::fill(values, values + num_values, std::numeric_limits<double>::quiet_NaN());

    BufferInfo info;
    info.name = name;
    info.shape = shape;
    info.num_values = num_values;
    info.total_size = total_size;
    info.data = values;
    info.mode = mode_;

    buffers_[name] = info;
    total_allocated_ += total_size;

    return info;
}

BufferInfo BufferManager::get_buffer(const std::string& name) const {
    auto it = buffers_.find(name);
    if (it == buffers_.end()) {
        std::ostringstream oss;
        oss << "Buffer '" << name << "' not found";
        throw BufferNotFoundError(oss.str());
    }
    return it->second;
}

bool BufferManager::has_buffer(const std::string& name) const {
    return buffers_.find(name) != buffers_.end();
}

double* BufferManager::scenario_slice(const std::string& name, size_t scenario_index) const {
    auto it = buffers_.find(name);
    if (it == buffers_.end()) {
        throw BufferNotFoundError("Buffer '" + name + "' not found");
    }
    const BufferInfo& info = it->second;
    if (scenario_index >= info.n_scenarios()) {
        std::ostringstream oss;
        oss << "Scenario index " << scenario_index << " outside buffer '" << name
            << "' with " << info.n_scenarios() << " scenarios";
        throw BufferOverflowError(oss.str());
    }
    return info.data + scenario_index * info.scenario_stride();
}

void BufferManager::fill_scenario_nan(const std::string& name, size_t scenario_index) {
    double* slice = scenario_slice(name, scenario_index);
    size_t stride = buffers_.at(name).scenario_stride();
    std::fill(slice, slice + stride, std::numeric_limits<double>::quiet_NaN());
}

void BufferManager::free_all() {
    for (auto& pair : buffers_) {
        BufferInfo& info = pair.second;
        if (info.data != nullptr) {
            if (info.mode == BufferMode::SHARED) {
                unmap_shared(info.data, info.total_size);
            } else {
                free_aligned(info.data);
            }
            info.data = nullptr;
        }
    }
    buffers_.clear();
    total_allocated_ = 0;
}

size_t BufferManager::get_total_allocated() const {
    return total_allocated_;
}

size_t BufferManager::get_max_values() {
    // 500M values × 8 bytes = 4 GB
    return 500'000'000;
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* BufferManager::allocate_aligned(size_t size) {
    // Ensure size is a multiple of 16 bytes
    size_t aligned_size = (size + 15) & ~static_cast<size_t>(15);

    void* ptr = nullptr;
    int result = posix_memalign(&ptr, 16, aligned_size);
    if (result != 0 || ptr == nullptr) {
        throw std::bad_alloc();
    }

    return ptr;
}

void BufferManager::free_aligned(void* ptr) {
    if (ptr == nullptr) {
        return;
    }
    free(ptr);
}

void* BufferManager::map_shared(size_t size) {
    void* ptr = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED | MAP_ANONYMOUS, -1, 0);
    if (ptr == MAP_FAILED) {
        throw std::bad_alloc();
    }
    return ptr;
}

void BufferManager::unmap_shared(void* ptr, size_t size) {
    if (ptr == nullptr) {
        return;
    }
    if (munmap(ptr, size) != 0) {
        std::cerr << "Warning: Failed to unmap shared buffer of " << size << " bytes" << std::endl;
    }
}

} // namespace ecobatch
