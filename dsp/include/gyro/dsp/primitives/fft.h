// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// SIMD-accelerated real FFT via pffft (Pretty Fast FFT).
// Forward transform only: real time-domain samples to the complex half
// spectrum (DC to Nyquist). Uses SSE on x86/x64, NEON on ARM, with scalar
// fallback.
//
// Runs in double precision through the pffftd_* API so that the FFT path
// matches the direct DFT: full double range and leakage at the DFT's
// numerical floor rather than float's.
//
// Backend: pffft (marton78 fork, BSD license), pffft_double.h
// ==============================================================================

#pragma once

#include <algorithm>
#include <bit>
#include <complex>
#include <cstddef>
#include <memory>

#include <pffft_double.h>

namespace Gyro {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Minimum supported FFT size
inline constexpr size_t kMinFFTSize = 256;

/// Maximum supported FFT size
inline constexpr size_t kMaxFFTSize = 8192;

/// @brief True if a buffer of this length can be transformed by FFT
[[nodiscard]] constexpr bool isSupportedFFTSize(size_t size) noexcept {
    return std::has_single_bit(size) && size >= kMinFFTSize && size <= kMaxFFTSize;
}

// =============================================================================
// RAII Helpers for pffft Resources
// =============================================================================

namespace detail {

struct PffftdSetupDeleter {
    void operator()(PFFFTD_Setup* s) const noexcept {
        if (s) pffftd_destroy_setup(s);
    }
};

struct PffftdAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffftd_aligned_free(p);
    }
};

using AlignedBuffer = std::unique_ptr<double, PffftdAlignedDeleter>;

/// Allocate a SIMD-aligned double buffer via pffft
inline AlignedBuffer makeAlignedBuffer(size_t numDoubles) {
    return AlignedBuffer(static_cast<double*>(pffftd_aligned_malloc(numDoubles * sizeof(double))));
}

} // namespace detail

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Real-input forward FFT (SIMD-accelerated via pffft)
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    // Non-copyable, movable (unique_ptr members enable default move)
    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Prepare FFT for given size (allocates pffft setup and aligned buffers)
    /// @param fftSize Power of 2 in range [kMinFFTSize, kMaxFFTSize]
    /// @post isPrepared() is false if the size is unsupported or allocation failed
    void prepare(size_t fftSize) noexcept {
        size_ = 0;
        if (!isSupportedFFTSize(fftSize)) {
            return;
        }

        setup_.reset(pffftd_new_setup(static_cast<int>(fftSize), PFFFT_REAL));
        if (!setup_) {
            return;
        }

        // SIMD-aligned buffers (16-byte on SSE, as required by pffft)
        input_ = detail::makeAlignedBuffer(fftSize);
        output_ = detail::makeAlignedBuffer(fftSize);
        work_ = detail::makeAlignedBuffer(fftSize);
        if (!input_ || !output_ || !work_) {
            setup_.reset();
            return;
        }
        size_ = fftSize;
    }

    // -------------------------------------------------------------------------
    // Processing
    // -------------------------------------------------------------------------

    /// @brief Forward FFT: real time-domain -> complex frequency-domain
    /// @param input N real samples
    /// @param output N/2+1 complex bins (DC to Nyquist), unscaled
    /// @pre prepare() has been called
    void forward(const double* input, std::complex<double>* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;
        std::copy(input, input + N, input_.get());

        pffftd_transform_ordered(setup_.get(), input_.get(), output_.get(),
                                 work_.get(), PFFFT_FORWARD);

        // pffft ordered output: [DC_real, Nyquist_real, Re(1), Im(1), Re(2), Im(2), ...]
        const double* bins = output_.get();
        output[0] = {bins[0], 0.0};
        output[N / 2] = {bins[1], 0.0};
        for (size_t k = 1; k < N / 2; ++k) {
            output[k] = {bins[2 * k], bins[2 * k + 1]};
        }
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    /// @brief Get configured FFT size
    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @brief Get number of output bins (N/2+1)
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }

    /// @brief Check if prepare() succeeded
    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

private:
    size_t size_ = 0;
    std::unique_ptr<PFFFTD_Setup, detail::PffftdSetupDeleter> setup_;
    detail::AlignedBuffer input_;   // Aligned copy of the caller's samples
    detail::AlignedBuffer output_;  // Ordered half spectrum
    detail::AlignedBuffer work_;    // pffft scratch
};

} // namespace DSP
} // namespace Gyro
