#include <tmappa/canvas.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <random>
#include <string>
#include <utility>

namespace tmappa {

class CanvasImpl : public Canvas {
public:
    explicit CanvasImpl(const Options& options) noexcept
        : _mutation(options.mutation), _seedOption(options.seed) {}

    Result<void> init() noexcept {
        if (!std::isfinite(_mutation)) {
            return Err("mutation magnitude must be a finite number");
        }
        if (_mutation < 0.0f || _mutation > 1.0f) {
            spdlog::warn("Canvas: mutation magnitude {} outside [0,1], colours will saturate", _mutation);
        }
        if (_seedOption) {
            _seed = *_seedOption;
        } else {
            try {
                _seed = std::random_device{}();
            } catch (const std::exception& e) {
                return Err(std::string("no entropy source for random seed: ") + e.what());
            }
        }
        _rng.seed(_seed);
        spdlog::debug("Canvas: mutation={} seed={}", _mutation, _seed);
        return Ok();
    }

    float mutationMagnitude() const override { return _mutation; }

    float random() override {
        // Top 24 bits scaled by 2^-24: always < 1.0f
        return static_cast<float>(_rng() >> 8) * (1.0f / 16777216.0f);
    }

    void registerBounds(const IntRect& bounds) override {
        _registered++;
        if (bounds.isEmpty()) return;
        _extent = _extent ? _extent->united(bounds) : bounds;
    }

    uint32_t seed() const override { return _seed; }
    std::optional<IntRect> extent() const override { return _extent; }
    uint32_t registeredCount() const override { return _registered; }

    void reset() override {
        _extent.reset();
        _registered = 0;
        _rng.seed(_seed);
    }

private:
    float _mutation;
    std::optional<uint32_t> _seedOption;
    uint32_t _seed = 0;
    std::mt19937 _rng;
    std::optional<IntRect> _extent;
    uint32_t _registered = 0;
};

Result<Canvas::Ptr> Canvas::create(const Options& options) noexcept {
    auto impl = std::make_shared<CanvasImpl>(options);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize Canvas", res);
    }
    return Ok(Ptr(std::move(impl)));
}

Result<Canvas::Ptr> Canvas::create() noexcept {
    return create(Options{});
}

} // namespace tmappa
