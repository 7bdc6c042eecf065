#pragma once

#include <tmappa/render-context.h>
#include <tmappa/result.hpp>
#include <cstdint>
#include <memory>
#include <optional>

namespace tmappa {

/**
 * Canvas - RenderContext backed by a seeded Mersenne Twister.
 *
 * Holds the colour mutation magnitude for a whole tree and accumulates the
 * bounds of every node registered against it into the canvas extent.
 * Not thread-safe; build a tree from one thread.
 */
class Canvas : public RenderContext {
public:
    using Ptr = std::shared_ptr<Canvas>;

    struct Options {
        float mutation = 0.5f;
        std::optional<uint32_t> seed;  // nullopt = seed from std::random_device
    };

    static Result<Ptr> create(const Options& options) noexcept;
    static Result<Ptr> create() noexcept;

    ~Canvas() override = default;

    Canvas(const Canvas&) = delete;
    Canvas& operator=(const Canvas&) = delete;

    // Seed actually in use (the generated one when none was given)
    virtual uint32_t seed() const = 0;

    // Union of all non-empty registered bounds; nullopt until there is one
    virtual std::optional<IntRect> extent() const = 0;

    virtual uint32_t registeredCount() const = 0;

    // Forget the extent and restart the random sequence from the seed
    virtual void reset() = 0;

protected:
    Canvas() = default;
};

} // namespace tmappa
