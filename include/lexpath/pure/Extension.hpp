#pragma once
#include <cstddef>
#include <iterator>
#include <string_view>
#include <utility>

namespace LP {

/**
 * One step of an extension chain. For `a.tar.gz` the first step covers
 * `gz` and the second `tar`; `stem()` is everything before the step.
 */
class Extension {
public:
    constexpr Extension() noexcept = default;
    constexpr explicit Extension(std::string_view fileName) noexcept
        : fileName_(fileName), start_(fileName.size()), end_(fileName.size()) {}

    // The extension text without its leading dot.
    [[nodiscard]] auto extension() const noexcept -> std::string_view;
    // (stem, ".ext.rest") split at the dot that starts this extension.
    [[nodiscard]] auto splitOnce() const noexcept -> std::pair<std::string_view, std::string_view>;
    // Every extension from this one to the end, without the leading dot: `tar.gz`.
    [[nodiscard]] auto fullExtension() const noexcept -> std::string_view;
    [[nodiscard]] auto stem() const noexcept -> std::string_view;

    friend class ExtensionIterator;

private:
    std::string_view fileName_;
    std::size_t      start_ = 0;
    std::size_t      end_   = 0;
};

class ExtensionIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = Extension;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const Extension*;
    using reference         = const Extension&;

    ExtensionIterator() noexcept = default;
    explicit ExtensionIterator(std::string_view fileName) noexcept;

    [[nodiscard]] auto operator*() const noexcept -> reference { return current_; }
    [[nodiscard]] auto operator->() const noexcept -> pointer { return &current_; }
    auto               operator++() noexcept -> ExtensionIterator&;
    auto               operator++(int) noexcept -> ExtensionIterator;

    [[nodiscard]] auto operator==(ExtensionIterator const& other) const noexcept -> bool {
        return done_ == other.done_ && (done_ || current_.start_ == other.current_.start_);
    }
    [[nodiscard]] auto operator==(std::default_sentinel_t) const noexcept -> bool { return done_; }

private:
    auto advance() noexcept -> void;

    Extension current_;
    bool      done_ = true;
};

// Lazy, restartable sequence of extensions, innermost first.
class Extensions {
public:
    constexpr explicit Extensions(std::string_view fileName) noexcept : fileName_(fileName) {}

    [[nodiscard]] auto begin() const noexcept -> ExtensionIterator { return ExtensionIterator{fileName_}; }
    [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t { return {}; }

private:
    std::string_view fileName_;
};

} // namespace LP
