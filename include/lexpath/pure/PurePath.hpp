#pragma once
#include <lexpath/pure/Extension.hpp>

#include <cstddef>
#include <expected>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace LP {

// Separator styles. PathView, PathBuf and friends are only instantiated for
// these two; other styles fail to link.
struct PosixStyle {
    static constexpr char separator = '/';
};

struct WindowsStyle {
    static constexpr char separator = '\\';
};

#ifdef _WIN32
using DefaultStyle = WindowsStyle;
#else
using DefaultStyle = PosixStyle;
#endif

template <typename Style>
class PathView;
template <typename Style>
class PathBuf;
template <typename Style>
class ComponentIterator;
template <typename Style>
class AncestorIterator;

/**
 * A single component of a path: never contains the separator. Only the
 * final component of a path may be empty.
 */
template <typename Style>
class Component {
public:
    // Empty result if `name` contains the separator.
    [[nodiscard]] static auto make(std::string_view name) noexcept -> std::optional<Component> {
        if (name.find(Style::separator) != std::string_view::npos)
            return std::nullopt;
        return Component{name};
    }

    // Callers must ensure `name` does not contain the separator.
    [[nodiscard]] static constexpr auto fromUnchecked(std::string_view name) noexcept -> Component {
        return Component{name};
    }

    [[nodiscard]] constexpr auto str() const noexcept -> std::string_view { return name_; }
    [[nodiscard]] constexpr auto empty() const noexcept -> bool { return name_.empty(); }

    // The file name without the final extension.
    [[nodiscard]] auto fileName() const noexcept -> std::string_view {
        auto it = this->extensions().begin();
        if (it == std::default_sentinel)
            return name_;
        return it->stem();
    }

    [[nodiscard]] auto extension() const noexcept -> std::optional<std::string_view> {
        auto it = this->extensions().begin();
        if (it == std::default_sentinel)
            return std::nullopt;
        return it->extension();
    }

    [[nodiscard]] auto extensions() const noexcept -> Extensions { return Extensions{name_}; }

    template <typename OtherStyle>
    [[nodiscard]] auto operator==(Component<OtherStyle> const& other) const noexcept -> bool {
        return name_ == other.str();
    }

private:
    constexpr explicit Component(std::string_view name) noexcept : name_(name) {}

    std::string_view name_;
};

/**
 * A component found while walking a path. Besides the component itself it
 * remembers where it sits so the path can be split around it.
 */
template <typename Style>
class ComponentCursor {
public:
    ComponentCursor() noexcept = default;

    [[nodiscard]] auto component() const noexcept -> Component<Style> {
        return Component<Style>::fromUnchecked(path_.substr(begin_, end_ - begin_));
    }
    [[nodiscard]] auto str() const noexcept -> std::string_view { return this->component().str(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return begin_ == end_; }

    // Byte offset of the component inside the walked path.
    [[nodiscard]] auto index() const noexcept -> std::size_t { return begin_; }

    // Everything before this component, without the joining separator.
    [[nodiscard]] auto parent() const noexcept -> PathView<Style>;
    // This component and everything after it.
    [[nodiscard]] auto rest() const noexcept -> PathView<Style>;
    [[nodiscard]] auto splitOnce() const noexcept -> std::pair<PathView<Style>, PathView<Style>>;

    [[nodiscard]] auto operator==(ComponentCursor const& other) const noexcept -> bool {
        return path_.data() == other.path_.data() && begin_ == other.begin_ && end_ == other.end_;
    }

    friend class ComponentIterator<Style>;
    friend class AncestorIterator<Style>;

private:
    std::string_view path_;
    std::size_t      begin_ = 0;
    std::size_t      end_   = 0;
};

// Front to back. A path ending in the separator yields a final empty component.
template <typename Style>
class ComponentIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = ComponentCursor<Style>;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const value_type*;
    using reference         = const value_type&;

    ComponentIterator() noexcept = default;
    explicit ComponentIterator(std::string_view path) noexcept;

    [[nodiscard]] auto operator*() const noexcept -> reference { return cursor_; }
    [[nodiscard]] auto operator->() const noexcept -> pointer { return &cursor_; }
    auto               operator++() noexcept -> ComponentIterator&;
    auto               operator++(int) noexcept -> ComponentIterator;

    [[nodiscard]] auto operator==(ComponentIterator const& other) const noexcept -> bool {
        return done_ == other.done_ && (done_ || cursor_ == other.cursor_);
    }
    [[nodiscard]] auto operator==(std::default_sentinel_t) const noexcept -> bool { return done_; }

private:
    ComponentCursor<Style> cursor_;
    bool                   done_ = true;
};

// Back to front; each step can split the path into (parent, rest).
template <typename Style>
class AncestorIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = ComponentCursor<Style>;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const value_type*;
    using reference         = const value_type&;

    AncestorIterator() noexcept = default;
    explicit AncestorIterator(std::string_view path) noexcept;

    [[nodiscard]] auto operator*() const noexcept -> reference { return cursor_; }
    [[nodiscard]] auto operator->() const noexcept -> pointer { return &cursor_; }
    auto               operator++() noexcept -> AncestorIterator&;
    auto               operator++(int) noexcept -> AncestorIterator;

    [[nodiscard]] auto operator==(AncestorIterator const& other) const noexcept -> bool {
        return done_ == other.done_ && (done_ || cursor_ == other.cursor_);
    }
    [[nodiscard]] auto operator==(std::default_sentinel_t) const noexcept -> bool { return done_; }

private:
    auto locateStart() noexcept -> void;

    ComponentCursor<Style> cursor_;
    bool                   done_ = true;
};

template <typename Iterator>
class PathRange {
public:
    explicit PathRange(std::string_view path) noexcept : path_(path) {}

    [[nodiscard]] auto begin() const noexcept -> Iterator { return Iterator{path_}; }
    [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t { return {}; }

private:
    std::string_view path_;
};

template <typename Style>
using Components = PathRange<ComponentIterator<Style>>;
template <typename Style>
using Ancestors = PathRange<AncestorIterator<Style>>;

/**
 * Prints a path, optionally with a different separator. A substitute that
 * already occurs inside the path text is refused since the output would be
 * ambiguous.
 */
template <typename Style>
class DisplayPath {
public:
    explicit DisplayPath(PathView<Style> path) noexcept;

    // Refusal hands back the unchanged display.
    [[nodiscard]] auto withSeparator(char separator) const -> std::expected<DisplayPath, DisplayPath>;
    [[nodiscard]] auto separator() const noexcept -> char { return separator_; }
    [[nodiscard]] auto toString() const -> std::string;

    friend auto operator<<(std::ostream& os, DisplayPath const& display) -> std::ostream& {
        return os << display.toString();
    }

private:
    std::string_view path_;
    char             separator_;
};

/**
 * Borrowed, separator-parameterized view of a path with no prefix. Does no
 * normalization of its own: `.` and `..` are ordinary components here.
 */
template <typename Style>
class PathView {
public:
    constexpr PathView() noexcept = default;
    constexpr explicit PathView(std::string_view path) noexcept : path_(path) {}

    [[nodiscard]] constexpr auto str() const noexcept -> std::string_view { return path_; }
    [[nodiscard]] constexpr auto empty() const noexcept -> bool { return path_.empty(); }
    [[nodiscard]] constexpr auto isFileNameEmpty() const noexcept -> bool {
        return path_.empty() || path_.back() == Style::separator;
    }

    // The final component, which is empty if the path ends with the separator.
    [[nodiscard]] auto last() const noexcept -> std::optional<Component<Style>>;
    [[nodiscard]] auto parent() const noexcept -> std::optional<PathView>;

    [[nodiscard]] auto components() const noexcept -> Components<Style> { return Components<Style>{path_}; }
    [[nodiscard]] auto ancestors() const noexcept -> Ancestors<Style> { return Ancestors<Style>{path_}; }
    [[nodiscard]] auto display() const noexcept -> DisplayPath<Style> { return DisplayPath<Style>{*this}; }

    // Compares components, so paths with different separators can be equal.
    template <typename OtherStyle>
    [[nodiscard]] auto operator==(PathView<OtherStyle> const& other) const noexcept -> bool {
        auto lhs = this->ancestors().begin();
        auto rhs = other.ancestors().begin();
        for (; lhs != std::default_sentinel && rhs != std::default_sentinel; ++lhs, ++rhs) {
            if (lhs->str() != rhs->str())
                return false;
        }
        return lhs == std::default_sentinel && rhs == std::default_sentinel;
    }

private:
    std::string_view path_;
};

// Owned, growable path. Pushing never normalizes; that is left to callers.
template <typename Style>
class PathBuf {
public:
    PathBuf() = default;

    // `path` is taken as-is, separators and all.
    [[nodiscard]] static auto fromStringUnchecked(std::string path) -> PathBuf {
        PathBuf buf;
        buf.path_ = std::move(path);
        return buf;
    }

    auto push(Component<Style> component) -> PathBuf&;
    // Drops a trailing separator if there is one, otherwise the last component.
    auto pop() -> bool;
    auto clear() noexcept -> void { path_.clear(); }

    /**
     * Replace the components between two component indices (as returned by
     * ComponentCursor::index(), or the path length for `end`). Returns false
     * and leaves the path untouched when either index is out of range or not
     * at a component boundary.
     */
    auto replaceRange(std::size_t begin, std::size_t end, PathView<Style> replacement) -> bool;

    [[nodiscard]] auto view() const noexcept -> PathView<Style> { return PathView<Style>{path_}; }
    [[nodiscard]] auto str() const noexcept -> std::string const& { return path_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return path_.empty(); }
    [[nodiscard]] auto isFileNameEmpty() const noexcept -> bool { return this->view().isFileNameEmpty(); }
    [[nodiscard]] auto last() const noexcept -> std::optional<Component<Style>> { return this->view().last(); }
    [[nodiscard]] auto parent() const noexcept -> std::optional<PathView<Style>> { return this->view().parent(); }
    [[nodiscard]] auto components() const noexcept -> Components<Style> { return this->view().components(); }
    [[nodiscard]] auto ancestors() const noexcept -> Ancestors<Style> { return this->view().ancestors(); }
    [[nodiscard]] auto display() const noexcept -> DisplayPath<Style> { return this->view().display(); }

    operator PathView<Style>() const noexcept { return this->view(); }

private:
    [[nodiscard]] auto isComponentBoundary(std::size_t index) const noexcept -> bool;

    std::string path_;
};

using PosixPathView    = PathView<PosixStyle>;
using PosixPathBuf     = PathBuf<PosixStyle>;
using PosixComponent   = Component<PosixStyle>;
using WindowsPathView  = PathView<WindowsStyle>;
using WindowsPathBuf   = PathBuf<WindowsStyle>;
using WindowsComponent = Component<WindowsStyle>;

} // namespace LP
