#include <lexpath/pure/PurePath.hpp>

#include "log/TaggedLogger.hpp"

namespace LP {

template <typename Style>
auto ComponentCursor<Style>::parent() const noexcept -> PathView<Style> {
    if (begin_ == 0)
        return PathView<Style>{};
    return PathView<Style>{path_.substr(0, begin_ - 1)};
}

template <typename Style>
auto ComponentCursor<Style>::rest() const noexcept -> PathView<Style> {
    return PathView<Style>{path_.substr(begin_)};
}

template <typename Style>
auto ComponentCursor<Style>::splitOnce() const noexcept -> std::pair<PathView<Style>, PathView<Style>> {
    return {this->parent(), this->rest()};
}

template <typename Style>
ComponentIterator<Style>::ComponentIterator(std::string_view path) noexcept {
    if (path.empty())
        return;
    cursor_.path_  = path;
    cursor_.begin_ = 0;
    auto next      = path.find(Style::separator);
    cursor_.end_   = next == std::string_view::npos ? path.size() : next;
    done_          = false;
}

template <typename Style>
auto ComponentIterator<Style>::operator++() noexcept -> ComponentIterator& {
    if (done_)
        return *this;
    if (cursor_.end_ == cursor_.path_.size()) {
        done_ = true;
        return *this;
    }
    cursor_.begin_ = cursor_.end_ + 1;
    auto next      = cursor_.path_.find(Style::separator, cursor_.begin_);
    cursor_.end_   = next == std::string_view::npos ? cursor_.path_.size() : next;
    return *this;
}

template <typename Style>
auto ComponentIterator<Style>::operator++(int) noexcept -> ComponentIterator {
    auto tmp = *this;
    ++*this;
    return tmp;
}

template <typename Style>
AncestorIterator<Style>::AncestorIterator(std::string_view path) noexcept {
    if (path.empty())
        return;
    cursor_.path_ = path;
    cursor_.end_  = path.size();
    this->locateStart();
    done_ = false;
}

template <typename Style>
auto AncestorIterator<Style>::locateStart() noexcept -> void {
    auto const position = cursor_.end_ == 0 ? std::string_view::npos
                                            : cursor_.path_.rfind(Style::separator, cursor_.end_ - 1);
    cursor_.begin_ = position == std::string_view::npos ? 0 : position + 1;
}

template <typename Style>
auto AncestorIterator<Style>::operator++() noexcept -> AncestorIterator& {
    if (done_)
        return *this;
    if (cursor_.begin_ == 0) {
        done_ = true;
        return *this;
    }
    cursor_.end_ = cursor_.begin_ - 1;
    this->locateStart();
    return *this;
}

template <typename Style>
auto AncestorIterator<Style>::operator++(int) noexcept -> AncestorIterator {
    auto tmp = *this;
    ++*this;
    return tmp;
}

template <typename Style>
DisplayPath<Style>::DisplayPath(PathView<Style> path) noexcept
    : path_(path.str()), separator_(Style::separator) {}

template <typename Style>
auto DisplayPath<Style>::withSeparator(char separator) const -> std::expected<DisplayPath, DisplayPath> {
    if (separator != Style::separator && path_.find(separator) != std::string_view::npos) {
        lp_log("Refusing separator substitution, path already contains '" + std::string(1, separator) + "'", "Display");
        return std::unexpected(*this);
    }
    auto display       = *this;
    display.separator_ = separator;
    return display;
}

template <typename Style>
auto DisplayPath<Style>::toString() const -> std::string {
    if (separator_ == Style::separator)
        return std::string{path_};

    std::string out;
    out.reserve(path_.size());
    bool first = true;
    for (auto const& component : PathView<Style>{path_}.components()) {
        if (!first)
            out.push_back(separator_);
        out.append(component.str());
        first = false;
    }
    return out;
}

template <typename Style>
auto PathView<Style>::last() const noexcept -> std::optional<Component<Style>> {
    auto it = this->ancestors().begin();
    if (it == std::default_sentinel)
        return std::nullopt;
    return it->component();
}

template <typename Style>
auto PathView<Style>::parent() const noexcept -> std::optional<PathView> {
    auto it = this->ancestors().begin();
    if (it == std::default_sentinel)
        return std::nullopt;
    return it->parent();
}

template <typename Style>
auto PathBuf<Style>::push(Component<Style> component) -> PathBuf& {
    if (!(path_.empty() || path_.back() == Style::separator))
        path_.push_back(Style::separator);
    path_.append(component.str());
    return *this;
}

template <typename Style>
auto PathBuf<Style>::pop() -> bool {
    auto parent = this->parent();
    if (!parent)
        return false;
    path_.resize(parent->str().size());
    return true;
}

template <typename Style>
auto PathBuf<Style>::isComponentBoundary(std::size_t index) const noexcept -> bool {
    return index == 0 || index == path_.size() || path_[index - 1] == Style::separator;
}

template <typename Style>
auto PathBuf<Style>::replaceRange(std::size_t begin, std::size_t end, PathView<Style> replacement) -> bool {
    if (begin > end || end > path_.size())
        return false;
    if (!this->isComponentBoundary(begin) || !this->isComponentBoundary(end))
        return false;

    std::string text;
    text.reserve(replacement.str().size() + 2);
    if (begin == path_.size() && begin > 0 && path_.back() != Style::separator && !replacement.empty())
        text.push_back(Style::separator);
    text.append(replacement.str());
    if (end < path_.size() && !replacement.empty() && !replacement.isFileNameEmpty())
        text.push_back(Style::separator);

    path_.replace(begin, end - begin, text);
    return true;
}

template class ComponentCursor<PosixStyle>;
template class ComponentCursor<WindowsStyle>;
template class ComponentIterator<PosixStyle>;
template class ComponentIterator<WindowsStyle>;
template class AncestorIterator<PosixStyle>;
template class AncestorIterator<WindowsStyle>;
template class DisplayPath<PosixStyle>;
template class DisplayPath<WindowsStyle>;
template class PathView<PosixStyle>;
template class PathView<WindowsStyle>;
template class PathBuf<PosixStyle>;
template class PathBuf<WindowsStyle>;

} // namespace LP
