#include <lexpath/pure/Extension.hpp>

namespace LP {

auto Extension::extension() const noexcept -> std::string_view {
    if (start_ >= end_)
        return {};
    return fileName_.substr(start_ + 1, end_ - start_ - 1);
}

auto Extension::splitOnce() const noexcept -> std::pair<std::string_view, std::string_view> {
    return {fileName_.substr(0, start_), fileName_.substr(start_)};
}

auto Extension::fullExtension() const noexcept -> std::string_view {
    auto rest = this->splitOnce().second;
    if (!rest.empty())
        rest.remove_prefix(1);
    return rest;
}

auto Extension::stem() const noexcept -> std::string_view {
    return this->splitOnce().first;
}

ExtensionIterator::ExtensionIterator(std::string_view fileName) noexcept
    : current_(fileName), done_(false) {
    this->advance();
}

auto ExtensionIterator::operator++() noexcept -> ExtensionIterator& {
    if (!done_)
        this->advance();
    return *this;
}

auto ExtensionIterator::operator++(int) noexcept -> ExtensionIterator {
    auto tmp = *this;
    ++*this;
    return tmp;
}

auto ExtensionIterator::advance() noexcept -> void {
    auto const stem     = current_.stem();
    auto const position = stem.rfind('.');
    // A leading dot marks a hidden file, not an extension.
    if (position == std::string_view::npos || position == 0) {
        done_ = true;
        return;
    }
    current_.end_   = current_.start_;
    current_.start_ = position;
}

} // namespace LP
