#include "DotPath.hpp"

#include <charconv>

namespace DJ {

DotPathIterator::DotPathIterator(std::string_view path) noexcept
    : path{path}, at_end{path.empty()} {
    if (!this->at_end)
        findSegmentEnd();
}

DotPathIterator::DotPathIterator(char const* const path) noexcept
    : DotPathIterator{std::string_view{path}} {}

auto DotPathIterator::findSegmentEnd() noexcept -> void {
    auto const pos    = this->path.find(Separator, this->current);
    this->segment_end = pos == std::string_view::npos ? this->path.size() : pos;
    this->current_segment = this->path.substr(this->current, this->segment_end - this->current);
}

auto DotPathIterator::operator*() const noexcept -> value_type {
    return this->current_segment;
}

auto DotPathIterator::operator->() const noexcept -> pointer {
    return &this->current_segment;
}

auto DotPathIterator::operator++() noexcept -> DotPathIterator& {
    if (this->at_end)
        return *this;
    if (this->isAtFinalComponent()) {
        this->at_end          = true;
        this->current         = this->path.size();
        this->current_segment = {};
        return *this;
    }
    this->current = this->segment_end + 1;
    findSegmentEnd();
    return *this;
}

auto DotPathIterator::operator++(int) noexcept -> DotPathIterator {
    DotPathIterator tmp = *this;
    ++*this;
    return tmp;
}

auto DotPathIterator::operator==(const DotPathIterator& other) const noexcept -> bool {
    return this->path.data() == other.path.data() && this->current == other.current && this->at_end == other.at_end;
}

auto DotPathIterator::isAtStart() const noexcept -> bool {
    return this->current == 0 && !this->at_end;
}

auto DotPathIterator::isAtFinalComponent() const noexcept -> bool {
    return !this->at_end && this->segment_end == this->path.size();
}

auto DotPathIterator::isAtEnd() const noexcept -> bool {
    return this->at_end;
}

auto DotPathIterator::toStringView() const noexcept -> std::string_view {
    return this->path;
}

auto DotPathIterator::currentComponent() const noexcept -> std::string_view {
    return this->current_segment;
}

auto DotPathIterator::next() const noexcept -> DotPathIterator {
    auto iter = *this;
    ++iter;
    return iter;
}

auto validateDotPath(std::string_view path) -> std::optional<Error> {
    if (path.empty())
        return Error{Error::Code::InvalidPath, "Empty path"};

    for (DotPathIterator it{path}; !it.isAtEnd(); ++it) {
        auto const segment = *it;
        if (segment.empty())
            return Error{Error::Code::InvalidPath, "Empty path component"};
        for (char c : segment) {
            if (!isPathSegmentChar(c))
                return Error{Error::Code::InvalidPath, std::string{"Invalid character '"} + c + "' in path component"};
        }
    }
    return std::nullopt;
}

auto parseIndex(std::string_view segment) noexcept -> std::optional<std::size_t> {
    if (segment.empty())
        return std::nullopt;
    for (char c : segment) {
        if (c < '0' || c > '9')
            return std::nullopt;
    }
    std::size_t value = 0;
    auto const [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), value);
    if (ec != std::errc{} || ptr != segment.data() + segment.size())
        return std::nullopt;
    return value;
}

} // namespace DJ
